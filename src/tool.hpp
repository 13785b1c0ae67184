#pragma once

#include "command.hpp"
#include "output_parser.hpp"
#include <memory>
#include <string>
#include <vector>

namespace scoopdeck {

// Abstract base class for package-management tools driven as subprocesses
class Tool {
public:
    virtual ~Tool() = default;

    // Get the name of this tool (e.g., "scoop")
    virtual std::string name() const = 0;

    // Check if the executable can be found on this system
    virtual bool is_available() const = 0;

    // Full argument vector (executable first) for one request
    virtual std::vector<std::string> command_line(const CommandRequest& request) const = 0;

    // Parser for this tool's listing and search output
    virtual const OutputParser& parser() const = 0;

    // Get color for a source/bucket
    virtual std::string source_color(const std::string& source) const {
        return source.empty() ? "\033[90m" : "\033[37m";  // dim / white
    }
};

using ToolPtr = std::unique_ptr<Tool>;

} // namespace scoopdeck
