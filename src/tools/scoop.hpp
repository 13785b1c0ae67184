#pragma once

#include "json_output_parser.hpp"
#include "tool.hpp"

namespace scoopdeck {

class ScoopTool : public Tool {
public:
    // `shell` empty runs the executable directly; otherwise the command is
    // routed through that PowerShell executable.
    explicit ScoopTool(std::string executable = "scoop", std::string shell = "");

    std::string name() const override { return "scoop"; }
    bool is_available() const override;
    std::vector<std::string> command_line(const CommandRequest& request) const override;
    const OutputParser& parser() const override { return parser_; }

    std::string source_color(const std::string& source) const override {
        if (source == "main") return "\033[36m";        // cyan
        if (source == "extras") return "\033[32m";      // green
        if (source == "versions") return "\033[33m";    // yellow
        if (source == "java") return "\033[35m";        // magenta
        if (source == "nerd-fonts") return "\033[94m";  // bright blue
        if (source == "games") return "\033[91m";       // bright red
        if (source.empty()) return "\033[90m";          // dim for unknown
        return "\033[37m";
    }

    const std::string& executable() const { return executable_; }
    const std::string& shell() const { return shell_; }

    // Tool verb for a command kind ("export" for List)
    static const char* verb(CommandKind kind);

private:
    std::string executable_;
    std::string shell_;
    JsonOutputParser parser_;
};

} // namespace scoopdeck
