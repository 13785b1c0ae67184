#pragma once

#include "package.hpp"
#include <cstddef>
#include <memory>
#include <string>

namespace scoopdeck {

// Records read from one block of tool output. Lines that looked like
// package rows but could not be read are counted in `dropped`.
struct ParseResult {
    PackageList records;
    std::size_t dropped = 0;

    // Output had candidate rows but none of them parsed
    bool is_format_mismatch() const { return records.empty() && dropped > 0; }
};

// Converts a tool's textual output into package records. One implementation
// per output format; a Tool picks the one that matches it.
class OutputParser {
public:
    virtual ~OutputParser() = default;

    virtual std::string name() const = 0;

    virtual ParseResult parse_installed_list(const std::string& raw_text) const = 0;
    virtual ParseResult parse_search_results(const std::string& raw_text) const = 0;
};

// Whitespace-aligned tables as printed by `scoop export` / `scoop search`:
//
//   Name    Version   Source
//   ----    -------   ------
//   7zip    23.01     main
//   git     2.43.0    main
//
// Headers, separators, banners and blank lines are skipped. The version
// column is located by content rather than position so localized headers
// and names containing spaces still parse.
class TableOutputParser : public OutputParser {
public:
    std::string name() const override { return "table"; }

    ParseResult parse_installed_list(const std::string& raw_text) const override;
    ParseResult parse_search_results(const std::string& raw_text) const override;

private:
    ParseResult parse(const std::string& raw_text, bool search) const;
};

using OutputParserPtr = std::unique_ptr<OutputParser>;

// Starts with a digit, or v/V followed by a digit, and is not a file name
// such as "7z.exe".
bool looks_like_version(const std::string& token);

} // namespace scoopdeck
