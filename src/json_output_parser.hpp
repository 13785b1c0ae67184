#pragma once

#include "output_parser.hpp"

namespace scoopdeck {

// JSON documents as printed by `scoop export`
//
//   {"buckets":[...],"apps":[{"Name":"7zip","Version":"23.01","Source":"main",
//     "Updated":"2024-01-15T10:22:33.1234567+01:00","Info":""}]}
//
// and by `scoop search | ConvertTo-Json` (one object or an array of rows).
// The first JSON value in the text is used, so banners before it are fine.
// Output without an export document (listings) or without JSON rows
// (search) is handed to the table parser.
class JsonOutputParser : public OutputParser {
public:
    std::string name() const override { return "json"; }

    ParseResult parse_installed_list(const std::string& raw_text) const override;
    ParseResult parse_search_results(const std::string& raw_text) const override;

private:
    TableOutputParser fallback_;
};

// "2024-01-15T10:22:33.1234567+01:00" -> "2024-01-15 10:22:33"
std::string format_updated_timestamp(const std::string& value);

} // namespace scoopdeck
