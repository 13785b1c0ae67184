#pragma once

#include "package.hpp"
#include <string>
#include <vector>

namespace scoopdeck {

std::string trim(const std::string& str);
std::string to_lower(std::string str);

// Split on any run of whitespace.
std::vector<std::string> split_whitespace(const std::string& str);

// Split on runs of two or more spaces/tabs (column gaps of formatted tables).
std::vector<std::string> split_columns(const std::string& str);

// Convert CRLF and lone CR to LF.
std::string normalize_newlines(const std::string& text);

// Remove ANSI CSI, OSC and two-character escape sequences.
std::string strip_ansi(const std::string& text);

// Full path of an executable found on PATH (or the argument itself when it
// already contains a slash and is executable); empty when not found.
std::string find_executable(const std::string& name);

inline bool command_exists(const std::string& name) {
    return !find_executable(name).empty();
}

// Sort packages by relevance to query
// Priority: exact match > starts with > contains in name > alphabetical
void sort_by_relevance(PackageList& packages, const std::string& query);

} // namespace scoopdeck
