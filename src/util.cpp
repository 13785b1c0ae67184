#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <unistd.h>

namespace scoopdeck {

std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::vector<std::string> split_whitespace(const std::string& str) {
    std::vector<std::string> tokens;
    std::istringstream stream(str);
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

std::vector<std::string> split_columns(const std::string& str) {
    std::vector<std::string> columns;
    std::string current;
    size_t i = 0;

    while (i < str.size()) {
        char c = str[i];
        if (c == ' ' || c == '\t') {
            size_t run_end = str.find_first_not_of(" \t", i);
            if (run_end == std::string::npos) run_end = str.size();

            // A single space belongs to the cell, a tab or wider gap ends it
            bool is_gap = (run_end - i >= 2) || c == '\t';
            if (is_gap) {
                if (!current.empty()) {
                    columns.push_back(current);
                    current.clear();
                }
            } else if (!current.empty()) {
                current += ' ';
            }
            i = run_end;
            continue;
        }
        current += c;
        ++i;
    }

    if (!current.empty()) {
        columns.push_back(current);
    }
    return columns;
}

std::string normalize_newlines(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\r') {
            out += '\n';
            if (i + 1 < text.size() && text[i + 1] == '\n') {
                ++i;
            }
        } else {
            out += text[i];
        }
    }
    return out;
}

std::string strip_ansi(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    size_t i = 0;

    while (i < text.size()) {
        if (text[i] != '\033' || i + 1 >= text.size()) {
            out += text[i++];
            continue;
        }

        char kind = text[i + 1];
        if (kind == '[') {
            // CSI: parameters 0x30-0x3F, intermediates 0x20-0x2F, final 0x40-0x7E
            size_t j = i + 2;
            while (j < text.size() && text[j] >= 0x30 && text[j] <= 0x3F) ++j;
            while (j < text.size() && text[j] >= 0x20 && text[j] <= 0x2F) ++j;
            if (j < text.size() && text[j] >= 0x40 && text[j] <= 0x7E) ++j;
            i = j;
        } else if (kind == ']') {
            // OSC: terminated by BEL or ESC backslash
            size_t j = i + 2;
            while (j < text.size()) {
                if (text[j] == '\a') {
                    ++j;
                    break;
                }
                if (text[j] == '\033' && j + 1 < text.size() && text[j + 1] == '\\') {
                    j += 2;
                    break;
                }
                ++j;
            }
            i = j;
        } else if ((kind >= '@' && kind <= 'Z') || (kind >= '\\' && kind <= '_')) {
            i += 2;
        } else {
            out += text[i++];
        }
    }
    return out;
}

std::string find_executable(const std::string& name) {
    if (name.empty()) {
        return "";
    }

    if (name.find('/') != std::string::npos) {
        return access(name.c_str(), X_OK) == 0 ? name : "";
    }

    const char* path_env = std::getenv("PATH");
    std::string path = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";

    std::istringstream dirs(path);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + name;
        if (access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return "";
}

void sort_by_relevance(PackageList& packages, const std::string& query) {
    std::string query_lower = to_lower(query);

    std::stable_sort(packages.begin(), packages.end(),
        [&query_lower](const PackageRecord& a, const PackageRecord& b) {
            std::string a_lower = to_lower(a.name);
            std::string b_lower = to_lower(b.name);

            // Exact match gets highest priority
            bool a_exact = (a_lower == query_lower);
            bool b_exact = (b_lower == query_lower);
            if (a_exact != b_exact) return a_exact > b_exact;

            // Starts with query gets next priority
            bool a_starts = (a_lower.find(query_lower) == 0);
            bool b_starts = (b_lower.find(query_lower) == 0);
            if (a_starts != b_starts) return a_starts > b_starts;

            bool a_contains = (a_lower.find(query_lower) != std::string::npos);
            bool b_contains = (b_lower.find(query_lower) != std::string::npos);
            if (a_contains != b_contains) return a_contains > b_contains;

            // If both contain, prefer shorter names
            if (a_contains && b_contains && a.name.length() != b.name.length()) {
                return a.name.length() < b.name.length();
            }

            return a_lower < b_lower;
        });
}

} // namespace scoopdeck
