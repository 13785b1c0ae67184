#include "output_parser.hpp"
#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <optional>
#include <set>
#include <sstream>
#include <utility>
#include <vector>

namespace scoopdeck {

namespace {

bool is_separator_line(const std::string& line) {
    bool has_rule = false;
    for (char c : line) {
        if (c == '-' || c == '=') {
            has_rule = true;
        } else if (c != ' ' && c != '\t') {
            return false;
        }
    }
    return has_rule;
}

bool is_header_line(const std::string& line) {
    auto tokens = split_whitespace(to_lower(line));
    if (tokens.empty() || tokens[0] != "name") return false;
    return std::find(tokens.begin(), tokens.end(), "version") != tokens.end();
}

// Status chatter printed around the table
bool is_banner_line(const std::string& line) {
    std::string lower = to_lower(line);
    if (lower.rfind("results from", 0) == 0) return true;
    if (lower.rfind("no matches found", 0) == 0) return true;
    if (line.rfind("WARN ", 0) == 0 || line.rfind("INFO ", 0) == 0 ||
        line.rfind("ERROR ", 0) == 0) {
        return true;
    }
    return !line.empty() && line.back() == ':';
}

std::string join(const std::vector<std::string>& parts, size_t first, size_t last,
                 const std::string& sep) {
    std::string out;
    for (size_t i = first; i < last && i < parts.size(); ++i) {
        if (!out.empty()) out += sep;
        out += parts[i];
    }
    return out;
}

// Column-aligned row: cells separated by two or more spaces.
std::optional<PackageRecord> parse_columns(const std::string& line, bool search) {
    auto columns = split_columns(line);
    if (columns.size() < 2) return std::nullopt;

    auto version_tokens = split_whitespace(columns[1]);
    if (version_tokens.empty() || !looks_like_version(version_tokens[0])) {
        return std::nullopt;
    }

    PackageRecord record;
    record.name = columns[0];
    record.version = version_tokens[0];
    size_t next = 2;

    if (version_tokens.size() == 3 && version_tokens[1] == "->" &&
        looks_like_version(version_tokens[2])) {
        record.updated_version = version_tokens[2];
    } else if (version_tokens.size() != 1) {
        return std::nullopt;
    } else if (columns.size() >= 4 && columns[2] == "->" && looks_like_version(columns[3])) {
        record.updated_version = columns[3];
        next = 4;
    }

    if (record.updated_version && search) {
        return std::nullopt;
    }

    if (next < columns.size()) {
        record.source = columns[next];
        ++next;
    }
    if (search) {
        record.binaries = join(columns, next, columns.size(), "  ");
    } else if (next < columns.size()) {
        record.updated = columns[next];
        record.info = join(columns, next + 1, columns.size(), "  ");
    }
    return record;
}

// Loosely spaced row: the last version-like token splits name from the rest.
std::optional<PackageRecord> parse_tokens(const std::string& line, bool search) {
    auto tokens = split_whitespace(line);
    if (tokens.size() < 2) return std::nullopt;

    std::optional<std::string> updated;
    if (!search) {
        for (size_t k = 1; k + 1 < tokens.size(); ++k) {
            if (tokens[k] == "->" && looks_like_version(tokens[k - 1]) &&
                looks_like_version(tokens[k + 1])) {
                updated = tokens[k + 1];
                tokens.erase(tokens.begin() + static_cast<long>(k),
                             tokens.begin() + static_cast<long>(k) + 2);
                break;
            }
        }
    }

    size_t version_idx = 0;
    for (size_t i = tokens.size() - 1; i >= 1; --i) {
        if (looks_like_version(tokens[i])) {
            version_idx = i;
            break;
        }
    }
    if (version_idx == 0) return std::nullopt;

    PackageRecord record;
    record.name = join(tokens, 0, version_idx, " ");
    record.version = tokens[version_idx];
    record.updated_version = updated;
    if (version_idx + 1 < tokens.size()) {
        record.source = tokens[version_idx + 1];
    }
    if (search) {
        record.binaries = join(tokens, version_idx + 2, tokens.size(), " ");
    }
    return record;
}

} // anonymous namespace

bool looks_like_version(const std::string& token) {
    if (token.empty()) return false;

    size_t first_digit = (token[0] == 'v' || token[0] == 'V') ? 1 : 0;
    if (first_digit >= token.size() ||
        !std::isdigit(static_cast<unsigned char>(token[first_digit]))) {
        return false;
    }

    for (char c : token) {
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != '.' && c != '-' && c != '_' && c != '+' && c != '~') {
            return false;
        }
    }

    static const std::set<std::string> executable_extensions = {
        "exe", "bat", "cmd", "ps1", "com", "jar", "msi", "lnk",
    };
    size_t dot = token.rfind('.');
    if (dot != std::string::npos &&
        executable_extensions.count(to_lower(token.substr(dot + 1))) > 0) {
        return false;
    }
    return true;
}

ParseResult TableOutputParser::parse_installed_list(const std::string& raw_text) const {
    return parse(raw_text, false);
}

ParseResult TableOutputParser::parse_search_results(const std::string& raw_text) const {
    return parse(raw_text, true);
}

ParseResult TableOutputParser::parse(const std::string& raw_text, bool search) const {
    ParseResult result;

    std::vector<std::string> lines;
    std::istringstream stream(strip_ansi(normalize_newlines(raw_text)));
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(trim(line));
    }

    // One row per app in a listing; search may show an app from several buckets
    std::set<std::pair<std::string, std::string>> seen;

    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string& current = lines[i];
        if (current.empty() || is_separator_line(current)) continue;

        // Whatever sits directly above a rule is a header, whatever its language
        size_t next = i + 1;
        while (next < lines.size() && lines[next].empty()) ++next;
        if (next < lines.size() && is_separator_line(lines[next])) continue;

        if (is_header_line(current) || is_banner_line(current)) continue;

        auto record = parse_columns(current, search);
        if (!record) {
            record = parse_tokens(current, search);
        }
        if (!record || record->name.empty()) {
            ++result.dropped;
            continue;
        }

        std::string bucket = search ? record->source : std::string();
        if (!seen.insert({record->name, bucket}).second) {
            ++result.dropped;
            continue;
        }

        result.records.push_back(std::move(*record));
    }

    return result;
}

} // namespace scoopdeck
