#include "json_output_parser.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <sstream>
#include <utility>

namespace scoopdeck {

using json = nlohmann::json;

namespace {

// Tries every '{' and '[' in turn; whatever follows the value is ignored.
std::optional<json> extract_first_json_value(const std::string& text) {
    for (size_t i = text.find_first_of("{["); i != std::string::npos;
         i = text.find_first_of("{[", i + 1)) {
        std::istringstream stream(text.substr(i));
        json value;
        try {
            stream >> value;
            return value;
        } catch (const json::parse_error&) {
            continue;
        }
    }
    return std::nullopt;
}

// Field value as display text. PowerShell serializes some values as arrays
// (joined) or as JsonElement stubs like {"ValueKind":3} (dropped).
std::string coerce_text(const json& value) {
    if (value.is_string()) {
        return trim(value.get<std::string>());
    }
    if (value.is_number() || value.is_boolean()) {
        return value.dump();
    }
    if (value.is_array()) {
        std::string joined;
        for (const auto& item : value) {
            std::string text = coerce_text(item);
            if (text.empty()) continue;
            if (!joined.empty()) joined += ' ';
            joined += text;
        }
        return joined;
    }
    return "";
}

// Capitalized key as written by PowerShell, lowercase as a fallback
std::string field(const json& item, const char* key, const char* lower_key) {
    auto it = item.find(key);
    if (it == item.end() || it->is_null()) {
        it = item.find(lower_key);
    }
    return it == item.end() ? "" : coerce_text(*it);
}

} // anonymous namespace

std::string format_updated_timestamp(const std::string& value) {
    if (value.size() < 19) {
        return value;
    }
    std::string out = value.substr(0, 19);
    for (char& c : out) {
        if (c == 'T') c = ' ';
    }
    return out;
}

ParseResult JsonOutputParser::parse_installed_list(const std::string& raw_text) const {
    std::string text = strip_ansi(raw_text);
    auto document = extract_first_json_value(text);
    if (!document || !document->is_object() || !document->contains("apps") ||
        !(*document)["apps"].is_array()) {
        // No export document; a bracketed value in a banner is not one either
        return fallback_.parse_installed_list(raw_text);
    }

    ParseResult result;
    std::set<std::string> seen;
    for (const auto& item : (*document)["apps"]) {
        if (!item.is_object()) {
            ++result.dropped;
            continue;
        }

        PackageRecord record;
        record.name = field(item, "Name", "name");
        record.version = field(item, "Version", "version");
        record.source = field(item, "Source", "source");
        record.updated = format_updated_timestamp(field(item, "Updated", "updated"));
        record.info = field(item, "Info", "info");

        if (record.name.empty() || !seen.insert(record.name).second) {
            ++result.dropped;
            continue;
        }
        result.records.push_back(std::move(record));
    }
    return result;
}

ParseResult JsonOutputParser::parse_search_results(const std::string& raw_text) const {
    std::string text = strip_ansi(raw_text);
    auto document = extract_first_json_value(text);

    json rows;
    if (document && document->is_object()) {
        rows = json::array();
        rows.push_back(std::move(*document));
    } else if (document && document->is_array()) {
        rows = std::move(*document);
    }

    bool has_objects = false;
    for (const auto& row : rows) {
        has_objects = has_objects || row.is_object();
    }
    if (!has_objects) {
        if (document && rows.is_array() && rows.empty()) {
            return ParseResult{};  // ConvertTo-Json of no matches
        }
        return fallback_.parse_search_results(raw_text);
    }

    ParseResult result;
    std::set<std::pair<std::string, std::string>> seen;
    for (const auto& row : rows) {
        if (!row.is_object()) {
            ++result.dropped;
            continue;
        }

        PackageRecord record;
        record.name = field(row, "Name", "name");
        record.version = field(row, "Version", "version");
        record.source = field(row, "Source", "source");
        record.binaries = field(row, "Binaries", "binaries");

        if (record.name.empty() || !seen.insert({record.name, record.source}).second) {
            ++result.dropped;
            continue;
        }
        result.records.push_back(std::move(record));
    }
    return result;
}

} // namespace scoopdeck
