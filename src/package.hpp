#pragma once

#include <optional>
#include <string>
#include <vector>

namespace scoopdeck {

struct PackageRecord {
    std::string name;
    std::string version;
    std::string source;                          // bucket, e.g. "main", "extras"
    std::optional<std::string> updated_version;  // installed listings only
    std::string binaries;                        // search results only
    std::string updated;                         // install time, "YYYY-MM-DD hh:mm:ss"
    std::string info;                            // e.g. "Global install", "Held package"

    bool has_update() const { return updated_version.has_value(); }

    bool operator==(const PackageRecord& other) const {
        return name == other.name && version == other.version &&
               source == other.source && updated_version == other.updated_version &&
               binaries == other.binaries && updated == other.updated &&
               info == other.info;
    }
    bool operator!=(const PackageRecord& other) const { return !(*this == other); }
};

using PackageList = std::vector<PackageRecord>;

} // namespace scoopdeck
