#pragma once

#include "package.hpp"
#include <cstddef>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace scoopdeck {

// Cached view of the last listing and recent searches. Every write replaces
// a whole snapshot; readers always get a complete copy.
class PackageCatalog {
public:
    static constexpr std::size_t DEFAULT_SEARCH_CAPACITY = 5;

    explicit PackageCatalog(std::size_t search_capacity = DEFAULT_SEARCH_CAPACITY);

    // Empty until a listing succeeded, and again after invalidate_installed()
    std::optional<PackageList> get_installed() const;
    std::optional<PackageList> get_search(const std::string& query) const;

    void set_installed(PackageList records);
    void set_search(const std::string& query, PackageList records);
    void invalidate_installed();

    std::size_t search_capacity() const { return search_capacity_; }
    std::size_t search_count() const;

private:
    mutable std::mutex mutex_;
    std::optional<PackageList> installed_;

    // Front is most recently used
    mutable std::list<std::pair<std::string, PackageList>> searches_;
    std::size_t search_capacity_;
};

} // namespace scoopdeck
