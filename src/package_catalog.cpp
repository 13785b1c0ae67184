#include "package_catalog.hpp"
#include <algorithm>

namespace scoopdeck {

PackageCatalog::PackageCatalog(std::size_t search_capacity)
    : search_capacity_(std::max<std::size_t>(1, search_capacity)) {
}

std::optional<PackageList> PackageCatalog::get_installed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return installed_;
}

std::optional<PackageList> PackageCatalog::get_search(const std::string& query) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = std::find_if(searches_.begin(), searches_.end(),
        [&query](const std::pair<std::string, PackageList>& entry) {
            return entry.first == query;
        });
    if (it == searches_.end()) {
        return std::nullopt;
    }

    // A hit counts as use
    searches_.splice(searches_.begin(), searches_, it);
    return searches_.front().second;
}

void PackageCatalog::set_installed(PackageList records) {
    std::lock_guard<std::mutex> lock(mutex_);
    installed_ = std::move(records);
}

void PackageCatalog::set_search(const std::string& query, PackageList records) {
    std::lock_guard<std::mutex> lock(mutex_);

    searches_.remove_if([&query](const std::pair<std::string, PackageList>& entry) {
        return entry.first == query;
    });
    searches_.emplace_front(query, std::move(records));

    while (searches_.size() > search_capacity_) {
        searches_.pop_back();
    }
}

void PackageCatalog::invalidate_installed() {
    std::lock_guard<std::mutex> lock(mutex_);
    installed_.reset();
}

std::size_t PackageCatalog::search_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return searches_.size();
}

} // namespace scoopdeck
