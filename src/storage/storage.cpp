#include "storage/storage.hpp"

#include <utility>

namespace memkv {

std::optional<std::string> Storage::get(std::string_view key) const {
    auto it = map_.find(std::string(key));
    if (it == map_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void Storage::set(std::string key, std::string value) {
    map_.insert_or_assign(std::move(key), std::move(value));
}

bool Storage::del(std::string_view key) {
    return map_.erase(std::string(key)) > 0;
}

void Storage::compact() {
    std::unordered_map<std::string, std::string> fresh;
    fresh.reserve(map_.size());
    for (auto& [k, v] : map_) {
        fresh.emplace(k, std::move(v));
    }
    map_.swap(fresh);
}

void Storage::clear() {
    std::unordered_map<std::string, std::string>{}.swap(map_);
}

} // namespace memkv
