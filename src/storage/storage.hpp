#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace memkv {

// Key-value container backed by std::unordered_map.
//
// NOT thread-safe.  The only live instance belongs to StorageEngine and is
// touched exclusively from the engine's processing loop.
class Storage {
public:
    Storage() = default;

    Storage(const Storage&)            = delete;
    Storage& operator=(const Storage&) = delete;

    Storage(Storage&&)            = default;
    Storage& operator=(Storage&&) = default;

    // Returns the value for `key`, or std::nullopt if not present.
    [[nodiscard]] std::optional<std::string> get(std::string_view key) const;

    // Inserts or overwrites `key` with `value`.
    void set(std::string key, std::string value);

    // Removes `key`. Returns true if the key existed, false otherwise.
    bool del(std::string_view key);

    // Returns the number of stored key-value pairs.
    [[nodiscard]] std::size_t size() const noexcept { return map_.size(); }

    // Rebuilds the map into freshly allocated storage with the same content,
    // releasing bucket memory retained after deletions.
    void compact();

    // Removes all entries and releases their memory.
    void clear();

private:
    std::unordered_map<std::string, std::string> map_;
};

} // namespace memkv
