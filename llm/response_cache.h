#pragma once

#include <string>
#include <list>
#include <map>
#include <mutex>
#include <optional>
#include <nlohmann/json.hpp>

/// @brief Bounded map from prompt pairs to responses
/// Keys hash only the first prefix_chars of each prompt. When an insert
/// finds the cache full, the oldest fifth of the entries (at least one) is
/// dropped in one pass.
class ResponseCache {
public:
    explicit ResponseCache(size_t capacity = 50, size_t prefix_chars = 200);

    /// @brief Hex SHA-256 of "<system prefix>|<user prefix>"
    std::string make_key(const std::string& system_prompt, const std::string& user_prompt) const;

    std::optional<std::string> get(const std::string& key) const;
    void put(const std::string& key, const std::string& value);

    size_t size() const;
    size_t capacity() const { return capacity_; }
    void clear();

    nlohmann::json stats() const;

private:
    size_t capacity_;
    size_t prefix_chars_;

    mutable std::mutex mutex_;
    std::list<std::string> order_;  // insertion order, oldest first
    std::map<std::string, std::string> entries_;
    mutable uint64_t hits_ = 0;
    mutable uint64_t misses_ = 0;
};
