#include "dirgen.h"
#include "llm/response_cache.h"

#include <openssl/sha.h>
#include <algorithm>
#include <iomanip>
#include <sstream>

ResponseCache::ResponseCache(size_t capacity, size_t prefix_chars)
    : capacity_(capacity == 0 ? 1 : capacity), prefix_chars_(prefix_chars) {
}

std::string ResponseCache::make_key(const std::string& system_prompt, const std::string& user_prompt) const {
    std::string combined = system_prompt.substr(0, prefix_chars_) + "|" + user_prompt.substr(0, prefix_chars_);

    unsigned char hash_bytes[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(combined.c_str()), combined.length(), hash_bytes);

    std::ostringstream hash_stream;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        hash_stream << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash_bytes[i]);
    }
    return hash_stream.str();
}

std::optional<std::string> ResponseCache::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        misses_++;
        return std::nullopt;
    }
    hits_++;
    return it->second;
}

void ResponseCache::put(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto existing = entries_.find(key);
    if (existing != entries_.end()) {
        existing->second = value;
        return;
    }

    if (entries_.size() >= capacity_) {
        size_t evict = std::max<size_t>(1, capacity_ / 5);
        for (size_t i = 0; i < evict && !order_.empty(); i++) {
            entries_.erase(order_.front());
            order_.pop_front();
        }
        dprintf(2, "Response cache full, evicted %zu entries", evict);
    }

    order_.push_back(key);
    entries_[key] = value;
}

size_t ResponseCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void ResponseCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    order_.clear();
}

nlohmann::json ResponseCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nlohmann::json{
        {"entries", entries_.size()},
        {"capacity", capacity_},
        {"hits", hits_},
        {"misses", misses_}
    };
}
