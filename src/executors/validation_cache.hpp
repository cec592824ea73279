#pragma once
#include "execution_result.hpp"
#include <chrono>
#include <iomanip>
#include <memory>
#include <mutex>
#include <openssl/sha.h>
#include <sstream>
#include <string>
#include <unordered_map>

// Memoises syntax-check results by the SHA-256 of the source. Entries are
// immutable once stored, so sharing them between concurrent callers is safe.
//
// Bounded both by entry count and by an estimate of the memory the entries
// hold; a single result larger than an eighth of the byte budget is never
// stored.
class ValidationCache {
public:
    static constexpr size_t kDefaultMaxBytes = 16u << 20;
    // Rough heap cost of one {"type", "value"} token object.
    static constexpr size_t kBytesPerToken = 192;

    explicit ValidationCache(size_t max_size = 256, size_t max_bytes = kDefaultMaxBytes)
        : max_size_(max_size), max_bytes_(max_bytes) {}

    std::shared_ptr<const ValidationResult> get(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(key);
        if (it == cache_.end()) return nullptr;
        it->second.lastUsed = std::chrono::steady_clock::now();
        return it->second.result;
    }

    // Returns false when the entry was not stored.
    bool put(const std::string& key, std::shared_ptr<const ValidationResult> result) {
        if (max_size_ == 0 || !result) return false;
        const size_t cost = footprint(key, *result);
        if (cost > max_bytes_ / 8) return false;

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(key);
        if (it != cache_.end()) {
            bytes_ -= it->second.bytes;
            cache_.erase(it);
        }
        cache_[key] = Entry{std::move(result), std::chrono::steady_clock::now(), cost};
        bytes_ += cost;
        while (!cache_.empty() && (cache_.size() > max_size_ || bytes_ > max_bytes_)) evictOldest();
        return true;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        cache_.clear();
        bytes_ = 0;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cache_.size();
    }

    size_t bytes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return bytes_;
    }

    static size_t footprint(const std::string& key, const ValidationResult& r) {
        size_t cost = sizeof(Entry) + sizeof(ValidationResult) + key.size();
        if (r.error) cost += r.error->size();
        if (r.tokens) cost += r.tokens->size() * kBytesPerToken;
        return cost;
    }

    static std::string computeHash(const std::string& data) {
        unsigned char hash[SHA256_DIGEST_LENGTH];
        SHA256_CTX sha256;
        SHA256_Init(&sha256);
        SHA256_Update(&sha256, data.data(), data.size());
        SHA256_Final(hash, &sha256);

        std::stringstream ss;
        for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
            ss << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
        }
        return ss.str();
    }

private:
    struct Entry {
        std::shared_ptr<const ValidationResult> result;
        std::chrono::steady_clock::time_point lastUsed;
        size_t bytes;
    };

    void evictOldest() {
        auto oldest = cache_.begin();
        for (auto it = cache_.begin(); it != cache_.end(); ++it) {
            if (it->second.lastUsed < oldest->second.lastUsed) oldest = it;
        }
        if (oldest != cache_.end()) {
            bytes_ -= oldest->second.bytes;
            cache_.erase(oldest);
        }
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> cache_;
    size_t max_size_;
    size_t max_bytes_;
    size_t bytes_{0};
};
