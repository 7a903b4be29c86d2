#pragma once

#include "backend/DaemonClient.hpp"
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace coda::backend {

// Final result of a cover fetch. A null data pointer is a remembered
// "daemon has no art for this file", not a missing entry.
struct CoverEntry {
    std::shared_ptr<const Artwork> data;

    bool has_art() const { return data != nullptr; }
};

/**
 * Cover art keyed by file key, shared by the UI loop and every background
 * fetch task.
 *
 * Besides finished entries the cache tracks a pending set: keys with a fetch
 * in flight. A key is pending from mark_pending() (or a successful claim())
 * until the matching insert(). All operations, including the compound
 * claim(), are atomic with respect to each other.
 *
 * The cache is bounded: once capacity entries are stored the least recently
 * used one is evicted. Pending keys are not entries and are never evicted.
 */
class CoverCache {
public:
    static constexpr size_t DEFAULT_CAPACITY = 256;

    struct Claim {
        enum class Kind {
            Hit,      // entry holds the cached result
            Pending,  // someone else is fetching it
            Claimed,  // caller now owns the fetch and must insert()
        };
        Kind kind;
        std::optional<CoverEntry> entry;
    };

    // capacity == 0 disables eviction
    explicit CoverCache(size_t capacity = DEFAULT_CAPACITY);

    CoverCache(const CoverCache&) = delete;
    CoverCache& operator=(const CoverCache&) = delete;

    std::optional<CoverEntry> get(const std::string& key);
    bool contains(const std::string& key) const;
    bool is_pending(const std::string& key) const;

    // Starts a fetch for key. Drops any stored entry so the key is never
    // both pending and cached.
    void mark_pending(const std::string& key);

    // Stores the final result (art or none) and clears the pending mark.
    // A later insert for the same key overwrites. Returns the stored entry,
    // which stays valid even if it is evicted right away.
    CoverEntry insert(const std::string& key, std::optional<Artwork> data);

    // Check cache, check pending, mark pending, in one critical section
    Claim claim(const std::string& key);

    size_t size() const;
    size_t pending_count() const;
    size_t capacity() const { return capacity_; }
    size_t memory_usage() const;  // artwork bytes plus keys

    void clear();

private:
    struct Slot {
        CoverEntry entry;
        std::list<std::string>::iterator lru_pos;
    };

    // Callers hold mutex_
    void touch(Slot& slot);
    void evict_if_needed();

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Slot> entries_;
    std::list<std::string> lru_;  // front = most recently used
    std::unordered_set<std::string> pending_;
    size_t capacity_;
};

using SharedCoverCache = std::shared_ptr<CoverCache>;

}  // namespace coda::backend
