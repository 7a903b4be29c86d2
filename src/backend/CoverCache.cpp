#include "backend/CoverCache.hpp"
#include "util/Logger.hpp"

namespace coda::backend {

CoverCache::CoverCache(size_t capacity) : capacity_(capacity) {}

std::optional<CoverEntry> CoverCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    touch(it->second);
    return it->second.entry;
}

bool CoverCache::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.find(key) != entries_.end();
}

bool CoverCache::is_pending(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.find(key) != pending_.end();
}

void CoverCache::mark_pending(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it != entries_.end()) {
        lru_.erase(it->second.lru_pos);
        entries_.erase(it);
    }
    pending_.insert(key);
}

CoverEntry CoverCache::insert(const std::string& key, std::optional<Artwork> data) {
    CoverEntry entry;
    if (data) {
        entry.data = std::make_shared<const Artwork>(std::move(*data));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    pending_.erase(key);

    auto it = entries_.find(key);
    if (it != entries_.end()) {
        it->second.entry = entry;
        touch(it->second);
        return entry;
    }

    lru_.push_front(key);
    entries_.emplace(key, Slot{entry, lru_.begin()});
    evict_if_needed();
    return entry;
}

CoverCache::Claim CoverCache::claim(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it != entries_.end()) {
        touch(it->second);
        return Claim{Claim::Kind::Hit, it->second.entry};
    }
    if (pending_.find(key) != pending_.end()) {
        return Claim{Claim::Kind::Pending, std::nullopt};
    }
    pending_.insert(key);
    return Claim{Claim::Kind::Claimed, std::nullopt};
}

size_t CoverCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

size_t CoverCache::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

size_t CoverCache::memory_usage() const {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t total = 0;
    for (const auto& [key, slot] : entries_) {
        total += key.size();
        if (slot.entry.data) {
            total += slot.entry.data->size();
        }
    }
    return total;
}

void CoverCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    lru_.clear();
    // In-flight fetches still hold their claims; their insert() will land
    // in the emptied cache
}

void CoverCache::touch(Slot& slot) {
    lru_.splice(lru_.begin(), lru_, slot.lru_pos);
}

void CoverCache::evict_if_needed() {
    if (capacity_ == 0) return;

    while (entries_.size() > capacity_) {
        const std::string& victim = lru_.back();
        util::Logger::debug("CoverCache: Evicting " + victim);
        entries_.erase(victim);
        lru_.pop_back();
    }
}

}  // namespace coda::backend
