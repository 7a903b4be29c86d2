#pragma once

#include "backend/CoverCache.hpp"
#include "backend/DaemonClient.hpp"
#include "util/Channel.hpp"
#include "util/TaskPool.hpp"
#include <memory>
#include <string>
#include <vector>

namespace coda::backend {

// Result of an on-demand load, tagged with the file it belongs to. The
// receiver must check the file still matches what it displays.
struct CoverArtMessage {
    std::shared_ptr<const Artwork> data;  // nullptr: no art
    std::string file;
};

using CoverChannel = util::Channel<CoverArtMessage>;

/**
 * Launches cover fetches as detached tasks on the task pool. Every fetch
 * goes through the shared CoverCache so a key is fetched at most once no
 * matter how many loads and prefetches ask for it concurrently.
 *
 * Tasks are never cancelled. A prefetch superseded by a newer song change
 * still runs to completion and only warms the cache.
 */
class CoverLoader {
public:
    CoverLoader(std::shared_ptr<DaemonClient> client,
                SharedCoverCache cache,
                std::shared_ptr<util::TaskPool> pool,
                std::shared_ptr<CoverChannel> results);

    // Delivers the cover for file over the result channel: immediately on a
    // cache hit, after the fetch otherwise. Delivers nothing if another
    // fetch for the same file is already in flight.
    void load(const std::string& file);

    // Warms the cache for each file not already cached or pending
    void prefetch(const std::vector<std::string>& files);

    const SharedCoverCache& cache() const { return cache_; }

private:
    std::shared_ptr<DaemonClient> client_;
    SharedCoverCache cache_;
    std::shared_ptr<util::TaskPool> pool_;
    std::shared_ptr<CoverChannel> results_;
};

}  // namespace coda::backend
