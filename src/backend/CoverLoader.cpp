#include "backend/CoverLoader.hpp"
#include "util/Logger.hpp"
#include <exception>

namespace coda::backend {

namespace {

// Any failure becomes "no art": the negative result is cached so a broken
// file is not refetched every time it comes around again
std::optional<Artwork> fetch_cover(DaemonClient& client, const std::string& file) {
    try {
        return client.fetch_album_art(file);
    } catch (const DaemonError& e) {
        util::Logger::debug("CoverLoader: Failed to load cover for " + file + ": " + e.what());
    } catch (const std::exception& e) {
        util::Logger::warn("CoverLoader: Unexpected error loading cover for " + file + ": " + e.what());
    }
    return std::nullopt;
}

}  // namespace

CoverLoader::CoverLoader(std::shared_ptr<DaemonClient> client,
                         SharedCoverCache cache,
                         std::shared_ptr<util::TaskPool> pool,
                         std::shared_ptr<CoverChannel> results)
    : client_(std::move(client)),
      cache_(std::move(cache)),
      pool_(std::move(pool)),
      results_(std::move(results)) {}

void CoverLoader::load(const std::string& file) {
    auto task = [client = client_, cache = cache_, results = results_, file]() {
        auto claim = cache->claim(file);

        switch (claim.kind) {
            case CoverCache::Claim::Kind::Hit:
                util::Logger::debug("CoverLoader: Cache hit for " + file);
                results->send(CoverArtMessage{claim.entry->data, file});
                return;
            case CoverCache::Claim::Kind::Pending:
                util::Logger::debug("CoverLoader: Already fetching " + file);
                return;
            case CoverCache::Claim::Kind::Claimed:
                break;
        }

        // The message shares the cached buffer
        CoverEntry entry = cache->insert(file, fetch_cover(*client, file));
        if (!results->send(CoverArtMessage{std::move(entry.data), file})) {
            util::Logger::debug("CoverLoader: Receiver gone, dropping cover for " + file);
        }
    };

    if (!pool_->submit(std::move(task))) {
        util::Logger::warn("CoverLoader: Could not schedule cover load for " + file);
    }
}

void CoverLoader::prefetch(const std::vector<std::string>& files) {
    for (const auto& file : files) {
        auto task = [client = client_, cache = cache_, file]() {
            if (cache->claim(file).kind != CoverCache::Claim::Kind::Claimed) {
                return;
            }

            auto data = fetch_cover(*client, file);
            bool has_art = data.has_value();
            cache->insert(file, std::move(data));
            util::Logger::debug("CoverLoader: Prefetched " + file + (has_art ? "" : " (no art)"));
        };

        if (!pool_->submit(std::move(task))) {
            util::Logger::debug("CoverLoader: Skipped prefetch for " + file);
        }
    }
}

}  // namespace coda::backend
