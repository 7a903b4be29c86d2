#include "backend/LibraryLoader.hpp"
#include "backend/LibraryIndex.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <format>
#include <map>
#include <set>
#include <thread>
#include <unordered_map>

namespace coda::backend {

namespace {

// Caps the backoff at base * 2^16 however many attempts are configured
constexpr int MAX_BACKOFF_SHIFT = 16;

}  // namespace

LibraryLoader::LibraryLoader(std::shared_ptr<DaemonClient> client)
    : LibraryLoader(std::move(client), Options{}) {}

LibraryLoader::LibraryLoader(std::shared_ptr<DaemonClient> client, Options options)
    : client_(std::move(client)),
      options_(options),
      sleeper_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }) {
    if (options_.retry_attempts < 1) {
        options_.retry_attempts = 1;
    }
}

std::vector<model::Track> LibraryLoader::fetch_catalog_with_retry() {
    const int attempts = options_.retry_attempts;

    for (int attempt = 1;; ++attempt) {
        try {
            return client_->list_all_songs();
        } catch (const DaemonError& e) {
            if (!e.transient()) {
                throw LibraryError(std::string("Catalog query rejected: ") + e.what());
            }
            if (attempt >= attempts) {
                throw LibraryError(std::format("Catalog fetch failed after {} attempts: {}",
                                               attempts, e.what()));
            }

            auto delay = options_.retry_base_delay * (1LL << std::min(attempt - 1, MAX_BACKOFF_SHIFT));
            util::Logger::warn(std::format("LibraryLoader: Attempt {}/{} failed ({}), retrying in {} ms",
                                           attempt, attempts, e.what(), delay.count()));
            sleeper_(delay);
        }
    }
}

model::Library LibraryLoader::load_eager() {
    try {
        client_->status();
    } catch (const DaemonError& e) {
        throw LibraryError(std::string("Daemon not reachable: ") + e.what());
    }

    auto songs = fetch_catalog_with_retry();
    util::Logger::info("LibraryLoader: Fetched " + std::to_string(songs.size()) + " songs");

    // Pass 1: one canonical artist per album name
    std::unordered_map<std::string, std::vector<model::Track>> by_album;
    for (auto& song : songs) {
        by_album[song.album].push_back(std::move(song));
    }

    // Pass 2: regroup under the canonical artist
    std::map<std::string, std::vector<model::Track>> by_artist;
    for (auto& [album, tracks] : by_album) {
        std::string canonical = canonical_album_artist(tracks);
        auto& bucket = by_artist[canonical];
        for (auto& t : tracks) {
            t.album_artist = canonical;
            bucket.push_back(std::move(t));
        }
    }

    model::Library library;
    library.artists.reserve(by_artist.size());
    for (auto& [name, tracks] : by_artist) {
        library.artists.push_back(model::Artist{name, group_into_albums(std::move(tracks))});
    }
    sort_artists(library.artists);
    library.albums = build_album_index(library.artists);

    util::Logger::info(std::format("LibraryLoader: {} artists, {} albums",
                                   library.artists.size(), library.albums.size()));
    return library;
}

model::LazyLibrary LibraryLoader::init_lazy() {
    std::vector<std::string> values;
    try {
        values = client_->list_tag_values(Tag::AlbumArtist);
    } catch (const DaemonError& e) {
        throw LibraryError(std::string("Album artist query failed: ") + e.what());
    }

    std::set<std::string> unique;
    for (auto& v : values) {
        if (!v.empty()) unique.insert(std::move(v));
    }

    std::vector<std::string> names(unique.begin(), unique.end());
    sort_artist_names(names);

    model::LazyLibrary library;
    library.artists.reserve(names.size());
    for (auto& name : names) {
        library.artists.push_back(model::LazyArtist{std::move(name), model::AlbumsNotLoaded{}});
    }
    library.all_loaded = library.artists.empty();

    util::Logger::info("LibraryLoader: " + std::to_string(library.artists.size()) + " album artists");
    return library;
}

void LibraryLoader::load_artist(model::LazyLibrary& library, size_t index) {
    if (library.artist(index).is_loaded()) {
        return;
    }
    auto& artist = library.artists[index];

    std::vector<model::Track> tracks;
    try {
        tracks = client_->find_songs(Tag::AlbumArtist, artist.name, Tag::Disc);
    } catch (const DaemonError& e) {
        throw LibraryError("Loading " + artist.name + " failed: " + e.what());
    }

    for (auto& t : tracks) {
        t.album_artist = artist.name;
    }

    auto albums = group_into_albums(std::move(tracks));
    merge_into_index(library.albums, artist.name, albums);
    artist.albums = std::move(albums);

    library.all_loaded = library.loaded_count() == library.artists.size();
    util::Logger::debug(std::format("LibraryLoader: Loaded {} ({}/{})", artist.name,
                                    library.loaded_count(), library.artists.size()));
}

model::Library LibraryLoader::materialize(model::LazyLibrary& library) {
    for (size_t i = 0; i < library.artists.size(); ++i) {
        load_artist(library, i);
    }

    model::Library result;
    for (const auto& artist : library.artists) {
        const auto& albums = std::get<std::vector<model::Album>>(artist.albums);
        if (albums.empty()) continue;
        result.artists.push_back(model::Artist{artist.name, albums});
    }
    result.albums = library.albums;
    return result;
}

}  // namespace coda::backend
