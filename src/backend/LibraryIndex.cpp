#include "backend/LibraryIndex.hpp"
#include "util/TimSort.hpp"
#include "util/UnicodeUtils.hpp"
#include <map>
#include <set>
#include <unordered_map>

namespace coda::backend {

namespace {

// std::map iterates names in ascending order, so keeping the first
// strictly-larger count resolves ties to the smallest name
std::string most_frequent(const std::map<std::string, size_t>& counts) {
    std::string best;
    size_t best_count = 0;
    for (const auto& [name, count] : counts) {
        if (count > best_count) {
            best = name;
            best_count = count;
        }
    }
    return best;
}

}  // namespace

std::string canonical_album_artist(const std::vector<model::Track>& tracks) {
    std::map<std::string, size_t> explicit_tags;
    std::map<std::string, size_t> track_artists;

    for (const auto& t : tracks) {
        if (t.has_explicit_album_artist && !t.album_artist.empty()) {
            ++explicit_tags[t.album_artist];
        }
        ++track_artists[t.artist];
    }

    if (!explicit_tags.empty()) {
        return most_frequent(explicit_tags);
    }
    return most_frequent(track_artists);
}

void sort_tracks(std::vector<model::Track>& tracks) {
    util::timsort(tracks, model::track_order_less);
}

void sort_albums(std::vector<model::Album>& albums) {
    util::timsort(albums, [](const model::Album& a, const model::Album& b) {
        return util::case_insensitive_less(a.name, b.name);
    });
}

void sort_artists(std::vector<model::Artist>& artists) {
    util::timsort(artists, [](const model::Artist& a, const model::Artist& b) {
        return util::case_insensitive_less(a.name, b.name);
    });
}

void sort_artist_names(std::vector<std::string>& names) {
    util::timsort(names, util::case_insensitive_less);
}

std::vector<model::Album> group_into_albums(std::vector<model::Track> tracks) {
    std::vector<model::Album> albums;
    std::unordered_map<std::string, size_t> slot;

    for (auto& t : tracks) {
        auto [it, inserted] = slot.try_emplace(t.album, albums.size());
        if (inserted) {
            albums.push_back(model::Album{t.album, {}});
        }
        albums[it->second].tracks.push_back(std::move(t));
    }

    for (auto& album : albums) {
        sort_tracks(album.tracks);
    }
    sort_albums(albums);
    return albums;
}

bool album_entry_less(const model::AlbumEntry& a, const model::AlbumEntry& b) {
    int cmp = util::case_insensitive_compare(a.album.name, b.album.name);
    if (cmp != 0) return cmp < 0;
    return util::case_insensitive_less(a.artist, b.artist);
}

std::vector<model::AlbumEntry> build_album_index(const std::vector<model::Artist>& artists) {
    std::vector<model::AlbumEntry> index;
    for (const auto& artist : artists) {
        for (const auto& album : artist.albums) {
            index.push_back(model::AlbumEntry{artist.name, album});
        }
    }
    util::timsort(index, album_entry_less);
    return index;
}

void merge_into_index(std::vector<model::AlbumEntry>& index,
                      const std::string& artist,
                      const std::vector<model::Album>& albums) {
    std::set<std::pair<std::string, std::string>> present;
    for (const auto& entry : index) {
        present.emplace(entry.artist, entry.album.name);
    }

    bool changed = false;
    for (const auto& album : albums) {
        if (present.emplace(artist, album.name).second) {
            index.push_back(model::AlbumEntry{artist, album});
            changed = true;
        }
    }

    if (changed) {
        util::timsort(index, album_entry_less);
    }
}

}  // namespace coda::backend
