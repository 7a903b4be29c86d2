#include "model/Library.hpp"
#include "util/UnicodeUtils.hpp"
#include <stdexcept>

namespace coda::model {

static std::out_of_range artist_index_error(size_t index, size_t count) {
    return std::out_of_range("artist index " + std::to_string(index) +
                             " out of range (" + std::to_string(count) + " artists)");
}

const Artist& Library::artist(size_t index) const {
    if (index >= artists.size()) {
        throw artist_index_error(index, artists.size());
    }
    return artists[index];
}

const std::vector<Album>& Library::albums_for(size_t index) const {
    return artist(index).albums;
}

const Artist* Library::find_artist(const std::string& name) const {
    for (const auto& a : artists) {
        if (a.name == name) {
            return &a;
        }
    }
    return nullptr;
}

size_t Library::track_count() const {
    size_t total = 0;
    for (const auto& a : artists) {
        for (const auto& album : a.albums) {
            total += album.tracks.size();
        }
    }
    return total;
}

std::vector<const AlbumEntry*> search_album_index(const std::vector<AlbumEntry>& index,
                                                  const std::string& query) {
    std::vector<const AlbumEntry*> result;
    const std::string needle = util::normalize_for_search(query);

    for (const auto& entry : index) {
        if (util::matches_search(entry.album.name, needle) ||
            util::matches_search(entry.artist, needle)) {
            result.push_back(&entry);
        }
    }
    return result;
}

const LazyArtist& LazyLibrary::artist(size_t index) const {
    if (index >= artists.size()) {
        throw artist_index_error(index, artists.size());
    }
    return artists[index];
}

bool LazyLibrary::is_loaded(size_t index) const {
    return artist(index).is_loaded();
}

const std::vector<Album>* LazyLibrary::albums_for(size_t index) const {
    return std::get_if<std::vector<Album>>(&artist(index).albums);
}

size_t LazyLibrary::loaded_count() const {
    size_t loaded = 0;
    for (const auto& a : artists) {
        if (a.is_loaded()) ++loaded;
    }
    return loaded;
}

}  // namespace coda::model
