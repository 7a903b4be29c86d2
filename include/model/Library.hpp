#pragma once

#include "model/Song.hpp"
#include <string>
#include <variant>
#include <vector>

namespace coda::model {

struct Album {
    std::string name;
    std::vector<Track> tracks;  // ordered by track_order_less
};

struct Artist {
    std::string name;
    std::vector<Album> albums;  // ordered case-insensitively by name
};

// One row of the flattened album view
struct AlbumEntry {
    std::string artist;
    Album album;
};

// Album state of a lazily loaded artist. NotLoaded until the artist's songs
// have been fetched; Loaded exactly once afterwards.
struct AlbumsNotLoaded {};
using AlbumState = std::variant<AlbumsNotLoaded, std::vector<Album>>;

struct LazyArtist {
    std::string name;
    AlbumState albums = AlbumsNotLoaded{};

    bool is_loaded() const { return std::holds_alternative<std::vector<Album>>(albums); }
};

// Album rows whose album or artist name contains the query
// (case- and diacritic-insensitive)
std::vector<const AlbumEntry*> search_album_index(const std::vector<AlbumEntry>& index,
                                                  const std::string& query);

struct Library {
    std::vector<Artist> artists;
    // Sorted case-insensitively by album name, then artist name
    std::vector<AlbumEntry> albums;

    size_t artist_count() const { return artists.size(); }
    const std::vector<AlbumEntry>& album_index() const { return albums; }
    const Artist& artist(size_t index) const;
    const std::vector<Album>& albums_for(size_t index) const;
    const Artist* find_artist(const std::string& name) const;
    size_t track_count() const;

    std::vector<const AlbumEntry*> search_albums(const std::string& query) const {
        return search_album_index(albums, query);
    }
};

struct LazyLibrary {
    std::vector<LazyArtist> artists;
    // Covers every loaded artist; same order as Library::albums
    std::vector<AlbumEntry> albums;
    bool all_loaded = false;

    size_t artist_count() const { return artists.size(); }
    const std::vector<AlbumEntry>& album_index() const { return albums; }
    const LazyArtist& artist(size_t index) const;
    bool is_loaded(size_t index) const;
    // nullptr while the artist is NotLoaded
    const std::vector<Album>* albums_for(size_t index) const;
    size_t loaded_count() const;

    // Only albums of artists loaded so far
    std::vector<const AlbumEntry*> search_albums(const std::string& query) const {
        return search_album_index(albums, query);
    }
};

}  // namespace coda::model
