#pragma once

#include "model/Library.hpp"
#include <string>
#include <vector>

namespace coda::backend {

// Grouping and ordering shared by the eager and lazy library loaders. Both
// strategies must produce the same shape, so neither sorts on its own.

// Album artist for one album's tracks. An explicit AlbumArtist tag wins (the
// most frequent one if the tracks disagree); otherwise the most frequent
// track artist. Ties go to the lexicographically smallest name.
std::string canonical_album_artist(const std::vector<model::Track>& tracks);

// Groups tracks into albums by album name. Albums come back sorted
// case-insensitively, tracks by disc, track number and title.
std::vector<model::Album> group_into_albums(std::vector<model::Track> tracks);

void sort_tracks(std::vector<model::Track>& tracks);
void sort_albums(std::vector<model::Album>& albums);
void sort_artists(std::vector<model::Artist>& artists);
void sort_artist_names(std::vector<std::string>& names);

// Album name first, artist name second, both case-insensitive
bool album_entry_less(const model::AlbumEntry& a, const model::AlbumEntry& b);

std::vector<model::AlbumEntry> build_album_index(const std::vector<model::Artist>& artists);

// Adds artist's albums to a sorted index, skipping (artist, album) pairs
// already present, and restores the order
void merge_into_index(std::vector<model::AlbumEntry>& index,
                      const std::string& artist,
                      const std::vector<model::Album>& albums);

}  // namespace coda::backend
