#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace coda::model {

enum class PlayState {
    Stopped,
    Playing,
    Paused,
};

const char* to_string(PlayState state);

struct Track {
    std::string title = "Unknown Title";
    std::string artist = "Unknown Artist";
    std::string album = "Unknown Album";
    // Resolved album artist; the eager loader overwrites it with the
    // album's canonical artist
    std::string album_artist;
    // True if the daemon reported an AlbumArtist tag for this file
    bool has_explicit_album_artist = false;

    // Daemon-relative path; the key for covers and lookups
    std::string file;
    // "rate:bits:channels" as reported by the daemon, empty if unknown
    std::string format;
    int disc = 0;
    int track = 0;

    std::optional<uint32_t> duration_ms;

    // Queue position when the track came from the play queue
    std::optional<size_t> queue_pos;

    // Playback progress, refreshed in place on every status poll
    std::optional<uint32_t> elapsed_ms;
    std::optional<double> progress;
    std::optional<PlayState> play_state;

    // Directory part of the file key ("" for top-level files)
    std::string album_dir() const;

    // Rate field of the format string
    std::optional<uint32_t> sample_rate() const;

    void refresh_progress(std::optional<uint32_t> elapsed, std::optional<PlayState> state);
};

// Daemon status subset the client cares about
struct Status {
    PlayState state = PlayState::Stopped;
    int volume = -1;  // -1 when the daemon has no mixer
    bool repeat = false;
    bool random = false;
    bool single = false;
    bool consume = false;
    std::optional<size_t> song_pos;
    std::optional<uint32_t> elapsed_ms;
    std::optional<uint32_t> duration_ms;
    // Output format of the current song, when playing
    std::optional<uint32_t> sample_rate;
    size_t queue_length = 0;
};

// Stable order inside an album: disc, track number, then title
bool track_order_less(const Track& a, const Track& b);

}  // namespace coda::model
