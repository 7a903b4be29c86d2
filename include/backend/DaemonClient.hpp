#pragma once

#include "model/Song.hpp"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace coda::backend {

class DaemonError : public std::runtime_error {
public:
    enum class Kind {
        Connection,  // socket/connect failure, daemon went away
        Timeout,
        Server,      // daemon answered with ACK
        Protocol,    // malformed response
    };

    DaemonError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    Kind kind() const { return kind_; }

    // Worth retrying after a delay
    bool transient() const { return kind_ == Kind::Connection || kind_ == Kind::Timeout; }

private:
    Kind kind_;
};

enum class Tag {
    Artist,
    AlbumArtist,
    Album,
    Title,
    Track,
    Disc,
};

const char* to_string(Tag tag);

using Artwork = std::vector<uint8_t>;

/**
 * Request/response view of the music daemon.
 *
 * Implementations must be safe to call from several threads at once: the UI
 * loop and every background cover task share one instance. All calls throw
 * DaemonError on failure.
 */
class DaemonClient {
public:
    virtual ~DaemonClient() = default;

    // Raw artwork for the file key; nullopt if the daemon has none
    virtual std::optional<Artwork> fetch_album_art(const std::string& file) = 0;

    virtual std::vector<std::string> list_tag_values(Tag tag) = 0;

    // Exact-match search on one tag, optionally sorted by another
    virtual std::vector<model::Track> find_songs(Tag tag, const std::string& value,
                                                 std::optional<Tag> sort = std::nullopt) = 0;

    // Whole flat catalog, unordered
    virtual std::vector<model::Track> list_all_songs() = 0;

    virtual model::Status status() = 0;

    // Largest binary chunk the daemon sends per art response
    virtual void set_binary_limit(uint32_t bytes) = 0;

    virtual std::optional<model::Track> current_song() = 0;
    virtual std::vector<model::Track> queue() = 0;

    // Playback and queue control
    virtual void toggle_pause(model::PlayState current) = 0;
    virtual void next() = 0;
    virtual void previous() = 0;
    virtual void set_volume(int percent) = 0;
    virtual void seek_current(int delta_seconds) = 0;
    virtual void set_repeat(bool on) = 0;
    virtual void set_random(bool on) = 0;
    virtual void set_single(bool on) = 0;
    virtual void set_consume(bool on) = 0;
    virtual void clear_queue() = 0;
    virtual void delete_queue_pos(size_t pos) = 0;
    virtual void move_queue_pos(size_t from, size_t to) = 0;
    virtual void play_queue_pos(size_t pos) = 0;
    virtual void add_to_queue(const std::string& file) = 0;
};

}  // namespace coda::backend
