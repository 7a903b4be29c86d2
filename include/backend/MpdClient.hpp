#pragma once

#include "backend/ConnectionPool.hpp"
#include "backend/DaemonClient.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <vector>

struct mpd_connection;

namespace coda::backend {

/**
 * DaemonClient over libmpdclient.
 *
 * libmpdclient connections are not thread-safe, so every call borrows a
 * connection for the duration of its round-trip. Album-art transfers draw
 * from their own pool: however many covers are in flight, status polls and
 * commands from the UI loop always find an interactive connection.
 */
class MpdClient : public DaemonClient {
public:
    struct Settings {
        std::string host;          // empty = libmpdclient default / $MPD_HOST
        unsigned port = 0;         // 0 = default / $MPD_PORT
        unsigned timeout_ms = 5000;
        size_t pool_size = 2;      // UI polls, commands, library queries
        size_t art_pool_size = 2;  // albumart transfers
    };

    explicit MpdClient(Settings settings);
    ~MpdClient() override;

    MpdClient(const MpdClient&) = delete;
    MpdClient& operator=(const MpdClient&) = delete;

    // Opens the first connection so configuration errors surface at startup
    void connect();

    std::optional<Artwork> fetch_album_art(const std::string& file) override;
    std::vector<std::string> list_tag_values(Tag tag) override;
    std::vector<model::Track> find_songs(Tag tag, const std::string& value,
                                         std::optional<Tag> sort = std::nullopt) override;
    std::vector<model::Track> list_all_songs() override;
    model::Status status() override;
    void set_binary_limit(uint32_t bytes) override;

    std::optional<model::Track> current_song() override;
    std::vector<model::Track> queue() override;

    void toggle_pause(model::PlayState current) override;
    void next() override;
    void previous() override;
    void set_volume(int percent) override;
    void seek_current(int delta_seconds) override;
    void set_repeat(bool on) override;
    void set_random(bool on) override;
    void set_single(bool on) override;
    void set_consume(bool on) override;
    void clear_queue() override;
    void delete_queue_pos(size_t pos) override;
    void move_queue_pos(size_t from, size_t to) override;
    void play_queue_pos(size_t pos) override;
    void add_to_queue(const std::string& file) override;

    // Whether the daemon accepted binarylimit; false falls back to its
    // default chunk size
    bool binary_limit_supported() const { return binary_limit_supported_.load(); }

private:
    struct ConnectionDeleter {
        void operator()(mpd_connection* conn) const;
    };
    using Pool = ConnectionPool<mpd_connection, ConnectionDeleter>;

    std::unique_ptr<mpd_connection, ConnectionDeleter> open_connection();
    void apply_binary_limit(mpd_connection* conn, uint32_t bytes);

    // Runs a libmpdclient mpd_run_* style command
    template<typename Fn>
    void run_command(const char* what, Fn&& fn);

    Settings settings_;
    std::atomic<uint32_t> binary_limit_{0};
    std::atomic<bool> binary_limit_supported_{true};

    Pool interactive_;
    Pool art_;
};

}  // namespace coda::backend
