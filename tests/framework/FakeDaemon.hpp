#pragma once

#include "backend/DaemonClient.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace coda::test {

inline model::Track make_track(const std::string& file, const std::string& artist,
                               const std::string& album, int track_no = 0,
                               const std::string& album_artist = "") {
    model::Track t;
    t.file = file;
    t.title = file;
    t.artist = artist;
    t.album = album;
    t.track = track_no;
    if (!album_artist.empty()) {
        t.album_artist = album_artist;
        t.has_explicit_album_artist = true;
    }
    return t;
}

// In-memory daemon. Thread-safe; counts every call the tests care about.
class FakeDaemon : public backend::DaemonClient {
public:
    // Art lookups wait here while the gate is closed
    void close_art_gate() {
        std::lock_guard<std::mutex> lock(mutex_);
        gate_open_ = false;
    }

    void open_art_gate() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            gate_open_ = true;
        }
        gate_cv_.notify_all();
    }

    void set_art(const std::string& file, backend::Artwork data) {
        std::lock_guard<std::mutex> lock(mutex_);
        art_[file] = std::move(data);
    }

    void set_songs(std::vector<model::Track> songs) {
        std::lock_guard<std::mutex> lock(mutex_);
        songs_ = std::move(songs);
    }

    void set_current(std::optional<model::Track> current) {
        std::lock_guard<std::mutex> lock(mutex_);
        current_ = std::move(current);
    }

    void set_queue(std::vector<model::Track> queue) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (size_t i = 0; i < queue.size(); ++i) queue[i].queue_pos = i;
        queue_ = std::move(queue);
        status_.queue_length = queue_.size();
    }

    void set_status(model::Status status) {
        std::lock_guard<std::mutex> lock(mutex_);
        status_ = status;
    }

    // Next `times` catalog fetches throw a DaemonError of `kind`
    void fail_catalog(int times, backend::DaemonError::Kind kind) {
        std::lock_guard<std::mutex> lock(mutex_);
        catalog_failures_ = times;
        catalog_failure_kind_ = kind;
    }

    void set_unreachable(bool unreachable) {
        std::lock_guard<std::mutex> lock(mutex_);
        unreachable_ = unreachable;
    }

    int art_fetches(const std::string& file) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = art_fetches_.find(file);
        return it == art_fetches_.end() ? 0 : it->second;
    }

    int total_art_fetches() const {
        std::lock_guard<std::mutex> lock(mutex_);
        int total = 0;
        for (const auto& [file, count] : art_fetches_) total += count;
        return total;
    }

    int catalog_calls() const { return catalog_calls_.load(); }
    int find_calls() const { return find_calls_.load(); }

    std::vector<std::string> commands() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return commands_;
    }

    std::optional<backend::Artwork> fetch_album_art(const std::string& file) override {
        std::unique_lock<std::mutex> lock(mutex_);
        ++art_fetches_[file];
        gate_cv_.wait(lock, [this] { return gate_open_; });
        check_reachable();
        auto it = art_.find(file);
        if (it == art_.end()) return std::nullopt;
        return it->second;
    }

    std::vector<std::string> list_tag_values(backend::Tag tag) override {
        std::lock_guard<std::mutex> lock(mutex_);
        check_reachable();
        std::vector<std::string> values;
        for (const auto& s : songs_) {
            std::string v = tag == backend::Tag::AlbumArtist ? s.album_artist
                          : tag == backend::Tag::Artist ? s.artist
                          : tag == backend::Tag::Album ? s.album : s.title;
            if (std::find(values.begin(), values.end(), v) == values.end()) {
                values.push_back(v);
            }
        }
        return values;
    }

    std::vector<model::Track> find_songs(backend::Tag tag, const std::string& value,
                                         std::optional<backend::Tag>) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++find_calls_;
        check_reachable();
        std::vector<model::Track> result;
        for (const auto& s : songs_) {
            const std::string& v = tag == backend::Tag::AlbumArtist ? s.album_artist
                                 : tag == backend::Tag::Artist ? s.artist : s.album;
            if (v == value) result.push_back(s);
        }
        return result;
    }

    std::vector<model::Track> list_all_songs() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++catalog_calls_;
        check_reachable();
        if (catalog_failures_ > 0) {
            --catalog_failures_;
            throw backend::DaemonError(catalog_failure_kind_, "listallinfo failed");
        }
        return songs_;
    }

    model::Status status() override {
        std::lock_guard<std::mutex> lock(mutex_);
        check_reachable();
        return status_;
    }

    void set_binary_limit(uint32_t) override {}

    std::optional<model::Track> current_song() override {
        std::lock_guard<std::mutex> lock(mutex_);
        check_reachable();
        return current_;
    }

    std::vector<model::Track> queue() override {
        std::lock_guard<std::mutex> lock(mutex_);
        check_reachable();
        return queue_;
    }

    void toggle_pause(model::PlayState) override { record("toggle"); }
    void next() override { record("next"); }
    void previous() override { record("previous"); }
    void set_volume(int percent) override { record("setvol " + std::to_string(percent)); }
    void seek_current(int delta) override { record("seekcur " + std::to_string(delta)); }
    void set_repeat(bool on) override { record(std::string("repeat ") + (on ? "1" : "0")); }
    void set_random(bool on) override { record(std::string("random ") + (on ? "1" : "0")); }
    void set_single(bool on) override { record(std::string("single ") + (on ? "1" : "0")); }
    void set_consume(bool on) override { record(std::string("consume ") + (on ? "1" : "0")); }
    void clear_queue() override { record("clear"); }
    void delete_queue_pos(size_t pos) override { record("delete " + std::to_string(pos)); }
    void move_queue_pos(size_t from, size_t to) override {
        record("move " + std::to_string(from) + " " + std::to_string(to));
    }
    void play_queue_pos(size_t pos) override { record("play " + std::to_string(pos)); }
    void add_to_queue(const std::string& file) override { record("add " + file); }

private:
    // Caller holds mutex_
    void check_reachable() const {
        if (unreachable_) {
            throw backend::DaemonError(backend::DaemonError::Kind::Connection, "connection refused");
        }
    }

    void record(const std::string& command) {
        std::lock_guard<std::mutex> lock(mutex_);
        check_reachable();
        commands_.push_back(command);
    }

    mutable std::mutex mutex_;
    std::condition_variable gate_cv_;
    bool gate_open_ = true;
    bool unreachable_ = false;

    std::map<std::string, backend::Artwork> art_;
    std::map<std::string, int> art_fetches_;
    std::vector<model::Track> songs_;
    std::optional<model::Track> current_;
    std::vector<model::Track> queue_;
    model::Status status_;

    int catalog_failures_ = 0;
    backend::DaemonError::Kind catalog_failure_kind_ = backend::DaemonError::Kind::Connection;
    std::atomic<int> catalog_calls_{0};
    std::atomic<int> find_calls_{0};
    std::vector<std::string> commands_;
};

}  // namespace coda::test
