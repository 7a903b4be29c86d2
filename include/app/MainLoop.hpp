#pragma once

#include "app/AppState.hpp"
#include "app/SampleRateReactor.hpp"
#include "app/SongChangeReactor.hpp"
#include "audio/RateController.hpp"
#include "backend/Config.hpp"
#include "backend/CoverLoader.hpp"
#include "backend/DaemonClient.hpp"
#include "backend/LibraryLoader.hpp"
#include "backend/PlayerCommands.hpp"
#include "model/Library.hpp"
#include "util/TaskPool.hpp"
#include <atomic>
#include <chrono>
#include <iosfwd>
#include <memory>
#include <string>
#include <variant>

namespace coda::app {

/**
 * The single-threaded UI loop: polls the daemon, runs the reactors, drains
 * finished covers and reads line commands from stdin.
 *
 * Owns the task pool, so destroying the loop waits for in-flight cover
 * fetches and rate switches.
 */
class MainLoop {
public:
    // rates may be nullptr when bit-perfect switching is off or unavailable
    MainLoop(const backend::Config& config,
             std::shared_ptr<backend::DaemonClient> client,
             std::shared_ptr<audio::RateController> rates,
             std::ostream& out);
    ~MainLoop();

    MainLoop(const MainLoop&) = delete;
    MainLoop& operator=(const MainLoop&) = delete;

    // Eager or lazy per config. Throws backend::LibraryError.
    void load_library();

    // Returns when the user quits, stdin closes or stop becomes true
    void run(const std::atomic<bool>& stop);

    // One status/current/queue poll plus the reactors. False if the daemon
    // could not be reached.
    bool poll();

    // Applies finished covers for the current track, drops stale ones
    size_t drain_covers();

    // Front-end and player commands; false on quit
    bool handle_line(const std::string& line);

    AppState& state() { return state_; }
    const std::shared_ptr<backend::CoverChannel>& cover_channel() const { return covers_out_; }
    const backend::SharedCoverCache& cover_cache() const { return cache_; }
    util::TaskPool& task_pool() { return *pool_; }
    backend::LibraryLoader& library_loader() { return library_loader_; }

private:
    using LibraryModel = std::variant<std::monostate, model::Library, model::LazyLibrary>;

    bool wait_for_input();
    void resolve_cover_from_cache();
    void print_status();
    void print_artists();
    void print_albums(const std::string& arg);
    void print_search(const std::string& query);
    void print_queue();

    std::shared_ptr<backend::DaemonClient> client_;
    std::ostream& out_;
    backend::LibraryMode library_mode_;
    bool album_art_;
    std::chrono::milliseconds poll_interval_;

    std::shared_ptr<util::TaskPool> pool_;
    backend::SharedCoverCache cache_;
    std::shared_ptr<backend::CoverChannel> covers_out_;
    std::shared_ptr<backend::CoverLoader> cover_loader_;

    SongChangeReactor song_reactor_;
    std::unique_ptr<SampleRateReactor> rate_reactor_;
    backend::PlayerCommands commands_;
    backend::LibraryLoader library_loader_;

    AppState state_;
    LibraryModel library_;
};

}  // namespace coda::app
