#pragma once

#include "backend/DaemonClient.hpp"
#include "model/Library.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

namespace coda::backend {

// Terminal library load failure: daemon unreachable, retries exhausted or a
// query rejected
class LibraryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Builds the artist → album → track hierarchy from the daemon's flat catalog.
 *
 * Eager: one bulk fetch (retried with exponential backoff) and a two-pass
 * grouping that assigns every album a single canonical album artist.
 *
 * Lazy: only the album-artist names up front; each artist's songs are
 * fetched on first access. Lazy grouping uses the AlbumArtist tag as-is.
 */
class LibraryLoader {
public:
    struct Options {
        int retry_attempts = 3;
        std::chrono::milliseconds retry_base_delay{1000};
    };

    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    explicit LibraryLoader(std::shared_ptr<DaemonClient> client);
    LibraryLoader(std::shared_ptr<DaemonClient> client, Options options);

    // Replaces std::this_thread::sleep_for between retries
    void set_sleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

    model::Library load_eager();

    model::LazyLibrary init_lazy();

    // Throws std::out_of_range for a bad index. No-op for a loaded artist.
    void load_artist(model::LazyLibrary& library, size_t index);

    // Loads every remaining artist and flattens into the eager shape
    model::Library materialize(model::LazyLibrary& library);

    const Options& options() const { return options_; }

private:
    std::vector<model::Track> fetch_catalog_with_retry();

    std::shared_ptr<DaemonClient> client_;
    Options options_;
    Sleeper sleeper_;
};

}  // namespace coda::backend
