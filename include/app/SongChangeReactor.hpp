#pragma once

#include "app/AppState.hpp"
#include "backend/CoverLoader.hpp"
#include "backend/PrefetchPlanner.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace coda::app {

// Starts cover work when the current track's file changes: an on-demand load
// for the new track plus prefetches for its queue neighbours.
class SongChangeReactor {
public:
    SongChangeReactor(std::shared_ptr<backend::CoverLoader> loader, backend::PrefetchWindow window);

    // Call once per status poll. No-op while the current file is unchanged.
    void check(const std::optional<model::Track>& current,
               const std::vector<model::Track>& queue,
               CoverDisplay& display);

    const std::optional<std::string>& last_key() const { return last_key_; }

private:
    std::shared_ptr<backend::CoverLoader> loader_;
    backend::PrefetchWindow window_;
    std::optional<std::string> last_key_;
};

}  // namespace coda::app
