#pragma once

#include "audio/RateController.hpp"
#include "model/Song.hpp"
#include "util/TaskPool.hpp"
#include <memory>
#include <optional>

namespace coda::app {

/**
 * Keeps the audio graph at the playing song's native rate.
 *
 * Switches happen on the task pool and are fire-and-forget: a failed switch
 * is logged and the next state or rate change tries again.
 */
class SampleRateReactor {
public:
    SampleRateReactor(std::shared_ptr<audio::RateController> controller,
                      std::shared_ptr<util::TaskPool> pool);

    // state/rate are nullopt when the poll could not tell
    void update(std::optional<model::PlayState> state, std::optional<uint32_t> song_rate);

private:
    void spawn_set_rate(uint32_t song_rate);
    void spawn_reset();

    std::shared_ptr<audio::RateController> controller_;
    std::shared_ptr<util::TaskPool> pool_;

    std::optional<model::PlayState> last_state_;
    std::optional<uint32_t> last_rate_;
    bool reset_issued_ = false;
};

}  // namespace coda::app
