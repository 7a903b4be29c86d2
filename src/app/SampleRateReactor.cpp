#include "app/SampleRateReactor.hpp"
#include "util/Logger.hpp"
#include <exception>

namespace coda::app {

SampleRateReactor::SampleRateReactor(std::shared_ptr<audio::RateController> controller,
                                     std::shared_ptr<util::TaskPool> pool)
    : controller_(std::move(controller)), pool_(std::move(pool)) {}

void SampleRateReactor::spawn_set_rate(uint32_t song_rate) {
    auto task = [controller = controller_, song_rate]() {
        try {
            uint32_t target = audio::resolve_bit_perfect_rate(song_rate, controller->supported_rates());
            if (!controller->set_rate(target)) {
                util::Logger::warn("SampleRateReactor: Failed to set rate " + std::to_string(target));
            }
        } catch (const std::exception& e) {
            util::Logger::warn(std::string("SampleRateReactor: Rate switch failed: ") + e.what());
        }
    };
    if (!pool_->submit(std::move(task))) {
        util::Logger::warn("SampleRateReactor: Could not schedule rate switch");
    }
}

void SampleRateReactor::spawn_reset() {
    auto task = [controller = controller_]() {
        try {
            if (!controller->reset_rate()) {
                util::Logger::warn("SampleRateReactor: Failed to reset rate");
            }
        } catch (const std::exception& e) {
            util::Logger::warn(std::string("SampleRateReactor: Rate reset failed: ") + e.what());
        }
    };
    if (!pool_->submit(std::move(task))) {
        util::Logger::warn("SampleRateReactor: Could not schedule rate reset");
    }
}

void SampleRateReactor::update(std::optional<model::PlayState> state,
                               std::optional<uint32_t> song_rate) {
    if (state == model::PlayState::Playing) {
        bool changed = last_state_ != model::PlayState::Playing || song_rate != last_rate_;
        if (changed && song_rate) {
            util::Logger::debug("SampleRateReactor: Playing at " + std::to_string(*song_rate) + " Hz");
            spawn_set_rate(*song_rate);
        }
        last_state_ = state;
        last_rate_ = song_rate;
        reset_issued_ = false;
        return;
    }

    // Paused, stopped or unknown: one reset until playback resumes
    if (!reset_issued_) {
        spawn_reset();
        reset_issued_ = true;
    }
    last_state_ = state;
    last_rate_.reset();
}

}  // namespace coda::app
