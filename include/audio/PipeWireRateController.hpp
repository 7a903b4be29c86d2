#pragma once

#include "audio/PipeWireContext.hpp"
#include "audio/RateController.hpp"
#include <memory>
#include <mutex>

namespace coda::audio {

/**
 * Forces the PipeWire graph rate through the "settings" metadata object
 * (clock.force-rate), the same knob `pw-metadata -n settings` turns.
 * Supported rates come from clock.allowed-rates on the same object.
 *
 * Thread-safe: calls serialize on an internal mutex and then on the
 * context's thread-loop lock.
 */
class PipeWireRateController : public RateController {
public:
    explicit PipeWireRateController(std::shared_ptr<PipeWireContext> context);
    ~PipeWireRateController() override;

    PipeWireRateController(const PipeWireRateController&) = delete;
    PipeWireRateController& operator=(const PipeWireRateController&) = delete;

    // Binds the settings metadata. False if the server does not expose it.
    [[nodiscard]] bool init();

    std::vector<uint32_t> supported_rates() override;
    bool set_rate(uint32_t rate) override;
    bool reset_rate() override;

private:
    friend struct RateControllerCallbacks;
    struct State;

    // Caller holds the thread-loop lock
    bool roundtrip();
    bool force_rate(const char* value);

    std::shared_ptr<PipeWireContext> context_;
    std::unique_ptr<State> state_;
    std::mutex call_mutex_;
};

}  // namespace coda::audio
