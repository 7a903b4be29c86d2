#include "audio/PipeWireRateController.hpp"
#include "util/Logger.hpp"
#include <pipewire/pipewire.h>
#include <pipewire/extensions/metadata.h>
#include <spa/utils/result.h>
#include <cstring>
#include <initializer_list>
#include <string>

namespace coda::audio {

namespace {
constexpr const char* SETTINGS_METADATA = "settings";
constexpr const char* KEY_FORCE_RATE = "clock.force-rate";
constexpr const char* KEY_ALLOWED_RATES = "clock.allowed-rates";
constexpr const char* KEY_RATE = "clock.rate";
constexpr int ROUNDTRIP_TIMEOUT_SEC = 2;
}  // namespace

// Everything here is touched on the PipeWire thread or under its lock
struct PipeWireRateController::State {
    struct pw_registry* registry = nullptr;
    struct pw_metadata* metadata = nullptr;
    struct spa_hook core_listener{};
    struct spa_hook registry_listener{};
    struct spa_hook metadata_listener{};

    int pending_seq = 0;
    bool done = false;

    std::vector<uint32_t> allowed_rates;
    uint32_t default_rate = 0;
};

struct RateControllerCallbacks {
    static void on_core_done(void* data, uint32_t id, int seq) {
        auto* self = static_cast<PipeWireRateController*>(data);
        if (id == PW_ID_CORE && seq == self->state_->pending_seq) {
            self->state_->done = true;
            pw_thread_loop_signal(self->context_->get_loop(), false);
        }
    }

    static void on_core_error(void* data, uint32_t id, int seq, int res, const char* message) {
        auto* self = static_cast<PipeWireRateController*>(data);
        util::Logger::warn(std::string("PipeWireRateController: Server error: ") +
                           (message ? message : spa_strerror(res)));
        if (id == PW_ID_CORE && seq == self->state_->pending_seq) {
            self->state_->done = true;
            pw_thread_loop_signal(self->context_->get_loop(), false);
        }
    }

    static int on_metadata_property(void* data, uint32_t subject, const char* key,
                                    const char* type, const char* value) {
        (void)subject;
        (void)type;
        auto* self = static_cast<PipeWireRateController*>(data);
        if (!key) return 0;

        if (std::strcmp(key, KEY_ALLOWED_RATES) == 0) {
            self->state_->allowed_rates = value ? parse_rate_list(value) : std::vector<uint32_t>{};
        } else if (std::strcmp(key, KEY_RATE) == 0 && value) {
            auto rates = parse_rate_list(value);
            self->state_->default_rate = rates.empty() ? 0 : rates.front();
        }
        return 0;
    }

    static void on_registry_global(void* data, uint32_t id, uint32_t permissions,
                                   const char* type, uint32_t version,
                                   const struct spa_dict* props) {
        (void)permissions;
        (void)version;
        auto* self = static_cast<PipeWireRateController*>(data);
        auto& state = *self->state_;

        if (state.metadata || !type || std::strcmp(type, PW_TYPE_INTERFACE_Metadata) != 0) {
            return;
        }
        const char* name = props ? spa_dict_lookup(props, PW_KEY_METADATA_NAME) : nullptr;
        if (!name || std::strcmp(name, SETTINGS_METADATA) != 0) {
            return;
        }

        state.metadata = static_cast<struct pw_metadata*>(
            pw_registry_bind(state.registry, id, type, PW_VERSION_METADATA, 0));
        if (!state.metadata) {
            util::Logger::warn("PipeWireRateController: Failed to bind settings metadata");
            return;
        }
        pw_metadata_add_listener(state.metadata, &state.metadata_listener,
                                 &metadata_events, self);
    }

    static const struct pw_core_events core_events;
    static const struct pw_registry_events registry_events;
    static const struct pw_metadata_events metadata_events;
};

const struct pw_core_events RateControllerCallbacks::core_events = {
    .version = PW_VERSION_CORE_EVENTS,
    .done = RateControllerCallbacks::on_core_done,
    .error = RateControllerCallbacks::on_core_error,
};

const struct pw_registry_events RateControllerCallbacks::registry_events = {
    .version = PW_VERSION_REGISTRY_EVENTS,
    .global = RateControllerCallbacks::on_registry_global,
    .global_remove = nullptr,
};

const struct pw_metadata_events RateControllerCallbacks::metadata_events = {
    .version = PW_VERSION_METADATA_EVENTS,
    .property = RateControllerCallbacks::on_metadata_property,
};

PipeWireRateController::PipeWireRateController(std::shared_ptr<PipeWireContext> context)
    : context_(std::move(context)), state_(std::make_unique<State>()) {}

PipeWireRateController::~PipeWireRateController() {
    struct pw_thread_loop* loop = context_->get_loop();
    if (!loop) return;

    pw_thread_loop_lock(loop);
    // Zeroed hooks were never added
    for (struct spa_hook* hook : {&state_->metadata_listener, &state_->registry_listener,
                                  &state_->core_listener}) {
        if (hook->link.next) spa_hook_remove(hook);
    }
    if (state_->metadata) {
        pw_proxy_destroy(reinterpret_cast<struct pw_proxy*>(state_->metadata));
    }
    if (state_->registry) {
        pw_proxy_destroy(reinterpret_cast<struct pw_proxy*>(state_->registry));
    }
    pw_thread_loop_unlock(loop);
}

bool PipeWireRateController::roundtrip() {
    struct pw_thread_loop* loop = context_->get_loop();

    state_->done = false;
    state_->pending_seq = pw_core_sync(context_->get_core(), PW_ID_CORE, state_->pending_seq);

    while (!state_->done) {
        if (pw_thread_loop_timed_wait(loop, ROUNDTRIP_TIMEOUT_SEC) != 0) {
            util::Logger::warn("PipeWireRateController: Round-trip timed out");
            return false;
        }
    }
    return true;
}

bool PipeWireRateController::init() {
    std::lock_guard<std::mutex> guard(call_mutex_);

    struct pw_thread_loop* loop = context_->get_loop();
    struct pw_core* core = context_->get_core();
    if (!loop || !core) {
        util::Logger::error("PipeWireRateController: Context not initialized");
        return false;
    }

    pw_thread_loop_lock(loop);

    pw_core_add_listener(core, &state_->core_listener,
                         &RateControllerCallbacks::core_events, this);
    state_->registry = pw_core_get_registry(core, PW_VERSION_REGISTRY, 0);
    if (!state_->registry) {
        pw_thread_loop_unlock(loop);
        util::Logger::error("PipeWireRateController: Failed to get registry");
        return false;
    }
    pw_registry_add_listener(state_->registry, &state_->registry_listener,
                             &RateControllerCallbacks::registry_events, this);

    // First round-trip delivers the globals, the second the metadata properties
    bool ok = roundtrip() && roundtrip();
    bool bound = state_->metadata != nullptr;
    size_t rate_count = state_->allowed_rates.size();

    pw_thread_loop_unlock(loop);

    if (!ok || !bound) {
        util::Logger::warn("PipeWireRateController: No settings metadata, rate switching disabled");
        return false;
    }

    util::Logger::info("PipeWireRateController: Ready (" + std::to_string(rate_count) +
                       " allowed rates)");
    return true;
}

std::vector<uint32_t> PipeWireRateController::supported_rates() {
    std::lock_guard<std::mutex> guard(call_mutex_);

    struct pw_thread_loop* loop = context_->get_loop();
    pw_thread_loop_lock(loop);
    std::vector<uint32_t> rates = state_->allowed_rates;
    if (rates.empty() && state_->default_rate != 0) {
        rates.push_back(state_->default_rate);
    }
    pw_thread_loop_unlock(loop);
    return rates;
}

bool PipeWireRateController::force_rate(const char* value) {
    std::lock_guard<std::mutex> guard(call_mutex_);

    struct pw_thread_loop* loop = context_->get_loop();
    pw_thread_loop_lock(loop);

    if (!state_->metadata) {
        pw_thread_loop_unlock(loop);
        return false;
    }

    int res = pw_metadata_set_property(state_->metadata, 0, KEY_FORCE_RATE, "Spa:Int", value);
    bool ok = res >= 0 && roundtrip();

    pw_thread_loop_unlock(loop);

    if (res < 0) {
        util::Logger::warn(std::string("PipeWireRateController: set_property failed: ") +
                           spa_strerror(res));
    }
    return ok;
}

bool PipeWireRateController::set_rate(uint32_t rate) {
    if (!force_rate(std::to_string(rate).c_str())) {
        return false;
    }
    util::Logger::info("PipeWireRateController: Forced graph rate " + std::to_string(rate) + " Hz");
    return true;
}

bool PipeWireRateController::reset_rate() {
    if (!force_rate("0")) {
        return false;
    }
    util::Logger::info("PipeWireRateController: Graph rate reset");
    return true;
}

}  // namespace coda::audio
