#include "audio/PipeWireContext.hpp"
#include "util/Logger.hpp"
#include <pipewire/pipewire.h>

namespace coda::audio {

PipeWireContext::PipeWireContext() {
}

PipeWireContext::~PipeWireContext() {
    if (loop_) {
        pw_thread_loop_lock(loop_);
        if (core_) {
            pw_core_disconnect(core_);
            core_ = nullptr;
        }
        if (context_) {
            pw_context_destroy(context_);
            context_ = nullptr;
        }
        pw_thread_loop_unlock(loop_);

        pw_thread_loop_stop(loop_);
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
    // Safe to leave initialized until process exit
    // pw_deinit();
}

bool PipeWireContext::init() {
    if (core_) return true; // Already initialized

    pw_init(nullptr, nullptr);
    loop_ = pw_thread_loop_new("coda-pipewire", nullptr);
    if (!loop_) {
        util::Logger::error("PipeWireContext: Failed to create thread loop");
        return false;
    }

    if (pw_thread_loop_start(loop_) < 0) {
        util::Logger::error("PipeWireContext: Failed to start thread loop");
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
        return false;
    }

    pw_thread_loop_lock(loop_);
    context_ = pw_context_new(pw_thread_loop_get_loop(loop_), nullptr, 0);
    if (context_) {
        core_ = pw_context_connect(context_, nullptr, 0);
    }
    pw_thread_loop_unlock(loop_);

    if (!core_) {
        util::Logger::warn("PipeWireContext: Cannot connect to the PipeWire server");
        return false;
    }

    util::Logger::debug("PipeWireContext: Connected");
    return true;
}

} // namespace coda::audio
