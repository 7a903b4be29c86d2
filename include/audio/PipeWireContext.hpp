#pragma once

struct pw_thread_loop;
struct pw_context;
struct pw_core;

namespace coda::audio {

// Owns the PipeWire thread loop and the connection to the server. Every
// PipeWire object created on top of it must be touched only with the loop
// locked.
class PipeWireContext {
public:
    PipeWireContext();
    ~PipeWireContext();

    PipeWireContext(const PipeWireContext&) = delete;
    PipeWireContext& operator=(const PipeWireContext&) = delete;

    [[nodiscard]] bool init();
    struct pw_thread_loop* get_loop() const { return loop_; }
    struct pw_core* get_core() const { return core_; }

private:
    struct pw_thread_loop* loop_ = nullptr;
    struct pw_context* context_ = nullptr;
    struct pw_core* core_ = nullptr;
};

} // namespace coda::audio
