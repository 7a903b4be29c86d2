#include "model/Song.hpp"
#include <algorithm>
#include <charconv>
#include <string_view>

namespace coda::model {

const char* to_string(PlayState state) {
    switch (state) {
        case PlayState::Stopped: return "stopped";
        case PlayState::Playing: return "playing";
        case PlayState::Paused:  return "paused";
    }
    return "unknown";
}

std::string Track::album_dir() const {
    auto slash = file.find_last_of('/');
    if (slash == std::string::npos) {
        return "";
    }
    return file.substr(0, slash);
}

std::optional<uint32_t> Track::sample_rate() const {
    if (format.empty()) {
        return std::nullopt;
    }

    auto colon = format.find(':');
    std::string_view rate_str(format.data(), colon == std::string::npos ? format.size() : colon);

    uint32_t rate = 0;
    auto [ptr, ec] = std::from_chars(rate_str.data(), rate_str.data() + rate_str.size(), rate);
    if (ec != std::errc() || ptr != rate_str.data() + rate_str.size() || rate == 0) {
        return std::nullopt;
    }
    return rate;
}

void Track::refresh_progress(std::optional<uint32_t> elapsed, std::optional<PlayState> state) {
    elapsed_ms = elapsed;
    play_state = state;
    if (elapsed && duration_ms && *duration_ms > 0) {
        progress = std::min(1.0, static_cast<double>(*elapsed) / static_cast<double>(*duration_ms));
    } else {
        progress.reset();
    }
}

bool track_order_less(const Track& a, const Track& b) {
    if (a.disc != b.disc) return a.disc < b.disc;
    if (a.track != b.track) return a.track < b.track;
    return a.title < b.title;
}

}  // namespace coda::model
