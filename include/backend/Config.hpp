#pragma once

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <string>

namespace coda::backend {

enum class LibraryMode {
    Eager,
    Lazy,
};

struct Config {
    // [mpd]
    std::string host = "localhost";
    unsigned port = 6600;
    unsigned timeout_ms = 5000;
    uint32_t binary_limit = 1024 * 1024;
    size_t pool_size = 2;
    size_t art_connections = 2;

    // [library]
    LibraryMode library_mode = LibraryMode::Eager;
    int retry_attempts = 3;
    unsigned retry_base_delay_ms = 1000;

    // [cover]
    bool enable_album_art = true;
    size_t cache_capacity = 256;
    size_t prefetch_ahead = 1;
    size_t prefetch_behind = 1;
    size_t fetch_threads = 4;

    // [pipewire]
    bool bit_perfect = false;

    // [ui]
    unsigned poll_interval_ms = 100;

    // [log]
    std::filesystem::path log_file = "/tmp/coda.log";
    std::string log_level = "info";
};

class ConfigLoader {
public:
    // Config file, then MPD_HOST / MPD_PORT on top
    static Config load_config();
    static Config load_from_file(const std::filesystem::path& path);
    static Config load_from_stream(std::istream& in);
    static void apply_env_overrides(Config& cfg);
    static void save_config(const Config& cfg, const std::filesystem::path& path);

    static std::filesystem::path get_config_file();
};

}  // namespace coda::backend
