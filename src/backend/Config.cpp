#include "backend/Config.hpp"
#include "util/Logger.hpp"
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <string>

namespace coda::backend {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

// Keeps the default and warns on anything that is not a whole number
template<typename T>
void parse_number(const std::string& key, const std::string& value, T& out) {
    T parsed{};
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
    if (ec != std::errc() || ptr != value.data() + value.size()) {
        util::Logger::warn("Config: Invalid number for " + key + ": '" + value + "'");
        return;
    }
    out = parsed;
}

void parse_bool(const std::string& key, const std::string& value, bool& out) {
    if (value == "true") {
        out = true;
    } else if (value == "false") {
        out = false;
    } else {
        util::Logger::warn("Config: Invalid boolean for " + key + ": '" + value + "'");
    }
}

void apply(Config& cfg, const std::string& section, const std::string& key, const std::string& value) {
    if (section == "mpd") {
        if (key == "host") cfg.host = value;
        else if (key == "port") parse_number(key, value, cfg.port);
        else if (key == "timeout_ms") parse_number(key, value, cfg.timeout_ms);
        else if (key == "binary_limit") parse_number(key, value, cfg.binary_limit);
        else if (key == "pool_size") parse_number(key, value, cfg.pool_size);
        else if (key == "art_connections") parse_number(key, value, cfg.art_connections);
    }
    else if (section == "library") {
        if (key == "mode") {
            if (value == "eager") cfg.library_mode = LibraryMode::Eager;
            else if (value == "lazy") cfg.library_mode = LibraryMode::Lazy;
            else util::Logger::warn("Config: Unknown library mode '" + value + "'");
        }
        else if (key == "retry_attempts") parse_number(key, value, cfg.retry_attempts);
        else if (key == "retry_base_delay_ms") parse_number(key, value, cfg.retry_base_delay_ms);
    }
    else if (section == "cover") {
        if (key == "enable_album_art") parse_bool(key, value, cfg.enable_album_art);
        else if (key == "cache_capacity") parse_number(key, value, cfg.cache_capacity);
        else if (key == "prefetch_ahead") parse_number(key, value, cfg.prefetch_ahead);
        else if (key == "prefetch_behind") parse_number(key, value, cfg.prefetch_behind);
        else if (key == "fetch_threads") parse_number(key, value, cfg.fetch_threads);
    }
    else if (section == "pipewire") {
        if (key == "bit_perfect") parse_bool(key, value, cfg.bit_perfect);
    }
    else if (section == "ui") {
        if (key == "poll_interval_ms") parse_number(key, value, cfg.poll_interval_ms);
    }
    else if (section == "log") {
        if (key == "file") cfg.log_file = value;
        else if (key == "level") cfg.log_level = value;
    }
}

}  // namespace

Config ConfigLoader::load_config() {
    util::Logger::info("Config: Loading configuration");

    auto config_file = get_config_file();
    Config cfg;
    if (std::filesystem::exists(config_file)) {
        cfg = load_from_file(config_file);
    } else {
        util::Logger::info("Config: No config at " + config_file.string() + ", using defaults");
    }

    apply_env_overrides(cfg);
    return cfg;
}

Config ConfigLoader::load_from_file(const std::filesystem::path& path) {
    util::Logger::debug("Config: Loading from " + path.string());

    std::ifstream file(path);
    if (!file) {
        util::Logger::warn("Config: Cannot open " + path.string());
        return Config{};
    }
    return load_from_stream(file);
}

Config ConfigLoader::load_from_stream(std::istream& in) {
    Config cfg;

    std::string line, current_section;
    while (std::getline(in, line)) {
        line = trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') continue;

        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes from strings
        if (value.length() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.length() - 2);
        }

        apply(cfg, current_section, key, value);
    }

    return cfg;
}

void ConfigLoader::apply_env_overrides(Config& cfg) {
    if (const char* host = std::getenv("MPD_HOST"); host && *host) {
        cfg.host = host;
    }
    if (const char* port = std::getenv("MPD_PORT"); port && *port) {
        parse_number("MPD_PORT", port, cfg.port);
    }
}

void ConfigLoader::save_config(const Config& cfg, const std::filesystem::path& path) {
    util::Logger::info("Config: Saving configuration to " + path.string());

    std::filesystem::create_directories(path.parent_path());

    std::ofstream file(path);
    if (!file) {
        util::Logger::error("Config: Cannot write " + path.string());
        return;
    }

    file << "# coda config\n\n";

    file << "[mpd]\n";
    file << "# Daemon address; MPD_HOST and MPD_PORT override these\n";
    file << "host = \"" << cfg.host << "\"\n";
    file << "port = " << cfg.port << "\n";
    file << "timeout_ms = " << cfg.timeout_ms << "\n";
    file << "# Largest binary chunk per album art response\n";
    file << "binary_limit = " << cfg.binary_limit << "\n";
    file << "# Connections for status polls, commands and library queries\n";
    file << "pool_size = " << cfg.pool_size << "\n";
    file << "# Separate connections for album art transfers\n";
    file << "art_connections = " << cfg.art_connections << "\n\n";

    file << "[library]\n";
    file << "# \"eager\" loads everything at startup, \"lazy\" loads artists on demand\n";
    file << "mode = \"" << (cfg.library_mode == LibraryMode::Lazy ? "lazy" : "eager") << "\"\n";
    file << "retry_attempts = " << cfg.retry_attempts << "\n";
    file << "retry_base_delay_ms = " << cfg.retry_base_delay_ms << "\n\n";

    file << "[cover]\n";
    file << "enable_album_art = " << (cfg.enable_album_art ? "true" : "false") << "\n";
    file << "# Covers kept in memory (0 = no limit)\n";
    file << "cache_capacity = " << cfg.cache_capacity << "\n";
    file << "prefetch_ahead = " << cfg.prefetch_ahead << "\n";
    file << "prefetch_behind = " << cfg.prefetch_behind << "\n";
    file << "fetch_threads = " << cfg.fetch_threads << "\n\n";

    file << "[pipewire]\n";
    file << "# Switch the graph rate to match each song\n";
    file << "bit_perfect = " << (cfg.bit_perfect ? "true" : "false") << "\n\n";

    file << "[ui]\n";
    file << "poll_interval_ms = " << cfg.poll_interval_ms << "\n\n";

    file << "[log]\n";
    file << "file = \"" << cfg.log_file.string() << "\"\n";
    file << "# debug, info, warn, error\n";
    file << "level = \"" << cfg.log_level << "\"\n";
}

std::filesystem::path ConfigLoader::get_config_file() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::filesystem::path(xdg) / "coda" / "config.toml";
    }
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".config" / "coda" / "config.toml";
    }
    return ".config/coda/config.toml";
}

}  // namespace coda::backend
