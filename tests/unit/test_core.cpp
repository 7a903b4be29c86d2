#include "../framework/SimpleTest.hpp"
#include "../framework/FakeDaemon.hpp"
#include "backend/Config.hpp"
#include "backend/PlayerCommands.hpp"
#include "model/Library.hpp"
#include "model/Song.hpp"
#include <cstdlib>
#include <sstream>

using namespace coda;
using coda::test::FakeDaemon;

// ---- model ----

TEST_CASE(test_track_defaults) {
    model::Track t;
    ASSERT_EQ(t.title, "Unknown Title");
    ASSERT_EQ(t.artist, "Unknown Artist");
    ASSERT_EQ(t.album, "Unknown Album");
}

TEST_CASE(test_track_album_dir) {
    model::Track t;
    t.file = "Artist/Album/01 Song.flac";
    ASSERT_EQ(t.album_dir(), "Artist/Album");
    t.file = "loose.mp3";
    ASSERT_EQ(t.album_dir(), "");
}

TEST_CASE(test_track_sample_rate) {
    model::Track t;
    ASSERT_FALSE(t.sample_rate().has_value());
    t.format = "96000:24:2";
    ASSERT_EQ(t.sample_rate().value(), 96000u);
    t.format = "dsd64:1:2";
    ASSERT_FALSE(t.sample_rate().has_value());
}

TEST_CASE(test_track_refresh_progress) {
    model::Track t;
    t.duration_ms = 200000;
    t.refresh_progress(50000, model::PlayState::Playing);
    ASSERT_NEAR(t.progress.value(), 0.25, 1e-9);
    ASSERT_TRUE(t.play_state == model::PlayState::Playing);

    t.refresh_progress(std::nullopt, model::PlayState::Stopped);
    ASSERT_FALSE(t.progress.has_value());
}

TEST_CASE(test_library_search_folds_diacritics) {
    model::Library lib;
    lib.albums.push_back({"Björk", {"Homogenic", {}}});
    lib.albums.push_back({"Sigur Rós", {"Takk", {}}});

    ASSERT_EQ(lib.search_albums("bjork").size(), 1u);
    ASSERT_EQ(lib.search_albums("TAKK").size(), 1u);
    ASSERT_EQ(lib.search_albums("").size(), 2u);
    ASSERT_TRUE(lib.search_albums("zzz").empty());
}

TEST_CASE(test_lazy_library_search_covers_loaded_albums) {
    model::LazyLibrary lazy;
    lazy.albums.push_back({"Björk", {"Homogenic", {}}});
    lazy.albums.push_back({"Sigur Rós", {"Takk", {}}});

    auto matches = lazy.search_albums("ros");
    ASSERT_EQ(matches.size(), 1u);
    ASSERT_EQ(matches[0]->album.name, "Takk");
    ASSERT_TRUE(lazy.search_albums("homo").size() == 1u);
    ASSERT_TRUE(lazy.search_albums("agaetis").empty());
}

// ---- config ----

TEST_CASE(test_config_defaults) {
    backend::Config cfg;
    ASSERT_EQ(cfg.port, 6600u);
    ASSERT_EQ(cfg.cache_capacity, 256u);
    ASSERT_EQ(cfg.retry_attempts, 3);
    ASSERT_EQ(cfg.poll_interval_ms, 100u);
    ASSERT_TRUE(cfg.library_mode == backend::LibraryMode::Eager);
}

TEST_CASE(test_config_parses_sections) {
    std::istringstream in(
        "# comment\n"
        "[mpd]\n"
        "host = \"music.local\"\n"
        "port = 6601\n"
        "pool_size = 3\n"
        "art_connections = 5\n"
        "\n"
        "[library]\n"
        "mode = \"lazy\"\n"
        "retry_attempts = 5\n"
        "[cover]\n"
        "cache_capacity = 0\n"
        "prefetch_ahead = 3\n"
        "enable_album_art = false\n"
        "[pipewire]\n"
        "bit_perfect = true\n"
        "[log]\n"
        "level = debug\n"
        "unknown_key = 1\n");

    auto cfg = backend::ConfigLoader::load_from_stream(in);
    ASSERT_EQ(cfg.host, "music.local");
    ASSERT_EQ(cfg.port, 6601u);
    ASSERT_EQ(cfg.pool_size, 3u);
    ASSERT_EQ(cfg.art_connections, 5u);
    ASSERT_TRUE(cfg.library_mode == backend::LibraryMode::Lazy);
    ASSERT_EQ(cfg.retry_attempts, 5);
    ASSERT_EQ(cfg.cache_capacity, 0u);
    ASSERT_EQ(cfg.prefetch_ahead, 3u);
    ASSERT_EQ(cfg.prefetch_behind, 1u);
    ASSERT_FALSE(cfg.enable_album_art);
    ASSERT_TRUE(cfg.bit_perfect);
    ASSERT_EQ(cfg.log_level, "debug");
}

TEST_CASE(test_config_bad_number_keeps_default) {
    std::istringstream in("[mpd]\nport = sixty\ntimeout_ms = 12x\n");
    auto cfg = backend::ConfigLoader::load_from_stream(in);
    ASSERT_EQ(cfg.port, 6600u);
    ASSERT_EQ(cfg.timeout_ms, 5000u);
}

TEST_CASE(test_config_env_overrides) {
    setenv("MPD_HOST", "envhost", 1);
    setenv("MPD_PORT", "7000", 1);
    backend::Config cfg;
    backend::ConfigLoader::apply_env_overrides(cfg);
    unsetenv("MPD_HOST");
    unsetenv("MPD_PORT");

    ASSERT_EQ(cfg.host, "envhost");
    ASSERT_EQ(cfg.port, 7000u);
}

TEST_CASE(test_config_save_and_reload) {
    auto path = std::filesystem::temp_directory_path() / "coda_test_config" / "config.toml";
    backend::Config cfg;
    cfg.host = "saved";
    cfg.library_mode = backend::LibraryMode::Lazy;
    cfg.prefetch_behind = 4;
    backend::ConfigLoader::save_config(cfg, path);

    auto loaded = backend::ConfigLoader::load_from_file(path);
    std::filesystem::remove_all(path.parent_path());

    ASSERT_EQ(loaded.host, "saved");
    ASSERT_TRUE(loaded.library_mode == backend::LibraryMode::Lazy);
    ASSERT_EQ(loaded.prefetch_behind, 4u);
}

// ---- player commands ----

TEST_CASE(test_parse_commands) {
    auto next = backend::parse_command("next");
    ASSERT_TRUE(next && next->action == backend::Action::Next);

    auto remove = backend::parse_command("remove 4");
    ASSERT_TRUE(remove && remove->action == backend::Action::RemoveEntry);
    ASSERT_EQ(remove->position, 4u);

    auto add = backend::parse_command("add Artist/Album/01 Song.flac");
    ASSERT_TRUE(add && add->action == backend::Action::AddSong);
    ASSERT_EQ(add->file, "Artist/Album/01 Song.flac");

    ASSERT_FALSE(backend::parse_command("remove").has_value());
    ASSERT_FALSE(backend::parse_command("goto x").has_value());
    ASSERT_FALSE(backend::parse_command("dance").has_value());
    ASSERT_FALSE(backend::parse_command("   ").has_value());
}

TEST_CASE(test_commands_dispatch) {
    auto daemon = std::make_shared<FakeDaemon>();
    backend::PlayerCommands commands(daemon);

    model::Status status;
    status.volume = 98;
    status.repeat = true;
    status.queue_length = 3;

    commands.execute({backend::Action::VolumeUp}, status);
    commands.execute({backend::Action::VolumeDown}, status);
    commands.execute({backend::Action::ToggleRepeat}, status);
    commands.execute({backend::Action::SeekBackward}, status);
    commands.execute({backend::Action::MoveEntryUp, 0}, status);    // already first
    commands.execute({backend::Action::MoveEntryDown, 2}, status);  // already last
    commands.execute({backend::Action::MoveEntryDown, 1}, status);

    std::vector<std::string> expected = {"setvol 100", "setvol 93", "repeat 0", "seekcur -5", "move 1 2"};
    ASSERT_TRUE(daemon->commands() == expected);
}

TEST_CASE(test_mute_restores_volume) {
    auto daemon = std::make_shared<FakeDaemon>();
    backend::PlayerCommands commands(daemon);

    model::Status status;
    status.volume = 40;
    commands.execute({backend::Action::ToggleMute}, status);
    status.volume = 0;
    commands.execute({backend::Action::ToggleMute}, status);

    std::vector<std::string> expected = {"setvol 0", "setvol 40"};
    ASSERT_TRUE(daemon->commands() == expected);
}

int main() {
    return coda::test::TestRunner::instance().run_all();
}
