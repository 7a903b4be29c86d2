#include "../framework/SimpleTest.hpp"
#include "../framework/FakeDaemon.hpp"
#include "app/MainLoop.hpp"
#include <chrono>
#include <sstream>
#include <thread>

using namespace coda;
using coda::test::FakeDaemon;
using coda::test::make_track;

struct PipelineFixture {
    std::shared_ptr<FakeDaemon> daemon = std::make_shared<FakeDaemon>();
    std::ostringstream out;
    std::unique_ptr<app::MainLoop> loop;

    explicit PipelineFixture(backend::Config config = test_config()) {
        std::vector<model::Track> queue;
        for (const char* f : {"a/1.flac", "a/2.flac", "a/3.flac", "b/1.flac"}) {
            queue.push_back(make_track(f, "Artist", "Album"));
            daemon->set_art(f, backend::Artwork(16, 0xAB));
        }
        daemon->set_queue(queue);

        model::Status status;
        status.state = model::PlayState::Playing;
        status.elapsed_ms = 1000;
        daemon->set_status(status);

        loop = std::make_unique<app::MainLoop>(config, daemon, nullptr, out);
    }

    static backend::Config test_config() {
        backend::Config config;
        config.fetch_threads = 2;
        config.poll_interval_ms = 10;
        return config;
    }

    void play(size_t pos) {
        auto track = make_track(daemon->queue()[pos].file, "Artist", "Album");
        track.queue_pos = pos;
        daemon->set_current(track);
    }

    void settle() {
        loop->task_pool().wait_idle();
        loop->drain_covers();
    }
};

TEST_CASE(test_poll_delivers_cover_for_current_song) {
    PipelineFixture f;
    f.play(1);

    ASSERT_TRUE(f.loop->poll());
    f.settle();

    auto& state = f.loop->state();
    ASSERT_TRUE(state.current.has_value());
    ASSERT_EQ(state.cover.file(), "a/2.flac");
    ASSERT_TRUE(state.cover.has_image());
    // Current plus both neighbours
    ASSERT_EQ(f.daemon->total_art_fetches(), 3);
}

TEST_CASE(test_stale_cover_is_discarded) {
    PipelineFixture f;
    f.play(0);
    f.loop->poll();
    f.loop->task_pool().wait_idle();

    // The song changes before the UI drains the finished cover
    f.play(3);
    f.daemon->close_art_gate();
    f.loop->poll();

    ASSERT_EQ(f.loop->drain_covers(), 0u);
    ASSERT_FALSE(f.loop->state().cover.resolved());

    f.daemon->open_art_gate();
    f.settle();
    ASSERT_EQ(f.loop->state().cover.file(), "b/1.flac");
}

TEST_CASE(test_cover_resolved_after_pending_prefetch) {
    auto config = PipelineFixture::test_config();
    config.fetch_threads = 4;
    PipelineFixture f(config);
    f.daemon->close_art_gate();

    // a/1 loads and a/2 is prefetched; both block at the daemon
    f.play(0);
    f.loop->poll();
    for (int spins = 0; spins < 200 && f.daemon->art_fetches("a/2.flac") == 0; ++spins) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ASSERT_EQ(f.daemon->art_fetches("a/2.flac"), 1);

    // Skipping to a/2 finds its fetch already in flight
    f.play(1);
    f.loop->poll();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    ASSERT_EQ(f.daemon->art_fetches("a/2.flac"), 1);

    f.daemon->open_art_gate();
    f.settle();
    f.loop->poll();
    f.loop->drain_covers();

    const auto& cover = f.loop->state().cover;
    ASSERT_TRUE(cover.resolved());
    ASSERT_EQ(cover.file(), "a/2.flac");
    ASSERT_TRUE(cover.has_image());
    ASSERT_EQ(f.daemon->art_fetches("a/2.flac"), 1);
}

TEST_CASE(test_poll_answers_while_art_fetches_block) {
    PipelineFixture f;
    f.daemon->close_art_gate();

    // Quick skips pile up blocked fetches on every worker
    for (size_t pos : {0u, 2u, 3u, 1u}) {
        f.play(pos);
        ASSERT_TRUE(f.loop->poll());
    }
    ASSERT_EQ(f.loop->state().current->file, "a/2.flac");
    ASSERT_TRUE(f.loop->handle_line("next"));
    ASSERT_TRUE(f.loop->state().status.has_value());

    f.daemon->open_art_gate();
    f.settle();
}

TEST_CASE(test_progress_refreshed_in_place) {
    PipelineFixture f;
    f.play(0);
    f.loop->poll();

    model::Status status;
    status.state = model::PlayState::Paused;
    status.elapsed_ms = 4000;
    f.daemon->set_status(status);
    f.loop->poll();

    const auto& current = f.loop->state().current;
    ASSERT_EQ(current->elapsed_ms.value(), 4000u);
    ASSERT_TRUE(current->play_state == model::PlayState::Paused);
    f.settle();
}

TEST_CASE(test_unreachable_daemon_keeps_running) {
    PipelineFixture f;
    f.daemon->set_unreachable(true);

    ASSERT_FALSE(f.loop->poll());
    ASSERT_FALSE(f.loop->state().status.has_value());
    ASSERT_TRUE(f.loop->handle_line("status"));
    ASSERT_TRUE(f.out.str().find("unreachable") != std::string::npos);
}

TEST_CASE(test_commands_reach_daemon) {
    PipelineFixture f;
    f.play(0);
    f.loop->poll();

    ASSERT_TRUE(f.loop->handle_line("next"));
    ASSERT_TRUE(f.loop->handle_line("goto 2"));
    ASSERT_TRUE(f.loop->handle_line("bogus"));
    ASSERT_FALSE(f.loop->handle_line("quit"));
    f.settle();

    std::vector<std::string> expected = {"next", "play 2"};
    ASSERT_TRUE(f.daemon->commands() == expected);
    ASSERT_TRUE(f.out.str().find("Unknown command: bogus") != std::string::npos);
}

TEST_CASE(test_lazy_library_through_front_end) {
    auto config = PipelineFixture::test_config();
    config.library_mode = backend::LibraryMode::Lazy;
    PipelineFixture f(config);
    f.daemon->set_songs({
        make_track("b/x/1.flac", "beta", "X", 1, "beta"),
        make_track("a/y/1.flac", "Alpha", "Y", 1, "Alpha"),
    });

    f.loop->load_library();
    ASSERT_TRUE(f.loop->handle_line("albums 1"));
    ASSERT_TRUE(f.out.str().find("X - beta") != std::string::npos);
    ASSERT_EQ(f.daemon->find_calls(), 1);

    ASSERT_TRUE(f.loop->handle_line("albums 7"));
    ASSERT_TRUE(f.loop->handle_line("materialize"));
    ASSERT_EQ(f.daemon->find_calls(), 2);
}

int main() {
    return coda::test::TestRunner::instance().run_all();
}
