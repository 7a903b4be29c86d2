#include "app/MainLoop.hpp"
#include "util/Logger.hpp"
#include <cerrno>
#include <charconv>
#include <format>
#include <iostream>
#include <poll.h>
#include <stdexcept>
#include <unistd.h>

namespace coda::app {

namespace {

std::string format_time(std::optional<uint32_t> ms) {
    if (!ms) return "--:--";
    uint32_t total = *ms / 1000;
    return std::format("{}:{:02}", total / 60, total % 60);
}

std::optional<size_t> parse_index(const std::string& text) {
    size_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

backend::LibraryLoader::Options library_options(const backend::Config& config) {
    backend::LibraryLoader::Options options;
    options.retry_attempts = config.retry_attempts;
    options.retry_base_delay = std::chrono::milliseconds(config.retry_base_delay_ms);
    return options;
}

}  // namespace

MainLoop::MainLoop(const backend::Config& config,
                   std::shared_ptr<backend::DaemonClient> client,
                   std::shared_ptr<audio::RateController> rates,
                   std::ostream& out)
    : client_(std::move(client)),
      out_(out),
      library_mode_(config.library_mode),
      album_art_(config.enable_album_art),
      poll_interval_(config.poll_interval_ms),
      pool_(std::make_shared<util::TaskPool>(config.fetch_threads)),
      cache_(std::make_shared<backend::CoverCache>(config.cache_capacity)),
      covers_out_(std::make_shared<backend::CoverChannel>()),
      cover_loader_(std::make_shared<backend::CoverLoader>(client_, cache_, pool_, covers_out_)),
      song_reactor_(cover_loader_, backend::PrefetchWindow{config.prefetch_ahead, config.prefetch_behind}),
      commands_(client_),
      library_loader_(client_, library_options(config)) {
    if (rates) {
        rate_reactor_ = std::make_unique<SampleRateReactor>(std::move(rates), pool_);
    }
}

MainLoop::~MainLoop() {
    // Late covers have nowhere to go
    covers_out_->close();
    pool_->wait_idle();
}

void MainLoop::load_library() {
    if (library_mode_ == backend::LibraryMode::Lazy) {
        library_ = library_loader_.init_lazy();
    } else {
        library_ = library_loader_.load_eager();
    }
}

bool MainLoop::poll() {
    model::Status status;
    std::optional<model::Track> current;
    std::vector<model::Track> queue;

    try {
        status = client_->status();
        current = client_->current_song();
        queue = client_->queue();
    } catch (const backend::DaemonError& e) {
        util::Logger::warn(std::string("MainLoop: Poll failed: ") + e.what());
        state_.status.reset();
        if (rate_reactor_) rate_reactor_->update(std::nullopt, std::nullopt);
        return false;
    }

    // Same track: keep it and only move the progress fields
    if (current && state_.current && current->file == state_.current->file) {
        state_.current->refresh_progress(status.elapsed_ms, status.state);
    } else {
        state_.current = std::move(current);
        if (state_.current) {
            state_.current->refresh_progress(status.elapsed_ms, status.state);
        }
    }
    state_.queue = std::move(queue);
    state_.status = status;

    if (album_art_) {
        song_reactor_.check(state_.current, state_.queue, state_.cover);
        resolve_cover_from_cache();
    } else if (!state_.current) {
        state_.cover.clear();
    }

    if (rate_reactor_) {
        std::optional<uint32_t> rate;
        if (state_.current) rate = state_.current->sample_rate();
        if (!rate) rate = status.sample_rate;
        rate_reactor_->update(status.state, rate);
    }
    return true;
}

void MainLoop::resolve_cover_from_cache() {
    // A load that found its key already pending (usually a prefetch) delivers
    // nothing; pick the result up once that fetch has landed in the cache
    if (!state_.current) return;
    const std::string& file = state_.current->file;
    if (state_.cover.resolved() && state_.cover.file() == file) return;

    if (auto entry = cache_->get(file)) {
        util::Logger::debug("MainLoop: Cover for " + file + " resolved from cache");
        state_.cover.show(file, entry->data);
    }
}

size_t MainLoop::drain_covers() {
    size_t applied = 0;
    while (auto message = covers_out_->try_receive()) {
        if (state_.current && message->file == state_.current->file) {
            state_.cover.show(message->file, message->data);
            ++applied;
        } else {
            util::Logger::debug("MainLoop: Discarding stale cover for " + message->file);
        }
    }
    return applied;
}

bool MainLoop::wait_for_input() {
    struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
    int ret = ::poll(&pfd, 1, static_cast<int>(poll_interval_.count()));

    if (ret < 0) {
        if (errno != EINTR) {
            util::Logger::error("MainLoop: poll failed: errno=" + std::to_string(errno));
        }
        return false;
    }
    return ret > 0 && (pfd.revents & (POLLIN | POLLHUP));
}

void MainLoop::run(const std::atomic<bool>& stop) {
    std::optional<std::string> shown_key;
    bool shown_cover = false;

    while (state_.running && !stop.load()) {
        poll();
        drain_covers();

        std::optional<std::string> key;
        if (state_.current) key = state_.current->file;
        if (key != shown_key) {
            print_status();
            shown_key = key;
            shown_cover = false;
        }
        if (!shown_cover && state_.cover.resolved() && key && state_.cover.file() == *key) {
            if (state_.cover.has_image()) {
                out_ << "[cover " << state_.cover.data()->size() << " bytes]" << std::endl;
            } else {
                out_ << "[no cover]" << std::endl;
            }
            shown_cover = true;
        }

        if (wait_for_input()) {
            std::string line;
            if (!std::getline(std::cin, line)) {
                util::Logger::info("MainLoop: stdin closed");
                break;
            }
            if (!handle_line(line)) {
                break;
            }
        }
    }
    state_.running = false;
}

bool MainLoop::handle_line(const std::string& line) {
    auto start = line.find_first_not_of(" \t");
    if (start == std::string::npos) return true;
    auto word_end = line.find_first_of(" \t", start);
    std::string word = line.substr(start, word_end == std::string::npos ? std::string::npos : word_end - start);
    std::string arg;
    if (word_end != std::string::npos) {
        auto arg_start = line.find_first_not_of(" \t", word_end);
        if (arg_start != std::string::npos) arg = line.substr(arg_start);
    }

    if (word == "quit" || word == "q") {
        state_.running = false;
        return false;
    }
    if (word == "help") {
        out_ << "status queue artists albums [i] search <text> reload materialize quit\n"
             << "toggle next prev vol+ vol- mute ff rew repeat random single consume\n"
             << "clear remove <pos> up <pos> down <pos> goto <pos> add <file> refresh" << std::endl;
        return true;
    }
    if (word == "status") { print_status(); return true; }
    if (word == "queue") { print_queue(); return true; }
    if (word == "artists") { print_artists(); return true; }
    if (word == "albums") { print_albums(arg); return true; }
    if (word == "search") { print_search(arg); return true; }

    if (word == "reload" || word == "materialize") {
        try {
            if (word == "reload") {
                load_library();
            } else if (auto* lazy = std::get_if<model::LazyLibrary>(&library_)) {
                model::Library full = library_loader_.materialize(*lazy);
                library_ = std::move(full);
            }
            out_ << "Library ready" << std::endl;
        } catch (const backend::LibraryError& e) {
            util::Logger::error(std::string("MainLoop: ") + e.what());
            out_ << "Library load failed: " << e.what() << std::endl;
        }
        return true;
    }

    auto command = backend::parse_command(line);
    if (!command) {
        out_ << "Unknown command: " << word << std::endl;
        return true;
    }

    if (command->action != backend::Action::Refresh) {
        try {
            commands_.execute(*command, state_.status.value_or(model::Status{}));
        } catch (const backend::DaemonError& e) {
            util::Logger::warn(std::string("MainLoop: Command failed: ") + e.what());
            out_ << "Error: " << e.what() << std::endl;
        }
    }
    poll();
    return true;
}

void MainLoop::print_status() {
    if (!state_.status) {
        out_ << "(daemon unreachable)" << std::endl;
        return;
    }
    const auto& status = *state_.status;
    if (!state_.current) {
        out_ << "[" << model::to_string(status.state) << "] nothing playing" << std::endl;
        return;
    }
    const auto& t = *state_.current;
    out_ << "[" << model::to_string(status.state) << "] " << t.artist << " - " << t.title
         << " (" << t.album << ") " << format_time(t.elapsed_ms) << "/" << format_time(t.duration_ms)
         << " vol " << status.volume << "%" << std::endl;
}

void MainLoop::print_queue() {
    for (size_t i = 0; i < state_.queue.size(); ++i) {
        const auto& t = state_.queue[i];
        bool playing = state_.current && state_.current->file == t.file;
        out_ << (playing ? "> " : "  ") << i << ". " << t.artist << " - " << t.title << std::endl;
    }
}

void MainLoop::print_artists() {
    if (auto* lib = std::get_if<model::Library>(&library_)) {
        for (size_t i = 0; i < lib->artists.size(); ++i) {
            out_ << i << ". " << lib->artists[i].name << std::endl;
        }
    } else if (auto* lazy = std::get_if<model::LazyLibrary>(&library_)) {
        for (size_t i = 0; i < lazy->artists.size(); ++i) {
            out_ << i << ". " << lazy->artists[i].name << (lazy->artists[i].is_loaded() ? "" : " *") << std::endl;
        }
    } else {
        out_ << "Library not loaded" << std::endl;
    }
}

void MainLoop::print_albums(const std::string& arg) {
    auto print_album = [this](const std::string& artist, const model::Album& album) {
        out_ << album.name << " - " << artist << " (" << album.tracks.size() << " tracks)" << std::endl;
    };

    if (arg.empty()) {
        const std::vector<model::AlbumEntry>* index = nullptr;
        if (auto* lib = std::get_if<model::Library>(&library_)) index = &lib->albums;
        if (auto* lazy = std::get_if<model::LazyLibrary>(&library_)) index = &lazy->albums;
        if (!index) {
            out_ << "Library not loaded" << std::endl;
            return;
        }
        for (const auto& entry : *index) print_album(entry.artist, entry.album);
        return;
    }

    auto i = parse_index(arg);
    if (!i) {
        out_ << "Bad artist index: " << arg << std::endl;
        return;
    }

    try {
        if (auto* lib = std::get_if<model::Library>(&library_)) {
            for (const auto& album : lib->albums_for(*i)) print_album(lib->artists[*i].name, album);
        } else if (auto* lazy = std::get_if<model::LazyLibrary>(&library_)) {
            library_loader_.load_artist(*lazy, *i);
            for (const auto& album : *lazy->albums_for(*i)) print_album(lazy->artists[*i].name, album);
        } else {
            out_ << "Library not loaded" << std::endl;
        }
    } catch (const std::out_of_range& e) {
        out_ << e.what() << std::endl;
    } catch (const backend::LibraryError& e) {
        util::Logger::warn(std::string("MainLoop: ") + e.what());
        out_ << "Load failed: " << e.what() << std::endl;
    }
}

void MainLoop::print_search(const std::string& query) {
    std::vector<const model::AlbumEntry*> matches;
    if (auto* lib = std::get_if<model::Library>(&library_)) {
        matches = lib->search_albums(query);
    } else if (auto* lazy = std::get_if<model::LazyLibrary>(&library_)) {
        matches = lazy->search_albums(query);
    } else {
        out_ << "Library not loaded" << std::endl;
        return;
    }
    for (const auto* entry : matches) {
        out_ << entry->album.name << " - " << entry->artist << std::endl;
    }
}

}  // namespace coda::app
