#include "app/SongChangeReactor.hpp"
#include "util/Logger.hpp"

namespace coda::app {

SongChangeReactor::SongChangeReactor(std::shared_ptr<backend::CoverLoader> loader,
                                     backend::PrefetchWindow window)
    : loader_(std::move(loader)), window_(window) {}

void SongChangeReactor::check(const std::optional<model::Track>& current,
                              const std::vector<model::Track>& queue,
                              CoverDisplay& display) {
    std::optional<std::string> key;
    if (current) key = current->file;

    if (key == last_key_) {
        return;
    }

    if (!current) {
        util::Logger::debug("SongChangeReactor: No current track");
        display.clear();
    } else {
        util::Logger::debug("SongChangeReactor: Now playing " + current->file);
        loader_->load(current->file);

        auto index = backend::find_current_index(queue, current);
        auto targets = backend::prefetch_targets(queue, index, window_);
        if (!targets.empty()) {
            loader_->prefetch(targets);
        }
    }

    last_key_ = std::move(key);
}

}  // namespace coda::app
