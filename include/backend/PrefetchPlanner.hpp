#pragma once

#include "model/Song.hpp"
#include <optional>
#include <string>
#include <vector>

namespace coda::backend {

struct PrefetchWindow {
    size_t ahead = 1;   // entries after the current one
    size_t behind = 1;  // entries before it
};

// File keys worth fetching ahead of need: the following entries nearest
// first, then the preceding ones. Never contains the current track's key or
// a duplicate. Empty when there is no current index.
std::vector<std::string> prefetch_targets(const std::vector<model::Track>& queue,
                                          std::optional<size_t> current_index,
                                          PrefetchWindow window = {});

// Queue index of the current track: its reported queue position when that
// still points at the same file, otherwise the first entry with its key
std::optional<size_t> find_current_index(const std::vector<model::Track>& queue,
                                         const std::optional<model::Track>& current);

}  // namespace coda::backend
