#include "backend/PrefetchPlanner.hpp"
#include <algorithm>

namespace coda::backend {

std::vector<std::string> prefetch_targets(const std::vector<model::Track>& queue,
                                          std::optional<size_t> current_index,
                                          PrefetchWindow window) {
    std::vector<std::string> targets;
    if (!current_index || *current_index >= queue.size()) {
        return targets;
    }

    const size_t current = *current_index;
    const std::string& current_key = queue[current].file;

    auto add = [&](size_t index) {
        const std::string& key = queue[index].file;
        if (key.empty() || key == current_key) return;
        if (std::find(targets.begin(), targets.end(), key) != targets.end()) return;
        targets.push_back(key);
    };

    for (size_t i = 1; i <= window.ahead && current + i < queue.size(); ++i) {
        add(current + i);
    }
    for (size_t i = 1; i <= window.behind && i <= current; ++i) {
        add(current - i);
    }
    return targets;
}

std::optional<size_t> find_current_index(const std::vector<model::Track>& queue,
                                         const std::optional<model::Track>& current) {
    if (!current) {
        return std::nullopt;
    }

    if (current->queue_pos && *current->queue_pos < queue.size() &&
        queue[*current->queue_pos].file == current->file) {
        return current->queue_pos;
    }

    for (size_t i = 0; i < queue.size(); ++i) {
        if (queue[i].file == current->file) {
            return i;
        }
    }
    return std::nullopt;
}

}  // namespace coda::backend
