#pragma once

#include "backend/DaemonClient.hpp"
#include "model/Song.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace coda::app {

// Image the UI shows for the current track. Holds the undecoded bytes;
// decoding and scaling belong to the renderer.
class CoverDisplay {
public:
    void show(const std::string& file, std::shared_ptr<const backend::Artwork> data) {
        file_ = file;
        data_ = std::move(data);
        resolved_ = true;
    }

    void clear() {
        file_.clear();
        data_.reset();
        resolved_ = false;
    }

    // Cover known for file(), with or without art
    bool resolved() const { return resolved_; }
    bool has_image() const { return data_ != nullptr; }
    const std::string& file() const { return file_; }
    const std::shared_ptr<const backend::Artwork>& data() const { return data_; }

private:
    std::string file_;
    std::shared_ptr<const backend::Artwork> data_;
    bool resolved_ = false;
};

// Everything the UI loop renders, owned and mutated only by that loop
struct AppState {
    std::optional<model::Status> status;
    std::optional<model::Track> current;
    std::vector<model::Track> queue;
    CoverDisplay cover;
    bool running = true;
};

}  // namespace coda::app
