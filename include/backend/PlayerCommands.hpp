#pragma once

#include "backend/DaemonClient.hpp"
#include "model/Song.hpp"
#include <memory>
#include <optional>
#include <string>

namespace coda::backend {

enum class Action {
    TogglePause,
    Next,
    Previous,
    VolumeUp,
    VolumeDown,
    ToggleMute,
    SeekForward,
    SeekBackward,
    ToggleRepeat,
    ToggleRandom,
    ToggleSingle,
    ToggleConsume,
    ClearQueue,
    RemoveEntry,
    MoveEntryUp,
    MoveEntryDown,
    PlayPosition,
    AddSong,
    Refresh,
};

struct Command {
    Action action;
    size_t position = 0;  // queue position for the entry actions
    std::string file;     // AddSong
};

constexpr int VOLUME_STEP = 5;
constexpr int SEEK_STEP_SECONDS = 5;

// Parses "next", "vol+", "remove 3", "add some/file.flac", ...
std::optional<Command> parse_command(const std::string& line);

/**
 * Dispatches player commands to the daemon. Toggles read the current state
 * from the last polled status. Holds the volume to restore on unmute.
 */
class PlayerCommands {
public:
    explicit PlayerCommands(std::shared_ptr<DaemonClient> client);

    // Throws DaemonError. Refresh is a no-op here; the caller re-polls.
    void execute(const Command& command, const model::Status& status);

private:
    void toggle_mute(const model::Status& status);

    std::shared_ptr<DaemonClient> client_;
    int volume_before_mute_ = 50;
};

}  // namespace coda::backend
