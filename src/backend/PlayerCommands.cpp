#include "backend/PlayerCommands.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <charconv>
#include <unordered_map>

namespace coda::backend {

namespace {

const std::unordered_map<std::string, Action>& command_words() {
    static const std::unordered_map<std::string, Action> words = {
        {"toggle", Action::TogglePause},
        {"pause", Action::TogglePause},
        {"play", Action::TogglePause},
        {"next", Action::Next},
        {"prev", Action::Previous},
        {"previous", Action::Previous},
        {"vol+", Action::VolumeUp},
        {"vol-", Action::VolumeDown},
        {"mute", Action::ToggleMute},
        {"ff", Action::SeekForward},
        {"rew", Action::SeekBackward},
        {"repeat", Action::ToggleRepeat},
        {"random", Action::ToggleRandom},
        {"single", Action::ToggleSingle},
        {"consume", Action::ToggleConsume},
        {"clear", Action::ClearQueue},
        {"remove", Action::RemoveEntry},
        {"up", Action::MoveEntryUp},
        {"down", Action::MoveEntryDown},
        {"goto", Action::PlayPosition},
        {"add", Action::AddSong},
        {"refresh", Action::Refresh},
    };
    return words;
}

bool needs_position(Action action) {
    return action == Action::RemoveEntry || action == Action::MoveEntryUp ||
           action == Action::MoveEntryDown || action == Action::PlayPosition;
}

}  // namespace

std::optional<Command> parse_command(const std::string& line) {
    auto start = line.find_first_not_of(" \t");
    if (start == std::string::npos) return std::nullopt;

    auto word_end = line.find_first_of(" \t", start);
    std::string word = line.substr(start, word_end == std::string::npos ? std::string::npos : word_end - start);

    std::string arg;
    if (word_end != std::string::npos) {
        auto arg_start = line.find_first_not_of(" \t", word_end);
        if (arg_start != std::string::npos) {
            auto arg_end = line.find_last_not_of(" \t\r\n");
            arg = line.substr(arg_start, arg_end - arg_start + 1);
        }
    }

    auto it = command_words().find(word);
    if (it == command_words().end()) return std::nullopt;

    Command cmd{it->second, 0, {}};
    if (needs_position(cmd.action)) {
        auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), cmd.position);
        if (arg.empty() || ec != std::errc() || ptr != arg.data() + arg.size()) {
            return std::nullopt;
        }
    } else if (cmd.action == Action::AddSong) {
        if (arg.empty()) return std::nullopt;
        cmd.file = arg;
    }
    return cmd;
}

PlayerCommands::PlayerCommands(std::shared_ptr<DaemonClient> client)
    : client_(std::move(client)) {}

void PlayerCommands::toggle_mute(const model::Status& status) {
    if (status.volume < 0) {
        util::Logger::warn("PlayerCommands: Daemon has no mixer, cannot mute");
        return;
    }
    if (status.volume > 0) {
        volume_before_mute_ = status.volume;
        client_->set_volume(0);
    } else {
        client_->set_volume(volume_before_mute_ > 0 ? volume_before_mute_ : 50);
    }
}

void PlayerCommands::execute(const Command& command, const model::Status& status) {
    switch (command.action) {
        case Action::TogglePause:
            client_->toggle_pause(status.state);
            break;
        case Action::Next:
            client_->next();
            break;
        case Action::Previous:
            client_->previous();
            break;
        case Action::VolumeUp:
        case Action::VolumeDown: {
            if (status.volume < 0) {
                util::Logger::warn("PlayerCommands: Daemon has no mixer");
                break;
            }
            int step = command.action == Action::VolumeUp ? VOLUME_STEP : -VOLUME_STEP;
            client_->set_volume(std::clamp(status.volume + step, 0, 100));
            break;
        }
        case Action::ToggleMute:
            toggle_mute(status);
            break;
        case Action::SeekForward:
            client_->seek_current(SEEK_STEP_SECONDS);
            break;
        case Action::SeekBackward:
            client_->seek_current(-SEEK_STEP_SECONDS);
            break;
        case Action::ToggleRepeat:
            client_->set_repeat(!status.repeat);
            break;
        case Action::ToggleRandom:
            client_->set_random(!status.random);
            break;
        case Action::ToggleSingle:
            client_->set_single(!status.single);
            break;
        case Action::ToggleConsume:
            client_->set_consume(!status.consume);
            break;
        case Action::ClearQueue:
            client_->clear_queue();
            break;
        case Action::RemoveEntry:
            client_->delete_queue_pos(command.position);
            break;
        case Action::MoveEntryUp:
            if (command.position > 0) {
                client_->move_queue_pos(command.position, command.position - 1);
            }
            break;
        case Action::MoveEntryDown:
            if (command.position + 1 < status.queue_length) {
                client_->move_queue_pos(command.position, command.position + 1);
            }
            break;
        case Action::PlayPosition:
            client_->play_queue_pos(command.position);
            break;
        case Action::AddSong:
            client_->add_to_queue(command.file);
            break;
        case Action::Refresh:
            break;
    }
}

}  // namespace coda::backend
