#pragma once

#include <deque>
#include <mutex>
#include <optional>

namespace coda::util {

// Multi-producer, single-consumer message queue between background tasks
// and the UI loop. Sending to a closed channel drops the message.
template<typename T>
class Channel {
public:
    // Returns false if the receiver has closed the channel
    bool send(T message) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        messages_.push_back(std::move(message));
        return true;
    }

    // Non-blocking; the UI loop drains this once per iteration
    std::optional<T> try_receive() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (messages_.empty()) {
            return std::nullopt;
        }
        T message = std::move(messages_.front());
        messages_.pop_front();
        return message;
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        messages_.clear();
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_.size();
    }

private:
    mutable std::mutex mutex_;
    std::deque<T> messages_;
    bool closed_ = false;
};

}  // namespace coda::util
