#pragma once

#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace coda::backend {

/**
 * Bounded set of exclusive connections.
 *
 * Connections are opened on demand up to capacity; callers beyond that
 * block until a lease comes back. A returned connection the reuse check
 * rejects is dropped, which frees its slot for a fresh one.
 */
template<typename Conn, typename Deleter = std::default_delete<Conn>>
class ConnectionPool {
public:
    using Ptr = std::unique_ptr<Conn, Deleter>;
    using Opener = std::function<Ptr()>;
    using ReuseCheck = std::function<bool(Conn*)>;

    class Lease {
    public:
        Lease(ConnectionPool& owner, Ptr conn) : owner_(&owner), conn_(std::move(conn)) {}

        ~Lease() {
            if (!owner_) return;
            if (conn_ && !owner_->reusable_(conn_.get())) {
                conn_.reset();
            }
            owner_->release(std::move(conn_));
        }

        Lease(Lease&& other) noexcept
            : owner_(std::exchange(other.owner_, nullptr)), conn_(std::move(other.conn_)) {}
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease& operator=(Lease&&) = delete;

        Conn* get() const { return conn_.get(); }

    private:
        ConnectionPool* owner_;
        Ptr conn_;
    };

    ConnectionPool(size_t capacity, Opener open, ReuseCheck reusable)
        : capacity_(capacity == 0 ? 1 : capacity),
          open_(std::move(open)),
          reusable_(std::move(reusable)) {}

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    // Throws whatever the opener throws; the reserved slot is given back
    Lease acquire() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return !idle_.empty() || open_count_ < capacity_; });

        if (!idle_.empty()) {
            Ptr conn = std::move(idle_.back());
            idle_.pop_back();
            return Lease(*this, std::move(conn));
        }

        // Reserve the slot, then connect without holding the lock
        ++open_count_;
        lock.unlock();
        try {
            return Lease(*this, open_());
        } catch (const std::exception&) {
            release(nullptr);
            throw;
        }
    }

    // Leases every idle connection at once, e.g. to reconfigure them
    std::vector<Lease> lease_idle() {
        std::vector<Ptr> idle;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            idle.swap(idle_);
        }
        std::vector<Lease> leases;
        leases.reserve(idle.size());
        for (auto& conn : idle) {
            leases.emplace_back(*this, std::move(conn));
        }
        return leases;
    }

    size_t capacity() const { return capacity_; }

    size_t open_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_count_;
    }

    size_t in_use() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_count_ - idle_.size();
    }

private:
    void release(Ptr conn) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (conn) {
                idle_.push_back(std::move(conn));
            } else {
                --open_count_;
            }
        }
        cv_.notify_one();
    }

    const size_t capacity_;
    Opener open_;
    ReuseCheck reusable_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<Ptr> idle_;
    size_t open_count_ = 0;
};

}  // namespace coda::backend
