#ifndef BOOK_UPDATE_SIGNAL_HPP
#define BOOK_UPDATE_SIGNAL_HPP

#include <mutex>
#include <condition_variable>
#include <chrono>
#include <cstdint>

/**
 * Wakes the monitoring loops of a symbol when its book changed.
 *
 * Every notify() bumps a generation counter and wakes all waiters. Each
 * waiter keeps the last generation it saw, so several monitors on one
 * symbol all see the update, and a slow consumer sees one wake-up for any
 * number of updates.
 */
class BookUpdateSignal {
public:
    void notify() {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            ++generation_;
        }
        cv_.notify_all();
    }

    uint64_t generation() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return generation_;
    }

    // true if the generation moved past lastSeen (which is then updated),
    // false on timeout/shutdown
    template<class Rep, class Period>
    bool waitFor(uint64_t& lastSeen, const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lk(mutex_);
        cv_.wait_for(lk, timeout, [this, &lastSeen] { return generation_ != lastSeen || shutdown_; });
        if (shutdown_ || generation_ == lastSeen) {
            return false;
        }
        lastSeen = generation_;
        return true;
    }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            shutdown_ = true;
        }
        cv_.notify_all();
    }

    bool isShutdown() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return shutdown_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    uint64_t generation_{0};
    bool shutdown_{false};
};

#endif // BOOK_UPDATE_SIGNAL_HPP
