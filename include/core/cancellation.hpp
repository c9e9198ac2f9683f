#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace kvault {

/**
 * @brief Cooperative cancellation signal shared between a caller and the
 * operations it starts. Copies observe the same state.
 *
 * Operations check is_cancelled() before each network attempt and sleep
 * through wait_for() so a cancel wakes a backoff immediately.
 */
class CancellationToken {
public:
    CancellationToken() : state_(std::make_shared<State>()) {}

    static CancellationToken none() { return CancellationToken{}; }

    void cancel() {
        {
            std::lock_guard lock(state_->mutex);
            state_->cancelled.store(true, std::memory_order_release);
        }
        state_->cv.notify_all();
    }

    [[nodiscard]] bool is_cancelled() const {
        return state_->cancelled.load(std::memory_order_acquire);
    }

    /// Sleeps up to `duration`. Returns true if cancelled (possibly early).
    template<typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> duration) const {
        std::unique_lock lock(state_->mutex);
        return state_->cv.wait_for(lock, duration, [this] {
            return state_->cancelled.load(std::memory_order_acquire);
        });
    }

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::mutex mutex;
        std::condition_variable cv;
    };

    std::shared_ptr<State> state_;
};

/**
 * @brief Cancels `token` once `flag` becomes true, from its own thread.
 *
 * A signal handler may only store into a lock-free atomic; cancel() locks a
 * mutex, so the handler sets the flag and this watcher does the rest.
 * Stops polling at the first cancel or on destruction.
 */
class CancellationWatcher {
public:
    CancellationWatcher(const std::atomic<bool>& flag, CancellationToken token,
                        std::chrono::milliseconds poll = std::chrono::milliseconds(50))
        : flag_(flag), token_(std::move(token)), poll_(poll), thread_([this] { run(); }) {}

    ~CancellationWatcher() {
        done_.store(true);
        thread_.join();
    }

    CancellationWatcher(const CancellationWatcher&) = delete;
    CancellationWatcher& operator=(const CancellationWatcher&) = delete;

private:
    void run() {
        while (!done_.load()) {
            if (flag_.load()) {
                token_.cancel();
                return;
            }
            std::this_thread::sleep_for(poll_);
        }
    }

    const std::atomic<bool>& flag_;
    CancellationToken token_;
    std::chrono::milliseconds poll_;
    std::atomic<bool> done_{false};
    std::thread thread_;
};

} // namespace kvault
