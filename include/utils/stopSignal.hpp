#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>

// One-shot cooperative stop request. Sleepers blocked in waitFor() are woken
// as soon as a stop is requested.
class StopSignal {
public:
    void requestStop() {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            stopped_ = true;
        }
        cv_.notify_all();
    }

    bool stopRequested() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return stopped_;
    }

    // Returns true if a stop was requested before the timeout elapsed.
    template <typename Rep, typename Period>
    bool waitFor(std::chrono::duration<Rep, Period> timeout) const {
        std::unique_lock<std::mutex> lock(mtx_);
        return cv_.wait_for(lock, timeout, [this] { return stopped_; });
    }

private:
    mutable std::mutex mtx_;
    mutable std::condition_variable cv_;
    bool stopped_ = false;
};
