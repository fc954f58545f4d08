#pragma once
#include <pthread.h>

#include <exception>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include "utils/stopSignal.hpp"

// A worker thread that owns its StopSignal. Completion is observed through
// join(), which rethrows whatever the task threw.
class BackgroundTask {
public:
    explicit BackgroundTask(std::string name) : name_(std::move(name)) {}
    ~BackgroundTask() {
        if (thread_.joinable()) {
            stop_.requestStop();
            thread_.join();
        }
    }

    BackgroundTask(const BackgroundTask&)            = delete;
    BackgroundTask& operator=(const BackgroundTask&) = delete;

    // fn is invoked as fn(const StopSignal&) on the worker thread. A task
    // runs at most once at a time; join() before starting it again.
    template <typename Fn>
    void start(Fn&& fn) {
        if (thread_.joinable())
            throw std::logic_error("BackgroundTask '" + name_ + "' is already running");
        thread_ = std::thread([this, f = std::forward<Fn>(fn)]() mutable {
            // best effort; kernel thread names are limited to 15 chars
            (void)pthread_setname_np(pthread_self(), name_.substr(0, 15).c_str());
            try {
                f(static_cast<const StopSignal&>(stop_));
            } catch (...) {
                error_ = std::current_exception();
            }
        });
    }

    void requestStop() { stop_.requestStop(); }
    const StopSignal& stopSignal() const { return stop_; }
    bool joinable() const { return thread_.joinable(); }
    const std::string& name() const { return name_; }

    void join() {
        if (thread_.joinable())
            thread_.join();
        if (error_) {
            std::exception_ptr e = error_;
            error_ = nullptr;
            std::rethrow_exception(e);
        }
    }

private:
    std::string        name_;
    StopSignal         stop_;
    std::thread        thread_;
    std::exception_ptr error_;
};
