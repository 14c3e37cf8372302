#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <cstdint>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>

namespace liarslie::core {

// Broadcast stop request for one agent runtime.
class ShutdownSignal {
public:
    void trigger() {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            triggered_ = true;
        }
        cv_.notify_all();
    }

    bool triggered() const { return triggered_.load(); }

    bool waitFor(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mtx_);
        return cv_.wait_for(lock, timeout, [this] { return triggered_.load(); });
    }

private:
    std::atomic<bool> triggered_{false};
    std::mutex mtx_;
    std::condition_variable cv_;
};

// One-shot readiness acknowledgment from a runtime to its spawner. Dropping the
// signal without calling notify() breaks the promise and fails the waiting side.
class ReadySignal {
public:
    ReadySignal() = default;
    ReadySignal(ReadySignal&&) = default;
    ReadySignal& operator=(ReadySignal&&) = default;

    std::future<uint64_t> future() { return promise_.get_future(); }

    bool notify(uint64_t agentId) {
        if (done_) return false;
        promise_.set_value(agentId);
        done_ = true;
        return true;
    }

    bool fail(const std::string& reason) {
        if (done_) return false;
        promise_.set_exception(std::make_exception_ptr(std::runtime_error(reason)));
        done_ = true;
        return true;
    }

    bool delivered() const { return done_; }

private:
    std::promise<uint64_t> promise_;
    bool done_ = false;
};

}
