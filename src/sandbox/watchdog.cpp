#include <parabox/sandbox/watchdog.hpp>
#include <parabox/core/logger.hpp>
#include <parabox/core/utils.hpp>

#include <chrono>

namespace parabox {

Watchdog::Watchdog(const Action& on_overrun)
    : on_overrun_(on_overrun)
    , armed_(false)
    , stop_(false)
    , deadline_ms_(0)
{
    thread_ = std::thread(&Watchdog::run, this);
}

Watchdog::~Watchdog() {
    stop();
}

void Watchdog::arm(int64_t deadline_ms) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        armed_ = true;
        deadline_ms_ = deadline_ms;
    }
    condition_.notify_all();
}

void Watchdog::disarm() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        armed_ = false;
    }
    condition_.notify_all();
}

bool Watchdog::armed() {
    std::lock_guard<std::mutex> lock(mutex_);
    return armed_;
}

void Watchdog::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) return;
        stop_ = true;
    }
    condition_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void Watchdog::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_) {
        if (!armed_) {
            condition_.wait(lock);
            continue;
        }

        int64_t remaining = deadline_ms_ - monotonic_ms();
        if (remaining > 0) {
            condition_.wait_for(lock, std::chrono::milliseconds(remaining));
            continue;
        }

        // Fires once per arm
        armed_ = false;
        lock.unlock();
        LOG_ERROR("Sandbox watchdog: deadline overrun, call did not return");
        if (on_overrun_) {
            on_overrun_();
        }
        lock.lock();
    }
}

} // namespace parabox
