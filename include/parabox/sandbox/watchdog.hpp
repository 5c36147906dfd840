/*
 * parabox - Sandbox watchdog
 *
 * The interpreter's deadline is enforced from a count hook, which only runs
 * between bytecode instructions. A plugin stuck inside a library C function
 * (a pathological string pattern, for instance) never reaches the hook.
 * The watchdog is the backstop: a separate thread that runs the overrun
 * action once an armed deadline passes without being disarmed. In the host
 * process the action ends the process.
 */
#ifndef PARABOX_SANDBOX_WATCHDOG_HPP
#define PARABOX_SANDBOX_WATCHDOG_HPP

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace parabox {

class Watchdog {
public:
    typedef std::function<void()> Action;

    explicit Watchdog(const Action& on_overrun);
    ~Watchdog();

    // deadline_ms is on the monotonic_ms() clock; re-arming replaces it
    void arm(int64_t deadline_ms);
    void disarm();

    // Joins the thread; no action runs afterwards
    void stop();

    bool armed();

private:
    Watchdog(const Watchdog&);
    Watchdog& operator=(const Watchdog&);

    void run();

    Action on_overrun_;
    std::mutex mutex_;
    std::condition_variable condition_;
    bool armed_;
    bool stop_;
    int64_t deadline_ms_;
    std::thread thread_;
};

} // namespace parabox

#endif // PARABOX_SANDBOX_WATCHDOG_HPP
