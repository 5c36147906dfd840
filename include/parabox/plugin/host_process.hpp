/*
 * parabox - Plugin host process handle
 *
 * Spawns parabox-plugin-host with one end of a socket pair on fd 3 and
 * nothing else inherited. A reader thread delivers each protocol message
 * to the message handler and reports an unexpected exit once the channel
 * closes. terminate() is the only way to stop the process on purpose; it
 * must not be called from inside a handler.
 */
#ifndef PARABOX_PLUGIN_HOST_PROCESS_HPP
#define PARABOX_PLUGIN_HOST_PROCESS_HPP

#include "../core/json.hpp"
#include "../ipc/channel.hpp"
#include "../sandbox/lua_runtime.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <sys/types.h>

namespace parabox {

struct HostOptions {
    std::string executable;
    SandboxLimits limits;
    std::string log_level;      // forwarded to the host; empty keeps its default
    int exit_grace_ms;          // wait for a host that closed its channel

    HostOptions() : exit_grace_ms(200) {}
};

class HostProcess;

typedef std::function<void(HostProcess*, const Json&)> HostMessageHandler;
// status is the raw wait status
typedef std::function<void(HostProcess*, int)> HostExitHandler;

class HostProcess {
public:
    HostProcess(const HostOptions& options,
                const HostMessageHandler& on_message,
                const HostExitHandler& on_exit);
    ~HostProcess();

    // Forks and execs the host, then starts the reader thread
    bool start(std::string* error = nullptr);

    bool send(const Json& msg);

    // Sends shutdown, waits up to grace_ms, then SIGKILLs. Joins the reader;
    // the exit handler is not called for a terminated host.
    void terminate(int grace_ms);

    // Safe to call from any thread; -1 before start()
    pid_t pid() const { return pid_.load(); }

    // "exit code N" or "signal N"
    static std::string describe_status(int status);

    // Command line the host is started with
    std::vector<std::string> build_argv() const;

private:
    HostProcess(const HostProcess&);
    HostProcess& operator=(const HostProcess&);

    void reader_loop();
    // Reaps the child, killing it once grace_ms has passed. Returns the wait status.
    int reap(int grace_ms);

    HostOptions options_;
    HostMessageHandler on_message_;
    HostExitHandler on_exit_;

    std::atomic<pid_t> pid_;
    std::unique_ptr<ControlChannel> channel_;
    std::thread reader_;
    std::atomic<bool> stopping_;

    std::mutex reap_mutex_;
    bool reaped_;
    int wait_status_;
};

} // namespace parabox

#endif // PARABOX_PLUGIN_HOST_PROCESS_HPP
