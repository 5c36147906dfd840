#include <parabox/plugin/host_process.hpp>
#include <parabox/ipc/protocol.hpp>
#include <parabox/core/logger.hpp>
#include <parabox/core/utils.hpp>

#include <cerrno>
#include <cstring>
#include <sstream>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/wait.h>

namespace parabox {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Runs in the forked child: only async-signal-safe calls until exec.
// Puts the channel on fd 3, stdio on /dev/null and drops every other
// descriptor but error_fd. False with errno set on failure.
bool prepare_child(int channel_fd, int error_fd, int max_fd) {
    if (channel_fd == kHostChannelFd) {
        int flags = fcntl(channel_fd, F_GETFD);
        if (flags < 0 || fcntl(channel_fd, F_SETFD, flags & ~FD_CLOEXEC) != 0) return false;
    } else if (dup2(channel_fd, kHostChannelFd) < 0) {
        return false;
    }

    int null_fd = open("/dev/null", O_RDWR);
    if (null_fd < 0) return false;
    if (dup2(null_fd, STDIN_FILENO) < 0 ||
        dup2(null_fd, STDOUT_FILENO) < 0 ||
        dup2(null_fd, STDERR_FILENO) < 0) {
        return false;
    }

    for (int fd = kHostChannelFd + 1; fd < max_fd; ++fd) {
        if (fd != error_fd) close(fd);
    }

    struct rlimit no_core;
    no_core.rlim_cur = 0;
    no_core.rlim_max = 0;
    setrlimit(RLIMIT_CORE, &no_core);
    prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
    prctl(PR_SET_PDEATHSIG, SIGKILL);
    return true;
}

// Never returns: either the host image replaces the child or errno is
// written to error_fd and the child exits 127
void exec_host(int channel_fd, int error_fd, int max_fd, char* const argv[]) {
    if (prepare_child(channel_fd, error_fd, max_fd)) {
        execv(argv[0], argv);
    }
    int err = errno;
    ssize_t rc = write(error_fd, &err, sizeof(err));
    (void)rc;
    _exit(127);
}

} // namespace

HostProcess::HostProcess(const HostOptions& options,
                         const HostMessageHandler& on_message,
                         const HostExitHandler& on_exit)
    : options_(options)
    , on_message_(on_message)
    , on_exit_(on_exit)
    , pid_(-1)
    , stopping_(false)
    , reaped_(false)
    , wait_status_(0)
{}

HostProcess::~HostProcess() {
    if (pid_ > 0 || reader_.joinable()) {
        terminate(0);
    }
}

std::vector<std::string> HostProcess::build_argv() const {
    std::vector<std::string> args;
    args.push_back(options_.executable);

    std::ostringstream n;
    n << options_.limits.memory_limit_bytes;
    args.push_back("--memory-limit");
    args.push_back(n.str());

    n.str("");
    n << options_.limits.stack_limit_bytes;
    args.push_back("--stack-limit");
    args.push_back(n.str());

    n.str("");
    n << options_.limits.load_timeout_ms;
    args.push_back("--load-timeout-ms");
    args.push_back(n.str());

    n.str("");
    n << options_.limits.click_timeout_ms;
    args.push_back("--click-timeout-ms");
    args.push_back(n.str());

    n.str("");
    n << options_.limits.max_menu_items;
    args.push_back("--max-menu-items");
    args.push_back(n.str());

    n.str("");
    n << options_.limits.watchdog_grace_ms;
    args.push_back("--watchdog-grace-ms");
    args.push_back(n.str());

    if (!options_.log_level.empty()) {
        args.push_back("--log-level");
        args.push_back(options_.log_level);
    }
    return args;
}

bool HostProcess::start(std::string* error) {
    if (pid_ > 0) {
        if (error) *error = "already started";
        return false;
    }
    if (access(options_.executable.c_str(), X_OK) != 0) {
        if (error) *error = "host executable not found: " + options_.executable;
        return false;
    }

    std::vector<std::string> args = build_argv();
    std::vector<char*> argv;
    for (size_t i = 0; i < args.size(); ++i) {
        argv.push_back(const_cast<char*>(args[i].c_str()));
    }
    argv.push_back(NULL);

    int sockets[2] = {-1, -1};
    if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sockets) != 0) {
        if (error) *error = std::string("socketpair failed: ") + std::strerror(errno);
        return false;
    }

    // Reports a failed exec back to the parent; closed by a successful one
    int exec_pipe[2] = {-1, -1};
    if (pipe2(exec_pipe, O_CLOEXEC) != 0) {
        if (error) *error = std::string("pipe failed: ") + std::strerror(errno);
        close_fd(sockets[0]);
        close_fd(sockets[1]);
        return false;
    }

    long open_max = sysconf(_SC_OPEN_MAX);
    int max_fd = (open_max > 0 && open_max < 65536) ? static_cast<int>(open_max) : 65536;

    pid_t pid = fork();
    if (pid < 0) {
        if (error) *error = std::string("fork failed: ") + std::strerror(errno);
        close_fd(sockets[0]);
        close_fd(sockets[1]);
        close_fd(exec_pipe[0]);
        close_fd(exec_pipe[1]);
        return false;
    }

    if (pid == 0) {
        close(sockets[0]);
        close(exec_pipe[0]);
        exec_host(sockets[1], exec_pipe[1], max_fd, &argv[0]);
    }

    close_fd(sockets[1]);
    close_fd(exec_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    pid_ = pid;
    if (n > 0) {
        if (error) *error = std::string("exec failed: ") + std::strerror(child_errno);
        close_fd(sockets[0]);
        reap(0);
        return false;
    }

    channel_.reset(new ControlChannel(sockets[0]));
    reader_ = std::thread(&HostProcess::reader_loop, this);

    LOG_INFO("Plugin host started (pid %d)", static_cast<int>(pid));
    return true;
}

bool HostProcess::send(const Json& msg) {
    if (!channel_ || stopping_) return false;
    return channel_->send(msg);
}

void HostProcess::reader_loop() {
    Json msg;
    while (channel_->receive(msg)) {
        if (stopping_) break;
        on_message_(this, msg);
    }

    if (stopping_) return;

    int status = reap(options_.exit_grace_ms);
    LOG_WARN("Plugin host (pid %d) exited: %s", static_cast<int>(pid_.load()), describe_status(status).c_str());
    if (!stopping_ && on_exit_) {
        on_exit_(this, status);
    }
}

int HostProcess::reap(int grace_ms) {
    std::lock_guard<std::mutex> lock(reap_mutex_);
    pid_t pid = pid_.load();
    if (reaped_ || pid <= 0) return wait_status_;

    int status = 0;
    int64_t deadline = monotonic_ms() + (grace_ms > 0 ? grace_ms : 0);
    while (true) {
        pid_t rc = waitpid(pid, &status, WNOHANG);
        if (rc == pid) {
            reaped_ = true;
            wait_status_ = status;
            return wait_status_;
        }
        if (rc < 0 && errno != EINTR) {
            reaped_ = true;
            return wait_status_;
        }
        if (monotonic_ms() >= deadline) break;
        sleep_ms(10);
    }

    LOG_DEBUG("Killing plugin host (pid %d)", static_cast<int>(pid));
    kill(pid, SIGKILL);
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            reaped_ = true;
            return wait_status_;
        }
    }
    reaped_ = true;
    wait_status_ = status;
    return wait_status_;
}

void HostProcess::terminate(int grace_ms) {
    bool was_stopping = stopping_.exchange(true);
    if (channel_ && !was_stopping) {
        if (!channel_->send(protocol::make_shutdown())) {
            LOG_DEBUG("Plugin host shutdown not delivered");
        }
    }

    pid_t pid = pid_.load();
    if (pid > 0) {
        int status = reap(grace_ms);
        LOG_INFO("Plugin host (pid %d) stopped: %s", static_cast<int>(pid), describe_status(status).c_str());
    }

    // The channel itself lives until destruction; senders may still hold it
    if (channel_) channel_->shutdown();
    if (reader_.joinable()) reader_.join();
    pid_ = -1;
}

std::string HostProcess::describe_status(int status) {
    std::ostringstream out;
    if (WIFEXITED(status)) {
        out << "exit code " << WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        out << "signal " << WTERMSIG(status);
    } else {
        out << "status " << status;
    }
    return out.str();
}

} // namespace parabox
