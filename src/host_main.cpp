/*
 * parabox - Plugin host process
 *
 * Runs one plugin in a sandboxed Lua interpreter. Spawned by the plugin
 * manager with its control channel on fd 3 and no other descriptors.
 *
 * Usage:
 *   parabox-plugin-host [--memory-limit N] [--stack-limit N]
 *                       [--load-timeout-ms N] [--click-timeout-ms N]
 *                       [--max-menu-items N] [--watchdog-grace-ms N]
 *                       [--log-level LEVEL]
 *
 * A load or click that is still running watchdog-grace-ms after its deadline
 * ends the process with SandboxHost::kOverrunExitCode.
 */

#include <parabox/sandbox/sandbox_host.hpp>
#include <parabox/ipc/channel.hpp>
#include <parabox/ipc/protocol.hpp>
#include <parabox/core/logger.hpp>

#include <csignal>
#include <cstdlib>
#include <cstring>
#include <string>
#include <unistd.h>

namespace {

bool parse_size(const char* text, long long min_value, long long& out) {
    if (!text || !*text) return false;
    char* end = NULL;
    long long value = std::strtoll(text, &end, 10);
    if (*end != '\0' || value < min_value) return false;
    out = value;
    return true;
}

bool parse_args(int argc, char* argv[], parabox::SandboxLimits& limits) {
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        const char* value = (i + 1 < argc) ? argv[i + 1] : NULL;
        long long n = 0;

        if (std::strcmp(arg, "--log-level") == 0 && value) {
            if (!parabox::Logger::instance().set_level(std::string(value))) {
                LOG_WARN("unknown log level '%s'", value);
            }
        } else if (std::strcmp(arg, "--memory-limit") == 0 && parse_size(value, 1024 * 1024, n)) {
            limits.memory_limit_bytes = static_cast<size_t>(n);
        } else if (std::strcmp(arg, "--stack-limit") == 0 && parse_size(value, 4096, n)) {
            limits.stack_limit_bytes = static_cast<size_t>(n);
        } else if (std::strcmp(arg, "--load-timeout-ms") == 0 && parse_size(value, 1, n)) {
            limits.load_timeout_ms = static_cast<int>(n);
        } else if (std::strcmp(arg, "--click-timeout-ms") == 0 && parse_size(value, 1, n)) {
            limits.click_timeout_ms = static_cast<int>(n);
        } else if (std::strcmp(arg, "--max-menu-items") == 0 && parse_size(value, 0, n)) {
            limits.max_menu_items = static_cast<size_t>(n);
        } else if (std::strcmp(arg, "--watchdog-grace-ms") == 0 && parse_size(value, 1, n)) {
            limits.watchdog_grace_ms = static_cast<int>(n);
        } else {
            LOG_ERROR("invalid argument: %s", arg);
            return false;
        }
        ++i;
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    parabox::Logger::instance().set_tag("host");
    std::signal(SIGPIPE, SIG_IGN);

    parabox::SandboxLimits limits;
    if (!parse_args(argc, argv, limits)) {
        return 2;
    }

    parabox::ControlChannel channel(parabox::kHostChannelFd);
    parabox::SandboxHost host(limits, [&channel](const parabox::Json& msg) {
        if (!channel.send(msg)) {
            LOG_WARN("control channel write failed");
        }
    }, [&channel](const parabox::Json& last_message) {
        // The interpreter thread is stuck in C code; nothing can unwind it
        if (!last_message.is_null() && !channel.send(last_message)) {
            LOG_WARN("control channel write failed");
        }
        _exit(parabox::SandboxHost::kOverrunExitCode);
    });

    if (!channel.send(parabox::protocol::make_ready())) {
        LOG_ERROR("control channel unavailable");
        return 1;
    }

    parabox::Json cmd;
    while (!host.finished()) {
        if (!channel.receive(cmd)) {
            LOG_DEBUG("control channel closed");
            host.dispose();
            return 0;
        }
        host.handle_command(cmd);
    }

    return host.exit_code();
}
