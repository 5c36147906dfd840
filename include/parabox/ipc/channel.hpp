/*
 * parabox - Control channel
 *
 * Newline-delimited JSON over a connected stream socket. Used by both the
 * supervisor (parent end of the socket pair) and the plugin host (fd 3).
 */
#ifndef PARABOX_IPC_CHANNEL_HPP
#define PARABOX_IPC_CHANNEL_HPP

#include "../core/json.hpp"
#include <string>
#include <mutex>

namespace parabox {

// File descriptor number the host process finds its end of the channel on
const int kHostChannelFd = 3;

class ControlChannel {
public:
    // Takes ownership of fd
    explicit ControlChannel(int fd);
    ~ControlChannel();

    int fd() const { return fd_; }

    // Serializes and writes one message. Safe to call from several threads.
    bool send(const Json& msg);

    // Blocks until one JSON object arrives. Lines that are not valid JSON
    // objects are skipped. Returns false on EOF or read error.
    bool receive(Json& out);

    // Wakes a blocked receive() from another thread
    void shutdown();

    // Largest accepted line; longer lines are discarded
    static const size_t kMaxLineBytes = 1024 * 1024;

private:
    ControlChannel(const ControlChannel&);
    ControlChannel& operator=(const ControlChannel&);

    bool write_all(const char* data, size_t size);

    int fd_;
    std::string buffer_;
    bool discarding_;
    std::mutex write_mutex_;
};

} // namespace parabox

#endif // PARABOX_IPC_CHANNEL_HPP
