#include <parabox/ipc/channel.hpp>
#include <parabox/core/logger.hpp>

#include <cerrno>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace parabox {

ControlChannel::ControlChannel(int fd) : fd_(fd), discarding_(false) {}

ControlChannel::~ControlChannel() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

bool ControlChannel::write_all(const char* data, size_t size) {
    size_t written = 0;
    while (written < size) {
        ssize_t rc = ::send(fd_, data + written, size - written, MSG_NOSIGNAL);
        if (rc < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (rc == 0) return false;
        written += static_cast<size_t>(rc);
    }
    return true;
}

bool ControlChannel::send(const Json& msg) {
    if (fd_ < 0) return false;

    // dump() never emits a raw newline; strings escape it
    std::string line = msg.dump();
    line += '\n';

    std::lock_guard<std::mutex> lock(write_mutex_);
    return write_all(line.data(), line.size());
}

bool ControlChannel::receive(Json& out) {
    if (fd_ < 0) return false;

    while (true) {
        size_t newline = buffer_.find('\n');
        if (newline != std::string::npos) {
            std::string line = buffer_.substr(0, newline);
            buffer_.erase(0, newline + 1);

            if (discarding_) {
                discarding_ = false;
                continue;
            }
            if (line.empty()) continue;
            if (line.size() > kMaxLineBytes) {
                LOG_WARN("Control channel: line exceeds %zu bytes, discarding", kMaxLineBytes);
                continue;
            }

            Json parsed;
            if (parse_json(line, parsed) && parsed.is_object()) {
                out = parsed;
                return true;
            }
            LOG_DEBUG("Control channel: dropping malformed line (%zu bytes)", line.size());
            continue;
        }

        if (buffer_.size() > kMaxLineBytes) {
            LOG_WARN("Control channel: line exceeds %zu bytes, discarding", kMaxLineBytes);
            buffer_.clear();
            discarding_ = true;
        }

        char chunk[4096];
        ssize_t n = ::recv(fd_, chunk, sizeof(chunk), 0);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (n == 0) {
            return false;
        }
        buffer_.append(chunk, static_cast<size_t>(n));
    }
}

void ControlChannel::shutdown() {
    if (fd_ >= 0) {
        ::shutdown(fd_, SHUT_RDWR);
    }
}

} // namespace parabox
