#include "mcphub/transport/stdio_transport.hpp"
#include "mcphub/error.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <string>

namespace mcphub {

namespace {

constexpr std::size_t kChunkSize = 4096;

// A peer that exits mid-write must surface as EPIPE, not kill the hub.
void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

} // anonymous namespace

StdioTransport::StdioTransport()
    : read_fd_(STDIN_FILENO), write_fd_(STDOUT_FILENO), owns_fds_(false) {
    ignore_sigpipe();
    if (::pipe2(wakeup_pipe_, O_CLOEXEC | O_NONBLOCK) < 0) {
        throw McpTransportError(std::string("Failed to create wakeup pipe: ") + std::strerror(errno));
    }
}

StdioTransport::StdioTransport(int read_fd, int write_fd)
    : read_fd_(read_fd), write_fd_(write_fd), owns_fds_(true) {
    ignore_sigpipe();
    if (::pipe2(wakeup_pipe_, O_CLOEXEC | O_NONBLOCK) < 0) {
        int err = errno;
        if (read_fd_ >= 0)  ::close(read_fd_);
        if (write_fd_ >= 0) ::close(write_fd_);
        throw McpTransportError(std::string("Failed to create wakeup pipe: ") + std::strerror(err));
    }
}

StdioTransport::~StdioTransport() {
    if (owns_fds_) {
        if (read_fd_ >= 0)  ::close(read_fd_);
        if (write_fd_ >= 0) ::close(write_fd_);
    }
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

bool StdioTransport::fill_buffer() {
    if (buffer_pos_ > 0) {
        buffer_.erase(0, buffer_pos_);
        buffer_pos_ = 0;
    }

    char chunk[kChunkSize];
    while (!shutdown_requested_) {
        struct pollfd fds[2];
        fds[0].fd = read_fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wakeup_pipe_[0];
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int ret = ::poll(fds, 2, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            throw McpTransportError(std::string("poll failed: ") + std::strerror(errno));
        }

        // Wakeup pipe has data -> shutdown() was called
        if (fds[1].revents & POLLIN) break;

        // POLLHUP without POLLIN still needs a read() to observe EOF
        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            throw McpTransportError(std::string("Read error: ") + std::strerror(errno));
        }
        if (n == 0) break;

        buffer_.append(chunk, static_cast<std::size_t>(n));
        return true;
    }
    connected_ = false;
    return false;
}

bool StdioTransport::read_line(std::string& line) {
    while (true) {
        std::size_t nl = buffer_.find('\n', buffer_pos_);
        if (nl != std::string::npos) {
            line.assign(buffer_, buffer_pos_, nl - buffer_pos_);
            buffer_pos_ = nl + 1;
            return true;
        }
        if (!fill_buffer()) {
            if (buffer_pos_ < buffer_.size()) {
                line.assign(buffer_, buffer_pos_, std::string::npos);
                buffer_pos_ = buffer_.size();
                return true;
            }
            return false;
        }
    }
}

bool StdioTransport::read_exact(std::size_t n, std::string& out) {
    while (buffer_.size() - buffer_pos_ < n) {
        if (!fill_buffer()) return false;
    }
    out.assign(buffer_, buffer_pos_, n);
    buffer_pos_ += n;
    return true;
}

void StdioTransport::write_all(std::string_view data) {
    if (shutdown_requested_) {
        throw McpTransportError("Transport shut down");
    }
    const char* p = data.data();
    std::size_t remaining = data.size();

    while (remaining > 0) {
        ssize_t written = ::write(write_fd_, p, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            connected_ = false;
            throw McpTransportError(std::string("Write error: ") + std::strerror(errno));
        }
        p += written;
        remaining -= static_cast<std::size_t>(written);
    }
}

void StdioTransport::shutdown() {
    if (shutdown_requested_.exchange(true)) return;
    connected_ = false;
    char b = 1;
    // The pipe is non-blocking and only ever needs one byte.
    if (::write(wakeup_pipe_[1], &b, 1) < 0 && errno != EAGAIN) {
        throw McpTransportError(std::string("Failed to signal shutdown: ") + std::strerror(errno));
    }
}

bool StdioTransport::is_connected() const {
    return connected_;
}

} // namespace mcphub
