#pragma once
#include <atomic>
#include <cstddef>
#include <string>
#include <string_view>

namespace mcphub {

/// StdioTransport is the byte-level endpoint of a peer connection: a buffered
/// reader over one file descriptor and a writer over another.
///
/// Reads block in poll() on the read descriptor and an internal wakeup pipe,
/// so shutdown() can release a thread stuck waiting on a silent peer. The
/// read side and the write side share no state; each side must be driven by
/// one thread at a time.
class StdioTransport {
public:
    /// Create transport using this process's stdin/stdout (not owned).
    StdioTransport();

    /// Create transport over the given descriptors, taking ownership of both.
    StdioTransport(int read_fd, int write_fd);

    ~StdioTransport();

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    /// Read up to and excluding the next '\n'. Returns false at end of stream
    /// (a trailing unterminated line is still returned first).
    [[nodiscard]] bool read_line(std::string& line);

    /// Read exactly n bytes. Returns false if the stream ends first.
    [[nodiscard]] bool read_exact(std::size_t n, std::string& out);

    /// Write every byte. Throws McpTransportError on failure.
    void write_all(std::string_view data);

    /// Wake blocked readers; afterwards reads report end of stream. Idempotent.
    void shutdown();

    [[nodiscard]] bool is_connected() const;

private:
    bool fill_buffer();

    int read_fd_;
    int write_fd_;
    bool owns_fds_;

    std::atomic<bool> connected_{true};
    std::atomic<bool> shutdown_requested_{false};

    std::string buffer_;
    std::size_t buffer_pos_{0};

    int wakeup_pipe_[2]{-1, -1};
};

} // namespace mcphub
