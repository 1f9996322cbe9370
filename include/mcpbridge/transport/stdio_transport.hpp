#pragma once
#include <atomic>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace mcpbridge {

/// StdioTransport reads newline-delimited lines from one file descriptor and
/// writes newline-terminated lines to another. Reads happen on the caller's
/// thread; writes are serialized by a mutex so lines never interleave.
class StdioTransport {
public:
    struct Options {
        /// Longest accepted input line, excluding the newline.
        size_t max_line_bytes = 10 * 1024 * 1024;
    };

    /// Create transport using system stdin/stdout.
    StdioTransport();
    explicit StdioTransport(Options opts);

    /// Create transport using specified file descriptors. The caller keeps
    /// ownership of both descriptors.
    StdioTransport(int read_fd, int write_fd);
    StdioTransport(int read_fd, int write_fd, Options opts);

    ~StdioTransport();

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    /// Block until a full line is available and return it without its line
    /// terminator ("\n" or "\r\n"). A final line without a newline is returned
    /// at EOF. Returns nullopt at EOF or once shutdown() was called.
    /// Throws McpTransportError on a read error or a line over max_line_bytes.
    [[nodiscard]] std::optional<std::string> read_line();

    /// Write payload followed by '\n'. Throws McpTransportError on failure.
    void write_line(std::string_view payload);

    /// Interrupt a blocked read_line(). Only touches an atomic flag and the
    /// wakeup pipe, so it may be called from a signal handler.
    void shutdown();

private:
    int read_fd_;
    int write_fd_;
    Options opts_;

    std::atomic<bool> shutdown_requested_{false};
    bool eof_{false};

    std::string buffer_;
    size_t scan_pos_{0};  // bytes of buffer_ already searched for '\n'

    std::mutex write_mutex_;

    int wakeup_pipe_[2]{-1, -1};  // pipe for waking up read_line()
};

} // namespace mcpbridge
