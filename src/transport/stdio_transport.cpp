#include "mcpbridge/transport/stdio_transport.hpp"
#include "mcpbridge/error.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <string>

namespace mcpbridge {

namespace {

constexpr size_t READ_CHUNK = 64 * 1024;

void strip_cr(std::string& line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
}

} // anonymous namespace

StdioTransport::StdioTransport()
    : StdioTransport(STDIN_FILENO, STDOUT_FILENO, Options{}) {
}

StdioTransport::StdioTransport(Options opts)
    : StdioTransport(STDIN_FILENO, STDOUT_FILENO, opts) {
}

StdioTransport::StdioTransport(int read_fd, int write_fd)
    : StdioTransport(read_fd, write_fd, Options{}) {
}

StdioTransport::StdioTransport(int read_fd, int write_fd, Options opts)
    : read_fd_(read_fd), write_fd_(write_fd), opts_(opts) {
    if (::pipe(wakeup_pipe_) < 0) {
        throw McpTransportError(std::string("Failed to create wakeup pipe: ") + strerror(errno));
    }
    // Set non-blocking on write end of wakeup pipe
    int flags = fcntl(wakeup_pipe_[1], F_GETFL, 0);
    fcntl(wakeup_pipe_[1], F_SETFL, flags | O_NONBLOCK);
}

StdioTransport::~StdioTransport() {
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

std::optional<std::string> StdioTransport::read_line() {
    while (true) {
        if (shutdown_requested_.load()) return std::nullopt;

        size_t nl = buffer_.find('\n', scan_pos_);
        if (nl != std::string::npos) {
            if (nl > opts_.max_line_bytes) {
                throw McpTransportError("Input line exceeds "
                                        + std::to_string(opts_.max_line_bytes) + " bytes");
            }
            std::string line = buffer_.substr(0, nl);
            buffer_.erase(0, nl + 1);
            scan_pos_ = 0;
            strip_cr(line);
            return line;
        }
        scan_pos_ = buffer_.size();

        if (buffer_.size() > opts_.max_line_bytes) {
            throw McpTransportError("Input line exceeds "
                                    + std::to_string(opts_.max_line_bytes) + " bytes");
        }

        if (eof_) {
            if (buffer_.empty()) return std::nullopt;
            // Final line without a terminating newline
            std::string line = std::move(buffer_);
            buffer_.clear();
            scan_pos_ = 0;
            strip_cr(line);
            return line;
        }

        // Use poll() so that shutdown() can interrupt the blocking read
        // via the wakeup pipe.
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
            throw McpTransportError(std::string("Poll error: ") + strerror(errno));
        }

        // Wakeup pipe has data → shutdown() was called
        if (fds[1].revents & POLLIN) return std::nullopt;

        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        char chunk[READ_CHUNK];
        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) continue;
            throw McpTransportError(std::string("Read error: ") + strerror(errno));
        }
        if (n == 0) {
            // EOF
            eof_ = true;
            continue;
        }

        buffer_.append(chunk, static_cast<size_t>(n));
    }
}

void StdioTransport::write_line(std::string_view payload) {
    std::string framed;
    framed.reserve(payload.size() + 1);
    framed.append(payload);
    framed += '\n';

    std::lock_guard<std::mutex> lock(write_mutex_);
    const char* data = framed.data();
    size_t remaining = framed.size();

    while (remaining > 0) {
        ssize_t written = ::write(write_fd_, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            throw McpTransportError(std::string("Write error: ") + strerror(errno));
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }
}

void StdioTransport::shutdown() {
    if (shutdown_requested_.exchange(true)) return;
    // Write to wakeup pipe to interrupt poll() in read_line().
    if (wakeup_pipe_[1] >= 0) {
        char b = 1;
        [[maybe_unused]] auto n = ::write(wakeup_pipe_[1], &b, 1);
    }
}

} // namespace mcpbridge
