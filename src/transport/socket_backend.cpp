#include "mcpbridge/transport/socket_backend.hpp"
#include "mcpbridge/error.hpp"
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <netdb.h>
#include <unistd.h>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <string>

namespace mcpbridge {

namespace {

constexpr std::string_view UNIX_PREFIX = "unix:";

std::string sys_error(const std::string& what) {
    return what + ": " + strerror(errno);
}

int connect_unix(const std::string& path) {
    sockaddr_un addr{};
    if (path.size() >= sizeof(addr.sun_path)) {
        throw McpBackendError("socket path too long: " + path);
    }
    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throw McpBackendError(sys_error("socket"));
    }
    addr.sun_family = AF_UNIX;
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::string msg = sys_error("connect unix:" + path);
        ::close(fd);
        throw McpBackendError(msg);
    }
    return fd;
}

int connect_tcp(const std::string& address) {
    auto colon = address.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == address.size()) {
        throw McpBackendError("invalid backend address: " + address);
    }
    std::string host = address.substr(0, colon);
    std::string port = address.substr(colon + 1);
    // [::1]:9100
    if (host.size() > 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* result = nullptr;
    int rc = ::getaddrinfo(host.c_str(), port.c_str(), &hints, &result);
    if (rc != 0) {
        throw McpBackendError("resolve " + address + ": " + gai_strerror(rc));
    }

    std::string last_error = "connect " + address + ": no addresses";
    int fd = -1;
    for (addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            last_error = sys_error("socket");
            continue;
        }
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) break;
        last_error = sys_error("connect " + address);
        ::close(fd);
        fd = -1;
    }
    ::freeaddrinfo(result);
    if (fd < 0) {
        throw McpBackendError(last_error);
    }
    return fd;
}

void set_timeouts(int fd, std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) return;
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

void write_all(int fd, const char* data, size_t size) {
    while (size > 0) {
        ssize_t n = ::send(fd, data, size, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw McpBackendError(sys_error("backend write"));
        }
        data += n;
        size -= static_cast<size_t>(n);
    }
}

// Returns bytes read; less than `size` only at EOF.
size_t read_all(int fd, char* data, size_t size) {
    size_t total = 0;
    while (total < size) {
        ssize_t n = ::recv(fd, data + total, size - total, 0);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                throw McpBackendError("backend read: timed out");
            }
            throw McpBackendError(sys_error("backend read"));
        }
        if (n == 0) break;
        total += static_cast<size_t>(n);
    }
    return total;
}

} // anonymous namespace

// ----------- Framing -----------

void write_frame(int fd, const std::string& payload) {
    if (payload.size() > UINT32_MAX) {
        throw McpBackendError("frame too large: " + std::to_string(payload.size()) + " bytes");
    }
    uint32_t length = static_cast<uint32_t>(payload.size());
    unsigned char header[4] = {
        static_cast<unsigned char>(length >> 24),
        static_cast<unsigned char>(length >> 16),
        static_cast<unsigned char>(length >> 8),
        static_cast<unsigned char>(length),
    };
    write_all(fd, reinterpret_cast<const char*>(header), sizeof(header));
    write_all(fd, payload.data(), payload.size());
}

std::optional<std::string> read_frame(int fd, size_t max_frame_bytes) {
    unsigned char header[4];
    size_t got = read_all(fd, reinterpret_cast<char*>(header), sizeof(header));
    if (got == 0) return std::nullopt;
    if (got < sizeof(header)) {
        throw McpBackendError("backend read: connection closed inside frame header");
    }
    uint32_t length = (uint32_t{header[0]} << 24) | (uint32_t{header[1]} << 16)
                      | (uint32_t{header[2]} << 8) | uint32_t{header[3]};
    if (length > max_frame_bytes) {
        throw McpBackendError("backend read: frame of " + std::to_string(length)
                              + " bytes exceeds limit of " + std::to_string(max_frame_bytes));
    }
    std::string payload(length, '\0');
    if (read_all(fd, payload.data(), length) < length) {
        throw McpBackendError("backend read: connection closed inside frame");
    }
    return payload;
}

void serve_backend_connection(int fd, const BackendHandler& handler, size_t max_frame_bytes) {
    while (true) {
        auto frame = read_frame(fd, max_frame_bytes);
        if (!frame) return;

        PluginRequest request;
        if (!request.ParseFromString(*frame)) {
            throw McpBackendError("backend: malformed request frame");
        }
        PluginResponse response = handler(request);
        response.set_request_id(request.request_id());

        std::string out;
        if (!response.SerializeToString(&out)) {
            throw McpBackendError("backend: failed to serialize response");
        }
        write_frame(fd, out);
    }
}

// ----------- SocketBackend -----------

SocketBackend::SocketBackend(Options opts)
    : opts_(std::move(opts)) {
}

SocketBackend::~SocketBackend() {
    close();
}

void SocketBackend::connect_locked() {
    if (fd_ >= 0) return;
    const std::string& address = opts_.address;
    if (address.compare(0, UNIX_PREFIX.size(), UNIX_PREFIX) == 0) {
        fd_ = connect_unix(address.substr(UNIX_PREFIX.size()));
    } else {
        fd_ = connect_tcp(address);
    }
    set_timeouts(fd_, opts_.io_timeout);
    spdlog::info("connected to backend at {}", address);
}

void SocketBackend::close_locked() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void SocketBackend::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    close_locked();
}

bool SocketBackend::is_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fd_ >= 0;
}

PluginResponse SocketBackend::send(const PluginRequest& request) {
    std::string payload;
    if (!request.SerializeToString(&payload)) {
        throw McpBackendError("failed to serialize backend request");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    try {
        connect_locked();
        write_frame(fd_, payload);
        auto frame = read_frame(fd_, opts_.max_frame_bytes);
        if (!frame) {
            throw McpBackendError("backend closed the connection");
        }
        PluginResponse response;
        if (!response.ParseFromString(*frame)) {
            throw McpBackendError("malformed backend response");
        }
        if (response.request_id() != request.request_id()) {
            throw McpBackendError("backend response id '" + response.request_id()
                                  + "' does not match request id '"
                                  + request.request_id() + "'");
        }
        return response;
    } catch (const McpBackendError&) {
        close_locked();
        throw;
    }
}

} // namespace mcpbridge
