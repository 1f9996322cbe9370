#pragma once
#include "../backend.hpp"
#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace mcpbridge {

/// IBackend over a stream socket. Each message travels as a 4-byte
/// big-endian length followed by the serialized protobuf.
///
/// Address forms: "unix:<path>" or "<host>:<port>".
/// The connection is opened lazily and dropped after any failed round trip,
/// so the next send() reconnects. There is no retry within a call.
class SocketBackend : public IBackend {
public:
    struct Options {
        std::string address{"unix:/tmp/mcpbridge-backend.sock"};
        /// Send/receive timeout per round trip; zero waits forever.
        std::chrono::milliseconds io_timeout{0};
        size_t max_frame_bytes = 64 * 1024 * 1024;
    };

    explicit SocketBackend(Options opts);
    ~SocketBackend() override;

    SocketBackend(const SocketBackend&) = delete;
    SocketBackend& operator=(const SocketBackend&) = delete;

    PluginResponse send(const PluginRequest& request) override;

    void close();
    [[nodiscard]] bool is_connected() const;

private:
    void connect_locked();
    void close_locked();

    Options opts_;
    int fd_{-1};
    mutable std::mutex mutex_;
};

// ---- Framing, shared with the serving side ----

/// Write one length-prefixed frame. Throws McpBackendError.
void write_frame(int fd, const std::string& payload);

/// Read one frame. Returns nullopt on a clean EOF before the length prefix.
/// Throws McpBackendError on a short read or a frame over max_frame_bytes.
std::optional<std::string> read_frame(int fd, size_t max_frame_bytes);

using BackendHandler = std::function<PluginResponse(const PluginRequest&)>;

/// Serve one connection: read requests, answer each through `handler`
/// (copying the request_id into the reply) until the peer closes.
void serve_backend_connection(int fd, const BackendHandler& handler,
                              size_t max_frame_bytes = 64 * 1024 * 1024);

} // namespace mcpbridge
