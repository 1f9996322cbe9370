#pragma once
#include "backend.hpp"
#include "json_rpc.hpp"
#include "router.hpp"
#include "types.hpp"
#include "version.hpp"
#include "transport/stdio_transport.hpp"
#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mcpbridge {

/// Bridge answers MCP JSON-RPC requests read from a StdioTransport by
/// forwarding them to an IBackend. Requests are handled strictly one at a
/// time in arrival order.
class Bridge {
public:
    struct Options {
        Implementation server_info{"mcpbridge", std::string(LIBRARY_VERSION)};
        std::string protocol_version{PROTOCOL_VERSION};
        std::string caller_id{CALLER_ID};
        /// Advertise and route prompts/list and prompts/get.
        bool advertise_prompts = true;
    };

    explicit Bridge(IBackend& backend);
    Bridge(IBackend& backend, Options opts);
    ~Bridge();

    // Non-copyable, non-movable
    Bridge(const Bridge&) = delete;
    Bridge& operator=(const Bridge&) = delete;

    /// Handle one input line (already trimmed, non-empty).
    /// Returns the reply, or nullopt for notifications.
    [[nodiscard]] std::optional<JsonRpcResponse> handle_line(std::string_view line);

    [[nodiscard]] std::optional<JsonRpcResponse> handle_message(const JsonRpcMessage& msg);

    /// Run the read-dispatch-write loop until EOF, transport shutdown, or
    /// `cancelled` becoming true. The flag is checked before each read and
    /// again before dispatching; a request already dispatched completes.
    /// Throws McpTransportError or McpSerializationError on fatal faults.
    void serve(StdioTransport& transport, const std::atomic<bool>& cancelled);

    /// serve() without external cancellation.
    void serve(StdioTransport& transport);

    [[nodiscard]] const Router& router() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mcpbridge
