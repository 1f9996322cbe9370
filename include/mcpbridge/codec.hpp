#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string_view>

namespace mcpbridge {

class Codec {
public:
    /// Parse one input line into a request or notification.
    /// Throws McpParseError on invalid JSON or fields of the wrong type.
    /// The protocol tag value and a missing method are not checked here so
    /// that the resulting error reply can echo the recovered id.
    [[nodiscard]] static JsonRpcMessage parse(std::string_view raw);

    /// Serialize a response to a single-line JSON string (no trailing newline).
    /// Throws McpSerializationError if the response cannot be encoded.
    [[nodiscard]] static std::string serialize(const JsonRpcResponse& resp);

private:
    static JsonRpcMessage parse_object(const nlohmann::json& j);
};

} // namespace mcpbridge
