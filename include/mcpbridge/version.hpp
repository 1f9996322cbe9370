#pragma once
#include <string_view>

namespace mcpbridge {

constexpr std::string_view LIBRARY_VERSION     = "1.0.0";
constexpr std::string_view PROTOCOL_VERSION    = "2024-11-05";
constexpr std::string_view JSONRPC_VERSION     = "2.0";

/// Caller identity attached to every backend tool call.
constexpr std::string_view CALLER_ID           = "transport.stdio";

} // namespace mcpbridge
