#pragma once
#include "backend.hpp"
#include "router.hpp"
#include "types.hpp"
#include <string>
#include <string_view>

namespace mcpbridge {
namespace handlers {

// ---- Local methods ----

/// initialize: fixed handshake reply, params are ignored.
HandlerResult initialize(const InitializeResult& info);

/// ping: always an empty object.
HandlerResult ping();

// ---- Backend-delegating methods ----
//
// Each builds one PluginRequest whose request_id is derived from the
// JSON-RPC id ("stdio-lt-<id>", "stdio-tc-<id>", ...), performs a single
// round trip and reshapes the reply. A backend failure becomes InternalError
// with the failure text; a reply carrying the wrong payload becomes
// InternalError "unexpected response type from backend".

HandlerResult tools_list(IBackend& backend, const JsonRpcRequest& request);

/// Arguments are validated and converted before the backend is contacted.
HandlerResult tools_call(IBackend& backend, const JsonRpcRequest& request,
                         std::string_view caller_id);

HandlerResult prompts_list(IBackend& backend, const JsonRpcRequest& request);

HandlerResult prompts_get(IBackend& backend, const JsonRpcRequest& request);

// ---- Backend message conversions ----

ToolDefinition to_mcp(const v1::ToolDefinition& def);
PromptDefinition to_mcp(const v1::PromptDefinition& def);
GetPromptResult to_mcp(const v1::PromptGetResponse& resp);

/// Always exactly one text block. A failed call keeps a successful envelope
/// and sets is_error.
CallToolResult to_mcp(const v1::ToolResponse& resp);

/// The "text" field of a tool result if present, else the whole result as
/// compact JSON. Empty for an absent result.
std::string result_text(const google::protobuf::Struct* result);

} // namespace handlers
} // namespace mcpbridge
