#pragma once
#include "mcpbridge/v1/backend.pb.h"

namespace mcpbridge {

using PluginRequest = mcpbridge::v1::PluginRequest;
using PluginResponse = mcpbridge::v1::PluginResponse;

/// One synchronous request/response round trip to the backend.
class IBackend {
public:
    virtual ~IBackend() = default;

    /// Send a request and wait for its reply.
    /// Throws McpBackendError if no reply could be obtained.
    virtual PluginResponse send(const PluginRequest& request) = 0;
};

} // namespace mcpbridge
