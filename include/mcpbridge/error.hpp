#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace mcpbridge {

class McpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Input line is not a well-formed JSON-RPC envelope.
class McpParseError : public McpError {
public:
    using McpError::McpError;
};

/// Fault on the stdio streams. Fatal to the run loop.
class McpTransportError : public McpError {
public:
    using McpError::McpError;
};

/// Backend round trip failed before a reply was received.
class McpBackendError : public McpError {
public:
    using McpError::McpError;
};

/// A native value has no representation in the structured value model.
class McpConversionError : public McpError {
public:
    std::string path;
    McpConversionError(std::string path, const std::string& msg)
        : McpError(path + ": " + msg), path(std::move(path)) {}
};

/// A response could not be encoded. Fatal to the run loop.
class McpSerializationError : public McpError {
public:
    using McpError::McpError;
};

namespace error {
    constexpr int ParseError       = -32700;
    constexpr int InvalidRequest   = -32600;
    constexpr int MethodNotFound   = -32601;
    constexpr int InvalidParams    = -32602;
    constexpr int InternalError    = -32603;
} // namespace error

} // namespace mcpbridge
