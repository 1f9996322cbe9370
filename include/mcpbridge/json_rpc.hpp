#pragma once
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <nlohmann/json.hpp>

namespace mcpbridge {

/// Signed, unsigned, fractional and string ids are kept apart so that a
/// reply echoes the id with the JSON type and value the client used.
/// uint64_t holds only integers above INT64_MAX.
using RequestId = std::variant<int64_t, uint64_t, double, std::string>;

// Helper to convert RequestId to json
inline void to_json(nlohmann::json& j, const RequestId& id) {
    std::visit([&j](const auto& v) { j = v; }, id);
}

void from_json(const nlohmann::json& j, RequestId& id);

/// Textual form of an id, used for backend correlation ids and log lines.
std::string to_string(const RequestId& id);

struct JsonRpcError {
    int code;
    std::string message;
    std::optional<nlohmann::json> data;

    bool operator==(const JsonRpcError& o) const {
        return code == o.code && message == o.message && data == o.data;
    }
};

inline void to_json(nlohmann::json& j, const JsonRpcError& e) {
    j = nlohmann::json{{"code", e.code}, {"message", e.message}};
    if (e.data) j["data"] = *e.data;
}

struct JsonRpcRequest {
    std::string jsonrpc{"2.0"};
    RequestId id;
    std::string method;
    std::optional<nlohmann::json> params;

    bool operator==(const JsonRpcRequest& o) const {
        return jsonrpc == o.jsonrpc && id == o.id && method == o.method
               && params == o.params;
    }
};

/// A request without an id. Never answered.
struct JsonRpcNotification {
    std::string jsonrpc{"2.0"};
    std::string method;
    std::optional<nlohmann::json> params;

    bool operator==(const JsonRpcNotification& o) const {
        return jsonrpc == o.jsonrpc && method == o.method && params == o.params;
    }
};

/// Exactly one of result and error is set. A missing id serializes as null
/// (parse failures, where no id could be recovered).
struct JsonRpcResponse {
    std::optional<RequestId> id;
    std::optional<nlohmann::json> result;
    std::optional<JsonRpcError> error;

    static JsonRpcResponse success(std::optional<RequestId> id, nlohmann::json result);
    static JsonRpcResponse failure(std::optional<RequestId> id, int code, std::string message);

    bool operator==(const JsonRpcResponse& o) const {
        return id == o.id && result == o.result && error == o.error;
    }
};

using JsonRpcMessage = std::variant<JsonRpcRequest, JsonRpcNotification>;

void to_json(nlohmann::json& j, const JsonRpcResponse& r);

} // namespace mcpbridge
