#pragma once
#include "json_rpc.hpp"
#include <functional>
#include <optional>
#include <unordered_map>
#include <string>
#include <string_view>
#include <variant>

namespace mcpbridge {

using HandlerResult = std::variant<nlohmann::json, JsonRpcError>;
using RequestHandler = std::function<HandlerResult(const JsonRpcRequest& request)>;

/// Methods with this prefix are acknowledged without a reply.
constexpr std::string_view NOTIFICATION_PREFIX = "notifications/";

class Router {
public:
    enum class RouteKind { Handler, Notification, Unknown };

    struct Route {
        RouteKind kind;
        const RequestHandler* handler;  // set only for RouteKind::Handler
    };

    /// Register a request handler for a method.
    void on_request(const std::string& method, RequestHandler handler);

    /// Exact match first, then the notification prefix.
    [[nodiscard]] Route route(const std::string& method) const;

    /// Dispatch a request. Returns nullopt for notification methods.
    [[nodiscard]] std::optional<JsonRpcResponse> dispatch(const JsonRpcRequest& request) const;

    [[nodiscard]] bool has_handler(const std::string& method) const;

private:
    std::unordered_map<std::string, RequestHandler> request_handlers_;
};

} // namespace mcpbridge
