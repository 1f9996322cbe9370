#include "mcpbridge/router.hpp"
#include "mcpbridge/error.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace mcpbridge {

void Router::on_request(const std::string& method, RequestHandler handler) {
    request_handlers_[method] = std::move(handler);
}

bool Router::has_handler(const std::string& method) const {
    return request_handlers_.count(method) > 0;
}

Router::Route Router::route(const std::string& method) const {
    auto it = request_handlers_.find(method);
    if (it != request_handlers_.end()) {
        return {RouteKind::Handler, &it->second};
    }
    if (method.compare(0, NOTIFICATION_PREFIX.size(), NOTIFICATION_PREFIX) == 0) {
        return {RouteKind::Notification, nullptr};
    }
    return {RouteKind::Unknown, nullptr};
}

std::optional<JsonRpcResponse> Router::dispatch(const JsonRpcRequest& request) const {
    auto r = route(request.method);
    switch (r.kind) {
        case RouteKind::Notification:
            spdlog::info("notification: {}", request.method);
            return std::nullopt;
        case RouteKind::Unknown:
            return JsonRpcResponse::failure(request.id, error::MethodNotFound,
                                            "method not found: " + request.method);
        case RouteKind::Handler:
            break;
    }

    try {
        auto result = (*r.handler)(request);
        if (auto* ok = std::get_if<nlohmann::json>(&result)) {
            return JsonRpcResponse::success(request.id, std::move(*ok));
        }
        auto& err = std::get<JsonRpcError>(result);
        JsonRpcResponse resp;
        resp.id = request.id;
        resp.error = std::move(err);
        return resp;
    } catch (const std::exception& e) {
        return JsonRpcResponse::failure(request.id, error::InternalError, e.what());
    }
}

} // namespace mcpbridge
