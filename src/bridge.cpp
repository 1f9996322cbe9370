#include "mcpbridge/bridge.hpp"
#include "mcpbridge/codec.hpp"
#include "mcpbridge/error.hpp"
#include "mcpbridge/handlers.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <string>

namespace mcpbridge {

namespace {

std::string_view trim(std::string_view s) {
    constexpr std::string_view ws = " \t\r\n\f\v";
    auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) return {};
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

} // anonymous namespace

// ----------- Bridge::Impl -----------

struct Bridge::Impl {
    IBackend& backend;
    Options opts;
    Router router;

    Impl(IBackend& b, Options o) : backend(b), opts(std::move(o)) {}

    InitializeResult build_initialize_result() const {
        InitializeResult result;
        result.protocol_version = opts.protocol_version;
        result.capabilities.tools = nlohmann::json::object();
        if (opts.advertise_prompts) {
            result.capabilities.prompts = nlohmann::json::object();
        }
        result.server_info = opts.server_info;
        return result;
    }

    void setup_handlers() {
        // initialize
        router.on_request("initialize", [info = build_initialize_result()](const JsonRpcRequest&) {
            return handlers::initialize(info);
        });

        // ping
        router.on_request("ping", [](const JsonRpcRequest&) {
            return handlers::ping();
        });

        // tools/list
        router.on_request("tools/list", [this](const JsonRpcRequest& req) {
            return handlers::tools_list(backend, req);
        });

        // tools/call
        router.on_request("tools/call", [this](const JsonRpcRequest& req) {
            return handlers::tools_call(backend, req, opts.caller_id);
        });

        if (opts.advertise_prompts) {
            // prompts/list
            router.on_request("prompts/list", [this](const JsonRpcRequest& req) {
                return handlers::prompts_list(backend, req);
            });

            // prompts/get
            router.on_request("prompts/get", [this](const JsonRpcRequest& req) {
                return handlers::prompts_get(backend, req);
            });
        }
    }

    std::optional<JsonRpcResponse> on_request(const JsonRpcRequest& req) {
        // notifications/* stay silent whatever the envelope looks like.
        if (router.route(req.method).kind == Router::RouteKind::Notification) {
            spdlog::info("notification: {} (id={})", req.method, to_string(req.id));
            return std::nullopt;
        }
        if (req.jsonrpc != JSONRPC_VERSION) {
            return JsonRpcResponse::failure(req.id, error::InvalidRequest,
                                            "invalid request: jsonrpc must be \"2.0\"");
        }
        if (req.method.empty()) {
            return JsonRpcResponse::failure(req.id, error::InvalidRequest,
                                            "invalid request: missing method");
        }

        auto start = std::chrono::steady_clock::now();
        auto response = router.dispatch(req);
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        if (response && response->error) {
            spdlog::warn("{} (id={}) failed with {}: {}", req.method, to_string(req.id),
                         response->error->code, response->error->message);
        } else {
            spdlog::debug("{} (id={}) handled in {} ms", req.method, to_string(req.id),
                          elapsed.count());
        }
        return response;
    }
};

// ----------- Bridge -----------

Bridge::Bridge(IBackend& backend)
    : Bridge(backend, Options{}) {
}

Bridge::Bridge(IBackend& backend, Options opts)
    : impl_(std::make_unique<Impl>(backend, std::move(opts))) {
    impl_->setup_handlers();
}

Bridge::~Bridge() = default;

std::optional<JsonRpcResponse> Bridge::handle_line(std::string_view line) {
    JsonRpcMessage msg;
    try {
        msg = Codec::parse(line);
    } catch (const McpParseError& e) {
        spdlog::warn("parse error: {}", e.what());
        return JsonRpcResponse::failure(std::nullopt, error::ParseError,
                                        std::string("parse error: ") + e.what());
    }
    return handle_message(msg);
}

std::optional<JsonRpcResponse> Bridge::handle_message(const JsonRpcMessage& msg) {
    if (const auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
        // Messages without an id are never answered and never reach a handler.
        spdlog::info("notification: {}", notif->method);
        return std::nullopt;
    }
    return impl_->on_request(std::get<JsonRpcRequest>(msg));
}

void Bridge::serve(StdioTransport& transport, const std::atomic<bool>& cancelled) {
    spdlog::info("bridge: serving {} {}", impl_->opts.server_info.name,
                 impl_->opts.server_info.version);

    while (!cancelled.load()) {
        auto line = transport.read_line();
        if (!line) break;
        if (cancelled.load()) break;

        auto trimmed = trim(*line);
        if (trimmed.empty()) continue;

        auto response = handle_line(trimmed);
        if (!response) continue;

        transport.write_line(Codec::serialize(*response));
    }

    spdlog::info("bridge: {}", cancelled.load() ? "cancelled" : "input closed");
}

void Bridge::serve(StdioTransport& transport) {
    const std::atomic<bool> never{false};
    serve(transport, never);
}

const Router& Bridge::router() const {
    return impl_->router;
}

} // namespace mcpbridge
