#include "mcpbridge/handlers.hpp"
#include "mcpbridge/error.hpp"
#include "mcpbridge/value_translator.hpp"
#include <spdlog/spdlog.h>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace mcpbridge {
namespace handlers {

namespace {

constexpr const char* UNEXPECTED_RESPONSE = "unexpected response type from backend";

JsonRpcError internal_error(std::string message) {
    return JsonRpcError{error::InternalError, std::move(message), std::nullopt};
}

JsonRpcError invalid_params(std::string message) {
    return JsonRpcError{error::InvalidParams, std::move(message), std::nullopt};
}

std::string correlation_id(const char* tag, const JsonRpcRequest& request) {
    return std::string("stdio-") + tag + "-" + to_string(request.id);
}

using BackendReply = std::variant<PluginResponse, JsonRpcError>;

BackendReply round_trip(IBackend& backend, const PluginRequest& request,
                        const std::string& operation) {
    spdlog::debug("backend {} request_id={}", operation, request.request_id());
    try {
        return backend.send(request);
    } catch (const McpBackendError& e) {
        spdlog::warn("backend {} failed: {}", operation, e.what());
        return internal_error("backend " + operation + " failed: " + e.what());
    }
}

struct CallParams {
    std::string name;
    std::optional<nlohmann::json> arguments;
};

// Shared decoding of {name, arguments} for tools/call and prompts/get.
// Null params or null arguments read as absent.
std::variant<CallParams, JsonRpcError> decode_call_params(const JsonRpcRequest& request) {
    nlohmann::json params = request.params ? *request.params : nlohmann::json(nullptr);
    if (params.is_null()) params = nlohmann::json::object();
    if (!params.is_object()) {
        return invalid_params(std::string("invalid params: expected an object, got ")
                              + params.type_name());
    }

    CallParams out;
    if (params.contains("name") && !params.at("name").is_null()) {
        const auto& name = params.at("name");
        if (!name.is_string()) {
            return invalid_params(std::string("invalid params: 'name' must be a string, got ")
                                  + name.type_name());
        }
        out.name = name.get<std::string>();
    }
    if (params.contains("arguments") && !params.at("arguments").is_null()) {
        const auto& args = params.at("arguments");
        if (!args.is_object()) {
            return invalid_params(std::string("invalid params: 'arguments' must be an object, got ")
                                  + args.type_name());
        }
        out.arguments = args;
    }
    if (out.name.empty()) {
        return invalid_params("missing required parameter: name");
    }
    return out;
}

} // anonymous namespace

// ---------- Local methods ----------

HandlerResult initialize(const InitializeResult& info) {
    nlohmann::json j;
    to_json(j, info);
    return j;
}

HandlerResult ping() {
    return nlohmann::json::object();
}

// ---------- Tools ----------

HandlerResult tools_list(IBackend& backend, const JsonRpcRequest& request) {
    PluginRequest req;
    req.set_request_id(correlation_id("lt", request));
    req.mutable_list_tools();

    auto reply = round_trip(backend, req, "list_tools");
    if (auto* err = std::get_if<JsonRpcError>(&reply)) return std::move(*err);
    const auto& resp = std::get<PluginResponse>(reply);
    if (resp.response_case() != PluginResponse::kListTools) {
        return internal_error(UNEXPECTED_RESPONSE);
    }

    nlohmann::json tools = nlohmann::json::array();
    for (const auto& def : resp.list_tools().tools()) {
        nlohmann::json tj;
        to_json(tj, to_mcp(def));
        tools.push_back(std::move(tj));
    }
    return nlohmann::json{{"tools", std::move(tools)}};
}

HandlerResult tools_call(IBackend& backend, const JsonRpcRequest& request,
                         std::string_view caller_id) {
    auto decoded = decode_call_params(request);
    if (auto* err = std::get_if<JsonRpcError>(&decoded)) return std::move(*err);
    auto& params = std::get<CallParams>(decoded);

    PluginRequest req;
    req.set_request_id(correlation_id("tc", request));
    auto* call = req.mutable_tool_call();
    call->set_tool_name(params.name);
    call->set_caller_plugin(std::string(caller_id));
    if (params.arguments) {
        try {
            *call->mutable_arguments() = ValueTranslator::to_struct(*params.arguments, "arguments");
        } catch (const McpConversionError& e) {
            return invalid_params(std::string("invalid arguments: ") + e.what());
        }
    }

    spdlog::debug("tools/call '{}'", params.name);
    auto reply = round_trip(backend, req, "tool_call");
    if (auto* err = std::get_if<JsonRpcError>(&reply)) return std::move(*err);
    const auto& resp = std::get<PluginResponse>(reply);
    if (resp.response_case() != PluginResponse::kToolCall) {
        return internal_error(UNEXPECTED_RESPONSE);
    }

    nlohmann::json j;
    to_json(j, to_mcp(resp.tool_call()));
    return j;
}

// ---------- Prompts ----------

HandlerResult prompts_list(IBackend& backend, const JsonRpcRequest& request) {
    PluginRequest req;
    req.set_request_id(correlation_id("lp", request));
    req.mutable_list_prompts();

    auto reply = round_trip(backend, req, "list_prompts");
    if (auto* err = std::get_if<JsonRpcError>(&reply)) return std::move(*err);
    const auto& resp = std::get<PluginResponse>(reply);
    if (resp.response_case() != PluginResponse::kListPrompts) {
        return internal_error(UNEXPECTED_RESPONSE);
    }

    nlohmann::json prompts = nlohmann::json::array();
    for (const auto& def : resp.list_prompts().prompts()) {
        nlohmann::json pj;
        to_json(pj, to_mcp(def));
        prompts.push_back(std::move(pj));
    }
    return nlohmann::json{{"prompts", std::move(prompts)}};
}

HandlerResult prompts_get(IBackend& backend, const JsonRpcRequest& request) {
    auto decoded = decode_call_params(request);
    if (auto* err = std::get_if<JsonRpcError>(&decoded)) return std::move(*err);
    auto& params = std::get<CallParams>(decoded);

    PluginRequest req;
    req.set_request_id(correlation_id("pg", request));
    auto* get = req.mutable_prompt_get();
    get->set_prompt_name(params.name);
    if (params.arguments) {
        auto& args = *get->mutable_arguments();
        for (auto it = params.arguments->begin(); it != params.arguments->end(); ++it) {
            // null reads as the empty string.
            if (it.value().is_null()) {
                args[it.key()] = std::string();
                continue;
            }
            if (!it.value().is_string()) {
                return invalid_params("invalid params: argument '" + it.key()
                                      + "' must be a string");
            }
            args[it.key()] = it.value().get<std::string>();
        }
    }

    auto reply = round_trip(backend, req, "prompt_get");
    if (auto* err = std::get_if<JsonRpcError>(&reply)) return std::move(*err);
    const auto& resp = std::get<PluginResponse>(reply);
    if (resp.response_case() != PluginResponse::kPromptGet) {
        return internal_error(UNEXPECTED_RESPONSE);
    }

    nlohmann::json j;
    to_json(j, to_mcp(resp.prompt_get()));
    return j;
}

// ---------- Conversions ----------

ToolDefinition to_mcp(const v1::ToolDefinition& def) {
    ToolDefinition out;
    out.name = def.name();
    out.description = def.description();
    out.input_schema = ValueTranslator::to_json(
        def.has_input_schema() ? &def.input_schema() : nullptr);
    return out;
}

PromptDefinition to_mcp(const v1::PromptDefinition& def) {
    PromptDefinition out;
    out.name = def.name();
    out.description = def.description();
    out.arguments.reserve(static_cast<size_t>(def.arguments_size()));
    for (const auto& arg : def.arguments()) {
        out.arguments.push_back(PromptArgument{arg.name(), arg.description(), arg.required()});
    }
    return out;
}

GetPromptResult to_mcp(const v1::PromptGetResponse& resp) {
    GetPromptResult out;
    if (!resp.description().empty()) out.description = resp.description();
    out.messages.reserve(static_cast<size_t>(resp.messages_size()));
    for (const auto& m : resp.messages()) {
        PromptMessage msg;
        msg.role = m.role();
        // An absent content block reads as empty type and text.
        msg.content.type = m.content().type();
        msg.content.text = m.content().text();
        out.messages.push_back(std::move(msg));
    }
    return out;
}

CallToolResult to_mcp(const v1::ToolResponse& resp) {
    CallToolResult out;
    if (!resp.success()) {
        std::string message = resp.error_message();
        if (message.empty()) {
            message = "tool error: " + resp.error_code();
        }
        out.content.push_back(Content{"text", std::move(message)});
        out.is_error = true;
        return out;
    }
    out.content.push_back(Content{"text", result_text(resp.has_result() ? &resp.result() : nullptr)});
    return out;
}

std::string result_text(const google::protobuf::Struct* result) {
    if (!result) return {};
    auto it = result->fields().find("text");
    if (it != result->fields().end()) {
        return it->second.string_value();
    }
    return ValueTranslator::to_json(*result).dump();
}

} // namespace handlers
} // namespace mcpbridge
