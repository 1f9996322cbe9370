#include "mcpbridge/json_rpc.hpp"
#include "mcpbridge/version.hpp"
#include <limits>
#include <stdexcept>

namespace mcpbridge {

void from_json(const nlohmann::json& j, RequestId& id) {
    if (j.is_number_unsigned()
        && j.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        id = j.get<uint64_t>();
    } else if (j.is_number_integer()) {
        id = j.get<int64_t>();
    } else if (j.is_number_float()) {
        id = j.get<double>();
    } else if (j.is_string()) {
        id = j.get<std::string>();
    } else {
        throw std::invalid_argument("RequestId must be a number or string");
    }
}

std::string to_string(const RequestId& id) {
    if (const auto* s = std::get_if<std::string>(&id)) return *s;
    nlohmann::json j;
    to_json(j, id);
    return j.dump();
}

JsonRpcResponse JsonRpcResponse::success(std::optional<RequestId> id, nlohmann::json result) {
    JsonRpcResponse resp;
    resp.id = std::move(id);
    resp.result = std::move(result);
    return resp;
}

JsonRpcResponse JsonRpcResponse::failure(std::optional<RequestId> id, int code,
                                         std::string message) {
    JsonRpcResponse resp;
    resp.id = std::move(id);
    resp.error = JsonRpcError{code, std::move(message), std::nullopt};
    return resp;
}

void to_json(nlohmann::json& j, const JsonRpcResponse& r) {
    nlohmann::json id_j;
    if (r.id) to_json(id_j, *r.id);
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["id"] = id_j;
    if (r.result) j["result"] = *r.result;
    if (r.error) j["error"] = *r.error;
}

} // namespace mcpbridge
