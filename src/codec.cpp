#include "mcpbridge/codec.hpp"
#include "mcpbridge/error.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <stdexcept>
#include <string>

namespace mcpbridge {

namespace {

// Convert simdjson value to nlohmann::json recursively
nlohmann::json simdjson_to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            auto object = val.get_object();
            for (auto field : object) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = simdjson_to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(simdjson_to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            // Try integer first, then double
            auto result_int = val.get_int64();
            if (result_int.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_int.value());
            }
            auto result_uint = val.get_uint64();
            if (result_uint.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_uint.value());
            }
            return nlohmann::json(val.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(val.get_bool().value());
        case simdjson::ondemand::json_type::null:
            return nlohmann::json(nullptr);
        default:
            return nlohmann::json(nullptr);
    }
}

nlohmann::json simdjson_doc_to_nlohmann(simdjson::ondemand::document& doc) {
    auto val = doc.get_value();
    if (val.error()) {
        throw McpParseError(std::string("Message must be a JSON object: ")
                            + simdjson::error_message(val.error()));
    }
    nlohmann::json j = simdjson_to_nlohmann(val.value());
    if (!doc.at_end()) {
        throw McpParseError("Trailing content after JSON value");
    }
    return j;
}

} // anonymous namespace

JsonRpcMessage Codec::parse_object(const nlohmann::json& j) {
    std::string jsonrpc;
    if (j.contains("jsonrpc")) {
        if (!j.at("jsonrpc").is_string()) {
            throw McpParseError("'jsonrpc' must be a string");
        }
        jsonrpc = j.at("jsonrpc").get<std::string>();
    }

    bool has_method = j.contains("method");
    if (has_method && !j.at("method").is_string()) {
        throw McpParseError("'method' must be a string");
    }
    // A null id is treated like an absent one.
    bool has_id = j.contains("id") && !j.at("id").is_null();

    if (has_id) {
        JsonRpcRequest req;
        req.jsonrpc = std::move(jsonrpc);
        try {
            from_json(j.at("id"), req.id);
        } catch (const std::invalid_argument& e) {
            throw McpParseError(e.what());
        }
        // An empty method is reported as an invalid request by the dispatcher.
        if (has_method) req.method = j.at("method").get<std::string>();
        if (j.contains("params")) req.params = j.at("params");
        return req;
    } else if (has_method) {
        JsonRpcNotification notif;
        notif.jsonrpc = std::move(jsonrpc);
        notif.method = j.at("method").get<std::string>();
        if (j.contains("params")) notif.params = j.at("params");
        return notif;
    } else {
        throw McpParseError("Cannot determine message type: missing both 'id' and 'method'");
    }
}

JsonRpcMessage Codec::parse(std::string_view raw) {
    if (raw.empty()) {
        throw McpParseError("Empty input");
    }

    // Use simdjson for fast parsing
    simdjson::ondemand::parser parser;
    // simdjson requires padded input
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw McpParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    // Convert to nlohmann for further processing
    nlohmann::json j;
    try {
        j = simdjson_doc_to_nlohmann(doc);
    } catch (const McpParseError&) {
        throw;
    } catch (const std::exception& e) {
        throw McpParseError(std::string("JSON parse error: ") + e.what());
    }

    if (!j.is_object()) {
        throw McpParseError("Message must be a JSON object");
    }

    return parse_object(j);
}

std::string Codec::serialize(const JsonRpcResponse& resp) {
    nlohmann::json j;
    to_json(j, resp);
    try {
        return j.dump();
    } catch (const nlohmann::json::exception& e) {
        throw McpSerializationError(std::string("Failed to serialize response: ") + e.what());
    }
}

} // namespace mcpbridge
