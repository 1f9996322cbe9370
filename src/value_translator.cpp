#include "mcpbridge/value_translator.hpp"
#include "mcpbridge/error.hpp"
#include <cmath>
#include <string>

namespace mcpbridge {

namespace {

std::string key_path(const std::string& parent, const std::string& key) {
    return parent + "." + key;
}

std::string index_path(const std::string& parent, size_t index) {
    return parent + "[" + std::to_string(index) + "]";
}

} // anonymous namespace

// ---------- structured -> JSON ----------

nlohmann::json ValueTranslator::to_json(const google::protobuf::Value& value) {
    switch (value.kind_case()) {
        case google::protobuf::Value::kNullValue:
            return nullptr;
        case google::protobuf::Value::kNumberValue: {
            // Whole numbers in the exact range print without a fraction.
            double d = value.number_value();
            if (std::isfinite(d) && std::trunc(d) == d
                && std::fabs(d) <= static_cast<double>(MAX_EXACT_INTEGER)) {
                return static_cast<int64_t>(d);
            }
            return d;
        }
        case google::protobuf::Value::kStringValue:
            return value.string_value();
        case google::protobuf::Value::kBoolValue:
            return value.bool_value();
        case google::protobuf::Value::kStructValue:
            return to_json(value.struct_value());
        case google::protobuf::Value::kListValue:
            return to_json(value.list_value());
        case google::protobuf::Value::KIND_NOT_SET:
            return nullptr;
    }
    return nullptr;
}

nlohmann::json ValueTranslator::to_json(const google::protobuf::Struct& s) {
    nlohmann::json obj = nlohmann::json::object();
    for (const auto& field : s.fields()) {
        obj[field.first] = to_json(field.second);
    }
    return obj;
}

nlohmann::json ValueTranslator::to_json(const google::protobuf::ListValue& list) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& item : list.values()) {
        arr.push_back(to_json(item));
    }
    return arr;
}

std::optional<nlohmann::json> ValueTranslator::to_json(const google::protobuf::Struct* s) {
    if (!s) return std::nullopt;
    return to_json(*s);
}

// ---------- JSON -> structured ----------

google::protobuf::Value ValueTranslator::to_value(const nlohmann::json& j,
                                                  const std::string& path) {
    google::protobuf::Value value;
    switch (j.type()) {
        case nlohmann::json::value_t::null:
            value.set_null_value(google::protobuf::NULL_VALUE);
            break;
        case nlohmann::json::value_t::boolean:
            value.set_bool_value(j.get<bool>());
            break;
        case nlohmann::json::value_t::string:
            value.set_string_value(j.get_ref<const std::string&>());
            break;
        case nlohmann::json::value_t::number_integer: {
            auto n = j.get<int64_t>();
            if (n > MAX_EXACT_INTEGER || n < -MAX_EXACT_INTEGER) {
                throw McpConversionError(path, "integer " + std::to_string(n)
                                         + " is out of the exactly representable range");
            }
            value.set_number_value(static_cast<double>(n));
            break;
        }
        case nlohmann::json::value_t::number_unsigned: {
            auto n = j.get<uint64_t>();
            if (n > static_cast<uint64_t>(MAX_EXACT_INTEGER)) {
                throw McpConversionError(path, "integer " + std::to_string(n)
                                         + " is out of the exactly representable range");
            }
            value.set_number_value(static_cast<double>(n));
            break;
        }
        case nlohmann::json::value_t::number_float: {
            double d = j.get<double>();
            if (!std::isfinite(d)) {
                throw McpConversionError(path, "non-finite number");
            }
            value.set_number_value(d);
            break;
        }
        case nlohmann::json::value_t::object:
            *value.mutable_struct_value() = to_struct(j, path);
            break;
        case nlohmann::json::value_t::array:
            *value.mutable_list_value() = to_list(j, path);
            break;
        case nlohmann::json::value_t::binary:
            throw McpConversionError(path, "binary values are not supported");
        case nlohmann::json::value_t::discarded:
            throw McpConversionError(path, "discarded value");
    }
    return value;
}

google::protobuf::Struct ValueTranslator::to_struct(const nlohmann::json& j,
                                                    const std::string& path) {
    if (!j.is_object()) {
        throw McpConversionError(path, std::string("expected an object, got ") + j.type_name());
    }
    google::protobuf::Struct s;
    auto& fields = *s.mutable_fields();
    for (auto it = j.begin(); it != j.end(); ++it) {
        fields[it.key()] = to_value(it.value(), key_path(path, it.key()));
    }
    return s;
}

google::protobuf::ListValue ValueTranslator::to_list(const nlohmann::json& j,
                                                     const std::string& path) {
    if (!j.is_array()) {
        throw McpConversionError(path, std::string("expected an array, got ") + j.type_name());
    }
    google::protobuf::ListValue list;
    size_t index = 0;
    for (const auto& item : j) {
        *list.add_values() = to_value(item, index_path(path, index));
        ++index;
    }
    return list;
}

} // namespace mcpbridge
