#pragma once
#include <optional>
#include <string>
#include <google/protobuf/struct.pb.h>
#include <nlohmann/json.hpp>

namespace mcpbridge {

/// Conversion between the backend's structured values (google.protobuf.Value)
/// and JSON values of the client protocol.
///
/// Structured -> JSON is total: a whole number within +/-2^53 becomes an
/// integer, any other number stays a double, an unset kind becomes null. JSON -> structured throws McpConversionError naming the
/// offending path when a value has no structured representation.
class ValueTranslator {
public:
    /// Integers beyond this magnitude do not survive a round trip through the
    /// double carried by google.protobuf.Value.
    static constexpr int64_t MAX_EXACT_INTEGER = int64_t{1} << 53;

    [[nodiscard]] static nlohmann::json to_json(const google::protobuf::Value& value);
    [[nodiscard]] static nlohmann::json to_json(const google::protobuf::Struct& s);
    [[nodiscard]] static nlohmann::json to_json(const google::protobuf::ListValue& list);

    /// Absent struct (unset message field) stays absent.
    [[nodiscard]] static std::optional<nlohmann::json>
    to_json(const google::protobuf::Struct* s);

    [[nodiscard]] static google::protobuf::Value to_value(const nlohmann::json& j,
                                                          const std::string& path = "$");

    /// `j` must be an object.
    [[nodiscard]] static google::protobuf::Struct to_struct(const nlohmann::json& j,
                                                            const std::string& path = "$");

    [[nodiscard]] static google::protobuf::ListValue to_list(const nlohmann::json& j,
                                                             const std::string& path = "$");
};

} // namespace mcpbridge
