#pragma once
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace mcpbridge {

// ---------- Content ----------

/// A content block. Tool results always carry type "text"; prompt messages
/// carry whatever type the backend reports.
struct Content {
    std::string type{"text"};
    std::string text;

    bool operator==(const Content& o) const {
        return type == o.type && text == o.text;
    }
};

// ---------- Tool ----------

struct ToolDefinition {
    std::string name;
    std::optional<std::string> description;
    // nullopt when the backend sent no schema; serialized as null
    std::optional<nlohmann::json> input_schema;

    bool operator==(const ToolDefinition& o) const {
        return name == o.name && description == o.description
               && input_schema == o.input_schema;
    }
};

struct CallToolResult {
    std::vector<Content> content;
    bool is_error = false;

    bool operator==(const CallToolResult& o) const {
        return content == o.content && is_error == o.is_error;
    }
};

// ---------- Prompt ----------

struct PromptArgument {
    std::string name;
    std::optional<std::string> description;
    bool required = false;

    bool operator==(const PromptArgument& o) const {
        return name == o.name && description == o.description && required == o.required;
    }
};

struct PromptDefinition {
    std::string name;
    std::optional<std::string> description;
    std::vector<PromptArgument> arguments;

    bool operator==(const PromptDefinition& o) const {
        return name == o.name && description == o.description
               && arguments == o.arguments;
    }
};

struct PromptMessage {
    std::string role;  // "user" or "assistant"
    Content content;

    bool operator==(const PromptMessage& o) const {
        return role == o.role && content == o.content;
    }
};

struct GetPromptResult {
    std::optional<std::string> description;
    std::vector<PromptMessage> messages;

    bool operator==(const GetPromptResult& o) const {
        return description == o.description && messages == o.messages;
    }
};

// ---------- Capabilities ----------

struct ServerCapabilities {
    std::optional<nlohmann::json> tools;
    std::optional<nlohmann::json> prompts;

    bool operator==(const ServerCapabilities& o) const {
        return tools == o.tools && prompts == o.prompts;
    }
};

struct Implementation {
    std::string name;
    std::string version;

    bool operator==(const Implementation& o) const {
        return name == o.name && version == o.version;
    }
};

struct InitializeResult {
    std::string protocol_version;
    ServerCapabilities capabilities;
    Implementation server_info;

    bool operator==(const InitializeResult& o) const {
        return protocol_version == o.protocol_version && capabilities == o.capabilities
               && server_info == o.server_info;
    }
};

// ---------- JSON serialization ----------

void to_json(nlohmann::json& j, const Content& c);
void to_json(nlohmann::json& j, const ToolDefinition& t);
void to_json(nlohmann::json& j, const CallToolResult& t);
void to_json(nlohmann::json& j, const PromptArgument& t);
void to_json(nlohmann::json& j, const PromptDefinition& t);
void to_json(nlohmann::json& j, const PromptMessage& t);
void to_json(nlohmann::json& j, const GetPromptResult& t);
void to_json(nlohmann::json& j, const ServerCapabilities& t);
void to_json(nlohmann::json& j, const Implementation& t);
void to_json(nlohmann::json& j, const InitializeResult& t);

} // namespace mcpbridge
