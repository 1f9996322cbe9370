#include "mcpbridge/types.hpp"

namespace mcpbridge {

// ---------- Content ----------

void to_json(nlohmann::json& j, const Content& c) {
    j = {{"type", c.type}, {"text", c.text}};
}

// ---------- ToolDefinition ----------

void to_json(nlohmann::json& j, const ToolDefinition& t) {
    j = {{"name", t.name}};
    if (t.description) j["description"] = *t.description;
    j["inputSchema"] = t.input_schema ? *t.input_schema : nlohmann::json(nullptr);
}

// ---------- CallToolResult ----------

void to_json(nlohmann::json& j, const CallToolResult& t) {
    j = nlohmann::json::object();
    j["content"] = nlohmann::json::array();
    for (const auto& c : t.content) {
        nlohmann::json cj;
        to_json(cj, c);
        j["content"].push_back(cj);
    }
    j["isError"] = t.is_error;
}

// ---------- PromptArgument ----------

void to_json(nlohmann::json& j, const PromptArgument& t) {
    j = {{"name", t.name}, {"required", t.required}};
    if (t.description) j["description"] = *t.description;
}

// ---------- PromptDefinition ----------

void to_json(nlohmann::json& j, const PromptDefinition& t) {
    j = {{"name", t.name}, {"arguments", t.arguments}};
    if (t.description) j["description"] = *t.description;
}

// ---------- PromptMessage ----------

void to_json(nlohmann::json& j, const PromptMessage& t) {
    j = {{"role", t.role}, {"content", t.content}};
}

// ---------- GetPromptResult ----------

void to_json(nlohmann::json& j, const GetPromptResult& t) {
    j = {{"messages", t.messages}};
    if (t.description) j["description"] = *t.description;
}

// ---------- ServerCapabilities ----------

void to_json(nlohmann::json& j, const ServerCapabilities& t) {
    j = nlohmann::json::object();
    if (t.tools) j["tools"] = *t.tools;
    if (t.prompts) j["prompts"] = *t.prompts;
}

// ---------- Implementation ----------

void to_json(nlohmann::json& j, const Implementation& t) {
    j = {{"name", t.name}, {"version", t.version}};
}

// ---------- InitializeResult ----------

void to_json(nlohmann::json& j, const InitializeResult& t) {
    j = {
        {"protocolVersion", t.protocol_version},
        {"capabilities", t.capabilities},
        {"serverInfo", t.server_info}
    };
}

} // namespace mcpbridge
