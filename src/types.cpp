#include "mcpserve/types.hpp"

namespace mcpserve {

nlohmann::json default_server_capabilities() {
    return nlohmann::json{
        {"resources", {{"subscribe", true}, {"listChanged", true}}},
        {"tools", {{"listChanged", true}}},
        {"prompts", {{"listChanged", true}}}
    };
}

// ---------- TextContent ----------

void to_json(nlohmann::json& j, const TextContent& t) {
    j = {{"type", "text"}, {"text", t.text}};
}

// ---------- ImageContent ----------

void to_json(nlohmann::json& j, const ImageContent& t) {
    j = {{"type", "image"}, {"data", t.data}, {"mimeType", t.mime_type}};
}

// ---------- EmbeddedResource ----------

void to_json(nlohmann::json& j, const EmbeddedResource& t) {
    nlohmann::json resource;
    resource["uri"] = t.uri;
    resource["mimeType"] = t.mime_type;
    if (t.text) resource["text"] = *t.text;
    if (t.blob) resource["blob"] = *t.blob;
    j = {{"type", "resource"}, {"resource", resource}};
}

// ---------- Content ----------

void to_json(nlohmann::json& j, const Content& c) {
    std::visit([&j](const auto& v) { to_json(j, v); }, c);
}

// ---------- ToolDefinition ----------

void to_json(nlohmann::json& j, const ToolDefinition& t) {
    j = {{"name", t.name}, {"description", t.description.value_or("")}};
    if (t.input_schema) {
        j["inputSchema"] = *t.input_schema;
    } else {
        j["inputSchema"] = {
            {"type", "object"},
            {"properties", nlohmann::json::object()},
            {"required", nlohmann::json::array()}
        };
    }
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

// ---------- ResourceDefinition ----------

void to_json(nlohmann::json& j, const ResourceDefinition& t) {
    j = {{"uri", t.uri}, {"name", t.name}};
    if (t.description) j["description"] = *t.description;
    if (t.mime_type) j["mimeType"] = *t.mime_type;
}

// ---------- ResourceContent ----------

void to_json(nlohmann::json& j, const ResourceContent& t) {
    j = {{"uri", t.uri}};
    if (t.mime_type) j["mimeType"] = *t.mime_type;
    if (t.text) j["text"] = *t.text;
    if (t.blob) j["blob"] = *t.blob;
}

// ---------- Prompts ----------

void to_json(nlohmann::json& j, const PromptArgument& t) {
    j = {{"name", t.name}, {"required", t.required}};
    if (t.description) j["description"] = *t.description;
}

void to_json(nlohmann::json& j, const PromptDefinition& t) {
    j = {{"name", t.name}, {"arguments", nlohmann::json::array()}};
    if (t.description) j["description"] = *t.description;
    for (const auto& arg : t.arguments) {
        nlohmann::json aj;
        to_json(aj, arg);
        j["arguments"].push_back(std::move(aj));
    }
}

void to_json(nlohmann::json& j, const PromptMessage& t) {
    nlohmann::json content;
    to_json(content, t.content);
    j = {{"role", t.role}, {"content", content}};
}

void to_json(nlohmann::json& j, const GetPromptResult& t) {
    j = nlohmann::json::object();
    if (t.description) j["description"] = *t.description;
    j["messages"] = nlohmann::json::array();
    for (const auto& m : t.messages) {
        nlohmann::json mj;
        to_json(mj, m);
        j["messages"].push_back(std::move(mj));
    }
}

// ---------- Lifecycle ----------

void to_json(nlohmann::json& j, const Implementation& t) {
    j = {{"name", t.name}, {"version", t.version}};
}

void from_json(const nlohmann::json& j, Implementation& t) {
    t.name = j.value("name", std::string{});
    t.version = j.value("version", std::string{});
}

void to_json(nlohmann::json& j, const InitializeResult& t) {
    nlohmann::json server_info;
    to_json(server_info, t.server_info);
    j = {
        {"protocolVersion", t.protocol_version},
        {"capabilities", t.capabilities},
        {"serverInfo", server_info}
    };
}

} // namespace mcpserve
