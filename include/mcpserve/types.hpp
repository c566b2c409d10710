#pragma once
#include <string>
#include <vector>
#include <optional>
#include <variant>
#include <nlohmann/json.hpp>

namespace mcpserve {

// ---------- Content types ----------

struct TextContent {
    std::string text;

    bool operator==(const TextContent& o) const { return text == o.text; }
};

struct ImageContent {
    std::string data;       // base64
    std::string mime_type;

    bool operator==(const ImageContent& o) const {
        return data == o.data && mime_type == o.mime_type;
    }
};

struct EmbeddedResource {
    std::string uri;
    std::string mime_type;
    std::optional<std::string> text;
    std::optional<std::string> blob;  // base64

    bool operator==(const EmbeddedResource& o) const {
        return uri == o.uri && mime_type == o.mime_type && text == o.text
               && blob == o.blob;
    }
};

using Content = std::variant<TextContent, ImageContent, EmbeddedResource>;

// ---------- Tool ----------

struct ToolDefinition {
    std::string name;
    std::optional<std::string> description;
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

// ---------- Resource ----------

struct ResourceDefinition {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mime_type;

    bool operator==(const ResourceDefinition& o) const {
        return uri == o.uri && name == o.name && description == o.description
               && mime_type == o.mime_type;
    }
};

struct ResourceContent {
    std::string uri;
    std::optional<std::string> mime_type;
    std::optional<std::string> text;
    std::optional<std::string> blob;  // base64

    bool operator==(const ResourceContent& o) const {
        return uri == o.uri && mime_type == o.mime_type && text == o.text
               && blob == o.blob;
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

// ---------- Lifecycle ----------

struct Implementation {
    std::string name;
    std::string version;

    bool operator==(const Implementation& o) const {
        return name == o.name && version == o.version;
    }
};

struct InitializeResult {
    std::string protocol_version;
    nlohmann::json capabilities;
    Implementation server_info;

    bool operator==(const InitializeResult& o) const {
        return protocol_version == o.protocol_version && capabilities == o.capabilities
               && server_info == o.server_info;
    }
};

/// Capabilities advertised at initialize unless overridden by the host.
nlohmann::json default_server_capabilities();

// ---------- JSON serialization ----------

void to_json(nlohmann::json& j, const TextContent& t);
void to_json(nlohmann::json& j, const ImageContent& t);
void to_json(nlohmann::json& j, const EmbeddedResource& t);
void to_json(nlohmann::json& j, const Content& c);

void to_json(nlohmann::json& j, const ToolDefinition& t);
void to_json(nlohmann::json& j, const CallToolResult& t);

void to_json(nlohmann::json& j, const ResourceDefinition& t);
void to_json(nlohmann::json& j, const ResourceContent& t);

void to_json(nlohmann::json& j, const PromptArgument& t);
void to_json(nlohmann::json& j, const PromptDefinition& t);
void to_json(nlohmann::json& j, const PromptMessage& t);
void to_json(nlohmann::json& j, const GetPromptResult& t);

void to_json(nlohmann::json& j, const Implementation& t);
/// Lenient: missing fields stay empty. Used for the client's clientInfo.
void from_json(const nlohmann::json& j, Implementation& t);

void to_json(nlohmann::json& j, const InitializeResult& t);

} // namespace mcpserve
