#include "mcpserve/capability.hpp"
#include "mcpserve/error.hpp"

namespace mcpserve {

namespace {

bool valid_role(const std::string& role) {
    return role == "user" || role == "assistant";
}

} // anonymous namespace

// ---------- FunctionTool ----------

FunctionTool::FunctionTool(ToolDefinition def, ToolFunction fn)
    : def_(std::move(def)), fn_(std::move(fn)) {
}

CallToolResult FunctionTool::validate_and_call(const nlohmann::json& arguments) {
    if (!arguments.is_object()) {
        throw McpInvalidArgumentsError("arguments must be an object");
    }
    if (def_.input_schema && def_.input_schema->contains("required")) {
        const auto& required = def_.input_schema->at("required");
        if (required.is_array()) {
            std::string missing;
            for (const auto& field : required) {
                if (!field.is_string()) continue;
                const auto key = field.get<std::string>();
                if (!arguments.contains(key)) {
                    if (!missing.empty()) missing += ", ";
                    missing += key;
                }
            }
            if (!missing.empty()) {
                throw McpInvalidArgumentsError("missing required arguments: " + missing);
            }
        }
    }
    return fn_(arguments);
}

// ---------- TextResource ----------

TextResource::TextResource(ResourceDefinition def, std::string content, bool binary)
    : def_(std::move(def)), binary_(binary), content_(std::move(content)) {
}

std::string TextResource::content() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return content_;
}

void TextResource::set_content(std::string content) {
    std::lock_guard<std::mutex> lock(mutex_);
    content_ = std::move(content);
}

// ---------- FunctionPrompt ----------

FunctionPrompt::FunctionPrompt(PromptDefinition def, PromptFunction fn)
    : def_(std::move(def)), fn_(std::move(fn)) {
}

GetPromptResult FunctionPrompt::validate_and_render(const nlohmann::json& arguments) {
    if (!arguments.is_object()) {
        throw McpInvalidArgumentsError("arguments must be an object");
    }
    for (const auto& arg : def_.arguments) {
        if (arg.required && !arguments.contains(arg.name)) {
            throw McpInvalidArgumentsError("missing required argument: " + arg.name);
        }
    }

    GetPromptResult result;
    result.description = def_.description;
    result.messages = fn_(arguments);
    if (result.messages.empty()) {
        throw McpError("At least one message must be provided");
    }
    for (const auto& m : result.messages) {
        if (!valid_role(m.role)) {
            throw McpError("Invalid role: " + m.role + ". Must be one of: user, assistant");
        }
    }
    return result;
}

PromptMessage text_message(std::string role, std::string text) {
    return PromptMessage{std::move(role), TextContent{std::move(text)}};
}

} // namespace mcpserve
