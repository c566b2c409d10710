#pragma once
#include "types.hpp"
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace mcpserve {

/// An invocable tool. validate_and_call() throws McpInvalidArgumentsError
/// when `arguments` do not satisfy the tool's schema.
class Tool {
public:
    virtual ~Tool() = default;

    virtual const ToolDefinition& definition() const = 0;
    virtual CallToolResult validate_and_call(const nlohmann::json& arguments) = 0;

    const std::string& name() const { return definition().name; }
};

/// A readable resource addressed by uri.
class Resource {
public:
    virtual ~Resource() = default;

    virtual const ResourceDefinition& definition() const = 0;

    /// True when content() holds raw bytes to be sent base64-encoded as `blob`.
    virtual bool binary() const = 0;
    virtual std::string content() const = 0;
    virtual void set_content(std::string content) = 0;

    const std::string& uri() const { return definition().uri; }
};

/// A prompt template rendered into an ordered list of messages.
class Prompt {
public:
    virtual ~Prompt() = default;

    virtual const PromptDefinition& definition() const = 0;
    virtual GetPromptResult validate_and_render(const nlohmann::json& arguments) = 0;

    const std::string& name() const { return definition().name; }
};

// ---------- Ready-made implementations ----------

using ToolFunction = std::function<CallToolResult(const nlohmann::json& arguments)>;

/// Tool backed by a callable. Arguments must be an object carrying every
/// property named in the input schema's "required" list.
class FunctionTool : public Tool {
public:
    FunctionTool(ToolDefinition def, ToolFunction fn);

    const ToolDefinition& definition() const override { return def_; }
    CallToolResult validate_and_call(const nlohmann::json& arguments) override;

private:
    ToolDefinition def_;
    ToolFunction fn_;
};

/// In-memory resource. Thread-safe: content may be replaced while readers run.
class TextResource : public Resource {
public:
    TextResource(ResourceDefinition def, std::string content, bool binary = false);

    const ResourceDefinition& definition() const override { return def_; }
    bool binary() const override { return binary_; }
    std::string content() const override;
    void set_content(std::string content) override;

private:
    ResourceDefinition def_;
    bool binary_;
    mutable std::mutex mutex_;
    std::string content_;
};

using PromptFunction = std::function<std::vector<PromptMessage>(const nlohmann::json& arguments)>;

/// Prompt backed by a callable. Required arguments are checked before the
/// call, and every rendered message must use the "user" or "assistant" role.
class FunctionPrompt : public Prompt {
public:
    FunctionPrompt(PromptDefinition def, PromptFunction fn);

    const PromptDefinition& definition() const override { return def_; }
    GetPromptResult validate_and_render(const nlohmann::json& arguments) override;

private:
    PromptDefinition def_;
    PromptFunction fn_;
};

/// Convenience: a text message for FunctionPrompt renderers.
PromptMessage text_message(std::string role, std::string text);

} // namespace mcpserve
