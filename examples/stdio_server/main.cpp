/// Stdio server: tools, a resource and a prompt over newline-delimited JSON-RPC.
/// Usage: ./stdio_server
/// Diagnostics go to stderr; stdout carries protocol traffic only.

#include <mcpserve/mcpserve.hpp>
#include <string>

int main() {
    mcpserve::McpServer::Options opts;
    opts.server_info = {"stdio-server", "1.0.0"};

    mcpserve::McpServer server{std::move(opts)};

    // ---- Tools ----

    mcpserve::FunctionTool echo{
        mcpserve::ToolDefinition{"echo", "Echo the input text back to the caller", nlohmann::json{
            {"type", "object"},
            {"properties", {
                {"text", {{"type", "string"}, {"description", "The text to echo"}}}
            }},
            {"required", {"text"}}
        }},
        [](const nlohmann::json& args) {
            mcpserve::CallToolResult result;
            result.content.push_back(mcpserve::TextContent{args.at("text").get<std::string>()});
            return result;
        }};
    server.add_tool(echo);

    mcpserve::FunctionTool add{
        mcpserve::ToolDefinition{"add", "Add two numbers", nlohmann::json{
            {"type", "object"},
            {"properties", {{"a", {{"type", "number"}}}, {"b", {{"type", "number"}}}}},
            {"required", {"a", "b"}}
        }},
        [](const nlohmann::json& args) {
            double sum = args.at("a").get<double>() + args.at("b").get<double>();
            mcpserve::CallToolResult result;
            result.content.push_back(mcpserve::TextContent{nlohmann::json(sum).dump()});
            return result;
        }};
    server.add_tool(add);

    // ---- Resources ----

    mcpserve::TextResource notes{
        mcpserve::ResourceDefinition{"notes://scratch", "Scratchpad", "Notes written by the append_note tool", "text/plain"},
        ""};
    server.add_resource(notes);

    // Writing through update_resource() notifies subscribers of notes://scratch.
    mcpserve::FunctionTool append_note{
        mcpserve::ToolDefinition{"append_note", "Append a line to the scratchpad", nlohmann::json{
            {"type", "object"},
            {"properties", {{"line", {{"type", "string"}}}}},
            {"required", {"line"}}
        }},
        [&server, &notes](const nlohmann::json& args) {
            server.update_resource("notes://scratch",
                                   notes.content() + args.at("line").get<std::string>() + "\n");
            mcpserve::CallToolResult result;
            result.content.push_back(mcpserve::TextContent{"noted"});
            return result;
        }};
    server.add_tool(append_note);

    // ---- Prompts ----

    mcpserve::FunctionPrompt summarize{
        mcpserve::PromptDefinition{"summarize", "Summarize a piece of text", {
            {"text", "The text to summarize", true},
            {"style", "brief or detailed", false}
        }},
        [](const nlohmann::json& args) {
            std::string style = args.value("style", "brief");
            return std::vector<mcpserve::PromptMessage>{
                mcpserve::text_message("user", "Give a " + style + " summary of:\n" +
                                               args.at("text").get<std::string>())
            };
        }};
    server.add_prompt(summarize);

    // Serve over stdio; blocks until stdin closes
    server.serve_stdio();
    return 0;
}
