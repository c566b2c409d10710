/// HTTP server: the MCP endpoints under /mcp next to a small host application.
/// Usage: ./http_server [port]
/// Set MCPSERVE_TOKEN to require "Authorization: Bearer <token>" on every
/// request except /health.

#include <mcpserve/mcpserve.hpp>
#include <httplib.h>
#include <pthread.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <string>
#include <thread>

namespace {

std::string now_string() {
    std::time_t t = std::time(nullptr);
    char buf[64];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", std::gmtime(&t));
    return buf;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    // Handle SIGINT/SIGTERM on a dedicated thread; every other thread
    // inherits the blocked mask.
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    mcpserve::McpServer::Options opts;
    opts.server_info = {"http-server", "1.0.0"};
    mcpserve::McpServer server{std::move(opts)};

    mcpserve::TextResource clock{
        mcpserve::ResourceDefinition{"clock://now", "Clock", "Current UTC time, updated every second", "text/plain"},
        now_string()};
    server.add_resource(clock);

    mcpserve::FunctionTool echo{
        mcpserve::ToolDefinition{"echo", "Echo the input text", nlohmann::json{
            {"type", "object"},
            {"properties", {{"text", {{"type", "string"}}}}},
            {"required", {"text"}}
        }},
        [](const nlohmann::json& args) {
            mcpserve::CallToolResult result;
            result.content.push_back(mcpserve::TextContent{args.at("text").get<std::string>()});
            return result;
        }};
    server.add_tool(echo);

    mcpserve::HttpServerTransport::Options http;
    http.host = "127.0.0.1";
    http.port = argc > 1 ? static_cast<uint16_t>(std::stoi(argv[1])) : 8080;
    http.allowed_origins = {"http://localhost", "http://127.0.0.1"};
    if (const char* token = std::getenv("MCPSERVE_TOKEN")) {
        http.auth.token = token;
        http.auth.exempt_paths = {"/health"};
    }
    http.app = [](const httplib::Request& req, httplib::Response& res) {
        if (req.path == "/health") {
            res.set_content(R"({"status":"ok"})", "application/json");
            return;
        }
        res.status = 404;
        res.set_content("Not found", "text/plain");
    };

    std::atomic<bool> done{false};

    std::thread ticker([&] {
        while (!done) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
            server.update_resource("clock://now", now_string());
        }
    });

    std::thread signal_waiter([&] {
        int sig = 0;
        sigwait(&signals, &sig);
        MCPSERVE_INFO("Received signal {}, shutting down", sig);
        server.shutdown();
    });

    int status = 0;
    try {
        server.serve_http(std::move(http));
    } catch (const mcpserve::McpTransportError& e) {
        MCPSERVE_ERROR("{}", e.what());
        status = 1;
    }

    done = true;
    ticker.join();
    if (status != 0) {
        // The waiter is still parked in sigwait(); wake it.
        pthread_kill(signal_waiter.native_handle(), SIGTERM);
    }
    signal_waiter.join();
    return status;
}
