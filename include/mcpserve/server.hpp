#pragma once
#include "capability.hpp"
#include "json_rpc.hpp"
#include "types.hpp"
#include "version.hpp"
#include "transport/transport.hpp"
#include "transport/http_transport.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mcpserve {

/// Passed to resource update callbacks after update_resource() succeeds.
struct ResourceUpdate {
    std::string uri;
    std::string name;
    std::optional<std::string> mime_type;
    std::string content;
};

using ResourceUpdateCallback = std::function<void(const ResourceUpdate& update)>;

/// Protocol dispatcher shared by every transport.
///
/// Holds the capability registries, the session state machine and the
/// subscription table behind one lock. Capabilities are registered by
/// reference and must outlive the server (or their removal).
class McpServer {
public:
    struct Options {
        Implementation server_info{"mcpserve", std::string(LIBRARY_VERSION)};
        /// Shallow-merged over default_server_capabilities().
        nlohmann::json capabilities = nlohmann::json::object();
    };

    explicit McpServer(Options opts);
    ~McpServer();

    // Non-copyable, non-movable
    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    // ---- Tool registration ----
    void add_tool(Tool& tool);
    bool remove_tool(const std::string& name);

    // ---- Resource registration ----
    void add_resource(Resource& resource);
    bool remove_resource(const std::string& uri);

    /// Replace a resource's content, notify its subscribers and run the
    /// update callbacks. Returns false for an unknown uri.
    bool update_resource(const std::string& uri, std::string content);

    /// Direct access for the host. Throws McpError for an unknown uri.
    Resource& read_resource(const std::string& uri);

    size_t on_resource_update(ResourceUpdateCallback callback);
    bool remove_resource_update_callback(size_t id);

    // ---- Prompt registration ----
    void add_prompt(Prompt& prompt);
    bool remove_prompt(const std::string& name);

    // ---- Dispatch ----

    /// Decode and dispatch one raw message from `from`. Never throws;
    /// returns std::nullopt when nothing is to be sent back.
    std::optional<JsonRpcMessage> handle(std::string_view raw, const SubscriberId& from = {});

    /// handle(), serialized.
    std::optional<std::string> handle_json(std::string_view raw, const SubscriberId& from = {});

    /// Forget every subscription held by `who`.
    void subscriber_gone(const SubscriberId& who);

    [[nodiscard]] bool initialized() const;
    [[nodiscard]] nlohmann::json capabilities() const;

    // ---- Transport ----

    /// Use `transport` for out-of-band notifications without starting it.
    void attach(ITransport& transport);
    void detach();

    void serve_stdio();
    void serve_http(HttpServerTransport::Options opts);
    void serve(std::unique_ptr<ITransport> transport);
    void shutdown();

    bool is_running() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mcpserve
