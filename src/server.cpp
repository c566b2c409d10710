#include "mcpserve/server.hpp"
#include "mcpserve/base64.hpp"
#include "mcpserve/codec.hpp"
#include "mcpserve/error.hpp"
#include "mcpserve/logger.hpp"
#include "mcpserve/router.hpp"
#include "mcpserve/session.hpp"
#include "mcpserve/version.hpp"
#include "mcpserve/transport/stdio_transport.hpp"

#include <algorithm>
#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace mcpserve {

namespace {

/// `params[key]` when params is an object holding a non-null `key`.
const nlohmann::json* find_member(const nlohmann::json& params, const char* key) {
    if (!params.is_object()) return nullptr;
    auto it = params.find(key);
    if (it == params.end() || it->is_null()) return nullptr;
    return &*it;
}

std::optional<std::string> string_member(const nlohmann::json& params, const char* key) {
    const auto* value = find_member(params, key);
    if (!value || !value->is_string()) return std::nullopt;
    return value->get<std::string>();
}

nlohmann::json arguments_of(const nlohmann::json& params) {
    const auto* args = find_member(params, "arguments");
    return args ? *args : nlohmann::json::object();
}

JsonRpcError invalid_params(std::string message) {
    return JsonRpcError{error::InvalidParams, std::move(message), std::nullopt};
}

nlohmann::json tool_error_result(const std::string& message) {
    CallToolResult result;
    result.is_error = true;
    result.content.push_back(TextContent{"Error: " + message});
    nlohmann::json j;
    to_json(j, result);
    return j;
}

template <typename T, typename Key>
T* find_by(std::vector<T*>& items, const Key& key, const std::string& value) {
    auto it = std::find_if(items.begin(), items.end(),
                           [&](T* item) { return key(*item) == value; });
    return it == items.end() ? nullptr : *it;
}

template <typename T, typename Key>
bool upsert(std::vector<T*>& items, T& item, const Key& key) {
    for (auto& existing : items) {
        if (key(*existing) == key(item)) {
            existing = &item;
            return false;
        }
    }
    items.push_back(&item);
    return true;
}

template <typename T, typename Key>
T* erase_by(std::vector<T*>& items, const Key& key, const std::string& value) {
    auto it = std::find_if(items.begin(), items.end(),
                           [&](T* item) { return key(*item) == value; });
    if (it == items.end()) return nullptr;
    T* removed = *it;
    items.erase(it);
    return removed;
}

std::string join_names(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& n : names) {
        if (!out.empty()) out += ", ";
        out += n;
    }
    return out;
}

const auto tool_key = [](const Tool& t) -> const std::string& { return t.name(); };
const auto resource_key = [](const Resource& r) -> const std::string& { return r.uri(); };
const auto prompt_key = [](const Prompt& p) -> const std::string& { return p.name(); };

} // anonymous namespace

// ----------- McpServer::Impl -----------

struct McpServer::Impl {
    Options opts;
    nlohmann::json capabilities;
    Router router;

    // Registries, session and callbacks. One coarse lock.
    mutable std::mutex mutex;
    Session session;
    std::vector<Tool*> tools;
    std::vector<Resource*> resources;
    std::vector<Prompt*> prompts;
    std::map<size_t, ResourceUpdateCallback> update_callbacks;
    size_t next_callback_id{1};

    // Transport reference for sending outbound messages
    ITransport* transport{nullptr};
    std::mutex transport_mutex;

    std::atomic<bool> running{false};

    explicit Impl(Options o) : opts(std::move(o)) {
        capabilities = default_server_capabilities();
        if (opts.capabilities.is_object()) {
            for (const auto& [key, value] : opts.capabilities.items()) {
                capabilities[key] = value;
            }
        }
    }

    // ---- Outbound ----

    /// Push a list-changed style notification on the default channel.
    void broadcast(const std::string& method) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!session.initialized()) return;
        }
        JsonRpcNotification notif{method, nlohmann::json::object()};
        std::lock_guard<std::mutex> lock(transport_mutex);
        if (!transport) return;
        try {
            transport->send(notif);
        } catch (const std::exception& e) {
            MCPSERVE_ERROR("Failed to send {}: {}", method, e.what());
        }
    }

    /// Deliver `notif` to each subscriber. A subscriber that cannot be
    /// reached loses all of its subscriptions.
    void notify_subscribers(const std::vector<SubscriberId>& subscribers,
                            const JsonRpcNotification& notif) {
        std::vector<SubscriberId> unreachable;
        {
            std::lock_guard<std::mutex> lock(transport_mutex);
            if (!transport) return;
            for (const auto& subscriber : subscribers) {
                try {
                    if (!transport->send_to(subscriber, notif)) {
                        unreachable.push_back(subscriber);
                    }
                } catch (const std::exception& e) {
                    MCPSERVE_ERROR("Failed to send {}: {}", notif.method, e.what());
                    unreachable.push_back(subscriber);
                }
            }
        }
        if (unreachable.empty()) return;
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& subscriber : unreachable) {
            auto dropped = session.subscriptions().drop_subscriber(subscriber);
            MCPSERVE_INFO("Dropped {} subscription(s) of unreachable subscriber '{}'",
                          dropped.size(), subscriber);
        }
    }

    // ---- Method table ----

    void setup_handlers() {
        router.on_request("ping", [](const nlohmann::json&, const RequestContext&) -> HandlerResult {
            return nlohmann::json::object();
        });

        router.on_request("initialize", [this](const nlohmann::json& params,
                                                const RequestContext&) -> HandlerResult {
            InitializeResult result;
            {
                std::lock_guard<std::mutex> lock(mutex);
                session.record_client(params);
                const auto& client = session.client_info();
                MCPSERVE_INFO("Client connected: {} v{}",
                              client ? client->name : "unknown",
                              client ? client->version : "unknown");
                result.protocol_version = std::string(PROTOCOL_VERSION);
                result.capabilities = capabilities;
                result.server_info = opts.server_info;
            }
            nlohmann::json j;
            to_json(j, result);
            return j;
        });

        router.on_notification("notifications/initialized",
                               [this](const nlohmann::json&, const RequestContext&) {
            std::lock_guard<std::mutex> lock(mutex);
            if (session.mark_initialized()) {
                MCPSERVE_INFO("Client initialized, beginning normal operation");
            }
        });

        router.on_request("tools/list", [this](const nlohmann::json&,
                                                const RequestContext&) -> HandlerResult {
            std::lock_guard<std::mutex> lock(mutex);
            nlohmann::json list = nlohmann::json::array();
            for (const auto* tool : tools) {
                nlohmann::json j;
                to_json(j, tool->definition());
                list.push_back(std::move(j));
            }
            return nlohmann::json{{"tools", list}};
        });

        router.on_request("tools/call", [this](const nlohmann::json& params,
                                                const RequestContext&) -> HandlerResult {
            auto name = string_member(params, "name");
            if (!name) return invalid_params("Invalid params: missing tool name");

            Tool* tool = nullptr;
            {
                std::lock_guard<std::mutex> lock(mutex);
                tool = find_by(tools, tool_key, *name);
            }
            if (!tool) return invalid_params("Tool not found: " + *name);

            // Run the tool without the lock so a slow call does not stall
            // other connections.
            try {
                nlohmann::json j;
                to_json(j, tool->validate_and_call(arguments_of(params)));
                return j;
            } catch (const McpInvalidArgumentsError& e) {
                MCPSERVE_ERROR("Invalid arguments for tool {}: {}", *name, e.what());
                return tool_error_result(e.what());
            } catch (const std::exception& e) {
                MCPSERVE_ERROR("Error calling tool {}: {}", *name, e.what());
                return tool_error_result(e.what());
            }
        });

        router.on_request("resources/list", [this](const nlohmann::json&,
                                                    const RequestContext&) -> HandlerResult {
            std::lock_guard<std::mutex> lock(mutex);
            nlohmann::json list = nlohmann::json::array();
            for (const auto* resource : resources) {
                nlohmann::json j;
                to_json(j, resource->definition());
                list.push_back(std::move(j));
            }
            return nlohmann::json{{"resources", list}};
        });

        router.on_request("resources/read", [this](const nlohmann::json& params,
                                                    const RequestContext&) -> HandlerResult {
            auto uri = string_member(params, "uri");
            if (!uri) return invalid_params("Invalid params: missing resource URI");

            Resource* resource = nullptr;
            {
                std::lock_guard<std::mutex> lock(mutex);
                resource = find_by(resources, resource_key, *uri);
            }
            if (!resource) return invalid_params("Resource not found: " + *uri);

            ResourceContent content;
            content.uri = *uri;
            content.mime_type = resource->definition().mime_type;
            try {
                if (resource->binary()) {
                    content.blob = base64_encode(resource->content());
                } else {
                    content.text = resource->content();
                }
            } catch (const std::exception& e) {
                MCPSERVE_ERROR("Error reading resource {}: {}", *uri, e.what());
                return invalid_params(std::string("Error: ") + e.what());
            }
            nlohmann::json j;
            to_json(j, content);
            return nlohmann::json{{"contents", nlohmann::json::array({j})}};
        });

        router.on_request("resources/subscribe", [this](const nlohmann::json& params,
                                                         const RequestContext& ctx) -> HandlerResult {
            std::lock_guard<std::mutex> lock(mutex);
            if (!session.initialized()) return NoResponse{};

            auto uri = string_member(params, "uri");
            if (!uri) return invalid_params("Invalid params: missing resource URI");
            if (!find_by(resources, resource_key, *uri)) {
                return invalid_params("Resource not found: " + *uri);
            }
            if (session.subscriptions().subscribe(*uri, ctx.subscriber)) {
                MCPSERVE_DEBUG("Subscriber '{}' subscribed to {}", ctx.subscriber, *uri);
            }
            return nlohmann::json{{"subscribed", true}};
        });

        router.on_request("resources/unsubscribe", [this](const nlohmann::json& params,
                                                           const RequestContext& ctx) -> HandlerResult {
            std::lock_guard<std::mutex> lock(mutex);
            if (!session.initialized()) return NoResponse{};

            auto uri = string_member(params, "uri");
            if (!uri) return invalid_params("Invalid params: missing resource URI");
            if (!find_by(resources, resource_key, *uri)) {
                return invalid_params("Resource not found: " + *uri);
            }
            session.subscriptions().unsubscribe(*uri, ctx.subscriber);
            return nlohmann::json{{"unsubscribed", true}};
        });

        router.on_request("prompts/list", [this](const nlohmann::json&,
                                                  const RequestContext&) -> HandlerResult {
            std::lock_guard<std::mutex> lock(mutex);
            nlohmann::json list = nlohmann::json::array();
            for (const auto* prompt : prompts) {
                nlohmann::json j;
                to_json(j, prompt->definition());
                list.push_back(std::move(j));
            }
            return nlohmann::json{{"prompts", list}};
        });

        router.on_request("prompts/get", [this](const nlohmann::json& params,
                                                 const RequestContext&) -> HandlerResult {
            auto name = string_member(params, "name");
            if (!name) return invalid_params("Invalid params: missing prompt name");

            Prompt* prompt = nullptr;
            {
                std::lock_guard<std::mutex> lock(mutex);
                prompt = find_by(prompts, prompt_key, *name);
            }
            if (!prompt) return invalid_params("Prompt not found: " + *name);

            try {
                nlohmann::json j;
                to_json(j, prompt->validate_and_render(arguments_of(params)));
                return j;
            } catch (const std::exception& e) {
                MCPSERVE_ERROR("Error getting prompt {}: {}", *name, e.what());
                return invalid_params(std::string("Error: ") + e.what());
            }
        });
    }

    void log_startup() {
        std::vector<std::string> tool_names, resource_uris, prompt_names;
        {
            std::lock_guard<std::mutex> lock(mutex);
            for (const auto* t : tools) tool_names.push_back(t->name());
            for (const auto* r : resources) resource_uris.push_back(r->uri());
            for (const auto* p : prompts) prompt_names.push_back(p->name());
        }
        MCPSERVE_INFO("Starting MCP server: {} v{}", opts.server_info.name, opts.server_info.version);
        MCPSERVE_INFO("Available tools: {}", join_names(tool_names));
        MCPSERVE_INFO("Available resources: {}", join_names(resource_uris));
        MCPSERVE_INFO("Available prompts: {}", join_names(prompt_names));
    }
};

// ----------- McpServer -----------

McpServer::McpServer(Options opts)
    : impl_(std::make_unique<Impl>(std::move(opts))) {
    impl_->setup_handlers();
}

McpServer::~McpServer() = default;

void McpServer::add_tool(Tool& tool) {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        upsert(impl_->tools, tool, tool_key);
    }
    MCPSERVE_INFO("Registered tool: {}", tool.name());
    impl_->broadcast("notifications/tools/list_changed");
}

bool McpServer::remove_tool(const std::string& name) {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (!erase_by(impl_->tools, tool_key, name)) return false;
    }
    MCPSERVE_INFO("Removed tool: {}", name);
    impl_->broadcast("notifications/tools/list_changed");
    return true;
}

void McpServer::add_resource(Resource& resource) {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        upsert(impl_->resources, resource, resource_key);
    }
    MCPSERVE_INFO("Registered resource: {} ({})", resource.definition().name, resource.uri());
    impl_->broadcast("notifications/resources/listChanged");
}

bool McpServer::remove_resource(const std::string& uri) {
    std::string name;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        auto* removed = erase_by(impl_->resources, resource_key, uri);
        if (!removed) return false;
        name = removed->definition().name;
        impl_->session.subscriptions().drop_uri(uri);
    }
    MCPSERVE_INFO("Removed resource: {} ({})", name, uri);
    impl_->broadcast("notifications/resources/listChanged");
    return true;
}

bool McpServer::update_resource(const std::string& uri, std::string content) {
    Resource* resource = nullptr;
    std::vector<SubscriberId> subscribers;
    std::vector<ResourceUpdateCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        resource = find_by(impl_->resources, resource_key, uri);
        if (!resource) return false;
        resource->set_content(content);
        // No replay: updates made before the handshake completes are not
        // announced later.
        if (impl_->session.initialized()) {
            subscribers = impl_->session.subscriptions().subscribers(uri);
        }
        for (const auto& [id, cb] : impl_->update_callbacks) callbacks.push_back(cb);
    }

    const auto& def = resource->definition();
    if (!subscribers.empty()) {
        nlohmann::json params = {{"uri", uri}, {"name", def.name}, {"mimeType", nullptr}};
        if (def.mime_type) params["mimeType"] = *def.mime_type;
        impl_->notify_subscribers(subscribers,
                                  JsonRpcNotification{"notifications/resources/updated", params});
    }

    ResourceUpdate update{uri, def.name, def.mime_type, std::move(content)};
    for (const auto& cb : callbacks) {
        try {
            cb(update);
        } catch (const std::exception& e) {
            MCPSERVE_ERROR("Resource update callback failed for {}: {}", uri, e.what());
        }
    }
    return true;
}

Resource& McpServer::read_resource(const std::string& uri) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto* resource = find_by(impl_->resources, resource_key, uri);
    if (!resource) throw McpError("Resource not found: " + uri);
    return *resource;
}

size_t McpServer::on_resource_update(ResourceUpdateCallback callback) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    size_t id = impl_->next_callback_id++;
    impl_->update_callbacks[id] = std::move(callback);
    return id;
}

bool McpServer::remove_resource_update_callback(size_t id) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->update_callbacks.erase(id) > 0;
}

void McpServer::add_prompt(Prompt& prompt) {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        upsert(impl_->prompts, prompt, prompt_key);
    }
    MCPSERVE_INFO("Registered prompt: {}", prompt.name());
    impl_->broadcast("notifications/prompts/list_changed");
}

bool McpServer::remove_prompt(const std::string& name) {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (!erase_by(impl_->prompts, prompt_key, name)) return false;
    }
    MCPSERVE_INFO("Removed prompt: {}", name);
    impl_->broadcast("notifications/prompts/list_changed");
    return true;
}

std::optional<JsonRpcMessage> McpServer::handle(std::string_view raw, const SubscriberId& from) {
    nlohmann::json doc;
    try {
        doc = Codec::parse_json(raw);
    } catch (const McpParseError& e) {
        MCPSERVE_DEBUG("Unparsable message: {}", e.what());
        return make_error(std::nullopt, error::InvalidRequest, "Invalid Request");
    }

    JsonRpcMessage msg;
    try {
        msg = Codec::to_message(doc);
    } catch (const McpProtocolError& e) {
        return make_error(Codec::extract_id(doc), e.code, e.what());
    }
    return impl_->router.dispatch(msg, from);
}

std::optional<std::string> McpServer::handle_json(std::string_view raw, const SubscriberId& from) {
    auto reply = handle(raw, from);
    if (!reply) return std::nullopt;
    return Codec::serialize(*reply);
}

void McpServer::subscriber_gone(const SubscriberId& who) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto dropped = impl_->session.subscriptions().drop_subscriber(who);
    if (!dropped.empty()) {
        MCPSERVE_INFO("Dropped {} subscription(s) of disconnected subscriber '{}'",
                      dropped.size(), who);
    }
}

bool McpServer::initialized() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->session.initialized();
}

nlohmann::json McpServer::capabilities() const {
    return impl_->capabilities;
}

void McpServer::attach(ITransport& transport) {
    std::lock_guard<std::mutex> lock(impl_->transport_mutex);
    impl_->transport = &transport;
}

void McpServer::detach() {
    std::lock_guard<std::mutex> lock(impl_->transport_mutex);
    impl_->transport = nullptr;
}

void McpServer::serve(std::unique_ptr<ITransport> transport) {
    impl_->log_startup();
    attach(*transport);
    impl_->running = true;
    try {
        transport->start(
            [this](std::string_view raw, const SubscriberId& from) { return handle(raw, from); },
            [this](const SubscriberId& who) { subscriber_gone(who); });
    } catch (...) {
        impl_->running = false;
        detach();
        throw;
    }
    impl_->running = false;
    detach();
}

void McpServer::serve_stdio() {
    serve(std::make_unique<StdioTransport>());
}

void McpServer::serve_http(HttpServerTransport::Options opts) {
    serve(std::make_unique<HttpServerTransport>(std::move(opts)));
}

void McpServer::shutdown() {
    impl_->running = false;
    std::lock_guard<std::mutex> lock(impl_->transport_mutex);
    if (impl_->transport) {
        impl_->transport->shutdown();
    }
}

bool McpServer::is_running() const {
    return impl_->running;
}

} // namespace mcpserve
