#pragma once
#include "json_rpc.hpp"
#include "session.hpp"
#include <functional>
#include <optional>
#include <unordered_map>
#include <string>
#include <mutex>

namespace mcpserve {

/// Returned by a handler that deliberately sends nothing back.
struct NoResponse {};

/// Who sent the message being dispatched.
struct RequestContext {
    std::optional<RequestId> id;
    SubscriberId subscriber;
};

using HandlerResult = std::variant<nlohmann::json, JsonRpcError, NoResponse>;
using RequestHandler = std::function<HandlerResult(const nlohmann::json& params,
                                                   const RequestContext& ctx)>;
using NotificationHandler = std::function<void(const nlohmann::json& params,
                                               const RequestContext& ctx)>;

class Router {
public:
    /// Register a request handler for a method.
    void on_request(const std::string& method, RequestHandler handler);

    /// Register a notification handler.
    void on_notification(const std::string& method, NotificationHandler handler);

    /// Dispatch an incoming message. Returns response if applicable.
    ///
    /// Failures inside a handler never escape: McpProtocolError maps to its
    /// code, anything else is logged and answered with InvalidRequest.
    [[nodiscard]] std::optional<JsonRpcMessage> dispatch(const JsonRpcMessage& msg,
                                                         const SubscriberId& subscriber = {});

    [[nodiscard]] bool has_handler(const std::string& method) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, RequestHandler> request_handlers_;
    std::unordered_map<std::string, NotificationHandler> notification_handlers_;
};

} // namespace mcpserve
