#include "mcpserve/router.hpp"
#include "mcpserve/error.hpp"
#include "mcpserve/logger.hpp"
#include <stdexcept>

namespace mcpserve {

namespace {

std::string id_to_string(const std::optional<RequestId>& id) {
    if (!id) return "null";
    if (const auto* i = std::get_if<int64_t>(&*id)) return std::to_string(*i);
    return "\"" + std::get<std::string>(*id) + "\"";
}

} // anonymous namespace

void Router::on_request(const std::string& method, RequestHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    request_handlers_[method] = std::move(handler);
}

void Router::on_notification(const std::string& method, NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    notification_handlers_[method] = std::move(handler);
}

bool Router::has_handler(const std::string& method) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return request_handlers_.count(method) > 0 || notification_handlers_.count(method) > 0;
}

std::optional<JsonRpcMessage> Router::dispatch(const JsonRpcMessage& msg,
                                               const SubscriberId& subscriber) {
    if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
        RequestHandler handler;
        RequestContext ctx{req->id, subscriber};
        const std::string& method = req->method;
        nlohmann::json params = req->params ? *req->params : nlohmann::json::object();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = request_handlers_.find(method);
            if (it == request_handlers_.end()) {
                return make_error(req->id, error::MethodNotFound, "Method not found: " + method);
            }
            handler = it->second;
        }
        // Call handler WITHOUT holding the lock so handlers may register
        // further methods.
        try {
            auto result = handler(params, ctx);

            if (auto* ok = std::get_if<nlohmann::json>(&result)) {
                return make_result(req->id, std::move(*ok));
            }
            if (auto* err = std::get_if<JsonRpcError>(&result)) {
                JsonRpcResponse resp;
                resp.id = req->id;
                resp.error = std::move(*err);
                return resp;
            }
            return std::nullopt;
        } catch (const McpProtocolError& e) {
            return make_error(req->id, e.code, e.what());
        } catch (const std::exception& e) {
            MCPSERVE_ERROR("Error handling request {} (id {}): {}", method,
                           id_to_string(req->id), e.what());
            return make_error(req->id, error::InvalidRequest,
                              std::string("Internal error: ") + e.what());
        }
    } else if (const auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
        NotificationHandler handler;
        nlohmann::json params = notif->params ? *notif->params : nlohmann::json::object();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = notification_handlers_.find(notif->method);
            if (it == notification_handlers_.end()) {
                MCPSERVE_DEBUG("Ignoring notification {}", notif->method);
                return std::nullopt;
            }
            handler = it->second;
        }
        try {
            handler(params, RequestContext{std::nullopt, subscriber});
        } catch (const std::exception& e) {
            // Notifications never get a response, so the failure is only logged.
            MCPSERVE_ERROR("Error handling notification {}: {}", notif->method, e.what());
        }
        return std::nullopt;
    } else if (const auto* resp = std::get_if<JsonRpcResponse>(&msg)) {
        // This server never issues requests, so a response has nothing to answer.
        return make_error(resp->id, error::InvalidRequest, "Invalid Request");
    }

    return std::nullopt;
}

} // namespace mcpserve
