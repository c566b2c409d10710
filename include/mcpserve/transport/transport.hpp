#pragma once
#include "../json_rpc.hpp"
#include "../session.hpp"
#include <functional>
#include <optional>
#include <string_view>

namespace mcpserve {

/// Called with one raw inbound message and the identity of its sender.
/// Returns the reply to deliver, if any.
using MessageHandler = std::function<std::optional<JsonRpcMessage>(std::string_view raw,
                                                                   const SubscriberId& from)>;

/// Called once when a sender's connection goes away for good.
using DisconnectHandler = std::function<void(const SubscriberId& who)>;

/// Abstract transport interface
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Start the transport. Blocks until shutdown or end of input.
    virtual void start(MessageHandler on_message,
                       DisconnectHandler on_disconnect = nullptr) = 0;

    /// Push a message on the default channel, outside any request/response
    /// pair. Throws McpTransportError if the channel is gone.
    virtual void send(const JsonRpcMessage& msg) = 0;

    /// Push a message to one subscriber. The default channel is addressed by
    /// the empty id. Returns false when `to` has no live connection.
    virtual bool send_to(const SubscriberId& to, const JsonRpcMessage& msg) {
        if (!to.empty()) return false;
        send(msg);
        return true;
    }

    /// Graceful shutdown.
    virtual void shutdown() = 0;

    /// Check if transport is connected.
    [[nodiscard]] virtual bool is_connected() const = 0;
};

} // namespace mcpserve
