#pragma once
#include "transport.hpp"
#include "auth_gate.hpp"
#include "http_endpoint.hpp"
#include "../codec.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Forward declarations to avoid including heavy httplib header
namespace httplib {
    class Server;
}

namespace mcpserve {

/// One open push stream.
///
/// The worker thread serving the stream is the only writer to its socket.
/// Everyone else hands it frames through push(); each frame is written and
/// flushed on its own as soon as the writer wakes.
class HttpConnection {
public:
    explicit HttpConnection(std::string id);

    const std::string& id() const { return id_; }

    /// Queue a complete SSE frame. Returns false once the connection is closed.
    bool push(std::string frame);

    /// Move queued frames into `out`, waiting up to `timeout` for the first
    /// one. Returns false when the connection is closed. An empty `out`
    /// after a true return means the wait timed out.
    bool wait_frames(std::deque<std::string>& out, std::chrono::milliseconds timeout);

    void close();
    bool closed() const;

private:
    const std::string id_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> outbox_;
    bool closed_ = false;
};

/// HTTP transport: `POST <mcp_path>/messages` carries one message and gets
/// the reply in the response body; `GET <mcp_path>/sse` opens a push stream
/// that carries every out-of-band message. Requests outside the MCP prefix
/// are handed to the wrapped host application.
class HttpServerTransport : public ITransport {
public:
    struct Options {
        std::string host = "127.0.0.1";
        uint16_t port = 8080;   ///< 0 binds an ephemeral port; see port()
        std::string mcp_path = "/mcp";
        std::vector<std::string> allowed_origins;
        std::chrono::milliseconds keepalive_interval{std::chrono::seconds(30)};
        size_t worker_threads = 16;
        AuthOptions auth;
        HttpHandler app;        ///< host application for non-MCP paths
    };

    explicit HttpServerTransport(Options opts);
    ~HttpServerTransport() override;

    HttpServerTransport(const HttpServerTransport&) = delete;
    HttpServerTransport& operator=(const HttpServerTransport&) = delete;

    /// Bind and serve. Blocks until shutdown().
    void start(MessageHandler on_message, DisconnectHandler on_disconnect = nullptr) override;

    /// Broadcast to every open push stream.
    void send(const JsonRpcMessage& msg) override;

    /// Push to one stream. The empty id broadcasts.
    bool send_to(const SubscriberId& to, const JsonRpcMessage& msg) override;

    void shutdown() override;
    bool is_connected() const override;

    /// Install the handlers without listening. start() does this itself;
    /// embedders that route requests to accept() on their own call it directly.
    void attach(MessageHandler on_message, DisconnectHandler on_disconnect = nullptr);

    /// Single entry point: auth gate, then the MCP endpoints.
    HttpOutcome accept(const httplib::Request& req, httplib::Response& res);

    /// Block until the listener is accepting or `timeout` elapses.
    bool wait_until_ready(std::chrono::milliseconds timeout = std::chrono::seconds(5)) const;

    /// Bound port; differs from Options::port when that was 0.
    uint16_t port() const { return bound_port_.load(); }

    const Options& options() const { return opts_; }

    size_t connection_count() const;

private:
    class ConnectionLease;

    HttpOutcome route(const httplib::Request& req, httplib::Response& res);
    void handle_post(const httplib::Request& req, httplib::Response& res);
    void open_stream(httplib::Response& res);

    bool validate_origin(const std::string& origin) const;
    void setup_routes();

    std::shared_ptr<HttpConnection> register_connection();
    void release_connection(const std::string& id);
    std::shared_ptr<HttpConnection> find_connection(const std::string& id) const;
    void close_all_connections();

    Options opts_;
    AuthGate gate_;
    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<uint16_t> bound_port_{0};

    mutable std::mutex connections_mutex_;
    std::map<std::string, std::shared_ptr<HttpConnection>> connections_;

    MessageHandler message_handler_;
    DisconnectHandler disconnect_handler_;
};

} // namespace mcpserve
