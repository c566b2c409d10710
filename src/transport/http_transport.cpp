#include "mcpserve/transport/http_transport.hpp"
#include "mcpserve/error.hpp"
#include "mcpserve/logger.hpp"

#include <httplib.h>

#include <iomanip>
#include <random>
#include <sstream>
#include <thread>

namespace mcpserve {

namespace {

std::string generate_uuid() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;
    uint64_t a = dis(gen), b = dis(gen);
    // Format as UUID v4
    a = (a & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
    b = (b & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    oss << std::setw(8)  << (a >> 32);
    oss << "-" << std::setw(4) << ((a >> 16) & 0xFFFF);
    oss << "-" << std::setw(4) << (a & 0xFFFF);
    oss << "-" << std::setw(4) << (b >> 48);
    oss << "-" << std::setw(12) << (b & 0xFFFFFFFFFFFFull);
    return oss.str();
}

std::string data_frame(const JsonRpcMessage& msg) {
    return "data: " + Codec::serialize(msg) + "\n\n";
}

// httplib route patterns are regular expressions.
std::string regex_escape(const std::string& path) {
    static const std::string special = ".^$|()[]{}*+?\\";
    std::string out;
    for (char c : path) {
        if (special.find(c) != std::string::npos) out += '\\';
        out += c;
    }
    return out;
}

constexpr const char* KEEPALIVE_FRAME = ": keepalive\n\n";

void json_error(httplib::Response& res, int status, int code, const std::string& message,
                bool with_id = true) {
    nlohmann::json body = {{"jsonrpc", "2.0"}};
    if (with_id) body["id"] = nullptr;
    body["error"] = {{"code", code}, {"message", message}};
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

} // anonymous namespace

// ---------- HttpConnection ----------

HttpConnection::HttpConnection(std::string id) : id_(std::move(id)) {
}

bool HttpConnection::push(std::string frame) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return false;
        outbox_.push_back(std::move(frame));
    }
    cv_.notify_one();
    return true;
}

bool HttpConnection::wait_frames(std::deque<std::string>& out, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return closed_ || !outbox_.empty(); });
    if (closed_) return false;
    out.swap(outbox_);
    return true;
}

void HttpConnection::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        outbox_.clear();
    }
    cv_.notify_all();
}

bool HttpConnection::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

// ---------- ConnectionLease ----------

/// Keeps a push stream registered for exactly as long as httplib holds the
/// response that serves it.
class HttpServerTransport::ConnectionLease {
public:
    ConnectionLease(HttpServerTransport& owner, std::shared_ptr<HttpConnection> conn)
        : owner_(owner), conn_(std::move(conn)) {
    }

    ~ConnectionLease() {
        conn_->close();
        owner_.release_connection(conn_->id());
    }

    ConnectionLease(const ConnectionLease&) = delete;
    ConnectionLease& operator=(const ConnectionLease&) = delete;

    HttpConnection& connection() { return *conn_; }

private:
    HttpServerTransport& owner_;
    std::shared_ptr<HttpConnection> conn_;
};

// ---------- HttpServerTransport ----------

HttpServerTransport::HttpServerTransport(Options opts)
    : opts_(std::move(opts))
    , gate_(opts_.auth, [this](const httplib::Request& req, httplib::Response& res) {
          return route(req, res);
      })
    , server_(std::make_unique<httplib::Server>()) {
}

HttpServerTransport::~HttpServerTransport() {
    shutdown();
}

void HttpServerTransport::attach(MessageHandler on_message, DisconnectHandler on_disconnect) {
    message_handler_ = std::move(on_message);
    disconnect_handler_ = std::move(on_disconnect);
}

bool HttpServerTransport::validate_origin(const std::string& origin) const {
    if (opts_.allowed_origins.empty()) return true;
    for (const auto& allowed : opts_.allowed_origins) {
        if (origin == allowed) return true;
    }
    return false;
}

HttpOutcome HttpServerTransport::accept(const httplib::Request& req, httplib::Response& res) {
    return gate_.accept(req, res);
}

HttpOutcome HttpServerTransport::route(const httplib::Request& req, httplib::Response& res) {
    const std::string& prefix = opts_.mcp_path;
    const std::string& path = req.path;
    bool under_prefix = path == prefix ||
        (path.size() > prefix.size() && path.compare(0, prefix.size(), prefix) == 0 &&
         path[prefix.size()] == '/');
    if (!under_prefix) return HttpOutcome::PassThrough;

    // Validate Origin header for DNS rebinding protection
    auto origin = req.get_header_value("Origin");
    if (!origin.empty() && !validate_origin(origin)) {
        MCPSERVE_WARN("Rejected request from origin {}", origin);
        json_error(res, 403, error::InvalidRequest, "Invalid origin");
        return HttpOutcome::Replied;
    }

    const std::string sub = path.substr(prefix.size());
    if (sub == "/messages" && req.method == "POST") {
        handle_post(req, res);
        return HttpOutcome::Replied;
    }
    if (sub == "/sse" && req.method == "GET") {
        open_stream(res);
        return HttpOutcome::Streaming;
    }

    json_error(res, 404, error::MethodNotFound, "Endpoint not found", false);
    return HttpOutcome::Replied;
}

void HttpServerTransport::handle_post(const httplib::Request& req, httplib::Response& res) {
    SubscriberId peer;
    if (req.has_param("session_id")) {
        peer = req.get_param_value("session_id");
        if (!find_connection(peer)) {
            json_error(res, 404, error::InvalidRequest, "Session not found");
            return;
        }
    }

    if (!message_handler_) {
        json_error(res, 503, error::ServerError, "Server not ready");
        return;
    }

    try {
        auto reply = message_handler_(req.body, peer);
        if (reply) {
            res.status = 200;
            res.set_content(Codec::serialize(*reply), "application/json");
        } else {
            res.status = 202;
        }
    } catch (const McpParseError& e) {
        json_error(res, 400, error::ParseError, e.what());
    } catch (const std::exception& e) {
        MCPSERVE_ERROR("Error handling POST {}: {}", req.path, e.what());
        json_error(res, 500, error::ServerError, std::string("Internal error: ") + e.what());
    }
}

void HttpServerTransport::open_stream(httplib::Response& res) {
    auto lease = std::make_shared<ConnectionLease>(*this, register_connection());
    auto& conn = lease->connection();
    conn.push("event: endpoint\ndata: " + opts_.mcp_path + "/messages?session_id=" +
              conn.id() + "\n\n");

    res.status = 200;
    res.set_header("Cache-Control", "no-cache");
    res.set_chunked_content_provider("text/event-stream",
        [lease, keepalive = opts_.keepalive_interval](size_t /*offset*/,
                                                      httplib::DataSink& sink) -> bool {
            auto& stream = lease->connection();
            std::deque<std::string> frames;
            if (!stream.wait_frames(frames, keepalive)) {
                // Closed by shutdown: end the chunked body cleanly.
                sink.done();
                return true;
            }
            if (frames.empty()) frames.emplace_back(KEEPALIVE_FRAME);
            for (const auto& frame : frames) {
                if (!sink.write(frame.data(), frame.size())) {
                    MCPSERVE_INFO("Stream {} write failed; peer gone", stream.id());
                    stream.close();
                    return false;
                }
            }
            return true;
        },
        [lease](bool success) {
            MCPSERVE_DEBUG("Stream {} finished ({})", lease->connection().id(),
                           success ? "clean" : "aborted");
        });
}

std::shared_ptr<HttpConnection> HttpServerTransport::register_connection() {
    auto conn = std::make_shared<HttpConnection>(generate_uuid());
    size_t open = 0;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections_[conn->id()] = conn;
        open = connections_.size();
    }
    MCPSERVE_INFO("Stream {} opened ({} open)", conn->id(), open);
    return conn;
}

void HttpServerTransport::release_connection(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connections_.erase(id);
    }
    MCPSERVE_INFO("Stream {} closed", id);
    if (!disconnect_handler_) return;
    try {
        disconnect_handler_(id);
    } catch (const std::exception& e) {
        MCPSERVE_ERROR("Disconnect handler failed for stream {}: {}", id, e.what());
    }
}

std::shared_ptr<HttpConnection> HttpServerTransport::find_connection(const std::string& id) const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    auto it = connections_.find(id);
    return it == connections_.end() ? nullptr : it->second;
}

void HttpServerTransport::close_all_connections() {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    for (auto& [id, conn] : connections_) {
        conn->close();
    }
}

size_t HttpServerTransport::connection_count() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return connections_.size();
}

void HttpServerTransport::setup_routes() {
    server_->new_task_queue = [n = opts_.worker_threads] {
        return new httplib::ThreadPool(n);
    };

    // Route handlers run after httplib has read the request body.
    auto mcp = [this](const httplib::Request& req, httplib::Response& res) {
        accept(req, res);
    };
    const std::string prefix = regex_escape(opts_.mcp_path);
    server_->Post(prefix + "/messages", mcp);
    server_->Get(prefix + "/sse", mcp);

    // Anything else under the prefix gets the JSON-RPC 404 from route().
    const std::string under_prefix = prefix + "(/.*)?";
    server_->Get(under_prefix, mcp);
    server_->Post(under_prefix, mcp);
    server_->Put(under_prefix, mcp);
    server_->Patch(under_prefix, mcp);
    server_->Delete(under_prefix, mcp);
    server_->Options(under_prefix, mcp);

    // Everything outside the prefix belongs to the host application, still
    // behind the auth gate.
    auto fallback = [this](const httplib::Request& req, httplib::Response& res) {
        if (accept(req, res) != HttpOutcome::PassThrough) return;
        if (opts_.app) {
            opts_.app(req, res);
        } else {
            res.status = 404;
        }
    };
    server_->Get(".*", fallback);
    server_->Post(".*", fallback);
    server_->Put(".*", fallback);
    server_->Patch(".*", fallback);
    server_->Delete(".*", fallback);
    server_->Options(".*", fallback);

    server_->set_logger([](const httplib::Request& req, const httplib::Response& res) {
        MCPSERVE_DEBUG("{} {} -> {}", req.method, req.path, res.status);
    });
}

void HttpServerTransport::start(MessageHandler on_message, DisconnectHandler on_disconnect) {
    if (running_.exchange(true)) return;
    if (stop_requested_.load()) {
        running_ = false;
        return;
    }

    attach(std::move(on_message), std::move(on_disconnect));
    setup_routes();

    int port = -1;
    if (opts_.port == 0) {
        port = server_->bind_to_any_port(opts_.host);
    } else if (server_->bind_to_port(opts_.host, opts_.port)) {
        port = opts_.port;
    }
    if (port <= 0) {
        running_ = false;
        throw McpTransportError("Failed to start HTTP server on " + opts_.host + ":" +
                                std::to_string(opts_.port));
    }
    bound_port_ = static_cast<uint16_t>(port);
    MCPSERVE_INFO("HTTP transport listening on http://{}:{}{}", opts_.host, port, opts_.mcp_path);

    // Run server in blocking mode
    bool ok = server_->listen_after_bind();

    running_ = false;
    close_all_connections();
    if (!ok && !stop_requested_.load()) {
        throw McpTransportError("HTTP server on " + opts_.host + ":" + std::to_string(port) +
                                " stopped unexpectedly");
    }
    MCPSERVE_INFO("HTTP transport stopped");
}

void HttpServerTransport::send(const JsonRpcMessage& msg) {
    const std::string frame = data_frame(msg);
    std::vector<std::shared_ptr<HttpConnection>> targets;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (auto& [id, conn] : connections_) targets.push_back(conn);
    }
    if (targets.empty()) {
        MCPSERVE_DEBUG("No open streams; dropping broadcast");
        return;
    }
    for (auto& conn : targets) {
        conn->push(frame);
    }
}

bool HttpServerTransport::send_to(const SubscriberId& to, const JsonRpcMessage& msg) {
    if (to.empty()) {
        send(msg);
        return true;
    }
    auto conn = find_connection(to);
    return conn && conn->push(data_frame(msg));
}

void HttpServerTransport::shutdown() {
    if (stop_requested_.exchange(true)) return;
    MCPSERVE_INFO("Stopping HTTP transport");
    close_all_connections();
    server_->stop();
}

bool HttpServerTransport::is_connected() const {
    return running_;
}

bool HttpServerTransport::wait_until_ready(std::chrono::milliseconds timeout) const {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (bound_port_.load() != 0 && server_->is_running()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
}

} // namespace mcpserve
