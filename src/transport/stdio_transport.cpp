#include "mcpserve/transport/stdio_transport.hpp"
#include "mcpserve/error.hpp"
#include "mcpserve/logger.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace mcpserve {

StdioTransport::StdioTransport()
    : StdioTransport(STDIN_FILENO, STDOUT_FILENO, Options{}) {
}

StdioTransport::StdioTransport(Options opts)
    : StdioTransport(STDIN_FILENO, STDOUT_FILENO, std::move(opts)) {
}

StdioTransport::StdioTransport(int read_fd, int write_fd)
    : StdioTransport(read_fd, write_fd, Options{}) {
}

StdioTransport::StdioTransport(int read_fd, int write_fd, Options opts)
    : read_fd_(read_fd), write_fd_(write_fd), opts_(std::move(opts)) {
    if (::pipe(wakeup_pipe_) < 0) {
        throw McpTransportError(std::string("Failed to create wakeup pipe: ") + std::strerror(errno));
    }
    // Set non-blocking on write end of wakeup pipe
    int flags = ::fcntl(wakeup_pipe_[1], F_GETFL, 0);
    ::fcntl(wakeup_pipe_[1], F_SETFL, flags | O_NONBLOCK);
}

StdioTransport::~StdioTransport() {
    shutdown();
    if (wakeup_pipe_[0] >= 0) ::close(wakeup_pipe_[0]);
    if (wakeup_pipe_[1] >= 0) ::close(wakeup_pipe_[1]);
}

void StdioTransport::start(MessageHandler on_message, DisconnectHandler on_disconnect) {
    if (running_.exchange(true)) {
        return; // already running
    }
    // shutdown() before start(): return without reading.
    if (shutdown_requested_.load()) {
        running_ = false;
        return;
    }
    connected_ = true;
    MCPSERVE_INFO("Starting stdio transport");

    LineReader reader(read_fd_, opts_.max_message_size, wakeup_pipe_[0]);
    auto on_overflow = [this](size_t) {
        send_error(error::MessageTooLarge, "Message too large");
    };

    while (running_) {
        auto line = reader.next(on_overflow);
        if (!line) break;

        try {
            auto reply = on_message(*line, SubscriberId{});
            if (reply) send(*reply);
        } catch (const McpParseError& e) {
            MCPSERVE_ERROR("JSON parsing error: {}", e.what());
            send_error(error::ParseError, "Parse error: Invalid JSON");
        } catch (const McpTransportError& e) {
            MCPSERVE_ERROR("Stdio transport failed: {}", e.what());
            break;
        } catch (const std::exception& e) {
            MCPSERVE_ERROR("Error processing message: {}", e.what());
            send_error(error::ServerError, std::string("Internal error: ") + e.what());
        }
    }

    if (reader.eof()) {
        MCPSERVE_INFO("Stdio input closed");
    }
    connected_ = false;
    running_ = false;
    if (on_disconnect) on_disconnect(SubscriberId{});
    MCPSERVE_INFO("Stopped stdio transport");
}

bool StdioTransport::write_line(std::string line) {
    line += '\n';
    const char* data = line.data();
    size_t remaining = line.size();

    std::lock_guard<std::mutex> lock(write_mutex_);
    while (remaining > 0) {
        ssize_t written = ::write(write_fd_, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }
    return true;
}

void StdioTransport::send_error(int code, const std::string& message) {
    if (!write_line(Codec::serialize(make_error(std::nullopt, code, message)))) {
        MCPSERVE_ERROR("Failed to write error response: {}", std::strerror(errno));
        connected_ = false;
    }
}

void StdioTransport::send(const JsonRpcMessage& msg) {
    if (shutdown_requested_.load()) {
        throw McpTransportError("Transport shut down");
    }
    if (!write_line(Codec::serialize(msg))) {
        connected_ = false;
        throw McpTransportError(std::string("Write error: ") + std::strerror(errno));
    }
}

void StdioTransport::shutdown() {
    if (shutdown_requested_.exchange(true)) return;
    MCPSERVE_INFO("Stopping stdio transport");
    running_ = false;
    // Write to wakeup pipe to interrupt poll() in the reader.
    if (wakeup_pipe_[1] >= 0) {
        char b = 1;
        if (::write(wakeup_pipe_[1], &b, 1) < 0 && errno != EAGAIN) {
            MCPSERVE_WARN("Failed to wake stdio reader: {}", std::strerror(errno));
        }
    }
}

bool StdioTransport::is_connected() const {
    return connected_;
}

} // namespace mcpserve
