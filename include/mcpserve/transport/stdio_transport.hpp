#pragma once
#include "transport.hpp"
#include "../codec.hpp"
#include "../framing.hpp"
#include <atomic>
#include <mutex>

namespace mcpserve {

/// StdioTransport reads newline-delimited JSON from stdin and writes one
/// message per line to stdout.
///
/// A single loop reads, dispatches and writes. shutdown() is observed
/// between messages and also wakes a read that is blocked in poll().
/// Out-of-band pushes from other threads share a write lock with replies,
/// so lines are never interleaved.
class StdioTransport : public ITransport {
public:
    struct Options {
        size_t max_message_size = LineFramer::DEFAULT_MAX_MESSAGE_SIZE;
    };

    /// Create transport using system stdin/stdout.
    StdioTransport();
    explicit StdioTransport(Options opts);

    /// Create transport using specified file descriptors (for testing).
    /// The descriptors stay owned by the caller.
    StdioTransport(int read_fd, int write_fd);
    StdioTransport(int read_fd, int write_fd, Options opts);

    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    void start(MessageHandler on_message, DisconnectHandler on_disconnect = nullptr) override;
    void send(const JsonRpcMessage& msg) override;
    void shutdown() override;
    bool is_connected() const override;

private:
    bool write_line(std::string line);
    void send_error(int code, const std::string& message);

    int read_fd_;
    int write_fd_;
    Options opts_;

    std::atomic<bool> running_{false};
    std::atomic<bool> connected_{false};
    std::atomic<bool> shutdown_requested_{false};

    std::mutex write_mutex_;

    int wakeup_pipe_[2]{-1, -1};  // pipe for waking up the reader
};

} // namespace mcpserve
