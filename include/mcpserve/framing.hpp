#pragma once
#include <cstddef>
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace mcpserve {

/// Splits an arbitrarily chunked byte stream into newline-delimited records.
///
/// The separator is the raw '\n' byte. JSON text never contains a literal
/// line feed inside a string, so no JSON-aware scanning is needed. A trailing
/// Surrounding whitespace (including the '\r' of CRLF) is trimmed and blank
/// records are skipped.
///
/// A record whose length (excluding the separator and a final '\r') exceeds the ceiling is
/// reported once through the overflow callback and dropped in full: bytes are
/// discarded up to and including its terminating '\n', then framing resumes.
/// The output therefore does not depend on where chunk boundaries fall.
class LineFramer {
public:
    static constexpr size_t DEFAULT_MAX_MESSAGE_SIZE = 1024 * 1024;

    using LineCallback = std::function<void(std::string line)>;
    using OverflowCallback = std::function<void(size_t limit)>;

    explicit LineFramer(size_t max_message_size = DEFAULT_MAX_MESSAGE_SIZE);

    /// Append a chunk, emitting every record it completes in order.
    void feed(std::string_view chunk, const LineCallback& on_line,
              const OverflowCallback& on_overflow = nullptr);

    /// Signal end of input. A pending record without its '\n' is discarded;
    /// returns the number of bytes dropped.
    size_t finish();

    /// Drop all state so the framer can serve a new connection.
    void reset();

    size_t buffered() const { return buffer_.size(); }
    bool discarding() const { return discarding_; }
    size_t max_message_size() const { return max_message_size_; }

private:
    void emit(std::string line, const LineCallback& on_line);

    size_t max_message_size_;
    std::string buffer_;
    bool discarding_{false};
};

/// Pull-style view over a file descriptor: next() returns one record at a
/// time, blocking in poll() while no data is available.
class LineReader {
public:
    /// `interrupt_fd` (optional, -1 for none) is polled alongside `fd`;
    /// readability on it makes next() return std::nullopt.
    LineReader(int fd, size_t max_message_size = LineFramer::DEFAULT_MAX_MESSAGE_SIZE,
               int interrupt_fd = -1);

    /// Next complete record, or std::nullopt once the source reaches EOF, fails,
    /// or is interrupted. Oversized records are reported through `on_overflow`
    /// in their place between the surrounding records.
    std::optional<std::string> next(const LineFramer::OverflowCallback& on_overflow = nullptr);

    bool eof() const { return eof_; }

private:
    struct Record {
        std::string line;
        bool overflow;
        size_t limit;
    };

    void report_overflows(const LineFramer::OverflowCallback& on_overflow);

    int fd_;
    int interrupt_fd_;
    LineFramer framer_;
    std::deque<Record> ready_;
    bool eof_{false};
};

} // namespace mcpserve
