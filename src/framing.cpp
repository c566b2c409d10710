#include "mcpserve/framing.hpp"
#include "mcpserve/logger.hpp"
#include <unistd.h>
#include <poll.h>
#include <cerrno>
#include <cstring>

namespace mcpserve {

LineFramer::LineFramer(size_t max_message_size)
    : max_message_size_(max_message_size) {
    buffer_.reserve(4096);
}

namespace {

bool is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\v' || c == '\f';
}

} // anonymous namespace

void LineFramer::emit(std::string line, const LineCallback& on_line) {
    // Trim surrounding whitespace, including the \r of a CRLF terminator
    size_t end = line.size();
    while (end > 0 && is_blank(line[end - 1])) --end;
    size_t begin = 0;
    while (begin < end && is_blank(line[begin])) ++begin;
    if (begin == end) return;
    line.erase(end);
    line.erase(0, begin);
    on_line(std::move(line));
}

void LineFramer::feed(std::string_view chunk, const LineCallback& on_line,
                      const OverflowCallback& on_overflow) {
    while (!chunk.empty()) {
        size_t nl = chunk.find('\n');
        std::string_view segment = chunk.substr(0, nl);
        bool complete = nl != std::string_view::npos;
        chunk = complete ? chunk.substr(nl + 1) : std::string_view{};

        if (discarding_) {
            if (complete) discarding_ = false;
            continue;
        }

        // A final \r belongs to the terminator, not the payload
        bool trailing_cr = segment.empty()
            ? (!buffer_.empty() && buffer_.back() == '\r')
            : segment.back() == '\r';
        size_t length = buffer_.size() + segment.size() - (trailing_cr ? 1 : 0);
        if (length > max_message_size_) {
            MCPSERVE_WARN("Message exceeds maximum size of {} bytes, discarding", max_message_size_);
            buffer_.clear();
            discarding_ = !complete;
            if (on_overflow) on_overflow(max_message_size_);
            continue;
        }

        buffer_.append(segment.data(), segment.size());
        if (complete) {
            std::string line;
            line.swap(buffer_);
            emit(std::move(line), on_line);
        }
    }
}

size_t LineFramer::finish() {
    size_t dropped = buffer_.size();
    if (dropped > 0) {
        MCPSERVE_DEBUG("Discarding {} bytes of unterminated input", dropped);
    }
    reset();
    return dropped;
}

void LineFramer::reset() {
    buffer_.clear();
    discarding_ = false;
}

// ---------- LineReader ----------

LineReader::LineReader(int fd, size_t max_message_size, int interrupt_fd)
    : fd_(fd), interrupt_fd_(interrupt_fd), framer_(max_message_size) {
}

// Overflows are queued between the lines around them so the caller sees
// them in wire order.
void LineReader::report_overflows(const LineFramer::OverflowCallback& on_overflow) {
    while (!ready_.empty() && ready_.front().overflow) {
        size_t limit = ready_.front().limit;
        ready_.pop_front();
        if (on_overflow) on_overflow(limit);
    }
}

std::optional<std::string> LineReader::next(const LineFramer::OverflowCallback& on_overflow) {
    char chunk[8192];

    report_overflows(on_overflow);

    while (ready_.empty()) {
        if (eof_) return std::nullopt;

        struct pollfd fds[2];
        fds[0].fd = fd_;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = interrupt_fd_;
        fds[1].events = POLLIN;
        fds[1].revents = 0;
        nfds_t nfds = interrupt_fd_ >= 0 ? 2 : 1;

        int ret = ::poll(fds, nfds, -1);
        if (ret < 0) {
            if (errno == EINTR) continue;
            MCPSERVE_ERROR("poll() failed: {}", std::strerror(errno));
            eof_ = true;
            break;
        }

        if (nfds == 2 && (fds[1].revents & POLLIN)) return std::nullopt;

        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        ssize_t n = ::read(fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            MCPSERVE_ERROR("IO error while reading: {}", std::strerror(errno));
            eof_ = true;
            break;
        }
        if (n == 0) {
            eof_ = true;
            break;
        }

        framer_.feed(std::string_view(chunk, static_cast<size_t>(n)),
                     [this](std::string line) { ready_.push_back({std::move(line), false, 0}); },
                     [this](size_t limit) { ready_.push_back({std::string(), true, limit}); });
        report_overflows(on_overflow);
    }

    if (ready_.empty()) {
        framer_.finish();
        return std::nullopt;
    }
    std::string line = std::move(ready_.front().line);
    ready_.pop_front();
    return line;
}

} // namespace mcpserve
