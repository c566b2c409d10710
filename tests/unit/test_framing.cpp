#include <gtest/gtest.h>
#include "mcpserve/framing.hpp"
#include <unistd.h>
#include <string>
#include <thread>
#include <vector>

using namespace mcpserve;

namespace {

struct Collected {
    std::vector<std::string> lines;
    size_t overflows = 0;
};

// Feed `input` in chunks of `chunk` bytes.
Collected frame(const std::string& input, size_t chunk, size_t limit = LineFramer::DEFAULT_MAX_MESSAGE_SIZE) {
    LineFramer framer(limit);
    Collected out;
    for (size_t off = 0; off < input.size(); off += chunk) {
        framer.feed(std::string_view(input).substr(off, chunk),
                    [&](std::string line) { out.lines.push_back(std::move(line)); },
                    [&](size_t) { ++out.overflows; });
    }
    return out;
}

} // anonymous namespace

TEST(LineFramer, SplitsOnNewline) {
    auto out = frame("{\"a\":1}\n{\"b\":2}\n", 1024);
    ASSERT_EQ(out.lines.size(), 2u);
    EXPECT_EQ(out.lines[0], "{\"a\":1}");
    EXPECT_EQ(out.lines[1], "{\"b\":2}");
}

TEST(LineFramer, ReassemblesAcrossChunks) {
    LineFramer framer;
    std::vector<std::string> lines;
    auto collect = [&](std::string line) { lines.push_back(std::move(line)); };

    framer.feed("{\"jsonrpc\":", collect);
    EXPECT_TRUE(lines.empty());
    EXPECT_GT(framer.buffered(), 0u);
    framer.feed("\"2.0\"}\n{\"x\"", collect);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "{\"jsonrpc\":\"2.0\"}");
    framer.feed(":1}\n", collect);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[1], "{\"x\":1}");
    EXPECT_EQ(framer.buffered(), 0u);
}

TEST(LineFramer, OutputIndependentOfChunking) {
    const std::string input = "first\r\n\nsecond\n" + std::string(40, 'z') + "\nthird\n";
    auto whole = frame(input, input.size(), 32);
    for (size_t chunk : {1u, 2u, 3u, 7u, 31u, 32u, 33u}) {
        auto split = frame(input, chunk, 32);
        EXPECT_EQ(split.lines, whole.lines) << "chunk size " << chunk;
        EXPECT_EQ(split.overflows, whole.overflows) << "chunk size " << chunk;
    }
    ASSERT_EQ(whole.lines.size(), 3u);
    EXPECT_EQ(whole.overflows, 1u);
}

TEST(LineFramer, StripsCarriageReturnAndSkipsEmptyLines) {
    auto out = frame("\n\r\none\r\n\n\ntwo\n", 1024);
    ASSERT_EQ(out.lines.size(), 2u);
    EXPECT_EQ(out.lines[0], "one");
    EXPECT_EQ(out.lines[1], "two");
}

TEST(LineFramer, LineAtCeilingIsAccepted) {
    const size_t limit = 16;
    auto out = frame(std::string(limit, 'a') + "\n", 5, limit);
    ASSERT_EQ(out.lines.size(), 1u);
    EXPECT_EQ(out.lines[0].size(), limit);
    EXPECT_EQ(out.overflows, 0u);
}

TEST(LineFramer, CrlfLineAtCeilingIsAccepted) {
    for (size_t chunk : {1u, 9u, 10u}) {
        auto out = frame("12345678\r\n", chunk, 8);
        EXPECT_EQ(out.overflows, 0u) << "chunk size " << chunk;
        ASSERT_EQ(out.lines.size(), 1u) << "chunk size " << chunk;
        EXPECT_EQ(out.lines[0], "12345678");
    }
    auto over = frame("123456789\r\n", 4, 8);
    EXPECT_EQ(over.overflows, 1u);
    EXPECT_TRUE(over.lines.empty());
}

TEST(LineFramer, CarriageReturnInsidePayloadCounts) {
    // Only a \r directly before the \n is excused from the ceiling.
    auto out = frame("1234\r5678\n", 5, 8);
    EXPECT_EQ(out.overflows, 1u);
    EXPECT_TRUE(out.lines.empty());
}

TEST(LineFramer, TrimsAndSkipsWhitespaceOnlyLines) {
    auto out = frame("   \n\t\r\n  {\"id\":1} \t\r\n \n{\"id\":2}\n", 3);
    ASSERT_EQ(out.lines.size(), 2u);
    EXPECT_EQ(out.lines[0], "{\"id\":1}");
    EXPECT_EQ(out.lines[1], "{\"id\":2}");
    EXPECT_EQ(out.overflows, 0u);
}

TEST(LineFramer, InnerWhitespaceIsKept) {
    auto out = frame("{\"a\": \"b c\"}\n", 1024);
    ASSERT_EQ(out.lines.size(), 1u);
    EXPECT_EQ(out.lines[0], "{\"a\": \"b c\"}");
}

TEST(LineFramer, OneByteOverCeilingIsDropped) {
    const size_t limit = 16;
    auto out = frame(std::string(limit + 1, 'a') + "\nok\n", 5, limit);
    EXPECT_EQ(out.overflows, 1u);
    ASSERT_EQ(out.lines.size(), 1u);
    EXPECT_EQ(out.lines[0], "ok");
}

TEST(LineFramer, OversizedRecordReportedOnce) {
    const size_t limit = 8;
    LineFramer framer(limit);
    size_t overflows = 0;
    std::vector<std::string> lines;
    for (int i = 0; i < 10; ++i) {
        framer.feed(std::string(limit, 'x'), [&](std::string l) { lines.push_back(l); },
                    [&](size_t reported) {
                        EXPECT_EQ(reported, limit);
                        ++overflows;
                    });
    }
    EXPECT_TRUE(framer.discarding());
    framer.feed("tail\nnext\n", [&](std::string l) { lines.push_back(l); },
                [&](size_t) { ++overflows; });
    EXPECT_EQ(overflows, 1u);
    EXPECT_FALSE(framer.discarding());
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "next");
}

TEST(LineFramer, FinishDropsPartialRecord) {
    LineFramer framer;
    std::vector<std::string> lines;
    framer.feed("complete\npartial", [&](std::string l) { lines.push_back(l); });
    EXPECT_EQ(framer.finish(), 7u);
    EXPECT_EQ(framer.buffered(), 0u);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "complete");
}

TEST(LineFramer, PreservesUtf8Bytes) {
    const std::string text = "{\"t\":\"za\xC5\xBC\xC3\xB3\xC5\x82\xC4\x87\"}";
    auto out = frame(text + "\n", 3);
    ASSERT_EQ(out.lines.size(), 1u);
    EXPECT_EQ(out.lines[0], text);
}

// ---- LineReader ----

TEST(LineReader, ReadsRecordsUntilEof) {
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);
    const std::string data = "one\ntwo\nunterminated";
    ASSERT_EQ(write(fds[1], data.data(), data.size()), static_cast<ssize_t>(data.size()));
    close(fds[1]);

    LineReader reader(fds[0]);
    auto a = reader.next();
    auto b = reader.next();
    auto c = reader.next();
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(*a, "one");
    EXPECT_EQ(*b, "two");
    EXPECT_FALSE(c.has_value());
    EXPECT_TRUE(reader.eof());
    close(fds[0]);
}

TEST(LineReader, InterruptFdWakesBlockedRead) {
    int data[2], wake[2];
    ASSERT_EQ(pipe(data), 0);
    ASSERT_EQ(pipe(wake), 0);

    LineReader reader(data[0], LineFramer::DEFAULT_MAX_MESSAGE_SIZE, wake[0]);
    std::optional<std::string> result{"sentinel"};
    std::thread t([&] { result = reader.next(); });

    char b = 1;
    ASSERT_EQ(write(wake[1], &b, 1), 1);
    t.join();
    EXPECT_FALSE(result.has_value());
    EXPECT_FALSE(reader.eof());

    close(data[0]); close(data[1]);
    close(wake[0]); close(wake[1]);
}

TEST(LineReader, ReportsOverflow) {
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);
    const std::string data = std::string(100, 'a') + "\nsmall\n";
    ASSERT_EQ(write(fds[1], data.data(), data.size()), static_cast<ssize_t>(data.size()));
    close(fds[1]);

    LineReader reader(fds[0], 10);
    size_t overflows = 0;
    auto line = reader.next([&](size_t) { ++overflows; });
    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(*line, "small");
    EXPECT_EQ(overflows, 1u);
    close(fds[0]);
}

TEST(LineReader, OverflowKeepsWireOrder) {
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);
    const std::string data = "{\"id\":1}\n" + std::string(20, 'x') + "\n{\"id\":2}\n";
    ASSERT_EQ(write(fds[1], data.data(), data.size()), static_cast<ssize_t>(data.size()));
    close(fds[1]);

    LineReader reader(fds[0], 16);
    std::vector<std::string> events;
    auto on_overflow = [&](size_t limit) {
        EXPECT_EQ(limit, 16u);
        events.push_back("overflow");
    };
    while (auto line = reader.next(on_overflow)) {
        events.push_back(*line);
    }
    close(fds[0]);

    std::vector<std::string> expected = {"{\"id\":1}", "overflow", "{\"id\":2}"};
    EXPECT_EQ(events, expected);
}

TEST(LineReader, TrailingOverflowReportedBeforeEof) {
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);
    const std::string data = "ok\n" + std::string(40, 'y') + "\n";
    ASSERT_EQ(write(fds[1], data.data(), data.size()), static_cast<ssize_t>(data.size()));
    close(fds[1]);

    LineReader reader(fds[0], 16);
    size_t overflows = 0;
    auto first = reader.next([&](size_t) { ++overflows; });
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, "ok");
    EXPECT_EQ(overflows, 0u);

    auto second = reader.next([&](size_t) { ++overflows; });
    EXPECT_FALSE(second.has_value());
    EXPECT_EQ(overflows, 1u);
    close(fds[0]);
}
