/***
 * Name: test_output_sink
 * Purpose: Check line buffering, explicit flushes and the shared output
 *          budget of the worker's output sink.
 */
#include <gtest/gtest.h>

#include <scriptdeck/sandbox/output_sink.hpp>
#include <scriptdeck/sandbox/types.hpp>

#include <unistd.h>

using namespace scriptdeck;

namespace {

// Collects what the sink wrote into a pipe. Payloads stay well below the
// pipe buffer so nothing blocks.
class SinkHarness {
public:
    SinkHarness() : writer_(-1) {
        if (pipe(fds_) == 0) writer_ = ChannelWriter(fds_[1]);
    }
    ~SinkHarness() {
        close(fds_[0]);
    }

    ChannelWriter& writer() { return writer_; }

    std::vector<Frame> frames() {
        close(fds_[1]);
        ChannelDecoder decoder;
        char buf[4096];
        ssize_t n;
        while ((n = read(fds_[0], buf, sizeof(buf))) > 0) {
            decoder.feed(buf, static_cast<size_t>(n));
        }
        std::vector<Frame> out;
        Frame f;
        while (decoder.next(f)) out.push_back(f);
        return out;
    }

private:
    int fds_[2];
    ChannelWriter writer_;
};

std::string joined(const std::vector<Frame>& frames, FrameType type) {
    std::string s;
    for (size_t i = 0; i < frames.size(); ++i) {
        if (frames[i].type == type) s += frames[i].payload;
    }
    return s;
}

} // namespace

TEST(OutputSink, CompleteLinesGoOutImmediately) {
    SinkHarness h;
    OutputSink sink(h.writer(), 1000);
    sink.write(FrameType::STDOUT, "one\ntw");
    EXPECT_EQ(sink.emitted_bytes(), 4u);
    sink.write(FrameType::STDOUT, "o\n");
    EXPECT_EQ(sink.emitted_bytes(), 8u);

    std::vector<Frame> frames = h.frames();
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_EQ(frames[0].payload, "one\n");
    EXPECT_EQ(frames[1].payload, "two\n");
}

TEST(OutputSink, FlushAllSendsPartialLines) {
    SinkHarness h;
    OutputSink sink(h.writer(), 1000);
    sink.write(FrameType::STDOUT, "prompt: ");
    sink.write(FrameType::STDERR, "warn");
    EXPECT_EQ(sink.emitted_bytes(), 0u);
    sink.flush_all();

    std::vector<Frame> frames = h.frames();
    EXPECT_EQ(joined(frames, FrameType::STDOUT), "prompt: ");
    EXPECT_EQ(joined(frames, FrameType::STDERR), "warn");
}

TEST(OutputSink, StreamsBufferedSeparately) {
    SinkHarness h;
    OutputSink sink(h.writer(), 1000);
    sink.write(FrameType::STDOUT, "out-");
    sink.write(FrameType::STDERR, "err\n");
    sink.write(FrameType::STDOUT, "line\n");

    std::vector<Frame> frames = h.frames();
    EXPECT_EQ(joined(frames, FrameType::STDOUT), "out-line\n");
    EXPECT_EQ(joined(frames, FrameType::STDERR), "err\n");
}

TEST(OutputSink, LongLineFlushedAtBufferLimit) {
    SinkHarness h;
    OutputSink sink(h.writer(), 100000);
    sink.write(FrameType::STDOUT, std::string(OutputSink::BUFFER_LIMIT, 'a'));
    EXPECT_EQ(sink.emitted_bytes(), OutputSink::BUFFER_LIMIT);
}

TEST(OutputSink, BudgetTruncatesOnceWithMarker) {
    SinkHarness h;
    OutputSink sink(h.writer(), 10);
    sink.write(FrameType::STDOUT, "123456\n");
    sink.write(FrameType::STDERR, "abcdef\n");
    EXPECT_TRUE(sink.truncated());
    sink.write(FrameType::STDOUT, "dropped\n");
    sink.flush_all();
    EXPECT_EQ(sink.emitted_bytes(), 10u);

    std::vector<Frame> frames = h.frames();
    EXPECT_EQ(joined(frames, FrameType::STDOUT), "123456\n");
    EXPECT_EQ(joined(frames, FrameType::STDERR), std::string("abc") + OUTPUT_TRUNCATED_MARKER);
}
