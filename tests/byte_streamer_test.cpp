#include <gtest/gtest.h>
#include <rangefetch/byte_streamer.hpp>

#include "test_support.hpp"

#include <string>
#include <vector>

using namespace rangefetch;
using namespace rangefetch::test;

namespace {

constexpr const char* kUrl = "http://files.example.test/pub/data.bin";

class ByteStreamerTest : public ::testing::Test {
protected:
    TransferTarget target() const { return {kUrl, dir_.str()}; }
    fs::path destination() const { return dir_.path() / "data.bin"; }

    TempDir dir_;
    TransferState state_;
};

} // namespace

TEST_F(ByteStreamerTest, StreamsWholeEntityAndCompletes) {
    FakeServer server(makeEntity(5000));
    const auto run = state_.begin(true);
    ASSERT_TRUE(run);

    ByteStreamer streamer(state_, server, 1024);
    streamer.run(target(), *run);

    EXPECT_EQ(state_.status(), TransferStatus::Complete);
    EXPECT_EQ(state_.totalBytes(), 5000);
    EXPECT_EQ(state_.transferredBytes(), 5000);
    EXPECT_EQ(state_.filename(), "data.bin");
    EXPECT_EQ(state_.filepath(), destination().string());
    EXPECT_EQ(readFile(destination()), makeEntity(5000));
    // 4 full buffers and a 904-byte tail
    EXPECT_EQ(server.reads(), 5);
    EXPECT_EQ(server.rangeHeaders(), std::vector<std::string>{"bytes=0-"});
}

TEST_F(ByteStreamerTest, ResumesAtRecordedOffset) {
    const std::string entity = makeEntity(1000);
    {
        std::ofstream partial(destination(), std::ios::binary);
        partial << entity.substr(0, 300);
    }

    FakeServer server(entity);
    const auto first = state_.begin(true);
    ASSERT_TRUE(first);
    state_.setTotalIfUnknown(*first, 1000);
    state_.addTransferred(*first, 300);
    state_.pause();

    const auto resumed = state_.begin(false);
    ASSERT_TRUE(resumed);
    ByteStreamer streamer(state_, server, 256);
    streamer.run(target(), *resumed);

    EXPECT_EQ(server.rangeHeaders(), std::vector<std::string>{"bytes=300-"});
    EXPECT_EQ(state_.status(), TransferStatus::Complete);
    EXPECT_EQ(state_.totalBytes(), 1000);
    EXPECT_EQ(state_.transferredBytes(), 1000);
    EXPECT_EQ(readFile(destination()), entity);
}

TEST_F(ByteStreamerTest, FullyReceivedTransferCompletesWithoutRequest) {
    const std::string entity = makeEntity(1000);
    FakeServer server(entity);

    const auto first = state_.begin(true);
    ASSERT_TRUE(first);
    server.on_chunk = [this](std::int64_t served_to) {
        if (served_to == 1000) {
            state_.pause();
        }
    };
    ByteStreamer(state_, server, 100).run(target(), *first);
    ASSERT_EQ(state_.status(), TransferStatus::Paused);
    ASSERT_EQ(state_.transferredBytes(), 1000);

    const auto resumed = state_.begin(false);
    ASSERT_TRUE(resumed);
    ByteStreamer(state_, server, 100).run(target(), *resumed);

    EXPECT_EQ(state_.status(), TransferStatus::Complete);
    EXPECT_TRUE(state_.errorMessage().empty());
    EXPECT_EQ(state_.transferredBytes(), 1000);
    EXPECT_EQ(server.rangeHeaders(), std::vector<std::string>{"bytes=0-"});
    EXPECT_EQ(readFile(destination()), entity);
}

TEST_F(ByteStreamerTest, ZeroContentLengthFailsWithoutCreatingFile) {
    FakeServer server;
    server.fixed_response = FakeResponse{200, 0, "", ""};
    const auto run = state_.begin(true);
    ASSERT_TRUE(run);

    ByteStreamer streamer(state_, server, 1024);
    streamer.run(target(), *run);

    EXPECT_EQ(state_.status(), TransferStatus::Error);
    EXPECT_EQ(state_.errorMessage(), "Invalid Content Length!");
    EXPECT_FALSE(fs::exists(destination()));
}

TEST_F(ByteStreamerTest, MissingContentLengthIsInvalid) {
    FakeServer server;
    server.fixed_response = FakeResponse{200, -1, "chunked body", ""};
    const auto run = state_.begin(true);
    ASSERT_TRUE(run);

    ByteStreamer(state_, server, 1024).run(target(), *run);

    EXPECT_EQ(state_.status(), TransferStatus::Error);
    EXPECT_EQ(state_.errorMessage(), "Invalid Content Length!");
}

TEST_F(ByteStreamerTest, ClassifiedStatusStopsBeforeOpeningFile) {
    FakeServer server;
    server.fixed_response = FakeResponse{503, std::nullopt, "down for maintenance", ""};
    const auto run = state_.begin(true);
    ASSERT_TRUE(run);

    ByteStreamer(state_, server, 1024).run(target(), *run);

    EXPECT_EQ(state_.status(), TransferStatus::Error);
    EXPECT_EQ(state_.errorMessage(), "Service Unavailable!");
    EXPECT_FALSE(fs::exists(destination()));
}

TEST_F(ByteStreamerTest, ForbiddenFileDownloadIsRecoverable) {
    FakeServer server;
    server.fixed_response = FakeResponse{403, std::nullopt, "", ""};
    const auto run = state_.begin(true);
    ASSERT_TRUE(run);

    ByteStreamer(state_, server, 1024).run({"https://github.com/owner/repo/archive/main.zip", dir_.str()}, *run);

    EXPECT_EQ(state_.status(), TransferStatus::Error);
    EXPECT_EQ(state_.errorMessage(), "Forbidden!");
}

TEST_F(ByteStreamerTest, TransportErrorEndsInErrorState) {
    FakeServer server;
    server.transport_error = "curl error: Couldn't resolve host name";
    const auto run = state_.begin(true);
    ASSERT_TRUE(run);

    ByteStreamer(state_, server, 1024).run(target(), *run);

    EXPECT_EQ(state_.status(), TransferStatus::Error);
    EXPECT_EQ(state_.errorMessage(), "curl error: Couldn't resolve host name");
}

TEST_F(ByteStreamerTest, ReadFailureKeepsBytesAlreadyWritten) {
    const std::string entity = makeEntity(1000);
    FakeServer server(entity);
    server.fail_read_at = 500;
    const auto run = state_.begin(true);
    ASSERT_TRUE(run);

    ByteStreamer(state_, server, 100).run(target(), *run);

    EXPECT_EQ(state_.status(), TransferStatus::Error);
    EXPECT_EQ(state_.errorMessage(), "connection reset");
    EXPECT_EQ(state_.transferredBytes(), 500);
    EXPECT_EQ(readFile(destination()), entity.substr(0, 500));
}

TEST_F(ByteStreamerTest, ServerIgnoringRangeRestartsFromZero) {
    const std::string entity = makeEntity(800);
    {
        std::ofstream partial(destination(), std::ios::binary);
        partial << std::string(200, 'x');
    }

    FakeServer server(entity);
    server.ignore_range = true;
    const auto first = state_.begin(true);
    ASSERT_TRUE(first);
    state_.setTotalIfUnknown(*first, 800);
    state_.addTransferred(*first, 200);
    state_.pause();

    const auto resumed = state_.begin(false);
    ASSERT_TRUE(resumed);
    ByteStreamer(state_, server, 128).run(target(), *resumed);

    EXPECT_EQ(state_.status(), TransferStatus::Complete);
    EXPECT_EQ(state_.transferredBytes(), 800);
    EXPECT_EQ(readFile(destination()), entity);
}

TEST_F(ByteStreamerTest, FreshDownloadReplacesStaleFile) {
    {
        std::ofstream stale(destination(), std::ios::binary);
        stale << std::string(2000, 'x');
    }

    const std::string entity = makeEntity(700);
    FakeServer server(entity);
    const auto run = state_.begin(true);
    ASSERT_TRUE(run);
    ByteStreamer(state_, server, 256).run(target(), *run);

    EXPECT_EQ(state_.status(), TransferStatus::Complete);
    EXPECT_EQ(readFile(destination()), entity);
}

TEST_F(ByteStreamerTest, UrlWithoutFileNameFails) {
    FakeServer server(makeEntity(10));
    const auto run = state_.begin(true);
    ASSERT_TRUE(run);

    ByteStreamer(state_, server, 1024).run({"http://files.example.test/pub/", dir_.str()}, *run);

    EXPECT_EQ(state_.status(), TransferStatus::Error);
    EXPECT_NE(state_.errorMessage().find("Cannot derive a filename"), std::string::npos);
}

TEST_F(ByteStreamerTest, CloseIsSafeWhenNothingWasOpened) {
    FakeServer server;
    ByteStreamer streamer(state_, server, 1024);
    streamer.close();
    streamer.close();
    SUCCEED();
}

TEST(PathHelpersTest, FilenameFromUrl) {
    EXPECT_EQ(filenameFromUrl("https://example.test/a/b/archive.tar.gz"), "archive.tar.gz");
    EXPECT_EQ(filenameFromUrl("https://example.test/a/file.zip?token=abc#frag"), "file.zip");
    EXPECT_EQ(filenameFromUrl("http://example.test/top.txt"), "top.txt");
    EXPECT_THROW((void)filenameFromUrl("https://example.test/dir/"), std::runtime_error);
    EXPECT_THROW((void)filenameFromUrl("not a url"), std::invalid_argument);
}

TEST(PathHelpersTest, NormalizeAndCompose) {
    EXPECT_EQ(normalizeDirectory("/tmp/downloads///"), "/tmp/downloads");
    EXPECT_EQ(normalizeDirectory("downloads"), "downloads");
    EXPECT_EQ(normalizeDirectory(""), "");
    EXPECT_EQ(composeFilepath("/tmp/downloads", "a.bin"), "/tmp/downloads/a.bin");
    EXPECT_EQ(composeFilepath("", "a.bin"), "a.bin");
}
