#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include "../client/chunk_sender.hpp"
#include "../server/ingest_forwarder.hpp"
#include "../server/session_reassembler.hpp"
#include "test_support.hpp"

using namespace ::testing;
using testsupport::FakeHttpTransport;
using testsupport::TempDir;
using testsupport::pattern_bytes;

namespace {

// Records calls; acknowledges chunks, reporting completion on the last one
struct RecordingChannel : RelayChannel {
    std::vector<Artifact> directs;
    std::vector<Chunk>    chunks;
    int  fail_at_chunk{-1};
    bool never_complete{false};

    Result<void> submit_direct(const Artifact& artifact) override {
        directs.push_back(artifact);
        return Result<void>::ok();
    }

    Result<ChunkAck> submit_chunk(const Chunk& chunk) override {
        chunks.push_back(chunk);
        if ((int)chunk.index == fail_at_chunk) {
            return Result<ChunkAck>::fail("Expected chunk 0, got 1");
        }
        ChunkAck ack;
        ack.complete = !never_complete && chunk.index + 1 == chunk.total_chunks;
        return Result<ChunkAck>::ok(ack);
    }
};

// Hands chunks straight to a real reassembler
struct LoopbackChannel : RelayChannel {
    SessionReassembler& reassembler;
    IngestForwarder&    forwarder;
    int                 chunk_calls{0};

    LoopbackChannel(SessionReassembler& r, IngestForwarder& f) : reassembler(r), forwarder(f) {}

    Result<void> submit_direct(const Artifact& artifact) override {
        return forwarder.forward(artifact);
    }
    Result<ChunkAck> submit_chunk(const Chunk& chunk) override {
        ++chunk_calls;
        return reassembler.submit_chunk(chunk);
    }
};

Artifact make_artifact(size_t req_len, size_t resp_len) {
    Artifact a;
    a.url      = "https://target.example/static/bundle.js";
    a.request  = pattern_bytes(req_len, 1);
    a.response = pattern_bytes(resp_len, 2);
    return a;
}

constexpr u32 KB500 = 500u * 1024u;

class ChunkSenderTest : public ::testing::Test {
protected:
    RecordingChannel channel_;
    ChunkSender      sender_{channel_, KB500, [] { return std::string("sid-fixed"); }};

    void SetUp() override { testsupport::quiet_logger(); }
};

TEST_F(ChunkSenderTest, SmallArtifactGoesDirect) {
    Artifact a = make_artifact(1000, 4000);
    ASSERT_TRUE(sender_.send(a).success);
    ASSERT_EQ(channel_.directs.size(), 1u);
    EXPECT_TRUE(channel_.chunks.empty());
    EXPECT_EQ(channel_.directs[0].response, a.response);
}

TEST_F(ChunkSenderTest, ExactlyThresholdGoesDirect) {
    ASSERT_TRUE(sender_.send(make_artifact(KB500 - 10, 10)).success);
    EXPECT_EQ(channel_.directs.size(), 1u);
    EXPECT_TRUE(channel_.chunks.empty());
}

TEST_F(ChunkSenderTest, OneByteOverThresholdIsChunked) {
    ASSERT_TRUE(sender_.send(make_artifact(KB500 - 10, 11)).success);
    EXPECT_TRUE(channel_.directs.empty());
    ASSERT_EQ(channel_.chunks.size(), 1u);
    EXPECT_EQ(channel_.chunks[0].total_chunks, 1u);
}

TEST_F(ChunkSenderTest, LargeArtifactSplitsStreamsIndependently) {
    // 1.2 MB: a 100 KB request fits chunk 0, the response spans chunks 0-2
    Artifact a = make_artifact(100000, 1100000);
    ASSERT_TRUE(sender_.send(a).success);

    ASSERT_EQ(channel_.chunks.size(), 3u);
    EXPECT_EQ(ChunkSender::count_chunks(a, KB500), 3u);
    for (u32 i = 0; i < 3; ++i) {
        const Chunk& c = channel_.chunks[i];
        EXPECT_EQ(c.index, i);
        EXPECT_EQ(c.total_chunks, 3u);
        EXPECT_EQ(c.session_id, "sid-fixed");
        EXPECT_EQ(c.has_url, i == 0);
        EXPECT_EQ(c.has_request, i == 0);
        EXPECT_TRUE(c.has_response);
    }
    EXPECT_EQ(channel_.chunks[0].url, a.url);
    EXPECT_EQ(channel_.chunks[0].request_piece, a.request);
    EXPECT_EQ(channel_.chunks[0].response_piece.size(), KB500);
    EXPECT_EQ(channel_.chunks[1].response_piece.size(), KB500);
    EXPECT_EQ(channel_.chunks[2].response_piece.size(), 1100000u - 2u * KB500);
}

TEST_F(ChunkSenderTest, StopsAtFirstFailedChunk) {
    channel_.fail_at_chunk = 1;
    auto r = sender_.send(make_artifact(10, 3 * KB500));
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, "Expected chunk 0, got 1");
    EXPECT_EQ(channel_.chunks.size(), 2u);
}

TEST_F(ChunkSenderTest, MissingCompletionIsDistinctError) {
    channel_.never_complete = true;
    auto r = sender_.send(make_artifact(10, 2 * KB500));
    EXPECT_FALSE(r.success);
    EXPECT_NE(r.error.find("not all chunks were processed"), std::string::npos);
    EXPECT_EQ(channel_.chunks.size(), 2u);
}

TEST(ChunkSenderStatic, PartitionAndCount) {
    EXPECT_TRUE(ChunkSender::partition("", 4).empty());
    auto p = ChunkSender::partition("abcdefghij", 4);
    ASSERT_EQ(p.size(), 3u);
    EXPECT_EQ(p[0], "abcd");
    EXPECT_EQ(p[1], "efgh");
    EXPECT_EQ(p[2], "ij");

    Artifact a;
    a.request  = std::string(9, 'r');
    a.response = std::string(3, 's');
    EXPECT_EQ(ChunkSender::count_chunks(a, 4), 3u);
    EXPECT_EQ(ChunkSender::count_chunks(a, 9), 1u);
}

TEST(ChunkSenderStatic, RejectsBadThreshold) {
    RecordingChannel ch;
    EXPECT_THROW({ ChunkSender s(ch, 0); }, std::invalid_argument);
    EXPECT_THROW({ ChunkSender s(ch, MAX_CHUNK_THRESHOLD + 1); }, std::invalid_argument);
    EXPECT_NO_THROW({ ChunkSender s(ch, MAX_CHUNK_THRESHOLD); });
}

TEST(ChunkSenderStatic, GeneratedSessionIdsDiffer) {
    RecordingChannel ch;
    ChunkSender sender(ch, 16);
    ASSERT_TRUE(sender.send(make_artifact(10, 40)).success);
    ASSERT_TRUE(sender.send(make_artifact(10, 40)).success);
    ASSERT_FALSE(ch.chunks.empty());
    EXPECT_NE(ch.chunks.front().session_id, ch.chunks.back().session_id);
}

// Sender and reassembler wired together reproduce the payloads byte for byte
TEST(ChunkSenderReassembly, RoundTripIsByteExact) {
    testsupport::quiet_logger();
    TempDir            dir;
    SettingsStore      settings(dir.str());
    FakeHttpTransport  http;
    IngestForwarder    forwarder(settings, http);
    SessionReassembler reassembler(forwarder, std::chrono::seconds(60));
    LoopbackChannel    channel(reassembler, forwarder);
    ChunkSender        sender(channel, 64 * 1024);

    Artifact a = make_artifact(300000, 150000);
    auto r = sender.send(a);
    ASSERT_TRUE(r.success) << r.error;
    EXPECT_EQ(channel.chunk_calls, 5);
    EXPECT_EQ(reassembler.session_count(), 0u);

    ASSERT_EQ(http.call_count(), 1u);
    auto body = testsupport::ingest_json(http.calls()[0].request);
    EXPECT_EQ(body["requestUrl"], a.url);
    EXPECT_EQ(body["request"].get<std::string>(), a.request);
    EXPECT_EQ(body["response"].get<std::string>(), a.response);
}

} // namespace
