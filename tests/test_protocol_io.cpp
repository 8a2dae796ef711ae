#include <gtest/gtest.h>

#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

#include "../common/hash.hpp"
#include "../common/protocol_io.hpp"
#include "../common/relay_codec.hpp"
#include "test_support.hpp"

using namespace ::testing;
using testsupport::pattern_bytes;

namespace {

Chunk sample_chunk(u32 index, u32 total) {
    Chunk c;
    c.session_id   = "1700000000000-00112233445566778899aabbccddeeff";
    c.index        = index;
    c.total_chunks = total;
    if (index == 0) {
        c.has_url = true;
        c.url     = "https://t.example/a.js";
    }
    c.has_request    = true;
    c.request_piece  = "GET /a.js HTTP/1.1\r\n\r\n";
    c.has_response   = true;
    c.response_piece = "HTTP/1.1 200 OK\r\n\r\nvar x = 1;";
    return c;
}

constexpr size_t COMPRESSED_FLAG_OFFSET = 9;  // offsetof(ChunkHdr, compressed)
constexpr size_t REQUEST_RAW_LEN_OFFSET = 12; // offsetof(ChunkHdr, request_raw_len)

void put_be32(std::vector<u8>& p, size_t off, u32 v) {
    p[off]     = (u8)(v >> 24);
    p[off + 1] = (u8)(v >> 16);
    p[off + 2] = (u8)(v >> 8);
    p[off + 3] = (u8)v;
}

TEST(FrameHeader, EncodesBigEndian) {
    FrameHeader h{};
    h.msg_type    = (u16)MsgType::MT_SUBMIT_CHUNK;
    h.flags       = 0;
    h.payload_len = 0x01020304u;
    u8 buf[8];
    proto::encode_header(h, buf);
    const u8 expected[8] = {0x00, 0x11, 0x00, 0x00, 0x01, 0x02, 0x03, 0x04};
    EXPECT_EQ(std::memcmp(buf, expected, 8), 0);

    FrameHeader back = proto::decode_header(buf);
    EXPECT_EQ(back.msg_type, h.msg_type);
    EXPECT_EQ(back.payload_len, h.payload_len);
}

TEST(Hello, WireLayout) {
    Hello h{};
    hello_init(h, CAP_COMPRESS);
    proto::encode_hello(h);
    const u8* b = reinterpret_cast<const u8*>(&h);
    const u8 expected[8] = {'J', 'X', 'R', '1', JXRELAY_VERSION, 0, 0x00, 0x01};
    EXPECT_EQ(std::memcmp(b, expected, 8), 0);
    EXPECT_TRUE(hello_valid_magic(h));
}

TEST(PayloadWriter, BlobIsLengthPrefixed) {
    proto::PayloadWriter w;
    w.put_blob("abc");
    const std::vector<u8> expected = {0, 0, 0, 3, 'a', 'b', 'c'};
    EXPECT_EQ(w.bytes(), expected);

    proto::PayloadReader r(w.bytes());
    EXPECT_EQ(r.get_blob(), "abc");
    EXPECT_TRUE(r.at_end());
    EXPECT_THROW(r.get_u8(), ProtocolError);
}

TEST(ChunkCodec, DecodesWhatWasEncoded) {
    Chunk c = sample_chunk(0, 2);
    Chunk d = codec::decode_chunk(codec::encode_chunk(c, false), false);
    EXPECT_EQ(d.session_id, c.session_id);
    EXPECT_EQ(d.index, 0u);
    EXPECT_EQ(d.total_chunks, 2u);
    EXPECT_TRUE(d.has_url);
    EXPECT_EQ(d.url, c.url);
    EXPECT_EQ(d.request_piece, c.request_piece);
    EXPECT_EQ(d.response_piece, c.response_piece);
}

TEST(ChunkCodec, AbsentPiecesStayAbsent) {
    Chunk c = sample_chunk(1, 2);
    c.has_request = false;
    c.request_piece.clear();
    Chunk d = codec::decode_chunk(codec::encode_chunk(c, true), true);
    EXPECT_FALSE(d.has_url);
    EXPECT_FALSE(d.has_request);
    EXPECT_TRUE(d.has_response);
}

TEST(ChunkCodec, CompressesOnlyWhenAllowed) {
    Chunk c = sample_chunk(0, 1);
    c.response_piece = std::string(200000, 'A');

    std::vector<u8> packed = codec::encode_chunk(c, true);
    EXPECT_LT(packed.size(), 10000u);
    EXPECT_NE(packed[COMPRESSED_FLAG_OFFSET] & PIECE_RESPONSE, 0);
    EXPECT_EQ(codec::decode_chunk(packed, true).response_piece, c.response_piece);

    // a link without CAP_COMPRESS must refuse compressed pieces
    EXPECT_THROW(codec::decode_chunk(packed, false), ProtocolError);

    std::vector<u8> plain = codec::encode_chunk(c, false);
    EXPECT_EQ(plain[COMPRESSED_FLAG_OFFSET], 0);
    EXPECT_GT(plain.size(), 200000u);
}

TEST(ChunkCodec, CorruptPieceFailsChecksum) {
    std::vector<u8> p = codec::encode_chunk(sample_chunk(0, 1), false);
    p.back() ^= 0x01;
    try {
        codec::decode_chunk(p, false);
        FAIL() << "expected ProtocolError";
    } catch (const ProtocolError& e) {
        EXPECT_NE(std::string(e.what()).find("checksum mismatch"), std::string::npos);
    }
}

TEST(ChunkCodec, RejectsStructuralViolations) {
    // URL on a later chunk
    Chunk late_url = sample_chunk(1, 2);
    late_url.has_url = true;
    late_url.url = "u";
    EXPECT_THROW(codec::decode_chunk(codec::encode_chunk(late_url, false), false), ProtocolError);

    // index beyond total
    EXPECT_THROW(codec::decode_chunk(codec::encode_chunk(sample_chunk(3, 3), false), false),
                 ProtocolError);

    // zero total
    Chunk zero = sample_chunk(0, 1);
    zero.total_chunks = 0;
    EXPECT_THROW(codec::decode_chunk(codec::encode_chunk(zero, false), false), ProtocolError);

    // truncated and padded payloads
    std::vector<u8> p = codec::encode_chunk(sample_chunk(0, 1), false);
    std::vector<u8> truncated(p.begin(), p.end() - 3);
    EXPECT_THROW(codec::decode_chunk(truncated, false), ProtocolError);
    std::vector<u8> padded = p;
    padded.push_back(0);
    EXPECT_THROW(codec::decode_chunk(padded, false), ProtocolError);
}

TEST(ChunkCodec, RejectsOversizedAnnouncedLength) {
    Chunk c = sample_chunk(0, 1);
    c.request_piece = std::string(64 * 1024, 'a');
    std::vector<u8> p = codec::encode_chunk(c, true);
    ASSERT_NE(p[COMPRESSED_FLAG_OFFSET] & PIECE_REQUEST, 0);

    // a tiny frame claiming a ~4 GiB request piece
    std::vector<u8> huge = p;
    put_be32(huge, REQUEST_RAW_LEN_OFFSET, 0xFFFFFFF0u);
    EXPECT_THROW(codec::decode_chunk(huge, true), ProtocolError);

    std::vector<u8> over = p;
    put_be32(over, REQUEST_RAW_LEN_OFFSET, MAX_CHUNK_THRESHOLD + 1);
    EXPECT_THROW(codec::decode_chunk(over, true), ProtocolError);

    // within bounds but disagreeing with the zstd frame
    std::vector<u8> off_by_one = p;
    put_be32(off_by_one, REQUEST_RAW_LEN_OFFSET, 64 * 1024 + 1);
    EXPECT_THROW(codec::decode_chunk(off_by_one, true), ProtocolError);

    EXPECT_EQ(codec::decode_chunk(p, true).request_piece, c.request_piece);
}

TEST(ChunkCodec, EncoderRejectsEmptySessionId) {
    Chunk c = sample_chunk(0, 1);
    c.session_id.clear();
    EXPECT_THROW(codec::encode_chunk(c, false), std::runtime_error);
}

TEST(ArtifactCodec, DigestProtectsPayloads) {
    Artifact a;
    a.url      = "https://t.example/";
    a.request  = pattern_bytes(5000, 7);
    a.response = pattern_bytes(9000, 8);

    std::vector<u8> p = codec::encode_artifact(a);
    Artifact back = codec::decode_artifact(p);
    EXPECT_EQ(back.request, a.request);
    EXPECT_EQ(back.response, a.response);

    p.back() ^= 0x20;
    EXPECT_THROW(codec::decode_artifact(p), ProtocolError);
}

TEST(ArtifactCodec, OversizedArtifactRefused) {
    Artifact a;
    a.url      = "u";
    a.response = std::string(MAX_PAYLOAD_LEN, 'x');
    EXPECT_THROW(codec::encode_artifact(a), std::runtime_error);
}

TEST(ArtifactCodec, DigestSeparatesRequestFromResponse) {
    // same concatenation, different split
    EXPECT_NE(hash::payload_digest("ab", "c"), hash::payload_digest("a", "bc"));
}

TEST(SmallCodecs, ChunkAckAndFetched) {
    ChunkAck ack;
    ack.complete = true;
    EXPECT_TRUE(codec::decode_chunk_ack(codec::encode_chunk_ack(ack)).complete);
    EXPECT_THROW(codec::decode_chunk_ack({}), ProtocolError);

    FetchedResource f;
    f.request_raw  = "GET / HTTP/1.1\r\n\r\n";
    f.response_raw = "HTTP/1.1 204 No Content\r\n\r\n";
    FetchedResource g = codec::decode_fetched(codec::encode_fetched(f));
    EXPECT_EQ(g.request_raw, f.request_raw);
    EXPECT_EQ(g.response_raw, f.response_raw);
}

} // namespace
