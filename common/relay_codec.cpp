// ============================================================
// relay_codec.cpp
// ============================================================

#include "relay_codec.hpp"
#include "protocol_io.hpp"
#include "compress.hpp"
#include "hash.hpp"
#include <cstring>

namespace codec {

namespace {

// Wire form of one optional piece: maybe compressed, always described by the
// raw length and hash in the header.
struct PieceOut {
    std::string wire;
    bool        compressed{false};
};

PieceOut pack_piece(const std::string& raw, bool allow_compress) {
    PieceOut out;
    if (allow_compress && compress::try_compress(raw, out.wire)) {
        out.compressed = true;
    } else {
        out.wire = raw;
    }
    return out;
}

std::string unpack_piece(const std::string& wire, bool compressed,
                         u32 raw_len, u32 expected_hash,
                         const char* what, u32 chunk_index)
{
    std::string raw;
    if (compressed) {
        try {
            raw = compress::decompress_str(wire, raw_len);
        } catch (const std::exception& e) {
            throw ProtocolError(std::string("Chunk ") + std::to_string(chunk_index) +
                                ": " + what + " piece: " + e.what());
        }
    } else {
        raw = wire;
    }
    if (raw.size() != raw_len) {
        throw ProtocolError(std::string("Chunk ") + std::to_string(chunk_index) +
                            ": " + what + " piece length " + std::to_string(raw.size()) +
                            " does not match header " + std::to_string(raw_len));
    }
    if (hash::xxh3_32(raw) != expected_hash) {
        throw ProtocolError(std::string("Chunk ") + std::to_string(chunk_index) +
                            ": " + what + " piece checksum mismatch");
    }
    return raw;
}

} // namespace

std::vector<u8> encode_chunk(const Chunk& chunk, bool compress) {
    if (chunk.session_id.empty() || chunk.session_id.size() > 0xFFFF) {
        throw std::runtime_error("Invalid session id length: " +
                                 std::to_string(chunk.session_id.size()));
    }

    ChunkHdr hdr{};
    hdr.chunk_index    = chunk.index;
    hdr.total_chunks   = chunk.total_chunks;
    hdr.session_id_len = (u16)chunk.session_id.size();

    PieceOut req, resp;
    if (chunk.has_url) hdr.presence |= PIECE_URL;
    if (chunk.has_request) {
        hdr.presence       |= PIECE_REQUEST;
        hdr.request_raw_len = (u32)chunk.request_piece.size();
        hdr.request_xxh3    = hash::xxh3_32(chunk.request_piece);
        req = pack_piece(chunk.request_piece, compress);
        if (req.compressed) hdr.compressed |= PIECE_REQUEST;
    }
    if (chunk.has_response) {
        hdr.presence        |= PIECE_RESPONSE;
        hdr.response_raw_len = (u32)chunk.response_piece.size();
        hdr.response_xxh3    = hash::xxh3_32(chunk.response_piece);
        resp = pack_piece(chunk.response_piece, compress);
        if (resp.compressed) hdr.compressed |= PIECE_RESPONSE;
    }

    proto::PayloadWriter w(sizeof(ChunkHdr) + chunk.session_id.size() +
                           chunk.url.size() + req.wire.size() + resp.wire.size() + 12);
    ChunkHdr encoded = hdr;
    proto::encode_chunk_hdr(encoded);
    w.put_raw(&encoded, sizeof(ChunkHdr));
    w.put_raw(chunk.session_id.data(), chunk.session_id.size());
    if (chunk.has_url)      w.put_blob(chunk.url);
    if (chunk.has_request)  w.put_blob(req.wire);
    if (chunk.has_response) w.put_blob(resp.wire);

    if (w.size() > MAX_PAYLOAD_LEN) {
        throw std::runtime_error("Chunk " + std::to_string(chunk.index) +
                                 " exceeds relay frame limit (" +
                                 std::to_string(w.size()) + " bytes)");
    }
    return std::move(w.bytes());
}

Chunk decode_chunk(const std::vector<u8>& payload, bool allow_compressed) {
    proto::PayloadReader r(payload);
    ChunkHdr hdr{};
    r.get_raw(&hdr, sizeof(ChunkHdr));
    proto::decode_chunk_hdr(hdr);

    if (hdr.session_id_len == 0) {
        throw ProtocolError("Chunk without session id");
    }
    if (hdr.total_chunks == 0) {
        throw ProtocolError("Chunk announces zero total chunks");
    }
    if (hdr.chunk_index >= hdr.total_chunks) {
        throw ProtocolError("Chunk index " + std::to_string(hdr.chunk_index) +
                            " out of range for " + std::to_string(hdr.total_chunks) + " chunks");
    }
    if (hdr.compressed && !allow_compressed) {
        throw ProtocolError("Compressed piece on a link without CAP_COMPRESS");
    }
    if ((hdr.compressed & ~hdr.presence) != 0) {
        throw ProtocolError("Compression flag set on an absent piece");
    }
    if ((hdr.presence & PIECE_URL) && hdr.chunk_index != 0) {
        throw ProtocolError("URL present on chunk " + std::to_string(hdr.chunk_index));
    }
    if (hdr.request_raw_len > MAX_CHUNK_THRESHOLD || hdr.response_raw_len > MAX_CHUNK_THRESHOLD) {
        throw ProtocolError("Chunk " + std::to_string(hdr.chunk_index) +
                            " announces a piece larger than " + std::to_string(MAX_CHUNK_THRESHOLD) +
                            " bytes");
    }

    Chunk c;
    c.index        = hdr.chunk_index;
    c.total_chunks = hdr.total_chunks;
    c.session_id   = r.get_bytes(hdr.session_id_len);

    if (hdr.presence & PIECE_URL) {
        c.has_url = true;
        c.url     = r.get_blob();
    }
    if (hdr.presence & PIECE_REQUEST) {
        c.has_request   = true;
        c.request_piece = unpack_piece(r.get_blob(), (hdr.compressed & PIECE_REQUEST) != 0,
                                       hdr.request_raw_len, hdr.request_xxh3,
                                       "request", hdr.chunk_index);
    }
    if (hdr.presence & PIECE_RESPONSE) {
        c.has_response   = true;
        c.response_piece = unpack_piece(r.get_blob(), (hdr.compressed & PIECE_RESPONSE) != 0,
                                        hdr.response_raw_len, hdr.response_xxh3,
                                        "response", hdr.chunk_index);
    }
    if (!r.at_end()) {
        throw ProtocolError("Trailing bytes after chunk " + std::to_string(hdr.chunk_index));
    }
    return c;
}

std::vector<u8> encode_artifact(const Artifact& artifact) {
    DirectHdr hdr{};
    hash::Hash128 digest = hash::payload_digest(artifact.request, artifact.response);
    std::memcpy(hdr.xxh3_128, digest.data(), digest.size());

    proto::PayloadWriter w(sizeof(DirectHdr) + 12 + artifact.url.size() +
                           artifact.request.size() + artifact.response.size());
    w.put_raw(&hdr, sizeof(DirectHdr));
    w.put_blob(artifact.url);
    w.put_blob(artifact.request);
    w.put_blob(artifact.response);
    if (w.size() > MAX_PAYLOAD_LEN) {
        throw std::runtime_error("Artifact exceeds relay frame limit (" +
                                 std::to_string(w.size()) + " bytes); send it chunked");
    }
    return std::move(w.bytes());
}

Artifact decode_artifact(const std::vector<u8>& payload) {
    proto::PayloadReader r(payload);
    DirectHdr hdr{};
    r.get_raw(&hdr, sizeof(DirectHdr));

    Artifact a;
    a.url      = r.get_blob();
    a.request  = r.get_blob();
    a.response = r.get_blob();
    if (!r.at_end()) {
        throw ProtocolError("Trailing bytes after artifact");
    }

    hash::Hash128 digest = hash::payload_digest(a.request, a.response);
    if (std::memcmp(digest.data(), hdr.xxh3_128, digest.size()) != 0) {
        throw ProtocolError("Artifact checksum mismatch for " + a.url);
    }
    return a;
}

std::vector<u8> encode_chunk_ack(const ChunkAck& ack) {
    return std::vector<u8>{ack.complete ? (u8)1 : (u8)0};
}

ChunkAck decode_chunk_ack(const std::vector<u8>& payload) {
    proto::PayloadReader r(payload);
    ChunkAck ack;
    ack.complete = r.get_u8() != 0;
    return ack;
}

std::vector<u8> encode_fetched(const FetchedResource& res) {
    proto::PayloadWriter w(8 + res.request_raw.size() + res.response_raw.size());
    w.put_blob(res.request_raw);
    w.put_blob(res.response_raw);
    if (w.size() > MAX_PAYLOAD_LEN) {
        throw std::runtime_error("Fetched resource exceeds relay frame limit (" +
                                 std::to_string(w.size()) + " bytes)");
    }
    return std::move(w.bytes());
}

FetchedResource decode_fetched(const std::vector<u8>& payload) {
    proto::PayloadReader r(payload);
    FetchedResource res;
    res.request_raw  = r.get_blob();
    res.response_raw = r.get_blob();
    return res;
}

std::vector<u8> encode_string(const std::string& s) {
    return std::vector<u8>(s.begin(), s.end());
}

std::string decode_string(const std::vector<u8>& payload) {
    return std::string(payload.begin(), payload.end());
}

} // namespace codec
