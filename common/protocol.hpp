#pragma once

// protocol.hpp -- Wire protocol between jxrelay_send and jxrelay_server

#include "platform.hpp"
#include <cstring>
#include <stdexcept>
#include <string>

// Magic number: "JXR1"
static constexpr u32 JXRELAY_MAGIC   = 0x4A585231u;
static constexpr u8  JXRELAY_VERSION = 1;

// Hard ceiling for one frame on the relay channel. Artifacts bigger than the
// chunk threshold are split so that no frame comes near it.
static constexpr u32 MAX_PAYLOAD_LEN = 4u * 1024u * 1024u;

// Policy defaults; both can be overridden on the command line.
static constexpr u32 DEFAULT_CHUNK_THRESHOLD    = 500u * 1024u;
static constexpr u32 DEFAULT_SESSION_TIMEOUT_MS = 60u * 1000u;

// Largest chunk threshold a sender may pick: two raw pieces plus framing
// must stay under MAX_PAYLOAD_LEN even when compression does not help.
static constexpr u32 MAX_CHUNK_THRESHOLD = (MAX_PAYLOAD_LEN - 64u * 1024u) / 2u;

// Fixed path on the ingestion sink
static constexpr const char* INGEST_PATH = "/caido-ingest";

// ---- Message Types ----
enum class MsgType : u16 {
    MT_HELLO          = 0x0001,
    MT_HELLO_ACK      = 0x0002,

    MT_SUBMIT_DIRECT  = 0x0010,  // whole artifact, under the chunk threshold
    MT_SUBMIT_CHUNK   = 0x0011,  // one chunk of a session

    MT_FETCH_URL      = 0x0020,

    MT_GET_SETTINGS   = 0x0030,
    MT_SAVE_SETTINGS  = 0x0031,

    MT_RESULT_OK      = 0x0050,  // payload = operation data
    MT_RESULT_ERR     = 0x0051,  // payload = error text

    MT_PING           = 0x0070,
    MT_PONG           = 0x0071,
};

// ---- Frame Header (8 bytes, big-endian on wire) ----
struct FrameHeader {
    u16 msg_type;
    u16 flags;
    u32 payload_len;
};
static_assert(sizeof(FrameHeader) == 8, "FrameHeader must be 8 bytes");

// ---- Capabilities bits ----
enum Capabilities : u16 {
    CAP_COMPRESS = 0x0001,  // chunk pieces may be zstd-compressed
};

// ---- Piece bits (ChunkHdr::presence / ChunkHdr::compressed) ----
enum PieceBits : u8 {
    PIECE_URL      = 0x01,
    PIECE_REQUEST  = 0x02,
    PIECE_RESPONSE = 0x04,
};

#pragma pack(push, 1)

// Hello: 8 bytes
struct Hello {
    u8  magic[4];
    u8  version;
    u8  pad;
    u16 capabilities;
};
static_assert(sizeof(Hello) == 8, "Hello size mismatch");

// HelloAck: 8 bytes
struct HelloAck {
    u16 capabilities;       // intersection of both sides
    u8  pad[2];
    u32 max_payload_len;
};
static_assert(sizeof(HelloAck) == 8, "HelloAck size mismatch");

// ChunkHdr: 28 bytes fixed, followed by
//   session id (session_id_len bytes)
//   [u32 len + url]            if presence & PIECE_URL
//   [u32 len + request bytes]  if presence & PIECE_REQUEST
//   [u32 len + response bytes] if presence & PIECE_RESPONSE
// raw_len / xxh3 always describe the uncompressed piece.
struct ChunkHdr {
    u32 chunk_index;
    u32 total_chunks;
    u8  presence;
    u8  compressed;
    u16 session_id_len;
    u32 request_raw_len;
    u32 request_xxh3;
    u32 response_raw_len;
    u32 response_xxh3;
};
static_assert(sizeof(ChunkHdr) == 28, "ChunkHdr size mismatch");

// DirectHdr: 16 bytes, followed by url, request, response (u32 len + bytes each)
struct DirectHdr {
    u8 xxh3_128[16];        // hash::payload_digest(request, response)
};
static_assert(sizeof(DirectHdr) == 16, "DirectHdr size mismatch");

#pragma pack(pop)

// Malformed frame, bad checksum, or a chunk that breaks session ordering.
// Kept apart from std::runtime_error so callers can tell protocol faults from
// transport faults.
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& what) : std::runtime_error(what) {}
};

// ---- Inline helpers ----
inline void hello_init(Hello& h, u16 caps) {
    h.magic[0] = 'J'; h.magic[1] = 'X'; h.magic[2] = 'R'; h.magic[3] = '1';
    h.version = JXRELAY_VERSION;
    h.pad = 0;
    h.capabilities = caps;
}

inline bool hello_valid_magic(const Hello& h) {
    return h.magic[0]=='J' && h.magic[1]=='X' && h.magic[2]=='R' && h.magic[3]=='1';
}

inline const char* msg_type_name(MsgType t) {
    switch (t) {
        case MsgType::MT_HELLO:         return "HELLO";
        case MsgType::MT_HELLO_ACK:     return "HELLO_ACK";
        case MsgType::MT_SUBMIT_DIRECT: return "SUBMIT_DIRECT";
        case MsgType::MT_SUBMIT_CHUNK:  return "SUBMIT_CHUNK";
        case MsgType::MT_FETCH_URL:     return "FETCH_URL";
        case MsgType::MT_GET_SETTINGS:  return "GET_SETTINGS";
        case MsgType::MT_SAVE_SETTINGS: return "SAVE_SETTINGS";
        case MsgType::MT_RESULT_OK:     return "RESULT_OK";
        case MsgType::MT_RESULT_ERR:    return "RESULT_ERR";
        case MsgType::MT_PING:          return "PING";
        case MsgType::MT_PONG:          return "PONG";
    }
    return "UNKNOWN";
}
