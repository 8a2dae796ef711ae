#pragma once

// ============================================================
// protocol_io.hpp -- Byte order, fixed-header codecs and payload
//                    builders for relay frames
// ============================================================

#include "protocol.hpp"
#include <string>
#include <vector>
#include <stdexcept>

// Linux: htobe16/32/64 and be16/32/64toh live in <endian.h>
#ifndef _WIN32
#  include <endian.h>
#endif

namespace proto {

// ---- Byte-order helpers ----

inline u16 hton16(u16 v) {
#if defined(_WIN32)
    return htons(v);
#else
    return htobe16(v);
#endif
}

inline u32 hton32(u32 v) {
#if defined(_WIN32)
    return htonl(v);
#else
    return htobe32(v);
#endif
}

inline u16 ntoh16(u16 v) {
#if defined(_WIN32)
    return ntohs(v);
#else
    return be16toh(v);
#endif
}

inline u32 ntoh32(u32 v) {
#if defined(_WIN32)
    return ntohl(v);
#else
    return be32toh(v);
#endif
}

// ---- FrameHeader ----

inline void encode_header(const FrameHeader& h, u8 buf[8]) {
    u16 mt = hton16(h.msg_type);
    u16 fl = hton16(h.flags);
    u32 pl = hton32(h.payload_len);
    std::memcpy(buf,     &mt, 2);
    std::memcpy(buf + 2, &fl, 2);
    std::memcpy(buf + 4, &pl, 4);
}

inline FrameHeader decode_header(const u8 buf[8]) {
    FrameHeader h;
    u16 mt, fl; u32 pl;
    std::memcpy(&mt, buf,     2);
    std::memcpy(&fl, buf + 2, 2);
    std::memcpy(&pl, buf + 4, 4);
    h.msg_type    = ntoh16(mt);
    h.flags       = ntoh16(fl);
    h.payload_len = ntoh32(pl);
    return h;
}

// ---- Fixed structs (in-place, host<->network) ----

inline void encode_hello(Hello& h)   { h.capabilities = hton16(h.capabilities); }
inline void decode_hello(Hello& h)   { h.capabilities = ntoh16(h.capabilities); }

inline void encode_hello_ack(HelloAck& a) {
    a.capabilities    = hton16(a.capabilities);
    a.max_payload_len = hton32(a.max_payload_len);
}

inline void decode_hello_ack(HelloAck& a) {
    a.capabilities    = ntoh16(a.capabilities);
    a.max_payload_len = ntoh32(a.max_payload_len);
}

inline void encode_chunk_hdr(ChunkHdr& c) {
    c.chunk_index      = hton32(c.chunk_index);
    c.total_chunks     = hton32(c.total_chunks);
    c.session_id_len   = hton16(c.session_id_len);
    c.request_raw_len  = hton32(c.request_raw_len);
    c.request_xxh3     = hton32(c.request_xxh3);
    c.response_raw_len = hton32(c.response_raw_len);
    c.response_xxh3    = hton32(c.response_xxh3);
}

inline void decode_chunk_hdr(ChunkHdr& c) {
    c.chunk_index      = ntoh32(c.chunk_index);
    c.total_chunks     = ntoh32(c.total_chunks);
    c.session_id_len   = ntoh16(c.session_id_len);
    c.request_raw_len  = ntoh32(c.request_raw_len);
    c.request_xxh3     = ntoh32(c.request_xxh3);
    c.response_raw_len = ntoh32(c.response_raw_len);
    c.response_xxh3    = ntoh32(c.response_xxh3);
}

// ---- Payload builder ----

class PayloadWriter {
public:
    PayloadWriter() = default;
    explicit PayloadWriter(size_t reserve) { buf_.reserve(reserve); }

    void put_raw(const void* data, size_t len) {
        const u8* p = static_cast<const u8*>(data);
        buf_.insert(buf_.end(), p, p + len);
    }


    void put_u32(u32 v) {
        u32 n = hton32(v);
        put_raw(&n, 4);
    }

    // u32 length + bytes
    void put_blob(const std::string& s) {
        if (s.size() > MAX_PAYLOAD_LEN) {
            throw std::runtime_error("Blob too large for a relay frame: " + std::to_string(s.size()));
        }
        put_u32((u32)s.size());
        put_raw(s.data(), s.size());
    }

    std::vector<u8>&       bytes()       { return buf_; }
    const std::vector<u8>& bytes() const { return buf_; }
    size_t size() const { return buf_.size(); }

private:
    std::vector<u8> buf_;
};

// ---- Payload reader; throws ProtocolError on truncation ----

class PayloadReader {
public:
    PayloadReader(const u8* data, size_t len) : data_(data), len_(len) {}
    explicit PayloadReader(const std::vector<u8>& v) : data_(v.data()), len_(v.size()) {}

    void get_raw(void* out, size_t n) {
        need(n);
        std::memcpy(out, data_ + pos_, n);
        pos_ += n;
    }

    u8 get_u8() {
        u8 v;
        get_raw(&v, 1);
        return v;
    }

    u32 get_u32() {
        u32 v;
        get_raw(&v, 4);
        return ntoh32(v);
    }

    std::string get_bytes(size_t n) {
        need(n);
        std::string s(reinterpret_cast<const char*>(data_ + pos_), n);
        pos_ += n;
        return s;
    }

    std::string get_blob() {
        u32 n = get_u32();
        return get_bytes(n);
    }

    size_t remaining() const { return len_ - pos_; }
    bool   at_end() const    { return pos_ == len_; }

private:
    void need(size_t n) const {
        if (n > len_ - pos_) {
            throw ProtocolError("Truncated payload: need " + std::to_string(n) +
                                " bytes, have " + std::to_string(len_ - pos_));
        }
    }

    const u8* data_;
    size_t    len_;
    size_t    pos_{0};
};

} // namespace proto
