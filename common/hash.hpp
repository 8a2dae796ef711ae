#pragma once

// ============================================================
// hash.hpp -- xxHash3 wrappers used for chunk and artifact integrity
// ============================================================

#include "platform.hpp"
#include "utils.hpp"
#include <cstddef>
#include <array>
#include <string>
#include <stdexcept>

#define XXH_STATIC_LINKING_ONLY
#include <xxhash.h>

namespace hash {

using Hash128 = std::array<u8, 16>;

namespace detail {

inline Hash128 to_array(XXH128_hash_t h) {
    Hash128 result;
    // big-endian, high half first
    for (int i = 0; i < 8; ++i) {
        result[i]     = (u8)(h.high64 >> (56 - 8 * i));
        result[i + 8] = (u8)(h.low64  >> (56 - 8 * i));
    }
    return result;
}

} // namespace detail

inline Hash128 xxh3_128(const void* data, size_t len) {
    return detail::to_array(XXH3_128bits(data, len));
}

// Lower 32 bits of xxh3_64; carried per piece in every chunk frame
inline u32 xxh3_32(const void* data, size_t len) {
    return (u32)(XXH3_64bits(data, len) & 0xFFFFFFFFull);
}

inline u32 xxh3_32(const std::string& s) {
    return xxh3_32(s.data(), s.size());
}

// Streaming hasher for xxh3_128, used to digest request+response without
// concatenating them.
class StreamHasher128 {
public:
    StreamHasher128() {
        state_ = XXH3_createState();
        if (!state_) throw std::runtime_error("XXH3_createState failed");
        reset();
    }

    ~StreamHasher128() {
        if (state_) XXH3_freeState(state_);
    }

    StreamHasher128(const StreamHasher128&) = delete;
    StreamHasher128& operator=(const StreamHasher128&) = delete;

    void reset() {
        XXH3_128bits_reset(state_);
    }

    void update(const void* data, size_t len) {
        XXH3_128bits_update(state_, data, len);
    }

    void update(const std::string& s) {
        update(s.data(), s.size());
    }

    Hash128 digest() const {
        return detail::to_array(XXH3_128bits_digest(state_));
    }

private:
    XXH3_state_t* state_;
};

// Digest of an artifact's two payloads. Each payload is preceded by its
// length so ("ab","c") and ("a","bc") hash differently.
inline Hash128 payload_digest(const std::string& request, const std::string& response) {
    StreamHasher128 h;
    u8 len_buf[8];
    for (const std::string* part : {&request, &response}) {
        u64 n = part->size();
        for (int i = 0; i < 8; ++i) len_buf[i] = (u8)(n >> (56 - 8 * i));
        h.update(len_buf, sizeof(len_buf));
        h.update(*part);
    }
    return h.digest();
}

inline std::string to_hex(const Hash128& h) {
    return utils::to_hex(h.data(), h.size());
}

} // namespace hash
