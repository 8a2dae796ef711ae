#pragma once

// ============================================================
// compress.hpp -- zstd wrapper for chunk pieces on the relay channel
// ============================================================

#include "platform.hpp"
#include <string>
#include <stdexcept>

#include <zstd.h>

namespace compress {

// Compression level 1 = fastest
static constexpr int ZSTD_LEVEL = 1;

// Pieces smaller than this are sent raw; the frame overhead outweighs the gain
static constexpr size_t MIN_COMPRESS_LEN = 1024;

inline size_t max_compressed_size(size_t input_size) {
    return ZSTD_compressBound(input_size);
}

inline std::string compress_str(const std::string& src) {
    std::string out(max_compressed_size(src.size()), '\0');
    size_t sz = ZSTD_compress(&out[0], out.size(), src.data(), src.size(), ZSTD_LEVEL);
    if (ZSTD_isError(sz)) {
        throw std::runtime_error(std::string("ZSTD compress error: ") + ZSTD_getErrorName(sz));
    }
    out.resize(sz);
    return out;
}

// raw_len is the size announced by the sender; anything else is corruption.
// The frame's own content size is checked first so a lying header cannot
// drive the allocation.
inline std::string decompress_str(const std::string& src, size_t raw_len) {
    unsigned long long frame_len = ZSTD_getFrameContentSize(src.data(), src.size());
    if (frame_len == ZSTD_CONTENTSIZE_ERROR) {
        throw std::runtime_error("ZSTD decompress error: not a zstd frame");
    }
    if (frame_len != ZSTD_CONTENTSIZE_UNKNOWN && frame_len != raw_len) {
        throw std::runtime_error("ZSTD frame holds " + std::to_string(frame_len) +
                                 " bytes, expected " + std::to_string(raw_len));
    }
    std::string out(raw_len, '\0');
    size_t sz = ZSTD_decompress(raw_len ? &out[0] : nullptr, raw_len, src.data(), src.size());
    if (ZSTD_isError(sz)) {
        throw std::runtime_error(std::string("ZSTD decompress error: ") + ZSTD_getErrorName(sz));
    }
    if (sz != raw_len) {
        throw std::runtime_error("ZSTD decompress size mismatch: got " + std::to_string(sz) +
                                 ", expected " + std::to_string(raw_len));
    }
    return out;
}

// Compress only when it pays off. Returns true and fills `out` when the
// compressed form is smaller than the input.
inline bool try_compress(const std::string& src, std::string& out) {
    if (src.size() < MIN_COMPRESS_LEN) return false;
    std::string packed = compress_str(src);
    if (packed.size() >= src.size()) return false;
    out = std::move(packed);
    return true;
}

} // namespace compress
