#pragma once

// ============================================================
// relay_codec.hpp -- Payload encoding for relay RPC frames
//
// Decoders throw ProtocolError on malformed input, bad checksums or
// failed decompression; encoders throw std::runtime_error when a
// value cannot fit a frame.
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include "artifact.hpp"
#include <vector>
#include <string>

namespace codec {

// compress / allow_compressed: CAP_COMPRESS was negotiated for this link
std::vector<u8> encode_chunk(const Chunk& chunk, bool compress);
Chunk           decode_chunk(const std::vector<u8>& payload, bool allow_compressed);

std::vector<u8> encode_artifact(const Artifact& artifact);
Artifact        decode_artifact(const std::vector<u8>& payload);

std::vector<u8> encode_chunk_ack(const ChunkAck& ack);
ChunkAck        decode_chunk_ack(const std::vector<u8>& payload);

std::vector<u8>  encode_fetched(const FetchedResource& res);
FetchedResource  decode_fetched(const std::vector<u8>& payload);

std::vector<u8> encode_string(const std::string& s);
std::string     decode_string(const std::vector<u8>& payload);

} // namespace codec
