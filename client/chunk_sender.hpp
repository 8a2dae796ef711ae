#pragma once

// ============================================================
// chunk_sender.hpp -- "Send this artifact" regardless of size
//
// Artifacts whose request + response fit the chunk threshold go out
// in one direct call. Larger ones get a fresh session id and are
// streamed as a strictly sequential run of chunk calls: call i is
// awaited before call i+1 is issued.
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include "../common/artifact.hpp"
#include "../common/result.hpp"
#include "relay_channel.hpp"
#include <functional>
#include <string>
#include <vector>

class ChunkSender {
public:
    using IdGenerator = std::function<std::string()>;

    // Throws std::invalid_argument unless 0 < threshold <= MAX_CHUNK_THRESHOLD
    explicit ChunkSender(RelayChannel& channel,
                         u32 threshold = DEFAULT_CHUNK_THRESHOLD,
                         IdGenerator next_id = IdGenerator());

    Result<void> send(const Artifact& artifact);

    u32 threshold() const { return threshold_; }

    // Split into threshold-sized pieces; the last one may be shorter.
    // Empty input yields no pieces.
    static std::vector<std::string> partition(const std::string& bytes, u32 threshold);

    // max(request pieces, response pieces)
    static u32 count_chunks(const Artifact& artifact, u32 threshold);

private:
    RelayChannel& channel_;
    u32           threshold_;
    IdGenerator   next_id_;

    Result<void> send_chunked(const Artifact& artifact);
};
