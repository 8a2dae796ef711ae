#pragma once

// ============================================================
// session_reassembler.hpp -- Chunked-transfer session table
//
// Owns every in-flight chunked transfer. Chunks of one session must
// arrive in index order starting at 0; when the last one lands the
// artifact is rebuilt, handed to the IngestForwarder once, and the
// session is dropped whatever the forward outcome.
//
// Idle sessions are swept at the start of every submit_chunk() call;
// there is no background thread.
// ============================================================

#include "../common/platform.hpp"
#include "../common/artifact.hpp"
#include "../common/result.hpp"
#include "ingest_forwarder.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

struct ChunkSession {
    std::string session_id;
    std::string url;
    std::string request_buf;
    std::string response_buf;
    u32 received_chunks{0};
    u32 total_chunks{0};
    std::chrono::steady_clock::time_point last_activity;

    ChunkSession() = default;
    ChunkSession(const ChunkSession&) = delete;
    ChunkSession& operator=(const ChunkSession&) = delete;
};

class SessionReassembler {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    SessionReassembler(IngestForwarder& forwarder,
                       std::chrono::milliseconds session_timeout,
                       Clock clock = &std::chrono::steady_clock::now);

    // Fold one chunk into its session. complete=true only on the call that
    // finished the session and forwarded it successfully.
    Result<ChunkAck> submit_chunk(const Chunk& chunk);

    // Drop sessions idle for longer than the timeout; returns how many
    size_t gc_sessions();

    size_t session_count() const;

    // received_chunks of a live session, nullopt if absent
    std::optional<u32> received_chunks(const std::string& session_id) const;

private:
    IngestForwarder&          forwarder_;
    std::chrono::milliseconds session_timeout_;
    Clock                     clock_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<ChunkSession>> sessions_;

    size_t gc_locked(std::chrono::steady_clock::time_point now);
    Result<ChunkAck> finish(std::unique_ptr<ChunkSession> session);
};
