// ============================================================
// session_reassembler.cpp
// ============================================================

#include "session_reassembler.hpp"
#include "../common/hash.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"

SessionReassembler::SessionReassembler(IngestForwarder& forwarder,
                                       std::chrono::milliseconds session_timeout,
                                       Clock clock)
    : forwarder_(forwarder)
    , session_timeout_(session_timeout)
    , clock_(std::move(clock))
{}

Result<ChunkAck> SessionReassembler::submit_chunk(const Chunk& chunk) {
    try {
        std::unique_ptr<ChunkSession> finished;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            auto now = clock_();
            gc_locked(now);

            auto it = sessions_.find(chunk.session_id);
            if (it == sessions_.end()) {
                if (chunk.index != 0) {
                    Logger::get().relay_error("chunk " + std::to_string(chunk.index) +
                                              " for unknown session " + chunk.session_id);
                    return Result<ChunkAck>::fail("Session not found. Must start with chunk 0.");
                }
                if (chunk.total_chunks == 0) {
                    Logger::get().relay_error("session " + chunk.session_id + " announced 0 chunks");
                    return Result<ChunkAck>::fail("Invalid total chunk count 0");
                }
                auto session = std::make_unique<ChunkSession>();
                session->session_id    = chunk.session_id;
                session->url           = chunk.has_url ? chunk.url : std::string();
                session->total_chunks  = chunk.total_chunks;
                session->last_activity = now;
                it = sessions_.emplace(chunk.session_id, std::move(session)).first;
                LOG_INFO("Session created: " + chunk.session_id +
                         " chunks=" + std::to_string(chunk.total_chunks));
            }

            ChunkSession& s = *it->second;
            if (chunk.index != s.received_chunks) {
                Logger::get().relay_error("session " + s.session_id + ": expected chunk " +
                                          std::to_string(s.received_chunks) + ", got " +
                                          std::to_string(chunk.index));
                return Result<ChunkAck>::fail("Expected chunk " + std::to_string(s.received_chunks) +
                                              ", got " + std::to_string(chunk.index));
            }

            if (chunk.index == 0 && chunk.has_url && !chunk.url.empty()) {
                s.url = chunk.url;
            }
            if (chunk.has_request)  s.request_buf  += chunk.request_piece;
            if (chunk.has_response) s.response_buf += chunk.response_piece;
            ++s.received_chunks;
            s.last_activity = now;

            if (s.received_chunks < s.total_chunks) {
                LOG_DEBUG("Session " + s.session_id + ": chunk " + std::to_string(chunk.index + 1) +
                          "/" + std::to_string(s.total_chunks));
                ChunkAck ack;
                ack.complete = false;
                return Result<ChunkAck>::ok(ack);
            }

            // Detach under the lock: no other call can see this session again,
            // so the forward below runs at most once.
            finished = std::move(it->second);
            sessions_.erase(it);
        }
        return finish(std::move(finished));
    } catch (const std::exception& e) {
        Logger::get().relay_error("submit_chunk " + chunk.session_id + ": " + e.what());
        return Result<ChunkAck>::fail("Failed to process chunk: " + std::string(e.what()));
    }
}

Result<ChunkAck> SessionReassembler::finish(std::unique_ptr<ChunkSession> session) {
    Artifact artifact;
    artifact.url      = std::move(session->url);
    artifact.request  = std::move(session->request_buf);
    artifact.response = std::move(session->response_buf);

    LOG_INFO("Session complete: " + session->session_id + " " + artifact.url +
             " request=" + utils::format_bytes(artifact.request.size()) +
             " response=" + utils::format_bytes(artifact.response.size()) +
             " xxh3=" + hash::to_hex(hash::payload_digest(artifact.request, artifact.response)));

    Result<void> fwd = forwarder_.forward(artifact);
    if (!fwd) {
        return forward_failure<ChunkAck>(fwd);
    }
    ChunkAck ack;
    ack.complete = true;
    return Result<ChunkAck>::ok(ack);
}

size_t SessionReassembler::gc_sessions() {
    std::lock_guard<std::mutex> lk(mutex_);
    return gc_locked(clock_());
}

size_t SessionReassembler::gc_locked(std::chrono::steady_clock::time_point now) {
    size_t removed = 0;
    for (auto it = sessions_.begin(); it != sessions_.end(); ) {
        auto idle = now - it->second->last_activity;
        if (idle > session_timeout_) {
            LOG_INFO("Session GC: " + it->first + " (" +
                     std::to_string(it->second->received_chunks) + "/" +
                     std::to_string(it->second->total_chunks) + " chunks)");
            it = sessions_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t SessionReassembler::session_count() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return sessions_.size();
}

std::optional<u32> SessionReassembler::received_chunks(const std::string& session_id) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) return std::nullopt;
    return it->second->received_chunks;
}
