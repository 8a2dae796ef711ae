// ============================================================
// chunk_sender.cpp
// ============================================================

#include "chunk_sender.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <algorithm>
#include <stdexcept>

ChunkSender::ChunkSender(RelayChannel& channel, u32 threshold, IdGenerator next_id)
    : channel_(channel)
    , threshold_(threshold)
    , next_id_(next_id ? std::move(next_id) : IdGenerator(&utils::generate_session_id))
{
    if (threshold_ == 0 || threshold_ > MAX_CHUNK_THRESHOLD) {
        throw std::invalid_argument("Chunk threshold must be 1-" +
                                    std::to_string(MAX_CHUNK_THRESHOLD) + " bytes, got " +
                                    std::to_string(threshold_));
    }
}

std::vector<std::string> ChunkSender::partition(const std::string& bytes, u32 threshold) {
    std::vector<std::string> pieces;
    if (threshold == 0) return pieces;
    pieces.reserve((bytes.size() + threshold - 1) / threshold);
    for (size_t off = 0; off < bytes.size(); off += threshold) {
        pieces.push_back(bytes.substr(off, threshold));
    }
    return pieces;
}

u32 ChunkSender::count_chunks(const Artifact& artifact, u32 threshold) {
    if (threshold == 0) return 0;
    u64 req  = ((u64)artifact.request.size()  + threshold - 1) / threshold;
    u64 resp = ((u64)artifact.response.size() + threshold - 1) / threshold;
    return (u32)std::max(req, resp);
}

Result<void> ChunkSender::send(const Artifact& artifact) {
    try {
        if (artifact.total_size() <= threshold_) {
            LOG_DEBUG("Direct send " + artifact.url + " (" +
                      utils::format_bytes(artifact.total_size()) + ")");
            return channel_.submit_direct(artifact);
        }
        return send_chunked(artifact);
    } catch (const std::exception& e) {
        Logger::get().relay_error("send " + artifact.url + ": " + e.what());
        return Result<void>::fail(e.what());
    }
}

Result<void> ChunkSender::send_chunked(const Artifact& artifact) {
    std::vector<std::string> req_pieces  = partition(artifact.request,  threshold_);
    std::vector<std::string> resp_pieces = partition(artifact.response, threshold_);
    u32 total = count_chunks(artifact, threshold_);

    std::string session_id = next_id_();
    LOG_INFO("Chunked send " + artifact.url + " (" +
             utils::format_bytes(artifact.total_size()) + ") as " +
             std::to_string(total) + " chunks, session " + session_id);

    for (u32 i = 0; i < total; ++i) {
        Chunk chunk;
        chunk.session_id   = session_id;
        chunk.index        = i;
        chunk.total_chunks = total;
        if (i == 0) {
            chunk.has_url = true;
            chunk.url     = artifact.url;
        }
        if (i < req_pieces.size()) {
            chunk.has_request   = true;
            chunk.request_piece = std::move(req_pieces[i]);
        }
        if (i < resp_pieces.size()) {
            chunk.has_response   = true;
            chunk.response_piece = std::move(resp_pieces[i]);
        }

        Result<ChunkAck> r = channel_.submit_chunk(chunk);
        if (!r) {
            Logger::get().relay_error("session " + session_id + " chunk " +
                                      std::to_string(i) + ": " + r.error);
            return forward_failure<void>(r);
        }
        if (r.data.complete) {
            LOG_DEBUG("Session " + session_id + " complete after chunk " + std::to_string(i));
            return Result<void>::ok();
        }
    }

    Logger::get().relay_error("session " + session_id + ": no completion after " +
                              std::to_string(total) + " chunks");
    return Result<void>::fail("Failed to send chunks: not all chunks were processed");
}
