#pragma once

// ============================================================
// artifact.hpp -- Units moved through the relay
// ============================================================

#include "platform.hpp"
#include <string>

// One captured request/response pair
struct Artifact {
    std::string url;
    std::string request;    // raw HTTP request text
    std::string response;   // raw HTTP response text

    u64 total_size() const { return (u64)request.size() + (u64)response.size(); }
};

// One fragment of a chunked artifact. Pieces are optional: the request and
// response streams are partitioned independently, so one may run out first.
struct Chunk {
    std::string session_id;
    u32         index{0};
    u32         total_chunks{1};

    bool        has_url{false};       // only meaningful when index == 0
    std::string url;
    bool        has_request{false};
    std::string request_piece;
    bool        has_response{false};
    std::string response_piece;
};

// Reply to one chunk submission
struct ChunkAck {
    bool complete{false};
};

// Result of a resource fetch
struct FetchedResource {
    std::string request_raw;
    std::string response_raw;
};
