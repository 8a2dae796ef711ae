#pragma once

// ============================================================
// ingest_forwarder.hpp -- Delivers one complete artifact to the
//                         ingestion sink (POST /caido-ingest)
// ============================================================

#include "../common/platform.hpp"
#include "../common/artifact.hpp"
#include "../common/result.hpp"
#include "../common/settings.hpp"
#include "../common/http_client.hpp"
#include <string>

class IngestForwarder {
public:
    IngestForwarder(SettingsStore& settings, HttpTransport& http)
        : settings_(settings), http_(http) {}

    // One outbound call, no retry. Host and port come from the current
    // settings snapshot.
    Result<void> forward(const Artifact& artifact);

    // {"requestUrl": ..., "request": ..., "response": ...}
    static std::string build_body(const Artifact& artifact);

    static std::string build_request(const Settings& settings, const std::string& body);

private:
    SettingsStore& settings_;
    HttpTransport& http_;
};
