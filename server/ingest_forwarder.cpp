// ============================================================
// ingest_forwarder.cpp
// ============================================================

#include "ingest_forwarder.hpp"
#include "../common/protocol.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <nlohmann/json.hpp>

std::string IngestForwarder::build_body(const Artifact& artifact) {
    nlohmann::json j = {
        {"requestUrl", artifact.url},
        {"request", artifact.request},
        {"response", artifact.response},
    };
    // Raw captures are not guaranteed to be UTF-8; invalid sequences become U+FFFD
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string IngestForwarder::build_request(const Settings& settings, const std::string& body) {
    HttpUrl sink;
    sink.scheme = "http";
    sink.host   = settings.host;
    sink.port   = settings.port;

    std::string req;
    req.reserve(body.size() + 256);
    req += "POST ";
    req += INGEST_PATH;
    req += " HTTP/1.1\r\n";
    req += "Host: " + sink.host_header() + "\r\n";
    req += "content-type: application/json\r\n";
    req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    req += "Connection: close\r\n";
    req += "\r\n";
    req += body;
    return req;
}

Result<void> IngestForwarder::forward(const Artifact& artifact) {
    try {
        std::shared_ptr<const Settings> settings = settings_.current();
        std::string request = build_request(*settings, build_body(artifact));

        std::string raw = http_.exchange(settings->host, settings->port, false, request);

        HttpResponseHead head;
        size_t body_start = 0;
        if (parse_response_head(raw, head, body_start) && head.status / 100 != 2) {
            LOG_WARN("Ingestion sink answered " + std::to_string(head.status) +
                     " for " + artifact.url);
        }
        LOG_DEBUG("Forwarded " + artifact.url + " (" +
                  utils::format_bytes(artifact.total_size()) + ") to " +
                  settings->host + ":" + std::to_string(settings->port));
        return Result<void>::ok();
    } catch (const std::exception& e) {
        Logger::get().relay_error("failed to send request " + artifact.url + ": " + e.what());
        return Result<void>::fail("Failed to send request to ingestion sink: " + std::string(e.what()));
    }
}
