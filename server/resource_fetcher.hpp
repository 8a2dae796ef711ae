#pragma once

// ============================================================
// resource_fetcher.hpp -- One outbound GET on behalf of a sender
//
// Returns the raw request text that was sent and the raw response
// bytes, ready to be relayed as an artifact.
// ============================================================

#include "../common/platform.hpp"
#include "../common/artifact.hpp"
#include "../common/result.hpp"
#include "../common/http_client.hpp"
#include <string>

class ResourceFetcher {
public:
    explicit ResourceFetcher(HttpTransport& http) : http_(http) {}

    Result<FetchedResource> fetch_url(const std::string& url);

    // Browser-like GET. Host carries the port unless it is 80 or 443.
    static std::string build_get_request(const HttpUrl& url);

private:
    HttpTransport& http_;
};
