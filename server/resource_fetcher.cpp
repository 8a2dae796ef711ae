// ============================================================
// resource_fetcher.cpp
// ============================================================

#include "resource_fetcher.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"

namespace {

const char* const FETCH_USER_AGENT =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64; rv:145.0) Gecko/20100101 Firefox/145.0";
const char* const FETCH_ACCEPT_LANGUAGE = "fr,fr-FR;q=0.8,en-US;q=0.5,en;q=0.3";

} // namespace

std::string ResourceFetcher::build_get_request(const HttpUrl& url) {
    std::string host = url.host;
    if (url.port != 80 && url.port != 443) {
        host += ":" + std::to_string(url.port);
    }

    std::string req;
    req += "GET " + url.target + " HTTP/1.1\r\n";
    req += "Host: " + host + "\r\n";
    req += "User-Agent: " + std::string(FETCH_USER_AGENT) + "\r\n";
    req += "Accept: */*\r\n";
    req += "Accept-Language: " + std::string(FETCH_ACCEPT_LANGUAGE) + "\r\n";
    req += "Accept-Encoding: gzip, deflate\r\n";
    req += "Connection: keep-alive\r\n";
    req += "\r\n";
    return req;
}

Result<FetchedResource> ResourceFetcher::fetch_url(const std::string& url) {
    try {
        HttpUrl target = parse_http_url(url);

        FetchedResource res;
        res.request_raw  = build_get_request(target);
        res.response_raw = http_.exchange(target.host, target.port, target.scheme == "https",
                                          res.request_raw);
        if (res.response_raw.empty()) throw NoResponseError();

        LOG_INFO("Fetched " + url + " (" + utils::format_bytes(res.response_raw.size()) + ")");
        return Result<FetchedResource>::ok(std::move(res));
    } catch (const NoResponseError& e) {
        Logger::get().relay_error("no response fetching " + url);
        return Result<FetchedResource>::fail(e.what());
    } catch (const std::exception& e) {
        Logger::get().relay_error("failed to fetch URL " + url + ": " + e.what());
        return Result<FetchedResource>::fail("Failed to fetch URL: " + std::string(e.what()));
    }
}
