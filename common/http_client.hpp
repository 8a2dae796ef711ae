#pragma once

// ============================================================
// http_client.hpp -- Minimal HTTP/1.1 exchange over TcpSocket
//
// Used for the two outbound calls the relay makes: the POST to the
// ingestion sink and the GET behind resource fetches. Requests are
// built by the caller as raw text; the transport returns the raw
// response bytes exactly as received. https goes through OpenSSL with
// peer and hostname verification.
// ============================================================

#include "platform.hpp"
#include <string>
#include <map>
#include <stdexcept>

struct HttpUrl {
    std::string scheme;   // "http" or "https", lower case
    std::string host;
    u16         port{80};
    std::string target;   // path + query, always starts with '/'

    // "host" or "host:port" when the port is not the scheme default
    std::string host_header() const;
};

// Throws std::runtime_error on anything that is not an absolute http(s) URL
HttpUrl parse_http_url(const std::string& url);

struct HttpResponseHead {
    int         status{0};
    std::string reason;
    std::map<std::string, std::string> headers;  // names lower-cased
};

// Parse the status line and headers at the start of a raw response.
// Returns false when the header block is incomplete or malformed.
bool parse_response_head(const std::string& raw, HttpResponseHead& head, size_t& body_start);

// Peer accepted the connection and closed it without sending anything
class NoResponseError : public std::runtime_error {
public:
    NoResponseError() : std::runtime_error("No response received") {}
};

// Seam for outbound HTTP. exchange() sends one raw request, over TLS when
// `tls` is set, and returns the raw response; it throws std::runtime_error
// on transport failure and NoResponseError when the peer closes without
// answering.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual std::string exchange(const std::string& host, u16 port, bool tls,
                                 const std::string& raw_request) = 0;
};

class TcpHttpTransport : public HttpTransport {
public:
    // Responses larger than this are refused
    static constexpr size_t DEFAULT_MAX_RESPONSE = 64u * 1024u * 1024u;

    explicit TcpHttpTransport(int timeout_ms = 30000,
                              size_t max_response = DEFAULT_MAX_RESPONSE)
        : timeout_ms_(timeout_ms), max_response_(max_response) {}

    std::string exchange(const std::string& host, u16 port, bool tls,
                         const std::string& raw_request) override;

private:
    int    timeout_ms_;
    size_t max_response_;
};
