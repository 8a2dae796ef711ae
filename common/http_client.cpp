// ============================================================
// http_client.cpp
// ============================================================

#include "http_client.hpp"
#include "socket.hpp"
#include "logger.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <stdexcept>

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

namespace {

constexpr size_t kReadBufferSize = 16 * 1024;
constexpr size_t kMaxHeaderBytes = 1024 * 1024;

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t')) ++b;
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t' || s[e - 1] == '\r')) --e;
    return s.substr(b, e - b);
}

// True once a complete chunked body starting at `pos` is in `buf`
bool chunked_body_complete(const std::string& buf, size_t pos) {
    for (;;) {
        size_t eol = buf.find("\r\n", pos);
        if (eol == std::string::npos) return false;
        std::string size_line = buf.substr(pos, eol - pos);
        size_t semi = size_line.find(';');
        if (semi != std::string::npos) size_line.resize(semi);
        size_line = trim(size_line);
        if (size_line.empty()) {
            throw std::runtime_error("Malformed chunked encoding");
        }
        char* end = nullptr;
        unsigned long long n = std::strtoull(size_line.c_str(), &end, 16);
        if (!end || *end != '\0') {
            throw std::runtime_error("Malformed chunk size: " + size_line);
        }
        pos = eol + 2;
        if (n == 0) {
            // trailers, terminated by an empty line
            if (buf.compare(pos, 2, "\r\n") == 0) return true;
            return buf.find("\r\n\r\n", pos) != std::string::npos;
        }
        if (buf.size() < pos + n + 2) return false;
        pos += n + 2;
    }
}

bool response_has_no_body(const std::string& raw_request, int status) {
    if (status / 100 == 1 || status == 204 || status == 304) return true;
    return raw_request.compare(0, 5, "HEAD ") == 0;
}

// ---- TLS ----

void init_openssl_once() {
    static std::once_flag once;
    std::call_once(once, [] {
        OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS, nullptr);
    });
}

// Drains the OpenSSL error queue into one message
std::string ssl_error_text(const std::string& what) {
    std::string s = what;
    unsigned long e = ERR_get_error();
    if (e != 0) {
        char buf[256];
        ERR_error_string_n(e, buf, sizeof(buf));
        s += ": ";
        s += buf;
    }
    ERR_clear_error();
    return s;
}

// Client side of a TLS session over an already connected TcpSocket. The
// handshake verifies the certificate chain against the system store and
// the certificate name against `host`.
class TlsStream {
public:
    TlsStream(TcpSocket& sock, const std::string& host)
        : ctx_(nullptr, &SSL_CTX_free), ssl_(nullptr, &SSL_free)
    {
        init_openssl_once();
        ERR_clear_error();

        ctx_.reset(SSL_CTX_new(TLS_client_method()));
        if (!ctx_) throw std::runtime_error(ssl_error_text("SSL_CTX_new() failed"));
        SSL_CTX_set_verify(ctx_.get(), SSL_VERIFY_PEER, nullptr);
        if (SSL_CTX_set_default_verify_paths(ctx_.get()) != 1) {
            throw std::runtime_error(ssl_error_text("Cannot load system CA certificates"));
        }
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
        // Servers commonly close after the body without close_notify
        SSL_CTX_set_options(ctx_.get(), SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif

        ssl_.reset(SSL_new(ctx_.get()));
        if (!ssl_) throw std::runtime_error(ssl_error_text("SSL_new() failed"));

        bool ip_literal = utils::validate_ip(host);
        if (!ip_literal) SSL_set_tlsext_host_name(ssl_.get(), host.c_str());
        X509_VERIFY_PARAM* param = SSL_get0_param(ssl_.get());
        int name_ok = ip_literal ? X509_VERIFY_PARAM_set1_ip_asc(param, host.c_str())
                                 : X509_VERIFY_PARAM_set1_host(param, host.c_str(), host.size());
        if (name_ok != 1) {
            throw std::runtime_error(ssl_error_text("Cannot set TLS peer name " + host));
        }
        SSL_set_fd(ssl_.get(), (int)sock.native());

        int rc = SSL_connect(ssl_.get());
        if (rc != 1) {
            long verify = SSL_get_verify_result(ssl_.get());
            std::string msg = "TLS handshake with " + host + " failed";
            if (verify != X509_V_OK) {
                ERR_clear_error();
                throw std::runtime_error(msg + ": certificate verification failed: " +
                                         X509_verify_cert_error_string(verify));
            }
            throw std::runtime_error(ssl_error_text(msg));
        }
        LOG_DEBUG("TLS " + std::string(SSL_get_version(ssl_.get())) + " with " + host);
    }

    ~TlsStream() {
        if (ssl_) SSL_shutdown(ssl_.get());
    }

    TlsStream(const TlsStream&) = delete;
    TlsStream& operator=(const TlsStream&) = delete;

    void send_all(const char* data, size_t len) {
        while (len > 0) {
            int n = SSL_write(ssl_.get(), data, (int)std::min<size_t>(len, 1u << 20));
            if (n <= 0) {
                throw std::runtime_error(ssl_error_text("SSL_write() failed"));
            }
            data += n;
            len  -= (size_t)n;
        }
    }

    // 0 on orderly close
    size_t recv_some(char* buf, size_t len) {
        int n = SSL_read(ssl_.get(), buf, (int)len);
        if (n > 0) return (size_t)n;
        int err = SSL_get_error(ssl_.get(), n);
        if (err == SSL_ERROR_ZERO_RETURN) return 0;
        if (err == SSL_ERROR_SYSCALL && ERR_peek_error() == 0 && n == 0) return 0;
        throw std::runtime_error(ssl_error_text("SSL_read() failed"));
    }

private:
    std::unique_ptr<SSL_CTX, decltype(&SSL_CTX_free)> ctx_;
    std::unique_ptr<SSL, decltype(&SSL_free)>         ssl_;
};

} // namespace

std::string HttpUrl::host_header() const {
    bool default_port = (scheme == "http" && port == 80) || (scheme == "https" && port == 443);
    return default_port ? host : host + ":" + std::to_string(port);
}

HttpUrl parse_http_url(const std::string& url) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        throw std::runtime_error("Invalid URL: " + url);
    }

    HttpUrl u;
    u.scheme = utils::to_lower(url.substr(0, scheme_end));
    if (u.scheme != "http" && u.scheme != "https") {
        throw std::runtime_error("Unsupported URL scheme: " + u.scheme);
    }
    u.port = (u.scheme == "https") ? 443 : 80;

    std::string rest = url.substr(scheme_end + 3);
    size_t path_pos = rest.find_first_of("/?#");
    std::string authority = rest.substr(0, path_pos);
    std::string target = (path_pos == std::string::npos) ? "" : rest.substr(path_pos);

    size_t frag = target.find('#');
    if (frag != std::string::npos) target.resize(frag);
    if (target.empty() || target[0] != '/') target = "/" + target;
    u.target = target;

    size_t at = authority.rfind('@');
    if (at != std::string::npos) authority = authority.substr(at + 1);

    size_t colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']') == std::string::npos) {
        std::string port_str = authority.substr(colon + 1);
        authority.resize(colon);
        if (!port_str.empty()) {
            char* end = nullptr;
            long p = std::strtol(port_str.c_str(), &end, 10);
            if (!end || *end != '\0' || !utils::validate_port((int)p)) {
                throw std::runtime_error("Invalid port in URL: " + url);
            }
            u.port = (u16)p;
        }
    }
    if (authority.empty()) {
        throw std::runtime_error("Invalid URL (no host): " + url);
    }
    u.host = utils::to_lower(authority);
    return u;
}

bool parse_response_head(const std::string& raw, HttpResponseHead& head, size_t& body_start) {
    size_t end = raw.find("\r\n\r\n");
    if (end == std::string::npos) return false;
    body_start = end + 4;

    size_t line_end = raw.find("\r\n");
    std::string status_line = raw.substr(0, line_end);
    if (status_line.compare(0, 5, "HTTP/") != 0) return false;
    size_t sp1 = status_line.find(' ');
    if (sp1 == std::string::npos) return false;
    size_t sp2 = status_line.find(' ', sp1 + 1);
    std::string code = status_line.substr(sp1 + 1, sp2 == std::string::npos ? std::string::npos : sp2 - sp1 - 1);
    char* code_end = nullptr;
    long status = std::strtol(code.c_str(), &code_end, 10);
    if (code.size() != 3 || !code_end || *code_end != '\0') return false;
    head.status = (int)status;
    head.reason = (sp2 == std::string::npos) ? "" : status_line.substr(sp2 + 1);

    head.headers.clear();
    size_t pos = line_end + 2;
    while (pos < end) {
        size_t eol = raw.find("\r\n", pos);
        std::string line = raw.substr(pos, eol - pos);
        pos = eol + 2;
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        head.headers[utils::to_lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
    return true;
}

std::string TcpHttpTransport::exchange(const std::string& host, u16 port, bool tls,
                                       const std::string& raw_request)
{
    TcpSocket sock;
    sock.connect(host, port);
    if (timeout_ms_ > 0) sock.set_recv_timeout_ms(timeout_ms_);

    std::unique_ptr<TlsStream> tls_stream;
    if (tls) tls_stream = std::make_unique<TlsStream>(sock, host);

    if (tls_stream) tls_stream->send_all(raw_request.data(), raw_request.size());
    else            sock.send_all(raw_request.data(), raw_request.size());

    std::string raw;
    char buf[kReadBufferSize];

    auto read_more = [&]() -> bool {
        size_t n = tls_stream ? tls_stream->recv_some(buf, sizeof(buf))
                              : sock.recv_some(buf, sizeof(buf));
        if (n == 0) return false;
        raw.append(buf, n);
        if (raw.size() > max_response_) {
            throw std::runtime_error("Response from " + host + " exceeds " +
                                     utils::format_bytes(max_response_));
        }
        return true;
    };

    HttpResponseHead head;
    size_t body_start = 0;
    while (!parse_response_head(raw, head, body_start)) {
        if (raw.find("\r\n\r\n") != std::string::npos) {
            throw std::runtime_error("Malformed response from " + host);
        }
        if (raw.size() > kMaxHeaderBytes) {
            throw std::runtime_error("Response headers from " + host + " too large");
        }
        if (!read_more()) {
            if (raw.empty()) throw NoResponseError();
            throw std::runtime_error("Connection closed inside response headers");
        }
    }

    LOG_DEBUG(std::string(tls ? "HTTPS " : "HTTP ") + std::to_string(head.status) +
              " from " + host + ":" + std::to_string(port));

    if (response_has_no_body(raw_request, head.status)) {
        raw.resize(body_start);
        return raw;
    }

    auto te = head.headers.find("transfer-encoding");
    auto cl = head.headers.find("content-length");
    if (te != head.headers.end() && utils::to_lower(te->second).find("chunked") != std::string::npos) {
        while (!chunked_body_complete(raw, body_start)) {
            if (!read_more()) throw std::runtime_error("Connection closed inside chunked body");
        }
    } else if (cl != head.headers.end()) {
        char* end = nullptr;
        unsigned long long len = std::strtoull(cl->second.c_str(), &end, 10);
        if (!end || *end != '\0') {
            throw std::runtime_error("Bad Content-Length: " + cl->second);
        }
        if (len > max_response_) {
            throw std::runtime_error("Response from " + host + " exceeds " +
                                     utils::format_bytes(max_response_));
        }
        while (raw.size() < body_start + len) {
            if (!read_more()) throw std::runtime_error("Connection closed inside response body");
        }
        raw.resize(body_start + (size_t)len);
    } else {
        // no framing: body runs to connection close
        while (read_more()) {}
    }
    return raw;
}
