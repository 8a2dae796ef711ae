#pragma once

// ============================================================
// platform.hpp -- Fixed-width aliases and the socket handle type
//
// Only what every jxrelay header needs. Address resolution and
// TCP option headers are pulled in by socket.cpp alone.
// ============================================================

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>

using u8  = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;
using i64 = int64_t;

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  ifndef NOMINMAX
#    define NOMINMAX
#  endif
#  include <winsock2.h>
#  include <ws2tcpip.h>
#  pragma comment(lib, "ws2_32.lib")

using socket_t = SOCKET;
#  define INVALID_SOCKET_VAL INVALID_SOCKET
#  define SOCKET_ERROR_VAL   SOCKET_ERROR
#  define CLOSE_SOCKET(s)    closesocket(s)
#else
#  include <sys/types.h>
#  include <sys/socket.h>
#  include <unistd.h>
#  include <errno.h>
#  include <csignal>

using socket_t = int;
#  define INVALID_SOCKET_VAL (-1)
#  define SOCKET_ERROR_VAL   (-1)
#  define CLOSE_SOCKET(s)    ::close(s)
#endif

inline int last_socket_error() {
#ifdef _WIN32
    return WSAGetLastError();
#else
    return errno;
#endif
}

// A receive timeout surfaces as one of these
inline bool would_block(int err) {
#ifdef _WIN32
    return err == WSAEWOULDBLOCK || err == WSAETIMEDOUT;
#else
    return err == EAGAIN || err == EWOULDBLOCK;
#endif
}

inline std::string socket_error_str(int err) {
#ifdef _WIN32
    char buf[256] = {0};
    FormatMessageA(FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
                   nullptr, err, 0, buf, sizeof(buf), nullptr);
    std::string s = buf;
    while (!s.empty() && (s.back() == '\r' || s.back() == '\n')) s.pop_back();
    return s + " (err=" + std::to_string(err) + ")";
#else
    return std::string(std::strerror(err)) + " (errno=" + std::to_string(err) + ")";
#endif
}

namespace platform {

// Winsock start-up on Windows. On POSIX, ignore SIGPIPE: a peer that drops
// mid-reply must surface as a send error, not kill the process.
inline void init() {
#ifdef _WIN32
    WSADATA wsa;
    int rc = WSAStartup(MAKEWORD(2, 2), &wsa);
    if (rc != 0) {
        throw std::runtime_error("WSAStartup failed: " + std::to_string(rc));
    }
#else
    std::signal(SIGPIPE, SIG_IGN);
#endif
}

inline void cleanup() {
#ifdef _WIN32
    WSACleanup();
#endif
}

struct Guard {
    Guard()  { init(); }
    ~Guard() { cleanup(); }
    Guard(const Guard&) = delete;
    Guard& operator=(const Guard&) = delete;
};

} // namespace platform
