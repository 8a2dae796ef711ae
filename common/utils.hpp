#pragma once

// ============================================================
// utils.hpp -- Small helpers shared by the daemon and the sender
// ============================================================

#include "platform.hpp"
#include <string>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <sstream>
#include <iomanip>
#include <mutex>
#include <random>

namespace utils {

// Current time in milliseconds since epoch
inline u64 now_ms() {
    using namespace std::chrono;
    return (u64)duration_cast<milliseconds>(
        system_clock::now().time_since_epoch()
    ).count();
}

// Format bytes as human-readable (e.g., "1.23 MB")
inline std::string format_bytes(u64 bytes) {
    if (bytes < 1024ULL) {
        return std::to_string(bytes) + " B";
    }
    static const char* const units[] = {"KB", "MB", "GB"};
    double v = (double)bytes / 1024.0;
    int u = 0;
    while (v >= 1024.0 && u < 2) {
        v /= 1024.0;
        ++u;
    }
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << v << " " << units[u];
    return ss.str();
}

// Validate IPv4 address string
inline bool validate_ip(const std::string& ip) {
    int a, b, c, d;
    char tail;
    if (sscanf(ip.c_str(), "%d.%d.%d.%d%c", &a, &b, &c, &d, &tail) != 4) return false;
    return (a >= 0 && a <= 255) && (b >= 0 && b <= 255) &&
           (c >= 0 && c <= 255) && (d >= 0 && d <= 255);
}

// Validate port number (1-65535)
inline bool validate_port(int port) {
    return port >= 1 && port <= 65535;
}

inline std::string to_hex(const u8* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

// Chunked-transfer session id: "<ms since epoch>-<32 hex chars>".
// The random half comes from a random_device-seeded 64-bit engine, so two
// senders starting in the same millisecond still collide with probability
// around 2^-128.
inline std::string generate_session_id() {
    static std::mutex mu;
    static std::mt19937_64 gen([] {
        std::random_device rd;
        std::seed_seq seq{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
        return std::mt19937_64(seq);
    }());

    u8 rnd[16];
    {
        std::lock_guard<std::mutex> lk(mu);
        u64 a = gen();
        u64 b = gen();
        for (int i = 0; i < 8; ++i) {
            rnd[i]     = (u8)(a >> (i * 8));
            rnd[i + 8] = (u8)(b >> (i * 8));
        }
    }
    return std::to_string(now_ms()) + "-" + to_hex(rnd, sizeof(rnd));
}

inline std::string to_lower(std::string s) {
    for (auto& c : s) {
        if (c >= 'A' && c <= 'Z') c = (char)(c + 32);
    }
    return s;
}

} // namespace utils
