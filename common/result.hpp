#pragma once

// ============================================================
// result.hpp -- Tagged success/failure value returned by every
//               public relay operation
// ============================================================

#include <string>
#include <utility>

template<typename T>
struct Result {
    bool        success{false};
    T           data{};
    std::string error;

    static Result ok(T value) {
        Result r;
        r.success = true;
        r.data    = std::move(value);
        return r;
    }

    static Result fail(std::string message) {
        Result r;
        r.success = false;
        r.error   = std::move(message);
        return r;
    }

    explicit operator bool() const { return success; }
};

template<>
struct Result<void> {
    bool        success{false};
    std::string error;

    static Result ok() {
        Result r;
        r.success = true;
        return r;
    }

    static Result fail(std::string message) {
        Result r;
        r.success = false;
        r.error   = std::move(message);
        return r;
    }

    explicit operator bool() const { return success; }
};

// Carry a failure across result types
template<typename To, typename From>
inline Result<To> forward_failure(const Result<From>& r) {
    return Result<To>::fail(r.error);
}
