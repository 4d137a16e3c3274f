#pragma once
#include <cerrno>
#include <cstring>
#include <string>
#include <string_view>
#include <utility>

namespace updater {

// err carries an errno-style code: EBUSY, EPERM, ECANCELED, a syscall errno, or -1.
struct Result {
    bool ok{true};
    int err{0};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    bool busy() const { return !ok && err == EBUSY; }
    bool cancelled() const { return !ok && err == ECANCELED; }

    // Prefixes msg with "<context>: " on failure.
    Result WithContext(std::string_view context) const {
        if (ok) return *this;
        return Fail(err, std::string(context) + ": " + msg);
    }

    static Result Ok() { return {}; }
    static Result Fail(int e, std::string m) {
        return {.ok = false, .err = e, .msg = std::move(m)};
    }
    // Captures errno: "<what> (<strerror>)".
    static Result FromErrno(std::string what) {
        const int e = errno;
        return Fail(e, std::move(what) + " (" + std::strerror(e) + ")");
    }
};

} // namespace updater
