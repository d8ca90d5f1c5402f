#pragma once
#include <string>
#include <string_view>
#include <utility>

namespace uploader {

struct Result {
    bool ok{true};
    int err{0};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    // Same failure with "<context>: " in front of the message.
    Result WithContext(std::string_view context) const {
        if (ok) return *this;
        return Fail(err, std::string(context) + ": " + msg);
    }

    static Result Ok() { return {}; }
    static Result Fail(int e, std::string m) {
        return {.ok = false, .err = e, .msg = std::move(m)};
    }
};

} // namespace uploader
