/**
 * @file status.hpp
 * @brief Outcome of broker operations.
 *
 * @copyright Copyright (c) 2024 PubSubD Contributors
 * @license MIT License
 */

#pragma once

#include <string>
#include <utility>

namespace pubsubd {
namespace core {

/**
 * @brief Failure classes reported to callers.
 */
enum class StatusCode {
    OK,
    INVALID_ARGUMENT,  ///< Negative deadline, bad page token, malformed request
    NOT_FOUND,         ///< Topic or subscription absent (or deleted)
    ALREADY_EXISTS,    ///< Duplicate name on create
    UNAVAILABLE,       ///< Pull admission cap reached; retry with backoff
    CANCELLED          ///< Caller abandoned a waiting Pull
};

inline const char* statusCodeToString(StatusCode code) {
    switch (code) {
        case StatusCode::OK: return "OK";
        case StatusCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case StatusCode::NOT_FOUND: return "NOT_FOUND";
        case StatusCode::ALREADY_EXISTS: return "ALREADY_EXISTS";
        case StatusCode::UNAVAILABLE: return "UNAVAILABLE";
        case StatusCode::CANCELLED: return "CANCELLED";
        default: return "UNKNOWN";
    }
}

/**
 * @class Status
 * @brief A StatusCode plus a human-readable message.
 */
class Status {
public:
    Status() = default;
    Status(StatusCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    static Status OK() { return Status(); }

    static Status invalidArgument(std::string message) {
        return Status(StatusCode::INVALID_ARGUMENT, std::move(message));
    }
    static Status notFound(std::string message) {
        return Status(StatusCode::NOT_FOUND, std::move(message));
    }
    static Status alreadyExists(std::string message) {
        return Status(StatusCode::ALREADY_EXISTS, std::move(message));
    }
    static Status unavailable(std::string message) {
        return Status(StatusCode::UNAVAILABLE, std::move(message));
    }
    static Status cancelled(std::string message) {
        return Status(StatusCode::CANCELLED, std::move(message));
    }

    bool ok() const { return code_ == StatusCode::OK; }
    StatusCode code() const { return code_; }
    const std::string& message() const { return message_; }

private:
    StatusCode code_ = StatusCode::OK;
    std::string message_;
};

}  // namespace core
}  // namespace pubsubd
