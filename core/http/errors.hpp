#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "control/command_dispatcher.hpp"

namespace skysync {
namespace http {

/**
 * @brief API status codes mapped to HTTP status codes
 *
 * - OK -> HTTP 200
 * - INVALID_ARGUMENT -> HTTP 400
 * - NOT_FOUND -> HTTP 404
 * - RESOURCE_EXHAUSTED -> HTTP 429
 * - INTERNAL -> HTTP 500
 * - BAD_GATEWAY -> HTTP 502
 * - UNAVAILABLE -> HTTP 503
 * - DEADLINE_EXCEEDED -> HTTP 504
 */
enum class StatusCode {
    OK,
    INVALID_ARGUMENT,
    NOT_FOUND,
    RESOURCE_EXHAUSTED,
    BAD_GATEWAY,
    UNAVAILABLE,
    DEADLINE_EXCEEDED,
    INTERNAL
};

inline int status_code_to_http(StatusCode code) {
    switch (code) {
        case StatusCode::OK:
            return 200;
        case StatusCode::INVALID_ARGUMENT:
            return 400;
        case StatusCode::NOT_FOUND:
            return 404;
        case StatusCode::RESOURCE_EXHAUSTED:
            return 429;
        case StatusCode::BAD_GATEWAY:
            return 502;
        case StatusCode::UNAVAILABLE:
            return 503;
        case StatusCode::DEADLINE_EXCEEDED:
            return 504;
        case StatusCode::INTERNAL:
            return 500;
    }
    return 500;
}

inline std::string status_code_to_string(StatusCode code) {
    switch (code) {
        case StatusCode::OK:
            return "OK";
        case StatusCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case StatusCode::NOT_FOUND:
            return "NOT_FOUND";
        case StatusCode::RESOURCE_EXHAUSTED:
            return "RESOURCE_EXHAUSTED";
        case StatusCode::BAD_GATEWAY:
            return "BAD_GATEWAY";
        case StatusCode::UNAVAILABLE:
            return "UNAVAILABLE";
        case StatusCode::DEADLINE_EXCEEDED:
            return "DEADLINE_EXCEEDED";
        case StatusCode::INTERNAL:
            return "INTERNAL";
    }
    return "INTERNAL";
}

// Command error kind -> API status
inline StatusCode error_kind_to_status(control::ErrorKind kind) {
    switch (kind) {
        case control::ErrorKind::NONE:
            return StatusCode::OK;
        case control::ErrorKind::INVALID_COMMAND_VALUE:
        case control::ErrorKind::MALFORMED_CAPABILITY:
            return StatusCode::INVALID_ARGUMENT;
        case control::ErrorKind::UNKNOWN_DEVICE:
        case control::ErrorKind::UNKNOWN_CAPABILITY:
            return StatusCode::NOT_FOUND;
        case control::ErrorKind::QUOTA_EXHAUSTED:
            return StatusCode::RESOURCE_EXHAUSTED;
        case control::ErrorKind::TRANSPORT:
        case control::ErrorKind::COMMAND_REJECTED:
            return StatusCode::BAD_GATEWAY;
        case control::ErrorKind::AMBIGUOUS_COMMAND_RESULT:
            return StatusCode::DEADLINE_EXCEEDED;
    }
    return StatusCode::INTERNAL;
}

/**
 * @brief Build a JSON status object
 *
 * All HTTP responses include a top-level "status" object with code and message.
 */
inline nlohmann::json make_status(StatusCode code, const std::string &message = "") {
    std::string msg = message.empty() ? (code == StatusCode::OK ? "ok" : status_code_to_string(code)) : message;
    return {{"code", status_code_to_string(code)}, {"message", msg}};
}

inline nlohmann::json make_error_response(StatusCode code, const std::string &message) {
    return {{"status", make_status(code, message)}};
}

}  // namespace http
}  // namespace skysync
