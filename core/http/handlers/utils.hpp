#pragma once

#include <httplib.h>

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "../errors.hpp"

namespace skysync {
namespace http {

// Helper: Parse device_id from regex matches
inline bool parse_device_param(const httplib::Request &req, std::string &device_id) {
    if (req.matches.size() >= 2) {
        device_id = req.matches[1].str();
        return !device_id.empty();
    }
    return false;
}

// Helper: Send JSON response
inline void send_json(httplib::Response &res, StatusCode code, const nlohmann::json &body) {
    res.status = status_code_to_http(code);
    res.set_content(body.dump(), "application/json");
}

// Helper: Parse a JSON object body, replying 400 on failure
inline bool parse_json_body(const httplib::Request &req, httplib::Response &res, nlohmann::json &body) {
    try {
        body = nlohmann::json::parse(req.body);
    } catch (const nlohmann::json::parse_error &e) {
        send_json(res, StatusCode::INVALID_ARGUMENT,
                  make_error_response(StatusCode::INVALID_ARGUMENT, std::string("Invalid JSON: ") + e.what()));
        return false;
    }
    if (!body.is_object()) {
        send_json(res, StatusCode::INVALID_ARGUMENT,
                  make_error_response(StatusCode::INVALID_ARGUMENT, "Request body must be a JSON object"));
        return false;
    }
    return true;
}

/**
 * @brief Access-Control-Allow-Origin value for a request origin
 *
 * Allowlist entries are exact origins, "*" or a single-wildcard pattern
 * such as "http://*.local:8080". Returns "" when nothing matches.
 */
inline std::string cors_allow_origin(const std::vector<std::string> &allowlist, const std::string &origin) {
    for (const auto &allowed : allowlist) {
        if (allowed == "*") {
            return "*";
        }
        const auto star = allowed.find('*');
        if (star == std::string::npos) {
            if (allowed == origin) {
                return origin;
            }
            continue;
        }
        const auto head = allowed.substr(0, star);
        const auto tail = allowed.substr(star + 1);
        if (origin.size() >= head.size() + tail.size() && origin.compare(0, head.size(), head) == 0 &&
            origin.compare(origin.size() - tail.size(), tail.size(), tail) == 0) {
            return origin;
        }
    }
    return "";
}

}  // namespace http
}  // namespace skysync
