#include "../../control/command_dispatcher.hpp"
#include "../../logging/logger.hpp"
#include "../../registry/device_registry.hpp"
#include "../json.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace skysync {
namespace http {

//=============================================================================
// POST /v0/command
//=============================================================================
void HttpServer::handle_post_command(const httplib::Request &req, httplib::Response &res) {
    nlohmann::json request_json;
    if (!parse_json_body(req, res, request_json)) {
        return;
    }

    if (!request_json.contains("device_id") || !request_json["device_id"].is_string()) {
        send_json(res, StatusCode::INVALID_ARGUMENT,
                  make_error_response(StatusCode::INVALID_ARGUMENT, "Missing string field 'device_id'"));
        return;
    }
    if (!request_json.contains("instance") || !request_json["instance"].is_string()) {
        send_json(res, StatusCode::INVALID_ARGUMENT,
                  make_error_response(StatusCode::INVALID_ARGUMENT, "Missing string field 'instance'"));
        return;
    }
    if (!request_json.contains("value")) {
        send_json(res, StatusCode::INVALID_ARGUMENT,
                  make_error_response(StatusCode::INVALID_ARGUMENT, "Missing field 'value'"));
        return;
    }

    control::CommandRequest command;
    command.device_id = request_json["device_id"].get<std::string>();
    command.instance = request_json["instance"].get<std::string>();

    // Shape the value by the declared kind when the capability is known;
    // unknown devices and capabilities are reported by the dispatcher
    auto device = registry_.get_device_copy(command.device_id);
    const capability::CapabilitySpec *spec = device ? device->find_capability(command.instance) : nullptr;

    std::string error;
    if (!decode_value(request_json["value"], spec, command.value, error)) {
        send_json(res, StatusCode::INVALID_ARGUMENT, make_error_response(StatusCode::INVALID_ARGUMENT, error));
        return;
    }

    auto result = dispatcher_.dispatch(command);

    if (!result.success) {
        StatusCode status = error_kind_to_status(result.error_kind);
        LOG_WARN("[HTTP] Command failed: " << result.error_message << " ("
                                           << control::error_kind_to_string(result.error_kind) << "), returning "
                                           << status_code_to_http(status));

        nlohmann::json response = make_error_response(status, result.error_message);
        response["error_kind"] = control::error_kind_to_string(result.error_kind);
        if (result.error_kind == control::ErrorKind::QUOTA_EXHAUSTED) {
            auto retry_after_s = (result.retry_after.count() + 999) / 1000;
            response["retry_after_ms"] = result.retry_after.count();
            res.set_header("Retry-After", std::to_string(retry_after_s));
        }
        send_json(res, status, response);
        return;
    }

    nlohmann::json response = {{"status", make_status(StatusCode::OK)},
                               {"device_id", command.device_id},
                               {"instance", command.instance},
                               {"applied_value", encode_value(result.applied_value)}};
    send_json(res, StatusCode::OK, response);
}

}  // namespace http
}  // namespace skysync
