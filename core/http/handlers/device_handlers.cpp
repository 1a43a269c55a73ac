#include "../../logging/logger.hpp"
#include "../../registry/device_registry.hpp"
#include "../../sync/sync_coordinator.hpp"
#include "../json.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace skysync {
namespace http {

//=============================================================================
// GET /v0/devices
//=============================================================================
void HttpServer::handle_get_devices(const httplib::Request &, httplib::Response &res) {
    auto devices = registry_.get_all_devices();

    nlohmann::json devices_json = nlohmann::json::array();
    for (const auto &device : devices) {
        devices_json.push_back(encode_device(device));
    }

    nlohmann::json response = {{"status", make_status(StatusCode::OK)}, {"devices", devices_json}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// GET /v0/devices/{device_id}
//=============================================================================
void HttpServer::handle_get_device(const httplib::Request &req, httplib::Response &res) {
    std::string device_id;
    if (!parse_device_param(req, device_id)) {
        send_json(res, StatusCode::INVALID_ARGUMENT,
                  make_error_response(StatusCode::INVALID_ARGUMENT, "Invalid path parameters"));
        return;
    }

    auto device = registry_.get_device_copy(device_id);
    if (!device) {
        send_json(res, StatusCode::NOT_FOUND,
                  make_error_response(StatusCode::NOT_FOUND, "Device not found: " + device_id));
        return;
    }

    nlohmann::json response = {{"status", make_status(StatusCode::OK)}, {"device", encode_device(*device)}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// POST /v0/devices/{device_id}/refresh
//=============================================================================
void HttpServer::handle_post_device_refresh(const httplib::Request &req, httplib::Response &res) {
    std::string device_id;
    if (!parse_device_param(req, device_id)) {
        send_json(res, StatusCode::INVALID_ARGUMENT,
                  make_error_response(StatusCode::INVALID_ARGUMENT, "Invalid path parameters"));
        return;
    }

    if (!registry_.has_device(device_id)) {
        send_json(res, StatusCode::NOT_FOUND,
                  make_error_response(StatusCode::NOT_FOUND, "Device not found: " + device_id));
        return;
    }

    coordinator_.request_refresh(device_id);
    LOG_INFO("[HTTP] Refresh requested for " << device_id);

    nlohmann::json response = {
        {"status", make_status(StatusCode::OK)}, {"device_id", device_id}, {"refresh_queued", true}};
    send_json(res, StatusCode::OK, response);
}

}  // namespace http
}  // namespace skysync
