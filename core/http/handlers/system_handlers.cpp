#include <chrono>

#include "../../events/event_emitter.hpp"
#include "../../governor/rate_governor.hpp"
#include "../../logging/logger.hpp"
#include "../../registry/device_registry.hpp"
#include "../../state/state_store.hpp"
#include "../../sync/sync_coordinator.hpp"
#include "../json.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace skysync {
namespace http {

//=============================================================================
// GET /v0/runtime/status
//=============================================================================
void HttpServer::handle_get_runtime_status(const httplib::Request &, httplib::Response &res) {
    auto uptime =
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - started_at_).count();

    nlohmann::json response = {{"status", make_status(StatusCode::OK)},
                               {"uptime_seconds", uptime},
                               {"device_count", registry_.device_count()},
                               {"stale_device_count", store_.stale_device_count()},
                               {"quota", encode_ledger(governor_.snapshot())},
                               {"polling", encode_sync_stats(coordinator_.stats())},
                               {"sse_clients", sse_client_count_.load()}};

    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// POST /v0/polling - {"interval_ms": N}
//=============================================================================
void HttpServer::handle_post_polling(const httplib::Request &req, httplib::Response &res) {
    nlohmann::json body;
    if (!parse_json_body(req, res, body)) {
        return;
    }

    if (!body.contains("interval_ms") || !body["interval_ms"].is_number_integer()) {
        send_json(res, StatusCode::INVALID_ARGUMENT,
                  make_error_response(StatusCode::INVALID_ARGUMENT, "Missing integer field 'interval_ms'"));
        return;
    }

    std::string error;
    auto interval = std::chrono::milliseconds(body["interval_ms"].get<int64_t>());
    if (!coordinator_.set_poll_interval(interval, error)) {
        send_json(res, StatusCode::INVALID_ARGUMENT, make_error_response(StatusCode::INVALID_ARGUMENT, error));
        return;
    }

    nlohmann::json response = {{"status", make_status(StatusCode::OK)}, {"interval_ms", interval.count()}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// GET /v0/diagnostics
//=============================================================================
void HttpServer::handle_get_diagnostics(const httplib::Request &, httplib::Response &res) {
    nlohmann::json devices = nlohmann::json::array();
    for (const auto &device : registry_.get_all_devices()) {
        devices.push_back(encode_device(device));
    }

    nlohmann::json states = nlohmann::json::array();
    for (const auto &state : store_.read_all()) {
        states.push_back(encode_device_state(state));
    }

    nlohmann::json response = {{"status", make_status(StatusCode::OK)},
                               {"generated_at_epoch_ms", events::now_epoch_ms()},
                               {"config", diagnostics_config_},
                               {"quota", encode_ledger(governor_.snapshot())},
                               {"polling", encode_sync_stats(coordinator_.stats())},
                               {"devices", devices},
                               {"state", states}};
    if (event_emitter_) {
        response["events"] = {{"subscribers", event_emitter_->subscriber_count()},
                              {"max_subscribers", event_emitter_->max_subscribers()},
                              {"next_event_id", event_emitter_->next_event_id()}};
    }

    send_json(res, StatusCode::OK, response);
}

}  // namespace http
}  // namespace skysync
