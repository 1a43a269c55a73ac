#include <chrono>

#include "../../events/event_emitter.hpp"
#include "../../logging/logger.hpp"
#include "../../state/state_store.hpp"
#include "../json.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace skysync {
namespace http {

//=============================================================================
// GET /v0/state
//=============================================================================
void HttpServer::handle_get_state(const httplib::Request &, httplib::Response &res) {
    auto states = store_.read_all();

    nlohmann::json devices_json = nlohmann::json::array();
    for (const auto &state : states) {
        devices_json.push_back(encode_device_state(state));
    }

    nlohmann::json response = {{"status", make_status(StatusCode::OK)},
                               {"generated_at_epoch_ms", events::now_epoch_ms()},
                               {"devices", devices_json}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// GET /v0/state/{device_id}[?instance=a&instance=b]
//=============================================================================
void HttpServer::handle_get_device_state(const httplib::Request &req, httplib::Response &res) {
    std::string device_id;
    if (!parse_device_param(req, device_id)) {
        send_json(res, StatusCode::INVALID_ARGUMENT,
                  make_error_response(StatusCode::INVALID_ARGUMENT, "Invalid path parameters"));
        return;
    }

    auto state = store_.read(device_id);
    if (!state) {
        send_json(res, StatusCode::NOT_FOUND,
                  make_error_response(StatusCode::NOT_FOUND, "Device not found: " + device_id));
        return;
    }

    // Optional instance filter
    if (req.has_param("instance")) {
        std::map<std::string, state::CachedCapability> filtered;
        auto range = req.params.equal_range("instance");
        for (auto it = range.first; it != range.second; ++it) {
            auto cap = state->capabilities.find(it->second);
            if (cap != state->capabilities.end()) {
                filtered.insert(*cap);
            }
        }
        state->capabilities = std::move(filtered);
    }

    nlohmann::json response = encode_device_state(*state);
    response["status"] = make_status(StatusCode::OK);
    response["generated_at_epoch_ms"] = events::now_epoch_ms();
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// GET /v0/events (SSE - Server-Sent Events)
//=============================================================================
void HttpServer::handle_get_events(const httplib::Request &req, httplib::Response &res) {
    if (!event_emitter_) {
        send_json(res, StatusCode::UNAVAILABLE,
                  make_error_response(StatusCode::UNAVAILABLE, "Event streaming not enabled"));
        return;
    }

    if (event_emitter_->at_capacity()) {
        LOG_WARN("[SSE] Client rejected: max subscribers (" << event_emitter_->max_subscribers() << ") reached");
        send_json(res, StatusCode::UNAVAILABLE, make_error_response(StatusCode::UNAVAILABLE, "Too many SSE clients"));
        return;
    }

    events::EventFilter filter;
    if (req.has_param("device_id")) {
        filter.device_id = req.get_param_value("device_id");
    }
    if (req.has_param("instance")) {
        filter.capability = req.get_param_value("instance");
    }

    // Subscribe to events (shared_ptr for lambda capture)
    std::string client_name = "sse-" + std::to_string(sse_client_count_.load() + 1);
    std::shared_ptr<events::Subscription> subscription(event_emitter_->subscribe(filter, 0, client_name).release());

    if (!subscription) {
        LOG_ERROR("[SSE] Failed to create subscription");
        send_json(res, StatusCode::UNAVAILABLE,
                  make_error_response(StatusCode::UNAVAILABLE, "Failed to subscribe to events"));
        return;
    }

    sse_client_count_++;

    res.set_header("Cache-Control", "no-cache");
    res.set_header("Connection", "keep-alive");
    res.set_header("X-Accel-Buffering", "no");  // Disable nginx buffering

    // Per-client keep-alive counter
    auto keepalive_counter = std::make_shared<int>(0);

    res.set_chunked_content_provider(
        "text/event-stream",
        [this, subscription, client_name, keepalive_counter](size_t, httplib::DataSink &sink) {
            if (!running_.load()) {
                return false;
            }

            // Queue overflowed: the client must re-read /v0/state
            if (uint64_t missed = subscription->take_missed()) {
                std::string lagged = "event: lagged\ndata: " + nlohmann::json({{"missed", missed}}).dump() + "\n\n";
                if (!sink.write(lagged.c_str(), lagged.size())) {
                    return false;
                }
            }

            // 1 second timeout allows periodic keep-alive
            auto event_opt = subscription->pop(1000);

            if (event_opt) {
                std::string sse_data = format_sse_event(*event_opt);
                if (!sink.write(sse_data.c_str(), sse_data.size())) {
                    LOG_WARN("[SSE] Write failed for " << client_name);
                    return false;
                }
                *keepalive_counter = 0;
            } else if (++(*keepalive_counter) >= 15) {
                std::string keepalive = ": keepalive\n\n";
                if (!sink.write(keepalive.c_str(), keepalive.size())) {
                    LOG_WARN("[SSE] Keep-alive failed for " << client_name);
                    return false;
                }
                *keepalive_counter = 0;
            }

            return true;
        },
        [this, subscription](bool) {
            subscription->unsubscribe();
            sse_client_count_--;
        });
}

std::string HttpServer::format_sse_event(const events::Event &event) {
    std::string result = "event: " + event_type_name(event) + "\n";
    result += "id: " + std::to_string(events::get_event_id(event)) + "\n";
    result += "data: " + encode_event(event).dump() + "\n\n";
    return result;
}

}  // namespace http
}  // namespace skysync
