#include "http_transport.hpp"

#include <httplib.h>

#include <cstdio>
#include <random>
#include <thread>

#include "logging/logger.hpp"

namespace skysync {
namespace transport {

namespace {
constexpr int kStatusOk = 200;
constexpr int kStatusUnauthorized = 401;
constexpr int kStatusTooManyRequests = 429;
constexpr int kStatusServerError = 500;
constexpr int kStatusBadGateway = 502;
constexpr int kStatusGatewayTimeout = 504;
constexpr const char *kApiKeyHeader = "Govee-API-Key";

// Errors raised before any request bytes left this process
bool nothing_sent(httplib::Error err) {
    switch (err) {
        case httplib::Error::Connection:
        case httplib::Error::BindIPAddress:
        case httplib::Error::SSLConnection:
        case httplib::Error::SSLServerVerification:
        case httplib::Error::ProxyConnection:
            return true;
        default:
            return false;
    }
}

std::string string_field(const nlohmann::json &obj, const char *key, const std::string &fallback = "") {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

std::string body_message(const nlohmann::json &body) {
    if (body.contains("msg") && body["msg"].is_string()) return body["msg"].get<std::string>();
    if (body.contains("message") && body["message"].is_string()) return body["message"].get<std::string>();
    return "";
}
}  // namespace

HttpTransport::HttpTransport(const HttpTransportConfig &config, governor::RateGovernor *governor, Sleeper sleeper)
    : config_(config),
      governor_(governor),
      sleeper_(sleeper ? std::move(sleeper) : Sleeper([](std::chrono::milliseconds d) {
          std::this_thread::sleep_for(d);
      })) {}

std::string HttpTransport::make_request_id() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    uint64_t hi = rng();
    uint64_t lo = rng();

    // RFC 4122 version 4 layout
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx", static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF), static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48), static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return buf;
}

bool HttpTransport::execute(Method method, const std::string &endpoint, const nlohmann::json &body, bool is_command,
                            governor::CallPriority priority, nlohmann::json &response, TransportError &error) {
    const std::string path = config_.base_path + endpoint;
    const std::string verb = method == Method::GET ? "GET" : "POST";
    error = TransportError{};

    for (int attempt = 0; attempt <= config_.max_retries; ++attempt) {
        if (attempt > 0) {
            if (governor_ != nullptr && !governor_->try_acquire(priority).granted) {
                error.message += " (retry denied by quota)";
                LOG_WARN("[Transport] " << verb << " " << endpoint << ": retry " << attempt << " denied by quota");
                return false;
            }
            auto delay = std::chrono::milliseconds(static_cast<int64_t>(config_.backoff_base_ms) << (attempt - 1));
            LOG_DEBUG("[Transport] " << verb << " " << endpoint << ": retry " << attempt << " in " << delay.count()
                                     << "ms");
            sleeper_(delay);
        }

        error.attempts = attempt + 1;
        request_count_.fetch_add(1);

        // httplib::Client auto-detects scheme and handles SSL when built with OpenSSL
        httplib::Client client(config_.base_url);
        client.set_connection_timeout(std::chrono::milliseconds(config_.timeout_ms));
        client.set_read_timeout(std::chrono::milliseconds(config_.timeout_ms));
        client.set_write_timeout(std::chrono::milliseconds(config_.timeout_ms));

        httplib::Headers headers = {{kApiKeyHeader, config_.api_key}};

        auto result = method == Method::GET ? client.Get(path, headers)
                                            : client.Post(path, headers, body.dump(), "application/json");

        if (!result) {
            auto err = result.error();
            error.http_status = 0;
            error.body.clear();
            error.message = verb + " " + endpoint + ": " + httplib::to_string(err);

            if (is_command && !nothing_sent(err)) {
                error.error_class = TransportErrorClass::AMBIGUOUS;
                LOG_WARN("[Transport] " << error.message << " after sending command; outcome unknown");
                return false;
            }

            error.error_class = TransportErrorClass::RETRYABLE;
            LOG_WARN("[Transport] " << error.message << " (attempt " << error.attempts << ")");
            continue;
        }

        error.http_status = result->status;
        error.body = result->body;

        if (result->status == kStatusTooManyRequests) {
            error.error_class = TransportErrorClass::QUOTA_EXHAUSTED;
            error.message = verb + " " + endpoint + ": API quota exhausted (HTTP 429)";
            LOG_WARN("[Transport] " << error.message);
            return false;
        }

        // A gateway error means the command may have reached the device already
        if (is_command && (result->status == kStatusBadGateway || result->status == kStatusGatewayTimeout)) {
            error.error_class = TransportErrorClass::AMBIGUOUS;
            error.message = verb + " " + endpoint + ": HTTP " + std::to_string(result->status);
            LOG_WARN("[Transport] " << error.message << " after sending command; outcome unknown");
            return false;
        }

        if (result->status >= kStatusServerError) {
            error.error_class = TransportErrorClass::RETRYABLE;
            error.message = verb + " " + endpoint + ": HTTP " + std::to_string(result->status);
            LOG_WARN("[Transport] " << error.message << " (attempt " << error.attempts << ")");
            continue;
        }

        if (result->status < kStatusOk || result->status >= 300) {
            error.error_class = TransportErrorClass::FATAL;
            error.message = verb + " " + endpoint + ": HTTP " + std::to_string(result->status);
            if (result->status == kStatusUnauthorized) {
                error.message += " (invalid API key)";
            }
            LOG_ERROR("[Transport] " << error.message << " - " << result->body);
            return false;
        }

        nlohmann::json parsed = nlohmann::json::parse(result->body, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_object()) {
            error.error_class = is_command ? TransportErrorClass::AMBIGUOUS : TransportErrorClass::FATAL;
            error.message = verb + " " + endpoint + ": response is not a JSON object";
            LOG_ERROR("[Transport] " << error.message);
            return false;
        }

        if (parsed.contains("code") && parsed["code"].is_number_integer()) {
            int code = parsed["code"].get<int>();
            if (code == kStatusTooManyRequests) {
                error.error_class = TransportErrorClass::QUOTA_EXHAUSTED;
                error.message = verb + " " + endpoint + ": API quota exhausted (code 429)";
                LOG_WARN("[Transport] " << error.message);
                return false;
            }
            if (code != kStatusOk) {
                error.error_class = TransportErrorClass::FATAL;
                error.message = verb + " " + endpoint + ": API code " + std::to_string(code);
                std::string msg = body_message(parsed);
                if (!msg.empty()) {
                    error.message += " - " + msg;
                }
                LOG_ERROR("[Transport] " << error.message);
                return false;
            }
        }

        response = std::move(parsed);
        error = TransportError{};
        return true;
    }

    LOG_ERROR("[Transport] " << error.message << " - giving up after " << error.attempts << " attempts");
    return false;
}

bool HttpTransport::list_devices(std::vector<DeviceDescriptor> &devices, TransportError &error) {
    nlohmann::json response;
    if (!execute(Method::GET, "/user/devices", nlohmann::json(), false, governor::CallPriority::ROUTINE, response,
                 error)) {
        return false;
    }

    if (!response.contains("data") || !response["data"].is_array()) {
        error.error_class = TransportErrorClass::FATAL;
        error.message = "GET /user/devices: response has no data array";
        LOG_ERROR("[Transport] " << error.message);
        return false;
    }

    devices.clear();
    for (const auto &entry : response["data"]) {
        if (!entry.is_object() || !entry.contains("device") || !entry["device"].is_string()) {
            LOG_WARN("[Transport] Skipping device entry without id: " << entry.dump());
            continue;
        }
        DeviceDescriptor desc;
        desc.device_id = entry["device"].get<std::string>();
        desc.sku = string_field(entry, "sku");
        desc.name = string_field(entry, "deviceName", desc.device_id);
        desc.type = string_field(entry, "type");
        if (entry.contains("capabilities")) {
            desc.capabilities = entry["capabilities"];
        }
        devices.push_back(std::move(desc));
    }

    LOG_DEBUG("[Transport] Device list returned " << devices.size() << " device(s)");
    return true;
}

bool HttpTransport::fetch_state(const DeviceAddress &device, nlohmann::json &payload, TransportError &error) {
    nlohmann::json request = {{"requestId", make_request_id()},
                              {"payload", {{"sku", device.sku}, {"device", device.device_id}}}};

    nlohmann::json response;
    if (!execute(Method::POST, "/device/state", request, false, governor::CallPriority::ROUTINE, response, error)) {
        return false;
    }

    if (!response.contains("payload") || !response["payload"].is_object()) {
        error.error_class = TransportErrorClass::FATAL;
        error.message = "POST /device/state: response has no payload for " + device.device_id;
        LOG_ERROR("[Transport] " << error.message);
        return false;
    }

    payload = response["payload"];
    return true;
}

bool HttpTransport::send_command(const DeviceAddress &device, const nlohmann::json &capability, nlohmann::json &ack,
                                 TransportError &error) {
    nlohmann::json request = {
        {"requestId", make_request_id()},
        {"payload", {{"sku", device.sku}, {"device", device.device_id}, {"capability", capability}}}};

    nlohmann::json response;
    if (!execute(Method::POST, "/device/control", request, true, governor::CallPriority::USER, response, error)) {
        return false;
    }

    if (response.contains("capability") && response["capability"].is_object()) {
        const auto &cap = response["capability"];
        if (cap.contains("state") && cap["state"].is_object() && string_field(cap["state"], "status") == "failure") {
            const auto &state = cap["state"];
            error.error_class = TransportErrorClass::REJECTED;
            error.http_status = kStatusOk;
            error.body = response.dump();
            error.message = "device " + device.device_id + " rejected command";
            if (state.contains("errorCode")) {
                error.message += " (code " + state["errorCode"].dump() + ")";
            }
            if (state.contains("errorMsg") && state["errorMsg"].is_string()) {
                error.message += ": " + state["errorMsg"].get<std::string>();
            }
            LOG_WARN("[Transport] " << error.message);
            return false;
        }
    }

    ack = std::move(response);
    return true;
}

}  // namespace transport
}  // namespace skysync
