#ifndef SKYSYNC_TRANSPORT_HTTP_TRANSPORT_HPP
#define SKYSYNC_TRANSPORT_HTTP_TRANSPORT_HPP

#include <atomic>
#include <chrono>
#include <functional>
#include <string>

#include "governor/rate_governor.hpp"
#include "i_cloud_transport.hpp"

namespace skysync {
namespace transport {

struct HttpTransportConfig {
    std::string base_url = "https://openapi.api.govee.com";
    std::string base_path = "/router/api/v1";
    std::string api_key;
    int timeout_ms = 10000;
    int max_retries = 2;          // retries after the first attempt
    int backoff_base_ms = 1000;   // 1s, 2s, 4s, ...
};

/**
 * @brief Live cloud transport over cpp-httplib
 *
 * Retry policy:
 * - 5xx (except 429) and network failures are retried up to max_retries
 *   times with exponential backoff
 * - 4xx is never retried
 * - 429 (HTTP status or body code) is reported as QUOTA_EXHAUSTED
 * - send_command is not retried once bytes may have reached the server;
 *   such failures are AMBIGUOUS
 *
 * The first attempt is charged by the caller. Every retry is charged here
 * through the optional governor; a denied retry ends the loop.
 */
class HttpTransport : public ICloudTransport {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    HttpTransport(const HttpTransportConfig &config, governor::RateGovernor *governor = nullptr,
                  Sleeper sleeper = nullptr);

    bool list_devices(std::vector<DeviceDescriptor> &devices, TransportError &error) override;
    bool fetch_state(const DeviceAddress &device, nlohmann::json &payload, TransportError &error) override;
    bool send_command(const DeviceAddress &device, const nlohmann::json &capability, nlohmann::json &ack,
                      TransportError &error) override;

    std::string name() const override { return "http"; }

    uint64_t request_count() const { return request_count_.load(); }

private:
    enum class Method { GET, POST };

    bool execute(Method method, const std::string &endpoint, const nlohmann::json &body, bool is_command,
                 governor::CallPriority priority, nlohmann::json &response, TransportError &error);

    std::string make_request_id();

    HttpTransportConfig config_;
    governor::RateGovernor *governor_;
    Sleeper sleeper_;
    std::atomic<uint64_t> request_count_{0};
};

}  // namespace transport
}  // namespace skysync

#endif  // SKYSYNC_TRANSPORT_HTTP_TRANSPORT_HPP
