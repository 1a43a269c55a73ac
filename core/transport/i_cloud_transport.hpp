#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace skysync {
namespace transport {

// How a failed call should be treated by the caller
enum class TransportErrorClass {
    NONE,
    RETRYABLE,        // 5xx or network failure; retries were exhausted
    FATAL,            // 4xx, malformed response, bad API key
    QUOTA_EXHAUSTED,  // HTTP 429 or API code 429
    AMBIGUOUS,        // command may or may not have been applied
    REJECTED          // device answered the command with status "failure"
};

inline const char *error_class_to_string(TransportErrorClass c) {
    switch (c) {
        case TransportErrorClass::NONE:
            return "NONE";
        case TransportErrorClass::RETRYABLE:
            return "RETRYABLE";
        case TransportErrorClass::FATAL:
            return "FATAL";
        case TransportErrorClass::QUOTA_EXHAUSTED:
            return "QUOTA_EXHAUSTED";
        case TransportErrorClass::AMBIGUOUS:
            return "AMBIGUOUS";
        case TransportErrorClass::REJECTED:
            return "REJECTED";
    }
    return "UNKNOWN";
}

struct TransportError {
    TransportErrorClass error_class = TransportErrorClass::NONE;
    int http_status = 0;  // 0 when no response was received
    std::string body;
    std::string message;
    int attempts = 0;
};

// Cloud address of a device
struct DeviceAddress {
    std::string device_id;  // vendor "device" field (MAC-like id)
    std::string sku;        // model, e.g. "H6008"
};

// One entry of the device list, capabilities still in vendor form
struct DeviceDescriptor {
    std::string device_id;
    std::string sku;
    std::string name;
    std::string type;  // e.g. "devices.types.light"
    nlohmann::json capabilities = nlohmann::json::array();
};

/**
 * @brief Interface to the vendor cloud API
 *
 * Implemented by HttpTransport (live API) and FixtureTransport (recorded
 * document). Each call returns false and fills @p error on failure.
 * Implementations must be safe to call from several threads.
 */
class ICloudTransport {
public:
    virtual ~ICloudTransport() = default;

    virtual bool list_devices(std::vector<DeviceDescriptor> &devices, TransportError &error) = 0;

    // On success @p payload holds {"capabilities": [...]}
    virtual bool fetch_state(const DeviceAddress &device, nlohmann::json &payload, TransportError &error) = 0;

    // @p capability is {"type", "instance", "value"}; @p ack receives the full response body
    virtual bool send_command(const DeviceAddress &device, const nlohmann::json &capability, nlohmann::json &ack,
                              TransportError &error) = 0;

    virtual std::string name() const = 0;
};

}  // namespace transport
}  // namespace skysync
