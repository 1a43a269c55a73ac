#ifndef SKYSYNC_TRANSPORT_FIXTURE_TRANSPORT_HPP
#define SKYSYNC_TRANSPORT_FIXTURE_TRANSPORT_HPP

#include <atomic>
#include <mutex>
#include <string>
#include <unordered_map>

#include "i_cloud_transport.hpp"

namespace skysync {
namespace transport {

/**
 * @brief Offline transport backed by a recorded API document
 *
 * Document layout:
 *   {"data": {"cloud_devices": [<user/devices entries>],
 *             "cloud_states": {"<device id>": {"capabilities": [...]}}}}
 *
 * Commands always succeed and are written into the in-memory states so the
 * next fetch_state echoes them. The file is never written back.
 */
class FixtureTransport : public ICloudTransport {
public:
    FixtureTransport() = default;

    bool load_file(const std::string &path, std::string &error);
    bool load(const nlohmann::json &document, std::string &error);

    bool list_devices(std::vector<DeviceDescriptor> &devices, TransportError &error) override;
    bool fetch_state(const DeviceAddress &device, nlohmann::json &payload, TransportError &error) override;
    bool send_command(const DeviceAddress &device, const nlohmann::json &capability, nlohmann::json &ack,
                      TransportError &error) override;

    std::string name() const override { return "fixture"; }

    uint64_t command_count() const { return command_count_.load(); }

private:
    mutable std::mutex mutex_;
    std::vector<DeviceDescriptor> devices_;
    std::unordered_map<std::string, nlohmann::json> states_;  // device id -> {"capabilities": [...]}
    std::atomic<uint64_t> command_count_{0};
};

}  // namespace transport
}  // namespace skysync

#endif  // SKYSYNC_TRANSPORT_FIXTURE_TRANSPORT_HPP
