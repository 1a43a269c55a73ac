#include "fixture_transport.hpp"

#include <fstream>

#include "logging/logger.hpp"

namespace skysync {
namespace transport {

bool FixtureTransport::load_file(const std::string &path, std::string &error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error = "Cannot open fixture file: " + path;
        return false;
    }

    nlohmann::json document = nlohmann::json::parse(file, nullptr, false);
    if (document.is_discarded()) {
        error = "Fixture file is not valid JSON: " + path;
        return false;
    }

    if (!load(document, error)) {
        error = path + ": " + error;
        return false;
    }

    LOG_INFO("[Fixture] Loaded " << devices_.size() << " device(s) from " << path);
    return true;
}

bool FixtureTransport::load(const nlohmann::json &document, std::string &error) {
    if (!document.is_object() || !document.contains("data") || !document["data"].is_object()) {
        error = "fixture document has no 'data' object";
        return false;
    }
    const auto &data = document["data"];

    std::vector<DeviceDescriptor> devices;
    if (data.contains("cloud_devices")) {
        if (!data["cloud_devices"].is_array()) {
            error = "'cloud_devices' must be an array";
            return false;
        }
        for (const auto &entry : data["cloud_devices"]) {
            if (!entry.is_object() || !entry.contains("device") || !entry["device"].is_string()) {
                error = "cloud_devices entry without 'device' id";
                return false;
            }
            DeviceDescriptor desc;
            desc.device_id = entry["device"].get<std::string>();
            desc.sku = entry.contains("sku") && entry["sku"].is_string() ? entry["sku"].get<std::string>() : "";
            desc.name = entry.contains("deviceName") && entry["deviceName"].is_string()
                            ? entry["deviceName"].get<std::string>()
                            : desc.device_id;
            desc.type = entry.contains("type") && entry["type"].is_string() ? entry["type"].get<std::string>() : "";
            if (entry.contains("capabilities")) {
                desc.capabilities = entry["capabilities"];
            }
            devices.push_back(std::move(desc));
        }
    }

    std::unordered_map<std::string, nlohmann::json> states;
    if (data.contains("cloud_states")) {
        if (!data["cloud_states"].is_object()) {
            error = "'cloud_states' must be an object keyed by device id";
            return false;
        }
        for (auto it = data["cloud_states"].begin(); it != data["cloud_states"].end(); ++it) {
            nlohmann::json state = it.value();
            // Accept both a bare payload and a full device/state response
            if (state.is_object() && state.contains("payload") && state["payload"].is_object()) {
                state = state["payload"];
            }
            if (!state.is_object() || !state.contains("capabilities") || !state["capabilities"].is_array()) {
                error = "cloud_states['" + it.key() + "'] has no capabilities array";
                return false;
            }
            states[it.key()] = state;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    devices_ = std::move(devices);
    states_ = std::move(states);
    return true;
}

bool FixtureTransport::list_devices(std::vector<DeviceDescriptor> &devices, TransportError &error) {
    (void)error;
    std::lock_guard<std::mutex> lock(mutex_);
    devices = devices_;
    return true;
}

bool FixtureTransport::fetch_state(const DeviceAddress &device, nlohmann::json &payload, TransportError &error) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(device.device_id);
    if (it == states_.end()) {
        error.error_class = TransportErrorClass::FATAL;
        error.http_status = 0;
        error.message = "no recorded state for " + device.device_id;
        return false;
    }

    payload = it->second;
    payload["sku"] = device.sku;
    payload["device"] = device.device_id;
    return true;
}

bool FixtureTransport::send_command(const DeviceAddress &device, const nlohmann::json &capability,
                                    nlohmann::json &ack, TransportError &error) {
    if (!capability.is_object() || !capability.contains("instance") || !capability["instance"].is_string()) {
        error.error_class = TransportErrorClass::FATAL;
        error.http_status = 400;
        error.message = "command payload has no instance";
        return false;
    }

    const std::string instance = capability["instance"].get<std::string>();
    command_count_.fetch_add(1);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto &state = states_[device.device_id];
        if (!state.is_object() || !state.contains("capabilities")) {
            state = {{"capabilities", nlohmann::json::array()}};
        }

        bool updated = false;
        for (auto &entry : state["capabilities"]) {
            if (entry.is_object() && entry.value("instance", std::string()) == instance) {
                entry["state"] = {{"value", capability.value("value", nlohmann::json())}};
                updated = true;
                break;
            }
        }
        if (!updated) {
            state["capabilities"].push_back({{"type", capability.value("type", std::string())},
                                             {"instance", instance},
                                             {"state", {{"value", capability.value("value", nlohmann::json())}}}});
        }
    }

    LOG_DEBUG("[Fixture] Simulated command " << instance << " on " << device.device_id);

    nlohmann::json echoed = capability;
    echoed["state"] = {{"status", "success"}};
    ack = {{"requestId", "fixture"}, {"msg", "success"}, {"code", 200}, {"capability", echoed}};
    return true;
}

}  // namespace transport
}  // namespace skysync
