#include "device_registry.hpp"

#include <mutex>
#include <sstream>
#include <unordered_set>

#include "capability/capability_codec.hpp"
#include "logging/logger.hpp"

namespace skysync {
namespace registry {

Device build_device(const transport::DeviceDescriptor &descriptor) {
    Device device;
    device.device_id = descriptor.device_id;
    device.sku = descriptor.sku;
    device.name = descriptor.name;
    device.type = descriptor.type;

    std::vector<capability::ParseIssue> issues;
    device.capabilities = capability::parse_declarations(descriptor.device_id, descriptor.capabilities, issues);
    for (const auto &issue : issues) {
        LOG_WARN("[Registry] " << capability::describe_issue(issue));
    }
    return device;
}

std::string declaration_signature(const std::vector<capability::CapabilitySpec> &specs) {
    std::ostringstream sig;
    for (const auto &spec : specs) {
        sig << spec.instance << '|' << spec.type << '|' << capability::kind_to_string(spec.kind) << '|'
            << spec.range.min << ':' << spec.range.max << ':' << spec.range.step;
        for (const auto &opt : spec.options) {
            sig << '|' << opt.name << '=' << opt.value.dump();
        }
        for (const auto &field : spec.fields) {
            sig << '|' << field.name << '#' << static_cast<int>(field.type);
        }
        sig << ';';
    }
    return sig.str();
}

ReconcileResult DeviceRegistry::reconcile(const std::vector<Device> &devices) {
    ReconcileResult result;
    std::unique_lock<std::shared_mutex> lock(mutex_);

    std::unordered_set<std::string> incoming;
    std::vector<Device> next;
    std::unordered_map<std::string, size_t> next_index;

    for (const auto &device : devices) {
        if (!incoming.insert(device.device_id).second) {
            LOG_WARN("[Registry] Duplicate device id in device list: " << device.device_id);
            continue;
        }

        auto it = id_to_index_.find(device.device_id);
        if (it == id_to_index_.end()) {
            result.added.push_back(device.device_id);
        } else if (declaration_signature(devices_[it->second].capabilities) !=
                   declaration_signature(device.capabilities)) {
            result.changed.push_back(device.device_id);
        }

        next_index[device.device_id] = next.size();
        next.push_back(device);
    }

    for (const auto &existing : devices_) {
        if (incoming.count(existing.device_id) == 0) {
            result.removed.push_back(existing.device_id);
        }
    }

    devices_ = std::move(next);
    id_to_index_ = std::move(next_index);

    if (!result.empty()) {
        LOG_INFO("[Registry] Inventory updated: " << result.added.size() << " added, " << result.removed.size()
                                                  << " removed, " << result.changed.size() << " changed, "
                                                  << devices_.size() << " total");
    }
    return result;
}

std::optional<Device> DeviceRegistry::get_device_copy(const std::string &device_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = id_to_index_.find(device_id);
    if (it == id_to_index_.end()) {
        return std::nullopt;
    }
    return devices_[it->second];
}

std::vector<Device> DeviceRegistry::get_all_devices() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return devices_;
}

bool DeviceRegistry::has_device(const std::string &device_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return id_to_index_.count(device_id) != 0;
}

size_t DeviceRegistry::device_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return devices_.size();
}

}  // namespace registry
}  // namespace skysync
