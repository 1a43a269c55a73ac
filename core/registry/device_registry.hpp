#ifndef SKYSYNC_REGISTRY_DEVICE_REGISTRY_HPP
#define SKYSYNC_REGISTRY_DEVICE_REGISTRY_HPP

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "capability/capability_types.hpp"
#include "transport/i_cloud_transport.hpp"

namespace skysync {
namespace registry {

// Registered device: immutable identity plus its declared capabilities
struct Device {
    std::string device_id;
    std::string sku;
    std::string name;
    std::string type;
    std::vector<capability::CapabilitySpec> capabilities;  // declaration order

    transport::DeviceAddress address() const { return transport::DeviceAddress{device_id, sku}; }

    const capability::CapabilitySpec *find_capability(const std::string &instance) const {
        return capability::find_spec(capabilities, instance);
    }
};

// Outcome of applying a fresh device list
struct ReconcileResult {
    std::vector<std::string> added;
    std::vector<std::string> removed;
    std::vector<std::string> changed;  // same id, different capability declaration

    bool empty() const { return added.empty() && removed.empty() && changed.empty(); }
};

// Convert a device-list entry into a Device; malformed declarations are logged and skipped
Device build_device(const transport::DeviceDescriptor &descriptor);

// Stable fingerprint of a capability declaration, used to detect changes
std::string declaration_signature(const std::vector<capability::CapabilitySpec> &specs);

/**
 * Thread Safety:
 * - All read methods use shared_lock (concurrent reads safe)
 * - All write methods use unique_lock (exclusive access)
 * - Returns by-value so callers never hold references into the registry
 *   across a reconcile()
 */
class DeviceRegistry {
public:
    DeviceRegistry() = default;

    // Replace the inventory with @p devices, reporting what changed
    ReconcileResult reconcile(const std::vector<Device> &devices);

    // Lookup - Thread-safe by-value returns
    std::optional<Device> get_device_copy(const std::string &device_id) const;
    std::vector<Device> get_all_devices() const;
    bool has_device(const std::string &device_id) const;

    size_t device_count() const;

private:
    std::vector<Device> devices_;
    std::unordered_map<std::string, size_t> id_to_index_;

    mutable std::shared_mutex mutex_;
};

}  // namespace registry
}  // namespace skysync

#endif  // SKYSYNC_REGISTRY_DEVICE_REGISTRY_HPP
