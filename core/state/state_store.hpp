#ifndef SKYSYNC_STATE_STATE_STORE_HPP
#define SKYSYNC_STATE_STATE_STORE_HPP

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "capability/capability_types.hpp"
#include "events/event_emitter.hpp"
#include "registry/device_registry.hpp"

namespace skysync {
namespace state {

// Cached capability value with metadata
struct CachedCapability {
    capability::CapabilityKind kind = capability::CapabilityKind::PROPERTY;
    capability::CapabilityValue value;
    std::chrono::system_clock::time_point updated_at;
    bool stale = false;  // absent from the latest full refresh

    std::chrono::milliseconds age(std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(now - updated_at);
    }
};

// Device state snapshot
struct DeviceState {
    std::string device_id;
    std::map<std::string, CachedCapability> capabilities;  // instance -> value
    std::optional<std::chrono::system_clock::time_point> last_refresh;
    bool stale = true;       // true until the first successful refresh
    std::string last_error;  // reason of the latest staleness

    const CachedCapability *find(const std::string &instance) const {
        auto it = capabilities.find(instance);
        return it == capabilities.end() ? nullptr : &it->second;
    }
};

enum class MergeMode {
    FULL_REFRESH,  // a complete poll result; absent capabilities become stale
    PARTIAL        // optimistic command reconciliation; only the given capabilities
};

struct MergeOutcome {
    bool applied = false;  // false when the device is unknown
    size_t changed = 0;
    size_t dropped = 0;  // undeclared or kind-mismatched entries
};

/**
 * @brief Held for the duration of a device's fetch+merge or send+reconcile
 *
 * Keeps the underlying mutex alive even if the device is removed while the
 * lock is held.
 */
class DeviceIoLock {
public:
    DeviceIoLock() = default;
    explicit DeviceIoLock(std::shared_ptr<std::mutex> mutex) : mutex_(std::move(mutex)), lock_(*mutex_) {}
    DeviceIoLock(std::shared_ptr<std::mutex> mutex, std::try_to_lock_t)
        : mutex_(std::move(mutex)), lock_(*mutex_, std::try_to_lock) {}

    bool owns_lock() const { return lock_.owns_lock(); }

private:
    std::shared_ptr<std::mutex> mutex_;
    std::unique_lock<std::mutex> lock_;
};

/**
 * @brief Single source of truth for device state
 *
 * Thread Safety:
 * - The device map is guarded by a shared_mutex (lookups shared, add/remove exclusive)
 * - Each device slot has its own shared_mutex: merges on different devices
 *   run concurrently, merges on one device are serialized, and read() takes
 *   a shared lock and copies, so it never observes a partial merge and
 *   never waits on network I/O
 * - Lock order is map then slot
 * - Events are emitted while the slot lock is held so per-device event
 *   order equals commit order
 */
class StateStore {
public:
    explicit StateStore(std::shared_ptr<events::EventEmitter> emitter = nullptr);

    void set_event_emitter(const std::shared_ptr<events::EventEmitter> &emitter);

    // Create a slot for a new device, or align an existing one with a changed declaration
    void register_device(const registry::Device &device);
    void remove_device(const std::string &device_id);

    MergeOutcome merge(const std::string &device_id, const std::vector<capability::Capability> &capabilities,
                       MergeMode mode);

    // Flag the device stale without touching values. Returns false for unknown devices.
    bool mark_stale(const std::string &device_id, const std::string &reason = "");

    std::optional<DeviceState> read(const std::string &device_id) const;
    std::vector<DeviceState> read_all() const;

    std::unique_ptr<events::Subscription> subscribe(const events::EventFilter &filter = events::EventFilter::all(),
                                                    size_t queue_size = 0, const std::string &name = "");

    // Serializes network I/O per device. Unknown devices get an empty lock.
    DeviceIoLock lock_device_io(const std::string &device_id) const;
    // Non-blocking variant: empty lock when the device is unknown or its I/O is busy
    DeviceIoLock try_lock_device_io(const std::string &device_id) const;

    bool has_device(const std::string &device_id) const;
    size_t device_count() const;
    size_t stale_device_count() const;

private:
    struct DeviceSlot {
        mutable std::shared_mutex mutex;
        DeviceState state;
        std::map<std::string, capability::CapabilityKind> declared;
        std::shared_ptr<std::mutex> io_mutex = std::make_shared<std::mutex>();
    };

    std::shared_ptr<DeviceSlot> find_slot(const std::string &device_id) const;
    void emit(events::Event event) const;

    std::shared_ptr<events::EventEmitter> event_emitter_;

    mutable std::shared_mutex map_mutex_;
    std::unordered_map<std::string, std::shared_ptr<DeviceSlot>> slots_;
    std::vector<std::string> order_;  // registration order for read_all()
};

}  // namespace state
}  // namespace skysync

#endif  // SKYSYNC_STATE_STATE_STORE_HPP
