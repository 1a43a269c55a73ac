#pragma once

/**
 * @file event_types.hpp
 * @brief Change notifications emitted by the state store
 *
 * Events are consumed by:
 * - subscribe_changes() callers (in-process)
 * - SSE endpoint (streaming to a host integration)
 *
 * Events are immutable value types. Timestamps are epoch milliseconds,
 * consistent with the HTTP API.
 */

#include <chrono>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "capability/capability_types.hpp"

namespace skysync {
namespace events {

inline int64_t now_epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

/**
 * @brief One or more capability values of a device changed
 *
 * Emitted once per merge that actually changed something; a merge that
 * rewrites identical values emits nothing. @c changes holds only the
 * capabilities whose value differs, in merge order.
 */
struct CapabilityChangeEvent {
    uint64_t event_id;
    std::string device_id;
    std::vector<capability::Capability> changes;
    int64_t timestamp_ms;

    bool touches(const std::string &instance) const {
        for (const auto &c : changes) {
            if (c.instance == instance) return true;
        }
        return false;
    }
};

/**
 * @brief Device-level staleness flag flipped
 *
 * stale=true after a failed or skipped refresh; stale=false after the next
 * successful merge.
 */
struct StalenessChangeEvent {
    uint64_t event_id;
    std::string device_id;
    bool stale;
    int64_t timestamp_ms;
};

enum class InventoryChange { ADDED, REMOVED, CHANGED };

inline const char *inventory_change_to_string(InventoryChange c) {
    switch (c) {
        case InventoryChange::ADDED:
            return "added";
        case InventoryChange::REMOVED:
            return "removed";
        case InventoryChange::CHANGED:
            return "changed";
    }
    return "unknown";
}

// Device appeared, disappeared or redeclared its capabilities
struct DeviceInventoryEvent {
    uint64_t event_id;
    std::string device_id;
    InventoryChange change;
    int64_t timestamp_ms;
};

using Event = std::variant<CapabilityChangeEvent, StalenessChangeEvent, DeviceInventoryEvent>;

inline uint64_t get_event_id(const Event &event) {
    return std::visit([](auto &&e) { return e.event_id; }, event);
}

inline const std::string &get_device_id(const Event &event) {
    return std::visit([](auto &&e) -> const std::string & { return e.device_id; }, event);
}

inline int64_t get_timestamp_ms(const Event &event) {
    return std::visit([](auto &&e) { return e.timestamp_ms; }, event);
}

}  // namespace events
}  // namespace skysync
