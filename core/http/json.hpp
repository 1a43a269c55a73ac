#pragma once

#include <nlohmann/json.hpp>
#include <string>

#include "capability/capability_types.hpp"
#include "events/event_types.hpp"
#include "governor/rate_governor.hpp"
#include "registry/device_registry.hpp"
#include "state/state_store.hpp"
#include "sync/sync_coordinator.hpp"

namespace skysync {
namespace http {

/**
 * @brief JSON encoding utilities for capability values and runtime types
 *
 * Values are tagged with lowercase type names:
 *   {"type": "int64", "int64": 73}
 *   {"type": "rgb", "rgb": {"r": 255, "g": 0, "b": 0}}
 *   {"type": "composite", "composite": {"field": ...}}
 */

nlohmann::json encode_value(const capability::CapabilityValue &value);
nlohmann::json encode_capability_spec(const capability::CapabilitySpec &spec);
nlohmann::json encode_device(const registry::Device &device);
nlohmann::json encode_device_state(const state::DeviceState &state);
nlohmann::json encode_ledger(const governor::LedgerSnapshot &ledger);
nlohmann::json encode_sync_stats(const sync::SyncStats &stats);

// SSE event name and payload
std::string event_type_name(const events::Event &event);
nlohmann::json encode_event(const events::Event &event);

/**
 * @brief Decode a request value
 *
 * Accepts the tagged form or a bare JSON value. With a @p spec the bare form
 * is shaped for its kind (0/1 for ON_OFF, packed integer or {r,g,b} for
 * COLOR); without one the JSON type alone decides.
 */
bool decode_value(const nlohmann::json &json, const capability::CapabilitySpec *spec,
                  capability::CapabilityValue &value, std::string &error);

}  // namespace http
}  // namespace skysync
