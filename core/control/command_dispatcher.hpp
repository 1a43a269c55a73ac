#ifndef SKYSYNC_CONTROL_COMMAND_DISPATCHER_HPP
#define SKYSYNC_CONTROL_COMMAND_DISPATCHER_HPP

#include <atomic>
#include <chrono>
#include <functional>
#include <string>

#include "capability/capability_types.hpp"
#include "governor/rate_governor.hpp"
#include "registry/device_registry.hpp"
#include "state/state_store.hpp"
#include "transport/i_cloud_transport.hpp"

namespace skysync {
namespace control {

enum class ErrorKind {
    NONE,
    TRANSPORT,
    QUOTA_EXHAUSTED,
    MALFORMED_CAPABILITY,
    INVALID_COMMAND_VALUE,
    UNKNOWN_CAPABILITY,
    UNKNOWN_DEVICE,
    AMBIGUOUS_COMMAND_RESULT,
    COMMAND_REJECTED
};

const char *error_kind_to_string(ErrorKind kind);

// Command request - one capability write on one device
struct CommandRequest {
    std::string device_id;
    std::string instance;
    capability::CapabilityValue value;
};

struct CommandResult {
    bool success = false;
    ErrorKind error_kind = ErrorKind::NONE;
    std::string error_message;
    std::chrono::milliseconds retry_after{0};  // set for QUOTA_EXHAUSTED
    capability::CapabilityValue applied_value;  // value after step alignment
};

/**
 * @brief Unified write path: validate, gate, send, reconcile
 *
 * Validation (device, capability, value) happens before any quota is spent.
 * Send and the optimistic store update run under the device's I/O lock, so
 * a concurrent poll of the same device cannot interleave with them.
 */
class CommandDispatcher {
public:
    using RefreshRequester = std::function<void(const std::string &device_id)>;

    CommandDispatcher(const registry::DeviceRegistry &registry, state::StateStore &store,
                      governor::RateGovernor &governor, transport::ICloudTransport &transport);

    // Called when a command outcome is unknown and the device must be re-read
    void set_refresh_requester(RefreshRequester requester);

    CommandResult dispatch(const CommandRequest &request);

    // Validation only (no quota, no network)
    bool validate(const CommandRequest &request, CommandResult &result) const;

    uint64_t commands_sent() const { return commands_sent_.load(); }
    uint64_t commands_failed() const { return commands_failed_.load(); }

private:
    bool resolve(const CommandRequest &request, registry::Device &device, const capability::CapabilitySpec *&spec,
                 CommandResult &result) const;
    CommandResult fail(CommandResult result, ErrorKind kind, const std::string &message);

    const registry::DeviceRegistry &registry_;
    state::StateStore &store_;
    governor::RateGovernor &governor_;
    transport::ICloudTransport &transport_;
    RefreshRequester refresh_requester_;

    std::atomic<uint64_t> commands_sent_{0};
    std::atomic<uint64_t> commands_failed_{0};
};

}  // namespace control
}  // namespace skysync

#endif  // SKYSYNC_CONTROL_COMMAND_DISPATCHER_HPP
