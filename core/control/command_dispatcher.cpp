#include "command_dispatcher.hpp"

#include "capability/capability_codec.hpp"
#include "logging/logger.hpp"

namespace skysync {
namespace control {

const char *error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:
            return "NONE";
        case ErrorKind::TRANSPORT:
            return "TRANSPORT";
        case ErrorKind::QUOTA_EXHAUSTED:
            return "QUOTA_EXHAUSTED";
        case ErrorKind::MALFORMED_CAPABILITY:
            return "MALFORMED_CAPABILITY";
        case ErrorKind::INVALID_COMMAND_VALUE:
            return "INVALID_COMMAND_VALUE";
        case ErrorKind::UNKNOWN_CAPABILITY:
            return "UNKNOWN_CAPABILITY";
        case ErrorKind::UNKNOWN_DEVICE:
            return "UNKNOWN_DEVICE";
        case ErrorKind::AMBIGUOUS_COMMAND_RESULT:
            return "AMBIGUOUS_COMMAND_RESULT";
        case ErrorKind::COMMAND_REJECTED:
            return "COMMAND_REJECTED";
    }
    return "UNKNOWN";
}

CommandDispatcher::CommandDispatcher(const registry::DeviceRegistry &registry, state::StateStore &store,
                                     governor::RateGovernor &governor, transport::ICloudTransport &transport)
    : registry_(registry), store_(store), governor_(governor), transport_(transport) {}

void CommandDispatcher::set_refresh_requester(RefreshRequester requester) {
    refresh_requester_ = std::move(requester);
}

CommandResult CommandDispatcher::fail(CommandResult result, ErrorKind kind, const std::string &message) {
    result.success = false;
    result.error_kind = kind;
    result.error_message = message;
    commands_failed_++;
    LOG_WARN("[Dispatcher] " << error_kind_to_string(kind) << ": " << message);
    return result;
}

bool CommandDispatcher::resolve(const CommandRequest &request, registry::Device &device,
                                const capability::CapabilitySpec *&spec, CommandResult &result) const {
    auto device_opt = registry_.get_device_copy(request.device_id);
    if (!device_opt) {
        result.error_kind = ErrorKind::UNKNOWN_DEVICE;
        result.error_message = "Device not found: " + request.device_id;
        return false;
    }
    device = std::move(*device_opt);

    spec = device.find_capability(request.instance);
    if (spec == nullptr) {
        result.error_kind = ErrorKind::UNKNOWN_CAPABILITY;
        result.error_message = "Capability not found: " + request.instance + " on device " + request.device_id;
        return false;
    }
    return true;
}

bool CommandDispatcher::validate(const CommandRequest &request, CommandResult &result) const {
    registry::Device device;
    const capability::CapabilitySpec *spec = nullptr;
    if (!resolve(request, device, spec, result)) {
        return false;
    }

    nlohmann::json payload;
    std::string error;
    if (!capability::encode_command(*spec, request.value, payload, result.applied_value, error)) {
        result.error_kind = ErrorKind::INVALID_COMMAND_VALUE;
        result.error_message = error;
        return false;
    }
    return true;
}

CommandResult CommandDispatcher::dispatch(const CommandRequest &request) {
    CommandResult result;

    registry::Device device;
    const capability::CapabilitySpec *spec = nullptr;
    if (!resolve(request, device, spec, result)) {
        return fail(result, result.error_kind, result.error_message);
    }

    nlohmann::json payload;
    std::string error;
    if (!capability::encode_command(*spec, request.value, payload, result.applied_value, error)) {
        return fail(result, ErrorKind::INVALID_COMMAND_VALUE, "Capability '" + request.instance + "': " + error);
    }

    // Serialize with polls and other commands on this device
    auto io = store_.lock_device_io(request.device_id);
    if (!io.owns_lock()) {
        return fail(result, ErrorKind::UNKNOWN_DEVICE, "Device removed: " + request.device_id);
    }

    auto grant = governor_.try_acquire(governor::CallPriority::USER);
    if (!grant.granted) {
        result.retry_after = grant.retry_after;
        return fail(result, ErrorKind::QUOTA_EXHAUSTED, "Daily API quota exhausted");
    }

    nlohmann::json ack;
    transport::TransportError terr;
    if (!transport_.send_command(device.address(), payload, ack, terr)) {
        switch (terr.error_class) {
            case transport::TransportErrorClass::QUOTA_EXHAUSTED:
                governor_.observe_exhausted();
                result.retry_after = governor_.snapshot().resets_in;
                return fail(result, ErrorKind::QUOTA_EXHAUSTED, "Quota exhausted by server: " + terr.message);
            case transport::TransportErrorClass::REJECTED:
                return fail(result, ErrorKind::COMMAND_REJECTED, "Device rejected command: " + terr.message);
            case transport::TransportErrorClass::AMBIGUOUS:
                // Outcome unknown: cached value can no longer be trusted
                store_.mark_stale(request.device_id, "command outcome unknown: " + terr.message);
                if (refresh_requester_) {
                    refresh_requester_(request.device_id);
                }
                return fail(result, ErrorKind::AMBIGUOUS_COMMAND_RESULT,
                            "Command outcome unknown, refresh scheduled: " + terr.message);
            default:
                return fail(result, ErrorKind::TRANSPORT, "Command failed: " + terr.message);
        }
    }

    // Optimistic reconcile: the cloud accepted the value we sent
    std::vector<capability::Capability> applied{
        capability::Capability{spec->instance, spec->kind, result.applied_value}};
    store_.merge(request.device_id, applied, state::MergeMode::PARTIAL);

    commands_sent_++;
    result.success = true;
    LOG_DEBUG("[Dispatcher] " << request.device_id << "/" << request.instance << " applied");
    return result;
}

}  // namespace control
}  // namespace skysync
