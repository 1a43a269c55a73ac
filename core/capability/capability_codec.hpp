#ifndef SKYSYNC_CAPABILITY_CAPABILITY_CODEC_HPP
#define SKYSYNC_CAPABILITY_CAPABILITY_CODEC_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "capability_types.hpp"

namespace skysync {
namespace capability {

// Non-fatal parse anomaly. A malformed entry is skipped; the rest of the
// payload is still used.
struct ParseIssue {
    enum class Kind { MALFORMED_CAPABILITY, UNDECLARED_CAPABILITY };

    Kind kind = Kind::MALFORMED_CAPABILITY;
    std::string device_id;
    std::string instance;
    std::string reason;
};

std::string describe_issue(const ParseIssue &issue);

/**
 * @brief Parse a device-list capability declaration array
 *
 * Input is the "capabilities" array of one device in the user/devices
 * response. Unknown kinds, duplicate instances and inconsistent parameters
 * (min > max, step <= 0, empty option set) are reported in @p issues and
 * skipped.
 */
std::vector<CapabilitySpec> parse_declarations(const std::string &device_id, const nlohmann::json &raw_capabilities,
                                               std::vector<ParseIssue> &issues);

/**
 * @brief Parse a device/state payload into typed capability readings
 *
 * Input is the response "payload" object ({"capabilities": [...]}) or the
 * capabilities array itself. Output order follows the payload. Entries not
 * declared in @p specs, with a kind mismatch, or with an out-of-bounds or
 * wrongly shaped value are reported in @p issues and skipped. Empty
 * readings (null or "") are skipped silently.
 */
std::vector<Capability> parse_capabilities(const std::string &device_id, const std::vector<CapabilitySpec> &specs,
                                           const nlohmann::json &raw_state, std::vector<ParseIssue> &issues);

/**
 * @brief Validate and encode a command value into a vendor capability payload
 *
 * On success @p payload holds {"type", "instance", "value"} and @p snapped
 * holds the value that will actually be applied (RANGE values aligned to the
 * declared step). Fails for PROPERTY capabilities, type mismatches,
 * out-of-range values, unknown enum tokens and unknown or missing
 * composite fields.
 */
bool encode_command(const CapabilitySpec &spec, const CapabilityValue &value, nlohmann::json &payload,
                    CapabilityValue &snapped, std::string &error);

// Wire encoding of an already-valid value (no snapping)
bool encode_wire_value(const CapabilitySpec &spec, const CapabilityValue &value, nlohmann::json &wire,
                       std::string &error);

// Build a device/state style payload from typed capabilities
nlohmann::json encode_state_payload(const std::vector<CapabilitySpec> &specs,
                                    const std::vector<Capability> &capabilities);

// Align v to min + k*step; ties round away from min; never exceeds max.
int64_t snap_to_step(const RangeSpec &range, int64_t v);
int64_t snap_to_step(const RangeSpec &range, double v);

}  // namespace capability
}  // namespace skysync

#endif  // SKYSYNC_CAPABILITY_CAPABILITY_CODEC_HPP
