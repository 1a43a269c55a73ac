#ifndef SKYSYNC_CAPABILITY_CAPABILITY_TYPES_HPP
#define SKYSYNC_CAPABILITY_CAPABILITY_TYPES_HPP

/**
 * @file capability_types.hpp
 * @brief Device-family independent capability model
 *
 * A device is described entirely by an ordered list of CapabilitySpecs.
 * Read and command logic dispatches on CapabilityKind, never on the
 * device model. Values are a closed std::variant so every consumer can
 * visit them exhaustively.
 */

#include <cstdint>
#include <cstring>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <variant>
#include <vector>

namespace skysync {
namespace capability {

enum class CapabilityKind {
    ON_OFF,     // on_off, toggle
    RANGE,      // range, color temperature
    MODE,       // enumerated presets and scenes
    COLOR,      // RGB triple
    COMPOSITE,  // STRUCT capabilities with named fields
    PROPERTY    // read-only sensor reading
};

inline const char *kind_to_string(CapabilityKind kind) {
    switch (kind) {
        case CapabilityKind::ON_OFF:
            return "on_off";
        case CapabilityKind::RANGE:
            return "range";
        case CapabilityKind::MODE:
            return "mode";
        case CapabilityKind::COLOR:
            return "color";
        case CapabilityKind::COMPOSITE:
            return "composite";
        case CapabilityKind::PROPERTY:
            return "property";
    }
    return "unknown";
}

struct RgbColor {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    static RgbColor from_packed(int64_t packed) {
        return RgbColor{static_cast<uint8_t>((packed >> 16) & 0xFF), static_cast<uint8_t>((packed >> 8) & 0xFF),
                        static_cast<uint8_t>(packed & 0xFF)};
    }

    int64_t packed() const { return (static_cast<int64_t>(r) << 16) | (static_cast<int64_t>(g) << 8) | b; }

    bool operator==(const RgbColor &other) const { return r == other.r && g == other.g && b == other.b; }
    bool operator!=(const RgbColor &other) const { return !(*this == other); }
};

constexpr int64_t kMaxPackedRgb = 0xFFFFFF;

// Field of a COMPOSITE value. ENUM fields carry the option name.
using FieldValue = std::variant<int64_t, std::string, std::vector<int64_t>>;
using CompositeValue = std::map<std::string, FieldValue>;

/**
 * @brief Normalized capability value
 *
 * Shape by kind:
 * - ON_OFF    -> bool
 * - RANGE     -> int64_t (double accepted on commands, snapped to step)
 * - MODE      -> std::string (option name)
 * - COLOR     -> RgbColor
 * - COMPOSITE -> CompositeValue
 * - PROPERTY  -> bool, int64_t, double or std::string
 */
using CapabilityValue = std::variant<bool, int64_t, double, std::string, RgbColor, CompositeValue>;

inline const char *value_type_name(const CapabilityValue &v) {
    return std::visit(
        [](auto &&arg) -> const char * {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (std::is_same_v<T, bool>)
                return "bool";
            else if constexpr (std::is_same_v<T, int64_t>)
                return "int64";
            else if constexpr (std::is_same_v<T, double>)
                return "double";
            else if constexpr (std::is_same_v<T, std::string>)
                return "string";
            else if constexpr (std::is_same_v<T, RgbColor>)
                return "rgb";
            else
                return "composite";
        },
        v);
}

/**
 * @brief Compare two CapabilityValues for equality
 *
 * Doubles are compared bitwise so NaN readings do not produce a change
 * event on every poll.
 */
inline bool values_equal(const CapabilityValue &a, const CapabilityValue &b) {
    if (a.index() != b.index()) return false;

    return std::visit(
        [&b](auto &&arg_a) -> bool {
            using T = std::decay_t<decltype(arg_a)>;
            const auto &arg_b = std::get<T>(b);

            if constexpr (std::is_same_v<T, double>) {
                uint64_t bits_a, bits_b;
                std::memcpy(&bits_a, &arg_a, sizeof(double));
                std::memcpy(&bits_b, &arg_b, sizeof(double));
                return bits_a == bits_b;
            } else {
                return arg_a == arg_b;
            }
        },
        a);
}

// Inclusive integer range with a positive step
struct RangeSpec {
    int64_t min = 0;
    int64_t max = 0;
    int64_t step = 1;
    std::string unit;

    bool contains(int64_t v) const { return v >= min && v <= max; }
};

// Named option; value is the vendor wire value (number, string or object)
struct EnumOption {
    std::string name;
    nlohmann::json value;
};

enum class FieldType { INTEGER, ENUM, ARRAY };

struct FieldSpec {
    std::string name;
    FieldType type = FieldType::INTEGER;
    bool has_range = false;
    RangeSpec range;                  // INTEGER bounds, or ARRAY element bounds
    std::vector<EnumOption> options;  // ENUM
    bool required = false;
    nlohmann::json default_value;  // null when absent
};

struct CapabilitySpec {
    std::string instance;  // unique within the device, e.g. "brightness"
    std::string type;      // vendor type, e.g. "devices.capabilities.range"
    CapabilityKind kind = CapabilityKind::PROPERTY;

    RangeSpec range;                  // RANGE
    std::vector<EnumOption> options;  // ON_OFF (on/off), MODE
    std::vector<FieldSpec> fields;    // COMPOSITE

    bool commandable() const { return kind != CapabilityKind::PROPERTY; }

    const EnumOption *find_option(const std::string &name) const {
        for (const auto &opt : options) {
            if (opt.name == name) return &opt;
        }
        return nullptr;
    }

    const FieldSpec *find_field(const std::string &name) const {
        for (const auto &field : fields) {
            if (field.name == name) return &field;
        }
        return nullptr;
    }
};

// A capability reading or commanded value
struct Capability {
    std::string instance;
    CapabilityKind kind = CapabilityKind::PROPERTY;
    CapabilityValue value;
};

inline const CapabilitySpec *find_spec(const std::vector<CapabilitySpec> &specs, const std::string &instance) {
    for (const auto &spec : specs) {
        if (spec.instance == instance) return &spec;
    }
    return nullptr;
}

}  // namespace capability
}  // namespace skysync

#endif  // SKYSYNC_CAPABILITY_CAPABILITY_TYPES_HPP
