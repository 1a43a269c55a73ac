#include "capability_codec.hpp"

#include <cmath>
#include <set>

namespace skysync {
namespace capability {

namespace {

constexpr const char *kTypePrefix = "devices.capabilities.";

std::string type_suffix(const std::string &type) {
    const std::string prefix = kTypePrefix;
    if (type.compare(0, prefix.size(), prefix) == 0) {
        return type.substr(prefix.size());
    }
    return type;
}

std::string get_string(const nlohmann::json &obj, const char *key) {
    if (!obj.is_object()) return "";
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

// Accepts JSON integers and integral floats
bool read_int(const nlohmann::json &j, int64_t &out) {
    if (j.is_number_integer()) {
        out = j.get<int64_t>();
        return true;
    }
    if (j.is_number_float()) {
        double d = j.get<double>();
        if (std::isfinite(d) && std::floor(d) == d) {
            out = static_cast<int64_t>(d);
            return true;
        }
    }
    return false;
}

bool is_empty_reading(const nlohmann::json &j) {
    return j.is_null() || (j.is_string() && j.get<std::string>().empty());
}

bool parse_range(const nlohmann::json &raw, RangeSpec &range, std::string &reason) {
    if (!raw.is_object()) {
        reason = "missing range";
        return false;
    }
    if (!raw.contains("min") || !raw.contains("max") || !read_int(raw["min"], range.min) ||
        !read_int(raw["max"], range.max)) {
        reason = "range bounds are not integers";
        return false;
    }
    range.step = 1;
    if (raw.contains("precision") && !read_int(raw["precision"], range.step)) {
        reason = "range precision is not an integer";
        return false;
    }
    if (range.min > range.max) {
        reason = "range min " + std::to_string(range.min) + " > max " + std::to_string(range.max);
        return false;
    }
    if (range.step <= 0) {
        reason = "range step must be positive";
        return false;
    }
    return true;
}

// Options with a name and a value; nameless entries are ignored
std::vector<EnumOption> parse_options(const nlohmann::json &raw, bool &all_valued) {
    std::vector<EnumOption> options;
    all_valued = true;
    if (!raw.is_array()) return options;

    for (const auto &entry : raw) {
        std::string name = get_string(entry, "name");
        if (name.empty()) continue;
        if (!entry.contains("value")) {
            all_valued = false;
            continue;
        }
        options.push_back(EnumOption{name, entry["value"]});
    }
    return options;
}

bool parse_field(const nlohmann::json &raw, FieldSpec &field, std::string &reason) {
    field.name = get_string(raw, "fieldName");
    if (field.name.empty()) {
        reason = "field without fieldName";
        return false;
    }

    const std::string data_type = get_string(raw, "dataType");
    if (data_type == "INTEGER") {
        field.type = FieldType::INTEGER;
        if (raw.contains("range")) {
            if (!parse_range(raw["range"], field.range, reason)) {
                reason = "field '" + field.name + "': " + reason;
                return false;
            }
            field.has_range = true;
        }
    } else if (data_type == "ENUM") {
        bool all_valued = true;
        field.options = parse_options(raw.value("options", nlohmann::json::array()), all_valued);
        if (!all_valued || field.options.empty()) {
            // Nested per-mode option trees carry no flat values; accept any integer
            field.type = FieldType::INTEGER;
            field.options.clear();
        } else {
            field.type = FieldType::ENUM;
        }
    } else if (data_type == "Array" || data_type == "ARRAY") {
        field.type = FieldType::ARRAY;
        if (raw.contains("elementRange")) {
            if (!parse_range(raw["elementRange"], field.range, reason)) {
                reason = "field '" + field.name + "': " + reason;
                return false;
            }
            field.has_range = true;
        }
    } else {
        reason = "field '" + field.name + "' has unsupported dataType '" + data_type + "'";
        return false;
    }

    if (raw.contains("required") && raw["required"].is_boolean()) {
        field.required = raw["required"].get<bool>();
    }
    if (raw.contains("defaultValue")) {
        field.default_value = raw["defaultValue"];
    }
    return true;
}

bool classify(const std::string &type, const std::string &instance, const std::string &data_type,
              CapabilityKind &kind) {
    const std::string suffix = type_suffix(type);

    if (suffix == "property" || suffix == "online") {
        kind = CapabilityKind::PROPERTY;
        return true;
    }
    if (data_type == "STRUCT") {
        kind = CapabilityKind::COMPOSITE;
        return true;
    }
    if (suffix == "on_off" || suffix == "toggle") {
        kind = CapabilityKind::ON_OFF;
        return true;
    }
    if (suffix == "color_setting") {
        kind = instance == "colorRgb" ? CapabilityKind::COLOR : CapabilityKind::RANGE;
        return true;
    }
    if (suffix == "range") {
        kind = CapabilityKind::RANGE;
        return true;
    }
    if ((suffix == "mode" || suffix == "dynamic_scene" || suffix == "diy_setting" || suffix == "music_setting" ||
         suffix == "work_mode") &&
        data_type == "ENUM") {
        kind = CapabilityKind::MODE;
        return true;
    }
    return false;
}

bool decode_field(const FieldSpec &field, const nlohmann::json &wire, FieldValue &out, std::string &reason) {
    switch (field.type) {
        case FieldType::INTEGER: {
            int64_t v = 0;
            if (!read_int(wire, v)) {
                reason = "field '" + field.name + "' is not an integer";
                return false;
            }
            if (field.has_range && !field.range.contains(v)) {
                reason = "field '" + field.name + "' value " + std::to_string(v) + " out of range";
                return false;
            }
            out = v;
            return true;
        }
        case FieldType::ENUM:
            for (const auto &opt : field.options) {
                if (opt.value == wire) {
                    out = opt.name;
                    return true;
                }
            }
            reason = "field '" + field.name + "' value " + wire.dump() + " not in option set";
            return false;
        case FieldType::ARRAY: {
            if (!wire.is_array()) {
                reason = "field '" + field.name + "' is not an array";
                return false;
            }
            std::vector<int64_t> items;
            for (const auto &item : wire) {
                int64_t v = 0;
                if (!read_int(item, v) || (field.has_range && !field.range.contains(v))) {
                    reason = "field '" + field.name + "' has an invalid element";
                    return false;
                }
                items.push_back(v);
            }
            out = std::move(items);
            return true;
        }
    }
    reason = "unsupported field type";
    return false;
}

bool decode_wire_value(const CapabilitySpec &spec, const nlohmann::json &wire, CapabilityValue &out,
                       std::string &reason) {
    switch (spec.kind) {
        case CapabilityKind::ON_OFF: {
            if (wire.is_boolean()) {
                out = wire.get<bool>();
                return true;
            }
            const EnumOption *on = spec.find_option("on");
            const EnumOption *off = spec.find_option("off");
            if (on != nullptr && on->value == wire) {
                out = true;
                return true;
            }
            if (off != nullptr && off->value == wire) {
                out = false;
                return true;
            }
            reason = "value " + wire.dump() + " is neither on nor off";
            return false;
        }
        case CapabilityKind::RANGE: {
            int64_t v = 0;
            if (!read_int(wire, v)) {
                reason = "value " + wire.dump() + " is not an integer";
                return false;
            }
            if (!spec.range.contains(v)) {
                reason = "value " + std::to_string(v) + " outside [" + std::to_string(spec.range.min) + ", " +
                         std::to_string(spec.range.max) + "]";
                return false;
            }
            out = v;
            return true;
        }
        case CapabilityKind::MODE:
            for (const auto &opt : spec.options) {
                if (opt.value == wire) {
                    out = opt.name;
                    return true;
                }
            }
            reason = "value " + wire.dump() + " not in option set";
            return false;
        case CapabilityKind::COLOR: {
            int64_t v = 0;
            if (!read_int(wire, v) || v < 0 || v > kMaxPackedRgb) {
                reason = "value " + wire.dump() + " is not a packed RGB color";
                return false;
            }
            out = RgbColor::from_packed(v);
            return true;
        }
        case CapabilityKind::COMPOSITE: {
            if (!wire.is_object()) {
                reason = "composite value is not an object";
                return false;
            }
            CompositeValue composite;
            for (auto it = wire.begin(); it != wire.end(); ++it) {
                const FieldSpec *field = spec.find_field(it.key());
                if (field == nullptr) {
                    reason = "undeclared field '" + it.key() + "'";
                    return false;
                }
                FieldValue fv;
                if (!decode_field(*field, it.value(), fv, reason)) {
                    return false;
                }
                composite[field->name] = std::move(fv);
            }
            out = std::move(composite);
            return true;
        }
        case CapabilityKind::PROPERTY:
            if (wire.is_boolean()) {
                out = wire.get<bool>();
            } else if (wire.is_number_integer()) {
                out = wire.get<int64_t>();
            } else if (wire.is_number_float()) {
                out = wire.get<double>();
            } else if (wire.is_string()) {
                out = wire.get<std::string>();
            } else if (wire.is_object() || wire.is_array()) {
                out = wire.dump();
            } else {
                reason = "unsupported reading";
                return false;
            }
            return true;
    }
    reason = "unsupported kind";
    return false;
}

bool encode_field(const FieldSpec &field, const FieldValue &value, nlohmann::json &wire, FieldValue &snapped,
                  std::string &error) {
    switch (field.type) {
        case FieldType::INTEGER: {
            const auto *v = std::get_if<int64_t>(&value);
            if (v == nullptr) {
                error = "field '" + field.name + "' expects an integer";
                return false;
            }
            int64_t out = *v;
            if (field.has_range) {
                if (!field.range.contains(out)) {
                    error = "field '" + field.name + "' value " + std::to_string(out) + " outside [" +
                            std::to_string(field.range.min) + ", " + std::to_string(field.range.max) + "]";
                    return false;
                }
                out = snap_to_step(field.range, out);
            }
            wire = out;
            snapped = out;
            return true;
        }
        case FieldType::ENUM: {
            const auto *token = std::get_if<std::string>(&value);
            if (token == nullptr) {
                error = "field '" + field.name + "' expects an option name";
                return false;
            }
            for (const auto &opt : field.options) {
                if (opt.name == *token) {
                    wire = opt.value;
                    snapped = *token;
                    return true;
                }
            }
            error = "field '" + field.name + "' has no option '" + *token + "'";
            return false;
        }
        case FieldType::ARRAY: {
            const auto *items = std::get_if<std::vector<int64_t>>(&value);
            if (items == nullptr) {
                error = "field '" + field.name + "' expects an integer array";
                return false;
            }
            for (int64_t item : *items) {
                if (field.has_range && !field.range.contains(item)) {
                    error = "field '" + field.name + "' element " + std::to_string(item) + " out of range";
                    return false;
                }
            }
            wire = *items;
            snapped = *items;
            return true;
        }
    }
    error = "unsupported field type";
    return false;
}

}  // namespace

std::string describe_issue(const ParseIssue &issue) {
    std::string kind =
        issue.kind == ParseIssue::Kind::MALFORMED_CAPABILITY ? "malformed capability" : "undeclared capability";
    return kind + " '" + issue.instance + "' on " + issue.device_id + ": " + issue.reason;
}

int64_t snap_to_step(const RangeSpec &range, int64_t v) {
    if (v <= range.min) return range.min;
    if (range.step <= 1) return v > range.max ? range.max : v;

    int64_t offset = v - range.min;
    int64_t q = offset / range.step;
    if ((offset % range.step) * 2 >= range.step) {
        ++q;
    }
    int64_t out = range.min + q * range.step;
    if (out > range.max) {
        out -= range.step;
    }
    return out;
}

int64_t snap_to_step(const RangeSpec &range, double v) {
    if (v <= static_cast<double>(range.min)) return range.min;

    double steps = std::floor((v - static_cast<double>(range.min)) / static_cast<double>(range.step) + 0.5);
    int64_t out = range.min + static_cast<int64_t>(steps) * range.step;
    if (out > range.max) {
        out -= range.step;
    }
    return out < range.min ? range.min : out;
}

std::vector<CapabilitySpec> parse_declarations(const std::string &device_id, const nlohmann::json &raw_capabilities,
                                               std::vector<ParseIssue> &issues) {
    std::vector<CapabilitySpec> specs;
    auto malformed = [&](const std::string &instance, const std::string &reason) {
        issues.push_back(ParseIssue{ParseIssue::Kind::MALFORMED_CAPABILITY, device_id, instance, reason});
    };

    if (!raw_capabilities.is_array()) {
        malformed("", "capability declaration is not an array");
        return specs;
    }

    std::set<std::string> seen;
    for (const auto &entry : raw_capabilities) {
        CapabilitySpec spec;
        spec.type = get_string(entry, "type");
        spec.instance = get_string(entry, "instance");

        if (spec.instance.empty()) {
            malformed("", "declaration without instance");
            continue;
        }
        if (seen.count(spec.instance) != 0) {
            malformed(spec.instance, "duplicate instance");
            continue;
        }

        nlohmann::json params = entry.contains("parameters") ? entry["parameters"] : nlohmann::json::object();
        if (!params.is_object()) {
            params = nlohmann::json::object();
        }
        const std::string data_type = get_string(params, "dataType");

        if (!classify(spec.type, spec.instance, data_type, spec.kind)) {
            malformed(spec.instance, "unknown capability type '" + spec.type + "'");
            continue;
        }

        std::string reason;
        bool ok = true;
        switch (spec.kind) {
            case CapabilityKind::ON_OFF: {
                bool all_valued = true;
                spec.options = parse_options(params.value("options", nlohmann::json::array()), all_valued);
                if (spec.options.empty()) {
                    spec.options = {EnumOption{"on", 1}, EnumOption{"off", 0}};
                } else if (spec.find_option("on") == nullptr || spec.find_option("off") == nullptr) {
                    ok = false;
                    reason = "on/off options missing";
                }
                break;
            }
            case CapabilityKind::RANGE:
                ok = parse_range(params.value("range", nlohmann::json()), spec.range, reason);
                spec.range.unit = get_string(params, "unit");
                break;
            case CapabilityKind::MODE: {
                bool all_valued = true;
                spec.options = parse_options(params.value("options", nlohmann::json::array()), all_valued);
                if (spec.options.empty()) {
                    ok = false;
                    reason = "empty option set";
                }
                break;
            }
            case CapabilityKind::COLOR:
                spec.range = RangeSpec{0, kMaxPackedRgb, 1, ""};
                break;
            case CapabilityKind::COMPOSITE: {
                const auto fields = params.value("fields", nlohmann::json::array());
                for (const auto &raw_field : fields) {
                    FieldSpec field;
                    if (!parse_field(raw_field, field, reason)) {
                        ok = false;
                        break;
                    }
                    spec.fields.push_back(std::move(field));
                }
                if (ok && spec.fields.empty()) {
                    ok = false;
                    reason = "composite without fields";
                }
                break;
            }
            case CapabilityKind::PROPERTY:
                break;
        }

        if (!ok) {
            malformed(spec.instance, reason);
            continue;
        }

        seen.insert(spec.instance);
        specs.push_back(std::move(spec));
    }

    return specs;
}

std::vector<Capability> parse_capabilities(const std::string &device_id, const std::vector<CapabilitySpec> &specs,
                                           const nlohmann::json &raw_state, std::vector<ParseIssue> &issues) {
    std::vector<Capability> out;

    const nlohmann::json *entries = &raw_state;
    if (raw_state.is_object() && raw_state.contains("capabilities")) {
        entries = &raw_state["capabilities"];
    }
    if (!entries->is_array()) {
        issues.push_back(
            ParseIssue{ParseIssue::Kind::MALFORMED_CAPABILITY, device_id, "", "state payload has no capability array"});
        return out;
    }

    for (const auto &entry : *entries) {
        const std::string instance = get_string(entry, "instance");
        const std::string type = get_string(entry, "type");

        const CapabilitySpec *spec = find_spec(specs, instance);
        if (spec == nullptr) {
            issues.push_back(
                ParseIssue{ParseIssue::Kind::UNDECLARED_CAPABILITY, device_id, instance, "not declared for device"});
            continue;
        }
        if (!type.empty() && type != spec->type) {
            issues.push_back(ParseIssue{ParseIssue::Kind::MALFORMED_CAPABILITY, device_id, instance,
                                        "type '" + type + "' does not match declared '" + spec->type + "'"});
            continue;
        }

        const nlohmann::json state = entry.contains("state") ? entry["state"] : nlohmann::json();
        const nlohmann::json wire = state.is_object() && state.contains("value") ? state["value"] : nlohmann::json();
        if (is_empty_reading(wire)) {
            continue;
        }

        Capability cap;
        cap.instance = spec->instance;
        cap.kind = spec->kind;
        std::string reason;
        if (!decode_wire_value(*spec, wire, cap.value, reason)) {
            issues.push_back(ParseIssue{ParseIssue::Kind::MALFORMED_CAPABILITY, device_id, instance, reason});
            continue;
        }
        out.push_back(std::move(cap));
    }

    return out;
}

bool encode_wire_value(const CapabilitySpec &spec, const CapabilityValue &value, nlohmann::json &wire,
                       std::string &error) {
    switch (spec.kind) {
        case CapabilityKind::ON_OFF: {
            const auto *on = std::get_if<bool>(&value);
            if (on == nullptr) {
                error = "expects a bool";
                return false;
            }
            const EnumOption *opt = spec.find_option(*on ? "on" : "off");
            wire = opt != nullptr ? opt->value : nlohmann::json(*on ? 1 : 0);
            return true;
        }
        case CapabilityKind::RANGE: {
            const auto *v = std::get_if<int64_t>(&value);
            if (v == nullptr) {
                error = "expects an integer";
                return false;
            }
            wire = *v;
            return true;
        }
        case CapabilityKind::MODE: {
            const auto *token = std::get_if<std::string>(&value);
            const EnumOption *opt = token != nullptr ? spec.find_option(*token) : nullptr;
            if (opt == nullptr) {
                error = "expects one of the declared option names";
                return false;
            }
            wire = opt->value;
            return true;
        }
        case CapabilityKind::COLOR: {
            const auto *rgb = std::get_if<RgbColor>(&value);
            if (rgb == nullptr) {
                error = "expects an RGB color";
                return false;
            }
            wire = rgb->packed();
            return true;
        }
        case CapabilityKind::COMPOSITE: {
            const auto *composite = std::get_if<CompositeValue>(&value);
            if (composite == nullptr) {
                error = "expects a field map";
                return false;
            }
            wire = nlohmann::json::object();
            for (const auto &[name, fv] : *composite) {
                const FieldSpec *field = spec.find_field(name);
                if (field == nullptr) {
                    error = "unknown field '" + name + "'";
                    return false;
                }
                FieldValue ignored;
                if (!encode_field(*field, fv, wire[name], ignored, error)) {
                    return false;
                }
            }
            return true;
        }
        case CapabilityKind::PROPERTY:
            std::visit(
                [&wire](auto &&arg) {
                    using T = std::decay_t<decltype(arg)>;
                    if constexpr (std::is_same_v<T, bool> || std::is_same_v<T, int64_t> ||
                                  std::is_same_v<T, double> || std::is_same_v<T, std::string>) {
                        wire = arg;
                    } else {
                        wire = nullptr;
                    }
                },
                value);
            return true;
    }
    error = "unsupported kind";
    return false;
}

bool encode_command(const CapabilitySpec &spec, const CapabilityValue &value, nlohmann::json &payload,
                    CapabilityValue &snapped, std::string &error) {
    const std::string prefix = "capability '" + spec.instance + "' ";

    switch (spec.kind) {
        case CapabilityKind::PROPERTY:
            error = prefix + "is read-only";
            return false;

        case CapabilityKind::ON_OFF:
            if (!std::holds_alternative<bool>(value)) {
                error = prefix + "expects a bool, got " + value_type_name(value);
                return false;
            }
            snapped = value;
            break;

        case CapabilityKind::RANGE: {
            const RangeSpec &range = spec.range;
            auto out_of_range = [&](const std::string &v) {
                error = prefix + "value " + v + " outside [" + std::to_string(range.min) + ", " +
                        std::to_string(range.max) + "]";
                return false;
            };
            if (const auto *i = std::get_if<int64_t>(&value)) {
                if (!range.contains(*i)) return out_of_range(std::to_string(*i));
                snapped = snap_to_step(range, *i);
            } else if (const auto *d = std::get_if<double>(&value)) {
                if (!std::isfinite(*d) || *d < static_cast<double>(range.min) ||
                    *d > static_cast<double>(range.max)) {
                    return out_of_range(std::to_string(*d));
                }
                snapped = snap_to_step(range, *d);
            } else {
                error = prefix + "expects a number, got " + value_type_name(value);
                return false;
            }
            break;
        }

        case CapabilityKind::MODE: {
            const auto *token = std::get_if<std::string>(&value);
            if (token == nullptr) {
                error = prefix + "expects an option name, got " + value_type_name(value);
                return false;
            }
            if (spec.find_option(*token) == nullptr) {
                error = prefix + "has no option '" + *token + "'";
                return false;
            }
            snapped = value;
            break;
        }

        case CapabilityKind::COLOR:
            if (std::holds_alternative<RgbColor>(value)) {
                snapped = value;
            } else if (const auto *packed = std::get_if<int64_t>(&value)) {
                if (*packed < 0 || *packed > kMaxPackedRgb) {
                    error = prefix + "packed color " + std::to_string(*packed) + " outside [0, 16777215]";
                    return false;
                }
                snapped = RgbColor::from_packed(*packed);
            } else {
                error = prefix + "expects an RGB color, got " + value_type_name(value);
                return false;
            }
            break;

        case CapabilityKind::COMPOSITE: {
            const auto *composite = std::get_if<CompositeValue>(&value);
            if (composite == nullptr) {
                error = prefix + "expects a field map, got " + value_type_name(value);
                return false;
            }
            for (const auto &entry : *composite) {
                if (spec.find_field(entry.first) == nullptr) {
                    error = prefix + "has no field '" + entry.first + "'";
                    return false;
                }
            }

            CompositeValue resolved;
            for (const auto &field : spec.fields) {
                auto it = composite->find(field.name);
                FieldValue given;
                if (it != composite->end()) {
                    given = it->second;
                } else if (!field.required) {
                    continue;
                } else if (!field.default_value.is_null()) {
                    std::string reason;
                    if (!decode_field(field, field.default_value, given, reason)) {
                        error = prefix + "default for " + reason;
                        return false;
                    }
                } else {
                    error = prefix + "missing required field '" + field.name + "'";
                    return false;
                }

                nlohmann::json ignored;
                FieldValue aligned;
                std::string field_error;
                if (!encode_field(field, given, ignored, aligned, field_error)) {
                    error = prefix + field_error;
                    return false;
                }
                resolved[field.name] = std::move(aligned);
            }
            snapped = std::move(resolved);
            break;
        }
    }

    nlohmann::json wire;
    if (!encode_wire_value(spec, snapped, wire, error)) {
        error = prefix + error;
        return false;
    }

    payload = {{"type", spec.type}, {"instance", spec.instance}, {"value", wire}};
    return true;
}

nlohmann::json encode_state_payload(const std::vector<CapabilitySpec> &specs,
                                    const std::vector<Capability> &capabilities) {
    nlohmann::json caps = nlohmann::json::array();
    for (const auto &cap : capabilities) {
        const CapabilitySpec *spec = find_spec(specs, cap.instance);
        if (spec == nullptr) continue;

        nlohmann::json wire;
        std::string error;
        if (!encode_wire_value(*spec, cap.value, wire, error)) continue;

        caps.push_back({{"type", spec->type}, {"instance", spec->instance}, {"state", {{"value", wire}}}});
    }
    return {{"capabilities", caps}};
}

}  // namespace capability
}  // namespace skysync
