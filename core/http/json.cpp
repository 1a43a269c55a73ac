#include "json.hpp"

namespace skysync {
namespace http {

namespace {

int64_t to_epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

nlohmann::json encode_field_value(const capability::FieldValue &value) {
    return std::visit([](auto &&v) -> nlohmann::json { return v; }, value);
}

const char *field_type_to_string(capability::FieldType type) {
    switch (type) {
        case capability::FieldType::INTEGER:
            return "integer";
        case capability::FieldType::ENUM:
            return "enum";
        case capability::FieldType::ARRAY:
            return "array";
    }
    return "unknown";
}

nlohmann::json encode_range(const capability::RangeSpec &range) {
    nlohmann::json out = {{"min", range.min}, {"max", range.max}, {"step", range.step}};
    if (!range.unit.empty()) {
        out["unit"] = range.unit;
    }
    return out;
}

nlohmann::json option_names(const std::vector<capability::EnumOption> &options) {
    nlohmann::json names = nlohmann::json::array();
    for (const auto &opt : options) {
        names.push_back(opt.name);
    }
    return names;
}

bool decode_field_value(const std::string &name, const nlohmann::json &json, capability::FieldValue &value,
                        std::string &error) {
    if (json.is_number_integer()) {
        value = json.get<int64_t>();
        return true;
    }
    if (json.is_string()) {
        value = json.get<std::string>();
        return true;
    }
    if (json.is_array()) {
        std::vector<int64_t> items;
        for (const auto &item : json) {
            if (!item.is_number_integer()) {
                error = "field '" + name + "' array elements must be integers";
                return false;
            }
            items.push_back(item.get<int64_t>());
        }
        value = std::move(items);
        return true;
    }
    error = "field '" + name + "' must be an integer, string or integer array";
    return false;
}

bool decode_rgb(const nlohmann::json &json, capability::RgbColor &rgb, std::string &error) {
    for (const char *channel : {"r", "g", "b"}) {
        if (!json.contains(channel) || !json[channel].is_number_integer()) {
            error = std::string("rgb value missing integer channel '") + channel + "'";
            return false;
        }
        int64_t c = json[channel].get<int64_t>();
        if (c < 0 || c > 255) {
            error = std::string("rgb channel '") + channel + "' must be between 0 and 255";
            return false;
        }
    }
    rgb = capability::RgbColor{static_cast<uint8_t>(json["r"].get<int64_t>()),
                               static_cast<uint8_t>(json["g"].get<int64_t>()),
                               static_cast<uint8_t>(json["b"].get<int64_t>())};
    return true;
}

bool decode_composite(const nlohmann::json &json, capability::CapabilityValue &value, std::string &error) {
    capability::CompositeValue composite;
    for (const auto &[name, field_json] : json.items()) {
        capability::FieldValue field;
        if (!decode_field_value(name, field_json, field, error)) {
            return false;
        }
        composite[name] = std::move(field);
    }
    value = std::move(composite);
    return true;
}

bool decode_tagged(const nlohmann::json &json, capability::CapabilityValue &value, std::string &error) {
    const auto type = json["type"].get<std::string>();
    if (!json.contains(type)) {
        error = "tagged value of type '" + type + "' missing '" + type + "' field";
        return false;
    }
    const auto &payload = json[type];

    if (type == "bool" && payload.is_boolean()) {
        value = payload.get<bool>();
    } else if (type == "int64" && payload.is_number_integer()) {
        value = payload.get<int64_t>();
    } else if (type == "double" && payload.is_number()) {
        value = payload.get<double>();
    } else if (type == "string" && payload.is_string()) {
        value = payload.get<std::string>();
    } else if (type == "rgb" && payload.is_object()) {
        capability::RgbColor rgb;
        if (!decode_rgb(payload, rgb, error)) return false;
        value = rgb;
    } else if (type == "composite" && payload.is_object()) {
        return decode_composite(payload, value, error);
    } else {
        error = "invalid tagged value of type '" + type + "'";
        return false;
    }
    return true;
}

}  // namespace

nlohmann::json encode_value(const capability::CapabilityValue &value) {
    nlohmann::json result;
    const std::string type = capability::value_type_name(value);
    result["type"] = type;

    std::visit(
        [&result, &type](auto &&v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, capability::RgbColor>) {
                result[type] = {{"r", v.r}, {"g", v.g}, {"b", v.b}};
            } else if constexpr (std::is_same_v<T, capability::CompositeValue>) {
                nlohmann::json fields = nlohmann::json::object();
                for (const auto &[name, field] : v) {
                    fields[name] = encode_field_value(field);
                }
                result[type] = fields;
            } else {
                result[type] = v;
            }
        },
        value);

    return result;
}

nlohmann::json encode_capability_spec(const capability::CapabilitySpec &spec) {
    nlohmann::json out = {{"instance", spec.instance},
                          {"type", spec.type},
                          {"kind", capability::kind_to_string(spec.kind)},
                          {"commandable", spec.commandable()}};

    switch (spec.kind) {
        case capability::CapabilityKind::RANGE:
            out["range"] = encode_range(spec.range);
            break;
        case capability::CapabilityKind::ON_OFF:
        case capability::CapabilityKind::MODE:
            out["options"] = option_names(spec.options);
            break;
        case capability::CapabilityKind::COMPOSITE: {
            nlohmann::json fields = nlohmann::json::array();
            for (const auto &field : spec.fields) {
                nlohmann::json f = {{"name", field.name},
                                    {"type", field_type_to_string(field.type)},
                                    {"required", field.required}};
                if (field.has_range) {
                    f["range"] = encode_range(field.range);
                }
                if (!field.options.empty()) {
                    f["options"] = option_names(field.options);
                }
                if (!field.default_value.is_null()) {
                    f["default"] = field.default_value;
                }
                fields.push_back(f);
            }
            out["fields"] = fields;
            break;
        }
        default:
            break;
    }
    return out;
}

nlohmann::json encode_device(const registry::Device &device) {
    nlohmann::json caps = nlohmann::json::array();
    for (const auto &spec : device.capabilities) {
        caps.push_back(encode_capability_spec(spec));
    }

    return {{"device_id", device.device_id},
            {"sku", device.sku},
            {"name", device.name},
            {"type", device.type},
            {"capabilities", caps}};
}

nlohmann::json encode_device_state(const state::DeviceState &state) {
    const auto now = std::chrono::system_clock::now();

    nlohmann::json caps = nlohmann::json::array();
    for (const auto &[instance, cached] : state.capabilities) {
        caps.push_back({{"instance", instance},
                        {"kind", capability::kind_to_string(cached.kind)},
                        {"value", encode_value(cached.value)},
                        {"stale", cached.stale},
                        {"timestamp_epoch_ms", to_epoch_ms(cached.updated_at)},
                        {"age_ms", cached.age(now).count()}});
    }

    nlohmann::json out = {{"device_id", state.device_id}, {"stale", state.stale}, {"capabilities", caps}};
    out["last_refresh_epoch_ms"] = state.last_refresh ? nlohmann::json(to_epoch_ms(*state.last_refresh)) : nullptr;
    if (!state.last_error.empty()) {
        out["last_error"] = state.last_error;
    }
    return out;
}

nlohmann::json encode_ledger(const governor::LedgerSnapshot &ledger) {
    return {{"quota", ledger.quota},
            {"used", ledger.used},
            {"remaining", ledger.remaining},
            {"poll_reserve", ledger.poll_reserve},
            {"exhausted_by_server", ledger.exhausted_by_server},
            {"resets_in_ms", ledger.resets_in.count()},
            {"routine_denials", ledger.routine_denials},
            {"user_denials", ledger.user_denials},
            {"windows_elapsed", ledger.windows_elapsed}};
}

nlohmann::json encode_sync_stats(const sync::SyncStats &stats) {
    nlohmann::json out = {{"phase", sync::phase_to_string(stats.phase)},
                          {"poll_interval_ms", stats.poll_interval_ms},
                          {"cycles_run", stats.cycles_run},
                          {"cycles_skipped", stats.cycles_skipped},
                          {"cycles_cancelled", stats.cycles_cancelled},
                          {"device_refreshes", stats.device_refreshes},
                          {"device_failures", stats.device_failures},
                          {"device_list_refreshes", stats.device_list_refreshes},
                          {"device_list_failures", stats.device_list_failures},
                          {"out_of_band_refreshes", stats.out_of_band_refreshes},
                          {"pending_refreshes", stats.pending_refreshes},
                          {"last_cycle_duration_ms", stats.last_cycle_duration.count()}};
    out["last_cycle_epoch_ms"] = stats.last_cycle_at_ms > 0 ? nlohmann::json(stats.last_cycle_at_ms) : nullptr;
    return out;
}

std::string event_type_name(const events::Event &event) {
    return std::visit(
        [](auto &&e) -> std::string {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, events::CapabilityChangeEvent>) {
                return "capability_change";
            } else if constexpr (std::is_same_v<T, events::StalenessChangeEvent>) {
                return "staleness_change";
            } else {
                return "device_inventory";
            }
        },
        event);
}

nlohmann::json encode_event(const events::Event &event) {
    nlohmann::json data;

    std::visit(
        [&data](auto &&e) {
            using T = std::decay_t<decltype(e)>;

            data["event_id"] = e.event_id;
            data["device_id"] = e.device_id;
            data["timestamp_ms"] = e.timestamp_ms;

            if constexpr (std::is_same_v<T, events::CapabilityChangeEvent>) {
                nlohmann::json changes = nlohmann::json::array();
                for (const auto &c : e.changes) {
                    changes.push_back({{"instance", c.instance},
                                       {"kind", capability::kind_to_string(c.kind)},
                                       {"value", encode_value(c.value)}});
                }
                data["changes"] = changes;
            } else if constexpr (std::is_same_v<T, events::StalenessChangeEvent>) {
                data["stale"] = e.stale;
            } else if constexpr (std::is_same_v<T, events::DeviceInventoryEvent>) {
                data["change"] = events::inventory_change_to_string(e.change);
            }
        },
        event);

    return data;
}

bool decode_value(const nlohmann::json &json, const capability::CapabilitySpec *spec,
                  capability::CapabilityValue &value, std::string &error) {
    // Tagged form is {"type": T, T: payload}; anything else is a plain object
    if (json.is_object() && json.size() == 2 && json.contains("type") && json["type"].is_string() &&
        json.contains(json["type"].get<std::string>())) {
        return decode_tagged(json, value, error);
    }

    using capability::CapabilityKind;
    const bool is_on_off = spec != nullptr && spec->kind == CapabilityKind::ON_OFF;
    const bool is_color = spec != nullptr && spec->kind == CapabilityKind::COLOR;

    if (json.is_boolean()) {
        value = json.get<bool>();
    } else if (json.is_number_integer()) {
        int64_t v = json.get<int64_t>();
        if (is_on_off && (v == 0 || v == 1)) {
            value = (v == 1);
        } else {
            value = v;
        }
    } else if (json.is_number_float()) {
        value = json.get<double>();
    } else if (json.is_string()) {
        value = json.get<std::string>();
    } else if (json.is_object()) {
        bool looks_rgb = json.size() == 3 && json.contains("r") && json.contains("g") && json.contains("b");
        if (is_color || (spec == nullptr && looks_rgb)) {
            capability::RgbColor rgb;
            if (!decode_rgb(json, rgb, error)) return false;
            value = rgb;
        } else {
            return decode_composite(json, value, error);
        }
    } else {
        error = "value must be a bool, number, string or object";
        return false;
    }
    return true;
}

}  // namespace http
}  // namespace skysync
