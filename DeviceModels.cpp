#include "DeviceModels.h"

#include <cmath>
#include <mutex>
#include <optional>

namespace {

// Hub values come as numbers on 2.x firmware and as numeric strings on 1.x.
std::optional<double> ToNumber(const nlohmann::json& value) {
    if (value.is_number()) return value.get<double>();
    if (value.is_string()) {
        try {
            size_t used = 0;
            const std::string s = value.get<std::string>();
            double d = std::stod(s, &used);
            if (used == s.size()) return d;
        }
        catch (const std::exception&) {
        }
    }
    return std::nullopt;
}

double Round(double value, int digits) {
    double scale = std::pow(10.0, digits);
    return std::round(value * scale) / scale;
}

// Stores value under key, reports whether it differs from the previous one.
bool SetIfChanged(nlohmann::json& attributes, const std::string& key, const nlohmann::json& value) {
    auto it = attributes.find(key);
    if (it != attributes.end() && *it == value) return false;
    attributes[key] = value;
    return true;
}

bool DecodeGateway(const std::vector<std::string>&, const nlohmann::json& data, nlohmann::json& attributes) {
    bool changed = false;
    if (data.contains("rgb")) {
        if (auto rgb = ToNumber(data["rgb"])) changed |= SetIfChanged(attributes, "rgb", static_cast<long long>(*rgb));
    }
    if (data.contains("illumination")) {
        if (auto lux = ToNumber(data["illumination"])) changed |= SetIfChanged(attributes, "illumination", *lux);
    }
    return changed;
}

} // namespace

std::string CategoryName(DeviceCategory category) {
    switch (category) {
    case DeviceCategory::Gateway: return "gateway";
    case DeviceCategory::Switch: return "switch";
    case DeviceCategory::Sensor: return "sensor";
    case DeviceCategory::BinarySensor: return "binary_sensor";
    case DeviceCategory::Unknown:
    default: return "unknown";
    }
}

std::vector<std::string> DataKeysFor(const ModelDescriptor& descriptor, const std::string& device_proto) {
    if (descriptor.legacy_status_key && (device_proto.empty() || device_proto[0] == '1')) {
        return { "status" };
    }
    return descriptor.channels;
}

// --- Per-Type Decoders ---

bool DecodeSwitch(const std::vector<std::string>& data_keys, const nlohmann::json& data, nlohmann::json& attributes) {
    if (data.contains("inuse")) {
        if (auto in_use = ToNumber(data["inuse"])) {
            attributes["in_use"] = static_cast<int>(*in_use);
            if (static_cast<int>(*in_use) == 0) {
                attributes["load_power"] = 0.0;
            }
        }
    }

    for (const char* key : { "power_consumed", "energy_consumed" }) {
        if (data.contains(key)) {
            if (auto consumed = ToNumber(data[key])) attributes["power_consumed"] = Round(*consumed, 2);
            break;
        }
    }

    if (data.contains("load_power")) {
        if (auto power = ToNumber(data["load_power"])) attributes["load_power"] = Round(*power, 2);
    }

    // Only the on/off state counts as a functional change
    bool changed = false;
    for (const auto& key : data_keys) {
        auto it = data.find(key);
        if (it == data.end() || !it->is_string()) continue;
        const std::string value = it->get<std::string>();
        if (value != "on" && value != "off") continue;
        changed |= SetIfChanged(attributes, key, value == "on");
    }
    return changed;
}

bool DecodeClimateSensor(const std::vector<std::string>&, const nlohmann::json& data, nlohmann::json& attributes) {
    bool changed = false;
    if (data.contains("temperature")) {
        auto raw = ToNumber(data["temperature"]);
        if (raw) {
            double celsius = Round(*raw / 100.0, 2);
            if (celsius >= -50.0 && celsius <= 60.0) changed |= SetIfChanged(attributes, "temperature", celsius);
        }
    }
    if (data.contains("humidity")) {
        auto raw = ToNumber(data["humidity"]);
        if (raw) {
            double percent = Round(*raw / 100.0, 2);
            if (percent >= 0.0 && percent <= 100.0) changed |= SetIfChanged(attributes, "humidity", percent);
        }
    }
    if (data.contains("pressure")) {
        auto raw = ToNumber(data["pressure"]);
        if (raw) changed |= SetIfChanged(attributes, "pressure", Round(*raw / 100.0, 2)); // Pa -> hPa
    }
    return changed;
}

bool DecodeMagnet(const std::vector<std::string>&, const nlohmann::json& data, nlohmann::json& attributes) {
    bool changed = false;
    if (data.contains("no_close")) {
        if (auto seconds = ToNumber(data["no_close"])) attributes["open_since"] = static_cast<long long>(*seconds);
        changed |= SetIfChanged(attributes, "open", true);
    }
    auto it = data.find("status");
    if (it != data.end() && it->is_string()) {
        const std::string status = it->get<std::string>();
        if (status == "open") changed |= SetIfChanged(attributes, "open", true);
        else if (status == "close") changed |= SetIfChanged(attributes, "open", false);
    }
    return changed;
}

bool DecodeMotion(const std::vector<std::string>&, const nlohmann::json& data, nlohmann::json& attributes) {
    bool changed = false;
    for (const char* key : { "lux", "illumination" }) {
        if (data.contains(key)) {
            if (auto lux = ToNumber(data[key])) changed |= SetIfChanged(attributes, "illuminance", *lux);
            break;
        }
    }
    if (data.contains("no_motion")) {
        if (auto seconds = ToNumber(data["no_motion"])) attributes["no_motion_since"] = static_cast<long long>(*seconds);
        changed |= SetIfChanged(attributes, "motion", false);
    }
    auto it = data.find("status");
    if (it != data.end() && it->is_string() && it->get<std::string>() == "motion") {
        // Every motion report is an event, even when already in motion
        attributes["motion"] = true;
        attributes["no_motion_since"] = 0;
        changed = true;
    }
    return changed;
}

bool DecodeLeak(const std::vector<std::string>&, const nlohmann::json& data, nlohmann::json& attributes) {
    auto it = data.find("status");
    if (it == data.end() || !it->is_string()) return false;
    const std::string status = it->get<std::string>();
    if (status == "leak") return SetIfChanged(attributes, "leak", true);
    if (status == "no_leak") return SetIfChanged(attributes, "leak", false);
    return false;
}

bool DecodeButton(const std::vector<std::string>& data_keys, const nlohmann::json& data, nlohmann::json& attributes) {
    bool changed = false;
    for (const auto& key : data_keys) {
        auto it = data.find(key);
        if (it == data.end() || !it->is_string()) continue;
        attributes["last_action"] = it->get<std::string>();
        attributes["last_action_channel"] = key;
        changed = true;
    }
    return changed;
}

nlohmann::json EncodeOnOff(const std::string& field, const nlohmann::json& value) {
    bool on = false;
    if (value.is_boolean()) on = value.get<bool>();
    else if (value.is_string()) on = value.get<std::string>() == "on";
    else if (value.is_number()) on = value.get<double>() != 0.0;
    return nlohmann::json{ {field, on ? "on" : "off"} };
}

// --- ModelRegistry ---

void ModelRegistry::Register(ModelDescriptor descriptor) {
    std::string model = descriptor.model;
    auto ptr = std::make_shared<const ModelDescriptor>(std::move(descriptor));
    std::lock_guard<std::shared_mutex> lock(m_mutex);
    m_models[model] = std::move(ptr);
}

std::shared_ptr<const ModelDescriptor> ModelRegistry::Find(const std::string& model) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_models.find(model);
    if (it == m_models.end()) return nullptr;
    return it->second;
}

std::vector<std::string> ModelRegistry::Models() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    std::vector<std::string> models;
    models.reserve(m_models.size());
    for (const auto& [model, descriptor] : m_models) {
        models.push_back(model);
    }
    return models;
}

std::shared_ptr<ModelRegistry> ModelRegistry::CreateDefault() {
    auto registry = std::make_shared<ModelRegistry>();

    auto add = [&](std::initializer_list<const char*> models, DeviceCategory category, const std::string& name,
        std::vector<std::string> channels, bool legacy_status, bool power, DecodeFn decode, EncodeFn encode) {
        for (const char* model : models) {
            ModelDescriptor d;
            d.model = model;
            d.category = category;
            d.name = name;
            d.channels = channels;
            d.legacy_status_key = legacy_status;
            d.supports_power = power;
            d.decode = decode;
            d.encode_command = encode;
            registry->Register(std::move(d));
        }
    };

    // --- Hubs ---
    add({ "gateway", "gateway.v3", "acpartner.v3" }, DeviceCategory::Gateway, "Gateway", {}, false, false, DecodeGateway, nullptr);

    // --- Switches ---
    add({ "plug" }, DeviceCategory::Switch, "Plug", { "channel_0" }, true, true, DecodeSwitch, EncodeOnOff);
    add({ "86plug", "ctrl_86plug", "ctrl_86plug.aq1" }, DeviceCategory::Switch, "Wall Plug", { "channel_0" }, true, true, DecodeSwitch, EncodeOnOff);
    add({ "ctrl_neutral1", "ctrl_neutral1.aq1" }, DeviceCategory::Switch, "Wall Switch", { "channel_0" }, false, false, DecodeSwitch, EncodeOnOff);
    add({ "ctrl_ln1", "ctrl_ln1.aq1" }, DeviceCategory::Switch, "Wall Switch LN", { "channel_0" }, false, false, DecodeSwitch, EncodeOnOff);
    add({ "ctrl_neutral2", "ctrl_neutral2.aq1" }, DeviceCategory::Switch, "Wall Switch", { "channel_0", "channel_1" }, false, false, DecodeSwitch, EncodeOnOff);
    add({ "ctrl_ln2", "ctrl_ln2.aq1" }, DeviceCategory::Switch, "Wall Switch LN", { "channel_0", "channel_1" }, false, false, DecodeSwitch, EncodeOnOff);

    // --- Sensors ---
    add({ "sensor_ht", "weather", "weather.v1" }, DeviceCategory::Sensor, "Climate Sensor", {}, false, false, DecodeClimateSensor, nullptr);

    // --- Binary sensors ---
    add({ "magnet", "sensor_magnet", "sensor_magnet.aq2" }, DeviceCategory::BinarySensor, "Door Window Sensor", { "status" }, false, false, DecodeMagnet, nullptr);
    add({ "motion", "sensor_motion", "sensor_motion.aq2" }, DeviceCategory::BinarySensor, "Motion Sensor", { "status" }, false, false, DecodeMotion, nullptr);
    add({ "sensor_wleak.aq1" }, DeviceCategory::BinarySensor, "Water Leak Sensor", { "status" }, false, false, DecodeLeak, nullptr);
    add({ "switch", "sensor_switch", "sensor_switch.aq2", "sensor_switch.aq3" }, DeviceCategory::BinarySensor, "Button", { "status", "channel_0" }, false, false, DecodeButton, nullptr);
    add({ "86sw1", "sensor_86sw1", "sensor_86sw1.aq1" }, DeviceCategory::BinarySensor, "Wall Button", { "channel_0" }, false, false, DecodeButton, nullptr);
    add({ "86sw2", "sensor_86sw2", "sensor_86sw2.aq1" }, DeviceCategory::BinarySensor, "Wall Button Dual", { "channel_0", "channel_1", "dual_channel" }, false, false, DecodeButton, nullptr);

    return registry;
}
