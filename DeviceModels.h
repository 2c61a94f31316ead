// DeviceModels.h
#pragma once

#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

enum class DeviceCategory {
    Gateway,
    Switch,
    Sensor,
    BinarySensor,
    Unknown
};

std::string CategoryName(DeviceCategory category);

// Writes decoded values into attributes. Returns true when a functional
// field (switch state, reading) changed.
using DecodeFn = std::function<bool(const std::vector<std::string>& data_keys,
    const nlohmann::json& data, nlohmann::json& attributes)>;

// Turns a logical command (field, value) into the fields of a hub write.
using EncodeFn = std::function<nlohmann::json(const std::string& field, const nlohmann::json& value)>;

// --- Model Descriptor ---
struct ModelDescriptor {
    std::string model;
    DeviceCategory category = DeviceCategory::Unknown;
    std::string name;                  // Display name, e.g. "Wall Switch"
    std::vector<std::string> channels; // Data keys carrying the functional state
    bool legacy_status_key = false;    // 1.x firmware reports "status" instead of "channel_0"
    bool supports_power = false;
    DecodeFn decode;
    EncodeFn encode_command;           // Empty for read-only devices
};

// Data keys in effect for one device ("status" or its channels).
std::vector<std::string> DataKeysFor(const ModelDescriptor& descriptor, const std::string& device_proto);

// --- Model Registration Table ---
class ModelRegistry {
public:
    ModelRegistry() = default;

    // Replaces an existing registration for the same model.
    void Register(ModelDescriptor descriptor);
    std::shared_ptr<const ModelDescriptor> Find(const std::string& model) const;
    std::vector<std::string> Models() const;

    // Plugs, wall switches, climate, door, motion, leak and button sensors.
    static std::shared_ptr<ModelRegistry> CreateDefault();

private:
    std::map<std::string, std::shared_ptr<const ModelDescriptor>> m_models;
    mutable std::shared_mutex m_mutex;
};

// --- Per-Type Decoders ---
bool DecodeSwitch(const std::vector<std::string>& data_keys, const nlohmann::json& data, nlohmann::json& attributes);
bool DecodeClimateSensor(const std::vector<std::string>& data_keys, const nlohmann::json& data, nlohmann::json& attributes);
bool DecodeMagnet(const std::vector<std::string>& data_keys, const nlohmann::json& data, nlohmann::json& attributes);
bool DecodeMotion(const std::vector<std::string>& data_keys, const nlohmann::json& data, nlohmann::json& attributes);
bool DecodeLeak(const std::vector<std::string>& data_keys, const nlohmann::json& data, nlohmann::json& attributes);
bool DecodeButton(const std::vector<std::string>& data_keys, const nlohmann::json& data, nlohmann::json& attributes);

nlohmann::json EncodeOnOff(const std::string& field, const nlohmann::json& value);
