#include "HubConfig.h"
#include "HubErrors.h"
#include "HubProtocol.h"
#include "Logging.h"

#include <fstream>
#include <set>

namespace {

// --- Helper to read optional typed values with a default ---
template <typename T>
T GetOr(const nlohmann::json& obj, const char* key, const T& default_value) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return default_value;
    try {
        return it->get<T>();
    }
    catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Invalid value for '") + key + "': " + e.what());
    }
}

StaticGatewayEntry ParseGatewayEntry(const nlohmann::json& j) {
    if (!j.is_object()) throw ConfigError("Gateway entry must be an object");

    StaticGatewayEntry entry;
    entry.host = GetOr<std::string>(j, "host", "");

    // "mac" is the documented name, "sid" is accepted as an alias
    std::string raw_sid = GetOr<std::string>(j, "mac", GetOr<std::string>(j, "sid", ""));
    entry.sid = HubProtocol::NormalizeSid(raw_sid);

    entry.key = GetOr<std::string>(j, "key", "");
    entry.disable = GetOr<bool>(j, "disable", false);
    entry.miio_token = GetOr<std::string>(j, "miio_token", "");

    int port = GetOr<int>(j, "port", HubProtocol::kDefaultGatewayPort);
    if (port < 1 || port > 65535) {
        throw ConfigError("Gateway port out of range: " + std::to_string(port));
    }
    entry.port = entry.host.empty() ? 0 : static_cast<uint16_t>(port);

    if (entry.key.empty()) {
        AddLog("Config Warning: Key is not provided for gateway " + (entry.sid.empty() ? std::string("<unknown>") : entry.sid) +
            ". Controlling the gateway will not be possible.");
    }
    return entry;
}

} // namespace

void ValidateGatewayEntries(const std::vector<StaticGatewayEntry>& entries) {
    std::set<std::string> seen;
    for (const auto& entry : entries) {
        if (!entry.key.empty() && entry.key.size() != 16) {
            throw ConfigError("Gateway key must be exactly 16 characters");
        }
        if (!entry.sid.empty() && !HubProtocol::IsValidSid(entry.sid)) {
            throw ConfigError("Gateway sid '" + entry.sid + "' is not a 12 or 14 digit hex id");
        }
        if (entries.size() > 1 && entry.sid.empty()) {
            throw ConfigError("Every gateway must declare its mac when more than one gateway is configured");
        }
        if (!entry.sid.empty() && !seen.insert(entry.sid).second) {
            throw ConfigError("Gateway sid '" + entry.sid + "' is declared more than once");
        }
    }
}

BridgeConfig ParseBridgeConfig(const nlohmann::json& root) {
    if (!root.is_object()) throw ConfigError("Configuration root must be an object");

    BridgeConfig config;

    auto gw_it = root.find("gateways");
    if (gw_it != root.end() && !gw_it->is_null()) {
        if (gw_it->is_object()) {
            config.gateways.push_back(ParseGatewayEntry(*gw_it));
        }
        else if (gw_it->is_array()) {
            for (const auto& j : *gw_it) {
                config.gateways.push_back(ParseGatewayEntry(j));
            }
        }
        else {
            throw ConfigError("'gateways' must be a list");
        }
    }
    ValidateGatewayEntries(config.gateways);

    config.interface = GetOr<std::string>(root, "interface", "any");
    config.discovery_retry = GetOr<int>(root, "discovery_retry", 3);
    if (config.discovery_retry < 1) throw ConfigError("discovery_retry must be positive");

    int minutes = GetOr<int>(root, "unavailable_after_minutes", 150);
    if (minutes < 1) throw ConfigError("unavailable_after_minutes must be positive");
    config.unavailable_after = std::chrono::minutes(minutes);

    int poll_seconds = GetOr<int>(root, "poll_interval_seconds", 30);
    if (poll_seconds < 1) throw ConfigError("poll_interval_seconds must be positive");
    config.poll_interval = std::chrono::seconds(poll_seconds);

    config.worker_threads = GetOr<int>(root, "worker_threads", 0);
    if (config.worker_threads < 0) throw ConfigError("worker_threads must not be negative");

    auto mqtt_it = root.find("mqtt");
    if (mqtt_it != root.end() && mqtt_it->is_object()) {
        const auto& m = *mqtt_it;
        config.mqtt.broker_uri = GetOr<std::string>(m, "broker_uri", "");
        config.mqtt.enabled = !config.mqtt.broker_uri.empty();
        config.mqtt.client_id = GetOr<std::string>(m, "client_id", config.mqtt.client_id);
        config.mqtt.topic_prefix = GetOr<std::string>(m, "topic_prefix", config.mqtt.topic_prefix);
        config.mqtt.username = GetOr<std::string>(m, "username", "");
        config.mqtt.password = GetOr<std::string>(m, "password", "");
        config.mqtt.keep_alive = GetOr<int>(m, "keep_alive", 60);
        config.mqtt.qos = GetOr<int>(m, "qos", 1);
        if (config.mqtt.qos < 0 || config.mqtt.qos > 2) throw ConfigError("mqtt.qos must be 0, 1 or 2");
    }
    return config;
}

BridgeConfig LoadBridgeConfig(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ConfigError("Cannot open configuration file " + path);

    nlohmann::json root = nlohmann::json::parse(in, nullptr, false);
    if (root.is_discarded()) throw ConfigError("Configuration file " + path + " is not valid JSON");

    BridgeConfig config = ParseBridgeConfig(root);
    AddLog("Config: Loaded " + std::to_string(config.gateways.size()) + " static gateway(s) from " + path);
    return config;
}
