// HubConfig.h
#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// --- Static Gateway Entry ---
struct StaticGatewayEntry {
    std::string host;        // empty: address learned through discovery
    uint16_t port = 0;       // 9898 by default when host is set
    std::string sid;         // normalized, empty when not declared
    std::string key;         // 16 chars, empty for a read-only hub
    bool disable = false;
    std::string miio_token;  // 32 hex chars, enables the auxiliary RPC channel
};

struct MqttSettings {
    bool enabled = false;
    std::string broker_uri;
    std::string client_id = "migateway_bridge";
    std::string topic_prefix = "migateway";
    std::string username;
    std::string password;
    int keep_alive = 60;
    int qos = 1;
};

struct BridgeConfig {
    std::vector<StaticGatewayEntry> gateways;
    std::string interface = "any";
    int discovery_retry = 3;
    std::chrono::minutes unavailable_after{ 150 };
    std::chrono::milliseconds poll_interval{ 30000 }; // power plugs and gateway radio
    int worker_threads = 0; // 0: hardware concurrency
    MqttSettings mqtt;
};

// Throws ConfigError. Runs before any network activity.
void ValidateGatewayEntries(const std::vector<StaticGatewayEntry>& entries);

BridgeConfig ParseBridgeConfig(const nlohmann::json& root);
BridgeConfig LoadBridgeConfig(const std::string& path);
