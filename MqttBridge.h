// MqttBridge.h
#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <MQTTClient.h>
#include <nlohmann/json.hpp>

#include "DeviceRegistry.h"
#include "GatewayBridge.h"
#include "HubConfig.h"

// --- MQTT Topic Layout ---
// <prefix>/<hub>/<sid>/state         retained JSON attributes
// <prefix>/<hub>/<sid>/availability  "online" / "offline"
// <prefix>/<hub>/<sid>/set           JSON object of fields to write
// <prefix>/<hub>/service/<name>      hub services (play_ringtone, ...)
// <prefix>/bridge/status             bridge liveness, last will "offline"
namespace MqttTopics {

std::string State(const std::string& prefix, const std::string& hub_sid, const std::string& sid);
std::string Availability(const std::string& prefix, const std::string& hub_sid, const std::string& sid);
std::string BridgeStatus(const std::string& prefix);

struct CommandTarget {
    std::string hub_sid;
    std::string sid;     // set for device writes
    std::string service; // set for hub services
};

// False when the topic is neither a device "set" nor a hub "service" topic.
bool ParseCommandTopic(const std::string& prefix, const std::string& topic, CommandTarget& target);

} // namespace MqttTopics

// --- Service Arguments ---
namespace MqttServiceArgs {

struct Ringtone {
    int ringtone_id = 0;
    std::optional<int> volume;
};

// {"ringtone_id": 2, "ringtone_vol": 40}. Throws std::invalid_argument when the
// id is missing, nlohmann::json::type_error for wrong types.
Ringtone ParseRingtone(const nlohmann::json& args);

} // namespace MqttServiceArgs

// --- MqttBridge ---
// Publishes registry state and forwards commands back into the bridge.
class MqttBridge {
public:
    MqttBridge(GatewayBridge& bridge, MqttSettings settings);
    ~MqttBridge();

    MqttBridge(const MqttBridge&) = delete;
    MqttBridge& operator=(const MqttBridge&) = delete;

    void Start();
    void Stop();
    bool IsConnected() const { return m_connected; }

private:
    void RunLoop();
    bool Connect();
    void PublishAll();
    void PublishState(const SubDeviceSnapshot& snapshot);
    void Publish(const std::string& topic, const std::string& payload, bool retained);
    void HandleCommand(const std::string& topic, const std::string& payload);
    void HandleService(const MqttTopics::CommandTarget& target, const nlohmann::json& args);

    static int MessageArrived(void* context, char* topicName, int topicLen, MQTTClient_message* message);
    static void ConnectionLost(void* context, char* cause);

    GatewayBridge& m_bridge;
    MqttSettings m_settings;

    MQTTClient m_client = nullptr;
    std::mutex m_client_mutex;
    std::thread m_thread;
    std::atomic<bool> m_stop{ false };
    std::atomic<bool> m_connected{ false };
};
