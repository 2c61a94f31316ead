#include "MqttBridge.h"
#include "HubErrors.h"
#include "Logging.h"

#include <optional>
#include <stdexcept>
#include <vector>

// --- Topics ---
namespace MqttTopics {

std::string State(const std::string& prefix, const std::string& hub_sid, const std::string& sid) {
    return prefix + "/" + hub_sid + "/" + sid + "/state";
}

std::string Availability(const std::string& prefix, const std::string& hub_sid, const std::string& sid) {
    return prefix + "/" + hub_sid + "/" + sid + "/availability";
}

std::string BridgeStatus(const std::string& prefix) {
    return prefix + "/bridge/status";
}

bool ParseCommandTopic(const std::string& prefix, const std::string& topic, CommandTarget& target) {
    if (topic.compare(0, prefix.size() + 1, prefix + "/") != 0) return false;

    std::vector<std::string> parts;
    size_t start = prefix.size() + 1;
    while (true) {
        size_t slash = topic.find('/', start);
        parts.push_back(topic.substr(start, slash == std::string::npos ? std::string::npos : slash - start));
        if (slash == std::string::npos) break;
        start = slash + 1;
    }
    if (parts.size() != 3 || parts[0].empty() || parts[1].empty() || parts[2].empty()) return false;

    target = CommandTarget();
    target.hub_sid = parts[0];
    if (parts[1] == "service") {
        target.service = parts[2];
        return true;
    }
    if (parts[2] == "set") {
        target.sid = parts[1];
        return true;
    }
    return false;
}

} // namespace MqttTopics

namespace MqttServiceArgs {

Ringtone ParseRingtone(const nlohmann::json& args) {
    auto id_it = args.find("ringtone_id");
    if (id_it == args.end()) throw std::invalid_argument("play_ringtone requires ringtone_id");
    Ringtone ringtone;
    ringtone.ringtone_id = id_it->get<int>();
    auto vol_it = args.find("ringtone_vol");
    if (vol_it != args.end()) ringtone.volume = vol_it->get<int>();
    return ringtone;
}

} // namespace MqttServiceArgs

// --- MqttBridge ---

MqttBridge::MqttBridge(GatewayBridge& bridge, MqttSettings settings)
    : m_bridge(bridge),
    m_settings(std::move(settings))
{
}

MqttBridge::~MqttBridge() {
    Stop();
}

void MqttBridge::Start() {
    if (m_thread.joinable()) return;
    m_stop = false;

    int rc = MQTTClient_create(&m_client, m_settings.broker_uri.c_str(), m_settings.client_id.c_str(), MQTTCLIENT_PERSISTENCE_NONE, NULL);
    if (rc != MQTTCLIENT_SUCCESS) {
        m_client = nullptr;
        AddLog("MQTT Error: Failed to create client for " + m_settings.broker_uri + " (rc=" + std::to_string(rc) + ")");
        return;
    }
    MQTTClient_setCallbacks(m_client, this, ConnectionLost, MessageArrived, NULL);

    m_bridge.Devices().SetStateListener([this](const SubDeviceSnapshot& snapshot) {
        PublishState(snapshot);
        });

    m_thread = std::thread(&MqttBridge::RunLoop, this);
}

void MqttBridge::Stop() {
    m_stop = true;
    if (m_thread.joinable()) m_thread.join();
    m_bridge.Devices().SetStateListener(nullptr);

    std::lock_guard<std::mutex> lock(m_client_mutex);
    if (m_client) {
        if (MQTTClient_isConnected(m_client)) {
            const std::string topic = MqttTopics::BridgeStatus(m_settings.topic_prefix);
            MQTTClient_message pubmsg = MQTTClient_message_initializer;
            pubmsg.payload = (void*)"offline";
            pubmsg.payloadlen = 7;
            pubmsg.qos = m_settings.qos;
            pubmsg.retained = 1;
            MQTTClient_publishMessage(m_client, topic.c_str(), &pubmsg, NULL);
            MQTTClient_disconnect(m_client, 1000);
        }
        MQTTClient_destroy(&m_client);
        m_client = nullptr;
    }
    m_connected = false;
}

bool MqttBridge::Connect() {
    const std::string will_topic = MqttTopics::BridgeStatus(m_settings.topic_prefix);

    MQTTClient_connectOptions conn_opts = MQTTClient_connectOptions_initializer;
    MQTTClient_willOptions will_opts = MQTTClient_willOptions_initializer;
    conn_opts.keepAliveInterval = m_settings.keep_alive;
    conn_opts.cleansession = 1;
    if (!m_settings.username.empty()) {
        conn_opts.username = m_settings.username.c_str();
        conn_opts.password = m_settings.password.c_str();
    }
    will_opts.topicName = will_topic.c_str();
    will_opts.message = "offline";
    will_opts.qos = m_settings.qos;
    will_opts.retained = 1;
    conn_opts.will = &will_opts;

    int rc;
    {
        std::lock_guard<std::mutex> lock(m_client_mutex);
        rc = MQTTClient_connect(m_client, &conn_opts);
    }
    if (rc != MQTTCLIENT_SUCCESS) {
        AddLog("MQTT Error: Connection to " + m_settings.broker_uri + " failed (rc=" + std::to_string(rc) + ")");
        return false;
    }

    m_connected = true;
    AddLog("MQTT: Connected to " + m_settings.broker_uri);

    // <prefix>/<hub>/<sid>/set and <prefix>/<hub>/service/<name>
    const std::string sub_topic = m_settings.topic_prefix + "/+/+/+";
    {
        std::lock_guard<std::mutex> lock(m_client_mutex);
        MQTTClient_subscribe(m_client, sub_topic.c_str(), m_settings.qos);
    }
    AddLog("MQTT: Subscribed to " + sub_topic);

    Publish(will_topic, "online", true);
    PublishAll();
    return true;
}

void MqttBridge::RunLoop() {
    AddLog("MQTT: Thread Started. Waiting for connection...");
    while (!m_stop) {
        if (!m_connected) {
            if (!Connect()) {
                for (int i = 0; i < 50 && !m_stop; ++i) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(100));
                }
                continue;
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

void MqttBridge::PublishAll() {
    for (const auto& snapshot : m_bridge.Devices().Snapshot()) {
        PublishState(snapshot);
    }
}

void MqttBridge::PublishState(const SubDeviceSnapshot& snapshot) {
    nlohmann::json state = snapshot.attributes;
    state["model"] = snapshot.model;
    state["category"] = CategoryName(snapshot.category);
    if (!snapshot.name.empty()) state["name"] = snapshot.name;

    Publish(MqttTopics::State(m_settings.topic_prefix, snapshot.hub_sid, snapshot.sid), state.dump(), true);
    Publish(MqttTopics::Availability(m_settings.topic_prefix, snapshot.hub_sid, snapshot.sid),
        snapshot.available ? "online" : "offline", true);
}

void MqttBridge::Publish(const std::string& topic, const std::string& payload, bool retained) {
    std::lock_guard<std::mutex> lock(m_client_mutex);
    if (!m_client || !m_connected) return;

    MQTTClient_message pubmsg = MQTTClient_message_initializer;
    pubmsg.payload = (void*)payload.data();
    pubmsg.payloadlen = (int)payload.size();
    pubmsg.qos = m_settings.qos;
    pubmsg.retained = retained ? 1 : 0;
    int rc = MQTTClient_publishMessage(m_client, topic.c_str(), &pubmsg, NULL);
    if (rc != MQTTCLIENT_SUCCESS) {
        AddLog("MQTT Error: Publish to " + topic + " failed (rc=" + std::to_string(rc) + ")");
    }
}

void MqttBridge::ConnectionLost(void* context, char* cause) {
    MqttBridge* self = static_cast<MqttBridge*>(context);
    if (self == nullptr) return;
    self->m_connected = false;
    AddLog("MQTT Error: Connection lost" + std::string(cause ? (": " + std::string(cause)) : ""));
}

int MqttBridge::MessageArrived(void* context, char* topicName, int topicLen, MQTTClient_message* message) {
    MqttBridge* self = static_cast<MqttBridge*>(context);
    std::string topic = topicLen > 0 ? std::string(topicName, topicLen) : std::string(topicName);
    std::string payload((char*)message->payload, message->payloadlen);
    MQTTClient_freeMessage(&message);
    MQTTClient_free(topicName);

    if (self == nullptr || self->m_stop) return 1;

    // Hub commands block for up to two timeouts, keep them off the Paho thread
    boost::asio::post(self->m_bridge.GetIoContext(), [self, topic, payload]() {
        self->HandleCommand(topic, payload);
        });
    return 1;
}

void MqttBridge::HandleCommand(const std::string& topic, const std::string& payload) {
    MqttTopics::CommandTarget target;
    if (!MqttTopics::ParseCommandTopic(m_settings.topic_prefix, topic, target)) return;

    nlohmann::json args = payload.empty() ? nlohmann::json::object() : nlohmann::json::parse(payload, nullptr, false);
    if (args.is_discarded() || !args.is_object()) {
        AddLog("MQTT Error: Payload on " + topic + " is not a JSON object");
        return;
    }
    if (g_log_show_ingress) AddLog("MQTT << " + topic + " " + payload, LogType::INGRESS);

    try {
        if (!target.service.empty()) {
            HandleService(target, args);
            return;
        }
        for (const auto& [field, value] : args.items()) {
            bool ok = m_bridge.WriteSubDevice(target.sid, field, value);
            if (!ok) AddLog("MQTT: Write " + field + " to " + target.sid + " was not acknowledged");
        }
    }
    catch (const HubError& e) {
        AddLog("MQTT Error: " + topic + ": " + e.what());
        PushNotification(std::string("Command failed: ") + e.what(), false);
    }
    catch (const std::invalid_argument& e) {
        AddLog("MQTT Error: " + topic + ": " + e.what());
    }
    catch (const nlohmann::json::exception& e) {
        AddLog("MQTT Error: " + topic + ": bad argument type: " + e.what());
    }
}

void MqttBridge::HandleService(const MqttTopics::CommandTarget& target, const nlohmann::json& args) {
    GatewayServices& services = m_bridge.Services();
    bool ok = false;

    if (target.service == "play_ringtone") {
        MqttServiceArgs::Ringtone ringtone = MqttServiceArgs::ParseRingtone(args);
        ok = services.PlayRingtone(target.hub_sid, ringtone.ringtone_id, ringtone.volume);
    }
    else if (target.service == "stop_ringtone") {
        ok = services.StopRingtone(target.hub_sid);
    }
    else if (target.service == "add_device") {
        ok = services.AddDevice(target.hub_sid);
    }
    else if (target.service == "remove_device") {
        ok = services.RemoveDevice(target.hub_sid, args.value("device_id", ""));
    }
    else if (target.service == "radio_volume") {
        ok = services.RadioVolume(target.hub_sid, args.value("volume", -1));
    }
    else if (target.service == "radio_power") {
        auto on_it = args.find("on");
        if (on_it == args.end()) throw std::invalid_argument("radio_power requires on");
        ok = m_bridge.SetRadioPower(target.hub_sid, on_it->get<bool>());
    }
    else if (target.service == "radio_refresh") {
        m_bridge.RefreshRadio(target.hub_sid);
        ok = true;
    }
    else {
        AddLog("MQTT: Unknown service " + target.service);
        return;
    }
    AddLog("MQTT: Service " + target.service + " on " + target.hub_sid + (ok ? " done" : " failed"));
}
