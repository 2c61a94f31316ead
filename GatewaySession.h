// GatewaySession.h
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "SubscriptionRegistry.h"

enum class SessionState {
    UNINITIALIZED, // No token learned yet
    TOKEN_KNOWN,
    WRITE_PENDING
};

std::string SessionStateName(SessionState state);

// --- Sub-device as known by its hub ---
struct SubDeviceInfo {
    std::string sid;
    std::string model;
    std::string short_id;
    std::string proto;
    nlohmann::json data = nlohmann::json::object(); // Last known decoded payload
};

struct GatewaySessionOptions {
    std::chrono::milliseconds command_timeout{ 5000 };
    int device_discovery_retries = 3;
};

// --- GatewaySession ---
// One per hub. Exchanges are synchronous and serialized by m_command_mutex:
// at most one correlated command is outstanding per hub, further callers wait.
class GatewaySession {
public:
    GatewaySession(std::string ip, uint16_t port, std::string sid, std::string key,
        std::string proto, std::string interface, std::string miio_token,
        GatewaySessionOptions options = GatewaySessionOptions());
    ~GatewaySession();

    GatewaySession(const GatewaySession&) = delete;
    GatewaySession& operator=(const GatewaySession&) = delete;

    // --- Commands ---
    // Throws NoKeyError (read-only hub), InvalidKeyError, CommandTimeoutError, ProtocolError.
    bool Write(const std::string& sid, const nlohmann::json& fields);
    bool WriteToHub(const nlohmann::json& fields) { return Write(m_sid, fields); }

    // nullopt when the hub did not answer (after the retry) or reported an error.
    std::optional<nlohmann::json> Read(const std::string& sid);

    // Device-list handshake. Learns the token and returns the raw answer.
    nlohmann::json RefreshToken();

    // Enumerates sub-devices and reads each once. False when the hub never answered.
    bool DiscoverDevices();

    // --- Push Path ---
    // Validates and decodes a report/heartbeat frame and fans it out to the
    // subscribers of its sid. Returns false when the frame was dropped.
    bool HandlePush(const nlohmann::json& frame);

    SubscriptionId Subscribe(const std::string& sid, PushCallback callback);
    bool Unsubscribe(SubscriptionId id);

    // Called for a pushed sid nobody subscribed to. It may subscribe before dispatch.
    void SetUnknownDeviceHandler(std::function<void(const SubDeviceInfo&)> handler);

    // --- Token ---
    std::string GetToken() const;
    void UpdateToken(const std::string& token);

    // --- Getters ---
    const std::string& GetIp() const { return m_ip; }
    uint16_t GetPort() const { return m_port; }
    const std::string& GetSid() const { return m_sid; }
    const std::string& GetProto() const { return m_proto; }
    const std::string& GetMiioToken() const { return m_miio_token; }
    bool HasKey() const { return !m_key.empty(); }
    bool IsProtoV2() const;
    SessionState GetState() const;
    std::map<std::string, SubDeviceInfo> GetDevices() const;

private:
    // Caller holds m_command_mutex.
    nlohmann::json SendCommand(const nlohmann::json& cmd, const std::string& expected_cmd, const std::string& sid);
    std::optional<nlohmann::json> SendOnce(const std::string& payload, const std::string& expected_cmd, const std::string& sid);
    nlohmann::json RefreshToken_NoLock();
    std::optional<nlohmann::json> ReadFrame_NoLock(const std::string& sid);
    nlohmann::json BuildWriteFrame(const std::string& sid, const nlohmann::json& fields);

    void AbsorbToken(const nlohmann::json& frame);
    void SetState(SessionState state);
    SubDeviceInfo RememberDevice(const std::string& sid, const nlohmann::json& frame, const nlohmann::json& payload);

    // --- Member Variables ---
    std::string m_ip;
    uint16_t m_port;
    std::string m_sid;
    std::string m_key;
    std::string m_proto;
    std::string m_interface;
    std::string m_miio_token;
    GatewaySessionOptions m_options;

    std::mutex m_command_mutex;

    mutable std::mutex m_state_mutex; // Guards token, state and device table
    std::string m_token;
    SessionState m_state;
    std::map<std::string, SubDeviceInfo> m_devices;

    SubscriptionRegistry m_subscriptions;

    std::mutex m_handler_mutex;
    std::function<void(const SubDeviceInfo&)> m_unknown_device_handler;
};
