// GatewayAuxRpc.h
#pragma once

#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "MiioClient.h"

// --- GatewayAuxRpc ---
// Radio and info commands over the hub's miIO channel, independent of the LAN session.
class GatewayAuxRpc {
public:
    struct RadioState {
        std::optional<int> volume;
        bool playing = false;
    };

    struct GatewayInfo {
        std::string model;
        std::string token;
        std::string local_ip;
    };

    GatewayAuxRpc(std::string ip, std::shared_ptr<IMiioClient> client);

    // Throws RpcError.
    nlohmann::json Call(const std::string& method, const nlohmann::json& params = nlohmann::json::array());

    // False when the hub answered without acknowledging.
    bool SetRadioVolume(int volume);
    bool SetRadioPower(bool on);
    RadioState GetRadioState();
    GatewayInfo GetInfo();

    const std::string& GetIp() const { return m_ip; }

    // "ok" as a string, inside a list, or as an object key.
    static bool IsAcknowledged(const nlohmann::json& result);

private:
    std::string m_ip;
    std::shared_ptr<IMiioClient> m_client;
};
