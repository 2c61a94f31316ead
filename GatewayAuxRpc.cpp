#include "GatewayAuxRpc.h"
#include "HubErrors.h"
#include "HubProtocol.h"
#include "Logging.h"

GatewayAuxRpc::GatewayAuxRpc(std::string ip, std::shared_ptr<IMiioClient> client)
    : m_ip(std::move(ip)),
    m_client(std::move(client))
{
}

bool GatewayAuxRpc::IsAcknowledged(const nlohmann::json& result) {
    if (result.is_string()) return result.get<std::string>() == "ok";
    if (result.is_array()) {
        for (const auto& item : result) {
            if (item.is_string() && item.get<std::string>() == "ok") return true;
        }
        return false;
    }
    if (result.is_object()) return result.contains("ok");
    return false;
}

nlohmann::json GatewayAuxRpc::Call(const std::string& method, const nlohmann::json& params) {
    if (!m_client) throw RpcError("Gateway " + m_ip + " has no auxiliary channel");
    return m_client->Command(method, params);
}

bool GatewayAuxRpc::SetRadioVolume(int volume) {
    auto result = Call("volume_ctrl_fm", nlohmann::json::array({ std::to_string(volume) }));
    bool ok = IsAcknowledged(result);
    AddLog("Aux RPC (" + m_ip + "): radio volume " + std::to_string(volume) + (ok ? " set" : " not acknowledged: " + result.dump()));
    return ok;
}

bool GatewayAuxRpc::SetRadioPower(bool on) {
    auto result = Call("play_fm", nlohmann::json::array({ on ? "on" : "off" }));
    bool ok = IsAcknowledged(result);
    if (!ok) AddLog("Aux RPC (" + m_ip + "): play_fm " + std::string(on ? "on" : "off") + " not acknowledged: " + result.dump());
    return ok;
}

GatewayAuxRpc::RadioState GatewayAuxRpc::GetRadioState() {
    auto result = Call("get_prop_fm");
    RadioState state;
    if (!result.is_object()) return state;

    auto volume_it = result.find("current_volume");
    if (volume_it != result.end() && volume_it->is_number()) state.volume = volume_it->get<int>();
    state.playing = HubProtocol::StringField(result, "current_status") == "run";
    return state;
}

GatewayAuxRpc::GatewayInfo GatewayAuxRpc::GetInfo() {
    auto result = Call("miIO.info");
    GatewayInfo info;
    if (!result.is_object()) throw RpcError("miIO.info returned " + result.dump());

    info.model = HubProtocol::StringField(result, "model");
    info.token = HubProtocol::StringField(result, "token");
    auto netif = result.find("netif");
    if (netif != result.end()) info.local_ip = HubProtocol::StringField(*netif, "localIp");
    return info;
}
