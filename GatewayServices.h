// GatewayServices.h
#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "GatewayAuxRpc.h"
#include "GatewaySession.h"

// --- GatewayServices ---
// Hub-level actions addressed by gateway sid. Invalid arguments throw
// std::invalid_argument before anything is sent; hub errors propagate.
class GatewayServices {
public:
    using GatewayList = std::function<std::vector<std::shared_ptr<GatewaySession>>()>;
    using AuxLookup = std::function<std::shared_ptr<GatewayAuxRpc>(const std::string& gw_sid)>;

    GatewayServices(GatewayList gateways, AuxLookup aux);

    // Empty sid selects the only gateway when exactly one is known.
    std::shared_ptr<GatewaySession> ResolveGateway(const std::string& gw_sid) const;

    bool PlayRingtone(const std::string& gw_sid, int ringtone_id, std::optional<int> volume = std::nullopt);
    bool StopRingtone(const std::string& gw_sid);
    bool AddDevice(const std::string& gw_sid);
    bool RemoveDevice(const std::string& gw_sid, const std::string& device_id);
    bool RadioVolume(const std::string& gw_sid, int volume);
    bool RadioPower(const std::string& gw_sid, bool on);
    GatewayAuxRpc::RadioState RadioState(const std::string& gw_sid);
    GatewayAuxRpc::GatewayInfo GatewayInfo(const std::string& gw_sid);

    static bool IsReservedRingtone(int ringtone_id);

private:
    std::shared_ptr<GatewayAuxRpc> RequireAux(const std::shared_ptr<GatewaySession>& gateway) const;

    GatewayList m_gateways;
    AuxLookup m_aux;
};
