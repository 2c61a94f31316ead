#include "GatewayServices.h"
#include "HubProtocol.h"
#include "Logging.h"

#include <algorithm>
#include <stdexcept>

namespace {
constexpr int kStopRingtoneId = 10000;
}

GatewayServices::GatewayServices(GatewayList gateways, AuxLookup aux)
    : m_gateways(std::move(gateways)),
    m_aux(std::move(aux))
{
}

bool GatewayServices::IsReservedRingtone(int ringtone_id) {
    return ringtone_id == 9 || (ringtone_id >= 14 && ringtone_id <= 19);
}

std::shared_ptr<GatewaySession> GatewayServices::ResolveGateway(const std::string& gw_sid) const {
    auto gateways = m_gateways ? m_gateways() : std::vector<std::shared_ptr<GatewaySession>>();
    if (gw_sid.empty()) {
        if (gateways.size() == 1) return gateways.front();
        throw std::invalid_argument("Gateway sid required when " + std::to_string(gateways.size()) + " gateways are known");
    }

    const std::string sid = HubProtocol::NormalizeSid(gw_sid);
    for (const auto& gateway : gateways) {
        if (gateway->GetSid() == sid) return gateway;
    }
    throw std::invalid_argument("Unknown gateway " + sid);
}

bool GatewayServices::PlayRingtone(const std::string& gw_sid, int ringtone_id, std::optional<int> volume) {
    if (IsReservedRingtone(ringtone_id)) {
        throw std::invalid_argument("Ringtone id " + std::to_string(ringtone_id) + " is not playable");
    }
    auto gateway = ResolveGateway(gw_sid);

    nlohmann::json fields = { {"mid", ringtone_id} };
    if (volume) fields["vol"] = std::clamp(*volume, 0, 100);
    return gateway->WriteToHub(fields);
}

bool GatewayServices::StopRingtone(const std::string& gw_sid) {
    return ResolveGateway(gw_sid)->WriteToHub({ {"mid", kStopRingtoneId} });
}

bool GatewayServices::AddDevice(const std::string& gw_sid) {
    auto gateway = ResolveGateway(gw_sid);
    bool ok = gateway->WriteToHub({ {"join_permission", "yes"} });
    if (ok) {
        PushNotification("Join permission enabled for 30 seconds! Please press the pairing button of the new device once.", true);
    }
    return ok;
}

bool GatewayServices::RemoveDevice(const std::string& gw_sid, const std::string& device_id) {
    if (device_id.size() != 14) {
        throw std::invalid_argument("Device id must be 14 characters, got '" + device_id + "'");
    }
    auto gateway = ResolveGateway(gw_sid);
    bool ok = gateway->WriteToHub({ {"remove_device", device_id} });
    AddLog("Gateway " + gateway->GetSid() + ": remove_device " + device_id + (ok ? " accepted" : " rejected"));
    return ok;
}

bool GatewayServices::RadioVolume(const std::string& gw_sid, int volume) {
    if (volume < 0 || volume > 100) {
        throw std::invalid_argument("Radio volume must be within 0..100");
    }
    return RequireAux(ResolveGateway(gw_sid))->SetRadioVolume(volume);
}

bool GatewayServices::RadioPower(const std::string& gw_sid, bool on) {
    auto gateway = ResolveGateway(gw_sid);
    bool ok = RequireAux(gateway)->SetRadioPower(on);
    AddLog("Gateway " + gateway->GetSid() + ": radio " + (on ? "on" : "off") + (ok ? "" : " not acknowledged"));
    return ok;
}

GatewayAuxRpc::RadioState GatewayServices::RadioState(const std::string& gw_sid) {
    return RequireAux(ResolveGateway(gw_sid))->GetRadioState();
}

GatewayAuxRpc::GatewayInfo GatewayServices::GatewayInfo(const std::string& gw_sid) {
    return RequireAux(ResolveGateway(gw_sid))->GetInfo();
}

std::shared_ptr<GatewayAuxRpc> GatewayServices::RequireAux(const std::shared_ptr<GatewaySession>& gateway) const {
    auto aux = m_aux ? m_aux(gateway->GetSid()) : nullptr;
    if (!aux) {
        throw std::invalid_argument("Gateway " + gateway->GetSid() + " has no miio_token configured");
    }
    return aux;
}
