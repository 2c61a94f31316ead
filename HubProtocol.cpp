#include "HubProtocol.h"
#include "HubErrors.h"

#include <algorithm>
#include <cctype>

namespace HubProtocol {

const std::vector<std::string> kGatewayModels = { "gateway", "gateway.v3", "acpartner.v3" };

bool IsGatewayModel(const std::string& model) {
    return std::find(kGatewayModels.begin(), kGatewayModels.end(), model) != kGatewayModels.end();
}

bool IsProtoV2(const std::string& proto_version) {
    return !proto_version.empty() && proto_version[0] == '2';
}

std::string NormalizeSid(const std::string& sid) {
    std::string out;
    out.reserve(sid.size());
    for (char c : sid) {
        if (c == ':') continue;
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

bool IsValidSid(const std::string& sid) {
    if (sid.size() != 12 && sid.size() != 14) return false;
    return std::all_of(sid.begin(), sid.end(), [](char c) {
        return std::isxdigit(static_cast<unsigned char>(c)) != 0;
    });
}

nlohmann::json BuildWhois() {
    return nlohmann::json{ {"cmd", "whois"} };
}

nlohmann::json BuildDeviceListRequest(bool proto_v2) {
    return nlohmann::json{ {"cmd", proto_v2 ? "discovery" : "get_id_list"} };
}

nlohmann::json BuildRead(bool /*proto_v2*/, const std::string& sid) {
    return nlohmann::json{ {"cmd", "read"}, {"sid", sid} };
}

nlohmann::json BuildWrite(bool proto_v2, const std::string& sid, const std::string& model,
    const std::string& short_id, const nlohmann::json& fields, const std::string& key_hex) {
    nlohmann::json cmd = { {"cmd", "write"} };
    if (!model.empty()) cmd["model"] = model;
    cmd["sid"] = sid;
    if (!short_id.empty()) {
        // Hubs echo short_id as an integer
        try { cmd["short_id"] = std::stoll(short_id); }
        catch (const std::exception&) { cmd["short_id"] = short_id; }
    }

    if (proto_v2) {
        cmd["key"] = key_hex;
        nlohmann::json params = nlohmann::json::array();
        for (auto it = fields.begin(); it != fields.end(); ++it) {
            params.push_back(nlohmann::json{ {it.key(), it.value()} });
        }
        cmd["params"] = params;
    }
    else {
        nlohmann::json data = fields;
        data["key"] = key_hex;
        cmd["data"] = data;
    }
    return cmd;
}

std::string DeviceListAck(bool proto_v2) { return proto_v2 ? "discovery_rsp" : "get_id_list_ack"; }
std::string ReadAck(bool proto_v2) { return proto_v2 ? "read_rsp" : "read_ack"; }
std::string WriteAck(bool proto_v2) { return proto_v2 ? "write_rsp" : "write_ack"; }

std::optional<nlohmann::json> DecodePayload(const nlohmann::json& frame) {
    if (!frame.is_object()) return std::nullopt;

    auto data_it = frame.find("data");
    if (data_it != frame.end()) {
        if (data_it->is_object()) return *data_it;
        if (data_it->is_string()) {
            nlohmann::json parsed = nlohmann::json::parse(data_it->get<std::string>(), nullptr, false);
            if (parsed.is_discarded() || !parsed.is_object()) return std::nullopt;
            return parsed;
        }
        return std::nullopt;
    }

    auto params_it = frame.find("params");
    if (params_it != frame.end() && params_it->is_array()) {
        nlohmann::json merged = nlohmann::json::object();
        for (const auto& entry : *params_it) {
            if (!entry.is_object()) continue;
            for (auto it = entry.begin(); it != entry.end(); ++it) {
                merged[it.key()] = it.value();
            }
        }
        return merged;
    }
    return std::nullopt;
}

std::vector<DeviceListEntry> DecodeDeviceList(const nlohmann::json& ack) {
    std::vector<DeviceListEntry> devices;

    auto list_it = ack.find("dev_list");
    if (list_it != ack.end()) {
        if (!list_it->is_array()) throw ProtocolError("dev_list is not an array");
        for (const auto& entry : *list_it) {
            if (!entry.is_object() || !entry.contains("sid") || !entry["sid"].is_string()) {
                throw ProtocolError("dev_list entry without sid");
            }
            DeviceListEntry dev;
            dev.sid = entry["sid"].get<std::string>();
            if (entry.contains("model") && entry["model"].is_string()) {
                dev.model = entry["model"].get<std::string>();
            }
            devices.push_back(dev);
        }
        return devices;
    }

    auto data_it = ack.find("data");
    if (data_it == ack.end()) throw ProtocolError("Device list answer has neither data nor dev_list");

    nlohmann::json ids = *data_it;
    if (ids.is_string()) {
        ids = nlohmann::json::parse(data_it->get<std::string>(), nullptr, false);
    }
    if (!ids.is_array()) throw ProtocolError("Device list data is not a JSON array");
    for (const auto& id : ids) {
        if (!id.is_string()) throw ProtocolError("Device list contains a non-string id");
        devices.push_back(DeviceListEntry{ id.get<std::string>(), "" });
    }
    return devices;
}

std::string ShortIdToString(const nlohmann::json& frame) {
    auto it = frame.find("short_id");
    if (it == frame.end()) return "";
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number_integer()) return std::to_string(it->get<long long>());
    return "";
}

std::string StringField(const nlohmann::json& frame, const char* name) {
    if (!frame.is_object()) return std::string();
    auto it = frame.find(name);
    return (it != frame.end() && it->is_string()) ? it->get<std::string>() : std::string();
}

} // namespace HubProtocol
