// HubProtocol.h
#pragma once

#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// --- Gateway LAN Protocol (JSON over UDP) ---
namespace HubProtocol {

constexpr const char* kMulticastAddress = "224.0.0.50";
constexpr uint16_t kDiscoveryPort = 4321;     // whois -> iam
constexpr uint16_t kMulticastPort = 9898;     // report / heartbeat push
constexpr uint16_t kDefaultGatewayPort = 9898; // unicast commands
constexpr size_t kSocketBufferSize = 1024;

// Models accepted in an "iam" answer.
extern const std::vector<std::string> kGatewayModels;

bool IsGatewayModel(const std::string& model);

// "2.x" firmware uses "params" lists and *_rsp commands, everything else is 1.x.
bool IsProtoV2(const std::string& proto_version);

// Strips ':' separators and lower-cases ("34:CE:00" -> "34ce00").
std::string NormalizeSid(const std::string& sid);
bool IsValidSid(const std::string& sid);

struct DeviceListEntry {
    std::string sid;
    std::string model; // empty when the hub only lists ids (1.x)
};

// --- Frame Builders ---
nlohmann::json BuildWhois();
nlohmann::json BuildDeviceListRequest(bool proto_v2);
nlohmann::json BuildRead(bool proto_v2, const std::string& sid);
nlohmann::json BuildWrite(bool proto_v2, const std::string& sid, const std::string& model,
    const std::string& short_id, const nlohmann::json& fields, const std::string& key_hex);

// --- Expected Response Commands ---
std::string DeviceListAck(bool proto_v2);
std::string ReadAck(bool proto_v2);
std::string WriteAck(bool proto_v2);

// --- Frame Decoders ---
// Flattens "data" (1.x JSON string or object) or "params" (2.x list of
// objects) into one attribute object. nullopt when neither is usable.
std::optional<nlohmann::json> DecodePayload(const nlohmann::json& frame);

// Sub-device ids of a device-list answer. Throws ProtocolError when malformed.
std::vector<DeviceListEntry> DecodeDeviceList(const nlohmann::json& ack);

// short_id arrives as a number on some firmware and as a string on others.
std::string ShortIdToString(const nlohmann::json& frame);

// Value of a string field, empty when it is missing or of another type.
std::string StringField(const nlohmann::json& frame, const char* name);

} // namespace HubProtocol
