// MiioClient.h
#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "HubCrypto.h"

// --- Auxiliary Transport ---
// Opaque command channel: method name plus arguments in, result out.
class IMiioClient {
public:
    virtual ~IMiioClient() = default;

    // Throws RpcError on transport failure or an error reply.
    virtual nlohmann::json Command(const std::string& method, const nlohmann::json& params) = 0;
};

// --- miIO Packet Codec ---
namespace Miio {

constexpr uint16_t kPort = 54321;
constexpr uint16_t kMagic = 0x2131;
constexpr size_t kHeaderSize = 32;

struct Packet {
    uint32_t device_id = 0;
    uint32_t stamp = 0;
    std::string payload; // Decrypted JSON, empty for a hello
};

std::vector<uint8_t> BuildHello();

// Header (magic, length, device id, stamp, MD5 checksum) + AES payload.
std::vector<uint8_t> EncodePacket(const HubCrypto::Block& token, uint32_t device_id, uint32_t stamp, const std::string& payload);

// Throws ProtocolError on bad magic, length or checksum.
Packet DecodePacket(const HubCrypto::Block& token, const uint8_t* data, size_t len);

} // namespace Miio

// --- MiioClient ---
// UDP miIO client. Learns device id and stamp with a hello, then sends
// encrypted {"id","method","params"} requests. One request at a time.
class MiioClient : public IMiioClient {
public:
    // Throws InvalidKeyError when the token is not 32 hex chars.
    MiioClient(std::string ip, const std::string& token_hex,
        std::chrono::milliseconds timeout = std::chrono::milliseconds(5000), uint16_t port = Miio::kPort);

    nlohmann::json Command(const std::string& method, const nlohmann::json& params) override;

    const std::string& GetIp() const { return m_ip; }

private:
    nlohmann::json CommandOnce(const std::string& method, const nlohmann::json& params);

    std::string m_ip;
    uint16_t m_port;
    HubCrypto::Block m_token;
    std::chrono::milliseconds m_timeout;

    std::mutex m_mutex;
    uint32_t m_next_id = 1;
    bool m_handshaken = false;
    uint32_t m_device_id = 0;
    uint32_t m_stamp = 0;
    std::chrono::steady_clock::time_point m_stamp_at;
};
