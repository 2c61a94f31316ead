#include "MiioClient.h"
#include "HubErrors.h"
#include "HubProtocol.h"
#include "Logging.h"

#include <array>
#include <cstring>
#include <optional>

#include <boost/asio.hpp>

using boost::asio::ip::udp;

namespace {

void PutBe16(uint8_t* p, uint16_t v) {
    p[0] = static_cast<uint8_t>(v >> 8);
    p[1] = static_cast<uint8_t>(v);
}

void PutBe32(uint8_t* p, uint32_t v) {
    p[0] = static_cast<uint8_t>(v >> 24);
    p[1] = static_cast<uint8_t>(v >> 16);
    p[2] = static_cast<uint8_t>(v >> 8);
    p[3] = static_cast<uint8_t>(v);
}

uint16_t GetBe16(const uint8_t* p) {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

uint32_t GetBe32(const uint8_t* p) {
    return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) | uint32_t(p[3]);
}

// MD5(header[0..16] || token || payload)
HubCrypto::Block Checksum(const uint8_t* header, const HubCrypto::Block& token, const uint8_t* payload, size_t payload_len) {
    std::vector<uint8_t> tmp;
    tmp.reserve(32 + payload_len);
    tmp.insert(tmp.end(), header, header + 16);
    tmp.insert(tmp.end(), token.begin(), token.end());
    tmp.insert(tmp.end(), payload, payload + payload_len);
    return HubCrypto::Md5Digest(tmp);
}

// Waits for one datagram until the deadline. nullopt on timeout.
std::optional<size_t> ReceiveUntil(boost::asio::io_context& io, udp::socket& socket,
    std::array<uint8_t, 4096>& buf, std::chrono::steady_clock::time_point deadline)
{
    auto remaining = deadline - std::chrono::steady_clock::now();
    if (remaining <= std::chrono::steady_clock::duration::zero()) return std::nullopt;

    boost::system::error_code rx_ec = boost::asio::error::would_block;
    size_t rx_len = 0;
    udp::endpoint sender;
    socket.async_receive_from(boost::asio::buffer(buf), sender,
        [&](const boost::system::error_code& e, size_t n) {
            rx_ec = e;
            rx_len = n;
        });
    io.restart();
    io.run_for(std::chrono::duration_cast<std::chrono::milliseconds>(remaining));
    if (!io.stopped()) {
        socket.cancel();
        io.run();
    }
    if (rx_ec == boost::asio::error::operation_aborted || rx_ec == boost::asio::error::would_block) return std::nullopt;
    if (rx_ec) throw RpcError("miIO receive failed: " + rx_ec.message());
    return rx_len;
}

} // namespace

// --- Packet Codec ---
namespace Miio {

std::vector<uint8_t> BuildHello() {
    std::vector<uint8_t> hello(kHeaderSize, 0xFF);
    PutBe16(hello.data(), kMagic);
    PutBe16(hello.data() + 2, static_cast<uint16_t>(kHeaderSize));
    return hello;
}

std::vector<uint8_t> EncodePacket(const HubCrypto::Block& token, uint32_t device_id, uint32_t stamp, const std::string& payload) {
    HubCrypto::Block key{}, iv{};
    HubCrypto::DeriveMiioKeyIv(token, key, iv);

    std::vector<uint8_t> plain(payload.begin(), payload.end());
    plain.push_back(0x00);
    std::vector<uint8_t> cipher = HubCrypto::Aes128CbcEncrypt(key, iv, plain);

    std::vector<uint8_t> packet(kHeaderSize + cipher.size(), 0x00);
    PutBe16(packet.data(), kMagic);
    PutBe16(packet.data() + 2, static_cast<uint16_t>(packet.size()));
    PutBe32(packet.data() + 8, device_id);
    PutBe32(packet.data() + 12, stamp);
    std::memcpy(packet.data() + kHeaderSize, cipher.data(), cipher.size());

    HubCrypto::Block checksum = Checksum(packet.data(), token, cipher.data(), cipher.size());
    std::memcpy(packet.data() + 16, checksum.data(), checksum.size());
    return packet;
}

Packet DecodePacket(const HubCrypto::Block& token, const uint8_t* data, size_t len) {
    if (len < kHeaderSize) throw ProtocolError("miIO packet shorter than its header");
    if (GetBe16(data) != kMagic) throw ProtocolError("miIO packet with bad magic");
    if (GetBe16(data + 2) != len) throw ProtocolError("miIO packet length mismatch");

    Packet packet;
    packet.device_id = GetBe32(data + 8);
    packet.stamp = GetBe32(data + 12);
    if (len == kHeaderSize) return packet; // hello reply

    const uint8_t* body = data + kHeaderSize;
    const size_t body_len = len - kHeaderSize;
    HubCrypto::Block checksum = Checksum(data, token, body, body_len);
    if (std::memcmp(checksum.data(), data + 16, checksum.size()) != 0) {
        throw ProtocolError("miIO packet checksum mismatch");
    }

    HubCrypto::Block key{}, iv{};
    HubCrypto::DeriveMiioKeyIv(token, key, iv);
    std::vector<uint8_t> plain = HubCrypto::Aes128CbcDecrypt(key, iv, std::vector<uint8_t>(body, body + body_len));
    while (!plain.empty() && plain.back() == 0x00) plain.pop_back();
    packet.payload.assign(plain.begin(), plain.end());
    return packet;
}

} // namespace Miio

// --- MiioClient ---

MiioClient::MiioClient(std::string ip, const std::string& token_hex, std::chrono::milliseconds timeout, uint16_t port)
    : m_ip(std::move(ip)),
    m_port(port),
    m_token{},
    m_timeout(timeout)
{
    std::vector<uint8_t> bytes;
    if (token_hex.size() != 32 || !HubCrypto::HexToBytes(token_hex, bytes) || bytes.size() != HubCrypto::kBlockSize) {
        throw InvalidKeyError("miIO token must be 32 hex characters");
    }
    std::copy(bytes.begin(), bytes.end(), m_token.begin());
}

nlohmann::json MiioClient::Command(const std::string& method, const nlohmann::json& params) {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (int attempt = 0; attempt < 2; ++attempt) {
        try {
            return CommandOnce(method, params);
        }
        catch (const CommandTimeoutError& e) {
            AddLog("miIO (" + m_ip + ") " + method + ": " + e.what() + (attempt == 0 ? ", retrying" : ""));
            m_handshaken = false;
        }
        catch (const ProtocolError& e) {
            m_handshaken = false;
            throw RpcError("miIO (" + m_ip + ") " + method + ": " + e.what());
        }
        catch (const boost::system::system_error& e) {
            throw RpcError("miIO (" + m_ip + ") " + method + ": " + e.what());
        }
    }
    throw RpcError("miIO (" + m_ip + ") " + method + ": no response");
}

nlohmann::json MiioClient::CommandOnce(const std::string& method, const nlohmann::json& params) {
    boost::system::error_code ec;
    auto address = boost::asio::ip::make_address(m_ip, ec);
    if (ec) throw RpcError("miIO: invalid address " + m_ip);
    udp::endpoint device(address, m_port);

    boost::asio::io_context io;
    udp::socket socket(io);
    socket.open(udp::v4());
    std::array<uint8_t, 4096> buf;

    if (!m_handshaken) {
        auto hello = Miio::BuildHello();
        socket.send_to(boost::asio::buffer(hello), device);
        auto deadline = std::chrono::steady_clock::now() + m_timeout;
        while (true) {
            auto len = ReceiveUntil(io, socket, buf, deadline);
            if (!len) throw CommandTimeoutError("handshake timed out");
            if (*len != Miio::kHeaderSize) continue;
            Miio::Packet reply = Miio::DecodePacket(m_token, buf.data(), *len);
            m_device_id = reply.device_id;
            m_stamp = reply.stamp;
            m_stamp_at = std::chrono::steady_clock::now();
            m_handshaken = true;
            break;
        }
    }

    const uint32_t id = m_next_id++;
    nlohmann::json request = { {"id", id}, {"method", method}, {"params", params.is_null() ? nlohmann::json::array() : params} };
    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - m_stamp_at).count();
    uint32_t stamp = m_stamp + static_cast<uint32_t>(elapsed) + 1;

    auto packet = Miio::EncodePacket(m_token, m_device_id, stamp, request.dump());
    if (g_log_show_egress) AddLog("miIO (" + m_ip + ") >> " + request.dump(), LogType::EGRESS);
    socket.send_to(boost::asio::buffer(packet), device);

    auto deadline = std::chrono::steady_clock::now() + m_timeout;
    while (true) {
        auto len = ReceiveUntil(io, socket, buf, deadline);
        if (!len) throw CommandTimeoutError("request " + std::to_string(id) + " timed out");
        if (*len <= Miio::kHeaderSize) continue;

        Miio::Packet reply = Miio::DecodePacket(m_token, buf.data(), *len);
        nlohmann::json response = nlohmann::json::parse(reply.payload, nullptr, false);
        if (response.is_discarded() || !response.is_object()) throw ProtocolError("malformed JSON reply");
        if (g_log_show_ingress) AddLog("miIO (" + m_ip + ") << " + reply.payload, LogType::INGRESS);

        auto id_it = response.find("id");
        if (id_it == response.end() || !id_it->is_number_integer() || id_it->get<int64_t>() != id) continue;
        auto error_it = response.find("error");
        if (error_it != response.end()) {
            std::string message = HubProtocol::StringField(*error_it, "message");
            if (message.empty()) message = error_it->dump();
            throw RpcError("miIO (" + m_ip + ") " + method + " failed: " + message);
        }
        auto result_it = response.find("result");
        return (result_it != response.end()) ? *result_it : response;
    }
}
