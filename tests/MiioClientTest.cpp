#include <gtest/gtest.h>

#include "FakeUdpPeer.h"
#include "GatewayAuxRpc.h"
#include "HubErrors.h"
#include "MiioClient.h"

using nlohmann::json;
using namespace std::chrono_literals;

namespace {

const std::string kTokenHex = "00112233445566778899aabbccddeeff";
constexpr uint32_t kDeviceId = 0x0102abcd;
constexpr uint32_t kStamp = 1000;

HubCrypto::Block Token() {
    std::vector<uint8_t> bytes;
    HubCrypto::HexToBytes(kTokenHex, bytes);
    HubCrypto::Block token{};
    std::copy(bytes.begin(), bytes.end(), token.begin());
    return token;
}

std::string ToString(const std::vector<uint8_t>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

std::string HelloReply() {
    std::vector<uint8_t> hello(Miio::kHeaderSize, 0x00);
    hello[0] = 0x21; hello[1] = 0x31;
    hello[2] = 0x00; hello[3] = 0x20;
    hello[8] = 0x01; hello[9] = 0x02; hello[10] = 0xab; hello[11] = 0xcd;
    hello[12] = 0x00; hello[13] = 0x00; hello[14] = 0x03; hello[15] = 0xe8;
    return ToString(hello);
}

// Answers the hello and decrypts requests; the reply body comes from respond(request).
FakeUdpPeer::Handler FakeDevice(std::function<json(const json&)> respond) {
    return [respond](const std::string& datagram) -> std::vector<std::string> {
        if (datagram.size() == Miio::kHeaderSize) return { HelloReply() };
        auto packet = Miio::DecodePacket(Token(), reinterpret_cast<const uint8_t*>(datagram.data()), datagram.size());
        json request = json::parse(packet.payload);
        json reply = respond(request);
        reply["id"] = request["id"];
        return { ToString(Miio::EncodePacket(Token(), kDeviceId, kStamp + 1, reply.dump())) };
    };
}

const uint8_t* Bytes(const std::string& s) {
    return reinterpret_cast<const uint8_t*>(s.data());
}

} // namespace

TEST(MiioPacketTest, HelloLayout) {
    auto hello = Miio::BuildHello();
    ASSERT_EQ(hello.size(), 32u);
    EXPECT_EQ(hello[0], 0x21);
    EXPECT_EQ(hello[1], 0x31);
    EXPECT_EQ(hello[2], 0x00);
    EXPECT_EQ(hello[3], 0x20);
    EXPECT_EQ(hello[4], 0xFF);
    EXPECT_EQ(hello[31], 0xFF);
}

TEST(MiioPacketTest, HeaderFieldsAndChecksum) {
    auto packet = Miio::EncodePacket(Token(), kDeviceId, kStamp, "{\"id\":1,\"method\":\"miIO.info\",\"params\":[]}");
    ASSERT_GT(packet.size(), 32u);
    EXPECT_EQ((packet.size() - 32) % 16, 0u);
    EXPECT_EQ(packet[2] * 256 + packet[3], static_cast<int>(packet.size()));

    auto decoded = Miio::DecodePacket(Token(), packet.data(), packet.size());
    EXPECT_EQ(decoded.device_id, kDeviceId);
    EXPECT_EQ(decoded.stamp, kStamp);
    EXPECT_EQ(json::parse(decoded.payload)["method"], "miIO.info");

    auto tampered = packet;
    tampered[20] ^= 0x01;
    EXPECT_THROW(Miio::DecodePacket(Token(), tampered.data(), tampered.size()), ProtocolError);

    auto bad_magic = packet;
    bad_magic[0] = 0x00;
    EXPECT_THROW(Miio::DecodePacket(Token(), bad_magic.data(), bad_magic.size()), ProtocolError);
    EXPECT_THROW(Miio::DecodePacket(Token(), packet.data(), 10), ProtocolError);
}

TEST(MiioClientTest, TokenMustBeHex) {
    EXPECT_THROW(MiioClient("127.0.0.1", "not-a-token"), InvalidKeyError);
    EXPECT_THROW(MiioClient("127.0.0.1", "zz112233445566778899aabbccddeeff"), InvalidKeyError);
}

TEST(MiioClientTest, HandshakeThenCommand) {
    FakeUdpPeer device(FakeDevice([](const json& request) {
        return json{ {"result", { {"method_seen", request["method"]}, {"params_seen", request["params"]} }} };
        }));
    MiioClient client("127.0.0.1", kTokenHex, 500ms, device.Port());

    json result = client.Command("get_prop_fm", json::array());
    EXPECT_EQ(result["method_seen"], "get_prop_fm");
    EXPECT_EQ(client.Command("volume_ctrl_fm", json::array({ "40" }))["params_seen"][0], "40");

    // One hello, then two requests on the learned session
    auto received = device.Received();
    ASSERT_EQ(received.size(), 3u);
    EXPECT_EQ(received[0].size(), 32u);
    auto request = Miio::DecodePacket(Token(), Bytes(received[1]), received[1].size());
    EXPECT_EQ(request.device_id, kDeviceId);
    EXPECT_GT(request.stamp, kStamp);
}

TEST(MiioClientTest, ErrorReplyIsRpcError) {
    FakeUdpPeer device(FakeDevice([](const json&) {
        return json{ {"error", { {"code", -5001}, {"message", "unknown method"} }} };
        }));
    MiioClient client("127.0.0.1", kTokenHex, 500ms, device.Port());
    EXPECT_THROW(client.Command("bogus", json::array()), RpcError);
}

TEST(MiioClientTest, SilentDeviceIsRpcErrorAfterRetry) {
    FakeUdpPeer device([](const std::string&) { return std::vector<std::string>{}; });
    MiioClient client("127.0.0.1", kTokenHex, 100ms, device.Port());
    EXPECT_THROW(client.Command("miIO.info", json::array()), RpcError);
    EXPECT_TRUE(device.WaitForCount(2));
    EXPECT_EQ(device.ReceivedCount(), 2u);
}

TEST(GatewayAuxRpcTest, RadioAndInfoOverMiio) {
    FakeUdpPeer device(FakeDevice([](const json& request) {
        const std::string method = request["method"].get<std::string>();
        if (method == "get_prop_fm") return json{ {"result", { {"current_volume", 30}, {"current_status", "run"} }} };
        if (method == "miIO.info") {
            return json{ {"result", { {"model", "lumi.gateway.v3"}, {"token", kTokenHex}, {"netif", { {"localIp", "127.0.0.1"} }} }} };
        }
        return json{ {"result", json::array({ "ok" })} };
        }));
    GatewayAuxRpc aux("127.0.0.1", std::make_shared<MiioClient>("127.0.0.1", kTokenHex, 500ms, device.Port()));

    auto radio = aux.GetRadioState();
    ASSERT_TRUE(radio.volume.has_value());
    EXPECT_EQ(*radio.volume, 30);
    EXPECT_TRUE(radio.playing);

    EXPECT_TRUE(aux.SetRadioVolume(40));
    EXPECT_TRUE(aux.SetRadioPower(false));

    auto info = aux.GetInfo();
    EXPECT_EQ(info.model, "lumi.gateway.v3");
    EXPECT_EQ(info.local_ip, "127.0.0.1");
}

TEST(GatewayAuxRpcTest, Acknowledgement) {
    EXPECT_TRUE(GatewayAuxRpc::IsAcknowledged("ok"));
    EXPECT_TRUE(GatewayAuxRpc::IsAcknowledged(json::array({ "ok" })));
    EXPECT_TRUE(GatewayAuxRpc::IsAcknowledged(json{ {"ok", 0} }));
    EXPECT_FALSE(GatewayAuxRpc::IsAcknowledged(json::array({ "error" })));
    EXPECT_FALSE(GatewayAuxRpc::IsAcknowledged(json(0)));
}

TEST(GatewayAuxRpcTest, MissingClientIsRpcError) {
    GatewayAuxRpc aux("127.0.0.1", nullptr);
    EXPECT_THROW(aux.Call("miIO.info"), RpcError);
}
