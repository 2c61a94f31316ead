#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <thread>

#include "FakeUdpPeer.h"
#include "GatewaySession.h"
#include "HubCrypto.h"
#include "HubErrors.h"

using nlohmann::json;
using namespace std::chrono_literals;

namespace {

const std::string kHubSid = "34ce00aabbcc";
const std::string kKey = "0987654321qwerty";
const std::string kPlug = "158d0001234567";

GatewaySessionOptions FastOptions() {
    GatewaySessionOptions options;
    options.command_timeout = 200ms;
    options.device_discovery_retries = 1;
    return options;
}

std::unique_ptr<GatewaySession> MakeSession(uint16_t port, const std::string& key = kKey, const std::string& proto = "1.1.2") {
    return std::make_unique<GatewaySession>("127.0.0.1", port, kHubSid, key, proto, "any", "", FastOptions());
}

json Parse(const std::string& datagram) {
    return json::parse(datagram, nullptr, false);
}

std::vector<std::string> Reply(const json& frame) {
    return { frame.dump() };
}

} // namespace

TEST(GatewaySessionTest, WriteWithoutKeySendsNothing) {
    FakeUdpPeer hub([](const std::string&) { return std::vector<std::string>{}; });
    auto session = MakeSession(hub.Port(), "");
    EXPECT_FALSE(session->HasKey());
    EXPECT_THROW(session->Write(kPlug, { {"channel_0", "on"} }), NoKeyError);
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(hub.ReceivedCount(), 0u);
}

TEST(GatewaySessionTest, WriteHandshakesAndUsesCurrentToken) {
    FakeUdpPeer hub([](const std::string& datagram) {
        json req = Parse(datagram);
        if (req["cmd"] == "get_id_list") {
            return Reply({ {"cmd", "get_id_list_ack"}, {"sid", kHubSid}, {"token", "1234567890abcdef"}, {"data", "[]"} });
        }
        if (req["cmd"] == "write") {
            return Reply({ {"cmd", "write_ack"}, {"sid", req["sid"]}, {"data", "{\"channel_0\":\"on\"}"} });
        }
        return std::vector<std::string>{};
        });
    auto session = MakeSession(hub.Port());

    EXPECT_TRUE(session->Write(kPlug, { {"channel_0", "on"} }));
    EXPECT_EQ(session->GetToken(), "1234567890abcdef");
    EXPECT_EQ(session->GetState(), SessionState::TOKEN_KNOWN);

    auto received = hub.Received();
    ASSERT_EQ(received.size(), 2u);
    EXPECT_EQ(Parse(received[0])["cmd"], "get_id_list");
    json write = Parse(received[1]);
    EXPECT_EQ(write["data"]["channel_0"], "on");
    EXPECT_EQ(write["data"]["key"], HubCrypto::EncryptGatewayTokenHex(kKey, "1234567890abcdef"));

    // A heartbeat token replaces the old one without another handshake
    session->UpdateToken("abcdefabcdefabcd");
    EXPECT_TRUE(session->Write(kPlug, { {"channel_0", "off"} }));
    received = hub.Received();
    ASSERT_EQ(received.size(), 3u);
    EXPECT_EQ(Parse(received[2])["data"]["key"], HubCrypto::EncryptGatewayTokenHex(kKey, "abcdefabcdefabcd"));
}

TEST(GatewaySessionTest, SilentHubIsRetriedOnce) {
    FakeUdpPeer hub([](const std::string&) { return std::vector<std::string>{}; });
    auto session = MakeSession(hub.Port());
    session->UpdateToken("1234567890abcdef");

    EXPECT_FALSE(session->Read(kPlug).has_value());
    EXPECT_TRUE(hub.WaitForCount(2));
    EXPECT_EQ(hub.ReceivedCount(), 2u);

    EXPECT_THROW(session->Write(kPlug, { {"channel_0", "on"} }), CommandTimeoutError);
    EXPECT_TRUE(hub.WaitForCount(4));
    EXPECT_EQ(hub.ReceivedCount(), 4u);
    EXPECT_EQ(session->GetState(), SessionState::TOKEN_KNOWN);
}

TEST(GatewaySessionTest, MalformedReplyIsNotRetried) {
    FakeUdpPeer hub([](const std::string&) { return std::vector<std::string>{ "not json" }; });
    auto session = MakeSession(hub.Port());

    EXPECT_THROW(session->Read(kPlug), ProtocolError);
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(hub.ReceivedCount(), 1u);
}

TEST(GatewaySessionTest, InvalidKeyRefreshesTokenAndRetries) {
    std::atomic<int> writes{ 0 };
    FakeUdpPeer hub([&writes](const std::string& datagram) {
        json req = Parse(datagram);
        if (req["cmd"] == "get_id_list") {
            return Reply({ {"cmd", "get_id_list_ack"}, {"sid", kHubSid}, {"token", "bbbbbbbbbbbbbbbb"}, {"data", "[]"} });
        }
        if (req["cmd"] == "write" && ++writes == 1) {
            return Reply({ {"cmd", "write_ack"}, {"sid", req["sid"]}, {"data", "{\"error\":\"Invalid key\"}"} });
        }
        return Reply({ {"cmd", "write_ack"}, {"sid", req["sid"]}, {"data", "{\"channel_0\":\"on\"}"} });
        });
    auto session = MakeSession(hub.Port());
    session->UpdateToken("aaaaaaaaaaaaaaaa");

    EXPECT_TRUE(session->Write(kPlug, { {"channel_0", "on"} }));

    auto received = hub.Received();
    ASSERT_EQ(received.size(), 3u);
    EXPECT_EQ(Parse(received[0])["cmd"], "write");
    EXPECT_EQ(Parse(received[1])["cmd"], "get_id_list");
    EXPECT_EQ(Parse(received[2])["data"]["key"], HubCrypto::EncryptGatewayTokenHex(kKey, "bbbbbbbbbbbbbbbb"));
}

TEST(GatewaySessionTest, RejectedWriteReturnsFalse) {
    FakeUdpPeer hub([](const std::string& datagram) {
        json req = Parse(datagram);
        return Reply({ {"cmd", "write_ack"}, {"sid", req["sid"]}, {"data", "{\"error\":\"No device\"}"} });
        });
    auto session = MakeSession(hub.Port());
    session->UpdateToken("aaaaaaaaaaaaaaaa");
    EXPECT_FALSE(session->Write(kPlug, { {"channel_0", "on"} }));
    EXPECT_EQ(hub.ReceivedCount(), 1u);
}

TEST(GatewaySessionTest, ProtocolTwoWrite) {
    FakeUdpPeer hub([](const std::string& datagram) {
        json req = Parse(datagram);
        return Reply({ {"cmd", "write_rsp"}, {"sid", req["sid"]}, {"params", json::array({ { {"channel_0", "on"} } })} });
        });
    auto session = MakeSession(hub.Port(), kKey, "2.0.1");
    session->UpdateToken("1234567890abcdef");

    EXPECT_TRUE(session->Write(kPlug, { {"channel_0", "on"} }));
    json write = Parse(hub.Received().at(0));
    EXPECT_EQ(write["key"], HubCrypto::EncryptGatewayTokenHex(kKey, "1234567890abcdef"));
    EXPECT_EQ(write["params"][0]["channel_0"], "on");
}

TEST(GatewaySessionTest, NonMatchingFrameIsSkipped) {
    FakeUdpPeer hub([](const std::string& datagram) {
        json req = Parse(datagram);
        return std::vector<std::string>{
            json{ {"cmd", "heartbeat"}, {"sid", kHubSid}, {"token", "cccccccccccccccc"}, {"data", "{}"} }.dump(),
            json{ {"cmd", "read_ack"}, {"sid", req["sid"]}, {"model", "magnet"}, {"short_id", 4343}, {"data", "{\"status\":\"open\"}"} }.dump()
        };
        });
    auto session = MakeSession(hub.Port());

    auto data = session->Read(kPlug);
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ((*data)["status"], "open");
    EXPECT_EQ(session->GetToken(), "cccccccccccccccc");

    auto devices = session->GetDevices();
    ASSERT_EQ(devices.count(kPlug), 1u);
    EXPECT_EQ(devices[kPlug].model, "magnet");
    EXPECT_EQ(devices[kPlug].short_id, "4343");
    EXPECT_EQ(hub.ReceivedCount(), 1u);
}

TEST(GatewaySessionTest, DiscoverDevicesReadsEveryListedDevice) {
    FakeUdpPeer hub([](const std::string& datagram) {
        json req = Parse(datagram);
        if (req["cmd"] == "get_id_list") {
            return Reply({ {"cmd", "get_id_list_ack"}, {"sid", kHubSid}, {"token", "1234567890abcdef"}, {"data", json::array({ kPlug }).dump()} });
        }
        if (req["sid"] == kPlug) {
            return Reply({ {"cmd", "read_ack"}, {"sid", kPlug}, {"model", "sensor_ht"}, {"data", "{\"temperature\":\"2150\"}"} });
        }
        return Reply({ {"cmd", "read_ack"}, {"sid", kHubSid}, {"model", "gateway"}, {"data", "{\"rgb\":0}"} });
        });
    auto session = MakeSession(hub.Port());

    ASSERT_TRUE(session->DiscoverDevices());
    auto devices = session->GetDevices();
    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(devices[kPlug].model, "sensor_ht");
    EXPECT_EQ(devices[kPlug].data["temperature"], "2150");
    EXPECT_EQ(devices[kHubSid].model, "gateway");
    EXPECT_EQ(session->GetState(), SessionState::TOKEN_KNOWN);
}

TEST(GatewaySessionTest, DiscoverDevicesSkipsBrokenDevice) {
    const std::string broken = "158d0000000001";
    const std::string healthy = "158d0000000002";
    FakeUdpPeer hub([&](const std::string& datagram) {
        json req = Parse(datagram);
        if (req["cmd"] == "get_id_list") {
            return Reply({ {"cmd", "get_id_list_ack"}, {"sid", kHubSid}, {"token", "1234567890abcdef"},
                {"data", json::array({ broken, healthy }).dump()} });
        }
        if (req["sid"] == broken) {
            return Reply({ {"cmd", "read_ack"}, {"sid", broken}, {"model", "magnet"} });
        }
        if (req["sid"] == healthy) {
            return Reply({ {"cmd", "read_ack"}, {"sid", healthy}, {"model", "magnet"}, {"data", "{\"status\":\"open\"}"} });
        }
        return Reply({ {"cmd", "read_ack"}, {"sid", kHubSid}, {"model", "gateway"}, {"data", "{\"rgb\":0}"} });
        });
    auto session = MakeSession(hub.Port());

    ASSERT_TRUE(session->DiscoverDevices());
    auto devices = session->GetDevices();
    EXPECT_EQ(devices.count(broken), 0u);
    ASSERT_EQ(devices.count(healthy), 1u);
    EXPECT_EQ(devices[healthy].data["status"], "open");
    EXPECT_EQ(devices.count(kHubSid), 1u);
}

TEST(GatewaySessionTest, WriteAckTokenKeysTheNextWrite) {
    std::atomic<int> writes{ 0 };
    FakeUdpPeer hub([&writes](const std::string& datagram) {
        json req = Parse(datagram);
        json ack = { {"cmd", "write_ack"}, {"sid", req["sid"]}, {"data", "{\"channel_0\":\"on\"}"} };
        if (++writes == 1) ack["token"] = "dddddddddddddddd";
        return Reply(ack);
        });
    auto session = MakeSession(hub.Port());
    session->UpdateToken("aaaaaaaaaaaaaaaa");

    EXPECT_TRUE(session->Write(kPlug, { {"channel_0", "on"} }));
    EXPECT_EQ(session->GetToken(), "dddddddddddddddd");
    EXPECT_TRUE(session->Write(kPlug, { {"channel_0", "off"} }));

    auto received = hub.Received();
    ASSERT_EQ(received.size(), 2u);
    EXPECT_EQ(Parse(received[0])["data"]["key"], HubCrypto::EncryptGatewayTokenHex(kKey, "aaaaaaaaaaaaaaaa"));
    EXPECT_EQ(Parse(received[1])["data"]["key"], HubCrypto::EncryptGatewayTokenHex(kKey, "dddddddddddddddd"));
}

TEST(GatewaySessionTest, DiscoverDevicesFailsOnSilentHub) {
    FakeUdpPeer hub([](const std::string&) { return std::vector<std::string>{}; });
    auto session = MakeSession(hub.Port());
    EXPECT_FALSE(session->DiscoverDevices());
    EXPECT_TRUE(session->GetDevices().empty());
}

TEST(GatewaySessionTest, PushFansOutToSubscribers) {
    auto session = MakeSession(9);
    std::string seen;
    session->Subscribe(kPlug, [&](const json& data, const json& raw) {
        seen = data["status"].get<std::string>();
        EXPECT_EQ(raw["cmd"], "report");
        });

    EXPECT_TRUE(session->HandlePush({ {"cmd", "report"}, {"sid", kPlug}, {"model", "magnet"}, {"data", "{\"status\":\"open\"}"} }));
    EXPECT_EQ(seen, "open");
    EXPECT_FALSE(session->HandlePush({ {"cmd", "report"}, {"model", "magnet"}, {"data", "{}"} }));
    EXPECT_FALSE(session->HandlePush({ {"cmd", "report"}, {"sid", kPlug}, {"data", "broken"} }));
}

TEST(GatewaySessionTest, UnknownDeviceHandlerMaySubscribe) {
    auto session = MakeSession(9);
    EXPECT_FALSE(session->HandlePush({ {"cmd", "report"}, {"sid", "158d0007654321"}, {"data", "{\"status\":\"open\"}"} }));

    int announced = 0, delivered = 0;
    session->SetUnknownDeviceHandler([&](const SubDeviceInfo& info) {
        ++announced;
        EXPECT_EQ(info.model, "magnet");
        session->Subscribe(info.sid, [&](const json&, const json&) { ++delivered; });
        });

    json frame = { {"cmd", "report"}, {"sid", "158d0007654321"}, {"model", "magnet"}, {"data", "{\"status\":\"close\"}"} };
    EXPECT_TRUE(session->HandlePush(frame));
    EXPECT_TRUE(session->HandlePush(frame));
    EXPECT_EQ(announced, 1);
    EXPECT_EQ(delivered, 2);
}

TEST(GatewaySessionTest, HeartbeatTokenIsAbsorbed) {
    auto session = MakeSession(9);
    EXPECT_EQ(session->GetState(), SessionState::UNINITIALIZED);
    session->HandlePush({ {"cmd", "heartbeat"}, {"sid", kHubSid}, {"token", "1234567890abcdef"}, {"data", "{}"} });
    EXPECT_EQ(session->GetToken(), "1234567890abcdef");
    EXPECT_EQ(session->GetState(), SessionState::TOKEN_KNOWN);
}

TEST(GatewaySessionTest, KeyLengthIsChecked) {
    EXPECT_THROW(GatewaySession("127.0.0.1", 9898, kHubSid, "short", "1.1.2", "any", ""), InvalidKeyError);
}
