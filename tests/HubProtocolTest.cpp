#include <gtest/gtest.h>

#include "HubErrors.h"
#include "HubProtocol.h"

using nlohmann::json;

TEST(HubProtocolTest, SidNormalization) {
    EXPECT_EQ(HubProtocol::NormalizeSid("34:CE:00:AA:BB:CC"), "34ce00aabbcc");
    EXPECT_TRUE(HubProtocol::IsValidSid("34ce00aabbcc"));
    EXPECT_TRUE(HubProtocol::IsValidSid("158d0001234567"));
    EXPECT_FALSE(HubProtocol::IsValidSid("158d000123456"));
    EXPECT_FALSE(HubProtocol::IsValidSid("34ce00aabbzz"));
}

TEST(HubProtocolTest, GatewayModelAllowlist) {
    EXPECT_TRUE(HubProtocol::IsGatewayModel("gateway"));
    EXPECT_TRUE(HubProtocol::IsGatewayModel("gateway.v3"));
    EXPECT_TRUE(HubProtocol::IsGatewayModel("acpartner.v3"));
    EXPECT_FALSE(HubProtocol::IsGatewayModel("magnet"));
}

TEST(HubProtocolTest, ProtocolOneWriteCarriesKeyInsideData) {
    json cmd = HubProtocol::BuildWrite(false, "158d0001234567", "plug", "4343", { {"channel_0", "on"} }, "abcd");
    EXPECT_EQ(cmd["cmd"], "write");
    EXPECT_EQ(cmd["model"], "plug");
    EXPECT_EQ(cmd["short_id"], 4343);
    EXPECT_EQ(cmd["data"]["channel_0"], "on");
    EXPECT_EQ(cmd["data"]["key"], "abcd");
    EXPECT_FALSE(cmd.contains("key"));
}

TEST(HubProtocolTest, ProtocolOneWriteOmitsUnknownModel) {
    json cmd = HubProtocol::BuildWrite(false, "34ce00aabbcc", "", "", { {"mid", 10000} }, "abcd");
    EXPECT_FALSE(cmd.contains("model"));
    EXPECT_FALSE(cmd.contains("short_id"));
    EXPECT_EQ(cmd["data"]["mid"], 10000);
}

TEST(HubProtocolTest, ProtocolTwoWriteUsesParamsList) {
    json cmd = HubProtocol::BuildWrite(true, "158d0001234567", "", "", { {"channel_0", "off"}, {"channel_1", "on"} }, "abcd");
    EXPECT_EQ(cmd["key"], "abcd");
    ASSERT_TRUE(cmd["params"].is_array());
    ASSERT_EQ(cmd["params"].size(), 2u);
    EXPECT_EQ(cmd["params"][0]["channel_0"], "off");
    EXPECT_EQ(cmd["params"][1]["channel_1"], "on");
    EXPECT_FALSE(cmd.contains("data"));
}

TEST(HubProtocolTest, AckNamesPerVersion) {
    EXPECT_EQ(HubProtocol::DeviceListAck(false), "get_id_list_ack");
    EXPECT_EQ(HubProtocol::DeviceListAck(true), "discovery_rsp");
    EXPECT_EQ(HubProtocol::ReadAck(true), "read_rsp");
    EXPECT_EQ(HubProtocol::WriteAck(false), "write_ack");
    EXPECT_EQ(HubProtocol::BuildDeviceListRequest(true)["cmd"], "discovery");
}

TEST(HubProtocolTest, DecodePayloadFromStringObjectAndParams) {
    auto v1 = HubProtocol::DecodePayload({ {"cmd", "report"}, {"data", "{\"status\":\"open\"}"} });
    ASSERT_TRUE(v1.has_value());
    EXPECT_EQ((*v1)["status"], "open");

    auto v1_obj = HubProtocol::DecodePayload({ {"data", { {"voltage", 3000} }} });
    ASSERT_TRUE(v1_obj.has_value());
    EXPECT_EQ((*v1_obj)["voltage"], 3000);

    auto v2 = HubProtocol::DecodePayload({ {"params", json::array({ { {"channel_0", "on"} }, { {"load_power", 12.5} } })} });
    ASSERT_TRUE(v2.has_value());
    EXPECT_EQ((*v2)["channel_0"], "on");
    EXPECT_EQ((*v2)["load_power"], 12.5);

    EXPECT_FALSE(HubProtocol::DecodePayload({ {"data", "not json"} }).has_value());
    EXPECT_FALSE(HubProtocol::DecodePayload({ {"cmd", "report"} }).has_value());
}

TEST(HubProtocolTest, DecodeDeviceListBothVersions) {
    auto v1 = HubProtocol::DecodeDeviceList({ {"cmd", "get_id_list_ack"}, {"data", "[\"158d0001234567\",\"158d0007654321\"]"} });
    ASSERT_EQ(v1.size(), 2u);
    EXPECT_EQ(v1[1].sid, "158d0007654321");
    EXPECT_TRUE(v1[0].model.empty());

    json v2_ack = { {"cmd", "discovery_rsp"}, {"dev_list", json::array({ { {"sid", "158d0001234567"}, {"model", "sensor_ht"} } })} };
    auto v2 = HubProtocol::DecodeDeviceList(v2_ack);
    ASSERT_EQ(v2.size(), 1u);
    EXPECT_EQ(v2[0].model, "sensor_ht");

    EXPECT_THROW(HubProtocol::DecodeDeviceList({ {"cmd", "get_id_list_ack"} }), ProtocolError);
    EXPECT_THROW(HubProtocol::DecodeDeviceList({ {"data", "{}"} }), ProtocolError);
}

TEST(HubProtocolTest, ShortIdAsNumberOrString) {
    EXPECT_EQ(HubProtocol::ShortIdToString({ {"short_id", 4343} }), "4343");
    EXPECT_EQ(HubProtocol::ShortIdToString({ {"short_id", "4343"} }), "4343");
    EXPECT_EQ(HubProtocol::ShortIdToString(json::object()), "");
}
