#include <gtest/gtest.h>

#include "DeviceModels.h"

using nlohmann::json;

TEST(DeviceModelsTest, DefaultTableCoversCommonModels) {
    auto registry = ModelRegistry::CreateDefault();
    for (const char* model : { "gateway", "plug", "ctrl_neutral2", "sensor_ht", "weather.v1", "magnet", "motion", "sensor_wleak.aq1", "86sw2" }) {
        EXPECT_NE(registry->Find(model), nullptr) << model;
    }
    EXPECT_EQ(registry->Find("lumi.unknown"), nullptr);
    EXPECT_EQ(registry->Find("ctrl_ln2")->channels.size(), 2u);
    EXPECT_TRUE(registry->Find("plug")->encode_command != nullptr);
    EXPECT_FALSE(registry->Find("magnet")->encode_command != nullptr);
}

TEST(DeviceModelsTest, LegacyPlugUsesStatusOnOldFirmware) {
    auto plug = ModelRegistry::CreateDefault()->Find("plug");
    EXPECT_EQ(DataKeysFor(*plug, "1.0.9"), std::vector<std::string>{ "status" });
    EXPECT_EQ(DataKeysFor(*plug, "2.0.1"), std::vector<std::string>{ "channel_0" });
}

TEST(DeviceModelsTest, SwitchStateChangeOnlyOnFlip) {
    json attributes = json::object();
    std::vector<std::string> keys = { "channel_0" };
    EXPECT_TRUE(DecodeSwitch(keys, { {"channel_0", "on"} }, attributes));
    EXPECT_EQ(attributes["channel_0"], true);
    EXPECT_FALSE(DecodeSwitch(keys, { {"channel_0", "on"} }, attributes));
    EXPECT_TRUE(DecodeSwitch(keys, { {"channel_0", "off"} }, attributes));
}

TEST(DeviceModelsTest, SwitchPowerFields) {
    json attributes = json::object();
    DecodeSwitch({ "status" }, { {"inuse", "1"}, {"load_power", "12.5"}, {"power_consumed", "1000.5"} }, attributes);
    EXPECT_EQ(attributes["in_use"], 1);
    EXPECT_DOUBLE_EQ(attributes["load_power"].get<double>(), 12.5);
    EXPECT_DOUBLE_EQ(attributes["power_consumed"].get<double>(), 1000.5);

    DecodeSwitch({ "status" }, { {"inuse", "0"} }, attributes);
    EXPECT_DOUBLE_EQ(attributes["load_power"].get<double>(), 0.0);
}

TEST(DeviceModelsTest, ClimateSensorScalesAndRejectsOutOfRange) {
    json attributes = json::object();
    EXPECT_TRUE(DecodeClimateSensor({}, { {"temperature", "2150"}, {"humidity", "4520"}, {"pressure", "100325"} }, attributes));
    EXPECT_DOUBLE_EQ(attributes["temperature"].get<double>(), 21.5);
    EXPECT_DOUBLE_EQ(attributes["humidity"].get<double>(), 45.2);
    EXPECT_DOUBLE_EQ(attributes["pressure"].get<double>(), 1003.25);

    EXPECT_FALSE(DecodeClimateSensor({}, { {"temperature", "10000"} }, attributes));
    EXPECT_DOUBLE_EQ(attributes["temperature"].get<double>(), 21.5);
}

TEST(DeviceModelsTest, MagnetOpenClose) {
    json attributes = json::object();
    EXPECT_TRUE(DecodeMagnet({}, { {"status", "open"} }, attributes));
    EXPECT_EQ(attributes["open"], true);
    EXPECT_TRUE(DecodeMagnet({}, { {"status", "close"} }, attributes));
    EXPECT_EQ(attributes["open"], false);
}

TEST(DeviceModelsTest, OnOffEncoder) {
    EXPECT_EQ(EncodeOnOff("channel_1", true), (json{ {"channel_1", "on"} }));
    EXPECT_EQ(EncodeOnOff("channel_0", "off"), (json{ {"channel_0", "off"} }));
    EXPECT_EQ(EncodeOnOff("channel_0", 0), (json{ {"channel_0", "off"} }));
}

TEST(DeviceModelsTest, RegisterReplacesExisting) {
    ModelRegistry registry;
    ModelDescriptor d;
    d.model = "custom";
    d.name = "First";
    registry.Register(d);
    d.name = "Second";
    registry.Register(d);
    EXPECT_EQ(registry.Find("custom")->name, "Second");
    EXPECT_EQ(registry.Models().size(), 1u);
}
