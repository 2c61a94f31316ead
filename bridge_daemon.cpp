// Headless bridge: discovery, push listener and MQTT front-end.
#include <iostream>
#include <memory>
#include <string>

#include <boost/asio.hpp>

#include "GatewayBridge.h"
#include "HubConfig.h"
#include "HubErrors.h"
#include "Logging.h"
#include "MqttBridge.h"

int main(int argc, char** argv) {
    g_log_echo_stdout = true;
    const std::string config_path = (argc > 1) ? argv[1] : "migateway.json";

    BridgeConfig config;
    try {
        config = LoadBridgeConfig(config_path);
    }
    catch (const HubError& e) {
        std::cerr << "Config Error: " << e.what() << std::endl;
        return 1;
    }

    std::unique_ptr<GatewayBridge> bridge;
    try {
        bridge = std::make_unique<GatewayBridge>(config);
    }
    catch (const ConfigError& e) {
        std::cerr << "Config Error: " << e.what() << std::endl;
        return 1;
    }

    try {
        if (!bridge->Start()) {
            return 2;
        }
    }
    catch (const HubError& e) {
        std::cerr << "Start Error: " << e.what() << std::endl;
        return 2;
    }

    std::unique_ptr<MqttBridge> mqtt;
    if (config.mqtt.enabled) {
        mqtt = std::make_unique<MqttBridge>(*bridge, config.mqtt);
        mqtt->Start();
    }
    else {
        AddLog("System: MQTT disabled (no broker_uri configured)");
    }

    boost::asio::io_context signal_io;
    boost::asio::signal_set signals(signal_io, SIGINT, SIGTERM);
    signals.async_wait([](const boost::system::error_code& ec, int signal_number) {
        if (!ec) AddLog("System: Signal " + std::to_string(signal_number) + " received, shutting down");
        });
    signal_io.run();

    if (mqtt) mqtt->Stop();
    bridge->Stop();
    return 0;
}
