// GatewayBridge.h
#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio.hpp>
#include <nlohmann/json.hpp>

#include "DeviceModels.h"
#include "DeviceRegistry.h"
#include "GatewayAuxRpc.h"
#include "GatewayDiscovery.h"
#include "GatewayServices.h"
#include "GatewaySession.h"
#include "HubConfig.h"
#include "PushListener.h"

// --- GatewayBridge ---
// Context object owning the worker pool, discovery, hub table, push listener,
// device registry, auxiliary RPC facades and hub services.
class GatewayBridge {
public:
    // Throws ConfigError before any network activity.
    explicit GatewayBridge(BridgeConfig config,
        DiscoveryOptions discovery_options = DiscoveryOptions(),
        PushListenerOptions listener_options = PushListenerOptions());
    ~GatewayBridge();

    GatewayBridge(const GatewayBridge&) = delete;
    GatewayBridge& operator=(const GatewayBridge&) = delete;

    // Discovery rounds, device enumeration, subscriptions, push listener.
    // False when no gateway was found.
    bool Start();
    void Stop();
    bool IsRunning() const { return m_running; }
    uint16_t GetPushPort() const { return m_listener ? m_listener->GetLocalPort() : 0; }

    // --- Hub Access ---
    GatewayTable GetGateways() const;
    std::vector<std::shared_ptr<GatewaySession>> GetGatewayList() const;
    std::shared_ptr<GatewaySession> FindGatewayByIp(const std::string& ip) const;
    std::shared_ptr<GatewaySession> FindGatewayBySid(const std::string& sid) const;
    std::shared_ptr<GatewayAuxRpc> GetAuxRpc(const std::string& gw_sid) const;

    // Logical command ("channel_0", true) through the model's encoder and the owning hub.
    // Throws std::invalid_argument for unknown or read-only devices and for fields
    // outside the device's data keys, HubError from the hub.
    bool WriteSubDevice(const std::string& sid, const std::string& field, const nlohmann::json& value);

    // --- Gateway Radio ---
    // Mirrored on the gateway's registry record. Empty sid selects the only gateway.
    bool SetRadioPower(const std::string& gw_sid, bool on);
    void RefreshRadio(const std::string& gw_sid);

    // One polling pass: power plugs are read, radio state refreshed.
    void PollOnce();

    DeviceRegistry& Devices() { return *m_devices; }
    GatewayServices& Services() { return *m_services; }
    boost::asio::io_context& GetIoContext() { return m_io_context; }
    const BridgeConfig& GetConfig() const { return m_config; }

private:
    void AttachGateway(const std::shared_ptr<GatewaySession>& gateway);
    void AttachDevice(const std::shared_ptr<GatewaySession>& gateway, const SubDeviceInfo& info);
    void LoadGatewayInfo(const std::string& gw_sid);
    void SchedulePoll();

    BridgeConfig m_config;
    PushListenerOptions m_listener_options;

    // Asio Thread Pool
    boost::asio::io_context m_io_context;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> m_work_guard;
    std::vector<std::thread> m_thread_pool;

    // Polling runs on its own strand, one pass at a time
    boost::asio::strand<boost::asio::io_context::executor_type> m_poll_strand;
    boost::asio::steady_timer m_poll_timer;

    std::shared_ptr<ModelRegistry> m_models;
    std::unique_ptr<GatewayDiscovery> m_discovery;
    std::unique_ptr<DeviceRegistry> m_devices;
    std::unique_ptr<GatewayServices> m_services;
    std::unique_ptr<PushListener> m_listener;

    mutable std::shared_mutex m_gateways_mutex;
    GatewayTable m_gateways;
    std::map<std::string, std::shared_ptr<GatewayAuxRpc>> m_aux_rpc; // gateway sid -> facade

    std::atomic<bool> m_running{ false };
};
