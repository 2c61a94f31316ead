// DeviceRegistry.h
#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include <boost/asio.hpp>
#include <nlohmann/json.hpp>

#include "DeviceModels.h"
#include "GatewaySession.h"

// --- Battery ---
constexpr int kVoltageMinMillivolts = 2800;
constexpr int kVoltageMaxMillivolts = 3300;

// 0 at or below 2800 mV, 100 at or above 3300 mV, one decimal.
double BatteryPercent(double millivolts);

// Reads "voltage" or "battery_voltage" into "voltage" (V) and "battery_level" (%).
// Returns true when either value changed.
bool DecodeVoltage(const nlohmann::json& data, nlohmann::json& attributes);

struct SubDeviceSnapshot {
    std::string hub_sid;
    std::string sid;
    std::string model;
    std::string name;
    DeviceCategory category = DeviceCategory::Unknown;
    std::vector<std::string> data_keys; // writable keys ("status" or "channel_N")
    bool supports_power = false;
    nlohmann::json attributes = nlohmann::json::object();
    bool available = true;
};

// --- DeviceRegistry ---
// Timers run on the shared io_context; stop the pool before destroying the registry.
class DeviceRegistry {
public:
    using Clock = std::chrono::steady_clock;
    using StateListener = std::function<void(const SubDeviceSnapshot&)>;

    DeviceRegistry(boost::asio::io_context& io, std::shared_ptr<ModelRegistry> models,
        Clock::duration unavailable_after = std::chrono::minutes(150));
    ~DeviceRegistry();

    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    // Creates the record from the hub's enumeration, decodes its last payload
    // and arms the availability timer. False when already registered.
    bool Register(const std::string& hub_sid, const SubDeviceInfo& info);
    bool Contains(const std::string& sid) const;

    bool OnPush(const std::string& sid, const nlohmann::json& data, const nlohmann::json& raw);
    bool OnPush(const std::string& sid, const nlohmann::json& data, const nlohmann::json& raw, Clock::time_point now);

    // Merges values that do not come from the hub (radio state, miIO info).
    // Availability is left alone. True when an attribute changed.
    bool UpdateAttributes(const std::string& sid, const nlohmann::json& attributes);

    // Marks the device unavailable when its deadline passed. True only on the transition.
    bool CheckAvailability(const std::string& sid, Clock::time_point now);

    std::optional<SubDeviceSnapshot> Get(const std::string& sid) const;
    std::vector<SubDeviceSnapshot> Snapshot() const;
    std::shared_ptr<const ModelDescriptor> GetDescriptor(const std::string& sid) const;

    void SetStateListener(StateListener listener);
    void CancelTimers();

    Clock::duration GetUnavailableAfter() const { return m_unavailable_after; }

private:
    struct SubDeviceRecord {
        SubDeviceRecord(boost::asio::io_context& io)
            : strand(boost::asio::make_strand(io)), timer(strand) {}

        std::string hub_sid;
        std::string sid;
        std::string model;
        std::shared_ptr<const ModelDescriptor> descriptor;
        std::vector<std::string> data_keys;

        std::mutex mutex; // Guards the fields below
        nlohmann::json attributes = nlohmann::json::object();
        bool available = true;
        Clock::time_point deadline;

        boost::asio::strand<boost::asio::io_context::executor_type> strand;
        boost::asio::steady_timer timer;
    };

    std::shared_ptr<SubDeviceRecord> Find(const std::string& sid) const;
    void ArmTimer(const std::shared_ptr<SubDeviceRecord>& record);
    SubDeviceSnapshot MakeSnapshot_NoLock(const SubDeviceRecord& record) const;
    void Notify(const SubDeviceSnapshot& snapshot);

    boost::asio::io_context& m_io_context;
    std::shared_ptr<ModelRegistry> m_models;
    Clock::duration m_unavailable_after;

    mutable std::shared_mutex m_mutex;
    std::map<std::string, std::shared_ptr<SubDeviceRecord>> m_devices;

    std::mutex m_listener_mutex;
    StateListener m_listener;
};
