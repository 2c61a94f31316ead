#include "DeviceRegistry.h"
#include "Logging.h"

#include <algorithm>
#include <cmath>

namespace {

double Round(double value, int digits) {
    double scale = std::pow(10.0, digits);
    return std::round(value * scale) / scale;
}

std::optional<double> ReadMillivolts(const nlohmann::json& value) {
    if (value.is_number()) return value.get<double>();
    if (value.is_string()) {
        try {
            return std::stod(value.get<std::string>());
        }
        catch (const std::exception&) {
        }
    }
    return std::nullopt;
}

} // namespace

double BatteryPercent(double millivolts) {
    double clamped = std::min(std::max(millivolts, static_cast<double>(kVoltageMinMillivolts)),
        static_cast<double>(kVoltageMaxMillivolts));
    return Round((clamped - kVoltageMinMillivolts) / (kVoltageMaxMillivolts - kVoltageMinMillivolts) * 100.0, 1);
}

bool DecodeVoltage(const nlohmann::json& data, nlohmann::json& attributes) {
    std::optional<double> millivolts;
    for (const char* key : { "voltage", "battery_voltage" }) {
        auto it = data.find(key);
        if (it != data.end()) {
            millivolts = ReadMillivolts(*it);
            break;
        }
    }
    if (!millivolts) return false;

    const double volts = Round(*millivolts / 1000.0, 2);
    const double level = BatteryPercent(*millivolts);
    bool changed = attributes.value("voltage", -1.0) != volts || attributes.value("battery_level", -1.0) != level;
    attributes["voltage"] = volts;
    attributes["battery_level"] = level;
    return changed;
}

DeviceRegistry::DeviceRegistry(boost::asio::io_context& io, std::shared_ptr<ModelRegistry> models, Clock::duration unavailable_after)
    : m_io_context(io),
    m_models(models ? std::move(models) : ModelRegistry::CreateDefault()),
    m_unavailable_after(unavailable_after)
{
}

DeviceRegistry::~DeviceRegistry() {
    CancelTimers();
}

std::shared_ptr<DeviceRegistry::SubDeviceRecord> DeviceRegistry::Find(const std::string& sid) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_devices.find(sid);
    return (it != m_devices.end()) ? it->second : nullptr;
}

bool DeviceRegistry::Contains(const std::string& sid) const {
    return Find(sid) != nullptr;
}

bool DeviceRegistry::Register(const std::string& hub_sid, const SubDeviceInfo& info) {
    auto record = std::make_shared<SubDeviceRecord>(m_io_context);
    record->hub_sid = hub_sid;
    record->sid = info.sid;
    record->model = info.model;
    record->descriptor = m_models->Find(info.model);
    if (record->descriptor) {
        record->data_keys = DataKeysFor(*record->descriptor, info.proto);
    }
    else {
        AddLog("Device Registry: Unsupported model '" + info.model + "' for " + info.sid + ", tracking battery and availability only");
    }

    {
        std::lock_guard<std::shared_mutex> lock(m_mutex);
        if (m_devices.count(info.sid)) return false;
        m_devices[info.sid] = record;
    }

    {
        std::lock_guard<std::mutex> lock(record->mutex);
        if (record->descriptor && record->descriptor->decode && info.data.is_object()) {
            record->descriptor->decode(record->data_keys, info.data, record->attributes);
        }
        if (info.data.is_object()) DecodeVoltage(info.data, record->attributes);
        record->deadline = Clock::now() + m_unavailable_after;
    }
    ArmTimer(record);
    AddLog("Device Registry: " + info.sid + " (" + info.model + ") registered on hub " + hub_sid);
    return true;
}

bool DeviceRegistry::OnPush(const std::string& sid, const nlohmann::json& data, const nlohmann::json& raw) {
    return OnPush(sid, data, raw, Clock::now());
}

bool DeviceRegistry::OnPush(const std::string& sid, const nlohmann::json& data, const nlohmann::json& raw, Clock::time_point now) {
    auto record = Find(sid);
    if (!record) {
        AddLog("Device Registry: Push for unregistered device " + sid + " dropped");
        return false;
    }

    bool changed = false;
    bool recovered = false;
    SubDeviceSnapshot snapshot;
    {
        std::lock_guard<std::mutex> lock(record->mutex);
        record->deadline = now + m_unavailable_after;
        recovered = !record->available;
        record->available = true;

        bool is_data = false;
        if (record->descriptor && record->descriptor->decode && data.is_object()) {
            is_data = record->descriptor->decode(record->data_keys, data, record->attributes);
        }
        bool is_voltage = data.is_object() && DecodeVoltage(data, record->attributes);
        changed = is_data || is_voltage || recovered;
        snapshot = MakeSnapshot_NoLock(*record);
    }
    ArmTimer(record);

    if (g_log_show_ingress) AddLog("Device " + sid + " << " + raw.dump(), LogType::INGRESS);
    if (recovered) AddLog("Device Registry: " + sid + " is available again");
    if (changed) Notify(snapshot);
    return changed;
}

bool DeviceRegistry::UpdateAttributes(const std::string& sid, const nlohmann::json& attributes) {
    auto record = Find(sid);
    if (!record || !attributes.is_object()) return false;

    bool changed = false;
    SubDeviceSnapshot snapshot;
    {
        std::lock_guard<std::mutex> lock(record->mutex);
        for (const auto& [key, value] : attributes.items()) {
            auto it = record->attributes.find(key);
            if (it != record->attributes.end() && *it == value) continue;
            record->attributes[key] = value;
            changed = true;
        }
        snapshot = MakeSnapshot_NoLock(*record);
    }
    if (changed) Notify(snapshot);
    return changed;
}

bool DeviceRegistry::CheckAvailability(const std::string& sid, Clock::time_point now) {
    auto record = Find(sid);
    if (!record) return false;

    SubDeviceSnapshot snapshot;
    {
        std::lock_guard<std::mutex> lock(record->mutex);
        if (!record->available || now < record->deadline) return false;
        record->available = false;
        snapshot = MakeSnapshot_NoLock(*record);
    }
    AddLog("Device Registry: " + sid + " unavailable, no report within "
        + std::to_string(std::chrono::duration_cast<std::chrono::minutes>(m_unavailable_after).count()) + " minutes");
    Notify(snapshot);
    return true;
}

void DeviceRegistry::ArmTimer(const std::shared_ptr<SubDeviceRecord>& record) {
    std::weak_ptr<SubDeviceRecord> weak = record;
    boost::asio::post(record->strand, [this, weak]() {
        auto rec = weak.lock();
        if (!rec) return;
        Clock::time_point deadline;
        {
            std::lock_guard<std::mutex> lock(rec->mutex);
            deadline = rec->deadline;
        }
        // Re-arming aborts the previous wait
        rec->timer.expires_at(deadline);
        rec->timer.async_wait([this, weak](const boost::system::error_code& ec) {
            if (ec == boost::asio::error::operation_aborted) return;
            auto r = weak.lock();
            if (!r) return;
            CheckAvailability(r->sid, Clock::now());
            });
        });
}

void DeviceRegistry::CancelTimers() {
    std::vector<std::shared_ptr<SubDeviceRecord>> records;
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        for (const auto& [sid, record] : m_devices) records.push_back(record);
    }
    for (auto& record : records) {
        // Cancel from the record's strand. A stopped pool never runs this and
        // the timer is cancelled when the record is destroyed.
        std::weak_ptr<SubDeviceRecord> weak = record;
        boost::asio::post(record->strand, [weak]() {
            if (auto rec = weak.lock()) rec->timer.cancel();
            });
    }
}

SubDeviceSnapshot DeviceRegistry::MakeSnapshot_NoLock(const SubDeviceRecord& record) const {
    SubDeviceSnapshot snapshot;
    snapshot.hub_sid = record.hub_sid;
    snapshot.sid = record.sid;
    snapshot.model = record.model;
    if (record.descriptor) {
        snapshot.name = record.descriptor->name;
        snapshot.category = record.descriptor->category;
        snapshot.supports_power = record.descriptor->supports_power;
    }
    snapshot.data_keys = record.data_keys;
    snapshot.attributes = record.attributes;
    snapshot.available = record.available;
    return snapshot;
}

std::optional<SubDeviceSnapshot> DeviceRegistry::Get(const std::string& sid) const {
    auto record = Find(sid);
    if (!record) return std::nullopt;
    std::lock_guard<std::mutex> lock(record->mutex);
    return MakeSnapshot_NoLock(*record);
}

std::vector<SubDeviceSnapshot> DeviceRegistry::Snapshot() const {
    std::vector<std::shared_ptr<SubDeviceRecord>> records;
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        for (const auto& [sid, record] : m_devices) records.push_back(record);
    }
    std::vector<SubDeviceSnapshot> result;
    result.reserve(records.size());
    for (const auto& record : records) {
        std::lock_guard<std::mutex> lock(record->mutex);
        result.push_back(MakeSnapshot_NoLock(*record));
    }
    return result;
}

std::shared_ptr<const ModelDescriptor> DeviceRegistry::GetDescriptor(const std::string& sid) const {
    auto record = Find(sid);
    return record ? record->descriptor : nullptr;
}

void DeviceRegistry::SetStateListener(StateListener listener) {
    std::lock_guard<std::mutex> lock(m_listener_mutex);
    m_listener = std::move(listener);
}

void DeviceRegistry::Notify(const SubDeviceSnapshot& snapshot) {
    StateListener listener;
    {
        std::lock_guard<std::mutex> lock(m_listener_mutex);
        listener = m_listener;
    }
    if (listener) listener(snapshot);
}
