#include "GatewayBridge.h"
#include "HubErrors.h"
#include "HubProtocol.h"
#include "Logging.h"
#include "MiioClient.h"

#include <algorithm>
#include <stdexcept>

GatewayBridge::GatewayBridge(BridgeConfig config, DiscoveryOptions discovery_options, PushListenerOptions listener_options)
    : m_config(std::move(config)),
    m_listener_options(std::move(listener_options)),
    m_work_guard(boost::asio::make_work_guard(m_io_context)),
    m_poll_strand(boost::asio::make_strand(m_io_context)),
    m_poll_timer(m_poll_strand),
    m_models(ModelRegistry::CreateDefault())
{
    m_discovery = std::make_unique<GatewayDiscovery>(m_config.gateways, m_config.interface, std::move(discovery_options));
    m_devices = std::make_unique<DeviceRegistry>(m_io_context, m_models, m_config.unavailable_after);
    m_services = std::make_unique<GatewayServices>(
        [this]() { return GetGatewayList(); },
        [this](const std::string& gw_sid) { return GetAuxRpc(gw_sid); });
}

GatewayBridge::~GatewayBridge() {
    Stop();
}

bool GatewayBridge::Start() {
    if (m_running) return true;

    int pool_size = (m_config.worker_threads > 0) ? m_config.worker_threads
        : static_cast<int>(std::max(2u, std::thread::hardware_concurrency()));
    for (int i = 0; i < pool_size; ++i) {
        m_thread_pool.emplace_back([this] {
            m_io_context.run();
            });
    }
    AddLog("Asio worker pool started with " + std::to_string(pool_size) + " threads.");
    m_running = true;

    const size_t expected = m_discovery->ExpectedGateways();
    for (int attempt = 0; attempt < std::max(1, m_config.discovery_retry); ++attempt) {
        AddLog("Discovering Xiaomi Gateways (Try " + std::to_string(attempt + 1) + ")");
        auto found = m_discovery->DiscoverGateways();
        if (found.size() >= expected) break;
    }

    GatewayTable gateways = m_discovery->GetGateways();
    if (gateways.empty()) {
        AddLog("System Error: No gateway discovered");
        PushNotification("No gateway discovered", false);
        Stop();
        return false;
    }

    for (const auto& [ip, gateway] : gateways) {
        AttachGateway(gateway);
    }

    m_listener = std::make_unique<PushListener>(m_config.interface,
        [this](const std::string& ip) { return FindGatewayByIp(ip); },
        m_io_context, m_listener_options);
    try {
        m_listener->Start();
    }
    catch (const boost::system::system_error& e) {
        AddLog(std::string("System Error: Push listener failed to start: ") + e.what());
        PushNotification("Push listener failed to start", false);
        Stop();
        return false;
    }

    for (const auto& gateway : GetGatewayList()) {
        if (GetAuxRpc(gateway->GetSid())) LoadGatewayInfo(gateway->GetSid());
    }
    SchedulePoll();

    AddLog("Gateways discovered. Listening for broadcasts");
    PushNotification(std::to_string(gateways.size()) + " gateway(s) online", true);
    return true;
}

void GatewayBridge::Stop() {
    if (!m_running.exchange(false)) return;

    if (m_listener) m_listener->Stop();
    m_devices->CancelTimers();
    boost::asio::post(m_poll_strand, [this]() { m_poll_timer.cancel(); });

    m_work_guard.reset();
    m_io_context.stop();
    for (auto& t : m_thread_pool) {
        if (t.joinable()) t.join();
    }
    m_thread_pool.clear();
    AddLog("Gateway Bridge stopped.");
}

void GatewayBridge::AttachGateway(const std::shared_ptr<GatewaySession>& gateway) {
    {
        std::lock_guard<std::shared_mutex> lock(m_gateways_mutex);
        if (m_gateways.count(gateway->GetIp())) return;
        m_gateways[gateway->GetIp()] = gateway;

        if (!gateway->GetMiioToken().empty()) {
            try {
                auto client = std::make_shared<MiioClient>(gateway->GetIp(), gateway->GetMiioToken());
                m_aux_rpc[gateway->GetSid()] = std::make_shared<GatewayAuxRpc>(gateway->GetIp(), client);
            }
            catch (const InvalidKeyError& e) {
                AddLog("Gateway " + gateway->GetSid() + " Error: " + e.what());
            }
        }
    }

    std::weak_ptr<GatewaySession> weak = gateway;
    gateway->SetUnknownDeviceHandler([this, weak](const SubDeviceInfo& info) {
        if (auto gw = weak.lock()) AttachDevice(gw, info);
        });

    try {
        if (!gateway->DiscoverDevices()) {
            AddLog("Gateway " + gateway->GetSid() + " Error: device enumeration got no answer");
        }
    }
    catch (const HubError& e) {
        AddLog("Gateway " + gateway->GetSid() + " Error: " + e.what());
    }

    for (const auto& [sid, info] : gateway->GetDevices()) {
        AttachDevice(gateway, info);
    }
}

void GatewayBridge::AttachDevice(const std::shared_ptr<GatewaySession>& gateway, const SubDeviceInfo& info) {
    if (!m_devices->Register(gateway->GetSid(), info)) return;

    DeviceRegistry* devices = m_devices.get();
    const std::string sid = info.sid;
    gateway->Subscribe(sid, [devices, sid](const nlohmann::json& data, const nlohmann::json& raw) {
        devices->OnPush(sid, data, raw);
        });
}

GatewayTable GatewayBridge::GetGateways() const {
    std::shared_lock<std::shared_mutex> lock(m_gateways_mutex);
    return m_gateways;
}

std::vector<std::shared_ptr<GatewaySession>> GatewayBridge::GetGatewayList() const {
    std::shared_lock<std::shared_mutex> lock(m_gateways_mutex);
    std::vector<std::shared_ptr<GatewaySession>> list;
    for (const auto& [ip, gateway] : m_gateways) list.push_back(gateway);
    return list;
}

std::shared_ptr<GatewaySession> GatewayBridge::FindGatewayByIp(const std::string& ip) const {
    std::shared_lock<std::shared_mutex> lock(m_gateways_mutex);
    auto it = m_gateways.find(ip);
    return (it != m_gateways.end()) ? it->second : nullptr;
}

std::shared_ptr<GatewaySession> GatewayBridge::FindGatewayBySid(const std::string& sid) const {
    const std::string normalized = HubProtocol::NormalizeSid(sid);
    std::shared_lock<std::shared_mutex> lock(m_gateways_mutex);
    for (const auto& [ip, gateway] : m_gateways) {
        if (gateway->GetSid() == normalized) return gateway;
    }
    return nullptr;
}

std::shared_ptr<GatewayAuxRpc> GatewayBridge::GetAuxRpc(const std::string& gw_sid) const {
    std::shared_lock<std::shared_mutex> lock(m_gateways_mutex);
    auto it = m_aux_rpc.find(HubProtocol::NormalizeSid(gw_sid));
    return (it != m_aux_rpc.end()) ? it->second : nullptr;
}

bool GatewayBridge::WriteSubDevice(const std::string& sid, const std::string& field, const nlohmann::json& value) {
    auto device = m_devices->Get(sid);
    if (!device) throw std::invalid_argument("Unknown device " + sid);

    auto descriptor = m_devices->GetDescriptor(sid);
    if (!descriptor || !descriptor->encode_command) {
        throw std::invalid_argument("Device " + sid + " (" + device->model + ") does not accept commands");
    }
    auto gateway = FindGatewayBySid(device->hub_sid);
    if (!gateway) throw std::invalid_argument("Gateway " + device->hub_sid + " is not attached");

    if (std::find(device->data_keys.begin(), device->data_keys.end(), field) == device->data_keys.end()) {
        throw std::invalid_argument("Device " + sid + " (" + device->model + ") has no writable field '" + field + "'");
    }

    nlohmann::json fields = descriptor->encode_command(field, value);
    if (g_log_show_egress) AddLog("Device " + sid + " >> " + fields.dump(), LogType::EGRESS);
    return gateway->Write(sid, fields);
}

// --- Gateway Radio ---

bool GatewayBridge::SetRadioPower(const std::string& gw_sid, bool on) {
    const std::string sid = m_services->ResolveGateway(gw_sid)->GetSid();
    bool ok = m_services->RadioPower(sid, on);
    if (ok) m_devices->UpdateAttributes(sid, { {"radio_on", on} });
    return ok;
}

void GatewayBridge::RefreshRadio(const std::string& gw_sid) {
    const std::string sid = m_services->ResolveGateway(gw_sid)->GetSid();
    GatewayAuxRpc::RadioState state = m_services->RadioState(sid);
    nlohmann::json attributes = { {"radio_on", state.playing} };
    attributes["radio_volume"] = state.volume ? nlohmann::json(*state.volume) : nlohmann::json();
    m_devices->UpdateAttributes(sid, attributes);
}

void GatewayBridge::LoadGatewayInfo(const std::string& gw_sid) {
    try {
        GatewayAuxRpc::GatewayInfo info = m_services->GatewayInfo(gw_sid);
        m_devices->UpdateAttributes(gw_sid, { {"miio_model", info.model}, {"miio_ip", info.local_ip} });
    }
    catch (const HubError& e) {
        AddLog("Gateway " + gw_sid + " Error: miIO.info failed: " + e.what());
    }
}

// --- Polling ---

void GatewayBridge::SchedulePoll() {
    boost::asio::post(m_poll_strand, [this]() {
        m_poll_timer.expires_after(m_config.poll_interval);
        m_poll_timer.async_wait(boost::asio::bind_executor(m_poll_strand,
            [this](const boost::system::error_code& ec) {
                if (ec == boost::asio::error::operation_aborted || !m_running) return;
                PollOnce();
                SchedulePoll();
            }));
        });
}

void GatewayBridge::PollOnce() {
    for (const auto& device : m_devices->Snapshot()) {
        if (!device.supports_power) continue;
        auto gateway = FindGatewayBySid(device.hub_sid);
        if (!gateway) continue;
        try {
            std::optional<nlohmann::json> data = gateway->Read(device.sid);
            if (data) {
                nlohmann::json raw = { {"cmd", "read_ack"}, {"sid", device.sid}, {"data", *data} };
                m_devices->OnPush(device.sid, *data, raw);
            }
        }
        catch (const HubError& e) {
            AddLog("Poll Error: " + device.sid + ": " + e.what());
        }
    }

    for (const auto& gateway : GetGatewayList()) {
        if (!GetAuxRpc(gateway->GetSid())) continue;
        try {
            RefreshRadio(gateway->GetSid());
        }
        catch (const HubError& e) {
            AddLog("Poll Error: radio of " + gateway->GetSid() + ": " + e.what());
        }
    }
}
