#include "GatewaySession.h"
#include "HubCrypto.h"
#include "HubErrors.h"
#include "HubProtocol.h"
#include "Logging.h"

#include <array>
#include <stdexcept>

#include <boost/asio.hpp>

using boost::asio::ip::udp;

std::string SessionStateName(SessionState state) {
    switch (state) {
    case SessionState::UNINITIALIZED: return "Uninitialized";
    case SessionState::TOKEN_KNOWN: return "Token known";
    case SessionState::WRITE_PENDING: return "Write pending";
    }
    return "Unknown";
}

namespace {

// Restores the session state once a write exchange is over, whichever way it ended.
class PendingWriteGuard {
public:
    PendingWriteGuard(std::function<void()> on_exit) : m_on_exit(std::move(on_exit)) {}
    ~PendingWriteGuard() { m_on_exit(); }
private:
    std::function<void()> m_on_exit;
};

// Correlation record of the exchange in flight.
struct PendingCommand {
    std::string expected_cmd;
    std::string sid;
    std::chrono::steady_clock::time_point deadline;

    bool Matches(const nlohmann::json& resp) const {
        if (resp["cmd"].get<std::string>() != expected_cmd) return false;
        if (sid.empty()) return true;
        auto it = resp.find("sid");
        return it == resp.end() || !it->is_string() || it->get<std::string>() == sid;
    }
};

} // namespace

GatewaySession::GatewaySession(std::string ip, uint16_t port, std::string sid, std::string key,
    std::string proto, std::string interface, std::string miio_token, GatewaySessionOptions options)
    : m_ip(std::move(ip)),
    m_port(port),
    m_sid(HubProtocol::NormalizeSid(sid)),
    m_key(std::move(key)),
    m_proto(std::move(proto)),
    m_interface(interface.empty() ? "any" : std::move(interface)),
    m_miio_token(std::move(miio_token)),
    m_options(options),
    m_state(SessionState::UNINITIALIZED)
{
    if (!m_key.empty() && m_key.size() != HubCrypto::kBlockSize) {
        throw InvalidKeyError("Gateway " + m_sid + ": key must be 16 characters");
    }
    AddLog("Gateway " + m_sid + ": Session created for " + m_ip + ":" + std::to_string(m_port) +
        (m_key.empty() ? " (read-only, no key)" : ""));
}

GatewaySession::~GatewaySession() = default;

bool GatewaySession::IsProtoV2() const {
    return HubProtocol::IsProtoV2(m_proto);
}

// --- Token ---

std::string GatewaySession::GetToken() const {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    return m_token;
}

void GatewaySession::UpdateToken(const std::string& token) {
    if (token.empty()) return;
    std::lock_guard<std::mutex> lock(m_state_mutex);
    m_token = token;
    if (m_state == SessionState::UNINITIALIZED) {
        m_state = SessionState::TOKEN_KNOWN;
    }
}

void GatewaySession::AbsorbToken(const nlohmann::json& frame) {
    auto it = frame.find("token");
    if (it != frame.end() && it->is_string()) {
        UpdateToken(it->get<std::string>());
    }
}

SessionState GatewaySession::GetState() const {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    return m_state;
}

void GatewaySession::SetState(SessionState state) {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    m_state = state;
}

std::map<std::string, SubDeviceInfo> GatewaySession::GetDevices() const {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    return m_devices;
}

SubDeviceInfo GatewaySession::RememberDevice(const std::string& sid, const nlohmann::json& frame, const nlohmann::json& payload) {
    std::lock_guard<std::mutex> lock(m_state_mutex);
    SubDeviceInfo& info = m_devices[sid];
    info.sid = sid;
    auto model_it = frame.find("model");
    if (model_it != frame.end() && model_it->is_string()) info.model = model_it->get<std::string>();
    std::string short_id = HubProtocol::ShortIdToString(frame);
    if (!short_id.empty()) info.short_id = short_id;
    auto proto_it = frame.find("proto");
    if (proto_it != frame.end() && proto_it->is_string()) info.proto = proto_it->get<std::string>();
    else if (info.proto.empty()) info.proto = m_proto;
    if (payload.is_object()) info.data.update(payload);
    return info;
}

// --- Transport ---

std::optional<nlohmann::json> GatewaySession::SendOnce(const std::string& payload, const std::string& expected_cmd, const std::string& sid) {
    boost::asio::io_context io;
    udp::socket socket(io);
    boost::system::error_code ec;

    udp::endpoint hub(boost::asio::ip::make_address(m_ip, ec), m_port);
    if (ec) throw ProtocolError("Gateway " + m_sid + ": invalid address " + m_ip);

    socket.open(udp::v4());
    if (m_interface != "any") {
        socket.bind(udp::endpoint(boost::asio::ip::make_address(m_interface), 0));
    }

    if (g_log_show_egress) AddLog("Gateway " + m_sid + " >> " + payload, LogType::EGRESS);
    socket.send_to(boost::asio::buffer(payload), hub, 0, ec);
    if (ec) {
        AddLog("Gateway " + m_sid + " Error: send failed: " + ec.message());
        return std::nullopt;
    }

    PendingCommand pending{ expected_cmd, sid, std::chrono::steady_clock::now() + m_options.command_timeout };
    std::array<char, HubProtocol::kSocketBufferSize> buf;

    while (true) {
        auto remaining = pending.deadline - std::chrono::steady_clock::now();
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
            // Deadline hit with the receive still pending
            socket.cancel();
            io.run();
        }

        if (rx_ec == boost::asio::error::operation_aborted || rx_ec == boost::asio::error::would_block) {
            return std::nullopt;
        }
        if (rx_ec) {
            AddLog("Gateway " + m_sid + " Error: receive failed: " + rx_ec.message());
            return std::nullopt;
        }
        if (sender.address() != hub.address()) {
            continue; // Stray datagram
        }

        std::string text(buf.data(), rx_len);
        if (g_log_show_ingress) AddLog("Gateway " + m_sid + " << " + text, LogType::INGRESS);

        nlohmann::json resp = nlohmann::json::parse(text, nullptr, false);
        if (resp.is_discarded() || !resp.is_object()) {
            throw ProtocolError("Gateway " + m_sid + ": malformed response to " + expected_cmd);
        }
        auto cmd_it = resp.find("cmd");
        if (cmd_it == resp.end() || !cmd_it->is_string()) {
            throw ProtocolError("Gateway " + m_sid + ": response without cmd");
        }

        // Every answer carries the current token
        AbsorbToken(resp);

        if (!pending.Matches(resp)) {
            AddLog("Gateway " + m_sid + ": Non matching response " + cmd_it->get<std::string>() + ", expecting " + expected_cmd);
            continue;
        }
        return resp;
    }
}

nlohmann::json GatewaySession::SendCommand(const nlohmann::json& cmd, const std::string& expected_cmd, const std::string& sid) {
    const std::string payload = cmd.dump();
    for (int attempt = 1; attempt <= 2; ++attempt) {
        std::optional<nlohmann::json> resp = SendOnce(payload, expected_cmd, sid);
        if (resp) return *resp;
        AddLog("Gateway " + m_sid + ": No " + expected_cmd + " within " +
            std::to_string(m_options.command_timeout.count()) + " ms (attempt " + std::to_string(attempt) + "/2)");
    }
    throw CommandTimeoutError("Gateway " + m_sid + ": no " + expected_cmd + " from " + m_ip + " after retry");
}

// --- Handshake & Enumeration ---

nlohmann::json GatewaySession::RefreshToken_NoLock() {
    const bool v2 = IsProtoV2();
    nlohmann::json ack = SendCommand(HubProtocol::BuildDeviceListRequest(v2), HubProtocol::DeviceListAck(v2), "");
    if (GetToken().empty()) {
        throw ProtocolError("Gateway " + m_sid + ": device list answer carries no token");
    }
    return ack;
}

nlohmann::json GatewaySession::RefreshToken() {
    std::lock_guard<std::mutex> command_lock(m_command_mutex);
    return RefreshToken_NoLock();
}

std::optional<nlohmann::json> GatewaySession::ReadFrame_NoLock(const std::string& sid) {
    const bool v2 = IsProtoV2();
    nlohmann::json resp;
    try {
        resp = SendCommand(HubProtocol::BuildRead(v2, sid), HubProtocol::ReadAck(v2), sid);
    }
    catch (const CommandTimeoutError& e) {
        AddLog(std::string("Gateway Error: ") + e.what());
        return std::nullopt;
    }

    std::optional<nlohmann::json> payload = HubProtocol::DecodePayload(resp);
    if (!payload) {
        throw ProtocolError("Gateway " + m_sid + ": read answer for " + sid + " carries no data");
    }
    if (payload->contains("error")) {
        AddLog("Gateway " + m_sid + ": Read of " + sid + " failed: " + (*payload)["error"].dump());
        return std::nullopt;
    }
    RememberDevice(sid, resp, *payload);
    return resp;
}

std::optional<nlohmann::json> GatewaySession::Read(const std::string& sid) {
    std::lock_guard<std::mutex> command_lock(m_command_mutex);
    std::optional<nlohmann::json> frame = ReadFrame_NoLock(sid);
    if (!frame) return std::nullopt;
    return HubProtocol::DecodePayload(*frame);
}

bool GatewaySession::DiscoverDevices() {
    std::lock_guard<std::mutex> command_lock(m_command_mutex);

    std::optional<nlohmann::json> ack;
    for (int attempt = 1; attempt <= m_options.device_discovery_retries && !ack; ++attempt) {
        try {
            ack = RefreshToken_NoLock();
        }
        catch (const CommandTimeoutError& e) {
            AddLog(std::string("Gateway Error: ") + e.what() + " (discovery try " + std::to_string(attempt) + ")");
        }
    }
    if (!ack) {
        AddLog("Gateway " + m_sid + " Error: Unable to enumerate sub-devices");
        return false;
    }

    std::vector<HubProtocol::DeviceListEntry> entries = HubProtocol::DecodeDeviceList(*ack);
    if (!m_sid.empty()) {
        // The hub itself carries light and illumination state
        bool listed = false;
        for (const auto& e : entries) listed |= (e.sid == m_sid);
        if (!listed) entries.push_back(HubProtocol::DeviceListEntry{ m_sid, "" });
    }
    AddLog("Gateway " + m_sid + ": Found " + std::to_string(entries.size()) + " devices");

    for (const auto& entry : entries) {
        std::optional<nlohmann::json> frame;
        try {
            for (int attempt = 1; attempt <= m_options.device_discovery_retries && !frame; ++attempt) {
                frame = ReadFrame_NoLock(entry.sid);
            }
        }
        catch (const ProtocolError& e) {
            // A broken answer from one device does not end the enumeration
            AddLog(std::string("Gateway Error: ") + e.what() + ", skipping " + entry.sid);
            continue;
        }
        if (!frame) {
            if (entry.model.empty()) {
                AddLog("Gateway " + m_sid + " Error: No data for sub-device " + entry.sid);
                continue;
            }
            nlohmann::json listed = { {"sid", entry.sid}, {"model", entry.model} };
            RememberDevice(entry.sid, listed, nlohmann::json::object());
            continue;
        }
        if (!entry.model.empty() && !frame->contains("model")) {
            (*frame)["model"] = entry.model;
            RememberDevice(entry.sid, *frame, nlohmann::json::object());
        }
    }
    SetState(GetToken().empty() ? SessionState::UNINITIALIZED : SessionState::TOKEN_KNOWN);
    return true;
}

// --- Write ---

nlohmann::json GatewaySession::BuildWriteFrame(const std::string& sid, const nlohmann::json& fields) {
    std::string model;
    std::string short_id;
    std::string token;
    {
        std::lock_guard<std::mutex> lock(m_state_mutex);
        token = m_token;
        auto it = m_devices.find(sid);
        if (it != m_devices.end()) {
            model = it->second.model;
            short_id = it->second.short_id;
        }
    }
    const std::string key_hex = HubCrypto::EncryptGatewayTokenHex(m_key, token);
    return HubProtocol::BuildWrite(IsProtoV2(), sid, model, short_id, fields, key_hex);
}

bool GatewaySession::Write(const std::string& sid, const nlohmann::json& fields) {
    if (m_key.empty()) {
        throw NoKeyError("Gateway " + m_sid + ": key is not provided, commands cannot be sent");
    }
    if (!fields.is_object() || fields.empty()) {
        throw std::invalid_argument("Write fields must be a non-empty object");
    }

    std::lock_guard<std::mutex> command_lock(m_command_mutex);
    if (GetToken().empty()) {
        RefreshToken_NoLock();
    }

    PendingWriteGuard guard([this] {
        SetState(GetToken().empty() ? SessionState::UNINITIALIZED : SessionState::TOKEN_KNOWN);
    });

    const bool v2 = IsProtoV2();
    bool key_retried = false;
    while (true) {
        SetState(SessionState::WRITE_PENDING);
        nlohmann::json ack = SendCommand(BuildWriteFrame(sid, fields), HubProtocol::WriteAck(v2), sid);

        std::optional<nlohmann::json> payload = HubProtocol::DecodePayload(ack);
        if (!payload) {
            throw ProtocolError("Gateway " + m_sid + ": write ack carries no data");
        }

        auto error_it = payload->find("error");
        if (error_it != payload->end()) {
            std::string error = error_it->is_string() ? error_it->get<std::string>() : error_it->dump();
            if (error.find("Invalid key") != std::string::npos && !key_retried) {
                // Token went stale, handshake again and resend once
                AddLog("Gateway " + m_sid + ": Invalid key, refreshing token and retrying");
                key_retried = true;
                RefreshToken_NoLock();
                continue;
            }
            AddLog("Gateway " + m_sid + " Error: write to " + sid + " rejected: " + error);
            return false;
        }

        RememberDevice(sid, ack, *payload);
        return true;
    }
}

// --- Push Path ---

SubscriptionId GatewaySession::Subscribe(const std::string& sid, PushCallback callback) {
    return m_subscriptions.Subscribe(sid, std::move(callback));
}

bool GatewaySession::Unsubscribe(SubscriptionId id) {
    return m_subscriptions.Unsubscribe(id);
}

void GatewaySession::SetUnknownDeviceHandler(std::function<void(const SubDeviceInfo&)> handler) {
    std::lock_guard<std::mutex> lock(m_handler_mutex);
    m_unknown_device_handler = std::move(handler);
}

bool GatewaySession::HandlePush(const nlohmann::json& frame) {
    AbsorbToken(frame);

    auto sid_it = frame.find("sid");
    if (sid_it == frame.end() || !sid_it->is_string()) {
        AddLog("Gateway " + m_sid + ": Push frame without sid dropped");
        return false;
    }
    const std::string sid = sid_it->get<std::string>();

    std::optional<nlohmann::json> payload = HubProtocol::DecodePayload(frame);
    if (!payload) {
        AddLog("Gateway " + m_sid + ": Push from " + sid + " without usable data dropped");
        return false;
    }
    if (payload->contains("error")) {
        AddLog("Gateway " + m_sid + ": Push from " + sid + " reports error " + (*payload)["error"].dump());
        return false;
    }

    SubDeviceInfo info = RememberDevice(sid, frame, *payload);

    if (!m_subscriptions.HasSubscribers(sid)) {
        std::function<void(const SubDeviceInfo&)> handler;
        {
            std::lock_guard<std::mutex> lock(m_handler_mutex);
            handler = m_unknown_device_handler;
        }
        if (handler) handler(info);
    }

    if (m_subscriptions.Dispatch(sid, *payload, frame) == 0) {
        AddLog("Gateway " + m_sid + ": Push for unknown sub-device " + sid + " dropped");
        return false;
    }
    return true;
}
