#include "GatewayDiscovery.h"
#include "HubErrors.h"
#include "Logging.h"

#include <array>

#include <boost/asio.hpp>

using boost::asio::ip::udp;

GatewayDiscovery::GatewayDiscovery(std::vector<StaticGatewayEntry> entries, std::string interface, DiscoveryOptions options)
    : m_entries(std::move(entries)),
    m_interface(interface.empty() ? "any" : std::move(interface)),
    m_options(std::move(options))
{
    ValidateGatewayEntries(m_entries);
    AddLog("Discovery: Expecting " + std::to_string(m_entries.size()) + " gateways");
}

GatewayTable GatewayDiscovery::GetGateways() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_gateways;
}

std::set<std::string> GatewayDiscovery::GetDisabled() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_disabled;
}

bool GatewayDiscovery::IsKnown_NoLock(const std::string& ip) const {
    return m_gateways.count(ip) > 0 || m_disabled.count(ip) > 0;
}

std::string GatewayDiscovery::ResolveHost(const std::string& host, uint16_t port) const {
    boost::asio::io_context io;
    udp::resolver resolver(io);
    boost::system::error_code ec;
    auto results = resolver.resolve(udp::v4(), host, std::to_string(port), ec);
    if (ec || results.empty()) {
        throw DnsResolutionError("Could not resolve " + host + ": " + (ec ? ec.message() : std::string("no address")));
    }
    return results.begin()->endpoint().address().to_string();
}

const StaticGatewayEntry* GatewayDiscovery::MatchEntry(const std::string& sid) const {
    for (const auto& entry : m_entries) {
        if (!entry.sid.empty() && entry.sid == sid) return &entry;
    }
    // Fall back to the sole entry without a declared sid
    const StaticGatewayEntry* anonymous = nullptr;
    for (const auto& entry : m_entries) {
        if (entry.sid.empty()) {
            if (anonymous) return nullptr;
            anonymous = &entry;
        }
    }
    return anonymous;
}

void GatewayDiscovery::InstantiateStaticEntries() {
    for (const auto& entry : m_entries) {
        if (entry.host.empty() || entry.port == 0) continue;

        std::string ip;
        try {
            ip = ResolveHost(entry.host, entry.port);
        }
        catch (const DnsResolutionError& e) {
            AddLog(std::string("Discovery Error: ") + e.what());
            continue;
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        if (IsKnown_NoLock(ip)) continue;

        if (entry.disable) {
            AddLog("Discovery: Gateway " + entry.sid + " is disabled by configuration");
            m_disabled.insert(ip);
            continue;
        }
        AddLog("Discovery: Gateway " + entry.sid + " configured at IP " + ip + ":" + std::to_string(entry.port));
        m_gateways[ip] = std::make_shared<GatewaySession>(ip, entry.port, entry.sid, entry.key, "",
            m_interface, entry.miio_token, m_options.session_options);
    }
}

void GatewayDiscovery::HandleResponse(const std::string& ip, const std::string& text) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (IsKnown_NoLock(ip)) return;
    }

    nlohmann::json resp = nlohmann::json::parse(text, nullptr, false);
    if (resp.is_discarded() || !resp.is_object()) {
        AddLog("Discovery Error: Malformed answer from " + ip + " ignored");
        return;
    }
    if (HubProtocol::StringField(resp, "cmd") != "iam") {
        AddLog("Discovery Error: Response from " + ip + " does not match return cmd");
        return;
    }
    const std::string model = HubProtocol::StringField(resp, "model");
    if (!HubProtocol::IsGatewayModel(model)) {
        AddLog("Discovery Error: Response from " + ip + " must be gateway model, got '" + model + "'");
        return;
    }
    auto sid_it = resp.find("sid");
    if (sid_it == resp.end() || !sid_it->is_string()) {
        AddLog("Discovery Error: iam from " + ip + " without sid");
        return;
    }
    const std::string sid = HubProtocol::NormalizeSid(sid_it->get<std::string>());

    uint16_t port = HubProtocol::kDefaultGatewayPort;
    auto port_it = resp.find("port");
    if (port_it != resp.end()) {
        try {
            int p = port_it->is_string() ? std::stoi(port_it->get<std::string>()) : port_it->get<int>();
            if (p > 0 && p <= 65535) port = static_cast<uint16_t>(p);
        }
        catch (const std::exception&) {
            AddLog("Discovery: iam from " + ip + " has unusable port, using default");
        }
    }
    std::string proto;
    auto proto_it = resp.find("proto_version");
    if (proto_it != resp.end() && proto_it->is_string()) proto = proto_it->get<std::string>();

    const StaticGatewayEntry* entry = MatchEntry(sid);

    std::lock_guard<std::mutex> lock(m_mutex);
    if (IsKnown_NoLock(ip)) return;
    if (entry && entry->disable) {
        AddLog("Discovery: Gateway " + sid + " is disabled by configuration");
        m_disabled.insert(ip);
        return;
    }
    AddLog("Discovery: Gateway " + sid + " found at IP " + ip);
    m_gateways[ip] = std::make_shared<GatewaySession>(ip, port, sid,
        entry ? entry->key : std::string(), proto, m_interface,
        entry ? entry->miio_token : std::string(), m_options.session_options);
}

void GatewayDiscovery::CollectResponses() {
    boost::asio::io_context io;
    udp::socket socket(io); // Closed on every path out of this function
    socket.open(udp::v4());
    if (m_interface != "any") {
        auto local = boost::asio::ip::make_address_v4(m_interface);
        socket.bind(udp::endpoint(local, 0));
        socket.set_option(boost::asio::ip::multicast::outbound_interface(local));
    }

    boost::system::error_code ec;
    udp::endpoint target(boost::asio::ip::make_address(m_options.multicast_address, ec), m_options.discovery_port);
    if (ec) throw ConfigError("Invalid discovery address " + m_options.multicast_address);

    const std::string whois = HubProtocol::BuildWhois().dump();
    socket.send_to(boost::asio::buffer(whois), target, 0, ec);
    if (ec) {
        AddLog("Discovery Error: whois send failed: " + ec.message());
        return;
    }

    // The deadline, not a response count, ends the round
    const auto deadline = std::chrono::steady_clock::now() + m_options.timeout;
    std::array<char, HubProtocol::kSocketBufferSize> buf;
    while (true) {
        auto remaining = deadline - std::chrono::steady_clock::now();
        if (remaining <= std::chrono::steady_clock::duration::zero()) break;

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
            socket.cancel();
            io.run();
        }

        if (rx_ec == boost::asio::error::operation_aborted || rx_ec == boost::asio::error::would_block) break;
        if (rx_ec) {
            AddLog("Discovery Error: receive failed: " + rx_ec.message());
            continue;
        }
        try {
            HandleResponse(sender.address().to_string(), std::string(buf.data(), rx_len));
        }
        catch (const nlohmann::json::exception& e) {
            AddLog(std::string("Discovery Error: iam from ") + sender.address().to_string() + " skipped: " + e.what());
        }
    }
    AddLog("Discovery: Gateway discovery finished in " + std::to_string(m_options.timeout.count() / 1000.0).substr(0, 4) + " seconds");
}

GatewayTable GatewayDiscovery::DiscoverGateways() {
    InstantiateStaticEntries();
    try {
        CollectResponses();
    }
    catch (const boost::system::system_error& e) {
        AddLog(std::string("Discovery Error: socket failure: ") + e.what());
    }
    return GetGateways();
}
