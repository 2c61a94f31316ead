#include "PushListener.h"
#include "Logging.h"

using boost::asio::ip::udp;

PushListener::PushListener(std::string interface, GatewayLookup lookup, boost::asio::io_context& worker_io, PushListenerOptions options)
    : m_interface(interface.empty() ? "any" : std::move(interface)),
    m_lookup(std::move(lookup)),
    m_worker_io(worker_io),
    m_options(std::move(options)),
    m_socket(m_io)
{
}

PushListener::~PushListener() {
    Stop();
}

void PushListener::Start() {
    if (m_running) return;

    // Any interface: 0.0.0.0 and membership on INADDR_ANY.
    // Specific interface: bound to the group, membership on that interface.
    std::string bind_address = m_options.listen_address;
    if (bind_address.empty()) {
        bind_address = (m_interface == "any") ? "0.0.0.0" : m_options.multicast_address;
    }
    udp::endpoint local(boost::asio::ip::make_address(bind_address), m_options.port);

    m_socket.open(udp::v4());
    m_socket.set_option(boost::asio::socket_base::reuse_address(true));
    m_socket.bind(local);

    if (m_options.join_multicast) {
        auto group = boost::asio::ip::make_address_v4(m_options.multicast_address);
        if (m_interface == "any") {
            m_socket.set_option(boost::asio::ip::multicast::join_group(group));
        }
        else {
            m_socket.set_option(boost::asio::ip::multicast::join_group(group, boost::asio::ip::make_address_v4(m_interface)));
        }
    }
    m_local_port = m_socket.local_endpoint().port();

    m_running = true;
    m_io.restart();
    DoReceive();
    m_thread = std::thread([this] {
        m_io.run();
        });
    AddLog("Push Listener: listening on " + bind_address + ":" + std::to_string(m_local_port.load()) + " (interface " + m_interface + ")");
}

void PushListener::Stop() {
    if (!m_running.exchange(false)) return;

    // Closing on the loop's own thread aborts the pending receive
    boost::asio::post(m_io, [this] {
        boost::system::error_code ec;
        m_socket.close(ec);
        });
    if (m_thread.joinable()) m_thread.join();
    AddLog("Push Listener: stopped (interface " + m_interface + ")");
}

void PushListener::DoReceive() {
    m_socket.async_receive_from(boost::asio::buffer(m_buffer), m_sender,
        [this](const boost::system::error_code& ec, size_t len) {
            if (ec == boost::asio::error::operation_aborted || !m_running) return;
            if (ec) {
                AddLog("Push Listener Error: receive failed: " + ec.message());
            }
            else {
                ++m_received;
                try {
                    ProcessDatagram(m_sender.address().to_string(), std::string(m_buffer.data(), len));
                }
                catch (const std::exception& e) {
                    ++m_dropped;
                    AddLog(std::string("Push Listener Error: datagram rejected: ") + e.what());
                }
            }
            DoReceive();
        });
}

void PushListener::ProcessDatagram(const std::string& ip, const std::string& text) {
    if (g_log_show_ingress) AddLog("MCAST (" + ip + ") << " + text, LogType::INGRESS);

    nlohmann::json data = nlohmann::json::parse(text, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        ++m_dropped;
        AddLog("Push Listener Error: Cannot process multicast message from " + ip);
        return;
    }

    const std::string cmd = HubProtocol::StringField(data, "cmd");
    auto gateway = m_lookup ? m_lookup(ip) : nullptr;
    if (!gateway) {
        ++m_dropped;
        AddLog("Push Listener: Unknown gateway ip " + ip);
        return;
    }

    if (cmd == "heartbeat" && HubProtocol::IsGatewayModel(HubProtocol::StringField(data, "model"))) {
        auto token_it = data.find("token");
        if (token_it != data.end() && token_it->is_string()) {
            gateway->UpdateToken(token_it->get<std::string>());
        }
        return;
    }

    if (cmd == "report" || cmd == "heartbeat") {
        boost::asio::post(m_worker_io, [gateway, data]() {
            try {
                gateway->HandlePush(data);
            }
            catch (const std::exception& e) {
                AddLog("Push Listener Error: " + gateway->GetSid() + " push failed: " + e.what());
            }
            });
        return;
    }

    ++m_dropped;
    AddLog("Push Listener: Unknown multicast data: " + text);
}
