// PushListener.h
#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio.hpp>

#include "GatewaySession.h"
#include "HubProtocol.h"

struct PushListenerOptions {
    std::string listen_address;   // empty: derived from the interface
    uint16_t port = HubProtocol::kMulticastPort;
    std::string multicast_address = HubProtocol::kMulticastAddress;
    bool join_multicast = true;
};

// --- PushListener ---
// One receive loop per bound interface on its own thread. Frames are routed by
// source IP to the owning hub and decoded on the worker pool, never on the
// receive thread.
class PushListener {
public:
    using GatewayLookup = std::function<std::shared_ptr<GatewaySession>(const std::string& ip)>;

    PushListener(std::string interface, GatewayLookup lookup, boost::asio::io_context& worker_io,
        PushListenerOptions options = PushListenerOptions());
    ~PushListener();

    PushListener(const PushListener&) = delete;
    PushListener& operator=(const PushListener&) = delete;

    // Throws boost::system::system_error when the socket cannot be bound.
    void Start();
    void Stop(); // Idempotent

    bool IsRunning() const { return m_running; }
    uint16_t GetLocalPort() const { return m_local_port; }
    uint64_t GetReceivedCount() const { return m_received; }
    uint64_t GetDroppedCount() const { return m_dropped; }

private:
    void DoReceive();
    void ProcessDatagram(const std::string& ip, const std::string& text);

    std::string m_interface;
    GatewayLookup m_lookup;
    boost::asio::io_context& m_worker_io;
    PushListenerOptions m_options;

    boost::asio::io_context m_io;
    boost::asio::ip::udp::socket m_socket;
    boost::asio::ip::udp::endpoint m_sender;
    std::array<char, HubProtocol::kSocketBufferSize> m_buffer;
    std::thread m_thread;

    std::atomic<bool> m_running{ false };
    std::atomic<uint16_t> m_local_port{ 0 };
    std::atomic<uint64_t> m_received{ 0 };
    std::atomic<uint64_t> m_dropped{ 0 };
};
