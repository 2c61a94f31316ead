// GatewayDiscovery.h
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "GatewaySession.h"
#include "HubConfig.h"
#include "HubProtocol.h"

using GatewayTable = std::map<std::string, std::shared_ptr<GatewaySession>>; // ip -> hub

struct DiscoveryOptions {
    std::string multicast_address = HubProtocol::kMulticastAddress;
    uint16_t discovery_port = HubProtocol::kDiscoveryPort;
    std::chrono::milliseconds timeout{ 5000 };
    GatewaySessionOptions session_options;
};

// --- GatewayDiscovery ---
// Rounds accumulate: a hub found in an earlier round is never recreated.
class GatewayDiscovery {
public:
    // Throws ConfigError when the static entries are ambiguous.
    GatewayDiscovery(std::vector<StaticGatewayEntry> entries, std::string interface,
        DiscoveryOptions options = DiscoveryOptions());

    // One round: static entries, then whois and "iam" collection until the deadline.
    GatewayTable DiscoverGateways();

    GatewayTable GetGateways() const;
    std::set<std::string> GetDisabled() const;
    size_t ExpectedGateways() const { return m_entries.size(); }

private:
    void InstantiateStaticEntries();
    void CollectResponses();
    void HandleResponse(const std::string& ip, const std::string& text);
    std::string ResolveHost(const std::string& host, uint16_t port) const;
    const StaticGatewayEntry* MatchEntry(const std::string& sid) const;
    bool IsKnown_NoLock(const std::string& ip) const;

    std::vector<StaticGatewayEntry> m_entries;
    std::string m_interface;
    DiscoveryOptions m_options;

    mutable std::mutex m_mutex;
    GatewayTable m_gateways;
    std::set<std::string> m_disabled;
};
