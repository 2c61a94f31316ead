// HubErrors.h
#pragma once

#include <stdexcept>
#include <string>

// --- Error Taxonomy ---
// Every failure surfaced by the core derives from HubError so front-ends
// can report it with a single catch.
class HubError : public std::runtime_error {
public:
    explicit HubError(const std::string& what) : std::runtime_error(what) {}
};

// Malformed key or token length. Fatal to the single command.
class InvalidKeyError : public HubError {
public:
    explicit InvalidKeyError(const std::string& what) : HubError(what) {}
};

// Write attempted on a hub configured without a key (read-only hub).
class NoKeyError : public HubError {
public:
    explicit NoKeyError(const std::string& what) : HubError(what) {}
};

// No correlated response after the retry.
class CommandTimeoutError : public HubError {
public:
    explicit CommandTimeoutError(const std::string& what) : HubError(what) {}
};

// Malformed or unexpected response. Never retried.
class ProtocolError : public HubError {
public:
    explicit ProtocolError(const std::string& what) : HubError(what) {}
};

// Auxiliary (miIO) channel failure.
class RpcError : public HubError {
public:
    explicit RpcError(const std::string& what) : HubError(what) {}
};

// Static entry host could not be resolved. Logged and skipped by discovery.
class DnsResolutionError : public HubError {
public:
    explicit DnsResolutionError(const std::string& what) : HubError(what) {}
};

// Static configuration rejected before any network activity.
class ConfigError : public HubError {
public:
    explicit ConfigError(const std::string& what) : HubError(what) {}
};
