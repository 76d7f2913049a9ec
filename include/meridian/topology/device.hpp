#pragma once

#include <meridian/exceptions.hpp>
#include <meridian/state_machines.hpp>
#include <meridian/topology/ipv4.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <compare>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace meridian::topology {

// ============================================================================
// Parser output (input to generation)
// ============================================================================

struct InterfaceConfig {
    std::string name;
    std::string ip_address;     // empty together with subnet_mask for unaddressed ports
    std::string subnet_mask;
    std::uint64_t bandwidth_mbps = 100;
    std::uint32_t mtu = 1500;
    std::optional<std::uint16_t> vlan;
    std::string description;
    bool shutdown = false;
    std::optional<std::string> encapsulation;

    auto operator==(const InterfaceConfig&) const -> bool = default;
};

struct DeviceConfig {
    std::string hostname;
    std::vector<InterfaceConfig> interfaces;
    std::set<std::string> routing_protocols;
    std::map<std::uint16_t, std::string> vlans;
    std::optional<std::string> default_gateway;
    // Per-protocol overrides of the engine's default hello interval
    std::map<std::string, std::chrono::milliseconds> hello_intervals;

    auto operator==(const DeviceConfig&) const -> bool = default;
};

using DeviceConfigMap = std::map<std::string, DeviceConfig>;

// ============================================================================
// Cross-references
// ============================================================================

// Non-owning reference to an interface, resolved through the Topology index
struct InterfaceRef {
    std::string device;
    std::string interface;

    auto to_string() const -> std::string { return device + ":" + interface; }

    auto operator<=>(const InterfaceRef&) const = default;
};

// "R1:GigabitEthernet0/0" -> {R1, GigabitEthernet0/0}; hostnames never contain ':'
inline auto parse_interface_ref(std::string_view text) -> std::optional<InterfaceRef> {
    auto colon = text.find(':');
    if (colon == std::string_view::npos || colon == 0 || colon + 1 == text.size()) {
        return std::nullopt;
    }
    return InterfaceRef{std::string(text.substr(0, colon)), std::string(text.substr(colon + 1))};
}

inline auto normalize_protocol(std::string_view protocol) -> std::string {
    std::string result(protocol);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// ============================================================================
// Generated entities
// ============================================================================

enum class DeviceRole : std::uint8_t {
    ROUTER,
    SWITCH,
    ENDPOINT
};

inline auto to_string(DeviceRole role) -> std::string_view {
    switch (role) {
        case DeviceRole::ROUTER:   return "router";
        case DeviceRole::SWITCH:   return "switch";
        case DeviceRole::ENDPOINT: return "endpoint";
    }
    return "unknown";
}

class Interface {
public:
    Interface(std::string device, InterfaceConfig config,
              std::optional<Ipv4Address> address, std::optional<std::uint8_t> prefix_length)
        : _device(std::move(device))
        , _config(std::move(config))
        , _address(address)
        , _prefix_length(prefix_length)
        , _state_machine(_config.shutdown)
    {}

    auto name() const -> const std::string& { return _config.name; }
    // Owning device's hostname: a lookup key, not an ownership edge
    auto device() const -> const std::string& { return _device; }
    auto ref() const -> InterfaceRef { return InterfaceRef{_device, _config.name}; }

    auto is_addressed() const -> bool { return _address.has_value(); }
    auto address() const -> std::optional<Ipv4Address> { return _address; }
    auto prefix_length() const -> std::optional<std::uint8_t> { return _prefix_length; }
    auto subnet() const -> std::optional<SubnetKey> {
        if (!_address || !_prefix_length) {
            return std::nullopt;
        }
        return SubnetKey::of(*_address, *_prefix_length);
    }

    auto bandwidth_mbps() const -> std::uint64_t { return _config.bandwidth_mbps; }
    auto mtu() const -> std::uint32_t { return _config.mtu; }
    auto vlan() const -> std::optional<std::uint16_t> { return _config.vlan; }
    auto description() const -> const std::string& { return _config.description; }
    auto config() const -> const InterfaceConfig& { return _config; }

    auto state() const -> InterfaceState { return _state_machine.state(); }
    auto state_machine() -> InterfaceStateMachine& { return _state_machine; }
    auto state_machine() const -> const InterfaceStateMachine& { return _state_machine; }

    // Synthetic MAC used by ARP discovery
    auto mac_address() const -> std::string { return "MAC_" + _device + "_" + _config.name; }

private:
    std::string _device;
    InterfaceConfig _config;
    std::optional<Ipv4Address> _address;
    std::optional<std::uint8_t> _prefix_length;
    InterfaceStateMachine _state_machine;
};

class Device {
public:
    Device(DeviceConfig config, DeviceRole role, std::vector<Interface> interfaces)
        : _config(std::move(config))
        , _role(role)
        , _interfaces(std::move(interfaces))
    {}

    auto hostname() const -> const std::string& { return _config.hostname; }
    auto role() const -> DeviceRole { return _role; }
    auto interfaces() const -> const std::vector<Interface>& { return _interfaces; }
    auto interfaces() -> std::vector<Interface>& { return _interfaces; }
    auto routing_protocols() const -> const std::set<std::string>& { return _config.routing_protocols; }
    auto vlans() const -> const std::map<std::uint16_t, std::string>& { return _config.vlans; }
    auto default_gateway() const -> const std::optional<std::string>& { return _config.default_gateway; }
    auto config() const -> const DeviceConfig& { return _config; }

    auto runs_protocol(std::string_view protocol) const -> bool {
        return _config.routing_protocols.find(std::string(protocol)) != _config.routing_protocols.end();
    }

    auto hello_interval_override(std::string_view protocol) const -> std::optional<std::chrono::milliseconds> {
        auto it = _config.hello_intervals.find(std::string(protocol));
        if (it == _config.hello_intervals.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    auto find_interface(std::string_view name) -> Interface* {
        auto it = std::find_if(_interfaces.begin(), _interfaces.end(),
                               [&](const Interface& intf) { return intf.name() == name; });
        return it == _interfaces.end() ? nullptr : &*it;
    }

    auto find_interface(std::string_view name) const -> const Interface* {
        auto it = std::find_if(_interfaces.begin(), _interfaces.end(),
                               [&](const Interface& intf) { return intf.name() == name; });
        return it == _interfaces.end() ? nullptr : &*it;
    }

private:
    DeviceConfig _config;
    DeviceRole _role;
    std::vector<Interface> _interfaces;
};

// ============================================================================
// Construction from parser records
// ============================================================================

inline auto derive_role(const DeviceConfig& config) -> DeviceRole {
    if (!config.routing_protocols.empty() || config.default_gateway.has_value()) {
        return DeviceRole::ROUTER;
    }
    auto has_vlan_port = std::any_of(config.interfaces.begin(), config.interfaces.end(),
                                     [](const InterfaceConfig& intf) { return intf.vlan.has_value(); });
    if (!config.vlans.empty() || has_vlan_port) {
        return DeviceRole::SWITCH;
    }
    return DeviceRole::ENDPOINT;
}

/**
 * @brief Builds a Device from a parser record, enforcing the parser contract.
 *
 * Protocol names are normalized to lower case. An interface carries either
 * both an address and a mask or neither.
 *
 * @throws TopologyInferenceError on malformed records
 */
inline auto make_device(const std::string& hostname, DeviceConfig config) -> Device {
    if (hostname.empty()) {
        throw TopologyInferenceError("device with empty hostname");
    }
    if (hostname.find(':') != std::string::npos) {
        throw TopologyInferenceError("hostname '" + hostname + "' contains ':'");
    }
    if (!config.hostname.empty() && config.hostname != hostname) {
        throw TopologyInferenceError("device keyed '" + hostname + "' reports hostname '" + config.hostname + "'");
    }
    config.hostname = hostname;

    std::set<std::string> protocols;
    for (const auto& protocol : config.routing_protocols) {
        protocols.insert(normalize_protocol(protocol));
    }
    config.routing_protocols = std::move(protocols);

    std::map<std::string, std::chrono::milliseconds> intervals;
    for (const auto& [protocol, interval] : config.hello_intervals) {
        if (interval.count() <= 0) {
            throw TopologyInferenceError("non-positive hello interval for " + protocol + " on " + hostname);
        }
        intervals[normalize_protocol(protocol)] = interval;
    }
    config.hello_intervals = std::move(intervals);

    std::vector<Interface> interfaces;
    interfaces.reserve(config.interfaces.size());
    std::set<std::string> seen_names;

    for (const auto& intf : config.interfaces) {
        auto where = hostname + ":" + intf.name;

        if (intf.name.empty()) {
            throw TopologyInferenceError("interface with empty name on " + hostname);
        }
        if (!seen_names.insert(intf.name).second) {
            throw TopologyInferenceError("duplicate interface name " + where);
        }
        if (intf.bandwidth_mbps == 0) {
            throw TopologyInferenceError("zero bandwidth on " + where);
        }

        if (intf.ip_address.empty() && intf.subnet_mask.empty()) {
            interfaces.emplace_back(hostname, intf, std::nullopt, std::nullopt);
            continue;
        }

        auto address = parse_ipv4(intf.ip_address);
        if (!address) {
            throw TopologyInferenceError("unparsable address '" + intf.ip_address + "' on " + where);
        }
        auto prefix = parse_subnet_mask(intf.subnet_mask);
        if (!prefix) {
            throw TopologyInferenceError("invalid subnet mask '" + intf.subnet_mask + "' on " + where);
        }

        interfaces.emplace_back(hostname, intf, address, prefix);
    }

    auto role = derive_role(config);
    return Device(std::move(config), role, std::move(interfaces));
}

} // namespace meridian::topology
