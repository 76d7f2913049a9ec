#pragma once

#include <meridian/topology/device.hpp>

#include <cstdint>
#include <set>
#include <string>
#include <vector>

// Device-record builders shared by the test executables
namespace meridian::test {

inline auto make_interface(std::string name, std::string ip, std::string mask, std::uint64_t bandwidth_mbps = 1000)
    -> topology::InterfaceConfig {
    topology::InterfaceConfig config;
    config.name = std::move(name);
    config.ip_address = std::move(ip);
    config.subnet_mask = std::move(mask);
    config.bandwidth_mbps = bandwidth_mbps;
    return config;
}

inline auto make_device(std::string hostname, std::vector<topology::InterfaceConfig> interfaces,
                        std::set<std::string> protocols = {}) -> topology::DeviceConfig {
    topology::DeviceConfig config;
    config.hostname = std::move(hostname);
    config.interfaces = std::move(interfaces);
    config.routing_protocols = std::move(protocols);
    return config;
}

// R1, R2 and R3, each pair on its own /30
inline auto triangle(std::set<std::string> protocols = {"ospf"}) -> topology::DeviceConfigMap {
    return {
        {"R1", make_device("R1", {
            make_interface("GigabitEthernet0/0", "10.0.12.1", "255.255.255.252"),
            make_interface("GigabitEthernet0/1", "10.0.13.1", "255.255.255.252")}, protocols)},
        {"R2", make_device("R2", {
            make_interface("GigabitEthernet0/0", "10.0.12.2", "255.255.255.252"),
            make_interface("FastEthernet0/1", "10.0.23.1", "255.255.255.252", 100)}, protocols)},
        {"R3", make_device("R3", {
            make_interface("GigabitEthernet0/1", "10.0.13.2", "255.255.255.252"),
            make_interface("FastEthernet0/1", "10.0.23.2", "255.255.255.252", 100)}, protocols)}
    };
}

// R1 and R2 on a single /30
inline auto router_pair(std::set<std::string> protocols = {"ospf"}) -> topology::DeviceConfigMap {
    return {
        {"R1", make_device("R1", {make_interface("GigabitEthernet0/0", "10.0.12.1", "255.255.255.252")}, protocols)},
        {"R2", make_device("R2", {make_interface("GigabitEthernet0/0", "10.0.12.2", "255.255.255.252")}, protocols)}
    };
}

// n routers R0..R(n-1) chained by /30 links: R0 - R1 - ... - R(n-1)
inline auto router_chain(std::size_t n, std::set<std::string> protocols = {}) -> topology::DeviceConfigMap {
    topology::DeviceConfigMap configs;
    for (std::size_t i = 0; i < n; ++i) {
        auto hostname = "R" + std::to_string(i);
        std::vector<topology::InterfaceConfig> interfaces;
        if (i > 0) {
            interfaces.push_back(make_interface("GigabitEthernet0/0",
                "10.1." + std::to_string(i - 1) + ".2", "/30"));
        }
        if (i + 1 < n) {
            interfaces.push_back(make_interface("GigabitEthernet0/1",
                "10.1." + std::to_string(i) + ".1", "/30"));
        }
        configs.emplace(hostname, make_device(hostname, std::move(interfaces), protocols));
    }
    return configs;
}

// Three routers plus a switch-facing LAN with all three on 192.168.0.0/24
inline auto shared_lan() -> topology::DeviceConfigMap {
    return {
        {"R1", make_device("R1", {make_interface("GigabitEthernet0/2", "192.168.0.1", "255.255.255.0")}, {"ospf"})},
        {"R2", make_device("R2", {make_interface("GigabitEthernet0/2", "192.168.0.2", "255.255.255.0")}, {"ospf"})},
        {"R3", make_device("R3", {make_interface("FastEthernet0/2", "192.168.0.3", "255.255.255.0", 100)}, {"ospf"})}
    };
}

} // namespace meridian::test
