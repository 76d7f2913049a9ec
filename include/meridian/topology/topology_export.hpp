#pragma once

#include <meridian/exceptions.hpp>
#include <meridian/state_machines.hpp>
#include <meridian/topology/device.hpp>
#include <meridian/topology/topology.hpp>
#include <meridian/topology/types.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace meridian::topology {

// ============================================================================
// Plain export records: no engine handles, suitable for serialization
// ============================================================================

struct InterfaceExport {
    std::string name;
    std::string ip_address;
    std::string subnet_mask;
    std::uint64_t bandwidth_mbps = 0;
    std::uint32_t mtu = 0;
    std::optional<std::uint16_t> vlan;
    std::string description;
    bool shutdown = false;
    std::optional<std::string> encapsulation;
    std::string state;    // informational; import derives state from shutdown

    auto operator==(const InterfaceExport&) const -> bool = default;
};

struct DeviceExport {
    std::string hostname;
    std::string role;
    std::vector<InterfaceExport> interfaces;
    std::vector<std::string> routing_protocols;
    std::map<std::uint16_t, std::string> vlans;
    std::optional<std::string> default_gateway;
    std::map<std::string, std::int64_t> hello_intervals_ms;

    auto operator==(const DeviceExport&) const -> bool = default;
};

struct LinkExport {
    std::string id;
    std::string endpoint_a;
    std::string endpoint_b;
    std::string subnet;
    std::uint64_t bandwidth_mbps = 0;
    std::int64_t latency_us = 0;
    double reliability = 0.0;
    std::string link_type;

    auto operator==(const LinkExport&) const -> bool = default;
};

struct SegmentExport {
    std::string id;
    std::string subnet;
    std::vector<std::string> members;
    std::uint64_t bandwidth_mbps = 0;
    std::int64_t latency_us = 0;

    auto operator==(const SegmentExport&) const -> bool = default;
};

struct SubnetExport {
    std::string key;
    std::vector<std::string> members;
    std::string role;

    auto operator==(const SubnetExport&) const -> bool = default;
};

struct OrphanExport {
    std::string interface;
    std::optional<std::string> subnet;
    std::string reason;
    std::optional<std::string> conflicts_with;

    auto operator==(const OrphanExport&) const -> bool = default;
};

struct TopologyExport {
    std::vector<DeviceExport> devices;
    std::vector<LinkExport> links;
    std::vector<SegmentExport> shared_segments;
    std::vector<SubnetExport> subnets;
    std::vector<OrphanExport> orphans;
    std::map<std::uint16_t, std::vector<std::string>> vlans;
    std::map<std::string, std::vector<std::string>> routing_domains;

    auto operator==(const TopologyExport&) const -> bool = default;
};

namespace detail {

inline auto to_strings(const std::vector<InterfaceRef>& refs) -> std::vector<std::string> {
    std::vector<std::string> result;
    result.reserve(refs.size());
    for (const auto& ref : refs) {
        result.push_back(ref.to_string());
    }
    return result;
}

inline auto require_ref(const std::string& text, std::string_view where) -> InterfaceRef {
    auto ref = parse_interface_ref(text);
    if (!ref) {
        throw TopologyInferenceError("malformed interface reference '" + text + "' in " + std::string(where));
    }
    return *ref;
}

inline auto require_refs(const std::vector<std::string>& texts, std::string_view where) -> std::vector<InterfaceRef> {
    std::vector<InterfaceRef> refs;
    refs.reserve(texts.size());
    for (const auto& text : texts) {
        refs.push_back(require_ref(text, where));
    }
    return refs;
}

inline auto require_subnet(const std::string& text, std::string_view where) -> SubnetKey {
    auto key = parse_subnet_key(text);
    if (!key) {
        throw TopologyInferenceError("malformed subnet '" + text + "' in " + std::string(where));
    }
    return *key;
}

} // namespace detail

inline auto export_topology(const Topology& topology) -> TopologyExport {
    TopologyExport result;

    for (const auto& [hostname, device] : topology.devices()) {
        DeviceExport entry;
        entry.hostname = hostname;
        entry.role = std::string(to_string(device.role()));
        entry.routing_protocols.assign(device.routing_protocols().begin(), device.routing_protocols().end());
        entry.vlans = device.vlans();
        entry.default_gateway = device.default_gateway();
        for (const auto& [protocol, interval] : device.config().hello_intervals) {
            entry.hello_intervals_ms[protocol] = interval.count();
        }

        for (const auto& intf : device.interfaces()) {
            const auto& config = intf.config();
            entry.interfaces.push_back(InterfaceExport{
                config.name,
                config.ip_address,
                config.subnet_mask,
                config.bandwidth_mbps,
                config.mtu,
                config.vlan,
                config.description,
                config.shutdown,
                config.encapsulation,
                std::string(to_string(intf.state()))
            });
        }

        result.devices.push_back(std::move(entry));
    }

    for (const auto& link : topology.links()) {
        result.links.push_back(LinkExport{
            link.id(),
            link.endpoint_a().to_string(),
            link.endpoint_b().to_string(),
            link.subnet().to_string(),
            link.bandwidth_mbps(),
            link.latency().count(),
            link.reliability(),
            std::string(to_string(link.type()))
        });
    }

    for (const auto& segment : topology.shared_segments()) {
        result.shared_segments.push_back(SegmentExport{
            segment.id(),
            segment.subnet().to_string(),
            detail::to_strings(segment.members()),
            segment.bandwidth_mbps(),
            segment.latency().count()
        });
    }

    for (const auto& [key, subnet] : topology.subnets()) {
        result.subnets.push_back(SubnetExport{
            key.to_string(),
            detail::to_strings(subnet.members),
            std::string(to_string(subnet.role))
        });
    }

    for (const auto& orphan : topology.orphans()) {
        OrphanExport entry;
        entry.interface = orphan.interface.to_string();
        if (orphan.subnet) {
            entry.subnet = orphan.subnet->to_string();
        }
        entry.reason = std::string(to_string(orphan.reason));
        if (orphan.conflicts_with) {
            entry.conflicts_with = orphan.conflicts_with->to_string();
        }
        result.orphans.push_back(std::move(entry));
    }

    for (const auto& [vlan, members] : topology.vlans()) {
        result.vlans[vlan] = detail::to_strings(members);
    }
    result.routing_domains = topology.routing_domains();

    return result;
}

/**
 * @brief Rebuilds a Topology from its export records.
 *
 * Devices go through the same construction checks as generation. Links,
 * segments and orphans are taken as recorded, so an imported topology keeps
 * the bandwidths and latencies it was exported with. Interface state is
 * reset to its configured value.
 *
 * @throws TopologyInferenceError on unresolved references or malformed values
 */
inline auto import_topology(const TopologyExport& data) -> Topology {
    std::map<std::string, Device> devices;
    for (const auto& entry : data.devices) {
        DeviceConfig config;
        config.hostname = entry.hostname;
        config.routing_protocols.insert(entry.routing_protocols.begin(), entry.routing_protocols.end());
        config.vlans = entry.vlans;
        config.default_gateway = entry.default_gateway;
        for (const auto& [protocol, interval] : entry.hello_intervals_ms) {
            config.hello_intervals[protocol] = std::chrono::milliseconds(interval);
        }
        for (const auto& intf : entry.interfaces) {
            config.interfaces.push_back(InterfaceConfig{
                intf.name,
                intf.ip_address,
                intf.subnet_mask,
                intf.bandwidth_mbps,
                intf.mtu,
                intf.vlan,
                intf.description,
                intf.shutdown,
                intf.encapsulation
            });
        }

        auto hostname = entry.hostname;
        if (!devices.emplace(hostname, make_device(hostname, std::move(config))).second) {
            throw TopologyInferenceError("duplicate device '" + hostname + "'");
        }
    }

    std::vector<Link> links;
    for (const auto& entry : data.links) {
        auto type = parse_link_type(entry.link_type);
        if (!type) {
            throw TopologyInferenceError("unknown link type '" + entry.link_type + "' on " + entry.id);
        }
        auto a = detail::require_ref(entry.endpoint_a, entry.id);
        auto b = detail::require_ref(entry.endpoint_b, entry.id);
        if (Link::make_id(a, b) != entry.id) {
            throw TopologyInferenceError("link id '" + entry.id + "' does not match its endpoints");
        }
        links.emplace_back(a, b, detail::require_subnet(entry.subnet, entry.id), entry.bandwidth_mbps,
                           std::chrono::microseconds(entry.latency_us), entry.reliability, *type);
    }

    std::vector<SharedSegment> segments;
    for (const auto& entry : data.shared_segments) {
        segments.emplace_back(detail::require_subnet(entry.subnet, entry.id),
                              detail::require_refs(entry.members, entry.id),
                              entry.bandwidth_mbps, std::chrono::microseconds(entry.latency_us));
    }

    std::map<SubnetKey, Subnet> subnets;
    for (const auto& entry : data.subnets) {
        auto role = parse_subnet_role(entry.role);
        if (!role) {
            throw TopologyInferenceError("unknown subnet role '" + entry.role + "' on " + entry.key);
        }
        auto key = detail::require_subnet(entry.key, "subnet index");
        if (!subnets.emplace(key, Subnet{key, detail::require_refs(entry.members, entry.key), *role}).second) {
            throw TopologyInferenceError("duplicate subnet " + entry.key);
        }
    }

    std::vector<OrphanInterface> orphans;
    for (const auto& entry : data.orphans) {
        auto reason = parse_orphan_reason(entry.reason);
        if (!reason) {
            throw TopologyInferenceError("unknown orphan reason '" + entry.reason + "' on " + entry.interface);
        }
        OrphanInterface orphan{detail::require_ref(entry.interface, "orphan list"), std::nullopt, *reason, std::nullopt};
        if (entry.subnet) {
            orphan.subnet = detail::require_subnet(*entry.subnet, entry.interface);
        }
        if (entry.conflicts_with) {
            orphan.conflicts_with = detail::require_ref(*entry.conflicts_with, entry.interface);
        }
        orphans.push_back(std::move(orphan));
    }

    return Topology(std::move(devices), std::move(links), std::move(segments), std::move(subnets), std::move(orphans));
}

} // namespace meridian::topology
