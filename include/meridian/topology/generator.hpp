#pragma once

#include <meridian/console_logger.hpp>
#include <meridian/exceptions.hpp>
#include <meridian/logger.hpp>
#include <meridian/topology/device.hpp>
#include <meridian/topology/topology.hpp>
#include <meridian/topology/types.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace meridian::topology {

// Latency model and analysis thresholds, fixed for the lifetime of a generator
struct generator_config {
    std::chrono::microseconds _propagation_floor{50};
    // Microseconds times Mbps: 100000 gives 1000 us of serialization delay at 100 Mbps
    double _serialization_factor{100'000.0};
    std::uint64_t _low_bandwidth_threshold_mbps{100};

    auto propagation_floor() const -> std::chrono::microseconds { return _propagation_floor; }
    auto serialization_factor() const -> double { return _serialization_factor; }
    auto low_bandwidth_threshold_mbps() const -> std::uint64_t { return _low_bandwidth_threshold_mbps; }
};

inline auto validate_generator_config(const generator_config& config) -> void {
    if (config._propagation_floor.count() < 0) {
        throw ConfigurationError("propagation_floor must not be negative");
    }

    if (!(config._serialization_factor > 0.0) || !std::isfinite(config._serialization_factor)) {
        throw ConfigurationError("serialization_factor must be a positive finite number");
    }

    if (config._low_bandwidth_threshold_mbps == 0) {
        throw ConfigurationError("low_bandwidth_threshold_mbps must be greater than 0");
    }
}

// Hardware family recognized from the leading letters of an interface name
struct interface_family {
    LinkType type;
    double reliability;
};

inline auto classify_interface(std::string_view name) -> interface_family {
    std::string prefix;
    for (char c : name) {
        if (!std::isalpha(static_cast<unsigned char>(c))) {
            break;
        }
        prefix.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (prefix == "tengigabitethernet" || prefix == "te") {
        return {LinkType::TEN_GIGABIT_ETHERNET, 0.9999};
    }
    if (prefix == "gigabitethernet" || prefix == "gi" || prefix == "ge") {
        return {LinkType::GIGABIT_ETHERNET, 0.9999};
    }
    if (prefix == "fastethernet" || prefix == "fa") {
        return {LinkType::FAST_ETHERNET, 0.9995};
    }
    if (prefix == "serial" || prefix == "se") {
        return {LinkType::SERIAL, 0.998};
    }
    if (prefix == "loopback" || prefix == "lo") {
        return {LinkType::LOOPBACK, 1.0};
    }
    return {LinkType::ETHERNET, 0.999};
}

/**
 * @brief Infers links, shared segments and orphans from parsed device records.
 *
 * Interfaces are visited in hostname order and, within a device, in
 * configuration order. The first interface to claim an address keeps it;
 * later claimants become duplicate-ip orphans and are left out of subnet
 * grouping. Each remaining subnet group becomes:
 *   - one member: a no-peer orphan
 *   - two members on distinct devices: a Link
 *   - two members on the same device: two same-device orphans
 *   - three or more members: a SharedSegment
 *
 * generate() is deterministic: equal inputs produce equal outputs, with links
 * ordered by id, segments and subnets by subnet key and orphans by interface.
 */
template<diagnostic_logger Logger = console_logger>
class TopologyGenerator {
public:
    explicit TopologyGenerator(Logger logger = Logger{}, generator_config config = generator_config{})
        : _logger(std::move(logger))
        , _config(config)
    {
        validate_generator_config(_config);
    }

    auto config() const -> const generator_config& { return _config; }
    auto logger() -> Logger& { return _logger; }

    // Monotonic non-increasing in bandwidth
    auto estimate_latency(std::uint64_t bandwidth_mbps) const -> std::chrono::microseconds {
        auto serialization = _config._serialization_factor / static_cast<double>(std::max<std::uint64_t>(bandwidth_mbps, 1));
        return _config._propagation_floor + std::chrono::microseconds(static_cast<std::int64_t>(std::llround(serialization)));
    }

    /**
     * @throws TopologyInferenceError if a record breaks the parser contract
     */
    auto generate(const DeviceConfigMap& configs) -> Topology {
        std::map<std::string, Device> devices;
        for (const auto& [hostname, config] : configs) {
            devices.emplace(hostname, make_device(hostname, config));
        }

        std::vector<OrphanInterface> orphans;
        std::map<Ipv4Address, InterfaceRef> claimed_addresses;
        std::map<SubnetKey, std::vector<const Interface*>> groups;

        for (const auto& [hostname, device] : devices) {
            for (const auto& intf : device.interfaces()) {
                if (!intf.is_addressed()) {
                    continue;
                }

                auto [claim, inserted] = claimed_addresses.emplace(*intf.address(), intf.ref());
                if (!inserted) {
                    orphans.push_back(OrphanInterface{intf.ref(), intf.subnet(), OrphanReason::DUPLICATE_IP, claim->second});
                    continue;
                }

                groups[*intf.subnet()].push_back(&intf);
            }
        }

        std::vector<Link> links;
        std::vector<SharedSegment> segments;
        std::map<SubnetKey, Subnet> subnets;

        for (const auto& [key, members] : groups) {
            Subnet subnet{key, {}, SubnetRole::ORPHAN};
            for (const auto* intf : members) {
                subnet.members.push_back(intf->ref());
            }

            if (members.size() == 1) {
                orphans.push_back(OrphanInterface{members[0]->ref(), key, OrphanReason::NO_PEER, std::nullopt});
            } else if (members.size() == 2 && members[0]->device() == members[1]->device()) {
                subnet.role = SubnetRole::ANOMALY;
                orphans.push_back(OrphanInterface{members[0]->ref(), key, OrphanReason::SAME_DEVICE, members[1]->ref()});
                orphans.push_back(OrphanInterface{members[1]->ref(), key, OrphanReason::SAME_DEVICE, members[0]->ref()});
            } else if (members.size() == 2) {
                subnet.role = SubnetRole::POINT_TO_POINT;
                links.push_back(make_link(key, *members[0], *members[1]));
            } else {
                subnet.role = SubnetRole::SHARED_SEGMENT;
                segments.push_back(make_segment(key, members));
            }

            subnets.emplace(key, std::move(subnet));
        }

        std::sort(links.begin(), links.end(),
                  [](const Link& a, const Link& b) { return a.id() < b.id(); });
        std::sort(orphans.begin(), orphans.end(),
                  [](const OrphanInterface& a, const OrphanInterface& b) { return a.interface < b.interface; });

        for (const auto& orphan : orphans) {
            auto ref = orphan.interface.to_string();
            auto reason = to_string(orphan.reason);
            auto peer = orphan.conflicts_with ? orphan.conflicts_with->to_string() : std::string("-");
            _logger.warning("Orphan interface", {
                {"interface", ref},
                {"reason", reason},
                {"conflicts_with", peer}
            });
        }

        Topology topology(std::move(devices), std::move(links), std::move(segments), std::move(subnets), std::move(orphans));

        auto device_count = std::to_string(topology.devices().size());
        auto link_count = std::to_string(topology.links().size());
        auto segment_count = std::to_string(topology.shared_segments().size());
        auto orphan_count = std::to_string(topology.orphans().size());
        _logger.info("Topology generated", {
            {"devices", device_count},
            {"links", link_count},
            {"segments", segment_count},
            {"orphans", orphan_count}
        });

        return topology;
    }

private:
    Logger _logger;
    generator_config _config;

    auto make_link(const SubnetKey& key, const Interface& a, const Interface& b) const -> Link {
        auto bandwidth = std::min(a.bandwidth_mbps(), b.bandwidth_mbps());
        auto family_a = classify_interface(a.name());
        auto family_b = classify_interface(b.name());
        auto type = std::min(family_a.type, family_b.type);
        return Link(a.ref(), b.ref(), key, bandwidth, estimate_latency(bandwidth),
                    family_a.reliability * family_b.reliability, type);
    }

    auto make_segment(const SubnetKey& key, const std::vector<const Interface*>& members) const -> SharedSegment {
        std::vector<InterfaceRef> refs;
        auto bandwidth = members.front()->bandwidth_mbps();
        for (const auto* intf : members) {
            refs.push_back(intf->ref());
            bandwidth = std::min(bandwidth, intf->bandwidth_mbps());
        }
        return SharedSegment(key, std::move(refs), bandwidth, estimate_latency(bandwidth));
    }
};

} // namespace meridian::topology
