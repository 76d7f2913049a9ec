#pragma once

#include <meridian/exceptions.hpp>
#include <meridian/state_machines.hpp>
#include <meridian/topology/device.hpp>
#include <meridian/topology/types.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <queue>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace meridian::topology {

struct BandwidthDistribution {
    std::size_t low = 0;      // < 100 Mbps
    std::size_t medium = 0;   // < 1 Gbps
    std::size_t high = 0;     // < 10 Gbps
    std::size_t ultra = 0;    // >= 10 Gbps
};

struct TopologyAnalysis {
    std::size_t total_devices = 0;
    std::size_t total_links = 0;
    std::size_t total_segments = 0;
    std::size_t total_subnets = 0;
    std::size_t total_vlans = 0;
    std::size_t routing_domains = 0;
    std::size_t connected_components = 0;
    std::vector<std::string> isolated_devices;
    std::vector<std::string> articulation_points;
    std::uint64_t total_bandwidth_mbps = 0;
    double average_bandwidth_mbps = 0.0;
    BandwidthDistribution bandwidth_distribution;
    std::size_t low_bandwidth_links = 0;
    bool multiple_routing_protocols = false;
};

/**
 * @brief Inferred network graph.
 *
 * Owns devices (and through them interfaces), links, shared segments, the
 * subnet index and the orphan list. Links and segments refer to interfaces by
 * InterfaceRef only. The entity sets are fixed at construction; afterwards
 * only interface state changes.
 *
 * Not synchronized: the simulation engine guards the instance it owns.
 */
class Topology {
public:
    Topology() = default;

    /**
     * @throws TopologyInferenceError if a link or segment member does not
     *         resolve, a link joins a device to itself, or an interface takes
     *         part in more than one grouping
     */
    Topology(std::map<std::string, Device> devices,
             std::vector<Link> links,
             std::vector<SharedSegment> segments,
             std::map<SubnetKey, Subnet> subnets,
             std::vector<OrphanInterface> orphans)
        : _devices(std::move(devices))
        , _links(std::move(links))
        , _segments(std::move(segments))
        , _subnets(std::move(subnets))
        , _orphans(std::move(orphans))
    {
        build_indices();
    }

    // Entity sets
    auto devices() const -> const std::map<std::string, Device>& { return _devices; }
    auto links() const -> const std::vector<Link>& { return _links; }
    auto shared_segments() const -> const std::vector<SharedSegment>& { return _segments; }
    auto subnets() const -> const std::map<SubnetKey, Subnet>& { return _subnets; }
    auto orphans() const -> const std::vector<OrphanInterface>& { return _orphans; }
    auto vlans() const -> const std::map<std::uint16_t, std::vector<InterfaceRef>>& { return _vlans; }
    auto routing_domains() const -> const std::map<std::string, std::vector<std::string>>& { return _routing_domains; }

    auto interface_count() const -> std::size_t {
        std::size_t count = 0;
        for (const auto& [hostname, device] : _devices) {
            count += device.interfaces().size();
        }
        return count;
    }

    // Lookups
    auto has_device(std::string_view hostname) const -> bool {
        return _devices.find(std::string(hostname)) != _devices.end();
    }

    auto find_device(std::string_view hostname) const -> const Device* {
        auto it = _devices.find(std::string(hostname));
        return it == _devices.end() ? nullptr : &it->second;
    }

    auto find_device(std::string_view hostname) -> Device* {
        auto it = _devices.find(std::string(hostname));
        return it == _devices.end() ? nullptr : &it->second;
    }

    auto find_interface(const InterfaceRef& ref) const -> const Interface* {
        auto* device = find_device(ref.device);
        return device ? device->find_interface(ref.interface) : nullptr;
    }

    auto find_interface(const InterfaceRef& ref) -> Interface* {
        auto* device = find_device(ref.device);
        return device ? device->find_interface(ref.interface) : nullptr;
    }

    auto find_link(std::string_view id) const -> const Link* {
        auto it = _link_index.find(std::string(id));
        return it == _link_index.end() ? nullptr : &_links[it->second];
    }

    auto find_segment(std::string_view id) const -> const SharedSegment* {
        auto it = std::find_if(_segments.begin(), _segments.end(),
                               [&](const SharedSegment& segment) { return segment.id() == id; });
        return it == _segments.end() ? nullptr : &*it;
    }

    auto find_subnet(const SubnetKey& key) const -> const Subnet* {
        auto it = _subnets.find(key);
        return it == _subnets.end() ? nullptr : &it->second;
    }

    auto links_between(std::string_view device_a, std::string_view device_b) const -> std::vector<const Link*> {
        std::vector<const Link*> result;
        for (const auto& link : _links) {
            if (link.connects(device_a, device_b)) {
                result.push_back(&link);
            }
        }
        return result;
    }

    auto link_for_interface(const InterfaceRef& ref) const -> const Link* {
        auto it = _attachments.find(ref);
        if (it == _attachments.end() || !it->second.is_link) {
            return nullptr;
        }
        return &_links[it->second.index];
    }

    auto segment_for_interface(const InterfaceRef& ref) const -> const SharedSegment* {
        auto it = _attachments.find(ref);
        if (it == _attachments.end() || it->second.is_link) {
            return nullptr;
        }
        return &_segments[it->second.index];
    }

    // Interfaces directly reachable from ref over its link or segment
    auto peers_of(const InterfaceRef& ref) const -> const std::vector<InterfaceRef>& {
        static const std::vector<InterfaceRef> none;
        auto it = _peers.find(ref);
        return it == _peers.end() ? none : it->second;
    }

    auto interface_state(const InterfaceRef& ref) const -> InterfaceState {
        auto* intf = find_interface(ref);
        if (!intf) {
            throw NotFoundError("interface", ref.to_string());
        }
        return intf->state();
    }

    auto link_state(const Link& link) const -> LinkState {
        return meridian::link_state(interface_state(link.endpoint_a()), interface_state(link.endpoint_b()));
    }

    // Adjacent devices, sorted, without duplicates
    auto neighbors(std::string_view hostname) const -> std::vector<std::string> {
        auto it = _adjacency.find(std::string(hostname));
        if (it == _adjacency.end()) {
            return {};
        }
        return {it->second.begin(), it->second.end()};
    }

    // Breadth-first search over the device adjacency; empty when unreachable
    auto shortest_path(const std::string& from, const std::string& to) const -> std::vector<std::string> {
        if (!has_device(from) || !has_device(to)) {
            return {};
        }
        if (from == to) {
            return {from};
        }

        std::queue<std::string> queue;
        std::map<std::string, std::string> parent;

        queue.push(from);
        parent[from] = from;

        while (!queue.empty()) {
            auto current = queue.front();
            queue.pop();

            if (current == to) {
                std::vector<std::string> path;
                auto node = to;
                while (node != from) {
                    path.push_back(node);
                    node = parent[node];
                }
                path.push_back(from);
                std::reverse(path.begin(), path.end());
                return path;
            }

            auto adjacent = _adjacency.find(current);
            if (adjacent == _adjacency.end()) {
                continue;
            }
            for (const auto& neighbor : adjacent->second) {
                if (parent.find(neighbor) == parent.end()) {
                    parent[neighbor] = current;
                    queue.push(neighbor);
                }
            }
        }

        return {};
    }

    auto analyze(std::uint64_t low_bandwidth_threshold_mbps = 100) const -> TopologyAnalysis {
        TopologyAnalysis analysis;
        analysis.total_devices = _devices.size();
        analysis.total_links = _links.size();
        analysis.total_segments = _segments.size();
        analysis.total_subnets = _subnets.size();
        analysis.total_vlans = _vlans.size();
        analysis.routing_domains = _routing_domains.size();

        for (const auto& link : _links) {
            analysis.total_bandwidth_mbps += link.bandwidth_mbps();

            auto bandwidth = link.bandwidth_mbps();
            if (bandwidth < 100) {
                ++analysis.bandwidth_distribution.low;
            } else if (bandwidth < 1000) {
                ++analysis.bandwidth_distribution.medium;
            } else if (bandwidth < 10000) {
                ++analysis.bandwidth_distribution.high;
            } else {
                ++analysis.bandwidth_distribution.ultra;
            }

            if (bandwidth < low_bandwidth_threshold_mbps) {
                ++analysis.low_bandwidth_links;
            }
        }
        if (!_links.empty()) {
            analysis.average_bandwidth_mbps =
                static_cast<double>(analysis.total_bandwidth_mbps) / static_cast<double>(_links.size());
        }

        for (const auto& [hostname, device] : _devices) {
            auto it = _adjacency.find(hostname);
            if (it == _adjacency.end() || it->second.empty()) {
                analysis.isolated_devices.push_back(hostname);
            }
        }

        analysis.connected_components = count_components();
        analysis.articulation_points = find_articulation_points();

        std::size_t dynamic_protocols = 0;
        for (const auto& [protocol, members] : _routing_domains) {
            if (protocol != "static") {
                ++dynamic_protocols;
            }
        }
        analysis.multiple_routing_protocols = dynamic_protocols > 1;

        return analysis;
    }

private:
    struct Attachment {
        bool is_link;
        std::size_t index;
    };

    std::map<std::string, Device> _devices;
    std::vector<Link> _links;
    std::vector<SharedSegment> _segments;
    std::map<SubnetKey, Subnet> _subnets;
    std::vector<OrphanInterface> _orphans;

    std::map<std::string, std::size_t> _link_index;
    std::map<InterfaceRef, Attachment> _attachments;
    std::map<InterfaceRef, std::vector<InterfaceRef>> _peers;
    std::map<std::string, std::set<std::string>> _adjacency;
    std::map<std::uint16_t, std::vector<InterfaceRef>> _vlans;
    std::map<std::string, std::vector<std::string>> _routing_domains;

    auto require_interface(const InterfaceRef& ref, std::string_view owner) const -> void {
        if (!find_interface(ref)) {
            throw TopologyInferenceError(std::string(owner) + " references unknown interface " + ref.to_string());
        }
    }

    auto attach(const InterfaceRef& ref, Attachment attachment, std::string_view owner) -> void {
        require_interface(ref, owner);
        if (!_attachments.emplace(ref, attachment).second) {
            throw TopologyInferenceError("interface " + ref.to_string() + " is attached to more than one link or segment");
        }
    }

    auto build_indices() -> void {
        for (const auto& [hostname, device] : _devices) {
            if (hostname != device.hostname()) {
                throw TopologyInferenceError("device keyed '" + hostname + "' reports hostname '" + device.hostname() + "'");
            }
            _adjacency[hostname];
        }

        for (std::size_t i = 0; i < _links.size(); ++i) {
            const auto& link = _links[i];
            auto id = link.id();
            if (link.endpoint_a().device == link.endpoint_b().device) {
                throw TopologyInferenceError("link " + id + " connects a device to itself");
            }
            attach(link.endpoint_a(), Attachment{true, i}, "link " + id);
            attach(link.endpoint_b(), Attachment{true, i}, "link " + id);
            _link_index[id] = i;

            _peers[link.endpoint_a()].push_back(link.endpoint_b());
            _peers[link.endpoint_b()].push_back(link.endpoint_a());
            _adjacency[link.endpoint_a().device].insert(link.endpoint_b().device);
            _adjacency[link.endpoint_b().device].insert(link.endpoint_a().device);
        }

        for (std::size_t i = 0; i < _segments.size(); ++i) {
            const auto& segment = _segments[i];
            if (segment.members().size() < 3) {
                throw TopologyInferenceError("segment " + segment.id() + " has fewer than three members");
            }
            for (const auto& member : segment.members()) {
                attach(member, Attachment{false, i}, "segment " + segment.id());
            }
            for (const auto& member : segment.members()) {
                for (const auto& other : segment.members()) {
                    if (other == member) {
                        continue;
                    }
                    _peers[member].push_back(other);
                    if (other.device != member.device) {
                        _adjacency[member.device].insert(other.device);
                    }
                }
            }
        }

        std::set<InterfaceRef> grouped;
        for (const auto& [key, subnet] : _subnets) {
            if (subnet.key != key) {
                throw TopologyInferenceError("subnet indexed as " + key.to_string() + " carries key " + subnet.key.to_string());
            }
            for (const auto& member : subnet.members) {
                require_interface(member, "subnet " + key.to_string());
                if (!grouped.insert(member).second) {
                    throw TopologyInferenceError("interface " + member.to_string() + " belongs to more than one subnet");
                }
            }
        }

        for (const auto& orphan : _orphans) {
            require_interface(orphan.interface, "orphan list");
        }

        for (const auto& [hostname, device] : _devices) {
            for (const auto& intf : device.interfaces()) {
                if (intf.vlan()) {
                    _vlans[*intf.vlan()].push_back(intf.ref());
                }
            }
            for (const auto& protocol : device.routing_protocols()) {
                _routing_domains[protocol].push_back(hostname);
            }
            if (device.default_gateway()) {
                _routing_domains["static"].push_back(hostname);
            }
        }
    }

    auto count_components() const -> std::size_t {
        std::set<std::string> visited;
        std::size_t components = 0;

        for (const auto& [hostname, device] : _devices) {
            if (visited.count(hostname)) {
                continue;
            }
            ++components;

            std::queue<std::string> queue;
            queue.push(hostname);
            visited.insert(hostname);
            while (!queue.empty()) {
                auto current = queue.front();
                queue.pop();
                for (const auto& neighbor : _adjacency.at(current)) {
                    if (visited.insert(neighbor).second) {
                        queue.push(neighbor);
                    }
                }
            }
        }

        return components;
    }

    // Tarjan's low-link algorithm over the undirected device graph
    auto find_articulation_points() const -> std::vector<std::string> {
        std::map<std::string, std::size_t> discovery;
        std::map<std::string, std::size_t> low;
        std::set<std::string> points;
        std::size_t timer = 0;

        std::function<void(const std::string&, const std::string*)> visit =
            [&](const std::string& node, const std::string* parent) {
                discovery[node] = low[node] = ++timer;
                std::size_t children = 0;

                for (const auto& neighbor : _adjacency.at(node)) {
                    if (parent && neighbor == *parent) {
                        continue;
                    }
                    auto seen = discovery.find(neighbor);
                    if (seen != discovery.end()) {
                        low[node] = std::min(low[node], seen->second);
                        continue;
                    }

                    ++children;
                    visit(neighbor, &node);
                    low[node] = std::min(low[node], low[neighbor]);

                    if (parent && low[neighbor] >= discovery[node]) {
                        points.insert(node);
                    }
                }

                if (!parent && children > 1) {
                    points.insert(node);
                }
            };

        for (const auto& [hostname, device] : _devices) {
            if (discovery.find(hostname) == discovery.end()) {
                visit(hostname, nullptr);
            }
        }

        return {points.begin(), points.end()};
    }
};

} // namespace meridian::topology
