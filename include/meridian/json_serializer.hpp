#pragma once

#include <meridian/exceptions.hpp>
#include <meridian/simulation/types.hpp>
#include <meridian/topology/topology_export.hpp>

#include <boost/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace meridian {

// JSON encoding of the export records. Every document carries a "type" tag.
class json_serializer {
public:
    auto serialize(const topology::TopologyExport& data) const -> std::string {
        boost::json::object obj;
        obj["type"] = "topology";

        boost::json::array devices;
        for (const auto& device : data.devices) {
            devices.push_back(to_json(device));
        }
        obj["devices"] = std::move(devices);

        boost::json::array links;
        for (const auto& link : data.links) {
            boost::json::object entry;
            entry["id"] = link.id;
            entry["endpoint_a"] = link.endpoint_a;
            entry["endpoint_b"] = link.endpoint_b;
            entry["subnet"] = link.subnet;
            entry["bandwidth_mbps"] = static_cast<std::int64_t>(link.bandwidth_mbps);
            entry["latency_us"] = link.latency_us;
            entry["reliability"] = link.reliability;
            entry["link_type"] = link.link_type;
            links.push_back(std::move(entry));
        }
        obj["links"] = std::move(links);

        boost::json::array segments;
        for (const auto& segment : data.shared_segments) {
            boost::json::object entry;
            entry["id"] = segment.id;
            entry["subnet"] = segment.subnet;
            entry["members"] = to_json(segment.members);
            entry["bandwidth_mbps"] = static_cast<std::int64_t>(segment.bandwidth_mbps);
            entry["latency_us"] = segment.latency_us;
            segments.push_back(std::move(entry));
        }
        obj["shared_segments"] = std::move(segments);

        boost::json::array subnets;
        for (const auto& subnet : data.subnets) {
            boost::json::object entry;
            entry["key"] = subnet.key;
            entry["members"] = to_json(subnet.members);
            entry["role"] = subnet.role;
            subnets.push_back(std::move(entry));
        }
        obj["subnets"] = std::move(subnets);

        boost::json::array orphans;
        for (const auto& orphan : data.orphans) {
            boost::json::object entry;
            entry["interface"] = orphan.interface;
            if (orphan.subnet) {
                entry["subnet"] = *orphan.subnet;
            }
            entry["reason"] = orphan.reason;
            if (orphan.conflicts_with) {
                entry["conflicts_with"] = *orphan.conflicts_with;
            }
            orphans.push_back(std::move(entry));
        }
        obj["orphans"] = std::move(orphans);

        boost::json::object vlans;
        for (const auto& [vlan, members] : data.vlans) {
            vlans[std::to_string(vlan)] = to_json(members);
        }
        obj["vlans"] = std::move(vlans);

        boost::json::object domains;
        for (const auto& [protocol, members] : data.routing_domains) {
            domains[protocol] = to_json(members);
        }
        obj["routing_domains"] = std::move(domains);

        return boost::json::serialize(obj);
    }

    auto deserialize_topology(std::string_view text) const -> topology::TopologyExport {
        try {
            auto obj = boost::json::parse(text).as_object();
            if (obj["type"].as_string() != "topology") {
                throw SerializationError("Invalid document type for topology");
            }

            topology::TopologyExport data;

            for (const auto& value : obj.at("devices").as_array()) {
                data.devices.push_back(device_from_json(value.as_object()));
            }

            for (const auto& value : obj.at("links").as_array()) {
                const auto& entry = value.as_object();
                topology::LinkExport link;
                link.id = std::string(entry.at("id").as_string());
                link.endpoint_a = std::string(entry.at("endpoint_a").as_string());
                link.endpoint_b = std::string(entry.at("endpoint_b").as_string());
                link.subnet = std::string(entry.at("subnet").as_string());
                link.bandwidth_mbps = static_cast<std::uint64_t>(entry.at("bandwidth_mbps").as_int64());
                link.latency_us = entry.at("latency_us").as_int64();
                link.reliability = entry.at("reliability").as_double();
                link.link_type = std::string(entry.at("link_type").as_string());
                data.links.push_back(std::move(link));
            }

            for (const auto& value : obj.at("shared_segments").as_array()) {
                const auto& entry = value.as_object();
                topology::SegmentExport segment;
                segment.id = std::string(entry.at("id").as_string());
                segment.subnet = std::string(entry.at("subnet").as_string());
                segment.members = strings_from_json(entry.at("members"));
                segment.bandwidth_mbps = static_cast<std::uint64_t>(entry.at("bandwidth_mbps").as_int64());
                segment.latency_us = entry.at("latency_us").as_int64();
                data.shared_segments.push_back(std::move(segment));
            }

            for (const auto& value : obj.at("subnets").as_array()) {
                const auto& entry = value.as_object();
                data.subnets.push_back(topology::SubnetExport{
                    std::string(entry.at("key").as_string()),
                    strings_from_json(entry.at("members")),
                    std::string(entry.at("role").as_string())
                });
            }

            for (const auto& value : obj.at("orphans").as_array()) {
                const auto& entry = value.as_object();
                topology::OrphanExport orphan;
                orphan.interface = std::string(entry.at("interface").as_string());
                orphan.subnet = optional_string(entry, "subnet");
                orphan.reason = std::string(entry.at("reason").as_string());
                orphan.conflicts_with = optional_string(entry, "conflicts_with");
                data.orphans.push_back(std::move(orphan));
            }

            if (const auto* vlans = obj.if_contains("vlans")) {
                for (const auto& [key, members] : vlans->as_object()) {
                    data.vlans[parse_vlan_id(key)] = strings_from_json(members);
                }
            }

            if (const auto* domains = obj.if_contains("routing_domains")) {
                for (const auto& [protocol, members] : domains->as_object()) {
                    data.routing_domains[std::string(protocol)] = strings_from_json(members);
                }
            }

            return data;
        } catch (const SerializationError&) {
            throw;
        } catch (const std::exception& e) {
            throw SerializationError(std::string("Malformed topology document: ") + e.what());
        }
    }

    auto serialize(const simulation::SimulationLogExport& data) const -> std::string {
        boost::json::object obj;
        obj["type"] = "simulation_log";
        obj["start_time_unix_ms"] = data.start_time_unix_ms;
        obj["clock_ms"] = data.clock_ms;
        obj["mode"] = data.mode;
        obj["total_events"] = static_cast<std::int64_t>(data.total_events);
        obj["total_faults"] = static_cast<std::int64_t>(data.total_faults);

        boost::json::array events;
        for (const auto& event : data.events) {
            boost::json::object entry;
            entry["sequence"] = static_cast<std::int64_t>(event.sequence);
            entry["timestamp_ms"] = event.timestamp_ms;
            entry["kind"] = event.kind;
            entry["device"] = event.device;
            if (event.interface) {
                entry["interface"] = *event.interface;
            }
            if (event.link) {
                entry["link"] = *event.link;
            }
            if (event.peer) {
                entry["peer"] = *event.peer;
            }
            boost::json::object payload;
            for (const auto& [key, value] : event.payload) {
                payload[key] = value;
            }
            entry["payload"] = std::move(payload);
            entry["description"] = event.description;
            events.push_back(std::move(entry));
        }
        obj["events"] = std::move(events);

        boost::json::array faults;
        for (const auto& fault : data.faults) {
            boost::json::object entry;
            entry["id"] = static_cast<std::int64_t>(fault.id);
            entry["kind"] = fault.kind;
            entry["target"] = fault.target;
            entry["affected_interfaces"] = to_json(fault.affected_interfaces);
            entry["injected_at_ms"] = fault.injected_at_ms;
            if (fault.duration_ms) {
                entry["duration_ms"] = *fault.duration_ms;
            }
            entry["status"] = fault.status;
            if (fault.cleared_at_ms) {
                entry["cleared_at_ms"] = *fault.cleared_at_ms;
            }
            faults.push_back(std::move(entry));
        }
        obj["faults"] = std::move(faults);

        const auto& stats = data.statistics;
        boost::json::object statistics;
        boost::json::object by_kind;
        for (const auto& [kind, count] : stats.events_by_kind) {
            by_kind[kind] = static_cast<std::int64_t>(count);
        }
        statistics["events_by_kind"] = std::move(by_kind);
        statistics["total_events"] = static_cast<std::int64_t>(stats.total_events);
        statistics["active_faults"] = static_cast<std::int64_t>(stats.active_faults);
        statistics["total_faults"] = static_cast<std::int64_t>(stats.total_faults);
        statistics["dispatched_callbacks"] = static_cast<std::int64_t>(stats.dispatched_callbacks);
        statistics["links_active"] = static_cast<std::int64_t>(stats.links_active);
        statistics["links_failed"] = static_cast<std::int64_t>(stats.links_failed);
        statistics["interfaces_down"] = static_cast<std::int64_t>(stats.interfaces_down);
        statistics["devices_down"] = to_json(stats.devices_down);
        obj["statistics"] = std::move(statistics);

        return boost::json::serialize(obj);
    }

private:
    static auto to_json(const std::vector<std::string>& values) -> boost::json::array {
        boost::json::array result;
        for (const auto& value : values) {
            result.emplace_back(value);
        }
        return result;
    }

    static auto to_json(const topology::DeviceExport& device) -> boost::json::object {
        boost::json::object obj;
        obj["hostname"] = device.hostname;
        obj["role"] = device.role;

        boost::json::array interfaces;
        for (const auto& intf : device.interfaces) {
            boost::json::object entry;
            entry["name"] = intf.name;
            entry["ip_address"] = intf.ip_address;
            entry["subnet_mask"] = intf.subnet_mask;
            entry["bandwidth_mbps"] = static_cast<std::int64_t>(intf.bandwidth_mbps);
            entry["mtu"] = static_cast<std::int64_t>(intf.mtu);
            if (intf.vlan) {
                entry["vlan"] = static_cast<std::int64_t>(*intf.vlan);
            }
            entry["description"] = intf.description;
            entry["shutdown"] = intf.shutdown;
            if (intf.encapsulation) {
                entry["encapsulation"] = *intf.encapsulation;
            }
            entry["state"] = intf.state;
            interfaces.push_back(std::move(entry));
        }
        obj["interfaces"] = std::move(interfaces);

        obj["routing_protocols"] = to_json(device.routing_protocols);

        boost::json::object vlans;
        for (const auto& [vlan, name] : device.vlans) {
            vlans[std::to_string(vlan)] = name;
        }
        obj["vlans"] = std::move(vlans);

        if (device.default_gateway) {
            obj["default_gateway"] = *device.default_gateway;
        }

        boost::json::object intervals;
        for (const auto& [protocol, interval] : device.hello_intervals_ms) {
            intervals[protocol] = interval;
        }
        obj["hello_intervals_ms"] = std::move(intervals);

        return obj;
    }

    static auto device_from_json(const boost::json::object& obj) -> topology::DeviceExport {
        topology::DeviceExport device;
        device.hostname = std::string(obj.at("hostname").as_string());
        device.role = std::string(obj.at("role").as_string());

        for (const auto& value : obj.at("interfaces").as_array()) {
            const auto& entry = value.as_object();
            topology::InterfaceExport intf;
            intf.name = std::string(entry.at("name").as_string());
            intf.ip_address = std::string(entry.at("ip_address").as_string());
            intf.subnet_mask = std::string(entry.at("subnet_mask").as_string());
            intf.bandwidth_mbps = static_cast<std::uint64_t>(entry.at("bandwidth_mbps").as_int64());
            intf.mtu = static_cast<std::uint32_t>(entry.at("mtu").as_int64());
            if (const auto* vlan = entry.if_contains("vlan")) {
                intf.vlan = static_cast<std::uint16_t>(vlan->as_int64());
            }
            intf.description = std::string(entry.at("description").as_string());
            intf.shutdown = entry.at("shutdown").as_bool();
            intf.encapsulation = optional_string(entry, "encapsulation");
            intf.state = std::string(entry.at("state").as_string());
            device.interfaces.push_back(std::move(intf));
        }

        device.routing_protocols = strings_from_json(obj.at("routing_protocols"));

        for (const auto& [key, name] : obj.at("vlans").as_object()) {
            device.vlans[parse_vlan_id(key)] = std::string(name.as_string());
        }

        device.default_gateway = optional_string(obj, "default_gateway");

        if (const auto* intervals = obj.if_contains("hello_intervals_ms")) {
            for (const auto& [protocol, interval] : intervals->as_object()) {
                device.hello_intervals_ms[std::string(protocol)] = interval.as_int64();
            }
        }

        return device;
    }

    static auto strings_from_json(const boost::json::value& value) -> std::vector<std::string> {
        std::vector<std::string> result;
        for (const auto& item : value.as_array()) {
            result.emplace_back(item.as_string());
        }
        return result;
    }

    static auto optional_string(const boost::json::object& obj, std::string_view key) -> std::optional<std::string> {
        const auto* value = obj.if_contains(key);
        if (!value || value->is_null()) {
            return std::nullopt;
        }
        return std::string(value->as_string());
    }

    static auto parse_vlan_id(std::string_view key) -> std::uint16_t {
        auto id = std::stoul(std::string(key));
        if (id > 4095) {
            throw SerializationError("VLAN id out of range: " + std::string(key));
        }
        return static_cast<std::uint16_t>(id);
    }
};

} // namespace meridian
