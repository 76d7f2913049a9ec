#pragma once

#include <meridian/topology/device.hpp>
#include <meridian/topology/ipv4.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace meridian::topology {

enum class LinkType : std::uint8_t {
    TEN_GIGABIT_ETHERNET,
    GIGABIT_ETHERNET,
    FAST_ETHERNET,
    SERIAL,
    LOOPBACK,
    ETHERNET
};

inline auto to_string(LinkType type) -> std::string_view {
    switch (type) {
        case LinkType::TEN_GIGABIT_ETHERNET: return "ten-gigabit-ethernet";
        case LinkType::GIGABIT_ETHERNET:     return "gigabit-ethernet";
        case LinkType::FAST_ETHERNET:        return "fast-ethernet";
        case LinkType::SERIAL:               return "serial";
        case LinkType::LOOPBACK:             return "loopback";
        case LinkType::ETHERNET:             return "ethernet";
    }
    return "ethernet";
}

inline auto parse_link_type(std::string_view text) -> std::optional<LinkType> {
    for (auto type : {LinkType::TEN_GIGABIT_ETHERNET, LinkType::GIGABIT_ETHERNET, LinkType::FAST_ETHERNET,
                      LinkType::SERIAL, LinkType::LOOPBACK, LinkType::ETHERNET}) {
        if (to_string(type) == text) {
            return type;
        }
    }
    return std::nullopt;
}

enum class SubnetRole : std::uint8_t {
    POINT_TO_POINT,   // two members on distinct devices, materialized as a Link
    SHARED_SEGMENT,   // three or more members
    ORPHAN,           // single member
    ANOMALY           // two members on the same device
};

inline auto to_string(SubnetRole role) -> std::string_view {
    switch (role) {
        case SubnetRole::POINT_TO_POINT: return "point-to-point";
        case SubnetRole::SHARED_SEGMENT: return "shared-segment";
        case SubnetRole::ORPHAN:         return "orphan";
        case SubnetRole::ANOMALY:        return "anomaly";
    }
    return "orphan";
}

inline auto parse_subnet_role(std::string_view text) -> std::optional<SubnetRole> {
    for (auto role : {SubnetRole::POINT_TO_POINT, SubnetRole::SHARED_SEGMENT, SubnetRole::ORPHAN, SubnetRole::ANOMALY}) {
        if (to_string(role) == text) {
            return role;
        }
    }
    return std::nullopt;
}

enum class OrphanReason : std::uint8_t {
    NO_PEER,         // alone in its subnet
    SAME_DEVICE,     // shares a two-member subnet with another interface of its own device
    DUPLICATE_IP     // address already claimed by an earlier interface
};

inline auto to_string(OrphanReason reason) -> std::string_view {
    switch (reason) {
        case OrphanReason::NO_PEER:      return "no-peer";
        case OrphanReason::SAME_DEVICE:  return "same-device";
        case OrphanReason::DUPLICATE_IP: return "duplicate-ip";
    }
    return "no-peer";
}

inline auto parse_orphan_reason(std::string_view text) -> std::optional<OrphanReason> {
    for (auto reason : {OrphanReason::NO_PEER, OrphanReason::SAME_DEVICE, OrphanReason::DUPLICATE_IP}) {
        if (to_string(reason) == text) {
            return reason;
        }
    }
    return std::nullopt;
}

// Point-to-point connection; endpoint_a always orders before endpoint_b
class Link {
public:
    Link(InterfaceRef a, InterfaceRef b, SubnetKey subnet, std::uint64_t bandwidth_mbps,
         std::chrono::microseconds latency, double reliability, LinkType type)
        : _endpoint_a(std::move(a))
        , _endpoint_b(std::move(b))
        , _subnet(subnet)
        , _bandwidth_mbps(bandwidth_mbps)
        , _latency(latency)
        , _reliability(reliability)
        , _type(type)
    {
        if (_endpoint_b < _endpoint_a) {
            std::swap(_endpoint_a, _endpoint_b);
        }
    }

    static auto make_id(const InterfaceRef& a, const InterfaceRef& b) -> std::string {
        return a < b ? a.to_string() + "<->" + b.to_string() : b.to_string() + "<->" + a.to_string();
    }

    auto id() const -> std::string { return make_id(_endpoint_a, _endpoint_b); }
    auto endpoint_a() const -> const InterfaceRef& { return _endpoint_a; }
    auto endpoint_b() const -> const InterfaceRef& { return _endpoint_b; }
    auto subnet() const -> SubnetKey { return _subnet; }
    auto bandwidth_mbps() const -> std::uint64_t { return _bandwidth_mbps; }
    auto latency() const -> std::chrono::microseconds { return _latency; }
    auto reliability() const -> double { return _reliability; }
    auto type() const -> LinkType { return _type; }

    auto has_endpoint(const InterfaceRef& ref) const -> bool {
        return _endpoint_a == ref || _endpoint_b == ref;
    }

    auto other_endpoint(const InterfaceRef& ref) const -> std::optional<InterfaceRef> {
        if (_endpoint_a == ref) return _endpoint_b;
        if (_endpoint_b == ref) return _endpoint_a;
        return std::nullopt;
    }

    auto connects(std::string_view device_a, std::string_view device_b) const -> bool {
        return (_endpoint_a.device == device_a && _endpoint_b.device == device_b)
            || (_endpoint_a.device == device_b && _endpoint_b.device == device_a);
    }

private:
    InterfaceRef _endpoint_a;
    InterfaceRef _endpoint_b;
    SubnetKey _subnet;
    std::uint64_t _bandwidth_mbps;
    std::chrono::microseconds _latency;
    double _reliability;
    LinkType _type;
};

// Broadcast domain with three or more members, kept as one entity
class SharedSegment {
public:
    SharedSegment(SubnetKey subnet, std::vector<InterfaceRef> members,
                  std::uint64_t bandwidth_mbps, std::chrono::microseconds latency)
        : _subnet(subnet)
        , _members(std::move(members))
        , _bandwidth_mbps(bandwidth_mbps)
        , _latency(latency)
    {}

    auto id() const -> std::string { return _subnet.to_string(); }
    auto subnet() const -> SubnetKey { return _subnet; }
    auto members() const -> const std::vector<InterfaceRef>& { return _members; }
    auto bandwidth_mbps() const -> std::uint64_t { return _bandwidth_mbps; }
    auto latency() const -> std::chrono::microseconds { return _latency; }

    auto has_member(const InterfaceRef& ref) const -> bool {
        return std::find(_members.begin(), _members.end(), ref) != _members.end();
    }

private:
    SubnetKey _subnet;
    std::vector<InterfaceRef> _members;
    std::uint64_t _bandwidth_mbps;
    std::chrono::microseconds _latency;
};

// Generation-time grouping, retained for lookup only
struct Subnet {
    SubnetKey key;
    std::vector<InterfaceRef> members;
    SubnetRole role = SubnetRole::ORPHAN;
};

struct OrphanInterface {
    InterfaceRef interface;
    std::optional<SubnetKey> subnet;
    OrphanReason reason = OrphanReason::NO_PEER;
    std::optional<InterfaceRef> conflicts_with;

    auto is_conflict() const -> bool { return reason != OrphanReason::NO_PEER; }
};

} // namespace meridian::topology
