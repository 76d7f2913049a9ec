#pragma once

#include <meridian/state_machines.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace meridian::simulation {

// Virtual time since simulation start
using virtual_time = std::chrono::milliseconds;
using virtual_duration = std::chrono::milliseconds;

enum class RunMode : std::uint8_t {
    STOPPED,
    RUNNING,
    PAUSED
};

inline auto to_string(RunMode mode) -> std::string_view {
    switch (mode) {
        case RunMode::STOPPED: return "stopped";
        case RunMode::RUNNING: return "running";
        case RunMode::PAUSED:  return "paused";
    }
    return "unknown";
}

// ============================================================================
// Events
// ============================================================================

enum class EventKind : std::uint8_t {
    ARP_REQUEST,
    ARP_REPLY,
    HELLO,
    NEIGHBOR_INIT,
    NEIGHBOR_FULL,
    FAULT_INJECTED,
    FAULT_CLEARED
};

inline auto to_string(EventKind kind) -> std::string_view {
    switch (kind) {
        case EventKind::ARP_REQUEST:    return "arp-request";
        case EventKind::ARP_REPLY:      return "arp-reply";
        case EventKind::HELLO:          return "hello";
        case EventKind::NEIGHBOR_INIT:  return "neighbor-init";
        case EventKind::NEIGHBOR_FULL:  return "neighbor-full";
        case EventKind::FAULT_INJECTED: return "fault-injected";
        case EventKind::FAULT_CLEARED:  return "fault-cleared";
    }
    return "unknown";
}

inline auto parse_event_kind(std::string_view text) -> std::optional<EventKind> {
    for (auto kind : {EventKind::ARP_REQUEST, EventKind::ARP_REPLY, EventKind::HELLO, EventKind::NEIGHBOR_INIT,
                      EventKind::NEIGHBOR_FULL, EventKind::FAULT_INJECTED, EventKind::FAULT_CLEARED}) {
        if (to_string(kind) == text) {
            return kind;
        }
    }
    return std::nullopt;
}

/**
 * @brief One dated entry of the append-only simulation log.
 *
 * The sequence number is assigned when the event is appended and equals its
 * position in the log. Hello events carry their protocol in the payload and
 * report a kind name such as "ospf-hello".
 */
class SimulationEvent {
public:
    SimulationEvent(virtual_time timestamp, EventKind kind, std::string device, std::string description = {})
        : _sequence(0)
        , _timestamp(timestamp)
        , _kind(kind)
        , _device(std::move(device))
        , _description(std::move(description))
    {}

    auto sequence() const -> std::uint64_t { return _sequence; }
    auto timestamp() const -> virtual_time { return _timestamp; }
    auto kind() const -> EventKind { return _kind; }
    auto device() const -> const std::string& { return _device; }
    auto interface() const -> const std::optional<std::string>& { return _interface; }
    auto link() const -> const std::optional<std::string>& { return _link; }
    auto peer() const -> const std::optional<std::string>& { return _peer; }
    auto payload() const -> const std::map<std::string, std::string>& { return _payload; }
    auto description() const -> const std::string& { return _description; }

    auto kind_name() const -> std::string {
        if (_kind == EventKind::HELLO) {
            auto it = _payload.find("protocol");
            if (it != _payload.end()) {
                return it->second + "-hello";
            }
        }
        return std::string(to_string(_kind));
    }

    auto payload_value(const std::string& key) const -> std::optional<std::string> {
        auto it = _payload.find(key);
        if (it == _payload.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    auto set_sequence(std::uint64_t sequence) -> void { _sequence = sequence; }
    auto set_interface(std::string interface) -> SimulationEvent& { _interface = std::move(interface); return *this; }
    auto set_link(std::string link) -> SimulationEvent& { _link = std::move(link); return *this; }
    auto set_peer(std::string peer) -> SimulationEvent& { _peer = std::move(peer); return *this; }
    auto add_payload(std::string key, std::string value) -> SimulationEvent& {
        _payload[std::move(key)] = std::move(value);
        return *this;
    }

private:
    std::uint64_t _sequence;
    virtual_time _timestamp;
    EventKind _kind;
    std::string _device;
    std::optional<std::string> _interface;
    std::optional<std::string> _link;
    std::optional<std::string> _peer;
    std::map<std::string, std::string> _payload;
    std::string _description;
};

// ============================================================================
// Faults
// ============================================================================

enum class FaultKind : std::uint8_t {
    INTERFACE_DOWN,
    LINK_FAILURE,
    DEVICE_FAILURE
};

inline auto to_string(FaultKind kind) -> std::string_view {
    switch (kind) {
        case FaultKind::INTERFACE_DOWN: return "interface-down";
        case FaultKind::LINK_FAILURE:   return "link-failure";
        case FaultKind::DEVICE_FAILURE: return "device-failure";
    }
    return "unknown";
}

inline auto parse_fault_kind(std::string_view text) -> std::optional<FaultKind> {
    if (text == "interface-down") return FaultKind::INTERFACE_DOWN;
    if (text == "link-failure") return FaultKind::LINK_FAILURE;
    if (text == "device-failure") return FaultKind::DEVICE_FAILURE;
    return std::nullopt;
}

enum class FaultStatus : std::uint8_t {
    ACTIVE,
    CLEARED
};

inline auto to_string(FaultStatus status) -> std::string_view {
    return status == FaultStatus::ACTIVE ? "active" : "cleared";
}

using fault_id = std::uint64_t;

struct Fault {
    fault_id _id;
    FaultKind _kind;
    std::string _target;
    std::vector<std::string> _affected_interfaces;
    virtual_time _injected_at;
    std::optional<virtual_duration> _duration;
    FaultStatus _status{FaultStatus::ACTIVE};
    std::optional<virtual_time> _cleared_at;

    auto id() const -> fault_id { return _id; }
    auto kind() const -> FaultKind { return _kind; }
    auto target() const -> const std::string& { return _target; }
    auto affected_interfaces() const -> const std::vector<std::string>& { return _affected_interfaces; }
    auto injected_at() const -> virtual_time { return _injected_at; }
    auto duration() const -> std::optional<virtual_duration> { return _duration; }
    auto status() const -> FaultStatus { return _status; }
    auto cleared_at() const -> std::optional<virtual_time> { return _cleared_at; }
    auto is_active() const -> bool { return _status == FaultStatus::ACTIVE; }

    // Scheduled automatic recovery time, if any
    auto recovers_at() const -> std::optional<virtual_time> {
        if (!_duration) {
            return std::nullopt;
        }
        return _injected_at + *_duration;
    }
};

// ============================================================================
// Scheduler handles
// ============================================================================

struct ScheduleToken {
    std::uint64_t _id{0};

    auto id() const -> std::uint64_t { return _id; }
    auto operator<=>(const ScheduleToken&) const = default;
};

// ============================================================================
// Protocol tables
// ============================================================================

struct NeighborEntry {
    std::string protocol;
    std::string peer_device;
    std::string local_interface;
    std::string peer_interface;
    NeighborState state = NeighborState::INIT;
    std::size_t hellos_received = 0;
    virtual_time last_hello{0};
};

struct ArpEntry {
    std::string ip_address;
    std::string mac_address;
    std::string interface;    // local interface the address was learned on
    virtual_time learned_at{0};
};

// ============================================================================
// Status and queries
// ============================================================================

struct SimulationStatistics {
    std::map<std::string, std::size_t> events_by_kind;
    std::size_t total_events = 0;
    std::size_t active_faults = 0;
    std::size_t total_faults = 0;
    std::size_t dispatched_callbacks = 0;
    std::size_t links_active = 0;
    std::size_t links_failed = 0;
    std::size_t interfaces_down = 0;
    std::vector<std::string> devices_down;
};

struct DeviceStatus {
    std::string hostname;
    std::size_t interfaces_up = 0;
    std::size_t interfaces_down = 0;
    std::vector<NeighborEntry> neighbors;
    std::vector<ArpEntry> arp_table;
};

struct SimulationStatus {
    RunMode mode = RunMode::STOPPED;
    virtual_time clock{0};
    std::size_t pending_callbacks = 0;
    std::vector<std::string> scenarios_started;
    SimulationStatistics statistics;
    std::map<std::string, DeviceStatus> devices;
};

struct EventQuery {
    // Matches the kind name, e.g. "neighbor-full" or "ospf-hello"
    std::optional<std::string> kind;
    std::optional<std::string> device;
    // Keep only the most recent matches
    std::optional<std::size_t> limit;
};

// ============================================================================
// Log export
// ============================================================================

struct EventExport {
    std::uint64_t sequence = 0;
    std::int64_t timestamp_ms = 0;
    std::string kind;
    std::string device;
    std::optional<std::string> interface;
    std::optional<std::string> link;
    std::optional<std::string> peer;
    std::map<std::string, std::string> payload;
    std::string description;
};

struct FaultExport {
    fault_id id = 0;
    std::string kind;
    std::string target;
    std::vector<std::string> affected_interfaces;
    std::int64_t injected_at_ms = 0;
    std::optional<std::int64_t> duration_ms;
    std::string status;
    std::optional<std::int64_t> cleared_at_ms;
};

struct SimulationLogExport {
    std::int64_t start_time_unix_ms = 0;
    std::int64_t clock_ms = 0;
    std::string mode;
    std::size_t total_events = 0;
    std::size_t total_faults = 0;
    std::vector<EventExport> events;
    std::vector<FaultExport> faults;
    SimulationStatistics statistics;
};

} // namespace meridian::simulation
