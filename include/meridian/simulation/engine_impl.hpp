#pragma once

#include <meridian/simulation/engine.hpp>

#include <algorithm>
#include <exception>
#include <string>

namespace meridian::simulation {

template<simulation_types Types>
SimulationEngine<Types>::SimulationEngine(topology::Topology topology,
                                          simulation_config config,
                                          logger_type logger,
                                          metrics_type metrics)
    : _config(std::move(config))
    , _logger(std::move(logger))
    , _metrics(std::move(metrics))
    , _topology(std::move(topology))
    , _wall_start(std::chrono::system_clock::now())
    , _scheduler(
        _config.pacing_factor(),
        [this](std::vector<SimulationEvent> events) { notify_subscribers(events); },
        [this](const std::exception& e) {
            _logger.error("Scheduled callback failed", {{"error", e.what()}});
        })
{
    validate_simulation_config(_config);
}

// ============================================================================
// Run control
// ============================================================================

template<simulation_types Types>
auto SimulationEngine<Types>::start() -> void {
    std::unique_lock lock(_mutex);
    _scheduler.start();
    _wall_start = std::chrono::system_clock::now();

    auto clock = std::to_string(_scheduler.now().count());
    _logger.info("Simulation started", {{"clock_ms", clock}});
    emit_metric(metric_names::run_mode_changed, "mode", to_string(RunMode::RUNNING));
}

template<simulation_types Types>
auto SimulationEngine<Types>::pause() -> void {
    std::unique_lock lock(_mutex);
    _scheduler.pause();

    auto clock = std::to_string(_scheduler.now().count());
    _logger.info("Simulation paused", {{"clock_ms", clock}});
    emit_metric(metric_names::run_mode_changed, "mode", to_string(RunMode::PAUSED));
}

template<simulation_types Types>
auto SimulationEngine<Types>::resume() -> void {
    std::unique_lock lock(_mutex);
    _scheduler.resume();

    auto clock = std::to_string(_scheduler.now().count());
    _logger.info("Simulation resumed", {{"clock_ms", clock}});
    emit_metric(metric_names::run_mode_changed, "mode", to_string(RunMode::RUNNING));
}

template<simulation_types Types>
auto SimulationEngine<Types>::stop() -> void {
    // Joins the dispatch thread, whose callbacks take _mutex
    _scheduler.stop();

    std::unique_lock lock(_mutex);
    std::size_t active = 0;
    for (const auto& [id, record] : _faults) {
        if (record.fault.is_active()) {
            ++active;
        }
    }

    auto clock = std::to_string(_scheduler.now().count());
    auto events = std::to_string(_log.size());
    auto active_faults = std::to_string(active);
    _logger.info("Simulation stopped", {
        {"clock_ms", clock},
        {"events", events},
        {"active_faults", active_faults}
    });
    emit_metric(metric_names::run_mode_changed, "mode", to_string(RunMode::STOPPED));
}

template<simulation_types Types>
auto SimulationEngine<Types>::pause_at(virtual_time t) -> folly::SemiFuture<virtual_time> {
    return _scheduler.pause_at(t);
}

template<simulation_types Types>
auto SimulationEngine<Types>::mode() const -> RunMode {
    return _scheduler.mode();
}

template<simulation_types Types>
auto SimulationEngine<Types>::now() const -> virtual_time {
    return _scheduler.now();
}

// ============================================================================
// Scenarios
// ============================================================================

template<simulation_types Types>
auto SimulationEngine<Types>::run_day1_scenario() -> void {
    std::unique_lock lock(_mutex);

    if (is_terminated()) {
        throw InvalidStateError("Cannot start day1 scenario: simulation is stopped");
    }
    if (_day1_started) {
        throw InvalidStateError("day1 scenario has already been started");
    }
    _day1_started = true;
    _scenarios_started.emplace_back("day1");

    auto start = _scheduler.now();
    auto arp_at = start + _config.arp_offset();
    std::size_t arp_exchanges = 0;

    for (const auto& link : _topology.links()) {
        for (const auto& endpoint : {link.endpoint_a(), link.endpoint_b()}) {
            _scheduler.schedule(arp_at, [this, endpoint](virtual_time at) {
                return arp_exchange(endpoint, at);
            });
            ++arp_exchanges;
        }
    }

    for (const auto& segment : _topology.shared_segments()) {
        for (const auto& member : segment.members()) {
            _scheduler.schedule(arp_at, [this, member](virtual_time at) {
                return arp_exchange(member, at);
            });
            ++arp_exchanges;
        }
    }

    auto hello_at = start + _config.hello_start_delay();
    for (const auto& [hostname, device] : _topology.devices()) {
        for (const auto& protocol : device.routing_protocols()) {
            auto interval = hello_interval(device, protocol);
            _scheduler.schedule(hello_at, [this, hostname, protocol](virtual_time at) {
                return send_hellos(hostname, protocol, at);
            }, interval);
            ++_hello_timers;
        }
    }

    auto arp_count = std::to_string(arp_exchanges);
    auto hello_count = std::to_string(_hello_timers);
    auto clock = std::to_string(start.count());
    _logger.info("Scenario started", {
        {"scenario", "day1"},
        {"clock_ms", clock},
        {"arp_exchanges", arp_count},
        {"hello_timers", hello_count}
    });
}

template<simulation_types Types>
auto SimulationEngine<Types>::run_fault_scenario(FaultKind kind) -> Fault {
    std::string target;
    virtual_duration duration{};
    {
        std::shared_lock lock(_mutex);
        switch (kind) {
            case FaultKind::LINK_FAILURE:
                if (_topology.links().empty()) {
                    throw NotFoundError("link", "any link for link_failure scenario");
                }
                target = _topology.links().front().id();
                duration = _config.link_failure_duration();
                break;

            case FaultKind::INTERFACE_DOWN: {
                std::optional<topology::InterfaceRef> first;
                for (const auto& [hostname, device] : _topology.devices()) {
                    for (const auto& intf : device.interfaces()) {
                        if (intf.state() == InterfaceState::UP && (!first || intf.ref() < *first)) {
                            first = intf.ref();
                        }
                    }
                }
                if (!first) {
                    throw NotFoundError("interface", "any up interface for interface_failure scenario");
                }
                target = first->to_string();
                duration = _config.interface_failure_duration();
                break;
            }

            case FaultKind::DEVICE_FAILURE: {
                auto it = std::find_if(_topology.devices().begin(), _topology.devices().end(),
                                       [](const auto& item) { return !item.second.interfaces().empty(); });
                if (it == _topology.devices().end()) {
                    throw NotFoundError("device", "any device for device_failure scenario");
                }
                target = it->first;
                duration = _config.device_failure_duration();
                break;
            }
        }
    }

    auto fault = inject(kind, target, duration);

    std::unique_lock lock(_mutex);
    std::string name;
    switch (kind) {
        case FaultKind::LINK_FAILURE:   name = "link_failure"; break;
        case FaultKind::INTERFACE_DOWN: name = "interface_failure"; break;
        case FaultKind::DEVICE_FAILURE: name = "device_failure"; break;
    }
    _scenarios_started.push_back(name);
    _logger.info("Scenario started", {{"scenario", name}, {"target", target}});
    return fault;
}

template<simulation_types Types>
auto SimulationEngine<Types>::start_scenario(std::string_view name) -> std::optional<Fault> {
    if (name == "day1") {
        run_day1_scenario();
        return std::nullopt;
    }
    if (name == "link_failure") {
        return run_fault_scenario(FaultKind::LINK_FAILURE);
    }
    if (name == "interface_failure") {
        return run_fault_scenario(FaultKind::INTERFACE_DOWN);
    }
    if (name == "device_failure") {
        return run_fault_scenario(FaultKind::DEVICE_FAILURE);
    }
    throw NotFoundError("scenario", std::string(name));
}

// ============================================================================
// Fault injection
// ============================================================================

template<simulation_types Types>
auto SimulationEngine<Types>::inject(FaultKind kind, const std::string& target,
                                     std::optional<virtual_duration> duration) -> Fault {
    std::vector<SimulationEvent> published;
    Fault result;
    {
        std::unique_lock lock(_mutex);

        if (is_terminated()) {
            throw InvalidStateError("Cannot inject a fault into a stopped simulation");
        }
        if (duration && duration->count() <= 0) {
            throw ConfigurationError("fault duration must be positive");
        }

        auto [resolved, interfaces] = resolve_fault_target(kind, target);
        auto at = _scheduler.now();
        auto id = _next_fault_id++;

        fault_record record;
        record.fault = Fault{id, kind, resolved, {}, at, duration, FaultStatus::ACTIVE, std::nullopt};
        record.interfaces = interfaces;
        for (const auto& ref : interfaces) {
            record.fault._affected_interfaces.push_back(ref.to_string());

            auto* intf = _topology.find_interface(ref);
            auto before = intf->state();
            intf->state_machine().apply(InterfaceEvent::FAULT_APPLIED);
            if (before == InterfaceState::UP) {
                reset_adjacencies(ref);
            }
        }

        auto subject = kind == FaultKind::DEVICE_FAILURE
            ? resolved
            : (interfaces.empty() ? resolved : interfaces.front().device);
        SimulationEvent event(at, EventKind::FAULT_INJECTED, subject,
                              std::string(to_string(kind)) + " injected on " + resolved);
        event.add_payload("fault_id", std::to_string(id))
             .add_payload("fault_kind", std::string(to_string(kind)))
             .add_payload("target", resolved);
        if (duration) {
            event.add_payload("duration_ms", std::to_string(duration->count()));
        }
        if (kind == FaultKind::INTERFACE_DOWN) {
            event.set_interface(interfaces.front().interface);
        } else if (kind == FaultKind::LINK_FAILURE) {
            event.set_link(resolved);
        }
        published.push_back(append(std::move(event)));

        if (duration) {
            record.recovery = _scheduler.schedule(at + *duration, [this, id](virtual_time recovered_at) {
                return recover(id, recovered_at);
            });
        }

        result = record.fault;
        _faults.emplace(id, std::move(record));

        auto id_text = std::to_string(id);
        auto clock = std::to_string(at.count());
        auto duration_text = duration ? std::to_string(duration->count()) : std::string("none");
        _logger.warning("Fault injected", {
            {"fault_id", id_text},
            {"kind", to_string(kind)},
            {"target", resolved},
            {"clock_ms", clock},
            {"duration_ms", duration_text}
        });
        emit_metric(metric_names::fault_injected, "kind", to_string(kind));
    }

    notify_subscribers(published);
    return result;
}

template<simulation_types Types>
auto SimulationEngine<Types>::clear(fault_id id) -> Fault {
    std::vector<SimulationEvent> published;
    Fault result;
    {
        std::unique_lock lock(_mutex);

        auto it = _faults.find(id);
        if (it == _faults.end()) {
            throw NotFoundError("fault", std::to_string(id));
        }

        auto& record = it->second;
        if (!record.fault.is_active()) {
            return record.fault;
        }

        if (record.recovery) {
            _scheduler.cancel(*record.recovery);
        }
        published.push_back(release_fault(record, _scheduler.now()));
        result = record.fault;
    }

    notify_subscribers(published);
    return result;
}

template<simulation_types Types>
auto SimulationEngine<Types>::recover(fault_id id, virtual_time at) -> std::vector<SimulationEvent> {
    std::unique_lock lock(_mutex);

    auto it = _faults.find(id);
    // Cleared explicitly while this callback waited for the lock
    if (it == _faults.end() || !it->second.fault.is_active()) {
        return {};
    }
    return {release_fault(it->second, at)};
}

template<simulation_types Types>
auto SimulationEngine<Types>::release_fault(fault_record& record, virtual_time at) -> SimulationEvent {
    for (const auto& ref : record.interfaces) {
        auto* intf = _topology.find_interface(ref);
        intf->state_machine().apply(InterfaceEvent::FAULT_RELEASED);
    }

    record.fault._status = FaultStatus::CLEARED;
    record.fault._cleared_at = at;
    record.recovery.reset();

    const auto& fault = record.fault;
    auto subject = fault.kind() == FaultKind::DEVICE_FAILURE || record.interfaces.empty()
        ? fault.target()
        : record.interfaces.front().device;
    SimulationEvent event(at, EventKind::FAULT_CLEARED, subject,
                          std::string(to_string(fault.kind())) + " cleared on " + fault.target());
    event.add_payload("fault_id", std::to_string(fault.id()))
         .add_payload("fault_kind", std::string(to_string(fault.kind())))
         .add_payload("target", fault.target());
    if (fault.kind() == FaultKind::INTERFACE_DOWN) {
        event.set_interface(record.interfaces.front().interface);
    } else if (fault.kind() == FaultKind::LINK_FAILURE) {
        event.set_link(fault.target());
    }

    auto id_text = std::to_string(fault.id());
    auto clock = std::to_string(at.count());
    _logger.info("Fault cleared", {
        {"fault_id", id_text},
        {"kind", to_string(fault.kind())},
        {"target", fault.target()},
        {"clock_ms", clock}
    });
    emit_metric(metric_names::fault_cleared, "kind", to_string(fault.kind()));

    return append(std::move(event));
}

template<simulation_types Types>
auto SimulationEngine<Types>::resolve_fault_target(FaultKind kind, const std::string& target) const
    -> std::pair<std::string, std::vector<topology::InterfaceRef>> {
    switch (kind) {
        case FaultKind::INTERFACE_DOWN: {
            auto ref = topology::parse_interface_ref(target);
            if (!ref || !_topology.find_interface(*ref)) {
                throw NotFoundError("interface", target);
            }
            return {ref->to_string(), {*ref}};
        }

        case FaultKind::LINK_FAILURE: {
            const auto* link = _topology.find_link(target);
            // Also accept a device pair "R1<->R2", resolved to the lowest link id between them
            auto separator = target.find("<->");
            if (!link && separator != std::string::npos) {
                auto candidates = _topology.links_between(target.substr(0, separator), target.substr(separator + 3));
                if (!candidates.empty()) {
                    link = candidates.front();
                }
            }
            if (!link) {
                throw NotFoundError("link", target);
            }
            return {link->id(), {link->endpoint_a(), link->endpoint_b()}};
        }

        case FaultKind::DEVICE_FAILURE: {
            const auto* device = _topology.find_device(target);
            if (!device) {
                throw NotFoundError("device", target);
            }
            std::vector<topology::InterfaceRef> refs;
            for (const auto& intf : device->interfaces()) {
                refs.push_back(intf.ref());
            }
            return {target, refs};
        }
    }
    throw NotFoundError("fault target", target);
}

template<simulation_types Types>
auto SimulationEngine<Types>::find_fault(fault_id id) const -> std::optional<Fault> {
    std::shared_lock lock(_mutex);
    auto it = _faults.find(id);
    if (it == _faults.end()) {
        return std::nullopt;
    }
    return it->second.fault;
}

template<simulation_types Types>
auto SimulationEngine<Types>::faults() const -> std::vector<Fault> {
    std::shared_lock lock(_mutex);
    std::vector<Fault> result;
    result.reserve(_faults.size());
    for (const auto& [id, record] : _faults) {
        result.push_back(record.fault);
    }
    return result;
}

// ============================================================================
// Protocol scripts
// ============================================================================

template<simulation_types Types>
auto SimulationEngine<Types>::arp_exchange(const topology::InterfaceRef& requester, virtual_time at)
    -> std::vector<SimulationEvent> {
    std::unique_lock lock(_mutex);
    std::vector<SimulationEvent> events;

    const auto* source = _topology.find_interface(requester);
    if (!source || !source->is_addressed() || source->state() != InterfaceState::UP) {
        return events;
    }

    const auto& peers = _topology.peers_of(requester);
    const auto* link = _topology.link_for_interface(requester);
    auto sender_ip = source->address()->to_string();

    SimulationEvent request(at, EventKind::ARP_REQUEST, requester.device,
                            "ARP request from " + requester.to_string());
    request.set_interface(requester.interface)
           .add_payload("sender_ip", sender_ip)
           .add_payload("sender_mac", source->mac_address());
    if (link) {
        auto peer = link->other_endpoint(requester);
        const auto* target = _topology.find_interface(*peer);
        request.set_link(link->id()).set_peer(peer->device)
               .add_payload("target_ip", target->address()->to_string());
    } else {
        request.add_payload("target_ip", "broadcast");
    }
    events.push_back(append(std::move(request)));

    for (const auto& peer : peers) {
        // A device never answers its own request on a shared segment
        if (peer.device == requester.device) {
            continue;
        }
        const auto* responder = _topology.find_interface(peer);
        if (!responder || !responder->is_addressed() || responder->state() != InterfaceState::UP) {
            continue;
        }

        auto responder_ip = responder->address()->to_string();
        SimulationEvent reply(at, EventKind::ARP_REPLY, peer.device,
                              "ARP reply from " + peer.to_string() + " to " + requester.to_string());
        reply.set_interface(peer.interface)
             .set_peer(requester.device)
             .add_payload("ip", responder_ip)
             .add_payload("mac", responder->mac_address());
        if (link) {
            reply.set_link(link->id());
        }
        events.push_back(append(std::move(reply)));

        _arp_tables[requester.device][responder_ip] =
            ArpEntry{responder_ip, responder->mac_address(), requester.interface, at};
    }

    for (const auto& event : events) {
        emit_metric(metric_names::event_dispatched, "kind", event.kind_name());
    }
    return events;
}

template<simulation_types Types>
auto SimulationEngine<Types>::send_hellos(const std::string& hostname, const std::string& protocol, virtual_time at)
    -> std::vector<SimulationEvent> {
    std::unique_lock lock(_mutex);
    std::vector<SimulationEvent> events;

    const auto* device = _topology.find_device(hostname);
    if (!device) {
        return events;
    }
    auto interval = hello_interval(*device, protocol);

    for (const auto& intf : device->interfaces()) {
        if (!intf.is_addressed() || intf.state() != InterfaceState::UP) {
            continue;
        }
        const auto& peers = _topology.peers_of(intf.ref());
        if (peers.empty()) {
            continue;
        }

        SimulationEvent hello(at, EventKind::HELLO, hostname,
                              protocol + " hello from " + intf.ref().to_string());
        hello.set_interface(intf.name())
             .add_payload("protocol", protocol)
             .add_payload("interval_ms", std::to_string(interval.count()));
        if (const auto* link = _topology.link_for_interface(intf.ref())) {
            hello.set_link(link->id());
        }
        events.push_back(append(std::move(hello)));

        for (const auto& peer : peers) {
            if (peer.device == hostname) {
                continue;
            }
            const auto* peer_device = _topology.find_device(peer.device);
            const auto* peer_intf = _topology.find_interface(peer);
            if (!peer_device || !peer_intf || !peer_device->runs_protocol(protocol)) {
                continue;
            }
            if (peer_intf->state() != InterfaceState::UP) {
                continue;
            }
            // Mismatched timers never form an adjacency
            if (hello_interval(*peer_device, protocol) != interval) {
                continue;
            }
            receive_hello(peer, intf.ref(), protocol, at, events);
        }
    }

    for (const auto& event : events) {
        emit_metric(metric_names::event_dispatched, "kind", event.kind_name());
    }
    return events;
}

template<simulation_types Types>
auto SimulationEngine<Types>::receive_hello(const topology::InterfaceRef& receiver, const topology::InterfaceRef& sender,
                                            const std::string& protocol, virtual_time at,
                                            std::vector<SimulationEvent>& events) -> void {
    adjacency_key key{protocol, receiver.interface, sender.device, sender.interface};
    auto& table = _neighbors[receiver.device];

    auto it = table.find(key);
    if (it == table.end()) {
        NeighborEntry entry{protocol, sender.device, receiver.interface, sender.interface,
                            NeighborState::INIT, 0, at};
        it = table.emplace(key, adjacency{NeighborStateMachine(_config.hellos_to_full()), entry}).first;
    }

    auto& adj = it->second;
    auto changed = adj.machine.apply(NeighborEvent::HELLO_RECEIVED);
    adj.entry.state = adj.machine.state();
    adj.entry.hellos_received = adj.machine.hellos_seen();
    adj.entry.last_hello = at;

    std::optional<EventKind> transition;
    if (changed && adj.machine.state() == NeighborState::FULL) {
        transition = EventKind::NEIGHBOR_FULL;
    } else if (adj.machine.state() == NeighborState::INIT && adj.machine.hellos_seen() == 1) {
        transition = EventKind::NEIGHBOR_INIT;
    }
    if (!transition) {
        return;
    }

    SimulationEvent event(at, *transition, receiver.device,
                          protocol + " neighbor " + sender.device + " " + std::string(to_string(adj.machine.state()))
                          + " on " + receiver.interface);
    event.set_interface(receiver.interface)
         .set_peer(sender.device)
         .add_payload("protocol", protocol)
         .add_payload("peer_interface", sender.interface);
    if (const auto* link = _topology.link_for_interface(receiver)) {
        event.set_link(link->id());
    }
    events.push_back(append(std::move(event)));

    _logger.debug("Neighbor state changed", {
        {"device", receiver.device},
        {"peer", sender.device},
        {"protocol", protocol},
        {"state", to_string(adj.machine.state())}
    });
}

// Both sides of every adjacency running over ref fall back to INIT
template<simulation_types Types>
auto SimulationEngine<Types>::reset_adjacencies(const topology::InterfaceRef& ref) -> void {
    auto reset = [this, &ref](adjacency& adj) {
        auto previous = adj.machine.state();
        adj.machine.apply(NeighborEvent::ADJACENCY_RESET);
        adj.entry.state = adj.machine.state();
        adj.entry.hellos_received = adj.machine.hellos_seen();
        if (previous != adj.entry.state) {
            _logger.debug("Neighbor adjacency reset", {
                {"interface", ref.to_string()},
                {"peer", adj.entry.peer_device},
                {"protocol", adj.entry.protocol}
            });
        }
    };

    auto local = _neighbors.find(ref.device);
    if (local != _neighbors.end()) {
        for (auto& [key, adj] : local->second) {
            if (adj.entry.local_interface == ref.interface) {
                reset(adj);
            }
        }
    }

    for (const auto& peer : _topology.peers_of(ref)) {
        auto remote = _neighbors.find(peer.device);
        if (remote == _neighbors.end()) {
            continue;
        }
        for (auto& [key, adj] : remote->second) {
            if (adj.entry.local_interface == peer.interface
                && adj.entry.peer_device == ref.device
                && adj.entry.peer_interface == ref.interface) {
                reset(adj);
            }
        }
    }
}

template<simulation_types Types>
auto SimulationEngine<Types>::hello_interval(const topology::Device& device, const std::string& protocol) const
    -> virtual_duration {
    if (auto override_interval = device.hello_interval_override(protocol)) {
        return *override_interval;
    }
    return _config.hello_interval_for(protocol);
}

template<simulation_types Types>
auto SimulationEngine<Types>::is_terminated() const -> bool {
    return _scheduler.has_started() && _scheduler.mode() == RunMode::STOPPED;
}

template<simulation_types Types>
auto SimulationEngine<Types>::append(SimulationEvent event) -> SimulationEvent {
    event.set_sequence(_log.size());
    ++_events_by_kind[event.kind_name()];
    _log.push_back(std::move(event));
    return _log.back();
}

// ============================================================================
// Queries
// ============================================================================

template<simulation_types Types>
auto SimulationEngine<Types>::collect_statistics() const -> SimulationStatistics {
    SimulationStatistics stats;
    stats.events_by_kind = _events_by_kind;
    stats.total_events = _log.size();
    stats.total_faults = _faults.size();
    for (const auto& [id, record] : _faults) {
        if (record.fault.is_active()) {
            ++stats.active_faults;
        }
    }
    stats.dispatched_callbacks = _scheduler.dispatched_count();

    for (const auto& link : _topology.links()) {
        if (_topology.link_state(link) == LinkState::UP) {
            ++stats.links_active;
        } else {
            ++stats.links_failed;
        }
    }

    for (const auto& [hostname, device] : _topology.devices()) {
        std::size_t down = 0;
        for (const auto& intf : device.interfaces()) {
            if (intf.state() == InterfaceState::DOWN) {
                ++stats.interfaces_down;
            }
            if (intf.state() != InterfaceState::UP) {
                ++down;
            }
        }
        if (!device.interfaces().empty() && down == device.interfaces().size()) {
            stats.devices_down.push_back(hostname);
        }
    }

    return stats;
}

template<simulation_types Types>
auto SimulationEngine<Types>::neighbors_of(const std::string& hostname) const -> std::vector<NeighborEntry> {
    std::vector<NeighborEntry> result;
    auto it = _neighbors.find(hostname);
    if (it != _neighbors.end()) {
        for (const auto& [key, adj] : it->second) {
            result.push_back(adj.entry);
        }
    }
    return result;
}

template<simulation_types Types>
auto SimulationEngine<Types>::arp_entries_of(const std::string& hostname) const -> std::vector<ArpEntry> {
    std::vector<ArpEntry> result;
    auto it = _arp_tables.find(hostname);
    if (it != _arp_tables.end()) {
        for (const auto& [ip, entry] : it->second) {
            result.push_back(entry);
        }
    }
    return result;
}

template<simulation_types Types>
auto SimulationEngine<Types>::get_status() const -> SimulationStatus {
    std::shared_lock lock(_mutex);

    SimulationStatus status;
    status.mode = _scheduler.mode();
    status.clock = _scheduler.now();
    status.pending_callbacks = _scheduler.pending_count();
    status.scenarios_started = _scenarios_started;
    status.statistics = collect_statistics();

    for (const auto& [hostname, device] : _topology.devices()) {
        DeviceStatus entry;
        entry.hostname = hostname;
        for (const auto& intf : device.interfaces()) {
            if (intf.state() == InterfaceState::UP) {
                ++entry.interfaces_up;
            } else {
                ++entry.interfaces_down;
            }
        }
        entry.neighbors = neighbors_of(hostname);
        entry.arp_table = arp_entries_of(hostname);
        status.devices.emplace(hostname, std::move(entry));
    }

    return status;
}

template<simulation_types Types>
auto SimulationEngine<Types>::statistics() const -> SimulationStatistics {
    std::shared_lock lock(_mutex);
    return collect_statistics();
}

template<simulation_types Types>
auto SimulationEngine<Types>::get_events(const EventQuery& query) const -> std::vector<SimulationEvent> {
    std::shared_lock lock(_mutex);

    std::vector<SimulationEvent> matches;
    for (const auto& event : _log) {
        if (query.kind && event.kind_name() != *query.kind && to_string(event.kind()) != *query.kind) {
            continue;
        }
        if (query.device && event.device() != *query.device) {
            continue;
        }
        matches.push_back(event);
    }

    if (query.limit && matches.size() > *query.limit) {
        matches.erase(matches.begin(), matches.end() - static_cast<std::ptrdiff_t>(*query.limit));
    }
    return matches;
}

template<simulation_types Types>
auto SimulationEngine<Types>::event_count() const -> std::size_t {
    std::shared_lock lock(_mutex);
    return _log.size();
}

template<simulation_types Types>
auto SimulationEngine<Types>::neighbor_table(const std::string& hostname) const -> std::vector<NeighborEntry> {
    std::shared_lock lock(_mutex);
    if (!_topology.has_device(hostname)) {
        throw NotFoundError("device", hostname);
    }
    return neighbors_of(hostname);
}

template<simulation_types Types>
auto SimulationEngine<Types>::arp_table(const std::string& hostname) const -> std::vector<ArpEntry> {
    std::shared_lock lock(_mutex);
    if (!_topology.has_device(hostname)) {
        throw NotFoundError("device", hostname);
    }
    return arp_entries_of(hostname);
}

template<simulation_types Types>
auto SimulationEngine<Types>::interface_state(const topology::InterfaceRef& ref) const -> InterfaceState {
    std::shared_lock lock(_mutex);
    return _topology.interface_state(ref);
}

template<simulation_types Types>
auto SimulationEngine<Types>::link_state(const std::string& link_id) const -> LinkState {
    std::shared_lock lock(_mutex);
    const auto* link = _topology.find_link(link_id);
    if (!link) {
        throw NotFoundError("link", link_id);
    }
    return _topology.link_state(*link);
}

template<simulation_types Types>
auto SimulationEngine<Types>::topology_snapshot() const -> topology::Topology {
    std::shared_lock lock(_mutex);
    return _topology;
}

template<simulation_types Types>
auto SimulationEngine<Types>::export_log() const -> SimulationLogExport {
    std::shared_lock lock(_mutex);

    SimulationLogExport result;
    result.start_time_unix_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        _wall_start.time_since_epoch()).count();
    result.clock_ms = _scheduler.now().count();
    result.mode = std::string(to_string(_scheduler.mode()));
    result.total_events = _log.size();
    result.total_faults = _faults.size();

    result.events.reserve(_log.size());
    for (const auto& event : _log) {
        result.events.push_back(EventExport{
            event.sequence(),
            event.timestamp().count(),
            event.kind_name(),
            event.device(),
            event.interface(),
            event.link(),
            event.peer(),
            event.payload(),
            event.description()
        });
    }

    for (const auto& [id, record] : _faults) {
        const auto& fault = record.fault;
        FaultExport entry;
        entry.id = fault.id();
        entry.kind = std::string(to_string(fault.kind()));
        entry.target = fault.target();
        entry.affected_interfaces = fault.affected_interfaces();
        entry.injected_at_ms = fault.injected_at().count();
        if (fault.duration()) {
            entry.duration_ms = fault.duration()->count();
        }
        entry.status = std::string(to_string(fault.status()));
        if (fault.cleared_at()) {
            entry.cleared_at_ms = fault.cleared_at()->count();
        }
        result.faults.push_back(std::move(entry));
    }

    result.statistics = collect_statistics();
    return result;
}

// ============================================================================
// Subscription and metrics
// ============================================================================

template<simulation_types Types>
auto SimulationEngine<Types>::subscribe(event_handler handler) -> subscription_id {
    std::lock_guard<std::mutex> lock(_subscribers_mutex);
    auto id = _next_subscription++;
    _subscribers.emplace(id, std::move(handler));
    return id;
}

template<simulation_types Types>
auto SimulationEngine<Types>::unsubscribe(subscription_id id) -> bool {
    std::lock_guard<std::mutex> lock(_subscribers_mutex);
    return _subscribers.erase(id) > 0;
}

template<simulation_types Types>
auto SimulationEngine<Types>::notify_subscribers(const std::vector<SimulationEvent>& events) -> void {
    if (events.empty()) {
        return;
    }

    std::vector<event_handler> handlers;
    {
        std::lock_guard<std::mutex> lock(_subscribers_mutex);
        for (const auto& [id, handler] : _subscribers) {
            handlers.push_back(handler);
        }
    }

    for (const auto& handler : handlers) {
        try {
            handler(events);
        } catch (const std::exception& e) {
            _logger.error("Event subscriber failed", {{"error", e.what()}});
        }
    }
}

template<simulation_types Types>
auto SimulationEngine<Types>::emit_metric(std::string_view name, std::string_view dimension, std::string_view value) -> void {
    auto metric = _metrics;
    metric.set_metric_name(name);
    metric.add_dimension(dimension, value);
    metric.add_one();
    metric.emit();
}

} // namespace meridian::simulation
