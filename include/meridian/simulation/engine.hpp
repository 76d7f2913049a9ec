#pragma once

#include <meridian/console_logger.hpp>
#include <meridian/exceptions.hpp>
#include <meridian/logger.hpp>
#include <meridian/metrics.hpp>
#include <meridian/state_machines.hpp>
#include <meridian/simulation/config.hpp>
#include <meridian/simulation/scheduler.hpp>
#include <meridian/simulation/types.hpp>
#include <meridian/topology/topology.hpp>

#include <folly/futures/Future.h>

#include <chrono>
#include <concepts>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace meridian::simulation {

// Types bundle: the engine's logger and metrics implementations
template<typename T>
concept simulation_types = requires {
    typename T::logger_type;
    typename T::metrics_type;
} && diagnostic_logger<typename T::logger_type>
  && metrics<typename T::metrics_type>;

struct DefaultSimulationTypes {
    using logger_type = console_logger;
    using metrics_type = noop_metrics;
};

static_assert(simulation_types<DefaultSimulationTypes>,
    "DefaultSimulationTypes must satisfy simulation_types concept");

/**
 * @brief Discrete-event simulation over an owned Topology.
 *
 * One dispatch thread, owned by the EventScheduler, fires protocol script and
 * recovery callbacks. Every other public member may be called concurrently
 * from any thread. A single shared mutex guards interface state, the fault
 * registry, neighbor and ARP tables and the event log, so each callback or
 * injection mutates state and appends its events as one step and readers see
 * either all of it or none of it.
 *
 * Subscribers receive each batch of newly logged events after the engine lock
 * has been released.
 */
template<simulation_types Types = DefaultSimulationTypes>
class SimulationEngine {
public:
    using logger_type = typename Types::logger_type;
    using metrics_type = typename Types::metrics_type;
    using event_handler = std::function<void(const std::vector<SimulationEvent>&)>;
    using subscription_id = std::uint64_t;

    explicit SimulationEngine(topology::Topology topology,
                              simulation_config config = simulation_config{},
                              logger_type logger = logger_type{},
                              metrics_type metrics = metrics_type{});

    SimulationEngine(const SimulationEngine&) = delete;
    SimulationEngine& operator=(const SimulationEngine&) = delete;

    // Run control
    auto start() -> void;
    auto pause() -> void;
    auto resume() -> void;
    auto stop() -> void;
    auto pause_at(virtual_time t) -> folly::SemiFuture<virtual_time>;
    auto mode() const -> RunMode;
    auto now() const -> virtual_time;

    // Scenarios
    auto run_day1_scenario() -> void;
    auto run_fault_scenario(FaultKind kind) -> Fault;
    // "day1", "link_failure", "interface_failure" or "device_failure"
    auto start_scenario(std::string_view name) -> std::optional<Fault>;

    // Fault injection
    auto inject(FaultKind kind, const std::string& target,
                std::optional<virtual_duration> duration = std::nullopt) -> Fault;
    auto clear(fault_id id) -> Fault;
    auto find_fault(fault_id id) const -> std::optional<Fault>;
    auto faults() const -> std::vector<Fault>;

    // Queries
    auto get_status() const -> SimulationStatus;
    auto statistics() const -> SimulationStatistics;
    auto get_events(const EventQuery& query = EventQuery{}) const -> std::vector<SimulationEvent>;
    auto event_count() const -> std::size_t;
    auto neighbor_table(const std::string& hostname) const -> std::vector<NeighborEntry>;
    auto arp_table(const std::string& hostname) const -> std::vector<ArpEntry>;
    auto interface_state(const topology::InterfaceRef& ref) const -> InterfaceState;
    auto link_state(const std::string& link_id) const -> LinkState;
    auto topology_snapshot() const -> topology::Topology;
    auto export_log() const -> SimulationLogExport;
    auto config() const -> const simulation_config& { return _config; }

    // Event subscription
    auto subscribe(event_handler handler) -> subscription_id;
    auto unsubscribe(subscription_id id) -> bool;

private:
    // (protocol, local interface, peer device, peer interface)
    using adjacency_key = std::tuple<std::string, std::string, std::string, std::string>;

    struct adjacency {
        NeighborStateMachine machine;
        NeighborEntry entry;
    };

    struct fault_record {
        Fault fault;
        std::vector<topology::InterfaceRef> interfaces;
        std::optional<ScheduleToken> recovery;
    };

    // Protocol scripts, run on the dispatch thread
    auto arp_exchange(const topology::InterfaceRef& requester, virtual_time at) -> std::vector<SimulationEvent>;
    auto send_hellos(const std::string& hostname, const std::string& protocol, virtual_time at) -> std::vector<SimulationEvent>;
    auto recover(fault_id id, virtual_time at) -> std::vector<SimulationEvent>;

    // Helpers below expect _mutex held exclusively
    auto receive_hello(const topology::InterfaceRef& receiver, const topology::InterfaceRef& sender,
                       const std::string& protocol, virtual_time at, std::vector<SimulationEvent>& events) -> void;
    auto reset_adjacencies(const topology::InterfaceRef& ref) -> void;
    auto resolve_fault_target(FaultKind kind, const std::string& target) const
        -> std::pair<std::string, std::vector<topology::InterfaceRef>>;
    auto release_fault(fault_record& record, virtual_time at) -> SimulationEvent;
    auto append(SimulationEvent event) -> SimulationEvent;
    auto hello_interval(const topology::Device& device, const std::string& protocol) const -> virtual_duration;
    auto is_terminated() const -> bool;

    // Expects _mutex held, shared or exclusive
    auto collect_statistics() const -> SimulationStatistics;
    auto neighbors_of(const std::string& hostname) const -> std::vector<NeighborEntry>;
    auto arp_entries_of(const std::string& hostname) const -> std::vector<ArpEntry>;

    auto notify_subscribers(const std::vector<SimulationEvent>& events) -> void;
    auto emit_metric(std::string_view name, std::string_view dimension, std::string_view value) -> void;

    simulation_config _config;
    logger_type _logger;
    metrics_type _metrics;

    mutable std::shared_mutex _mutex;
    topology::Topology _topology;
    std::vector<SimulationEvent> _log;
    std::map<std::string, std::size_t> _events_by_kind;
    std::map<fault_id, fault_record> _faults;
    fault_id _next_fault_id{1};
    std::map<std::string, std::map<adjacency_key, adjacency>> _neighbors;
    std::map<std::string, std::map<std::string, ArpEntry>> _arp_tables;
    std::vector<std::string> _scenarios_started;
    std::size_t _hello_timers{0};
    bool _day1_started{false};
    std::chrono::system_clock::time_point _wall_start;

    std::mutex _subscribers_mutex;
    std::map<subscription_id, event_handler> _subscribers;
    subscription_id _next_subscription{1};

    // Declared last: destroyed first, joining the dispatch thread while the
    // state its callbacks touch is still alive
    EventScheduler<SimulationEvent> _scheduler;
};

} // namespace meridian::simulation

#include <meridian/simulation/engine_impl.hpp>
