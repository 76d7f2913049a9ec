// Example: Day-1 bring-up of a small routed network
// This example demonstrates:
// 1. Inferring a topology from parsed device records
// 2. Running the Day-1 scenario until OSPF adjacencies are full
// 3. Failing a link for thirty virtual seconds and watching it recover
// 4. Exporting the topology and the simulation log as JSON

#include <meridian/meridian.hpp>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>

using namespace meridian;
using namespace std::chrono_literals;

namespace {
    constexpr auto convergence_time = 25'000ms;
    constexpr auto failure_duration = 30'000ms;
    constexpr auto breakpoint_timeout = 10s;

    auto make_interface(std::string name, std::string ip, std::string mask, std::uint64_t bandwidth)
        -> topology::InterfaceConfig {
        topology::InterfaceConfig config;
        config.name = std::move(name);
        config.ip_address = std::move(ip);
        config.subnet_mask = std::move(mask);
        config.bandwidth_mbps = bandwidth;
        return config;
    }

    auto make_router(std::string hostname, std::vector<topology::InterfaceConfig> interfaces)
        -> topology::DeviceConfig {
        topology::DeviceConfig config;
        config.hostname = std::move(hostname);
        config.interfaces = std::move(interfaces);
        config.routing_protocols = {"ospf"};
        return config;
    }

    auto triangle() -> topology::DeviceConfigMap {
        return {
            {"R1", make_router("R1", {
                make_interface("GigabitEthernet0/0", "10.0.12.1", "255.255.255.252", 1000),
                make_interface("GigabitEthernet0/1", "10.0.13.1", "255.255.255.252", 1000)})},
            {"R2", make_router("R2", {
                make_interface("GigabitEthernet0/0", "10.0.12.2", "255.255.255.252", 1000),
                make_interface("FastEthernet0/1", "10.0.23.1", "255.255.255.252", 100)})},
            {"R3", make_router("R3", {
                make_interface("GigabitEthernet0/1", "10.0.13.2", "255.255.255.252", 1000),
                make_interface("FastEthernet0/1", "10.0.23.2", "255.255.255.252", 100)})}
        };
    }
}

auto print_neighbors(const DefaultSimulationEngine& engine) -> void {
    for (const auto& hostname : {"R1", "R2", "R3"}) {
        for (const auto& neighbor : engine.neighbor_table(hostname)) {
            std::cout << "  " << hostname << " " << neighbor.protocol << " neighbor " << neighbor.peer_device
                      << " via " << neighbor.local_interface << ": " << to_string(neighbor.state) << "\n";
        }
    }
}

auto main() -> int {
    std::cout << std::string(60, '=') << "\n";
    std::cout << "  Day-1 Simulation Example\n";
    std::cout << std::string(60, '=') << "\n\n";

    try {
        // MERIDIAN_LOG_LEVEL=debug shows every adjacency change
        auto level = log_level::warning;
        if (const char* env = std::getenv("MERIDIAN_LOG_LEVEL")) {
            if (auto parsed = parse_log_level(env)) {
                level = *parsed;
            }
        }

        DefaultTopologyGenerator generator(console_logger("topology", level));
        auto topo = generator.generate(triangle());

        std::cout << "Topology: " << topo.devices().size() << " devices, "
                  << topo.links().size() << " links, "
                  << topo.orphans().size() << " orphans\n";
        for (const auto& link : topo.links()) {
            std::cout << "  " << link.id() << " " << link.bandwidth_mbps() << " Mbps, "
                      << link.latency().count() << " us\n";
        }

        json_serializer serializer;
        auto topology_json = serializer.serialize(topology::export_topology(topo));

        auto first_link = topo.links().front().id();
        DefaultSimulationEngine engine(std::move(topo), simulation::simulation_config{},
                                       console_logger("simulation", level));
        engine.subscribe([](const std::vector<simulation::SimulationEvent>& events) {
            for (const auto& event : events) {
                if (event.kind() == simulation::EventKind::NEIGHBOR_FULL
                    || event.kind() == simulation::EventKind::FAULT_CLEARED) {
                    std::cout << "  [t=" << event.timestamp().count() << "ms] "
                              << event.kind_name() << ": " << event.description() << "\n";
                }
            }
        });

        engine.start_scenario("day1");
        engine.start();

        auto converged_at = engine.pause_at(convergence_time).get(breakpoint_timeout);
        std::cout << "\nConverged by t=" << converged_at.count() << "ms\n";
        print_neighbors(engine);

        auto fault = engine.inject(simulation::FaultKind::LINK_FAILURE, first_link, failure_duration);
        std::cout << "\nInjected " << to_string(fault.kind()) << " on " << fault.target()
                  << " at t=" << fault.injected_at().count() << "ms\n";

        auto breakpoint = engine.pause_at(fault.injected_at() + failure_duration + convergence_time);
        engine.resume();
        std::move(breakpoint).get(breakpoint_timeout);

        auto status = engine.get_status();
        std::cout << "\nAfter recovery: " << status.statistics.links_active << " links up, "
                  << status.statistics.active_faults << " active faults, "
                  << status.statistics.total_events << " events\n";
        print_neighbors(engine);

        engine.stop();

        auto log_json = serializer.serialize(engine.export_log());
        std::cout << "\nTopology export: " << topology_json.size() << " bytes, simulation log: "
                  << log_json.size() << " bytes\n";
    } catch (const std::exception& e) {
        std::cerr << "  ✗ Exception: " << e.what() << "\n";
        return 1;
    }

    std::cout << std::string(60, '=') << "\n";
    return 0;
}
