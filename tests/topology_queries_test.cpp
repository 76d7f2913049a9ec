#define BOOST_TEST_MODULE TopologyQueriesTest
#include <boost/test/unit_test.hpp>

#include <meridian/console_logger.hpp>
#include <meridian/exceptions.hpp>
#include <meridian/topology/generator.hpp>
#include <meridian/topology/topology.hpp>

#include "test_topologies.hpp"

#include <chrono>
#include <map>
#include <string>
#include <vector>

using namespace meridian;
using namespace meridian::topology;
using meridian::test::make_device;
using meridian::test::make_interface;

namespace {
    constexpr std::size_t chain_length = 5;

    auto generate(const DeviceConfigMap& configs) -> Topology {
        TopologyGenerator<console_logger> generator(console_logger("topology", log_level::critical));
        return generator.generate(configs);
    }
}

BOOST_AUTO_TEST_SUITE(adjacency_queries)

BOOST_AUTO_TEST_CASE(neighbors_are_sorted_device_names) {
    auto topo = generate(test::triangle());

    BOOST_CHECK((topo.neighbors("R1") == std::vector<std::string>{"R2", "R3"}));
    BOOST_CHECK((topo.neighbors("R2") == std::vector<std::string>{"R1", "R3"}));
    BOOST_CHECK(topo.neighbors("R9").empty());
}

BOOST_AUTO_TEST_CASE(peers_resolve_through_links_and_segments) {
    auto topo = generate(test::shared_lan());

    const auto& peers = topo.peers_of({"R1", "GigabitEthernet0/2"});
    BOOST_CHECK_EQUAL(peers.size(), 2u);
    BOOST_CHECK(topo.segment_for_interface({"R1", "GigabitEthernet0/2"}) != nullptr);
    BOOST_CHECK(topo.link_for_interface({"R1", "GigabitEthernet0/2"}) == nullptr);
    BOOST_CHECK((topo.neighbors("R3") == std::vector<std::string>{"R1", "R2"}));
}

BOOST_AUTO_TEST_CASE(shortest_path_walks_the_chain) {
    auto topo = generate(test::router_chain(chain_length));

    auto path = topo.shortest_path("R0", "R4");
    BOOST_CHECK((path == std::vector<std::string>{"R0", "R1", "R2", "R3", "R4"}));
    BOOST_CHECK((topo.shortest_path("R2", "R2") == std::vector<std::string>{"R2"}));
    BOOST_CHECK(topo.shortest_path("R0", "R9").empty());
}

BOOST_AUTO_TEST_CASE(shortest_path_prefers_the_direct_link) {
    auto topo = generate(test::triangle());

    BOOST_CHECK_EQUAL(topo.shortest_path("R1", "R3").size(), 2u);
}

BOOST_AUTO_TEST_CASE(unreachable_devices_have_no_path) {
    auto configs = test::router_pair();
    configs.emplace("R9", make_device("R9", {make_interface("GigabitEthernet0/0", "10.9.9.1", "/30")}));
    auto topo = generate(configs);

    BOOST_CHECK(topo.shortest_path("R1", "R9").empty());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(indices)

BOOST_AUTO_TEST_CASE(vlan_and_routing_domain_indices) {
    auto configs = test::triangle();
    configs["R1"].interfaces[0].vlan = 10;
    configs["R2"].interfaces[0].vlan = 10;
    configs["R3"].routing_protocols = {"eigrp"};
    configs["R3"].default_gateway = "10.0.13.1";

    auto topo = generate(configs);

    BOOST_REQUIRE_EQUAL(topo.vlans().count(10), 1u);
    BOOST_CHECK_EQUAL(topo.vlans().at(10).size(), 2u);
    BOOST_CHECK((topo.routing_domains().at("ospf") == std::vector<std::string>{"R1", "R2"}));
    BOOST_CHECK((topo.routing_domains().at("eigrp") == std::vector<std::string>{"R3"}));
    BOOST_CHECK((topo.routing_domains().at("static") == std::vector<std::string>{"R3"}));
}

BOOST_AUTO_TEST_CASE(links_between_is_symmetric) {
    auto topo = generate(test::triangle());

    BOOST_CHECK_EQUAL(topo.links_between("R1", "R2").size(), 1u);
    BOOST_CHECK_EQUAL(topo.links_between("R2", "R1").size(), 1u);
    BOOST_CHECK(topo.links_between("R1", "R1").empty());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(analysis)

BOOST_AUTO_TEST_CASE(triangle_has_no_single_point_of_failure) {
    auto topo = generate(test::triangle());
    auto analysis = topo.analyze();

    BOOST_CHECK_EQUAL(analysis.total_devices, 3u);
    BOOST_CHECK_EQUAL(analysis.total_links, 3u);
    BOOST_CHECK_EQUAL(analysis.connected_components, 1u);
    BOOST_CHECK(analysis.articulation_points.empty());
    BOOST_CHECK(analysis.isolated_devices.empty());
    BOOST_CHECK(!analysis.multiple_routing_protocols);
}

BOOST_AUTO_TEST_CASE(chain_interior_routers_are_articulation_points) {
    auto topo = generate(test::router_chain(chain_length));
    auto analysis = topo.analyze();

    BOOST_CHECK((analysis.articulation_points == std::vector<std::string>{"R1", "R2", "R3"}));
}

BOOST_AUTO_TEST_CASE(bandwidth_distribution_and_low_bandwidth_count) {
    auto configs = test::triangle();
    configs["R1"].interfaces[0].bandwidth_mbps = 10;
    configs["R2"].interfaces[0].bandwidth_mbps = 10;
    configs["R1"].interfaces[1].bandwidth_mbps = 10000;
    configs["R3"].interfaces[0].bandwidth_mbps = 10000;

    auto topo = generate(configs);
    auto analysis = topo.analyze(100);

    BOOST_CHECK_EQUAL(analysis.bandwidth_distribution.low, 1u);
    BOOST_CHECK_EQUAL(analysis.bandwidth_distribution.medium, 1u);
    BOOST_CHECK_EQUAL(analysis.bandwidth_distribution.high, 0u);
    BOOST_CHECK_EQUAL(analysis.bandwidth_distribution.ultra, 1u);
    BOOST_CHECK_EQUAL(analysis.low_bandwidth_links, 1u);
    BOOST_CHECK_EQUAL(analysis.total_bandwidth_mbps, 10u + 100u + 10000u);
}

BOOST_AUTO_TEST_CASE(isolated_devices_and_components_are_reported) {
    auto configs = test::router_pair();
    configs.emplace("H1", make_device("H1", {make_interface("eth0", "172.16.0.10", "/24")}));
    configs["R2"].routing_protocols = {"ospf", "bgp"};

    auto topo = generate(configs);
    auto analysis = topo.analyze();

    BOOST_CHECK_EQUAL(analysis.connected_components, 2u);
    BOOST_CHECK((analysis.isolated_devices == std::vector<std::string>{"H1"}));
    BOOST_CHECK(analysis.multiple_routing_protocols);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(construction_checks)

BOOST_AUTO_TEST_CASE(link_to_unknown_interface_is_rejected) {
    auto topo = generate(test::router_pair());

    std::map<std::string, Device> devices = topo.devices();
    std::vector<Link> links{Link({"R1", "GigabitEthernet0/0"}, {"R2", "Serial9/9"},
                                 topo.links().front().subnet(), 100, std::chrono::microseconds(1050), 1.0,
                                 LinkType::SERIAL)};

    auto build = [&]() { return Topology(devices, links, {}, {}, {}); };
    BOOST_CHECK_THROW(build(), TopologyInferenceError);
}

BOOST_AUTO_TEST_CASE(interface_in_two_links_is_rejected) {
    auto topo = generate(test::triangle());

    std::vector<Link> links = topo.links();
    links.push_back(links.front());

    auto build = [&]() { return Topology(topo.devices(), links, {}, {}, {}); };
    BOOST_CHECK_THROW(build(), TopologyInferenceError);
}

BOOST_AUTO_TEST_CASE(unknown_interface_state_query_raises_not_found) {
    auto topo = generate(test::router_pair());

    BOOST_CHECK_THROW(topo.interface_state({"R1", "Serial0/0"}), NotFoundError);
}

BOOST_AUTO_TEST_SUITE_END()
