#define BOOST_TEST_MODULE TopologyGeneratorTest
#include <boost/test/unit_test.hpp>

#include <meridian/console_logger.hpp>
#include <meridian/exceptions.hpp>
#include <meridian/topology/generator.hpp>
#include <meridian/topology/topology_export.hpp>

#include "test_topologies.hpp"

#include <chrono>
#include <set>
#include <string>

using namespace meridian;
using namespace meridian::topology;
using meridian::test::make_device;
using meridian::test::make_interface;

namespace {
    constexpr const char* r1_r2_link = "R1:GigabitEthernet0/0<->R2:GigabitEthernet0/0";
    constexpr const char* r2_r3_link = "R2:FastEthernet0/1<->R3:FastEthernet0/1";
    constexpr std::chrono::microseconds gigabit_latency{150};
    constexpr std::chrono::microseconds fast_ethernet_latency{1050};
    constexpr std::size_t max_chain_length = 12;

    auto quiet_generator() -> TopologyGenerator<console_logger> {
        return TopologyGenerator<console_logger>(console_logger("topology", log_level::critical));
    }
}

BOOST_AUTO_TEST_SUITE(link_inference)

BOOST_AUTO_TEST_CASE(triangle_yields_three_links_and_no_orphans, * boost::unit_test::timeout(30)) {
    auto generator = quiet_generator();
    auto topo = generator.generate(test::triangle());

    BOOST_CHECK_EQUAL(topo.devices().size(), 3u);
    BOOST_CHECK_EQUAL(topo.links().size(), 3u);
    BOOST_CHECK_EQUAL(topo.orphans().size(), 0u);
    BOOST_CHECK_EQUAL(topo.shared_segments().size(), 0u);
    BOOST_CHECK_EQUAL(topo.subnets().size(), 3u);

    for (const auto& [key, subnet] : topo.subnets()) {
        BOOST_CHECK(subnet.role == SubnetRole::POINT_TO_POINT);
    }
}

BOOST_AUTO_TEST_CASE(link_takes_minimum_bandwidth_and_derived_latency) {
    auto configs = test::triangle();
    configs["R2"].interfaces[0].bandwidth_mbps = 100;

    auto generator = quiet_generator();
    auto topo = generator.generate(configs);

    const auto* r1_r2 = topo.find_link(r1_r2_link);
    BOOST_REQUIRE(r1_r2 != nullptr);
    BOOST_CHECK_EQUAL(r1_r2->bandwidth_mbps(), 100u);
    BOOST_CHECK(r1_r2->latency() == fast_ethernet_latency);

    const auto* r1_r3 = topo.links_between("R1", "R3").front();
    BOOST_CHECK_EQUAL(r1_r3->bandwidth_mbps(), 1000u);
    BOOST_CHECK(r1_r3->latency() == gigabit_latency);
}

BOOST_AUTO_TEST_CASE(link_type_and_reliability_follow_interface_names) {
    auto generator = quiet_generator();
    auto topo = generator.generate(test::triangle());

    const auto* gigabit = topo.find_link(r1_r2_link);
    const auto* fast = topo.find_link(r2_r3_link);
    BOOST_REQUIRE(gigabit != nullptr);
    BOOST_REQUIRE(fast != nullptr);

    BOOST_CHECK(gigabit->type() == LinkType::GIGABIT_ETHERNET);
    BOOST_CHECK(fast->type() == LinkType::FAST_ETHERNET);
    BOOST_CHECK_CLOSE(gigabit->reliability(), 0.9999 * 0.9999, 1e-9);
    BOOST_CHECK(fast->reliability() < gigabit->reliability());
}

BOOST_AUTO_TEST_CASE(abbreviated_interface_names_are_recognized) {
    BOOST_CHECK(classify_interface("Gi0/0").type == LinkType::GIGABIT_ETHERNET);
    BOOST_CHECK(classify_interface("Te1/0/1").type == LinkType::TEN_GIGABIT_ETHERNET);
    BOOST_CHECK(classify_interface("Se0/0/0").type == LinkType::SERIAL);
    BOOST_CHECK(classify_interface("Loopback0").type == LinkType::LOOPBACK);
    BOOST_CHECK(classify_interface("eth0").type == LinkType::ETHERNET);
}

/**
 * Property: every subnet with exactly two members on distinct devices
 * becomes exactly one link, and no orphans are produced.
 */
BOOST_AUTO_TEST_CASE(property_two_member_subnets_become_links, * boost::unit_test::timeout(60)) {
    auto generator = quiet_generator();

    for (std::size_t n = 2; n <= max_chain_length; ++n) {
        auto topo = generator.generate(test::router_chain(n));

        BOOST_CHECK_EQUAL(topo.links().size(), n - 1);
        BOOST_CHECK_EQUAL(topo.orphans().size(), 0u);
        BOOST_CHECK_EQUAL(topo.subnets().size(), n - 1);
    }
}

BOOST_AUTO_TEST_CASE(links_are_ordered_by_id) {
    auto generator = quiet_generator();
    auto topo = generator.generate(test::triangle());

    for (std::size_t i = 1; i < topo.links().size(); ++i) {
        BOOST_CHECK(topo.links()[i - 1].id() < topo.links()[i].id());
    }
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(orphans_and_conflicts)

BOOST_AUTO_TEST_CASE(lone_interface_is_a_no_peer_orphan) {
    auto configs = test::router_pair();
    configs["R1"].interfaces.push_back(make_interface("Loopback0", "1.1.1.1", "255.255.255.255"));

    auto generator = quiet_generator();
    auto topo = generator.generate(configs);

    BOOST_CHECK_EQUAL(topo.links().size(), 1u);
    BOOST_REQUIRE_EQUAL(topo.orphans().size(), 1u);
    const auto& orphan = topo.orphans().front();
    BOOST_CHECK_EQUAL(orphan.interface.to_string(), "R1:Loopback0");
    BOOST_CHECK(orphan.reason == OrphanReason::NO_PEER);
    BOOST_CHECK(!orphan.is_conflict());
}

BOOST_AUTO_TEST_CASE(two_interfaces_of_one_device_never_form_a_link) {
    DeviceConfigMap configs{
        {"R1", make_device("R1", {
            make_interface("GigabitEthernet0/0", "10.0.0.1", "/30"),
            make_interface("GigabitEthernet0/1", "10.0.0.2", "/30")})}
    };

    auto generator = quiet_generator();
    auto topo = generator.generate(configs);

    BOOST_CHECK_EQUAL(topo.links().size(), 0u);
    BOOST_REQUIRE_EQUAL(topo.orphans().size(), 2u);
    for (const auto& orphan : topo.orphans()) {
        BOOST_CHECK(orphan.reason == OrphanReason::SAME_DEVICE);
        BOOST_CHECK(orphan.is_conflict());
        BOOST_CHECK(orphan.conflicts_with.has_value());
    }
    BOOST_CHECK(topo.subnets().begin()->second.role == SubnetRole::ANOMALY);
}

BOOST_AUTO_TEST_CASE(duplicate_address_keeps_first_claimant) {
    DeviceConfigMap configs{
        {"R1", make_device("R1", {make_interface("GigabitEthernet0/0", "10.0.0.1", "/30")})},
        {"R2", make_device("R2", {make_interface("GigabitEthernet0/0", "10.0.0.1", "/24")})},
        {"R3", make_device("R3", {make_interface("GigabitEthernet0/0", "10.0.0.2", "/30")})}
    };

    auto generator = quiet_generator();
    auto topo = generator.generate(configs);

    BOOST_REQUIRE_EQUAL(topo.links().size(), 1u);
    BOOST_CHECK(topo.links().front().connects("R1", "R3"));

    BOOST_REQUIRE_EQUAL(topo.orphans().size(), 1u);
    const auto& orphan = topo.orphans().front();
    BOOST_CHECK_EQUAL(orphan.interface.to_string(), "R2:GigabitEthernet0/0");
    BOOST_CHECK(orphan.reason == OrphanReason::DUPLICATE_IP);
    BOOST_REQUIRE(orphan.conflicts_with.has_value());
    BOOST_CHECK_EQUAL(orphan.conflicts_with->to_string(), "R1:GigabitEthernet0/0");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(shared_segments)

BOOST_AUTO_TEST_CASE(three_members_form_one_segment) {
    auto generator = quiet_generator();
    auto topo = generator.generate(test::shared_lan());

    BOOST_CHECK_EQUAL(topo.links().size(), 0u);
    BOOST_REQUIRE_EQUAL(topo.shared_segments().size(), 1u);

    const auto& segment = topo.shared_segments().front();
    BOOST_CHECK_EQUAL(segment.id(), "192.168.0.0/24");
    BOOST_CHECK_EQUAL(segment.members().size(), 3u);
    BOOST_CHECK_EQUAL(segment.bandwidth_mbps(), 100u);
    BOOST_CHECK(topo.subnets().at(segment.subnet()).role == SubnetRole::SHARED_SEGMENT);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(determinism)

BOOST_AUTO_TEST_CASE(generate_is_idempotent) {
    auto configs = test::triangle();
    configs["R1"].interfaces.push_back(make_interface("Loopback0", "1.1.1.1", "/32"));

    auto generator = quiet_generator();
    auto first = generator.generate(configs);
    auto second = generator.generate(configs);

    BOOST_CHECK(export_topology(first) == export_topology(second));
    BOOST_REQUIRE_EQUAL(first.links().size(), second.links().size());
    for (std::size_t i = 0; i < first.links().size(); ++i) {
        BOOST_CHECK(first.links()[i].endpoint_a() == second.links()[i].endpoint_a());
        BOOST_CHECK(first.links()[i].endpoint_b() == second.links()[i].endpoint_b());
    }
}

BOOST_AUTO_TEST_CASE(latency_does_not_increase_with_bandwidth) {
    auto generator = quiet_generator();
    auto previous = generator.estimate_latency(1);

    for (std::uint64_t bandwidth : {10u, 100u, 1000u, 10000u, 100000u}) {
        auto latency = generator.estimate_latency(bandwidth);
        BOOST_CHECK(latency <= previous);
        previous = latency;
    }
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(device_records)

BOOST_AUTO_TEST_CASE(unaddressed_ports_are_kept_but_not_grouped) {
    auto configs = test::router_pair();
    configs["R1"].interfaces.push_back(make_interface("GigabitEthernet0/5", "", ""));

    auto generator = quiet_generator();
    auto topo = generator.generate(configs);

    BOOST_CHECK_EQUAL(topo.find_device("R1")->interfaces().size(), 2u);
    BOOST_CHECK_EQUAL(topo.orphans().size(), 0u);
    BOOST_CHECK(!topo.find_interface({"R1", "GigabitEthernet0/5"})->is_addressed());
}

BOOST_AUTO_TEST_CASE(shutdown_interface_is_grouped_but_administratively_down) {
    auto configs = test::router_pair();
    configs["R2"].interfaces[0].shutdown = true;

    auto generator = quiet_generator();
    auto topo = generator.generate(configs);

    BOOST_REQUIRE_EQUAL(topo.links().size(), 1u);
    BOOST_CHECK(topo.interface_state({"R2", "GigabitEthernet0/0"}) == InterfaceState::ADMIN_DOWN);
    BOOST_CHECK(topo.link_state(topo.links().front()) == LinkState::DOWN);
}

BOOST_AUTO_TEST_CASE(roles_are_derived_from_configuration) {
    auto configs = test::router_pair({});
    configs["R1"].routing_protocols = {"OSPF"};
    configs["R2"].vlans = {{10, "users"}};
    configs.emplace("H1", make_device("H1", {make_interface("eth0", "172.16.0.10", "/24")}));

    auto generator = quiet_generator();
    auto topo = generator.generate(configs);

    BOOST_CHECK(topo.find_device("R1")->role() == DeviceRole::ROUTER);
    BOOST_CHECK(topo.find_device("R1")->runs_protocol("ospf"));
    BOOST_CHECK(topo.find_device("R2")->role() == DeviceRole::SWITCH);
    BOOST_CHECK(topo.find_device("H1")->role() == DeviceRole::ENDPOINT);
}

BOOST_AUTO_TEST_CASE(malformed_records_raise_inference_errors) {
    auto generator = quiet_generator();

    auto bad_address = test::router_pair();
    bad_address["R1"].interfaces[0].ip_address = "10.0.12.300";
    BOOST_CHECK_THROW(generator.generate(bad_address), TopologyInferenceError);

    auto missing_mask = test::router_pair();
    missing_mask["R1"].interfaces[0].subnet_mask = "";
    BOOST_CHECK_THROW(generator.generate(missing_mask), TopologyInferenceError);

    auto bad_mask = test::router_pair();
    bad_mask["R1"].interfaces[0].subnet_mask = "255.0.255.0";
    BOOST_CHECK_THROW(generator.generate(bad_mask), TopologyInferenceError);

    auto duplicate_name = test::router_pair();
    duplicate_name["R1"].interfaces.push_back(duplicate_name["R1"].interfaces[0]);
    BOOST_CHECK_THROW(generator.generate(duplicate_name), TopologyInferenceError);

    auto zero_bandwidth = test::router_pair();
    zero_bandwidth["R1"].interfaces[0].bandwidth_mbps = 0;
    BOOST_CHECK_THROW(generator.generate(zero_bandwidth), TopologyInferenceError);

    auto mismatched_key = test::router_pair();
    mismatched_key["R1"].hostname = "R9";
    BOOST_CHECK_THROW(generator.generate(mismatched_key), TopologyInferenceError);
}

BOOST_AUTO_TEST_CASE(failed_generation_leaves_earlier_topology_intact) {
    auto generator = quiet_generator();
    auto good = generator.generate(test::triangle());

    auto bad = test::triangle();
    bad["R3"].interfaces[0].ip_address = "garbage";
    BOOST_CHECK_THROW(generator.generate(bad), TopologyInferenceError);

    BOOST_CHECK_EQUAL(good.links().size(), 3u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(configuration)

BOOST_AUTO_TEST_CASE(invalid_latency_model_is_rejected) {
    generator_config config;
    config._serialization_factor = 0.0;
    BOOST_CHECK_THROW(validate_generator_config(config), ConfigurationError);

    config = generator_config{};
    config._propagation_floor = std::chrono::microseconds(-1);
    BOOST_CHECK_THROW(validate_generator_config(config), ConfigurationError);

    config = generator_config{};
    BOOST_CHECK_NO_THROW(validate_generator_config(config));
}

BOOST_AUTO_TEST_SUITE_END()
