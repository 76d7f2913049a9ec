#define BOOST_TEST_MODULE FaultInjectionConcurrencyTest
#include <boost/test/unit_test.hpp>

#include <meridian/console_logger.hpp>
#include <meridian/exceptions.hpp>
#include <meridian/simulation/engine.hpp>
#include <meridian/topology/generator.hpp>

#include "test_topologies.hpp"

#include <folly/executors/CPUThreadPoolExecutor.h>
#include <folly/futures/Future.h>
#include <folly/init/Init.h>

#include <future>
#include <memory>
#include <set>
#include <string>
#include <vector>

using namespace meridian;
using namespace meridian::simulation;

namespace {
    constexpr std::size_t chain_length = 8;
    constexpr std::size_t concurrent_injections = 32;
    constexpr std::size_t executor_threads = 4;
    constexpr auto breakpoint_wait = std::chrono::seconds(10);

    using engine_type = SimulationEngine<DefaultSimulationTypes>;

    auto make_engine() -> std::unique_ptr<engine_type> {
        topology::TopologyGenerator<console_logger> generator(console_logger("topology", log_level::critical));
        return std::make_unique<engine_type>(generator.generate(test::router_chain(chain_length, {"ospf"})),
                                             simulation_config{},
                                             console_logger("simulation", log_level::critical));
    }

    // Cycles through every interface of the chain
    auto interface_target(std::size_t i) -> std::string {
        auto router = i % chain_length;
        auto name = router == 0 ? "GigabitEthernet0/1"
                  : router + 1 == chain_length ? "GigabitEthernet0/0"
                  : (i / chain_length) % 2 == 0 ? "GigabitEthernet0/0" : "GigabitEthernet0/1";
        return "R" + std::to_string(router) + ":" + name;
    }
}

struct FollyInitFixture {
    FollyInitFixture() {
        int argc = 1;
        char* argv_data[] = {const_cast<char*>("fault_injection_concurrency_test"), nullptr};
        char** argv = argv_data;
        _init = std::make_unique<folly::Init>(&argc, &argv);
    }

    ~FollyInitFixture() = default;

    std::unique_ptr<folly::Init> _init;
};

BOOST_GLOBAL_FIXTURE(FollyInitFixture);

BOOST_AUTO_TEST_SUITE(concurrent_fault_injection)

/**
 * Property: N concurrent injections grow the log by exactly N fault-injected
 * events, each with a distinct fault id, while the dispatch thread runs
 */
BOOST_AUTO_TEST_CASE(concurrent_injections_are_all_logged, * boost::unit_test::timeout(60)) {
    auto engine = make_engine();
    engine->start_scenario("day1");
    engine->start();

    std::vector<std::future<Fault>> pending;
    for (std::size_t i = 0; i < concurrent_injections; ++i) {
        pending.push_back(std::async(std::launch::async, [&engine, i]() {
            return engine->inject(FaultKind::INTERFACE_DOWN, interface_target(i), virtual_duration(5'000));
        }));
    }

    std::set<fault_id> ids;
    for (auto& future : pending) {
        ids.insert(future.get().id());
    }

    auto reached = engine->pause_at(engine->now());
    std::move(reached).get(breakpoint_wait);

    BOOST_CHECK_EQUAL(ids.size(), concurrent_injections);

    EventQuery query;
    query.kind = "fault-injected";
    auto injected = engine->get_events(query);
    BOOST_CHECK_EQUAL(injected.size(), concurrent_injections);

    std::set<std::string> logged_ids;
    for (const auto& event : injected) {
        logged_ids.insert(*event.payload_value("fault_id"));
    }
    BOOST_CHECK_EQUAL(logged_ids.size(), concurrent_injections);
    BOOST_CHECK_EQUAL(engine->statistics().total_faults, concurrent_injections);

    engine->stop();
}

/**
 * Property: injections submitted through an executor while the simulation is
 * paused all land at the paused clock and every one of them recovers
 */
BOOST_AUTO_TEST_CASE(executor_injections_at_the_paused_clock_all_recover, * boost::unit_test::timeout(60)) {
    auto engine = make_engine();
    engine->start_scenario("day1");

    auto first = engine->pause_at(virtual_time(15'000));
    engine->start();
    std::move(first).get(breakpoint_wait);
    auto events_before = engine->event_count();

    folly::CPUThreadPoolExecutor executor(executor_threads);
    std::vector<folly::Future<Fault>> pending;
    for (std::size_t i = 0; i < concurrent_injections; ++i) {
        pending.push_back(folly::via(&executor, [&engine, i]() {
            return engine->inject(FaultKind::INTERFACE_DOWN, interface_target(i), virtual_duration(1'000));
        }));
    }

    auto results = folly::collectAll(std::move(pending)).get(breakpoint_wait);
    for (const auto& result : results) {
        BOOST_REQUIRE(result.hasValue());
        BOOST_CHECK_EQUAL(result.value().injected_at().count(), 15'000);
    }
    BOOST_CHECK_EQUAL(engine->event_count(), events_before + concurrent_injections);

    auto second = engine->pause_at(virtual_time(17'000));
    engine->resume();
    std::move(second).get(breakpoint_wait);

    auto stats = engine->statistics();
    BOOST_CHECK_EQUAL(stats.active_faults, 0u);
    BOOST_CHECK_EQUAL(stats.interfaces_down, 0u);
    BOOST_CHECK_EQUAL(stats.events_by_kind.at("fault-cleared"), concurrent_injections);
}

/**
 * Property: readers running alongside injections only ever see whole
 * injections: every fault-injected event has its fault registered
 */
BOOST_AUTO_TEST_CASE(readers_see_consistent_snapshots, * boost::unit_test::timeout(60)) {
    auto engine = make_engine();
    engine->start_scenario("day1");
    engine->start();

    auto writer = std::async(std::launch::async, [&engine]() {
        for (std::size_t i = 0; i < concurrent_injections; ++i) {
            engine->inject(FaultKind::INTERFACE_DOWN, interface_target(i), virtual_duration(2'000));
        }
    });

    auto reader = std::async(std::launch::async, [&engine]() {
        std::size_t inconsistent = 0;
        for (std::size_t i = 0; i < concurrent_injections; ++i) {
            auto log = engine->export_log();
            std::size_t injected = 0;
            for (const auto& event : log.events) {
                if (event.kind == "fault-injected") {
                    ++injected;
                }
            }
            if (injected != log.faults.size()) {
                ++inconsistent;
            }
        }
        return inconsistent;
    });

    writer.get();
    BOOST_CHECK_EQUAL(reader.get(), 0u);

    engine->stop();
}

BOOST_AUTO_TEST_SUITE_END()
