#pragma once

#include <chrono>
#include <concepts>
#include <cstdint>
#include <string_view>

namespace meridian {

// Metrics sink concept. The engine copies its prototype once per emission,
// names it, attaches dimensions and emits.
template<typename M>
concept metrics = std::copy_constructible<M> && requires(
    M metric,
    std::string_view name,
    std::string_view dimension_name,
    std::string_view dimension_value,
    std::int64_t count,
    std::chrono::nanoseconds duration,
    double value
) {
    { metric.set_metric_name(name) } -> std::same_as<void>;
    { metric.add_dimension(dimension_name, dimension_value) } -> std::same_as<void>;
    
    { metric.add_one() } -> std::same_as<void>;
    { metric.add_count(count) } -> std::same_as<void>;
    { metric.add_duration(duration) } -> std::same_as<void>;
    { metric.add_value(value) } -> std::same_as<void>;
    
    { metric.emit() } -> std::same_as<void>;
};

// Discards everything
class noop_metrics {
public:
    auto set_metric_name([[maybe_unused]] std::string_view name) -> void {}
    
    auto add_dimension(
        [[maybe_unused]] std::string_view dimension_name,
        [[maybe_unused]] std::string_view dimension_value
    ) -> void {}
    
    auto add_one() -> void {}
    auto add_count([[maybe_unused]] std::int64_t count) -> void {}
    auto add_duration([[maybe_unused]] std::chrono::nanoseconds duration) -> void {}
    auto add_value([[maybe_unused]] double value) -> void {}
    
    auto emit() -> void {}
};

static_assert(metrics<noop_metrics>, "noop_metrics must satisfy metrics concept");

// Counters emitted by the simulation engine, each with one dimension
namespace metric_names {
    // dimension "mode": running, paused or stopped
    inline constexpr std::string_view run_mode_changed = "simulation.run_mode.changed";
    // dimension "kind": the event kind name, e.g. ospf-hello
    inline constexpr std::string_view event_dispatched = "simulation.event.dispatched";
    // dimension "kind": the fault kind name
    inline constexpr std::string_view fault_injected = "simulation.fault.injected";
    inline constexpr std::string_view fault_cleared = "simulation.fault.cleared";
}

} // namespace meridian
