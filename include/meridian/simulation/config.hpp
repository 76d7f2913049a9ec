#pragma once

#include <meridian/exceptions.hpp>
#include <meridian/simulation/types.hpp>

#include <chrono>
#include <cmath>
#include <cstddef>
#include <map>
#include <string>

namespace meridian::simulation {

struct simulation_config {
    // Wall-clock seconds per virtual second; 0 dispatches as fast as possible
    double _pacing_factor{0.0};
    virtual_duration _arp_offset{10};
    virtual_duration _hello_start_delay{1000};
    std::size_t _hellos_to_full{2};
    std::map<std::string, virtual_duration> _hello_intervals{
        {"ospf", virtual_duration{10'000}},
        {"eigrp", virtual_duration{5'000}},
        {"rip", virtual_duration{30'000}},
        {"bgp", virtual_duration{60'000}},
        {"isis", virtual_duration{10'000}}
    };
    virtual_duration _default_hello_interval{10'000};
    virtual_duration _link_failure_duration{30'000};
    virtual_duration _interface_failure_duration{30'000};
    virtual_duration _device_failure_duration{60'000};

    auto pacing_factor() const -> double { return _pacing_factor; }
    auto arp_offset() const -> virtual_duration { return _arp_offset; }
    auto hello_start_delay() const -> virtual_duration { return _hello_start_delay; }
    auto hellos_to_full() const -> std::size_t { return _hellos_to_full; }
    auto hello_intervals() const -> const std::map<std::string, virtual_duration>& { return _hello_intervals; }
    auto default_hello_interval() const -> virtual_duration { return _default_hello_interval; }
    auto link_failure_duration() const -> virtual_duration { return _link_failure_duration; }
    auto interface_failure_duration() const -> virtual_duration { return _interface_failure_duration; }
    auto device_failure_duration() const -> virtual_duration { return _device_failure_duration; }

    auto hello_interval_for(const std::string& protocol) const -> virtual_duration {
        auto it = _hello_intervals.find(protocol);
        return it == _hello_intervals.end() ? _default_hello_interval : it->second;
    }
};

inline auto validate_simulation_config(const simulation_config& config) -> void {
    if (config._pacing_factor < 0.0 || !std::isfinite(config._pacing_factor)) {
        throw ConfigurationError("pacing_factor must be a non-negative finite number");
    }

    if (config._arp_offset.count() < 0) {
        throw ConfigurationError("arp_offset must not be negative");
    }

    if (config._hello_start_delay.count() < 0) {
        throw ConfigurationError("hello_start_delay must not be negative");
    }

    if (config._hellos_to_full == 0) {
        throw ConfigurationError("hellos_to_full must be greater than 0");
    }

    if (config._default_hello_interval.count() <= 0) {
        throw ConfigurationError("default_hello_interval must be positive");
    }

    for (const auto& [protocol, interval] : config._hello_intervals) {
        if (interval.count() <= 0) {
            throw ConfigurationError("hello interval for " + protocol + " must be positive");
        }
    }

    if (config._link_failure_duration.count() <= 0
        || config._interface_failure_duration.count() <= 0
        || config._device_failure_duration.count() <= 0) {
        throw ConfigurationError("scenario fault durations must be positive");
    }
}

} // namespace meridian::simulation
