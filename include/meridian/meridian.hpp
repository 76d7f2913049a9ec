#pragma once

// Main header file for the meridian library
// Include this file to access topology inference and the simulation engine

#include <meridian/exceptions.hpp>
#include <meridian/logger.hpp>
#include <meridian/console_logger.hpp>
#include <meridian/metrics.hpp>
#include <meridian/state_machines.hpp>
#include <meridian/json_serializer.hpp>
#include <meridian/topology/ipv4.hpp>
#include <meridian/topology/device.hpp>
#include <meridian/topology/types.hpp>
#include <meridian/topology/topology.hpp>
#include <meridian/topology/generator.hpp>
#include <meridian/topology/topology_export.hpp>
#include <meridian/simulation/types.hpp>
#include <meridian/simulation/config.hpp>
#include <meridian/simulation/scheduler.hpp>
#include <meridian/simulation/engine.hpp>

namespace meridian {

// Version information
inline constexpr int version_major = 0;
inline constexpr int version_minor = 1;
inline constexpr int version_patch = 0;

// Convenience aliases for the default generator and engine
using DefaultTopologyGenerator = topology::TopologyGenerator<console_logger>;
using DefaultSimulationEngine = simulation::SimulationEngine<simulation::DefaultSimulationTypes>;

} // namespace meridian
