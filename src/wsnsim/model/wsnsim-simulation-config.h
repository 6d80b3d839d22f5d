/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * WSNSIM: round-based wireless sensor network routing simulation
 * Run configuration and protocol presets.
 */

#ifndef WSNSIM_SIMULATION_CONFIG_H
#define WSNSIM_SIMULATION_CONFIG_H

#include "wsnsim-cluster-strategy.h"
#include "wsnsim-energy-model.h"
#include "wsnsim-environment.h"
#include "wsnsim-threshold-reporter.h"
#include "wsnsim-topology.h"

#include "ns3/vector.h"

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace ns3
{
namespace wsnsim
{

/**
 * @ingroup wsnsim
 * @brief Named parameter sets of well-known protocols.
 */
enum class ProtocolPreset : uint8_t
{
    LEACH,   ///< probabilistic clusters, no forced head
    HEED,    ///< energy-dominated top-k clusters
    PEGASIS, ///< greedy chain
    EEHFR,   ///< composite-score probabilistic clusters with forced head
    TEEN,    ///< LEACH clusters with threshold-gated reporting
};

/**
 * @ingroup wsnsim
 * @brief Everything needed to start one run.
 *
 * A plain value; the constructor sets the documented defaults.  Call
 * Validate() before use, RoundSimulator does so and aborts on failure.
 */
struct SimulationConfig
{
    SimulationConfig();

    /**
     * @param reason [out] optional; receives the first problem found
     * @return true if the configuration can be simulated
     */
    bool Validate(std::string* reason = nullptr) const;

    /// @name Deployment
    //\{
    uint32_t nNodes;              ///< number of sensor nodes
    double areaWidth;             ///< deployment area width (m)
    double areaHeight;            ///< deployment area height (m)
    Vector sinkPosition;          ///< base station position
    std::vector<Vector> positions; ///< explicit node positions; empty for random placement
    double initialEnergy;         ///< initial energy per node (J)
    //\}

    /// @name Radio
    //\{
    uint32_t packetBits;                          ///< data packet size (bits)
    double txPowerDbm;                            ///< transmit power (dBm)
    EnvironmentType environment;                  ///< propagation environment
    HardwarePlatform platform;                    ///< energy profile
    std::vector<InterferenceSource> interference; ///< active interferers
    //\}

    /// @name Topology
    //\{
    TopologyKind topology;           ///< clusters or chain
    SelectionPolicy selection;       ///< cluster head selection policy
    double headFraction;             ///< target head fraction p
    double energyWeight;             ///< head score weight of residual energy
    double sinkWeight;               ///< head score weight of sink proximity
    double centralityWeight;         ///< head score weight of centrality
    double linkQualityWeight;        ///< head score weight of link quality
    double fairnessPenalty;          ///< head score discount for over-used heads, in [0, 1]
    double communicationRange;       ///< neighbourhood radius (m)
    uint32_t reclusterInterval;      ///< rounds between topology recomputations
    uint32_t leaderRotationInterval; ///< rounds between chain leader moves
    bool forceHeadFallback;          ///< force one head when none is elected
    bool epochRotation;              ///< LEACH epoch rotation of heads
    //\}

    /// @name Reporting
    //\{
    ReportingMode reporting;    ///< periodic or threshold-gated readings
    double hardThreshold;       ///< sensed value below which nothing is reported
    double softThreshold;       ///< minimum change since the last report
    uint32_t maxReportInterval; ///< rounds after which a report is due anyway
    //\}

    /// @name Run
    //\{
    bool sensing;           ///< charge sensing energy per reading
    uint32_t historyLength; ///< link history bound per node
    uint32_t roundBound;    ///< maximum number of rounds
    uint32_t seed;          ///< random stream seed
    //\}
};

/**
 * @brief Overwrite the topology fields of a configuration with a preset.
 * @param config [in,out] the configuration
 * @param preset the preset
 */
void ApplyPreset(SimulationConfig& config, ProtocolPreset preset);

/**
 * @brief Parse a preset name, case insensitive ("leach", "HEED", ...).
 * @param name the name
 * @param preset [out] the parsed preset
 * @return false if the name is unknown
 */
bool PresetFromString(const std::string& name, ProtocolPreset& preset);

/**
 * @param preset the preset
 * @return its upper-case name
 */
std::string PresetToString(ProtocolPreset preset);

std::ostream& operator<<(std::ostream& os, ProtocolPreset preset);

} // namespace wsnsim
} // namespace ns3

#endif /* WSNSIM_SIMULATION_CONFIG_H */
