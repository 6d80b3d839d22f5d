/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * WSNSIM: round-based wireless sensor network routing simulation
 * Run configuration and protocol presets.
 */

#include "wsnsim-simulation-config.h"

#include "ns3/log.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("WsnSimSimulationConfig");

namespace wsnsim
{

SimulationConfig::SimulationConfig()
    : nNodes(100),
      areaWidth(100.0),
      areaHeight(100.0),
      sinkPosition(50.0, 175.0, 0.0),
      initialEnergy(2.0),
      packetBits(4000),
      txPowerDbm(0.0),
      environment(EnvironmentType::INDOOR_OFFICE),
      platform(HardwarePlatform::GENERIC),
      topology(TopologyKind::CLUSTER),
      selection(SelectionPolicy::PROBABILISTIC),
      headFraction(0.1),
      energyWeight(0.4),
      sinkWeight(0.2),
      centralityWeight(0.2),
      linkQualityWeight(0.2),
      fairnessPenalty(0.0),
      communicationRange(50.0),
      reclusterInterval(1),
      leaderRotationInterval(1),
      forceHeadFallback(true),
      epochRotation(true),
      reporting(ReportingMode::PERIODIC),
      hardThreshold(70.0),
      softThreshold(2.0),
      maxReportInterval(10),
      sensing(true),
      historyLength(100),
      roundBound(2000),
      seed(1)
{
}

bool
SimulationConfig::Validate(std::string* reason) const
{
    std::ostringstream oss;
    if (nNodes == 0)
    {
        oss << "node count must be positive";
    }
    else if (!std::isfinite(initialEnergy) || initialEnergy <= 0.0)
    {
        oss << "initial energy must be positive and finite, got " << initialEnergy;
    }
    else if (packetBits == 0)
    {
        oss << "packet size must be positive";
    }
    else if (positions.empty() &&
             (!std::isfinite(areaWidth) || !std::isfinite(areaHeight) || areaWidth <= 0.0 ||
              areaHeight <= 0.0))
    {
        oss << "deployment area must be positive, got " << areaWidth << " x " << areaHeight;
    }
    else if (!positions.empty() && positions.size() != nNodes)
    {
        oss << "got " << positions.size() << " positions for " << nNodes << " nodes";
    }
    else if (!(headFraction >= 0.0 && headFraction <= 1.0))
    {
        oss << "head fraction must lie in [0, 1], got " << headFraction;
    }
    else if (energyWeight < 0.0 || sinkWeight < 0.0 || centralityWeight < 0.0 ||
             linkQualityWeight < 0.0)
    {
        oss << "head score weights must be non-negative";
    }
    else if (!(fairnessPenalty >= 0.0 && fairnessPenalty <= 1.0))
    {
        oss << "fairness penalty must lie in [0, 1], got " << fairnessPenalty;
    }
    else if (!std::isfinite(hardThreshold) || !std::isfinite(softThreshold) ||
             softThreshold < 0.0)
    {
        oss << "reporting thresholds must be finite and the soft one non-negative";
    }
    else if (maxReportInterval == 0)
    {
        oss << "maximum report interval must be at least one round";
    }
    else if (!(communicationRange > 0.0))
    {
        oss << "communication range must be positive";
    }
    else if (reclusterInterval == 0)
    {
        oss << "recluster interval must be at least one round";
    }
    else if (leaderRotationInterval == 0)
    {
        oss << "leader rotation interval must be at least one round";
    }
    else if (roundBound == 0)
    {
        oss << "round bound must be positive";
    }
    else if (!std::isfinite(txPowerDbm))
    {
        oss << "transmit power must be finite";
    }

    if (oss.tellp() == 0)
    {
        return true;
    }
    NS_LOG_LOGIC("Invalid configuration: " << oss.str());
    if (reason)
    {
        *reason = oss.str();
    }
    return false;
}

// ============================================================================
// Presets
// ============================================================================

void
ApplyPreset(SimulationConfig& config, ProtocolPreset preset)
{
    NS_LOG_FUNCTION(&config << preset);
    switch (preset)
    {
    case ProtocolPreset::LEACH:
        // plain LEACH: election on the threshold alone
        config.topology = TopologyKind::CLUSTER;
        config.selection = SelectionPolicy::PROBABILISTIC;
        config.energyWeight = 0.0;
        config.sinkWeight = 0.0;
        config.centralityWeight = 0.0;
        config.linkQualityWeight = 0.0;
        config.fairnessPenalty = 0.0;
        config.forceHeadFallback = false;
        config.epochRotation = true;
        config.reclusterInterval = 1;
        config.reporting = ReportingMode::PERIODIC;
        break;
    case ProtocolPreset::HEED:
        config.topology = TopologyKind::CLUSTER;
        config.selection = SelectionPolicy::TOP_K;
        config.energyWeight = 0.7;
        config.sinkWeight = 0.0;
        config.centralityWeight = 0.3;
        config.linkQualityWeight = 0.0;
        config.fairnessPenalty = 0.0;
        config.forceHeadFallback = true;
        config.epochRotation = false;
        config.reclusterInterval = 1;
        config.reporting = ReportingMode::PERIODIC;
        break;
    case ProtocolPreset::PEGASIS:
        config.topology = TopologyKind::CHAIN;
        config.reclusterInterval = 1;
        config.leaderRotationInterval = 1;
        config.reporting = ReportingMode::PERIODIC;
        break;
    case ProtocolPreset::EEHFR:
        config.topology = TopologyKind::CLUSTER;
        config.selection = SelectionPolicy::PROBABILISTIC;
        config.energyWeight = 0.4;
        config.sinkWeight = 0.2;
        config.centralityWeight = 0.2;
        config.linkQualityWeight = 0.2;
        config.fairnessPenalty = 0.25;
        config.forceHeadFallback = true;
        config.epochRotation = true;
        config.reclusterInterval = 1;
        config.reporting = ReportingMode::PERIODIC;
        break;
    case ProtocolPreset::TEEN:
        // LEACH clusters kept for a whole reporting window
        config.topology = TopologyKind::CLUSTER;
        config.selection = SelectionPolicy::PROBABILISTIC;
        config.energyWeight = 0.0;
        config.sinkWeight = 0.0;
        config.centralityWeight = 0.0;
        config.linkQualityWeight = 0.0;
        config.fairnessPenalty = 0.0;
        config.forceHeadFallback = true;
        config.epochRotation = true;
        config.reclusterInterval = 20;
        config.reporting = ReportingMode::THRESHOLD;
        break;
    }
}

bool
PresetFromString(const std::string& name, ProtocolPreset& preset)
{
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    for (auto p : {ProtocolPreset::LEACH,
                   ProtocolPreset::HEED,
                   ProtocolPreset::PEGASIS,
                   ProtocolPreset::EEHFR,
                   ProtocolPreset::TEEN})
    {
        if (PresetToString(p) == upper)
        {
            preset = p;
            return true;
        }
    }
    NS_LOG_LOGIC("Unknown preset name " << name);
    return false;
}

std::string
PresetToString(ProtocolPreset preset)
{
    switch (preset)
    {
    case ProtocolPreset::LEACH:
        return "LEACH";
    case ProtocolPreset::HEED:
        return "HEED";
    case ProtocolPreset::PEGASIS:
        return "PEGASIS";
    case ProtocolPreset::EEHFR:
        return "EEHFR";
    case ProtocolPreset::TEEN:
        return "TEEN";
    }
    return "UNKNOWN";
}

std::ostream&
operator<<(std::ostream& os, ProtocolPreset preset)
{
    return os << PresetToString(preset);
}

} // namespace wsnsim
} // namespace ns3
