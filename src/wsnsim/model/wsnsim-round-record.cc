/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * WSNSIM: round-based wireless sensor network routing simulation
 * Per-round and per-run result records.
 */

#include "wsnsim-round-record.h"

#include <iomanip>

namespace ns3
{
namespace wsnsim
{

LinkQualityAggregate::LinkQualityAggregate()
    : samples(0),
      meanRssiDbm(0.0),
      meanLqi(0.0),
      meanPdr(0.0)
{
}

void
LinkQualityAggregate::Add(const LinkMetrics& metrics)
{
    ++samples;
    meanRssiDbm += (metrics.rssiDbm - meanRssiDbm) / samples;
    meanLqi += (metrics.lqi - meanLqi) / samples;
    meanPdr += (metrics.pdr - meanPdr) / samples;
}

RoundRecord::RoundRecord()
    : round(0),
      aliveNodes(0),
      leaders(0),
      packetsAttempted(0),
      packetsDelivered(0),
      energyConsumed(0.0),
      residualEnergy(0.0),
      hopAttempts(0),
      hopSuccesses(0),
      deaths(0),
      energyFairness(1.0)
{
}

std::ostream&
operator<<(std::ostream& os, const RoundRecord& record)
{
    os << "round " << record.round << " alive " << record.aliveNodes << " leaders "
       << record.leaders << " delivered " << record.packetsDelivered << "/"
       << record.packetsAttempted << " energy " << record.energyConsumed << " J";
    return os;
}

SimulationSummary::SimulationSummary()
    : networkLifetime(0),
      roundsSimulated(0),
      totalEnergyConsumed(0.0),
      packetsSent(0),
      packetsReceived(0),
      packetDeliveryRatio(0.0),
      energyEfficiency(0.0),
      firstNodeDeath(-1),
      halfNodesDeath(-1),
      finalAliveNodes(0),
      averageEnergyPerRound(0.0),
      hopAttempts(0),
      hopSuccesses(0),
      hopDeliveryRatio(0.0),
      meanEnergyFairness(1.0)
{
}

void
SimulationSummary::Print(std::ostream& os) const
{
    std::ios oldState(nullptr);
    oldState.copyfmt(os);
    os << std::fixed << std::setprecision(4);
    os << "  Network lifetime:       " << networkLifetime << " rounds" << std::endl;
    os << "  Rounds simulated:       " << roundsSimulated << std::endl;
    os << "  First node death:       " << firstNodeDeath << std::endl;
    os << "  Half nodes death:       " << halfNodesDeath << std::endl;
    os << "  Final alive nodes:      " << finalAliveNodes << std::endl;
    os << "  Total energy:           " << totalEnergyConsumed << " J" << std::endl;
    os << "  Energy per round:       " << averageEnergyPerRound << " J" << std::endl;
    os << "  Packets sent/received:  " << packetsSent << "/" << packetsReceived << std::endl;
    os << "  End-to-end PDR:         " << packetDeliveryRatio << std::endl;
    os << "  Per-hop PDR:            " << hopDeliveryRatio << std::endl;
    os << "  Energy efficiency:      " << energyEfficiency << " packets/J" << std::endl;
    os << "  Energy fairness:        " << meanEnergyFairness << std::endl;
    os.copyfmt(oldState);
}

std::ostream&
operator<<(std::ostream& os, const SimulationSummary& summary)
{
    summary.Print(os);
    return os;
}

} // namespace wsnsim
} // namespace ns3
