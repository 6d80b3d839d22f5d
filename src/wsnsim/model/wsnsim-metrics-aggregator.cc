/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * WSNSIM: round-based wireless sensor network routing simulation
 * Folds round records into a run summary.
 */

#include "wsnsim-metrics-aggregator.h"

#include "ns3/log.h"

#include <algorithm>

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("WsnSimMetricsAggregator");

namespace wsnsim
{

SimulationSummary
MetricsAggregator::Finalize(const std::vector<RoundRecord>& records,
                            uint32_t initialNodeCount,
                            uint32_t roundBound)
{
    NS_LOG_FUNCTION(records.size() << initialNodeCount << roundBound);
    SimulationSummary summary;
    summary.roundsSimulated = static_cast<uint32_t>(records.size());
    summary.finalAliveNodes = records.empty() ? initialNodeCount : records.back().aliveNodes;

    bool exhausted = false;
    double fairnessSum = 0.0;
    for (const auto& record : records)
    {
        summary.totalEnergyConsumed += record.energyConsumed;
        fairnessSum += record.energyFairness;
        summary.packetsSent += record.packetsAttempted;
        summary.packetsReceived += record.packetsDelivered;
        summary.hopAttempts += record.hopAttempts;
        summary.hopSuccesses += record.hopSuccesses;

        if (summary.firstNodeDeath < 0 && record.aliveNodes < initialNodeCount)
        {
            summary.firstNodeDeath = static_cast<int32_t>(record.round);
        }
        if (summary.halfNodesDeath < 0 &&
            2 * static_cast<uint64_t>(record.aliveNodes) <= initialNodeCount)
        {
            summary.halfNodesDeath = static_cast<int32_t>(record.round);
        }
        if (!exhausted && record.aliveNodes == 0)
        {
            exhausted = true;
            summary.networkLifetime = record.round;
        }
    }

    if (!exhausted)
    {
        uint32_t last = records.empty() ? 0 : records.back().round;
        summary.networkLifetime = std::min(last, roundBound);
    }
    if (summary.packetsSent > 0)
    {
        summary.packetDeliveryRatio =
            static_cast<double>(summary.packetsReceived) / summary.packetsSent;
    }
    if (summary.hopAttempts > 0)
    {
        summary.hopDeliveryRatio = static_cast<double>(summary.hopSuccesses) / summary.hopAttempts;
    }
    if (summary.totalEnergyConsumed > 0.0)
    {
        summary.energyEfficiency = summary.packetsReceived / summary.totalEnergyConsumed;
    }
    if (summary.roundsSimulated > 0)
    {
        summary.averageEnergyPerRound = summary.totalEnergyConsumed / summary.roundsSimulated;
        summary.meanEnergyFairness = fairnessSum / summary.roundsSimulated;
    }
    return summary;
}

double
MetricsAggregator::JainIndex(const std::vector<double>& values)
{
    double sum = 0.0;
    double sumSquares = 0.0;
    for (double value : values)
    {
        double x = std::max(0.0, value);
        sum += x;
        sumSquares += x * x;
    }
    if (values.empty() || sum <= 0.0 || sumSquares <= 0.0)
    {
        return 1.0;
    }
    return sum * sum / (values.size() * sumSquares);
}

} // namespace wsnsim
} // namespace ns3
