/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * WSNSIM: round-based wireless sensor network routing simulation
 * Per-round and per-run result records.
 */

#ifndef WSNSIM_ROUND_RECORD_H
#define WSNSIM_ROUND_RECORD_H

#include "wsnsim-channel-model.h"

#include <cstdint>
#include <ostream>

namespace ns3
{
namespace wsnsim
{

/**
 * @ingroup wsnsim
 * @brief Running means of the link samples observed in a round.
 */
struct LinkQualityAggregate
{
    LinkQualityAggregate();

    /**
     * @param metrics one transmission's metrics
     */
    void Add(const LinkMetrics& metrics);

    uint32_t samples;   ///< number of samples
    double meanRssiDbm; ///< mean RSSI (dBm), 0 without samples
    double meanLqi;     ///< mean LQI, 0 without samples
    double meanPdr;     ///< mean predicted PDR, 0 without samples
};

/**
 * @ingroup wsnsim
 * @brief Outcome of one simulated round.
 *
 * packetsAttempted counts source readings generated this round and
 * packetsDelivered those that reached the sink; their ratio is the
 * end-to-end delivery ratio.  hopAttempts and hopSuccesses count individual
 * transmissions and are diagnostics only.
 */
struct RoundRecord
{
    RoundRecord();

    uint32_t round;                   ///< round index, starting at 1
    uint32_t aliveNodes;              ///< alive nodes at the end of the round
    uint32_t leaders;                 ///< heads, or 1 for a chain leader
    uint32_t packetsAttempted;        ///< source readings generated
    uint32_t packetsDelivered;        ///< source readings that reached the sink
    double energyConsumed;            ///< energy drawn from batteries this round (J)
    double residualEnergy;            ///< total residual energy at the end of the round (J)
    uint32_t hopAttempts;             ///< transmissions attempted
    uint32_t hopSuccesses;            ///< transmissions received
    uint32_t deaths;                  ///< nodes that died this round
    double energyFairness;            ///< Jain index of alive residual energies, 1 if none
    LinkQualityAggregate linkQuality; ///< link samples of the round
};

std::ostream& operator<<(std::ostream& os, const RoundRecord& record);

/**
 * @ingroup wsnsim
 * @brief Aggregate result of one run.
 */
struct SimulationSummary
{
    SimulationSummary();

    uint32_t networkLifetime;     ///< first round with no alive node, else last round simulated
    uint32_t roundsSimulated;     ///< number of round records
    double totalEnergyConsumed;   ///< sum of energyConsumed (J)
    uint64_t packetsSent;         ///< sum of packetsAttempted
    uint64_t packetsReceived;     ///< sum of packetsDelivered
    double packetDeliveryRatio;   ///< packetsReceived / packetsSent, 0 without packets
    double energyEfficiency;      ///< packets delivered per joule, 0 without energy
    int32_t firstNodeDeath;       ///< first round with a dead node, -1 if none
    int32_t halfNodesDeath;       ///< first round with at least half the nodes dead, -1 if none
    uint32_t finalAliveNodes;     ///< alive nodes after the last round
    double averageEnergyPerRound; ///< totalEnergyConsumed / roundsSimulated
    uint64_t hopAttempts;         ///< sum of hopAttempts
    uint64_t hopSuccesses;        ///< sum of hopSuccesses
    double hopDeliveryRatio;      ///< hopSuccesses / hopAttempts, 0 without attempts
    double meanEnergyFairness;    ///< mean of energyFairness over the rounds, 1 without rounds

    /**
     * Print a human readable report.
     * @param os the output stream
     */
    void Print(std::ostream& os) const;
};

std::ostream& operator<<(std::ostream& os, const SimulationSummary& summary);

} // namespace wsnsim
} // namespace ns3

#endif /* WSNSIM_ROUND_RECORD_H */
