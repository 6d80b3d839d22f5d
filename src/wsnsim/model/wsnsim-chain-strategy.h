/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * WSNSIM: round-based wireless sensor network routing simulation
 * Greedy chain construction strategy.
 */

#ifndef WSNSIM_CHAIN_STRATEGY_H
#define WSNSIM_CHAIN_STRATEGY_H

#include "wsnsim-topology-strategy.h"

#include <vector>

namespace ns3
{
namespace wsnsim
{

/**
 * @ingroup wsnsim
 * @brief PEGASIS-style chain strategy.
 *
 * The chain starts at the alive node farthest from the sink and greedily
 * appends the nearest unvisited alive node.  Data flows along the chain
 * towards the leader, which forwards the fused packet to the sink.  The
 * leader position advances every LeaderRotationInterval rounds.
 */
class ChainTopologyStrategy : public TopologyStrategy
{
  public:
    /**
     * @brief Get the type ID.
     * @return the object TypeId
     */
    static TypeId GetTypeId();

    ChainTopologyStrategy();
    ~ChainTopologyStrategy() override;

    TopologyKind GetKind() const override;
    TopologyAssignment Compute(const SensorNetwork& network,
                               uint32_t round,
                               RandomStreams& rng) override;
    void Repair(TopologyAssignment& assignment,
                const SensorNetwork& network,
                uint32_t round) override;

    /**
     * @brief Greedy nearest-neighbour chain, ties broken by lowest id.
     * @param network the network
     * @param nodes the ids to chain
     * @return a permutation of @p nodes
     */
    static std::vector<uint32_t> BuildChain(const SensorNetwork& network,
                                            const std::vector<uint32_t>& nodes);

    /**
     * @param round current round, starting at 1
     * @param length chain length
     * @return ((round - 1) / interval) mod length, 0 for an empty chain
     */
    uint32_t LeaderIndex(uint32_t round, uint32_t length) const;

  private:
    uint32_t m_rotationInterval; ///< rounds between two leader moves
};

} // namespace wsnsim
} // namespace ns3

#endif /* WSNSIM_CHAIN_STRATEGY_H */
