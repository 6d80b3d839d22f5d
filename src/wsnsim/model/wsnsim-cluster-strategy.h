/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * WSNSIM: round-based wireless sensor network routing simulation
 * Cluster-head selection strategy.
 */

#ifndef WSNSIM_CLUSTER_STRATEGY_H
#define WSNSIM_CLUSTER_STRATEGY_H

#include "wsnsim-topology-strategy.h"

#include <map>
#include <vector>

namespace ns3
{
namespace wsnsim
{

/**
 * @ingroup wsnsim
 * @brief How cluster heads are picked from the scored nodes.
 */
enum class SelectionPolicy : uint8_t
{
    PROBABILISTIC, ///< LEACH threshold scaled by the relative score
    TOP_K,         ///< the round(p * alive) best scores
};

std::ostream& operator<<(std::ostream& os, SelectionPolicy policy);

/**
 * @ingroup wsnsim
 * @brief Clustering strategy with composite-score head selection.
 *
 * Every alive node gets a score in [0, 1]:
 *
 *   ( w_E * residual energy ratio + w_S * sink proximity
 *   + w_C * centrality            + w_L * link quality )
 *   * (1 - FairnessPenalty * usage penalty)
 *
 * Heads are picked from the scores according to the SelectionPolicy, then
 * every other alive node joins the head with the best expected link
 * (0.6 * expected PDR + 0.4 * closeness).  When no head gets picked, the
 * highest-energy node is forced to be head unless ForceHeadFallback is off,
 * in which case every node sends straight to the sink.
 */
class ClusterTopologyStrategy : public TopologyStrategy
{
  public:
    /**
     * @brief Get the type ID.
     * @return the object TypeId
     */
    static TypeId GetTypeId();

    ClusterTopologyStrategy();
    ~ClusterTopologyStrategy() override;

    TopologyKind GetKind() const override;
    TopologyAssignment Compute(const SensorNetwork& network,
                               uint32_t round,
                               RandomStreams& rng) override;
    void Repair(TopologyAssignment& assignment,
                const SensorNetwork& network,
                uint32_t round) override;

    /**
     * @param network the network
     * @param id an alive node
     * @param alive all alive node ids
     * @return the composite head score of the node
     */
    double HeadScore(const SensorNetwork& network,
                     uint32_t id,
                     const std::vector<uint32_t>& alive) const;

    /**
     * @param network the network
     * @param id an alive node
     * @param alive all alive node ids
     * @return 1 - min(mean distance to in-range neighbours / range, 1), 0 without neighbours
     */
    double Centrality(const SensorNetwork& network,
                      uint32_t id,
                      const std::vector<uint32_t>& alive) const;

    /**
     * @param node a node
     * @return 0.5 RSSI + 0.3 LQI + 0.2 PDR, each normalized from the node history
     */
    double LinkQualityScore(const SensorNode& node) const;

    /**
     * @param network the network
     * @param member the joining node
     * @param head a candidate head
     * @return the join score of the member to head link
     */
    double JoinScore(const SensorNetwork& network, uint32_t member, uint32_t head) const;

    /**
     * @param round current round, starting at 1
     * @return the LEACH threshold T(r)
     */
    double Threshold(uint32_t round) const;

    /// @return the number of rounds of one head rotation epoch, round(1/p)
    uint32_t GetEpochLength() const;

    /**
     * @brief Over-use of a node as head.
     *
     * With u the share of the head selections so far that picked the node,
     * the penalty is min(1, max(0, u - p) / (1 - p)): zero up to the target
     * head fraction, one for a node that was head every time.
     *
     * @param id node id
     * @return the penalty in [0, 1], 0 before the first selection
     */
    double UsagePenalty(uint32_t id) const;

    /**
     * @param id node id
     * @return how many selections made the node head, repairs included
     */
    uint32_t GetHeadUsage(uint32_t id) const;

  private:
    /**
     * @param network the network
     * @param alive alive ids
     * @param round current round
     * @param rng the run's random streams
     * @return the elected heads
     */
    std::vector<uint32_t> SelectProbabilistic(const SensorNetwork& network,
                                              const std::vector<uint32_t>& alive,
                                              uint32_t round,
                                              RandomStreams& rng);

    /**
     * @param network the network
     * @param alive alive ids
     * @return the elected heads
     */
    std::vector<uint32_t> SelectTopK(const SensorNetwork& network,
                                     const std::vector<uint32_t>& alive) const;

    /**
     * @param network the network
     * @param candidates non-empty candidate ids
     * @return the highest-energy candidate, lowest id on ties
     */
    uint32_t FallbackHead(const SensorNetwork& network,
                          const std::vector<uint32_t>& candidates) const;

    /**
     * Attach nodes to their best head, or to the direct-to-sink group when
     * there is no head.
     * @param assignment the assignment
     * @param network the network
     * @param nodes the non-head nodes to place
     */
    void AttachMembers(TopologyAssignment& assignment,
                       const SensorNetwork& network,
                       const std::vector<uint32_t>& nodes) const;

    double m_headFraction;      ///< target head fraction p
    SelectionPolicy m_policy;   ///< how heads are picked
    double m_energyWeight;      ///< weight of the residual energy ratio
    double m_sinkWeight;        ///< weight of the sink proximity
    double m_centralityWeight;  ///< weight of the centrality
    double m_linkWeight;        ///< weight of the link quality
    double m_range;             ///< communication range for centrality and join (m)
    bool m_forceHead;           ///< force one head when none is elected
    bool m_epochRotation;       ///< exclude recent heads until the epoch ends
    double m_fairnessPenalty;   ///< score discount for over-used heads

    std::map<uint32_t, uint32_t> m_lastHeadRound; ///< node id to last round as head
    std::map<uint32_t, uint32_t> m_headUsage;     ///< node id to times picked as head
    uint32_t m_selections;                        ///< head selections made so far
};

} // namespace wsnsim
} // namespace ns3

#endif /* WSNSIM_CLUSTER_STRATEGY_H */
