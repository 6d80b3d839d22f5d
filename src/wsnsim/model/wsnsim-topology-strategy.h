/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * WSNSIM: round-based wireless sensor network routing simulation
 * Base class of the topology formation strategies.
 */

#ifndef WSNSIM_TOPOLOGY_STRATEGY_H
#define WSNSIM_TOPOLOGY_STRATEGY_H

#include "wsnsim-channel-model.h"
#include "wsnsim-environment.h"
#include "wsnsim-random-streams.h"
#include "wsnsim-sensor-node.h"
#include "wsnsim-topology.h"

#include "ns3/object.h"

#include <vector>

namespace ns3
{
namespace wsnsim
{

/**
 * @ingroup wsnsim
 * @brief Radio settings a strategy needs to rate candidate links.
 *
 * Strategies evaluate links on the mean channel only, so they never draw
 * from the run's random streams for link rating.
 */
struct LinkContext
{
    LinkContext();

    ChannelModel channel;                          ///< channel model of the run
    EnvironmentProfile environment;                ///< propagation environment
    std::vector<InterferenceSource> interference;  ///< active interferers
    double txPowerDbm;                             ///< transmit power (dBm)
};

/**
 * @ingroup wsnsim
 * @brief Produces the per-round role assignment of the network.
 *
 * Concrete strategies build a fresh TopologyAssignment with Compute() when
 * the recluster cadence is due, and patch the previous one with Repair()
 * on the rounds in between so that it never references a dead node.
 */
class TopologyStrategy : public Object
{
  public:
    /**
     * @brief Get the type ID.
     * @return the object TypeId
     */
    static TypeId GetTypeId();

    TopologyStrategy();
    ~TopologyStrategy() override;

    /// @return the shape of the assignments this strategy produces
    virtual TopologyKind GetKind() const = 0;

    /**
     * @brief Build a new assignment over the alive nodes.
     * @param network the network
     * @param round current round, starting at 1
     * @param rng the run's random streams
     * @return the assignment
     */
    virtual TopologyAssignment Compute(const SensorNetwork& network,
                                       uint32_t round,
                                       RandomStreams& rng) = 0;

    /**
     * @brief Make a previous assignment consistent with the alive nodes.
     * @param assignment [in,out] the assignment to patch
     * @param network the network
     * @param round current round, starting at 1
     */
    virtual void Repair(TopologyAssignment& assignment,
                        const SensorNetwork& network,
                        uint32_t round) = 0;

    /**
     * @param round current round, starting at 1
     * @return true if Compute() is due in this round
     */
    bool IsRecomputeDue(uint32_t round) const;

    /**
     * @param context radio settings of the run
     */
    void SetLinkContext(const LinkContext& context);

    /// @return radio settings of the run
    const LinkContext& GetLinkContext() const
    {
        return m_link;
    }

  protected:
    /**
     * @param network the network
     * @param from sender id
     * @param to receiver id
     * @return mean-channel metrics of the link
     */
    LinkMetrics ExpectedLink(const SensorNetwork& network, uint32_t from, uint32_t to) const;

    uint32_t m_reclusterInterval; ///< rounds between two Compute() calls
    LinkContext m_link;           ///< radio settings
};

} // namespace wsnsim
} // namespace ns3

#endif /* WSNSIM_TOPOLOGY_STRATEGY_H */
