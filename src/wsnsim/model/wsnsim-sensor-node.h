/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * WSNSIM: round-based wireless sensor network routing simulation
 * Sensor node state and the network arena that owns it.
 */

#ifndef WSNSIM_SENSOR_NODE_H
#define WSNSIM_SENSOR_NODE_H

#include "wsnsim-random-streams.h"

#include "ns3/vector.h"

#include <cstdint>
#include <deque>
#include <limits>
#include <ostream>
#include <vector>

namespace ns3
{
namespace wsnsim
{

/// Group id of nodes that send straight to the sink.
constexpr uint32_t DIRECT_TO_SINK = std::numeric_limits<uint32_t>::max();

/**
 * @ingroup wsnsim
 * @brief Role of an alive node in the current topology.
 */
enum class NodeRole : uint8_t
{
    MEMBER,     ///< Cluster member, or chain-less direct sender
    HEAD,       ///< Cluster head
    CHAIN_NODE, ///< Position in a chain; the leader is also a chain node
};

std::ostream& operator<<(std::ostream& os, NodeRole role);

/**
 * @ingroup wsnsim
 * @brief One observed link-quality sample.
 */
struct LinkSample
{
    double rssiDbm; ///< measured RSSI
    uint8_t lqi;    ///< link quality indicator
    double pdr;     ///< predicted delivery probability
};

/**
 * @ingroup wsnsim
 * @brief Mutable per-node record.
 *
 * A node is alive while its residual energy is strictly positive.  Energy
 * only decreases, through Debit(), and a dead node never comes back.
 */
class SensorNode
{
  public:
    /**
     * constructor
     * @param id node id, equal to its index in the owning SensorNetwork
     * @param position 2-D position (z ignored)
     * @param initialEnergy initial energy (J)
     * @param historyLength maximum number of link samples kept
     */
    SensorNode(uint32_t id, const Vector& position, double initialEnergy, uint32_t historyLength);

    /// @return the node id
    uint32_t GetId() const
    {
        return m_id;
    }

    /// @return the node position
    const Vector& GetPosition() const
    {
        return m_position;
    }

    /// @return the initial energy (J)
    double GetInitialEnergy() const
    {
        return m_initialEnergy;
    }

    /// @return the residual energy (J)
    double GetEnergy() const
    {
        return m_energy;
    }

    /// @return the residual energy divided by the initial energy
    double GetEnergyRatio() const;

    /// @return initial minus residual energy (J)
    double GetConsumedEnergy() const
    {
        return m_initialEnergy - m_energy;
    }

    /// @return the sum of every requested debit, including those on a dead node (J)
    double GetAttemptedEnergy() const
    {
        return m_attemptedEnergy;
    }

    /// @return true while residual energy is strictly positive
    bool IsAlive() const
    {
        return m_energy > 0.0;
    }

    /**
     * @brief Draw energy from the battery.
     *
     * The residual energy is clamped at zero.  The requested amount is
     * always added to the attempted energy, even on a dead node.
     *
     * @param joules requested energy; negative values are ignored
     * @return the energy actually drawn, in [0, joules]
     */
    double Debit(double joules);

    /// @return the current role
    NodeRole GetRole() const
    {
        return m_role;
    }

    /**
     * @param role the new role
     */
    void SetRole(NodeRole role)
    {
        m_role = role;
    }

    /// @return the group id (head id, or a sentinel)
    uint32_t GetGroupId() const
    {
        return m_groupId;
    }

    /**
     * @param groupId the new group id
     */
    void SetGroupId(uint32_t groupId)
    {
        m_groupId = groupId;
    }

    /**
     * Append a sample, evicting the oldest one once the history is full.
     * @param sample the sample
     */
    void AddLinkSample(const LinkSample& sample);

    /// @return the number of samples currently held
    uint32_t GetHistorySize() const
    {
        return static_cast<uint32_t>(m_history.size());
    }

    /// @return the retained samples, oldest first
    const std::deque<LinkSample>& GetHistory() const
    {
        return m_history;
    }

    /**
     * @param fallback value returned when the history is empty
     * @return the mean RSSI of the history
     */
    double GetMeanRssi(double fallback) const;

    /**
     * @param fallback value returned when the history is empty
     * @return the mean LQI of the history
     */
    double GetMeanLqi(double fallback) const;

    /**
     * @param fallback value returned when the history is empty
     * @return the mean PDR of the history
     */
    double GetMeanPdr(double fallback) const;

    /**
     * @param position another position
     * @return the planar distance to it (m)
     */
    double DistanceTo(const Vector& position) const;

  private:
    uint32_t m_id;                   ///< node id
    Vector m_position;               ///< position
    double m_initialEnergy;          ///< initial energy
    double m_energy;                 ///< residual energy
    double m_attemptedEnergy;        ///< sum of requested debits
    NodeRole m_role;                 ///< current role
    uint32_t m_groupId;              ///< current group
    uint32_t m_historyLength;        ///< history bound
    std::deque<LinkSample> m_history; ///< rolling link-quality history
};

/**
 * @ingroup wsnsim
 * @brief Arena owning every node of one run, indexed by node id.
 *
 * Nodes are created once and never destroyed, so ids stay valid for the
 * whole run.  Topology and simulator code refer to nodes by id only.
 */
class SensorNetwork
{
  public:
    SensorNetwork();

    /**
     * @brief Create one node per position.
     * @param positions node positions; node i gets positions[i]
     * @param sink the sink position
     * @param initialEnergy initial energy of every node (J)
     * @param historyLength link history bound of every node
     */
    SensorNetwork(const std::vector<Vector>& positions,
                  const Vector& sink,
                  double initialEnergy,
                  uint32_t historyLength);

    /**
     * @brief Draw uniform random positions in [0, width] x [0, height].
     *
     * Uses the placement stream of @p rng only.
     *
     * @param nNodes number of nodes
     * @param width area width (m)
     * @param height area height (m)
     * @param rng the run's random streams
     * @return the positions, in node id order
     */
    static std::vector<Vector> RandomPositions(uint32_t nNodes,
                                               double width,
                                               double height,
                                               RandomStreams& rng);

    /// @return the number of nodes, alive or dead
    uint32_t GetNNodes() const
    {
        return static_cast<uint32_t>(m_nodes.size());
    }

    /**
     * @param id node id
     * @return the node
     */
    SensorNode& GetNode(uint32_t id);

    /**
     * @param id node id
     * @return the node
     */
    const SensorNode& GetNode(uint32_t id) const;

    /**
     * @param id node id
     * @return true if @p id names a node of this network
     */
    bool Contains(uint32_t id) const
    {
        return id < m_nodes.size();
    }

    /// @return the ids of the alive nodes, ascending
    std::vector<uint32_t> GetAliveIds() const;

    /// @return the number of alive nodes
    uint32_t GetAliveCount() const;

    /// @return the sink position
    const Vector& GetSinkPosition() const
    {
        return m_sink;
    }

    /**
     * @param id node id
     * @return distance from the node to the sink (m)
     */
    double DistanceToSink(uint32_t id) const;

    /**
     * @param a node id
     * @param b node id
     * @return distance between the two nodes (m)
     */
    double Distance(uint32_t a, uint32_t b) const;

    /// @return the largest node to sink distance over all nodes (m)
    double GetMaxSinkDistance() const;

    /// @return the sum over nodes of initial minus residual energy (J)
    double GetTotalConsumedEnergy() const;

    /// @return the sum of residual energies (J)
    double GetTotalResidualEnergy() const;

  private:
    std::vector<SensorNode> m_nodes; ///< the arena
    Vector m_sink;                   ///< sink position
};

} // namespace wsnsim
} // namespace ns3

#endif /* WSNSIM_SENSOR_NODE_H */
