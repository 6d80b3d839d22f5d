/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * WSNSIM: round-based wireless sensor network routing simulation
 * Sensor node state implementation.
 */

#include "wsnsim-sensor-node.h"

#include "ns3/assert.h"
#include "ns3/log.h"

#include <algorithm>
#include <cmath>

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("WsnSimSensorNode");

namespace wsnsim
{

std::ostream&
operator<<(std::ostream& os, NodeRole role)
{
    switch (role)
    {
    case NodeRole::MEMBER:
        return os << "MEMBER";
    case NodeRole::HEAD:
        return os << "HEAD";
    case NodeRole::CHAIN_NODE:
        return os << "CHAIN_NODE";
    }
    return os << "UNKNOWN";
}

// ============================================================================
// SensorNode
// ============================================================================

SensorNode::SensorNode(uint32_t id,
                       const Vector& position,
                       double initialEnergy,
                       uint32_t historyLength)
    : m_id(id),
      m_position(position.x, position.y, 0.0),
      m_initialEnergy(initialEnergy),
      m_energy(initialEnergy),
      m_attemptedEnergy(0.0),
      m_role(NodeRole::MEMBER),
      m_groupId(DIRECT_TO_SINK),
      m_historyLength(historyLength)
{
}

double
SensorNode::GetEnergyRatio() const
{
    if (m_initialEnergy <= 0.0)
    {
        return 0.0;
    }
    return m_energy / m_initialEnergy;
}

double
SensorNode::Debit(double joules)
{
    if (!(joules > 0.0))
    {
        return 0.0;
    }
    m_attemptedEnergy += joules;
    if (!IsAlive())
    {
        return 0.0;
    }
    double drawn = std::min(joules, m_energy);
    m_energy -= drawn;
    if (m_energy <= 0.0)
    {
        m_energy = 0.0;
        NS_LOG_DEBUG("Node " << m_id << " depleted");
    }
    return drawn;
}

void
SensorNode::AddLinkSample(const LinkSample& sample)
{
    if (m_historyLength == 0)
    {
        return;
    }
    while (m_history.size() >= m_historyLength)
    {
        m_history.pop_front();
    }
    m_history.push_back(sample);
}

double
SensorNode::GetMeanRssi(double fallback) const
{
    if (m_history.empty())
    {
        return fallback;
    }
    double sum = 0.0;
    for (const auto& s : m_history)
    {
        sum += s.rssiDbm;
    }
    return sum / m_history.size();
}

double
SensorNode::GetMeanLqi(double fallback) const
{
    if (m_history.empty())
    {
        return fallback;
    }
    double sum = 0.0;
    for (const auto& s : m_history)
    {
        sum += s.lqi;
    }
    return sum / m_history.size();
}

double
SensorNode::GetMeanPdr(double fallback) const
{
    if (m_history.empty())
    {
        return fallback;
    }
    double sum = 0.0;
    for (const auto& s : m_history)
    {
        sum += s.pdr;
    }
    return sum / m_history.size();
}

double
SensorNode::DistanceTo(const Vector& position) const
{
    double dx = m_position.x - position.x;
    double dy = m_position.y - position.y;
    return std::sqrt(dx * dx + dy * dy);
}

// ============================================================================
// SensorNetwork
// ============================================================================

SensorNetwork::SensorNetwork()
    : m_sink(0.0, 0.0, 0.0)
{
}

SensorNetwork::SensorNetwork(const std::vector<Vector>& positions,
                             const Vector& sink,
                             double initialEnergy,
                             uint32_t historyLength)
    : m_sink(sink.x, sink.y, 0.0)
{
    m_nodes.reserve(positions.size());
    for (uint32_t i = 0; i < positions.size(); ++i)
    {
        m_nodes.emplace_back(i, positions[i], initialEnergy, historyLength);
    }
    NS_LOG_INFO("Created " << m_nodes.size() << " nodes, sink at " << m_sink);
}

std::vector<Vector>
SensorNetwork::RandomPositions(uint32_t nNodes, double width, double height, RandomStreams& rng)
{
    std::vector<Vector> positions;
    positions.reserve(nNodes);
    for (uint32_t i = 0; i < nNodes; ++i)
    {
        double x = rng.Place(0.0, width);
        double y = rng.Place(0.0, height);
        positions.emplace_back(x, y, 0.0);
    }
    return positions;
}

SensorNode&
SensorNetwork::GetNode(uint32_t id)
{
    NS_ASSERT_MSG(id < m_nodes.size(), "Unknown node id " << id);
    return m_nodes[id];
}

const SensorNode&
SensorNetwork::GetNode(uint32_t id) const
{
    NS_ASSERT_MSG(id < m_nodes.size(), "Unknown node id " << id);
    return m_nodes[id];
}

std::vector<uint32_t>
SensorNetwork::GetAliveIds() const
{
    std::vector<uint32_t> alive;
    for (const auto& node : m_nodes)
    {
        if (node.IsAlive())
        {
            alive.push_back(node.GetId());
        }
    }
    return alive;
}

uint32_t
SensorNetwork::GetAliveCount() const
{
    return static_cast<uint32_t>(
        std::count_if(m_nodes.begin(), m_nodes.end(), [](const SensorNode& n) {
            return n.IsAlive();
        }));
}

double
SensorNetwork::DistanceToSink(uint32_t id) const
{
    return GetNode(id).DistanceTo(m_sink);
}

double
SensorNetwork::Distance(uint32_t a, uint32_t b) const
{
    return GetNode(a).DistanceTo(GetNode(b).GetPosition());
}

double
SensorNetwork::GetMaxSinkDistance() const
{
    double maxDistance = 0.0;
    for (const auto& node : m_nodes)
    {
        maxDistance = std::max(maxDistance, node.DistanceTo(m_sink));
    }
    return maxDistance;
}

double
SensorNetwork::GetTotalConsumedEnergy() const
{
    double total = 0.0;
    for (const auto& node : m_nodes)
    {
        total += node.GetConsumedEnergy();
    }
    return total;
}

double
SensorNetwork::GetTotalResidualEnergy() const
{
    double total = 0.0;
    for (const auto& node : m_nodes)
    {
        total += node.GetEnergy();
    }
    return total;
}

} // namespace wsnsim
} // namespace ns3
