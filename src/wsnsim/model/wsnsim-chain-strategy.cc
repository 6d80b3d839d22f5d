/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * WSNSIM: round-based wireless sensor network routing simulation
 * Greedy chain construction strategy implementation.
 */

#include "wsnsim-chain-strategy.h"

#include "ns3/log.h"
#include "ns3/uinteger.h"

#include <algorithm>

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("WsnSimChainStrategy");

namespace wsnsim
{

NS_OBJECT_ENSURE_REGISTERED(ChainTopologyStrategy);

TypeId
ChainTopologyStrategy::GetTypeId()
{
    static TypeId tid =
        TypeId("ns3::wsnsim::ChainTopologyStrategy")
            .SetParent<TopologyStrategy>()
            .SetGroupName("WsnSim")
            .AddConstructor<ChainTopologyStrategy>()
            .AddAttribute("LeaderRotationInterval",
                          "Number of rounds before the leader moves to the next chain position.",
                          UintegerValue(1),
                          MakeUintegerAccessor(&ChainTopologyStrategy::m_rotationInterval),
                          MakeUintegerChecker<uint32_t>(1));
    return tid;
}

ChainTopologyStrategy::ChainTopologyStrategy()
    : m_rotationInterval(1)
{
    NS_LOG_FUNCTION(this);
}

ChainTopologyStrategy::~ChainTopologyStrategy()
{
    NS_LOG_FUNCTION(this);
}

TopologyKind
ChainTopologyStrategy::GetKind() const
{
    return TopologyKind::CHAIN;
}

std::vector<uint32_t>
ChainTopologyStrategy::BuildChain(const SensorNetwork& network, const std::vector<uint32_t>& nodes)
{
    std::vector<uint32_t> remaining = nodes;
    std::sort(remaining.begin(), remaining.end());
    std::vector<uint32_t> chain;
    if (remaining.empty())
    {
        return chain;
    }
    chain.reserve(remaining.size());

    // Start from the node farthest from the sink
    auto start = remaining.begin();
    for (auto it = remaining.begin(); it != remaining.end(); ++it)
    {
        if (network.DistanceToSink(*it) > network.DistanceToSink(*start))
        {
            start = it;
        }
    }
    chain.push_back(*start);
    remaining.erase(start);

    while (!remaining.empty())
    {
        uint32_t last = chain.back();
        auto nearest = remaining.begin();
        double nearestDistance = network.Distance(last, *nearest);
        for (auto it = remaining.begin() + 1; it != remaining.end(); ++it)
        {
            double d = network.Distance(last, *it);
            if (d < nearestDistance)
            {
                nearest = it;
                nearestDistance = d;
            }
        }
        chain.push_back(*nearest);
        remaining.erase(nearest);
    }
    return chain;
}

uint32_t
ChainTopologyStrategy::LeaderIndex(uint32_t round, uint32_t length) const
{
    if (length == 0)
    {
        return 0;
    }
    uint32_t interval = m_rotationInterval == 0 ? 1 : m_rotationInterval;
    uint32_t step = round > 0 ? (round - 1) / interval : 0;
    return step % length;
}

TopologyAssignment
ChainTopologyStrategy::Compute(const SensorNetwork& network, uint32_t round, RandomStreams& rng)
{
    NS_LOG_FUNCTION(this << round);
    TopologyAssignment assignment(TopologyKind::CHAIN);
    assignment.SetChain(BuildChain(network, network.GetAliveIds()));
    uint32_t length = static_cast<uint32_t>(assignment.GetChain().size());
    assignment.SetLeaderIndex(LeaderIndex(round, length));
    if (length > 0)
    {
        NS_LOG_DEBUG("Round " << round << ": chain of " << length << " nodes, leader "
                              << assignment.GetLeader());
    }
    return assignment;
}

void
ChainTopologyStrategy::Repair(TopologyAssignment& assignment,
                              const SensorNetwork& network,
                              uint32_t round)
{
    NS_LOG_FUNCTION(this << round);
    std::vector<uint32_t> chain = assignment.GetChain();
    auto end = std::remove_if(chain.begin(), chain.end(), [&network](uint32_t id) {
        return !network.Contains(id) || !network.GetNode(id).IsAlive();
    });
    if (end != chain.end())
    {
        NS_LOG_DEBUG("Dropping " << (chain.end() - end) << " dead nodes from the chain");
        chain.erase(end, chain.end());
    }
    assignment.SetChain(chain);
    assignment.SetLeaderIndex(LeaderIndex(round, static_cast<uint32_t>(chain.size())));
}

} // namespace wsnsim
} // namespace ns3
