/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * WSNSIM: round-based wireless sensor network routing simulation
 * Per-round role assignment implementation.
 */

#include "wsnsim-topology.h"

#include "ns3/assert.h"
#include "ns3/log.h"

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("WsnSimTopology");

namespace wsnsim
{

std::ostream&
operator<<(std::ostream& os, TopologyKind kind)
{
    switch (kind)
    {
    case TopologyKind::CLUSTER:
        return os << "cluster";
    case TopologyKind::CHAIN:
        return os << "chain";
    }
    return os << "unknown";
}

TopologyAssignment::TopologyAssignment(TopologyKind kind)
    : m_kind(kind),
      m_leaderIndex(0)
{
}

void
TopologyAssignment::Clear()
{
    m_clusters.clear();
    m_direct.clear();
    m_chain.clear();
    m_leaderIndex = 0;
}

bool
TopologyAssignment::IsEmpty() const
{
    return m_clusters.empty() && m_direct.empty() && m_chain.empty();
}

void
TopologyAssignment::AddHead(uint32_t head)
{
    m_clusters.emplace(head, MemberList());
}

void
TopologyAssignment::AddMember(uint32_t head, uint32_t member)
{
    auto it = m_clusters.find(head);
    NS_ASSERT_MSG(it != m_clusters.end(), "Node " << head << " is not a head");
    MemberList& members = it->second;
    members.insert(std::lower_bound(members.begin(), members.end(), member), member);
}

void
TopologyAssignment::AddDirect(uint32_t id)
{
    m_direct.insert(std::lower_bound(m_direct.begin(), m_direct.end(), id), id);
}

std::vector<uint32_t>
TopologyAssignment::GetHeads() const
{
    std::vector<uint32_t> heads;
    heads.reserve(m_clusters.size());
    for (const auto& cluster : m_clusters)
    {
        heads.push_back(cluster.first);
    }
    return heads;
}

const TopologyAssignment::MemberList&
TopologyAssignment::GetMembers(uint32_t head) const
{
    auto it = m_clusters.find(head);
    NS_ASSERT_MSG(it != m_clusters.end(), "Node " << head << " is not a head");
    return it->second;
}

TopologyAssignment::MemberList
TopologyAssignment::RemoveHead(uint32_t head)
{
    MemberList orphans;
    auto it = m_clusters.find(head);
    if (it != m_clusters.end())
    {
        orphans.swap(it->second);
        m_clusters.erase(it);
    }
    return orphans;
}

void
TopologyAssignment::SetChain(const std::vector<uint32_t>& chain)
{
    m_chain = chain;
    if (m_leaderIndex >= m_chain.size())
    {
        m_leaderIndex = 0;
    }
}

void
TopologyAssignment::SetLeaderIndex(uint32_t index)
{
    m_leaderIndex = m_chain.empty() ? 0 : index % m_chain.size();
}

uint32_t
TopologyAssignment::GetLeader() const
{
    NS_ASSERT_MSG(!m_chain.empty(), "Empty chain has no leader");
    return m_chain[m_leaderIndex];
}

uint32_t
TopologyAssignment::GetLeaderCount() const
{
    if (m_kind == TopologyKind::CHAIN)
    {
        return m_chain.empty() ? 0 : 1;
    }
    return static_cast<uint32_t>(m_clusters.size());
}

void
TopologyAssignment::ApplyRoles(SensorNetwork& network) const
{
    if (m_kind == TopologyKind::CHAIN)
    {
        if (m_chain.empty())
        {
            return;
        }
        uint32_t leader = GetLeader();
        for (uint32_t id : m_chain)
        {
            SensorNode& node = network.GetNode(id);
            node.SetRole(NodeRole::CHAIN_NODE);
            node.SetGroupId(leader);
        }
        return;
    }
    for (const auto& cluster : m_clusters)
    {
        SensorNode& head = network.GetNode(cluster.first);
        head.SetRole(NodeRole::HEAD);
        head.SetGroupId(cluster.first);
        for (uint32_t id : cluster.second)
        {
            SensorNode& member = network.GetNode(id);
            member.SetRole(NodeRole::MEMBER);
            member.SetGroupId(cluster.first);
        }
    }
    for (uint32_t id : m_direct)
    {
        SensorNode& node = network.GetNode(id);
        node.SetRole(NodeRole::MEMBER);
        node.SetGroupId(DIRECT_TO_SINK);
    }
}

bool
TopologyAssignment::IsConsistent(const SensorNetwork& network) const
{
    std::vector<uint32_t> seen(network.GetNNodes(), 0);
    auto visit = [&network, &seen](uint32_t id) {
        if (!network.Contains(id) || !network.GetNode(id).IsAlive())
        {
            NS_LOG_LOGIC("Assignment references dead or unknown node " << id);
            return false;
        }
        ++seen[id];
        return true;
    };

    if (m_kind == TopologyKind::CHAIN)
    {
        for (uint32_t id : m_chain)
        {
            if (!visit(id))
            {
                return false;
            }
        }
        if (!m_chain.empty() && m_leaderIndex >= m_chain.size())
        {
            return false;
        }
    }
    else
    {
        for (const auto& cluster : m_clusters)
        {
            if (!visit(cluster.first))
            {
                return false;
            }
            for (uint32_t id : cluster.second)
            {
                if (!visit(id))
                {
                    return false;
                }
            }
        }
        for (uint32_t id : m_direct)
        {
            if (!visit(id))
            {
                return false;
            }
        }
        if (!m_clusters.empty() && !m_direct.empty())
        {
            NS_LOG_LOGIC("Direct-to-sink group coexists with heads");
            return false;
        }
    }

    for (uint32_t id = 0; id < network.GetNNodes(); ++id)
    {
        uint32_t expected = network.GetNode(id).IsAlive() ? 1 : 0;
        if (seen[id] != expected)
        {
            NS_LOG_LOGIC("Node " << id << " appears " << seen[id] << " times");
            return false;
        }
    }
    return true;
}

} // namespace wsnsim
} // namespace ns3
