/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * WSNSIM: round-based wireless sensor network routing simulation
 * Per-round role assignment of the network.
 */

#ifndef WSNSIM_TOPOLOGY_H
#define WSNSIM_TOPOLOGY_H

#include "wsnsim-sensor-node.h"

#include <algorithm>
#include <cstdint>
#include <map>
#include <ostream>
#include <vector>

namespace ns3
{
namespace wsnsim
{

/**
 * @ingroup wsnsim
 * @brief Shape of the assignment.
 */
enum class TopologyKind : uint8_t
{
    CLUSTER, ///< heads with member sets
    CHAIN,   ///< one ordered chain with a leader
};

std::ostream& operator<<(std::ostream& os, TopologyKind kind);

/**
 * @ingroup wsnsim
 * @brief Who sends to whom during one round.
 *
 * In cluster mode the assignment maps every head id to its member ids;
 * alive nodes with no head live in the direct-to-sink group.  In chain mode
 * it holds a permutation of the alive node ids and the index of the leader
 * inside it.
 *
 * The assignment only stores ids; SensorNetwork owns the nodes.  Repair is
 * the strategy's job, ApplyRoles() mirrors the assignment onto the nodes.
 */
class TopologyAssignment
{
  public:
    /// Member list of a head, ascending ids.
    typedef std::vector<uint32_t> MemberList;

    /**
     * constructor
     * @param kind the shape
     */
    explicit TopologyAssignment(TopologyKind kind = TopologyKind::CLUSTER);

    /// @return the shape
    TopologyKind GetKind() const
    {
        return m_kind;
    }

    /// Forget every head, member, direct sender and chain position.
    void Clear();

    /// @return true if nothing is assigned
    bool IsEmpty() const;

    /// @name Cluster mode
    //\{
    /**
     * Add a head with an empty member list.
     * @param head node id
     */
    void AddHead(uint32_t head);

    /**
     * @param head an existing head id
     * @param member node id to attach
     */
    void AddMember(uint32_t head, uint32_t member);

    /**
     * @param id node id that sends straight to the sink
     */
    void AddDirect(uint32_t id);

    /// @return head ids, ascending
    std::vector<uint32_t> GetHeads() const;

    /**
     * @param head head id
     * @return true if @p head is a head of this assignment
     */
    bool IsHead(uint32_t head) const
    {
        return m_clusters.find(head) != m_clusters.end();
    }

    /**
     * @param head head id
     * @return its members
     */
    const MemberList& GetMembers(uint32_t head) const;

    /// @return the direct-to-sink group
    const MemberList& GetDirect() const
    {
        return m_direct;
    }

    /// @return the head to members map
    const std::map<uint32_t, MemberList>& GetClusters() const
    {
        return m_clusters;
    }

    /**
     * Remove a head together with its member list.
     * @param head head id
     * @return the members it had
     */
    MemberList RemoveHead(uint32_t head);

    /**
     * Drop every member and direct sender for which @p pred returns true.
     * @param pred predicate on node ids
     * @return the number of ids dropped
     */
    template <typename Pred>
    uint32_t RemoveMembersIf(Pred pred);
    //\}

    /// @name Chain mode
    //\{
    /**
     * @param chain ordered node ids
     */
    void SetChain(const std::vector<uint32_t>& chain);

    /// @return the ordered chain
    const std::vector<uint32_t>& GetChain() const
    {
        return m_chain;
    }

    /**
     * @param index leader position, taken modulo the chain length
     */
    void SetLeaderIndex(uint32_t index);

    /// @return the leader position inside the chain
    uint32_t GetLeaderIndex() const
    {
        return m_leaderIndex;
    }

    /// @return the leader node id; the chain must not be empty
    uint32_t GetLeader() const;
    //\}

    /// @return number of heads, or 1 for a non-empty chain
    uint32_t GetLeaderCount() const;

    /**
     * Copy roles and group ids onto the alive nodes of @p network.
     * @param network the network
     */
    void ApplyRoles(SensorNetwork& network) const;

    /**
     * Check that every referenced id exists and is alive, that each alive
     * node appears exactly once, and that the leader index is in range.
     * @param network the network
     * @return true if the assignment is consistent with @p network
     */
    bool IsConsistent(const SensorNetwork& network) const;

  private:
    TopologyKind m_kind;                       ///< shape
    std::map<uint32_t, MemberList> m_clusters; ///< head id to members
    MemberList m_direct;                       ///< direct-to-sink group
    std::vector<uint32_t> m_chain;             ///< chain order
    uint32_t m_leaderIndex;                    ///< leader position in m_chain
};

template <typename Pred>
uint32_t
TopologyAssignment::RemoveMembersIf(Pred pred)
{
    uint32_t removed = 0;
    auto drop = [&pred, &removed](MemberList& list) {
        auto end = std::remove_if(list.begin(), list.end(), pred);
        removed += static_cast<uint32_t>(list.end() - end);
        list.erase(end, list.end());
    };
    for (auto& cluster : m_clusters)
    {
        drop(cluster.second);
    }
    drop(m_direct);
    return removed;
}

} // namespace wsnsim
} // namespace ns3

#endif /* WSNSIM_TOPOLOGY_H */
