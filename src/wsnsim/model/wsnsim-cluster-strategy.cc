/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * WSNSIM: round-based wireless sensor network routing simulation
 * Cluster-head selection strategy implementation.
 */

#include "wsnsim-cluster-strategy.h"

#include "ns3/assert.h"
#include "ns3/boolean.h"
#include "ns3/double.h"
#include "ns3/enum.h"
#include "ns3/log.h"

#include <algorithm>
#include <cmath>

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("WsnSimClusterStrategy");

namespace wsnsim
{

NS_OBJECT_ENSURE_REGISTERED(ClusterTopologyStrategy);

namespace
{

/// Score components used while the link history is still empty.
const double DEFAULT_LQI = 50.0;
const double DEFAULT_PDR = 0.5;

/// Join score weights.
const double JOIN_PDR_WEIGHT = 0.6;
const double JOIN_DISTANCE_WEIGHT = 0.4;

} // namespace

std::ostream&
operator<<(std::ostream& os, SelectionPolicy policy)
{
    switch (policy)
    {
    case SelectionPolicy::PROBABILISTIC:
        return os << "probabilistic";
    case SelectionPolicy::TOP_K:
        return os << "top-k";
    }
    return os << "unknown";
}

// ============================================================================
// GetTypeId
// ============================================================================

TypeId
ClusterTopologyStrategy::GetTypeId()
{
    static TypeId tid =
        TypeId("ns3::wsnsim::ClusterTopologyStrategy")
            .SetParent<TopologyStrategy>()
            .SetGroupName("WsnSim")
            .AddConstructor<ClusterTopologyStrategy>()
            .AddAttribute("HeadFraction",
                          "Target fraction of alive nodes elected as cluster head.",
                          DoubleValue(0.1),
                          MakeDoubleAccessor(&ClusterTopologyStrategy::m_headFraction),
                          MakeDoubleChecker<double>(0.0, 1.0))
            .AddAttribute("SelectionPolicy",
                          "How cluster heads are picked from the scored nodes.",
                          EnumValue(SelectionPolicy::PROBABILISTIC),
                          MakeEnumAccessor<SelectionPolicy>(&ClusterTopologyStrategy::m_policy),
                          MakeEnumChecker(SelectionPolicy::PROBABILISTIC,
                                          "Probabilistic",
                                          SelectionPolicy::TOP_K,
                                          "TopK"))
            .AddAttribute("EnergyWeight",
                          "Weight of the residual energy ratio in the head score.",
                          DoubleValue(0.4),
                          MakeDoubleAccessor(&ClusterTopologyStrategy::m_energyWeight),
                          MakeDoubleChecker<double>(0.0))
            .AddAttribute("SinkWeight",
                          "Weight of the sink proximity in the head score.",
                          DoubleValue(0.2),
                          MakeDoubleAccessor(&ClusterTopologyStrategy::m_sinkWeight),
                          MakeDoubleChecker<double>(0.0))
            .AddAttribute("CentralityWeight",
                          "Weight of the neighbourhood centrality in the head score.",
                          DoubleValue(0.2),
                          MakeDoubleAccessor(&ClusterTopologyStrategy::m_centralityWeight),
                          MakeDoubleChecker<double>(0.0))
            .AddAttribute("LinkQualityWeight",
                          "Weight of the link-quality history in the head score.",
                          DoubleValue(0.2),
                          MakeDoubleAccessor(&ClusterTopologyStrategy::m_linkWeight),
                          MakeDoubleChecker<double>(0.0))
            .AddAttribute("CommunicationRange",
                          "Neighbourhood radius used by centrality and member join (m).",
                          DoubleValue(50.0),
                          MakeDoubleAccessor(&ClusterTopologyStrategy::m_range),
                          MakeDoubleChecker<double>(0.0))
            .AddAttribute("ForceHeadFallback",
                          "Force the highest-energy node to be head when none is elected.",
                          BooleanValue(true),
                          MakeBooleanAccessor(&ClusterTopologyStrategy::m_forceHead),
                          MakeBooleanChecker())
            .AddAttribute("EpochRotation",
                          "Exclude nodes that were head during the current epoch.",
                          BooleanValue(true),
                          MakeBooleanAccessor(&ClusterTopologyStrategy::m_epochRotation),
                          MakeBooleanChecker())
            .AddAttribute("FairnessPenalty",
                          "Fraction of the head score removed from a fully over-used head.",
                          DoubleValue(0.0),
                          MakeDoubleAccessor(&ClusterTopologyStrategy::m_fairnessPenalty),
                          MakeDoubleChecker<double>(0.0, 1.0));
    return tid;
}

ClusterTopologyStrategy::ClusterTopologyStrategy()
    : m_headFraction(0.1),
      m_policy(SelectionPolicy::PROBABILISTIC),
      m_energyWeight(0.4),
      m_sinkWeight(0.2),
      m_centralityWeight(0.2),
      m_linkWeight(0.2),
      m_range(50.0),
      m_forceHead(true),
      m_epochRotation(true),
      m_fairnessPenalty(0.0),
      m_selections(0)
{
    NS_LOG_FUNCTION(this);
}

ClusterTopologyStrategy::~ClusterTopologyStrategy()
{
    NS_LOG_FUNCTION(this);
}

TopologyKind
ClusterTopologyStrategy::GetKind() const
{
    return TopologyKind::CLUSTER;
}

// ============================================================================
// Scoring
// ============================================================================

double
ClusterTopologyStrategy::HeadScore(const SensorNetwork& network,
                                   uint32_t id,
                                   const std::vector<uint32_t>& alive) const
{
    const SensorNode& node = network.GetNode(id);
    double maxSink = network.GetMaxSinkDistance();
    double proximity = maxSink > 0.0 ? 1.0 - network.DistanceToSink(id) / maxSink : 1.0;
    double score = m_energyWeight * node.GetEnergyRatio() + m_sinkWeight * proximity +
                   m_centralityWeight * Centrality(network, id, alive) +
                   m_linkWeight * LinkQualityScore(node);
    if (m_fairnessPenalty > 0.0)
    {
        score *= 1.0 - m_fairnessPenalty * UsagePenalty(id);
    }
    return score;
}

double
ClusterTopologyStrategy::UsagePenalty(uint32_t id) const
{
    if (m_selections == 0)
    {
        return 0.0;
    }
    double used = static_cast<double>(GetHeadUsage(id)) / m_selections;
    double over = std::max(0.0, used - m_headFraction);
    double span = std::max(1e-9, 1.0 - m_headFraction);
    return std::min(1.0, over / span);
}

uint32_t
ClusterTopologyStrategy::GetHeadUsage(uint32_t id) const
{
    auto it = m_headUsage.find(id);
    return it == m_headUsage.end() ? 0 : it->second;
}

double
ClusterTopologyStrategy::Centrality(const SensorNetwork& network,
                                    uint32_t id,
                                    const std::vector<uint32_t>& alive) const
{
    if (m_range <= 0.0)
    {
        return 0.0;
    }
    double sum = 0.0;
    uint32_t neighbours = 0;
    for (uint32_t other : alive)
    {
        if (other == id)
        {
            continue;
        }
        double d = network.Distance(id, other);
        if (d <= m_range)
        {
            sum += d;
            ++neighbours;
        }
    }
    if (neighbours == 0)
    {
        return 0.0;
    }
    return 1.0 - std::min(sum / neighbours / m_range, 1.0);
}

double
ClusterTopologyStrategy::LinkQualityScore(const SensorNode& node) const
{
    double sensitivity = m_link.channel.GetSensitivity();
    double rssi = node.GetMeanRssi(sensitivity);
    double rssiNorm = std::clamp((rssi - sensitivity) / (ChannelModel::LQI_CEILING_DBM - sensitivity),
                                 0.0,
                                 1.0);
    double lqiNorm = std::clamp(node.GetMeanLqi(DEFAULT_LQI) / 255.0, 0.0, 1.0);
    double pdr = node.GetMeanPdr(DEFAULT_PDR);
    return std::clamp(0.5 * rssiNorm + 0.3 * lqiNorm + 0.2 * pdr, 0.0, 1.0);
}

double
ClusterTopologyStrategy::JoinScore(const SensorNetwork& network,
                                   uint32_t member,
                                   uint32_t head) const
{
    double d = network.Distance(member, head);
    double closeness = m_range > 0.0 ? 1.0 - std::min(d / m_range, 1.0) : 0.0;
    return JOIN_PDR_WEIGHT * ExpectedLink(network, member, head).pdr +
           JOIN_DISTANCE_WEIGHT * closeness;
}

uint32_t
ClusterTopologyStrategy::GetEpochLength() const
{
    if (m_headFraction <= 0.0 || m_headFraction >= 1.0)
    {
        return 1;
    }
    return std::max<uint32_t>(1, static_cast<uint32_t>(std::lround(1.0 / m_headFraction)));
}

double
ClusterTopologyStrategy::Threshold(uint32_t round) const
{
    if (m_headFraction <= 0.0)
    {
        return 0.0;
    }
    if (m_headFraction >= 1.0)
    {
        return 1.0;
    }
    uint32_t r = round > 0 ? (round - 1) % GetEpochLength() : 0;
    double denominator = 1.0 - m_headFraction * r;
    if (denominator <= 0.0)
    {
        return 1.0;
    }
    return std::min(1.0, m_headFraction / denominator);
}

// ============================================================================
// Head selection
// ============================================================================

std::vector<uint32_t>
ClusterTopologyStrategy::SelectProbabilistic(const SensorNetwork& network,
                                             const std::vector<uint32_t>& alive,
                                             uint32_t round,
                                             RandomStreams& rng)
{
    std::vector<double> scores;
    scores.reserve(alive.size());
    double total = 0.0;
    for (uint32_t id : alive)
    {
        scores.push_back(HeadScore(network, id, alive));
        total += scores.back();
    }
    double mean = total / alive.size();

    uint32_t epoch = GetEpochLength();
    auto recentlyHead = [this, round, epoch](uint32_t id) {
        auto it = m_lastHeadRound.find(id);
        return it != m_lastHeadRound.end() && round - it->second < epoch;
    };
    bool rotate = m_epochRotation &&
                  !std::all_of(alive.begin(), alive.end(), recentlyHead);

    double threshold = Threshold(round);
    std::vector<uint32_t> heads;
    for (std::size_t i = 0; i < alive.size(); ++i)
    {
        // one draw per alive node, eligible or not
        double u = rng.Uniform();
        if (rotate && recentlyHead(alive[i]))
        {
            continue;
        }
        double probability = mean > 0.0 ? threshold * scores[i] / mean : threshold;
        if (u < std::min(1.0, probability))
        {
            heads.push_back(alive[i]);
        }
    }
    NS_LOG_LOGIC("Round " << round << " T=" << threshold << " elected " << heads.size()
                          << " heads");
    return heads;
}

std::vector<uint32_t>
ClusterTopologyStrategy::SelectTopK(const SensorNetwork& network,
                                    const std::vector<uint32_t>& alive) const
{
    auto k = static_cast<std::size_t>(std::lround(m_headFraction * alive.size()));
    k = std::min(k, alive.size());

    std::vector<std::pair<double, uint32_t>> ranked;
    ranked.reserve(alive.size());
    for (uint32_t id : alive)
    {
        ranked.emplace_back(HeadScore(network, id, alive), id);
    }
    std::stable_sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
        return a.first > b.first || (a.first == b.first && a.second < b.second);
    });

    std::vector<uint32_t> heads;
    for (std::size_t i = 0; i < k; ++i)
    {
        heads.push_back(ranked[i].second);
    }
    std::sort(heads.begin(), heads.end());
    return heads;
}

uint32_t
ClusterTopologyStrategy::FallbackHead(const SensorNetwork& network,
                                      const std::vector<uint32_t>& candidates) const
{
    NS_ASSERT_MSG(!candidates.empty(), "No candidate for a forced head");
    uint32_t best = candidates.front();
    for (uint32_t id : candidates)
    {
        double energy = network.GetNode(id).GetEnergy();
        double bestEnergy = network.GetNode(best).GetEnergy();
        if (energy > bestEnergy || (energy == bestEnergy && id < best))
        {
            best = id;
        }
    }
    NS_LOG_DEBUG("Forcing node " << best << " as head");
    return best;
}

void
ClusterTopologyStrategy::AttachMembers(TopologyAssignment& assignment,
                                       const SensorNetwork& network,
                                       const std::vector<uint32_t>& nodes) const
{
    std::vector<uint32_t> heads = assignment.GetHeads();
    for (uint32_t id : nodes)
    {
        if (heads.empty())
        {
            assignment.AddDirect(id);
            continue;
        }
        uint32_t best = heads.front();
        double bestScore = JoinScore(network, id, best);
        double bestDistance = network.Distance(id, best);
        for (std::size_t i = 1; i < heads.size(); ++i)
        {
            double score = JoinScore(network, id, heads[i]);
            double distance = network.Distance(id, heads[i]);
            // heads are ascending, so equal candidates keep the lowest id
            if (score > bestScore || (score == bestScore && distance < bestDistance))
            {
                best = heads[i];
                bestScore = score;
                bestDistance = distance;
            }
        }
        assignment.AddMember(best, id);
    }
}

// ============================================================================
// Compute / Repair
// ============================================================================

TopologyAssignment
ClusterTopologyStrategy::Compute(const SensorNetwork& network, uint32_t round, RandomStreams& rng)
{
    NS_LOG_FUNCTION(this << round);
    TopologyAssignment assignment(TopologyKind::CLUSTER);
    std::vector<uint32_t> alive = network.GetAliveIds();
    if (alive.empty())
    {
        return assignment;
    }

    std::vector<uint32_t> heads = m_policy == SelectionPolicy::PROBABILISTIC
                                      ? SelectProbabilistic(network, alive, round, rng)
                                      : SelectTopK(network, alive);
    if (heads.empty() && m_forceHead)
    {
        heads.push_back(FallbackHead(network, alive));
    }

    ++m_selections;
    for (uint32_t head : heads)
    {
        assignment.AddHead(head);
        m_lastHeadRound[head] = round;
        ++m_headUsage[head];
    }

    std::vector<uint32_t> others;
    for (uint32_t id : alive)
    {
        if (!assignment.IsHead(id))
        {
            others.push_back(id);
        }
    }
    AttachMembers(assignment, network, others);

    NS_LOG_DEBUG("Round " << round << ": " << heads.size() << " heads, "
                          << assignment.GetDirect().size() << " direct senders");
    return assignment;
}

void
ClusterTopologyStrategy::Repair(TopologyAssignment& assignment,
                                const SensorNetwork& network,
                                uint32_t round)
{
    NS_LOG_FUNCTION(this << round);
    auto dead = [&network](uint32_t id) {
        return !network.Contains(id) || !network.GetNode(id).IsAlive();
    };

    std::vector<uint32_t> orphans;
    for (uint32_t head : assignment.GetHeads())
    {
        if (dead(head))
        {
            NS_LOG_DEBUG("Head " << head << " died, releasing its members");
            TopologyAssignment::MemberList members = assignment.RemoveHead(head);
            orphans.insert(orphans.end(), members.begin(), members.end());
        }
    }
    assignment.RemoveMembersIf(dead);
    orphans.erase(std::remove_if(orphans.begin(), orphans.end(), dead), orphans.end());

    if (assignment.GetClusters().empty())
    {
        std::vector<uint32_t> pool = orphans;
        pool.insert(pool.end(), assignment.GetDirect().begin(), assignment.GetDirect().end());
        std::sort(pool.begin(), pool.end());
        assignment.Clear();
        if (pool.empty())
        {
            return;
        }
        if (m_forceHead)
        {
            uint32_t head = FallbackHead(network, pool);
            assignment.AddHead(head);
            m_lastHeadRound[head] = round;
            ++m_headUsage[head];
            pool.erase(std::find(pool.begin(), pool.end(), head));
        }
        AttachMembers(assignment, network, pool);
        return;
    }

    std::sort(orphans.begin(), orphans.end());
    AttachMembers(assignment, network, orphans);
}

} // namespace wsnsim
} // namespace ns3
