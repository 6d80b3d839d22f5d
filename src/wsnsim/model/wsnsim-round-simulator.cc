/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * WSNSIM: round-based wireless sensor network routing simulation
 * Round-stepping simulation engine implementation.
 *
 * Order of events in a round (fixed, so runs are reproducible):
 *   1. sensing, alive nodes in id order (threshold test after the debit)
 *   2. member -> head, heads ascending then members ascending
 *      (chain: both ends towards the leader)
 *   3. head -> sink, heads ascending, then direct senders ascending
 */

#include "wsnsim-round-simulator.h"

#include "wsnsim-chain-strategy.h"
#include "wsnsim-cluster-strategy.h"
#include "wsnsim-metrics-aggregator.h"

#include "ns3/abort.h"
#include "ns3/assert.h"
#include "ns3/boolean.h"
#include "ns3/double.h"
#include "ns3/enum.h"
#include "ns3/log.h"
#include "ns3/object-factory.h"
#include "ns3/trace-source-accessor.h"
#include "ns3/uinteger.h"

#include <algorithm>
#include <map>
#include <string>

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("WsnSimRoundSimulator");

namespace wsnsim
{

NS_OBJECT_ENSURE_REGISTERED(RoundSimulator);

TypeId
RoundSimulator::GetTypeId()
{
    static TypeId tid =
        TypeId("ns3::wsnsim::RoundSimulator")
            .SetParent<Object>()
            .SetGroupName("WsnSim")
            .AddTraceSource("RoundCompleted",
                            "Fired at the end of every simulated round, and once with a "
                            "zero-alive record when the network is found dead.",
                            MakeTraceSourceAccessor(&RoundSimulator::m_roundTrace),
                            "ns3::wsnsim::RoundSimulator::RoundTracedCallback");
    return tid;
}

RoundSimulator::RoundSimulator(const SimulationConfig& config)
    : RoundSimulator(config, nullptr)
{
}

RoundSimulator::RoundSimulator(const SimulationConfig& config, Ptr<TopologyStrategy> strategy)
    : m_config(config),
      m_energy(config.platform),
      m_environment(GetEnvironmentProfile(config.environment)),
      m_strategy(strategy),
      m_reporter(config.nNodes,
                 config.hardThreshold,
                 config.softThreshold,
                 config.maxReportInterval),
      m_state(RUNNING),
      m_round(0),
      m_cumulativeEnergy(0.0)
{
    NS_LOG_FUNCTION(this);
    std::string reason;
    bool valid = m_config.Validate(&reason);
    NS_ABORT_MSG_UNLESS(valid, "Invalid simulation configuration: " << reason);
    Initialize();
}

RoundSimulator::~RoundSimulator()
{
    NS_LOG_FUNCTION(this);
}

void
RoundSimulator::DoDispose()
{
    NS_LOG_FUNCTION(this);
    m_strategy = nullptr;
    Object::DoDispose();
}

Ptr<TopologyStrategy>
RoundSimulator::CreateStrategy(const SimulationConfig& config)
{
    ObjectFactory factory;
    if (config.topology == TopologyKind::CHAIN)
    {
        factory.SetTypeId(ChainTopologyStrategy::GetTypeId());
        factory.Set("LeaderRotationInterval", UintegerValue(config.leaderRotationInterval));
    }
    else
    {
        factory.SetTypeId(ClusterTopologyStrategy::GetTypeId());
        factory.Set("HeadFraction", DoubleValue(config.headFraction));
        factory.Set("SelectionPolicy", EnumValue(config.selection));
        factory.Set("EnergyWeight", DoubleValue(config.energyWeight));
        factory.Set("SinkWeight", DoubleValue(config.sinkWeight));
        factory.Set("CentralityWeight", DoubleValue(config.centralityWeight));
        factory.Set("LinkQualityWeight", DoubleValue(config.linkQualityWeight));
        factory.Set("CommunicationRange", DoubleValue(config.communicationRange));
        factory.Set("ForceHeadFallback", BooleanValue(config.forceHeadFallback));
        factory.Set("EpochRotation", BooleanValue(config.epochRotation));
        factory.Set("FairnessPenalty", DoubleValue(config.fairnessPenalty));
    }
    factory.Set("ReclusterInterval", UintegerValue(config.reclusterInterval));
    return factory.Create<TopologyStrategy>();
}

void
RoundSimulator::Initialize()
{
    m_rng.AssignStreams(static_cast<int64_t>(m_config.seed) * RandomStreams::STREAM_COUNT);

    std::vector<Vector> positions = m_config.positions;
    if (positions.empty())
    {
        positions = SensorNetwork::RandomPositions(m_config.nNodes,
                                                   m_config.areaWidth,
                                                   m_config.areaHeight,
                                                   m_rng);
    }
    m_network = SensorNetwork(positions,
                              m_config.sinkPosition,
                              m_config.initialEnergy,
                              m_config.historyLength);
    m_readings.assign(m_network.GetNNodes(), 0);
    m_pending.assign(m_network.GetNNodes(), false);

    if (!m_strategy)
    {
        m_strategy = CreateStrategy(m_config);
    }
    LinkContext link;
    link.channel = m_channel;
    link.environment = m_environment;
    link.interference = m_config.interference;
    link.txPowerDbm = m_config.txPowerDbm;
    m_strategy->SetLinkContext(link);
    m_assignment = TopologyAssignment(m_strategy->GetKind());

    NS_LOG_INFO("Initialized " << m_network.GetNNodes() << " nodes, " << m_strategy->GetKind()
                               << " topology, " << m_config.reporting << " reporting, "
                               << m_config.environment << ", " << m_config.platform << ", seed "
                               << m_config.seed);
}

// ============================================================================
// Transmission primitives
// ============================================================================

void
RoundSimulator::Draw(uint32_t id, double joules, RoundRecord& record)
{
    double drawn = m_network.GetNode(id).Debit(joules);
    record.energyConsumed += drawn;
    m_cumulativeEnergy += drawn;
}

RoundSimulator::HopOutcome
RoundSimulator::Hop(uint32_t sender, uint32_t receiver, RoundRecord& record, bool& charged)
{
    charged = false;
    SensorNode& from = m_network.GetNode(sender);
    if (!from.IsAlive() || !m_pending[sender])
    {
        return HopOutcome::NOT_SENT;
    }
    m_pending[sender] = false;

    bool toSink = receiver == DIRECT_TO_SINK;
    double distance = toSink ? m_network.DistanceToSink(sender) : m_network.Distance(sender, receiver);
    double txEnergy = m_energy.TransmitEnergy(m_config.packetBits, distance, m_config.txPowerDbm);
    ++record.hopAttempts;
    if (txEnergy > from.GetEnergy())
    {
        // not enough energy for a whole packet: the node dies mid-send
        NS_LOG_DEBUG("Node " << sender << " died transmitting " << txEnergy << " J");
        Draw(sender, txEnergy, record);
        return HopOutcome::LOST;
    }
    Draw(sender, txEnergy, record);

    bool receiverOk = true;
    if (!toSink)
    {
        SensorNode& to = m_network.GetNode(receiver);
        if (to.IsAlive())
        {
            double rxEnergy = m_energy.ReceiveEnergy(m_config.packetBits);
            receiverOk = rxEnergy <= to.GetEnergy();
            Draw(receiver, rxEnergy, record);
            charged = receiverOk;
            if (charged)
            {
                m_pending[receiver] = true;
            }
        }
        else
        {
            receiverOk = false;
        }
    }

    LinkMetrics metrics = m_channel.ComputeLinkMetrics(m_config.txPowerDbm,
                                                       distance,
                                                       m_environment,
                                                       m_config.interference,
                                                       m_rng);
    bool delivered = m_rng.Bernoulli(metrics.pdr) && receiverOk;

    record.linkQuality.Add(metrics);
    LinkSample sample = {metrics.rssiDbm, metrics.lqi, metrics.pdr};
    from.AddLinkSample(sample);
    if (!toSink)
    {
        m_network.GetNode(receiver).AddLinkSample(sample);
    }

    if (!delivered)
    {
        NS_LOG_LOGIC("Hop " << sender << " -> "
                            << (toSink ? std::string("sink") : std::to_string(receiver))
                            << " lost, pdr " << metrics.pdr);
        return HopOutcome::LOST;
    }
    ++record.hopSuccesses;
    return HopOutcome::DELIVERED;
}

void
RoundSimulator::Forward(uint32_t head, uint32_t incoming, RoundRecord& record)
{
    if (!m_network.GetNode(head).IsAlive() || !m_pending[head])
    {
        m_readings[head] = 0;
        m_pending[head] = false;
        return;
    }
    Draw(head, m_energy.AggregationEnergy(m_config.packetBits, 1 + incoming), record);
    bool charged;
    if (Hop(head, DIRECT_TO_SINK, record, charged) == HopOutcome::DELIVERED)
    {
        record.packetsDelivered += m_readings[head];
    }
    m_readings[head] = 0;
}

// ============================================================================
// Round bodies
// ============================================================================

void
RoundSimulator::RunClusterRound(RoundRecord& record)
{
    std::map<uint32_t, uint32_t> incoming;
    for (const auto& cluster : m_assignment.GetClusters())
    {
        uint32_t head = cluster.first;
        uint32_t& received = incoming[head];
        for (uint32_t member : cluster.second)
        {
            bool charged;
            HopOutcome outcome = Hop(member, head, record, charged);
            received += charged ? 1 : 0;
            if (outcome == HopOutcome::DELIVERED)
            {
                m_readings[head] += m_readings[member];
            }
            m_readings[member] = 0;
        }
    }

    for (const auto& cluster : m_assignment.GetClusters())
    {
        Forward(cluster.first, incoming[cluster.first], record);
    }

    for (uint32_t id : m_assignment.GetDirect())
    {
        bool charged;
        if (Hop(id, DIRECT_TO_SINK, record, charged) == HopOutcome::DELIVERED)
        {
            record.packetsDelivered += m_readings[id];
        }
        m_readings[id] = 0;
    }
}

void
RoundSimulator::RunChainRound(RoundRecord& record)
{
    const std::vector<uint32_t>& chain = m_assignment.GetChain();
    if (chain.empty())
    {
        return;
    }
    std::size_t leader = m_assignment.GetLeaderIndex();
    uint32_t incoming = 0;

    // pass one token from each end of the chain towards the leader
    for (std::size_t i = 0; i < leader; ++i)
    {
        bool charged;
        HopOutcome outcome = Hop(chain[i], chain[i + 1], record, charged);
        if (outcome == HopOutcome::DELIVERED)
        {
            m_readings[chain[i + 1]] += m_readings[chain[i]];
        }
        m_readings[chain[i]] = 0;
        if (i + 1 == leader && charged)
        {
            ++incoming;
        }
    }
    for (std::size_t i = chain.size() - 1; i > leader; --i)
    {
        bool charged;
        HopOutcome outcome = Hop(chain[i], chain[i - 1], record, charged);
        if (outcome == HopOutcome::DELIVERED)
        {
            m_readings[chain[i - 1]] += m_readings[chain[i]];
        }
        m_readings[chain[i]] = 0;
        if (i - 1 == leader && charged)
        {
            ++incoming;
        }
    }

    Forward(chain[leader], incoming, record);
}

// ============================================================================
// Step / Run / Finalize
// ============================================================================

bool
RoundSimulator::Step(RoundRecord& record)
{
    NS_LOG_FUNCTION(this << m_round);
    record = RoundRecord();
    record.round = m_round;

    if (m_state == NETWORK_DEAD)
    {
        return false;
    }
    std::vector<uint32_t> alive = m_network.GetAliveIds();
    if (alive.empty())
    {
        NS_LOG_INFO("No alive node left after round " << m_round);
        m_state = NETWORK_DEAD;
        record.residualEnergy = m_network.GetTotalResidualEnergy();
        m_roundTrace(record);
        return false;
    }

    ++m_round;
    record.round = m_round;

    if (m_assignment.IsEmpty() || m_strategy->IsRecomputeDue(m_round))
    {
        m_assignment = m_strategy->Compute(m_network, m_round, m_rng);
    }
    else
    {
        m_strategy->Repair(m_assignment, m_network, m_round);
    }
    NS_ASSERT_MSG(m_assignment.IsConsistent(m_network),
                  "Topology of round " << m_round << " references dead or missing nodes");
    m_assignment.ApplyRoles(m_network);
    record.leaders = m_assignment.GetLeaderCount();

    // sensing: one source reading per alive node that survives the debit,
    // filtered by the thresholds in threshold reporting mode
    std::fill(m_readings.begin(), m_readings.end(), 0);
    std::fill(m_pending.begin(), m_pending.end(), false);
    for (uint32_t id : alive)
    {
        if (m_config.sensing)
        {
            Draw(id, m_energy.SensingEnergy(), record);
        }
        const SensorNode& node = m_network.GetNode(id);
        if (!node.IsAlive())
        {
            continue;
        }
        bool report = true;
        if (m_config.reporting == ReportingMode::THRESHOLD)
        {
            double value = ThresholdReporter::SenseValue(node.GetPosition(), m_rng);
            report = m_reporter.ShouldReport(id, value, m_round);
        }
        if (report)
        {
            m_readings[id] = 1;
            m_pending[id] = true;
            ++record.packetsAttempted;
        }
    }

    if (m_assignment.GetKind() == TopologyKind::CHAIN)
    {
        RunChainRound(record);
    }
    else
    {
        RunClusterRound(record);
    }

    record.aliveNodes = m_network.GetAliveCount();
    record.deaths = static_cast<uint32_t>(alive.size()) - record.aliveNodes;
    record.residualEnergy = m_network.GetTotalResidualEnergy();
    std::vector<double> residuals;
    for (uint32_t id : m_network.GetAliveIds())
    {
        residuals.push_back(m_network.GetNode(id).GetEnergy());
    }
    record.energyFairness = MetricsAggregator::JainIndex(residuals);
    m_records.push_back(record);

    NS_LOG_INFO(record);
    if (record.deaths > 0)
    {
        NS_LOG_DEBUG(record.deaths << " nodes died in round " << m_round);
    }
    m_roundTrace(record);
    return true;
}

SimulationSummary
RoundSimulator::Run()
{
    NS_LOG_FUNCTION(this);
    RoundRecord record;
    while (m_round < m_config.roundBound && Step(record))
    {
    }
    return Finalize();
}

SimulationSummary
RoundSimulator::Finalize() const
{
    return MetricsAggregator::Finalize(m_records, m_network.GetNNodes(), m_config.roundBound);
}

} // namespace wsnsim
} // namespace ns3
