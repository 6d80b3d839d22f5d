/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * WSNSIM: round-based wireless sensor network routing simulation
 * Base class of the topology formation strategies.
 */

#include "wsnsim-topology-strategy.h"

#include "ns3/log.h"
#include "ns3/uinteger.h"

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("WsnSimTopologyStrategy");

namespace wsnsim
{

NS_OBJECT_ENSURE_REGISTERED(TopologyStrategy);

LinkContext::LinkContext()
    : environment(GetEnvironmentProfile(EnvironmentType::INDOOR_OFFICE)),
      txPowerDbm(0.0)
{
}

TypeId
TopologyStrategy::GetTypeId()
{
    static TypeId tid =
        TypeId("ns3::wsnsim::TopologyStrategy")
            .SetParent<Object>()
            .SetGroupName("WsnSim")
            .AddAttribute("ReclusterInterval",
                          "Number of rounds between two topology recomputations.",
                          UintegerValue(1),
                          MakeUintegerAccessor(&TopologyStrategy::m_reclusterInterval),
                          MakeUintegerChecker<uint32_t>(1));
    return tid;
}

TopologyStrategy::TopologyStrategy()
    : m_reclusterInterval(1)
{
    NS_LOG_FUNCTION(this);
}

TopologyStrategy::~TopologyStrategy()
{
    NS_LOG_FUNCTION(this);
}

bool
TopologyStrategy::IsRecomputeDue(uint32_t round) const
{
    uint32_t interval = m_reclusterInterval == 0 ? 1 : m_reclusterInterval;
    return round == 0 || (round - 1) % interval == 0;
}

void
TopologyStrategy::SetLinkContext(const LinkContext& context)
{
    NS_LOG_FUNCTION(this << context.txPowerDbm);
    m_link = context;
}

LinkMetrics
TopologyStrategy::ExpectedLink(const SensorNetwork& network, uint32_t from, uint32_t to) const
{
    return m_link.channel.ExpectedLinkMetrics(m_link.txPowerDbm,
                                              network.Distance(from, to),
                                              m_link.environment,
                                              m_link.interference);
}

} // namespace wsnsim
} // namespace ns3
