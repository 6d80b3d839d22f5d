/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * WSNSIM: round-based wireless sensor network routing simulation
 * Threshold-gated reporting of sensed values.
 */

#include "wsnsim-threshold-reporter.h"

#include "ns3/assert.h"
#include "ns3/log.h"

#include <algorithm>
#include <cmath>

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("WsnSimThresholdReporter");

namespace wsnsim
{

std::ostream&
operator<<(std::ostream& os, ReportingMode mode)
{
    switch (mode)
    {
    case ReportingMode::PERIODIC:
        return os << "periodic";
    case ReportingMode::THRESHOLD:
        return os << "threshold";
    }
    return os << "unknown";
}

ThresholdReporter::ThresholdReporter(uint32_t nNodes,
                                     double hardThreshold,
                                     double softThreshold,
                                     uint32_t maxInterval)
    : m_hardThreshold(hardThreshold),
      m_softThreshold(softThreshold),
      m_maxInterval(maxInterval),
      m_lastValue(nNodes, 0.0),
      m_lastReportRound(nNodes, 0)
{
    NS_LOG_FUNCTION(this << nNodes << hardThreshold << softThreshold << maxInterval);
}

bool
ThresholdReporter::ShouldReport(uint32_t id, double value, uint32_t round)
{
    NS_ASSERT_MSG(id < m_lastValue.size(), "Unknown node id " << id);
    NS_ASSERT_MSG(round > 0, "Rounds start at 1");
    if (value < m_hardThreshold)
    {
        return false;
    }

    uint32_t last = m_lastReportRound[id];
    bool report = last == 0 || std::fabs(value - m_lastValue[id]) >= m_softThreshold ||
                  round - last >= m_maxInterval;
    if (report)
    {
        NS_LOG_LOGIC("Node " << id << " reports " << value << " in round " << round);
        m_lastValue[id] = value;
        m_lastReportRound[id] = round;
    }
    return report;
}

uint32_t
ThresholdReporter::GetLastReportRound(uint32_t id) const
{
    NS_ASSERT_MSG(id < m_lastReportRound.size(), "Unknown node id " << id);
    return m_lastReportRound[id];
}

double
ThresholdReporter::GetLastReportedValue(uint32_t id) const
{
    NS_ASSERT_MSG(id < m_lastValue.size(), "Unknown node id " << id);
    return m_lastValue[id];
}

double
ThresholdReporter::SenseValue(const Vector& position, RandomStreams& rng)
{
    double value = 65.0 + (position.x + position.y) / 200.0 * 20.0 + rng.Sense(-5.0, 15.0, 3.0);
    return std::clamp(value, 20.0, 100.0);
}

} // namespace wsnsim
} // namespace ns3
