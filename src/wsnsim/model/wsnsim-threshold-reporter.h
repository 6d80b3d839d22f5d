/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * WSNSIM: round-based wireless sensor network routing simulation
 * Threshold-gated reporting of sensed values.
 */

#ifndef WSNSIM_THRESHOLD_REPORTER_H
#define WSNSIM_THRESHOLD_REPORTER_H

#include "wsnsim-random-streams.h"

#include "ns3/vector.h"

#include <cstdint>
#include <ostream>
#include <vector>

namespace ns3
{
namespace wsnsim
{

/**
 * @ingroup wsnsim
 * @brief When a node generates a reading.
 */
enum class ReportingMode : uint8_t
{
    PERIODIC,  ///< every alive node reports every round
    THRESHOLD, ///< a node reports only when its sensed value passes the thresholds
};

std::ostream& operator<<(std::ostream& os, ReportingMode mode);

/**
 * @ingroup wsnsim
 * @brief Reactive reporting state of every node.
 *
 * A sensed value below the hard threshold is never reported.  Above it, a
 * node reports on its first crossing, when the value moved by at least the
 * soft threshold since its last report, or when maxInterval rounds passed
 * since that report.  Only a report updates the remembered value and round.
 */
class ThresholdReporter
{
  public:
    /**
     * constructor
     * @param nNodes number of node ids tracked
     * @param hardThreshold absolute reporting threshold
     * @param softThreshold minimum change since the last report
     * @param maxInterval rounds after which a report is due regardless of change
     */
    ThresholdReporter(uint32_t nNodes,
                      double hardThreshold,
                      double softThreshold,
                      uint32_t maxInterval);

    /**
     * @brief Decide whether a node reports its reading this round.
     * @param id node id
     * @param value the sensed value
     * @param round current round, starting at 1
     * @return true if the node reports
     */
    bool ShouldReport(uint32_t id, double value, uint32_t round);

    /**
     * @param id node id
     * @return the round of the last report, 0 if the node never reported
     */
    uint32_t GetLastReportRound(uint32_t id) const;

    /**
     * @param id node id
     * @return the last reported value, meaningless before the first report
     */
    double GetLastReportedValue(uint32_t id) const;

    /**
     * @brief Sensed temperature-like quantity at a position.
     *
     * 65 plus a position gradient of (x + y) / 200 * 20, a Uniform[-5, 15)
     * variation and Normal(0, 3) noise, clamped to [20, 100].
     *
     * @param position node position
     * @param rng the run's random streams
     * @return the sensed value
     */
    static double SenseValue(const Vector& position, RandomStreams& rng);

  private:
    double m_hardThreshold;                 ///< absolute threshold
    double m_softThreshold;                 ///< change threshold
    uint32_t m_maxInterval;                 ///< forced report interval (rounds)
    std::vector<double> m_lastValue;        ///< last reported value per node
    std::vector<uint32_t> m_lastReportRound; ///< round of the last report, 0 if none
};

} // namespace wsnsim
} // namespace ns3

#endif /* WSNSIM_THRESHOLD_REPORTER_H */
