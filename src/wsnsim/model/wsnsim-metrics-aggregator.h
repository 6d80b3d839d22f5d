/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * WSNSIM: round-based wireless sensor network routing simulation
 * Folds round records into a run summary.
 */

#ifndef WSNSIM_METRICS_AGGREGATOR_H
#define WSNSIM_METRICS_AGGREGATOR_H

#include "wsnsim-round-record.h"

#include <cstdint>
#include <vector>

namespace ns3
{
namespace wsnsim
{

/**
 * @ingroup wsnsim
 * @brief Pure reduction of a run's round records.
 */
class MetricsAggregator
{
  public:
    /**
     * @brief Summarize a run.
     *
     * Calling it twice on the same records gives the same summary.
     *
     * @param records round records in round order
     * @param initialNodeCount number of nodes at deployment
     * @param roundBound maximum number of rounds of the run
     * @return the summary
     */
    static SimulationSummary Finalize(const std::vector<RoundRecord>& records,
                                      uint32_t initialNodeCount,
                                      uint32_t roundBound);

    /**
     * @brief Jain's fairness index (sum x)^2 / (n * sum x^2).
     *
     * Negative values count as zero.  An empty set, or one whose values are
     * all zero, is perfectly fair (1).
     *
     * @param values the samples
     * @return index in [1/n, 1]
     */
    static double JainIndex(const std::vector<double>& values);
};

} // namespace wsnsim
} // namespace ns3

#endif /* WSNSIM_METRICS_AGGREGATOR_H */
