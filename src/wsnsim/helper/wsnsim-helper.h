/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * WSNSIM: round-based wireless sensor network routing simulation
 * Helper class that creates and runs simulators.
 */

#ifndef WSNSIM_HELPER_H
#define WSNSIM_HELPER_H

#include "ns3/attribute.h"
#include "ns3/object-factory.h"
#include "ns3/ptr.h"
#include "ns3/wsnsim-round-simulator.h"

#include <string>
#include <utility>
#include <vector>

namespace ns3
{
/**
 * @ingroup wsnsim
 * @brief Helper class that creates RoundSimulator instances and runs them.
 *
 * By default the topology strategy follows SimulationConfig::topology.
 * SetStrategy() overrides the strategy type, and SetStrategyAttribute()
 * overrides attributes on whatever strategy gets created.
 */
class WsnSimHelper
{
  public:
    WsnSimHelper();

    /**
     * @param type TypeId name of a TopologyStrategy subclass, such as
     *             "ns3::wsnsim::ChainTopologyStrategy"
     */
    void SetStrategy(std::string type);

    /**
     * @param name the name of the attribute to set
     * @param value the value of the attribute to set.
     *
     * Applied after the attributes derived from the configuration.
     */
    void SetStrategyAttribute(std::string name, const AttributeValue& value);

    /**
     * @param config the configuration
     * @returns a newly-created topology strategy
     */
    Ptr<wsnsim::TopologyStrategy> CreateStrategy(const wsnsim::SimulationConfig& config) const;

    /**
     * @param config the configuration
     * @returns a newly-created simulator, before its first round
     */
    Ptr<wsnsim::RoundSimulator> Create(const wsnsim::SimulationConfig& config) const;

    /**
     * @brief Run independent repetitions with consecutive seeds.
     *
     * Repetition i uses seed config.seed + i; each one owns its own network,
     * topology state and random streams.
     *
     * @param config the configuration of the first repetition
     * @param repetitions number of runs
     * @return one summary per run
     */
    std::vector<wsnsim::SimulationSummary> RunRepetitions(const wsnsim::SimulationConfig& config,
                                                          uint32_t repetitions) const;

  private:
    /** the factory used when the strategy type is overridden */
    ObjectFactory m_strategyFactory;
    /** true once SetStrategy() has been called */
    bool m_strategyOverride;
    /** attribute overrides, in call order */
    std::vector<std::pair<std::string, Ptr<AttributeValue>>> m_attributes;
};

} // namespace ns3

#endif /* WSNSIM_HELPER_H */
