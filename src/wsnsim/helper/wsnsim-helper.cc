/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * WSNSIM: round-based wireless sensor network routing simulation
 * Helper class implementation.
 */

#include "wsnsim-helper.h"

#include "ns3/assert.h"
#include "ns3/log.h"
#include "ns3/uinteger.h"

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("WsnSimHelper");

WsnSimHelper::WsnSimHelper()
    : m_strategyOverride(false)
{
}

void
WsnSimHelper::SetStrategy(std::string type)
{
    m_strategyFactory.SetTypeId(type);
    m_strategyOverride = true;
}

void
WsnSimHelper::SetStrategyAttribute(std::string name, const AttributeValue& value)
{
    m_attributes.emplace_back(name, value.Copy());
}

Ptr<wsnsim::TopologyStrategy>
WsnSimHelper::CreateStrategy(const wsnsim::SimulationConfig& config) const
{
    Ptr<wsnsim::TopologyStrategy> strategy;
    if (m_strategyOverride)
    {
        strategy = m_strategyFactory.Create<wsnsim::TopologyStrategy>();
        NS_ASSERT_MSG(strategy, "Strategy type is not a TopologyStrategy");
        strategy->SetAttribute("ReclusterInterval", UintegerValue(config.reclusterInterval));
    }
    else
    {
        strategy = wsnsim::RoundSimulator::CreateStrategy(config);
    }
    for (const auto& attribute : m_attributes)
    {
        strategy->SetAttribute(attribute.first, *attribute.second);
    }
    return strategy;
}

Ptr<wsnsim::RoundSimulator>
WsnSimHelper::Create(const wsnsim::SimulationConfig& config) const
{
    return CreateObject<wsnsim::RoundSimulator>(config, CreateStrategy(config));
}

std::vector<wsnsim::SimulationSummary>
WsnSimHelper::RunRepetitions(const wsnsim::SimulationConfig& config, uint32_t repetitions) const
{
    std::vector<wsnsim::SimulationSummary> summaries;
    summaries.reserve(repetitions);
    for (uint32_t i = 0; i < repetitions; ++i)
    {
        wsnsim::SimulationConfig run = config;
        run.seed = config.seed + i;
        NS_LOG_INFO("Repetition " << i + 1 << "/" << repetitions << " seed " << run.seed);
        Ptr<wsnsim::RoundSimulator> simulator = Create(run);
        summaries.push_back(simulator->Run());
        simulator->Dispose();
    }
    return summaries;
}

} // namespace ns3
