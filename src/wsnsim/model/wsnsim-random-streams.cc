/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * WSNSIM: round-based wireless sensor network routing simulation
 * Per-run random number handle implementation.
 */

#include "wsnsim-random-streams.h"

#include "ns3/log.h"

#include <algorithm>

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("WsnSimRandomStreams");

namespace wsnsim
{

const int64_t RandomStreams::STREAM_COUNT = 5;

RandomStreams::RandomStreams()
{
    m_normal = CreateObject<NormalRandomVariable>();
    m_trial = CreateObject<UniformRandomVariable>();
    m_placement = CreateObject<UniformRandomVariable>();
    m_sense = CreateObject<UniformRandomVariable>();
    m_senseNoise = CreateObject<NormalRandomVariable>();
}

RandomStreams::RandomStreams(int64_t stream)
    : RandomStreams()
{
    AssignStreams(stream);
}

int64_t
RandomStreams::AssignStreams(int64_t stream)
{
    NS_LOG_FUNCTION(this << stream);
    m_normal->SetStream(stream);
    m_trial->SetStream(stream + 1);
    m_placement->SetStream(stream + 2);
    m_sense->SetStream(stream + 3);
    m_senseNoise->SetStream(stream + 4);
    return STREAM_COUNT;
}

double
RandomStreams::Gaussian(double stddev)
{
    if (stddev <= 0.0)
    {
        return 0.0;
    }
    return m_normal->GetValue(0.0, stddev * stddev);
}

double
RandomStreams::Uniform()
{
    return m_trial->GetValue(0.0, 1.0);
}

double
RandomStreams::Uniform(double min, double max)
{
    return m_trial->GetValue(min, max);
}

bool
RandomStreams::Bernoulli(double p)
{
    p = std::clamp(p, 0.0, 1.0);
    if (p <= 0.0)
    {
        return false;
    }
    if (p >= 1.0)
    {
        return true;
    }
    return Uniform() < p;
}

double
RandomStreams::Place(double min, double max)
{
    return m_placement->GetValue(min, max);
}

double
RandomStreams::Sense(double min, double max, double stddev)
{
    double value = m_sense->GetValue(min, max);
    if (stddev > 0.0)
    {
        value += m_senseNoise->GetValue(0.0, stddev * stddev);
    }
    return value;
}

} // namespace wsnsim
} // namespace ns3
