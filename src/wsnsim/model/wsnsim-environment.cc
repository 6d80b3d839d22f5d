/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * WSNSIM: round-based wireless sensor network routing simulation
 * Environment profile tables.
 *
 * Values follow the log-distance shadowing measurements commonly used for
 * IEEE 802.15.4 links at 2.4 GHz (office, factory and residential indoor
 * sites; open, suburban and urban outdoor sites).
 */

#include "wsnsim-environment.h"

#include "ns3/assert.h"
#include "ns3/log.h"

#include <map>

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("WsnSimEnvironment");

namespace wsnsim
{

namespace
{

const EnvironmentProfile g_profiles[] = {
    {EnvironmentType::INDOOR_OFFICE, 2.0, 40.0, 4.5, -95.0, 2.4},
    {EnvironmentType::INDOOR_FACTORY, 2.7, 45.0, 8.5, -92.0, 2.4},
    {EnvironmentType::INDOOR_RESIDENTIAL, 1.8, 38.0, 3.5, -96.0, 2.4},
    {EnvironmentType::OUTDOOR_OPEN, 2.1, 32.0, 4.0, -98.0, 2.4},
    {EnvironmentType::OUTDOOR_SUBURBAN, 2.8, 38.0, 7.5, -96.0, 2.4},
    {EnvironmentType::OUTDOOR_URBAN, 3.4, 44.0, 12.0, -93.0, 2.4},
};

const std::map<std::string, EnvironmentType> g_names = {
    {"indoor_office", EnvironmentType::INDOOR_OFFICE},
    {"indoor_factory", EnvironmentType::INDOOR_FACTORY},
    {"indoor_residential", EnvironmentType::INDOOR_RESIDENTIAL},
    {"outdoor_open", EnvironmentType::OUTDOOR_OPEN},
    {"outdoor_suburban", EnvironmentType::OUTDOOR_SUBURBAN},
    {"outdoor_urban", EnvironmentType::OUTDOOR_URBAN},
};

} // namespace

const EnvironmentProfile&
GetEnvironmentProfile(EnvironmentType type)
{
    auto index = static_cast<std::size_t>(type);
    NS_ASSERT_MSG(index < sizeof(g_profiles) / sizeof(g_profiles[0]),
                  "Unknown environment " << index);
    return g_profiles[index];
}

bool
EnvironmentFromString(const std::string& name, EnvironmentType& type)
{
    auto it = g_names.find(name);
    if (it == g_names.end())
    {
        NS_LOG_LOGIC("Unknown environment name " << name);
        return false;
    }
    type = it->second;
    return true;
}

std::string
EnvironmentToString(EnvironmentType type)
{
    for (const auto& pair : g_names)
    {
        if (pair.second == type)
        {
            return pair.first;
        }
    }
    return "unknown";
}

std::vector<EnvironmentType>
GetAllEnvironments()
{
    std::vector<EnvironmentType> all;
    for (const auto& profile : g_profiles)
    {
        all.push_back(profile.type);
    }
    return all;
}

std::ostream&
operator<<(std::ostream& os, EnvironmentType type)
{
    return os << EnvironmentToString(type);
}

} // namespace wsnsim
} // namespace ns3
