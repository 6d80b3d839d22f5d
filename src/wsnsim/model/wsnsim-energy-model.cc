/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * WSNSIM: round-based wireless sensor network routing simulation
 * First-order radio energy model implementation.
 */

#include "wsnsim-energy-model.h"

#include "ns3/assert.h"
#include "ns3/log.h"

#include <cmath>
#include <map>

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("WsnSimEnergyModel");

namespace wsnsim
{

namespace
{

// E_fs = 10 pJ/bit/m^2 and E_mp = 0.0013 pJ/bit/m^4 on every platform
const EnergyParameters g_platforms[] = {
    {HardwarePlatform::GENERIC, 50e-9, 10e-12, 0.0013e-12, 5e-9, 1e-6},
    {HardwarePlatform::CC2420_TELOSB, 208.8e-9, 10e-12, 0.0013e-12, 5e-9, 1e-6},
    {HardwarePlatform::CC2650_SENSORTAG, 16.7e-9, 10e-12, 0.0013e-12, 3e-9, 0.5e-6},
    {HardwarePlatform::ESP32_LORA, 200e-9, 10e-12, 0.0013e-12, 10e-9, 2e-6},
};

const std::map<std::string, HardwarePlatform> g_names = {
    {"generic", HardwarePlatform::GENERIC},
    {"cc2420", HardwarePlatform::CC2420_TELOSB},
    {"cc2650", HardwarePlatform::CC2650_SENSORTAG},
    {"esp32_lora", HardwarePlatform::ESP32_LORA},
};

} // namespace

const EnergyParameters&
GetPlatformParameters(HardwarePlatform platform)
{
    auto index = static_cast<std::size_t>(platform);
    NS_ASSERT_MSG(index < sizeof(g_platforms) / sizeof(g_platforms[0]),
                  "Unknown platform " << index);
    return g_platforms[index];
}

bool
PlatformFromString(const std::string& name, HardwarePlatform& platform)
{
    auto it = g_names.find(name);
    if (it == g_names.end())
    {
        NS_LOG_LOGIC("Unknown platform name " << name);
        return false;
    }
    platform = it->second;
    return true;
}

std::string
PlatformToString(HardwarePlatform platform)
{
    for (const auto& pair : g_names)
    {
        if (pair.second == platform)
        {
            return pair.first;
        }
    }
    return "unknown";
}

std::ostream&
operator<<(std::ostream& os, HardwarePlatform platform)
{
    return os << PlatformToString(platform);
}

// ============================================================================
// EnergyModel
// ============================================================================

EnergyModel::EnergyModel()
    : EnergyModel(HardwarePlatform::GENERIC)
{
}

EnergyModel::EnergyModel(HardwarePlatform platform)
    : m_params(&GetPlatformParameters(platform))
{
    m_d0 = std::sqrt(m_params->eFreeSpace / m_params->eMultipath);
    NS_LOG_DEBUG("Platform " << platform << " crossover distance " << m_d0 << " m");
}

double
EnergyModel::AmplifierEnergy(uint32_t bits, double distance) const
{
    if (!(distance > 0.0))
    {
        return 0.0;
    }
    if (distance < m_d0)
    {
        return bits * m_params->eFreeSpace * distance * distance;
    }
    double d2 = distance * distance;
    return bits * m_params->eMultipath * d2 * d2;
}

double
EnergyModel::TransmitEnergy(uint32_t bits, double distance) const
{
    return bits * m_params->eElec + AmplifierEnergy(bits, distance);
}

double
EnergyModel::TransmitEnergy(uint32_t bits, double distance, double txPowerDbm) const
{
    double scale = std::pow(10.0, txPowerDbm / 10.0);
    return bits * m_params->eElec + scale * AmplifierEnergy(bits, distance);
}

double
EnergyModel::ReceiveEnergy(uint32_t bits) const
{
    return bits * m_params->eElec;
}

double
EnergyModel::AggregationEnergy(uint32_t bits, uint32_t mergedSignals) const
{
    return bits * m_params->eAggregation * mergedSignals;
}

double
EnergyModel::SensingEnergy() const
{
    return m_params->eSensing;
}

double
EnergyModel::GetCrossoverDistance() const
{
    return m_d0;
}

const EnergyParameters&
EnergyModel::GetParameters() const
{
    return *m_params;
}

} // namespace wsnsim
} // namespace ns3
