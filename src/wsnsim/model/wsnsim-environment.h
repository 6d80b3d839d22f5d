/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * WSNSIM: round-based wireless sensor network routing simulation
 * Radio environment profiles and interference sources.
 */

#ifndef WSNSIM_ENVIRONMENT_H
#define WSNSIM_ENVIRONMENT_H

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace ns3
{
namespace wsnsim
{

/**
 * @ingroup wsnsim
 * @brief Closed set of propagation environments.
 */
enum class EnvironmentType : uint8_t
{
    INDOOR_OFFICE,
    INDOOR_FACTORY,
    INDOOR_RESIDENTIAL,
    OUTDOOR_OPEN,
    OUTDOOR_SUBURBAN,
    OUTDOOR_URBAN,
};

/**
 * @ingroup wsnsim
 * @brief Log-distance shadowing parameters of one environment.
 *
 * Immutable once selected; obtain one through GetEnvironmentProfile().
 */
struct EnvironmentProfile
{
    EnvironmentType type;     ///< Which environment these values describe
    double pathLossExponent;  ///< Path-loss exponent n
    double referenceLossDb;   ///< Path loss at the reference distance (dB)
    double shadowingStdDb;    ///< Log-normal shadowing standard deviation (dB)
    double noiseFloorDbm;     ///< Thermal + ambient noise floor (dBm)
    double frequencyGhz;      ///< Carrier frequency (GHz)
};

/**
 * @brief Look up the constant profile of an environment.
 * @param type the environment
 * @return the profile
 */
const EnvironmentProfile& GetEnvironmentProfile(EnvironmentType type);

/**
 * @brief Parse an environment name such as "indoor_factory".
 * @param name the name (case sensitive, snake case)
 * @param type [out] the parsed environment
 * @return false if the name is unknown
 */
bool EnvironmentFromString(const std::string& name, EnvironmentType& type);

/**
 * @param type the environment
 * @return the snake case name of the environment
 */
std::string EnvironmentToString(EnvironmentType type);

/// @return every environment, in declaration order
std::vector<EnvironmentType> GetAllEnvironments();

std::ostream& operator<<(std::ostream& os, EnvironmentType type);

/**
 * @ingroup wsnsim
 * @brief Category tag of an interference source.
 */
enum class InterferenceKind : uint8_t
{
    WIFI,
    BLUETOOTH,
    MICROWAVE,
    MOTOR,
    OTHER,
};

/**
 * @ingroup wsnsim
 * @brief A co-channel interferer seen by every receiver.
 *
 * Contributes additively, in linear power, to the SINR denominator.
 */
struct InterferenceSource
{
    double powerDbm;       ///< Interferer transmit power (dBm)
    double distance;       ///< Distance from the receiver reference point (m)
    InterferenceKind kind; ///< Category tag

    InterferenceSource()
        : powerDbm(-30.0),
          distance(10.0),
          kind(InterferenceKind::WIFI)
    {
    }

    InterferenceSource(double power, double dist, InterferenceKind k)
        : powerDbm(power),
          distance(dist),
          kind(k)
    {
    }
};

} // namespace wsnsim
} // namespace ns3

#endif /* WSNSIM_ENVIRONMENT_H */
