/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * WSNSIM: round-based wireless sensor network routing simulation
 * First-order radio energy model.
 */

#ifndef WSNSIM_ENERGY_MODEL_H
#define WSNSIM_ENERGY_MODEL_H

#include <cstdint>
#include <ostream>
#include <string>

namespace ns3
{
namespace wsnsim
{

/**
 * @ingroup wsnsim
 * @brief Closed set of sensor hardware platforms.
 */
enum class HardwarePlatform : uint8_t
{
    GENERIC,
    CC2420_TELOSB,
    CC2650_SENSORTAG,
    ESP32_LORA,
};

/**
 * @ingroup wsnsim
 * @brief Energy constants of a hardware platform, all in joules.
 */
struct EnergyParameters
{
    HardwarePlatform platform; ///< Which platform these values describe
    double eElec;              ///< Electronics energy per bit (J/bit)
    double eFreeSpace;         ///< Free-space amplifier energy (J/bit/m^2)
    double eMultipath;         ///< Multipath amplifier energy (J/bit/m^4)
    double eAggregation;       ///< Data aggregation energy per bit per signal (J)
    double eSensing;           ///< Energy of one sensing event (J)
};

/**
 * @param platform the platform
 * @return its constant energy parameters
 */
const EnergyParameters& GetPlatformParameters(HardwarePlatform platform);

/**
 * @brief Parse a platform name such as "cc2420".
 * @param name the name
 * @param platform [out] the parsed platform
 * @return false if the name is unknown
 */
bool PlatformFromString(const std::string& name, HardwarePlatform& platform);

/**
 * @param platform the platform
 * @return its short name
 */
std::string PlatformToString(HardwarePlatform platform);

std::ostream& operator<<(std::ostream& os, HardwarePlatform platform);

/**
 * @ingroup wsnsim
 * @brief First-order radio model (Heinzelman et al.).
 *
 * Transmit energy is electronics energy plus an amplifier term that switches
 * from free-space (d^2) to multipath (d^4) fading at the crossover distance
 * d0 = sqrt(E_fs / E_mp).  A distance equal to d0 uses the multipath term.
 * All results are non-negative and non-decreasing in distance and bits.
 */
class EnergyModel
{
  public:
    /// Uses the generic platform.
    EnergyModel();

    /**
     * @param platform the hardware platform
     */
    explicit EnergyModel(HardwarePlatform platform);

    /**
     * @param bits packet size
     * @param distance transmission distance (m); negative values count as 0
     * @return energy to transmit the packet (J)
     */
    double TransmitEnergy(uint32_t bits, double distance) const;

    /**
     * @brief Transmit energy with an explicit transmit power.
     *
     * The amplifier term is scaled by the linear transmit power relative to
     * 0 dBm; the electronics term is unchanged.
     *
     * @param bits packet size
     * @param distance transmission distance (m)
     * @param txPowerDbm transmit power (dBm)
     * @return energy to transmit the packet (J)
     */
    double TransmitEnergy(uint32_t bits, double distance, double txPowerDbm) const;

    /**
     * @param bits packet size
     * @return energy to receive the packet (J)
     */
    double ReceiveEnergy(uint32_t bits) const;

    /**
     * @param bits packet size
     * @param mergedSignals number of signals fused into one packet
     * @return energy to aggregate the signals (J)
     */
    double AggregationEnergy(uint32_t bits, uint32_t mergedSignals) const;

    /// @return energy of one sensing event (J)
    double SensingEnergy() const;

    /// @return the crossover distance d0 (m)
    double GetCrossoverDistance() const;

    /// @return the platform parameters in use
    const EnergyParameters& GetParameters() const;

  private:
    /**
     * @param bits packet size
     * @param distance distance (m)
     * @return amplifier energy only
     */
    double AmplifierEnergy(uint32_t bits, double distance) const;

    const EnergyParameters* m_params; ///< constant table entry
    double m_d0;                      ///< crossover distance
};

} // namespace wsnsim
} // namespace ns3

#endif /* WSNSIM_ENERGY_MODEL_H */
