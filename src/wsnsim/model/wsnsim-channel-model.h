/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * WSNSIM: round-based wireless sensor network routing simulation
 * Channel and link-quality model.
 */

#ifndef WSNSIM_CHANNEL_MODEL_H
#define WSNSIM_CHANNEL_MODEL_H

#include "wsnsim-environment.h"
#include "wsnsim-random-streams.h"

#include <cstdint>
#include <vector>

namespace ns3
{
namespace wsnsim
{

/**
 * @ingroup wsnsim
 * @brief Link-quality metrics of a single transmission.
 */
struct LinkMetrics
{
    double receivedPowerDbm; ///< Mean received power after shadowing (dBm)
    double pathLossDb;       ///< Total path loss including shadowing (dB)
    double rssiDbm;          ///< Measured RSSI (dBm)
    uint8_t lqi;             ///< IEEE 802.15.4 link quality indicator, 0-255
    double sinrDb;           ///< Signal to interference plus noise ratio (dB)
    double pdrRssi;          ///< Delivery probability predicted from RSSI alone
    double pdrSinr;          ///< Delivery probability predicted from SINR alone
    double pdr;              ///< min(pdrRssi, pdrSinr), in [0, 1]
};

/**
 * @ingroup wsnsim
 * @brief Log-normal shadowing channel with IEEE 802.15.4 link-quality mapping.
 *
 * The model converts a transmit power and a distance into RSSI, LQI, SINR and
 * packet delivery probability.  It is a pure function of its inputs and of
 * the RandomStreams handle it is given; it holds only the radio constants
 * below and never fails (out-of-range inputs are clamped).
 *
 * Delivery probability is the minimum of two piecewise sub-models, one
 * driven by RSSI (transitional region between sensitivity and -70 dBm) and
 * one driven by SINR, so either a weak signal or heavy interference degrades
 * delivery.
 */
class ChannelModel
{
  public:
    /// Receiver sensitivity of a CC2420-class radio (dBm).
    static constexpr double DEFAULT_SENSITIVITY_DBM = -85.0;
    /// RSSI mapped to the maximum LQI (dBm).
    static constexpr double LQI_CEILING_DBM = -20.0;
    /// Standard deviation of the RSSI measurement noise (dB).
    static constexpr double DEFAULT_RSSI_NOISE_STD_DB = 2.0;
    /// Reference distance of the log-distance model (m).
    static constexpr double REFERENCE_DISTANCE = 1.0;
    /// Attenuation exponent applied to interferer distances.
    static constexpr double INTERFERENCE_EXPONENT = 2.5;

    ChannelModel();

    /**
     * @param sensitivityDbm receiver sensitivity (dBm)
     * @param rssiNoiseStdDb RSSI measurement noise standard deviation (dB)
     */
    ChannelModel(double sensitivityDbm, double rssiNoiseStdDb);

    /**
     * @brief Compute the metrics of one transmission.
     *
     * Draws one shadowing sample and one RSSI measurement-noise sample from
     * @p rng, in that order.
     *
     * @param txPowerDbm   transmit power (dBm)
     * @param distance     sender to receiver distance (m), clamped to >= 1 m
     * @param environment  propagation environment
     * @param interference active interferers (may be empty)
     * @param rng          the run's random streams
     * @return the link metrics
     */
    LinkMetrics ComputeLinkMetrics(double txPowerDbm,
                                   double distance,
                                   const EnvironmentProfile& environment,
                                   const std::vector<InterferenceSource>& interference,
                                   RandomStreams& rng) const;

    /**
     * @brief Compute the metrics of the mean channel (no shadowing, no noise).
     *
     * Used for topology decisions, which must not consume randomness.
     *
     * @param txPowerDbm   transmit power (dBm)
     * @param distance     sender to receiver distance (m)
     * @param environment  propagation environment
     * @param interference active interferers (may be empty)
     * @return the link metrics of the mean channel
     */
    LinkMetrics ExpectedLinkMetrics(double txPowerDbm,
                                    double distance,
                                    const EnvironmentProfile& environment,
                                    const std::vector<InterferenceSource>& interference) const;

    /**
     * @param distance     distance (m), clamped to >= 1 m
     * @param environment  propagation environment
     * @return the mean log-distance path loss, without shadowing (dB)
     */
    double MeanPathLoss(double distance, const EnvironmentProfile& environment) const;

    /**
     * @param rssiDbm measured RSSI (dBm)
     * @return the LQI, linear in RSSI between sensitivity and -20 dBm
     */
    uint8_t RssiToLqi(double rssiDbm) const;

    /**
     * @param rssiDbm measured RSSI (dBm)
     * @return delivery probability predicted from RSSI; exactly 0 below sensitivity
     */
    double RssiToPdr(double rssiDbm) const;

    /**
     * @param sinrDb SINR (dB)
     * @return delivery probability predicted from SINR
     */
    static double SinrToPdr(double sinrDb);

    /**
     * @param signalDbm    received signal power (dBm)
     * @param noiseFloorDbm noise floor (dBm)
     * @param interference active interferers
     * @return SINR in dB, all powers summed in milliwatts
     */
    static double ComputeSinr(double signalDbm,
                              double noiseFloorDbm,
                              const std::vector<InterferenceSource>& interference);

    /// @return the receiver sensitivity (dBm)
    double GetSensitivity() const;

    /// @return the RSSI measurement noise standard deviation (dB)
    double GetRssiNoiseStd() const;

  private:
    /**
     * Build the metrics record once the random terms are known.
     * @param txPowerDbm transmit power
     * @param distance distance
     * @param environment environment
     * @param interference interferers
     * @param shadowingDb shadowing sample
     * @param noiseDb RSSI measurement noise sample
     * @return the metrics
     */
    LinkMetrics Evaluate(double txPowerDbm,
                         double distance,
                         const EnvironmentProfile& environment,
                         const std::vector<InterferenceSource>& interference,
                         double shadowingDb,
                         double noiseDb) const;

    double m_sensitivityDbm; ///< receiver sensitivity
    double m_rssiNoiseStdDb; ///< RSSI measurement noise standard deviation
};

} // namespace wsnsim
} // namespace ns3

#endif /* WSNSIM_CHANNEL_MODEL_H */
