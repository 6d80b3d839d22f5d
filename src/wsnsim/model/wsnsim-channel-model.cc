/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * WSNSIM: round-based wireless sensor network routing simulation
 * Channel and link-quality model implementation.
 *
 * Path loss:   PL(d) = PL(d0) + 10 n log10(d / d0) + X,  X ~ N(0, sigma)
 * RSSI:        P_tx - PL(d) + N(0, sigma_meas)
 * SINR:        S / (N + sum I_i / d_i^2.5), powers in mW
 * PDR:         min(f_rssi(RSSI), f_sinr(SINR))
 */

#include "wsnsim-channel-model.h"

#include "ns3/log.h"

#include <algorithm>
#include <cmath>

namespace ns3
{

NS_LOG_COMPONENT_DEFINE("WsnSimChannelModel");

namespace wsnsim
{

namespace
{

/// Start of the strong-signal region of the RSSI sub-model (dBm).
const double STRONG_SIGNAL_DBM = -70.0;
/// Start of the transitional region of the RSSI sub-model (dBm).
const double TRANSITIONAL_DBM = -80.0;
/// Smallest linear SINR fed to the logarithm.
const double MIN_SINR_LINEAR = 1e-10;

double
DbmToMilliwatt(double dbm)
{
    return std::pow(10.0, dbm / 10.0);
}

} // namespace

ChannelModel::ChannelModel()
    : m_sensitivityDbm(DEFAULT_SENSITIVITY_DBM),
      m_rssiNoiseStdDb(DEFAULT_RSSI_NOISE_STD_DB)
{
}

ChannelModel::ChannelModel(double sensitivityDbm, double rssiNoiseStdDb)
    : m_sensitivityDbm(std::min(sensitivityDbm, LQI_CEILING_DBM - 1.0)),
      m_rssiNoiseStdDb(std::max(0.0, rssiNoiseStdDb))
{
}

LinkMetrics
ChannelModel::ComputeLinkMetrics(double txPowerDbm,
                                 double distance,
                                 const EnvironmentProfile& environment,
                                 const std::vector<InterferenceSource>& interference,
                                 RandomStreams& rng) const
{
    double shadowing = rng.Gaussian(environment.shadowingStdDb);
    double noise = rng.Gaussian(m_rssiNoiseStdDb);
    LinkMetrics m =
        Evaluate(txPowerDbm, distance, environment, interference, shadowing, noise);
    NS_LOG_LOGIC("d=" << distance << "m rssi=" << m.rssiDbm << "dBm sinr=" << m.sinrDb
                      << "dB pdr=" << m.pdr);
    return m;
}

LinkMetrics
ChannelModel::ExpectedLinkMetrics(double txPowerDbm,
                                  double distance,
                                  const EnvironmentProfile& environment,
                                  const std::vector<InterferenceSource>& interference) const
{
    return Evaluate(txPowerDbm, distance, environment, interference, 0.0, 0.0);
}

double
ChannelModel::MeanPathLoss(double distance, const EnvironmentProfile& environment) const
{
    if (!(distance >= REFERENCE_DISTANCE))
    {
        // also catches NaN
        distance = REFERENCE_DISTANCE;
    }
    return environment.referenceLossDb +
           10.0 * environment.pathLossExponent * std::log10(distance / REFERENCE_DISTANCE);
}

uint8_t
ChannelModel::RssiToLqi(double rssiDbm) const
{
    if (rssiDbm < m_sensitivityDbm)
    {
        return 0;
    }
    double normalized = (rssiDbm - m_sensitivityDbm) / (LQI_CEILING_DBM - m_sensitivityDbm);
    double lqi = std::floor(normalized * 255.0);
    return static_cast<uint8_t>(std::clamp(lqi, 0.0, 255.0));
}

double
ChannelModel::RssiToPdr(double rssiDbm) const
{
    if (!(rssiDbm >= m_sensitivityDbm))
    {
        return 0.0;
    }
    double pdr;
    if (rssiDbm > STRONG_SIGNAL_DBM)
    {
        pdr = 0.99;
    }
    else if (rssiDbm > TRANSITIONAL_DBM)
    {
        pdr = 0.5 + 0.49 * (rssiDbm - TRANSITIONAL_DBM) / (STRONG_SIGNAL_DBM - TRANSITIONAL_DBM);
    }
    else
    {
        // weak region, ramps from 0 at sensitivity to 0.5 at -80 dBm
        pdr = (rssiDbm - m_sensitivityDbm) / (TRANSITIONAL_DBM - m_sensitivityDbm) * 0.5;
    }
    return std::clamp(pdr, 0.0, 1.0);
}

double
ChannelModel::SinrToPdr(double sinrDb)
{
    double pdr;
    if (sinrDb > 15.0)
    {
        pdr = 0.95;
    }
    else if (sinrDb > 10.0)
    {
        pdr = 0.8 + 0.15 * (sinrDb - 10.0) / 5.0;
    }
    else if (sinrDb > 5.0)
    {
        pdr = 0.5 + 0.3 * (sinrDb - 5.0) / 5.0;
    }
    else if (sinrDb > 0.0)
    {
        pdr = 0.1 + 0.4 * sinrDb / 5.0;
    }
    else
    {
        pdr = 0.05;
    }
    return std::clamp(pdr, 0.0, 1.0);
}

double
ChannelModel::ComputeSinr(double signalDbm,
                          double noiseFloorDbm,
                          const std::vector<InterferenceSource>& interference)
{
    double signal = DbmToMilliwatt(signalDbm);
    double noise = DbmToMilliwatt(noiseFloorDbm);
    double total = 0.0;
    for (const auto& source : interference)
    {
        double attenuation = std::pow(std::max(source.distance, 0.0), INTERFERENCE_EXPONENT);
        total += DbmToMilliwatt(source.powerDbm) / std::max(attenuation, 1.0);
    }
    double sinr = signal / (noise + total);
    if (!(sinr > MIN_SINR_LINEAR))
    {
        sinr = MIN_SINR_LINEAR;
    }
    return 10.0 * std::log10(sinr);
}

double
ChannelModel::GetSensitivity() const
{
    return m_sensitivityDbm;
}

double
ChannelModel::GetRssiNoiseStd() const
{
    return m_rssiNoiseStdDb;
}

LinkMetrics
ChannelModel::Evaluate(double txPowerDbm,
                       double distance,
                       const EnvironmentProfile& environment,
                       const std::vector<InterferenceSource>& interference,
                       double shadowingDb,
                       double noiseDb) const
{
    LinkMetrics m;
    m.pathLossDb = MeanPathLoss(distance, environment) + shadowingDb;
    m.receivedPowerDbm = txPowerDbm - m.pathLossDb;
    m.rssiDbm = m.receivedPowerDbm + noiseDb;
    m.lqi = RssiToLqi(m.rssiDbm);
    m.sinrDb = ComputeSinr(m.receivedPowerDbm, environment.noiseFloorDbm, interference);
    m.pdrRssi = RssiToPdr(m.rssiDbm);
    m.pdrSinr = SinrToPdr(m.sinrDb);
    m.pdr = std::min(m.pdrRssi, m.pdrSinr);
    return m;
}

} // namespace wsnsim
} // namespace ns3
