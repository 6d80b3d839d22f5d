/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * WSNSIM: round-based wireless sensor network routing simulation
 * Per-run random number handle.
 */

#ifndef WSNSIM_RANDOM_STREAMS_H
#define WSNSIM_RANDOM_STREAMS_H

#include "ns3/ptr.h"
#include "ns3/random-variable-stream.h"

#include <cstdint>

namespace ns3
{
namespace wsnsim
{

/**
 * @ingroup wsnsim
 * @brief The random variables owned by one simulation run.
 *
 * Every stochastic draw of the model (shadowing, RSSI measurement noise,
 * delivery trials, head election, node placement, sensed values) goes
 * through an instance of this class that is passed explicitly to the
 * caller.  Two runs whose instances were given the same stream numbers
 * produce identical draws.
 *
 * Not an ns3::Object; owned by composition by the RoundSimulator.
 */
class RandomStreams
{
  public:
    /// Number of ns-3 streams consumed by AssignStreams().
    static const int64_t STREAM_COUNT;

    RandomStreams();

    /**
     * @brief Construct and immediately pin the streams.
     * @param stream first stream index to use
     */
    explicit RandomStreams(int64_t stream);

    /**
     * Assign fixed random variable stream numbers to the random variables
     * used by this handle.
     *
     * @param stream first stream index to use
     * @return the number of stream indices assigned
     */
    int64_t AssignStreams(int64_t stream);

    /**
     * @param stddev standard deviation; zero returns 0 without consuming a draw
     * @return a Normal(0, stddev) sample
     */
    double Gaussian(double stddev);

    /// @return a Uniform[0, 1) sample
    double Uniform();

    /**
     * @param min lower bound
     * @param max upper bound
     * @return a Uniform[min, max) sample
     */
    double Uniform(double min, double max);

    /**
     * @param p success probability, clamped to [0, 1]
     * @return true with probability p
     */
    bool Bernoulli(double p);

    /**
     * Draw from the placement stream, which is kept separate so that the
     * initial layout does not shift the delivery trials.
     *
     * @param min lower bound
     * @param max upper bound
     * @return a placement coordinate in [min, max)
     */
    double Place(double min, double max);

    /**
     * Draw a sensed physical quantity from the sensing streams, separate from
     * the radio so that threshold reporting does not shift the channel.
     *
     * @param min lower bound of the uniform part
     * @param max upper bound of the uniform part
     * @param stddev standard deviation of the Gaussian part
     * @return Uniform[min, max) + Normal(0, stddev)
     */
    double Sense(double min, double max, double stddev);

  private:
    Ptr<NormalRandomVariable> m_normal;     ///< shadowing and measurement noise
    Ptr<UniformRandomVariable> m_trial;     ///< delivery trials and head election
    Ptr<UniformRandomVariable> m_placement; ///< node placement
    Ptr<UniformRandomVariable> m_sense;     ///< sensed value variation
    Ptr<NormalRandomVariable> m_senseNoise; ///< sensed value noise
};

} // namespace wsnsim
} // namespace ns3

#endif /* WSNSIM_RANDOM_STREAMS_H */
