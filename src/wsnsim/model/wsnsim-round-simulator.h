/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * WSNSIM: round-based wireless sensor network routing simulation
 * Round-stepping simulation engine.
 */

#ifndef WSNSIM_ROUND_SIMULATOR_H
#define WSNSIM_ROUND_SIMULATOR_H

#include "wsnsim-channel-model.h"
#include "wsnsim-energy-model.h"
#include "wsnsim-random-streams.h"
#include "wsnsim-round-record.h"
#include "wsnsim-sensor-node.h"
#include "wsnsim-simulation-config.h"
#include "wsnsim-threshold-reporter.h"
#include "wsnsim-topology-strategy.h"
#include "wsnsim-topology.h"

#include "ns3/object.h"
#include "ns3/ptr.h"
#include "ns3/traced-callback.h"

#include <vector>

/**
 * @defgroup wsnsim WSNSIM
 *
 * Round-based simulation of clustered and chain-based wireless sensor
 * network routing: log-normal shadowing channel with IEEE 802.15.4 link
 * quality, first-order radio energy model, and pluggable topology
 * formation strategies.
 */

namespace ns3
{
namespace wsnsim
{

/**
 * @ingroup wsnsim
 * @brief Drives one run, one round per Step().
 *
 * Each round every alive node senses one reading, members (or chain nodes)
 * send it towards their head (or the chain leader), and every head fuses
 * what it received and forwards one packet to the sink.  In threshold
 * reporting mode a node still pays for sensing but only sends when the
 * ThresholdReporter lets its value through; a node with neither a reading
 * nor a paid reception stays silent.  All randomness
 * comes from the RandomStreams owned by the simulator, so two simulators
 * built from the same configuration produce the same records.
 *
 * The simulator is RUNNING until a Step() finds no alive node; it then
 * moves to NETWORK_DEAD, publishes a zero-alive record on RoundCompleted
 * (not stored with the round records) and every later Step() returns false.
 *
 * Invariant: after every round, the energy accumulated in the records
 * equals the sum over nodes of initial minus residual energy.
 */
class RoundSimulator : public Object
{
  public:
    /// Engine state
    enum State
    {
        RUNNING,
        NETWORK_DEAD,
    };

    /**
     * TracedCallback signature for completed rounds.
     * @param [in] record the round just simulated
     */
    typedef void (*RoundTracedCallback)(const RoundRecord& record);

    /**
     * @brief Get the type ID.
     * @return the object TypeId
     */
    static TypeId GetTypeId();

    /**
     * Build the network and the strategy described by @p config.
     * Aborts if the configuration does not validate.
     * @param config the configuration
     */
    explicit RoundSimulator(const SimulationConfig& config);

    /**
     * Build the network of @p config with an externally configured strategy.
     * @param config the configuration
     * @param strategy the topology strategy to use
     */
    RoundSimulator(const SimulationConfig& config, Ptr<TopologyStrategy> strategy);

    ~RoundSimulator() override;

    /**
     * @brief Create the strategy selected by a configuration.
     * @param config the configuration
     * @return a cluster or chain strategy with the configured attributes
     */
    static Ptr<TopologyStrategy> CreateStrategy(const SimulationConfig& config);

    /**
     * @brief Simulate one round.
     * @param record [out] the round outcome; when no node is alive, a record
     *               with zero alive nodes
     * @return false once the network is dead
     */
    bool Step(RoundRecord& record);

    /**
     * Step until the network dies or the round bound is reached.
     * @return the summary of the run
     */
    SimulationSummary Run();

    /// @return the summary of the rounds simulated so far
    SimulationSummary Finalize() const;

    /// @return the engine state
    State GetState() const
    {
        return m_state;
    }

    /// @return the last round simulated, 0 before the first Step()
    uint32_t GetRound() const
    {
        return m_round;
    }

    /// @return the energy drawn from all batteries so far (J)
    double GetCumulativeEnergy() const
    {
        return m_cumulativeEnergy;
    }

    /// @return the records of the rounds simulated so far
    const std::vector<RoundRecord>& GetRecords() const
    {
        return m_records;
    }

    /// @return the network
    const SensorNetwork& GetNetwork() const
    {
        return m_network;
    }

    /// @return the assignment used by the last round
    const TopologyAssignment& GetAssignment() const
    {
        return m_assignment;
    }

    /// @return the configuration
    const SimulationConfig& GetConfig() const
    {
        return m_config;
    }

    /// @return the topology strategy
    Ptr<TopologyStrategy> GetStrategy() const
    {
        return m_strategy;
    }

    /// @return the reporting state, used in threshold reporting mode
    const ThresholdReporter& GetReporter() const
    {
        return m_reporter;
    }

  protected:
    void DoDispose() override;

  private:
    /// Result of one transmission
    enum class HopOutcome
    {
        NOT_SENT,  ///< sender was dead or had nothing to send
        LOST,      ///< sent but not received
        DELIVERED, ///< received
    };

    /**
     * Charge the battery of a node and account for the energy drawn.
     * @param id node id
     * @param joules requested energy
     * @param record the current round record
     */
    void Draw(uint32_t id, double joules, RoundRecord& record);

    /**
     * @brief One transmission between a node and another node or the sink.
     * @param sender sender id
     * @param receiver receiver id, or DIRECT_TO_SINK for the sink
     * @param record the current round record
     * @param charged [out] true if the receiver paid for a full reception
     * @return the outcome
     */
    HopOutcome Hop(uint32_t sender, uint32_t receiver, RoundRecord& record, bool& charged);

    /**
     * Fuse the readings held by a head and forward them to the sink.
     * @param head head or leader id
     * @param incoming number of receptions the head paid for
     * @param record the current round record
     */
    void Forward(uint32_t head, uint32_t incoming, RoundRecord& record);

    /**
     * @param record the current round record
     */
    void RunClusterRound(RoundRecord& record);

    /**
     * @param record the current round record
     */
    void RunChainRound(RoundRecord& record);

    /**
     * Build the network and hand the radio settings to the strategy.
     */
    void Initialize();

    SimulationConfig m_config;        ///< configuration
    RandomStreams m_rng;              ///< the run's random streams
    ChannelModel m_channel;           ///< channel model
    EnergyModel m_energy;             ///< energy model
    EnvironmentProfile m_environment; ///< environment constants
    SensorNetwork m_network;          ///< node arena
    Ptr<TopologyStrategy> m_strategy; ///< topology strategy
    TopologyAssignment m_assignment;  ///< current assignment
    ThresholdReporter m_reporter;     ///< threshold reporting state

    State m_state;                    ///< engine state
    uint32_t m_round;                 ///< last round simulated
    double m_cumulativeEnergy;        ///< energy drawn so far
    std::vector<uint32_t> m_readings; ///< readings held by each node this round
    std::vector<bool> m_pending;      ///< node holds a reading or a paid reception to send
    std::vector<RoundRecord> m_records; ///< one record per round

    /// Fired at the end of every simulated round, and once on network death.
    TracedCallback<const RoundRecord&> m_roundTrace;
};

} // namespace wsnsim
} // namespace ns3

#endif /* WSNSIM_ROUND_SIMULATOR_H */
