/*
 * Copyright (c) 2026
 *
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * WSNSIM: round-based wireless sensor network routing simulation
 * Example: run a protocol preset until the network dies and print the summary.
 */

#include "ns3/core-module.h"
#include "ns3/wsnsim-helper.h"

#include <iostream>

using namespace ns3;
using namespace ns3::wsnsim;

NS_LOG_COMPONENT_DEFINE("WsnSimExample");

int
main(int argc, char* argv[])
{
    uint32_t nNodes = 100;
    std::string presetName = "EEHFR";
    std::string environmentName = "indoor_office";
    std::string platformName = "generic";
    uint32_t rounds = 2000;
    uint32_t seed = 1;
    uint32_t repetitions = 1;
    double energy = 2.0;
    bool verbose = false;

    CommandLine cmd(__FILE__);
    cmd.AddValue("nodes", "Number of sensor nodes", nNodes);
    cmd.AddValue("preset", "Protocol preset (LEACH, HEED, PEGASIS, EEHFR, TEEN)", presetName);
    cmd.AddValue("environment", "Deployment environment (e.g. indoor_office)", environmentName);
    cmd.AddValue("platform", "Hardware platform (generic, cc2420, cc2650, esp32_lora)", platformName);
    cmd.AddValue("energy", "Initial battery energy per node (J)", energy);
    cmd.AddValue("rounds", "Round bound", rounds);
    cmd.AddValue("seed", "Seed of the first repetition", seed);
    cmd.AddValue("repetitions", "Number of independent runs", repetitions);
    cmd.AddValue("verbose", "Log every round", verbose);
    cmd.Parse(argc, argv);

    if (verbose)
    {
        LogComponentEnable("WsnSimRoundSimulator", LOG_LEVEL_INFO);
        LogComponentEnable("WsnSimHelper", LOG_LEVEL_INFO);
    }

    SimulationConfig config;
    ProtocolPreset preset = ProtocolPreset::EEHFR;
    if (!PresetFromString(presetName, preset))
    {
        NS_FATAL_ERROR("Unknown preset " << presetName);
    }
    ApplyPreset(config, preset);
    if (!EnvironmentFromString(environmentName, config.environment))
    {
        NS_FATAL_ERROR("Unknown environment " << environmentName);
    }
    if (!PlatformFromString(platformName, config.platform))
    {
        NS_FATAL_ERROR("Unknown platform " << platformName);
    }
    config.nNodes = nNodes;
    config.initialEnergy = energy;
    config.roundBound = rounds;
    config.seed = seed;

    std::string reason;
    if (!config.Validate(&reason))
    {
        NS_FATAL_ERROR("Invalid configuration: " << reason);
    }

    std::cout << "Running " << preset << " with " << nNodes << " nodes, " << config.environment
              << ", " << config.platform << ", " << repetitions << " repetition(s)..."
              << std::endl;

    WsnSimHelper helper;
    std::vector<SimulationSummary> summaries = helper.RunRepetitions(config, repetitions);
    for (std::size_t i = 0; i < summaries.size(); ++i)
    {
        std::cout << "--- repetition " << i + 1 << " (seed " << seed + i << ") ---" << std::endl;
        summaries[i].Print(std::cout);
    }

    return 0;
}
