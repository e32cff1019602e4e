#pragma once

#include <cstdint>

#include "CoreConfig.h"
#include "RunSignatures.h"

namespace ssd {

// Constant-pressure run used by the analysis tools.
struct ScenarioConfig {
    CoreParams params{};
    LayerVector pressure{50.0, 30.0, 10.0, 5.0};

    // Optional seed state; empty vectors mean CoreEngine::initialState().
    LayerVector E0{};
    LayerVector kappa0{};

    double dt_s = 0.1;
    int steps = 200;
};

struct ScenarioMetrics {
    int leap_count = 0;
    double first_leap_t_s = -1.0; // -1 = no leap
    int first_leap_layer = -1;
    double peak_total_energy = 0.0;
    double final_total_kappa = 0.0;
    // Params hash, CRC over every tick's telemetry sample, final state digest.
    RunSignatures signatures{};
};

// Runs scenario.steps ticks with a Mt19937Source seeded by rng_seed.
// Throws ConfigError / InvalidInputError for malformed scenarios.
ScenarioMetrics runScenario(const ScenarioConfig& scenario, std::uint32_t rng_seed);

} // namespace ssd
