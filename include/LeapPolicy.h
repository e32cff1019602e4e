#pragma once

#include "CoreConfig.h"
#include "CoreState.h"
#include "RandomSource.h"

namespace ssd {

struct LeapDecision {
    bool leap = false;
    int layer = -1;
    // Trigger probability per layer under the active policy (zeros during warmup).
    LayerVector probability;
};

// DeterministicBiased: E >= theta ? min(1, (E - theta) / theta) : 0
// Thermal:             sigmoid((E - theta) / T)
double leapProbability(LeapPolicy policy, double E, double theta, double temperature_T);

bool inWarmup(const CoreParams& params, const CoreState& state);

// Scans layers in index order and draws against each nonzero probability;
// the first successful draw wins and ends the scan. No draws during warmup.
LeapDecision detectLeap(const CoreParams& params,
                        const CoreState& state,
                        const LayerVector& thetas,
                        RandomSource& rng);

// Partial energy reset and inertia reinforcement for one layer, plus a
// history record stamped with the state's current time.
CoreState executeLeap(const CoreParams& params, const CoreState& state, int layer);

} // namespace ssd
