#include "LeapPolicy.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace ssd {

namespace {

// Overflow-safe logistic.
double sigmoid(double x) {
    if (std::isnan(x)) return 0.0;
    if (x >= 0.0) {
        const double z = std::exp(-x);
        return 1.0 / (1.0 + z);
    }
    const double z = std::exp(x);
    return z / (1.0 + z);
}

double deterministicBiasedProbability(double E, double theta) {
    if (!(E >= theta)) return 0.0;
    const double denom = std::max(theta, kEps);
    return std::min(1.0, (E - theta) / denom);
}

double thermalProbability(double E, double theta, double temperature_T) {
    return sigmoid((E - theta) / std::max(temperature_T, kEps));
}

} // namespace

double leapProbability(LeapPolicy policy, double E, double theta, double temperature_T) {
    switch (policy) {
    case LeapPolicy::Thermal:
        return thermalProbability(E, theta, temperature_T);
    case LeapPolicy::DeterministicBiased:
    default:
        return deterministicBiasedProbability(E, theta);
    }
}

bool inWarmup(const CoreParams& params, const CoreState& state) {
    const int warmup = params.log_align.warmup_steps;
    return warmup > 0 && state.stepCount() < static_cast<std::uint64_t>(warmup);
}

LeapDecision detectLeap(const CoreParams& params,
                        const CoreState& state,
                        const LayerVector& thetas,
                        RandomSource& rng) {
    LeapDecision d;
    d.probability.assign(static_cast<std::size_t>(params.num_layers), 0.0);

    if (inWarmup(params, state)) {
        return d;
    }

    const LeapPolicy policy = selectLeapPolicy(params);
    const LayerVector& E = state.E();

    for (int i = 0; i < params.num_layers; ++i) {
        const std::size_t k = static_cast<std::size_t>(i);
        d.probability[k] = leapProbability(policy, E[k], thetas[k], params.temperature_T);
    }

    for (int i = 0; i < params.num_layers; ++i) {
        const double prob = d.probability[static_cast<std::size_t>(i)];
        if (prob <= 0.0) continue;
        if (rng.uniform01() < prob) {
            d.leap = true;
            d.layer = i;
            break;
        }
    }
    return d;
}

CoreState executeLeap(const CoreParams& params, const CoreState& state, int layer) {
    if (layer < 0 || layer >= params.num_layers) {
        throw InvalidInputError("leap layer " + std::to_string(layer) + " out of range");
    }
    const std::size_t k = static_cast<std::size_t>(layer);

    LayerVector E = state.E();
    LayerVector kappa = state.kappa();
    E[k] *= params.leap_energy_retention;
    kappa[k] += params.leap_kappa_increment;

    LeapRecord rec;
    rec.t_s = state.t();
    rec.kind = leapKindForLayer(layer);
    rec.layer = layer;

    return CoreStateBuilder(state)
        .energy(std::move(E))
        .inertia(std::move(kappa))
        .appendLeap(rec)
        .build();
}

} // namespace ssd
