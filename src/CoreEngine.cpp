#include "CoreEngine.h"

#include "LeapPolicy.h"
#include "LogAlignment.h"
#include "ResidualUpdate.h"
#include "StructuralPower.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace ssd {

namespace {

CoreParams validated(CoreParams params) {
    validateParams(params);
    return params;
}

double safeRatio(double num, double den) {
    return (den > kEps) ? num / den : 0.0;
}

} // namespace

CoreEngine::CoreEngine(CoreParams params, RandomSource& rng)
    : params_(validated(std::move(params))), rng_(rng) {}

CoreState CoreEngine::initialState() const {
    AdaptiveGainState gain;
    gain.ema_norm = 0.0;
    gain.alpha_t = params_.log_align.alpha0;
    gain.zeta = params_.residual.zeta_init;

    return CoreStateBuilder()
        .energy(LayerVector(static_cast<std::size_t>(params_.num_layers), 0.0))
        .inertia(params_.kappa_min_values)
        .time(0.0)
        .stepCount(0)
        .gain(gain)
        .build();
}

CoreState CoreEngine::initialState(const LayerVector& E0, const LayerVector& kappa0) const {
    requireLayerCount(E0, params_.num_layers, "initial energy");
    requireLayerCount(kappa0, params_.num_layers, "initial inertia");

    LayerVector E(E0.size(), 0.0);
    LayerVector kappa(kappa0.size(), 0.0);
    for (std::size_t i = 0; i < E0.size(); ++i) {
        E[i] = std::isfinite(E0[i]) ? std::max(0.0, E0[i]) : 0.0;
        const double k = std::isfinite(kappa0[i]) ? kappa0[i] : params_.kappa_min_values[i];
        kappa[i] = std::max(params_.kappa_min_values[i], k);
    }

    return CoreStateBuilder(initialState())
        .energy(std::move(E))
        .inertia(std::move(kappa))
        .build();
}

LayerVector CoreEngine::sanitizePressure(const LayerVector& p) const {
    requireLayerCount(p, params_.num_layers, "pressure");
    LayerVector out(p);
    for (double& x : out) {
        if (!std::isfinite(x)) x = 0.0;
    }
    return out;
}

CoreState CoreEngine::advance(const CoreState& state,
                              const LayerVector& p_in,
                              double dt,
                              const LayerVector* interlayer_transfer) {
    const LayerVector p = sanitizePressure(p_in);
    LayerVector transfer;
    if (interlayer_transfer) {
        requireLayerCount(*interlayer_transfer, params_.num_layers, "interlayer transfer");
        transfer = *interlayer_transfer;
        for (double& x : transfer) {
            if (!std::isfinite(x)) x = 0.0;
        }
    }
    if (!std::isfinite(dt) || dt < 0.0) dt = 0.0;

    // 1) Log-Alignment
    const LogAlignResult aligned = applyLogAlignment(params_.log_align, state.gain(), p);
    const LayerVector& p_hat = aligned.p_hat;

    // 2) Structural power + dynamic thresholds (pre-leap state)
    TickDiagnostics diag;
    diag.power = ssd::structuralPower(params_, state.E(), state.kappa(), p_hat);
    diag.theta_dynamic = dynamicThetas(params_, state.kappa(), diag.power);
    diag.dominant_layer = dominantLayerOf(diag.power);
    diag.dominant_power = diag.power[static_cast<std::size_t>(diag.dominant_layer)];

    // 3) Leap detection / execution
    const LeapDecision leap = detectLeap(params_, state, diag.theta_dynamic, rng_);
    diag.leap_probability = leap.probability;
    diag.leap_occurred = leap.leap;
    diag.leap_layer = leap.layer;
    const CoreState base = leap.leap ? executeLeap(params_, state, leap.layer) : state;

    // 4) Conductance, throughput, residual
    const LayerVector G = conductance(params_, base.kappa());
    const LayerVector j = throughput(G, p_hat);
    const ResidualResult resid = computeResidual(params_, p, p_hat, j, base.gain().zeta);

    // 5) Energy and inertia integration
    LayerVector E_next = integrateEnergy(params_, base.E(), resid.resid,
                                         interlayer_transfer ? &transfer : nullptr, dt);
    LayerVector kappa_next = integrateInertia(params_, base.kappa(), j, dt);

    AdaptiveGainState gain = aligned.gain;
    gain.zeta = resid.zeta;

    // 6) Diagnostics
    const std::uint64_t step_next = state.stepCount() + 1;
    const int warmup = params_.log_align.warmup_steps;

    diag.alpha_t = gain.alpha_t;
    diag.zeta = gain.zeta;
    diag.pressure_norm = aligned.input_norm;
    diag.pressure_hat_norm = l2Norm(p_hat);
    diag.throughput_norm = l2Norm(j);
    diag.residual_norm = resid.norm;
    diag.alignment_efficiency_raw = safeRatio(diag.throughput_norm, diag.pressure_norm);
    diag.alignment_efficiency_hat = safeRatio(diag.throughput_norm, diag.pressure_hat_norm);
    diag.compression_ratio = safeRatio(diag.pressure_hat_norm, diag.pressure_norm);
    diag.warmup_completed = warmup > 0 && step_next == static_cast<std::uint64_t>(warmup);
    diag.residual_mode = residualModeOf(params_);
    diag.leap_policy = selectLeapPolicy(params_);
    for (double e : E_next) diag.total_energy += e;

    return CoreStateBuilder(base)
        .energy(std::move(E_next))
        .inertia(std::move(kappa_next))
        .time(state.t() + dt)
        .stepCount(step_next)
        .gain(gain)
        .diagnostics(std::move(diag))
        .build();
}

int CoreEngine::dominantLayer(const CoreState& state, const LayerVector& p) const {
    const LayerVector p_hat = transform(state, p);
    return dominantLayerOf(ssd::structuralPower(params_, state.E(), state.kappa(), p_hat));
}

LayerVector CoreEngine::transform(const CoreState& state, const LayerVector& p) const {
    return applyLogAlignment(params_.log_align, state.gain(), sanitizePressure(p)).p_hat;
}

LayerVector CoreEngine::structuralPower(const CoreState& state, const LayerVector& p_hat) const {
    return ssd::structuralPower(params_, state.E(), state.kappa(), p_hat);
}

double CoreEngine::dynamicTheta(const CoreState& state, const LayerVector& p_hat, int layer) const {
    return ssd::dynamicTheta(params_, state.E(), state.kappa(), p_hat, layer);
}

CoreSnapshot CoreEngine::snapshot(const CoreState& state) const {
    CoreSnapshot s;
    s.E = state.E();
    s.kappa = state.kappa();
    s.alpha_t = state.gain().alpha_t;
    s.zeta = state.gain().zeta;
    s.ema_norm = state.gain().ema_norm;
    s.t_s = state.t();
    s.step_count = state.stepCount();
    return s;
}

} // namespace ssd
