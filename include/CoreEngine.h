#pragma once

#include "CoreConfig.h"
#include "CoreState.h"
#include "RandomSource.h"

namespace ssd {

// ============================================================
// Structural core engine
//
// Per tick:
//   p -> Log-Alignment -> structural power / dynamic thresholds
//     -> leap detection -> optional leap execution
//     -> conductance / throughput -> residual -> energy -> inertia
//     -> diagnostics -> new state
//
// Invariants after every advance():
//   E_i >= 0, kappa_i >= kappa_min_i, history append-only.
// ============================================================
class CoreEngine {
public:
    // Throws ConfigError on a malformed record. rng must outlive the engine.
    CoreEngine(CoreParams params, RandomSource& rng);

    // Copies would share the injected source; keep one engine per session.
    CoreEngine(const CoreEngine&) = delete;
    CoreEngine& operator=(const CoreEngine&) = delete;

    const CoreParams& params() const noexcept { return params_; }
    int numLayers() const noexcept { return params_.num_layers; }

    // E = 0, kappa = kappa_min, t = 0, step = 0.
    CoreState initialState() const;

    // Caller-chosen seed; throws InvalidInputError on length mismatch.
    // E is clamped at 0 and kappa at the configured floor.
    CoreState initialState(const LayerVector& E0, const LayerVector& kappa0) const;

    // The single state transition. Throws InvalidInputError if p (or transfer,
    // when given) does not have num_layers entries. Non-finite pressure
    // components are read as 0; negative or non-finite dt is read as 0.
    CoreState advance(const CoreState& state,
                      const LayerVector& p,
                      double dt = 0.1,
                      const LayerVector* interlayer_transfer = nullptr);

    // Read-only: Log-Alignment on a copy of the gain state, then structural power.
    int dominantLayer(const CoreState& state, const LayerVector& p) const;

    // Read-only Log-Alignment preview (gain state is not persisted).
    LayerVector transform(const CoreState& state, const LayerVector& p) const;

    // Read-only queries over an already transformed pressure vector.
    LayerVector structuralPower(const CoreState& state, const LayerVector& p_hat) const;
    double dynamicTheta(const CoreState& state, const LayerVector& p_hat, int layer) const;

    CoreSnapshot snapshot(const CoreState& state) const;

private:
    LayerVector sanitizePressure(const LayerVector& p) const;

    const CoreParams params_;
    RandomSource& rng_;
};

} // namespace ssd
