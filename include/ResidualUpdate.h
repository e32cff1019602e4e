#pragma once

#include "CoreConfig.h"

namespace ssd {

struct ResidualResult {
    LayerVector resid; // >= 0 componentwise
    double zeta = 1.0; // scale factor after this tick (unchanged in log-space mode)
    double norm = 0.0;
};

// G_i = G0 + g * kappa_i
LayerVector conductance(const CoreParams& params, const LayerVector& kappa);

// j_i = G_i * p_hat_i
LayerVector throughput(const LayerVector& G, const LayerVector& p_hat);

// max(0, |p_hat| - |j|)
ResidualResult logSpaceResidual(const LayerVector& p_hat, const LayerVector& j, double zeta);

// max(0, |p| - zeta * |j|), with zeta tracked by EMA of (||p|| + eps) / (||j|| + eps)
// and clipped to [zeta_min, zeta_max] when auto-estimation is enabled.
ResidualResult physicalSpaceResidual(const ResidualParams& params,
                                     const LayerVector& p,
                                     const LayerVector& j,
                                     double zeta_prev);

// Dispatches on residualModeOf(params).
ResidualResult computeResidual(const CoreParams& params,
                               const LayerVector& p,
                               const LayerVector& p_hat,
                               const LayerVector& j,
                               double zeta_prev);

// E' = max(0, E + (gamma * resid / R - beta * E + transfer) * dt)
// transfer may be null.
LayerVector integrateEnergy(const CoreParams& params,
                            const LayerVector& E,
                            const LayerVector& resid,
                            const LayerVector* transfer,
                            double dt);

// kappa' = max(kappa_min, kappa + (eta * |j| / (|j| + 1) - lambda * kappa) * dt)
LayerVector integrateInertia(const CoreParams& params,
                             const LayerVector& kappa,
                             const LayerVector& j,
                             double dt);

} // namespace ssd
