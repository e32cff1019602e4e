#pragma once

#include "CoreConfig.h"

namespace ssd {

// Power_i = p_hat_i * E_i * kappa_i * R_i
// Throws InvalidInputError if any vector length differs from num_layers.
LayerVector structuralPower(const CoreParams& params,
                            const LayerVector& E,
                            const LayerVector& kappa,
                            const LayerVector& p_hat);

// Index of the maximum power (first one on ties). 0 for an empty vector.
int dominantLayerOf(const LayerVector& power);

// Aggregate influence sum(power) / sum(kappa * R); 0 when the denominator is not positive.
double structuralInfluence(const CoreParams& params,
                           const LayerVector& kappa,
                           const LayerVector& power);

// Effective leap threshold for one layer.
// Disabled: Theta[i] exactly. Enabled: max(1, Theta[i] * (1 - sensitivity * influence)).
double dynamicTheta(const CoreParams& params,
                    const LayerVector& E,
                    const LayerVector& kappa,
                    const LayerVector& p_hat,
                    int layer);

// All layers at once; power is computed a single time.
LayerVector dynamicThetas(const CoreParams& params,
                          const LayerVector& kappa,
                          const LayerVector& power);

} // namespace ssd
