#pragma once

#include "CoreConfig.h"
#include "CoreState.h"

namespace ssd {

struct LogAlignResult {
    LayerVector p_hat;
    AdaptiveGainState gain{}; // updated EMA + alpha_t; zeta passes through
    double input_norm = 0.0;
};

// Adaptive, sign-preserving logarithmic compression of a pressure vector:
//
//   ema     = tau * ema + (1 - tau) * ||p||
//   alpha   = clamp(alpha0 / (epsilon + ema), alpha_min, alpha_max)
//   p_hat_i = sign(p_i) * log(1 + alpha * |p_i|) / log(log_base)
//
// Odd in p for a fixed gain state. When disabled, p is returned unchanged
// and the gain state is passed through untouched.
LogAlignResult applyLogAlignment(const LogAlignParams& params,
                                 const AdaptiveGainState& gain,
                                 const LayerVector& p);

} // namespace ssd
