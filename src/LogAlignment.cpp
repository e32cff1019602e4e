#include "LogAlignment.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace ssd {

namespace {

double logBaseDivisor(double log_base) {
    if (!std::isfinite(log_base) || log_base <= 1.0) return 1.0; // natural log
    const double d = std::log(log_base);
    return (d > kEps) ? d : 1.0;
}

double clipGain(double alpha, double lo, double hi) {
    if (!std::isfinite(alpha)) alpha = hi;
    // Inverted bounds collapse to the lower one.
    if (hi < lo) hi = lo;
    return std::max(0.0, std::clamp(alpha, lo, hi));
}

} // namespace

LogAlignResult applyLogAlignment(const LogAlignParams& params,
                                 const AdaptiveGainState& gain,
                                 const LayerVector& p) {
    LogAlignResult out;
    out.gain = gain;
    out.input_norm = l2Norm(p);

    if (!params.enabled) {
        out.p_hat = p;
        return out;
    }

    const double tau = std::clamp(params.ema_tau, 0.0, 1.0);
    const double eps = std::max(params.epsilon, kEps);

    const double ema = tau * gain.ema_norm + (1.0 - tau) * out.input_norm;
    out.gain.ema_norm = std::isfinite(ema) ? ema : std::numeric_limits<double>::max();
    out.gain.alpha_t = clipGain(params.alpha0 / (eps + out.gain.ema_norm),
                                params.alpha_min, params.alpha_max);

    const double inv_log_base = 1.0 / logBaseDivisor(params.log_base);
    out.p_hat.resize(p.size());
    for (std::size_t i = 0; i < p.size(); ++i) {
        const double mag = std::log1p(out.gain.alpha_t * std::abs(p[i])) * inv_log_base;
        out.p_hat[i] = (p[i] < 0.0) ? -mag : mag;
    }
    return out;
}

} // namespace ssd
