#include "ResidualUpdate.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace ssd {

namespace {

constexpr double kMaxFinite = std::numeric_limits<double>::max();

// Non-finite contributions are dropped so the state never carries NaN/Inf.
inline double finiteOr(double x, double fallback) {
    return std::isfinite(x) ? x : fallback;
}

double clampZeta(const ResidualParams& params, double zeta) {
    const double lo = std::max(params.zeta_min, kEps);
    const double hi = std::max(params.zeta_max, lo);
    if (!std::isfinite(zeta)) return hi;
    return std::clamp(zeta, lo, hi);
}

} // namespace

LayerVector conductance(const CoreParams& params, const LayerVector& kappa) {
    LayerVector G(kappa.size(), 0.0);
    for (std::size_t i = 0; i < kappa.size(); ++i) {
        G[i] = params.G0 + params.g * kappa[i];
    }
    return G;
}

LayerVector throughput(const LayerVector& G, const LayerVector& p_hat) {
    LayerVector j(p_hat.size(), 0.0);
    for (std::size_t i = 0; i < p_hat.size() && i < G.size(); ++i) {
        // Overflow saturates with its sign; only NaN collapses to zero.
        const double v = G[i] * p_hat[i];
        j[i] = std::isnan(v) ? 0.0 : std::clamp(v, -kMaxFinite, kMaxFinite);
    }
    return j;
}

ResidualResult logSpaceResidual(const LayerVector& p_hat, const LayerVector& j, double zeta) {
    ResidualResult r;
    r.zeta = zeta;
    r.resid.assign(p_hat.size(), 0.0);
    for (std::size_t i = 0; i < p_hat.size(); ++i) {
        const double d = std::abs(p_hat[i]) - std::abs(j[i]);
        r.resid[i] = std::max(0.0, finiteOr(d, 0.0));
    }
    r.norm = l2Norm(r.resid);
    return r;
}

ResidualResult physicalSpaceResidual(const ResidualParams& params,
                                     const LayerVector& p,
                                     const LayerVector& j,
                                     double zeta_prev) {
    ResidualResult r;
    r.zeta = clampZeta(params, zeta_prev);

    if (params.zeta_auto_estimate) {
        const double ratio = (l2Norm(p) + kEps) / (l2Norm(j) + kEps);
        const double decay = std::clamp(params.zeta_decay, 0.0, 1.0);
        r.zeta = clampZeta(params, decay * r.zeta + (1.0 - decay) * ratio);
    }

    r.resid.assign(p.size(), 0.0);
    for (std::size_t i = 0; i < p.size(); ++i) {
        const double d = std::abs(p[i]) - r.zeta * std::abs(j[i]);
        r.resid[i] = std::max(0.0, finiteOr(d, 0.0));
    }
    r.norm = l2Norm(r.resid);
    return r;
}

ResidualResult computeResidual(const CoreParams& params,
                               const LayerVector& p,
                               const LayerVector& p_hat,
                               const LayerVector& j,
                               double zeta_prev) {
    switch (residualModeOf(params)) {
    case ResidualMode::PhysicalSpace:
        return physicalSpaceResidual(params.residual, p, j, zeta_prev);
    case ResidualMode::LogSpace:
    default:
        return logSpaceResidual(p_hat, j, zeta_prev);
    }
}

LayerVector integrateEnergy(const CoreParams& params,
                            const LayerVector& E,
                            const LayerVector& resid,
                            const LayerVector* transfer,
                            double dt) {
    LayerVector out(E.size(), 0.0);
    for (std::size_t i = 0; i < E.size(); ++i) {
        const double R = std::max(params.R_values[i], kEps);
        const double generation = params.gamma_values[i] * resid[i] / R;
        const double decay = params.beta_values[i] * E[i];
        double dE = generation - decay;
        if (transfer) {
            dE += (*transfer)[i];
        }
        const double next = finiteOr(E[i] + dE * dt, E[i]);
        out[i] = std::max(0.0, next);
    }
    return out;
}

LayerVector integrateInertia(const CoreParams& params,
                             const LayerVector& kappa,
                             const LayerVector& j,
                             double dt) {
    LayerVector out(kappa.size(), 0.0);
    for (std::size_t i = 0; i < kappa.size(); ++i) {
        const double aj = std::abs(j[i]);
        const double usage = aj / (aj + 1.0);
        const double dkappa = params.eta_values[i] * usage - params.lambda_values[i] * kappa[i];
        const double next = finiteOr(kappa[i] + dkappa * dt, kappa[i]);
        out[i] = std::max(params.kappa_min_values[i], next);
    }
    return out;
}

} // namespace ssd
