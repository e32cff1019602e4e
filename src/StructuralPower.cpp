#include "StructuralPower.h"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <string>

namespace ssd {

namespace {

constexpr double kMinTheta = 1.0;

double thetaForLayer(const CoreParams& params, double influence, int layer) {
    const double base = params.Theta_values[static_cast<std::size_t>(layer)];
    if (!params.enable_dynamic_theta) {
        return base;
    }
    const double theta = base * (1.0 - params.theta_sensitivity * influence);
    // NaN influence (e.g. inf * 0 power) keeps the base threshold.
    if (!std::isfinite(theta)) return std::max(kMinTheta, base);
    return std::max(kMinTheta, theta);
}

} // namespace

LayerVector structuralPower(const CoreParams& params,
                            const LayerVector& E,
                            const LayerVector& kappa,
                            const LayerVector& p_hat) {
    requireLayerCount(p_hat, params.num_layers, "pressure");
    requireLayerCount(E, params.num_layers, "energy");
    requireLayerCount(kappa, params.num_layers, "inertia");

    LayerVector power(p_hat.size(), 0.0);
    for (std::size_t i = 0; i < power.size(); ++i) {
        power[i] = p_hat[i] * E[i] * kappa[i] * params.R_values[i];
    }
    return power;
}

int dominantLayerOf(const LayerVector& power) {
    if (power.empty()) return 0;
    const auto it = std::max_element(power.begin(), power.end());
    return static_cast<int>(std::distance(power.begin(), it));
}

double structuralInfluence(const CoreParams& params,
                           const LayerVector& kappa,
                           const LayerVector& power) {
    double total_power = 0.0;
    for (double x : power) total_power += x;

    double denom = 0.0;
    for (std::size_t i = 0; i < kappa.size() && i < params.R_values.size(); ++i) {
        denom += kappa[i] * params.R_values[i];
    }
    if (!(denom > 0.0)) return 0.0;
    return total_power / denom;
}

double dynamicTheta(const CoreParams& params,
                    const LayerVector& E,
                    const LayerVector& kappa,
                    const LayerVector& p_hat,
                    int layer) {
    if (layer < 0 || layer >= params.num_layers) {
        throw InvalidInputError("layer index " + std::to_string(layer) + " out of range [0," +
                                std::to_string(params.num_layers) + ")");
    }
    if (!params.enable_dynamic_theta) {
        requireLayerCount(p_hat, params.num_layers, "pressure");
        return params.Theta_values[static_cast<std::size_t>(layer)];
    }
    const LayerVector power = structuralPower(params, E, kappa, p_hat);
    return thetaForLayer(params, structuralInfluence(params, kappa, power), layer);
}

LayerVector dynamicThetas(const CoreParams& params,
                          const LayerVector& kappa,
                          const LayerVector& power) {
    const double influence = params.enable_dynamic_theta
        ? structuralInfluence(params, kappa, power)
        : 0.0;
    LayerVector thetas(static_cast<std::size_t>(params.num_layers), 0.0);
    for (int i = 0; i < params.num_layers; ++i) {
        thetas[static_cast<std::size_t>(i)] = thetaForLayer(params, influence, i);
    }
    return thetas;
}

} // namespace ssd
