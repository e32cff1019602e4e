#include "CoreConfig.h"

#include <algorithm>
#include <cstddef>
#include <string>

namespace ssd {

namespace {

void requireLayerLength(const std::vector<double>& values, const char* name, int num_layers) {
    if (values.size() != static_cast<std::size_t>(num_layers)) {
        throw ConfigError(std::string("per-layer array '") + name + "' has " +
                          std::to_string(values.size()) + " entries, expected num_layers=" +
                          std::to_string(num_layers));
    }
}

std::vector<double> resizeFromBaseline(const std::vector<double>& baseline, int n) {
    std::vector<double> out;
    out.reserve(static_cast<std::size_t>(n));
    for (int i = 0; i < n; ++i) {
        const std::size_t k = std::min(static_cast<std::size_t>(i), baseline.size() - 1);
        out.push_back(baseline[k]);
    }
    return out;
}

} // namespace

void validateParams(const CoreParams& params) {
    if (params.num_layers < 1) {
        throw ConfigError("num_layers must be >= 1, got " + std::to_string(params.num_layers));
    }
    requireLayerLength(params.R_values,         "R_values",         params.num_layers);
    requireLayerLength(params.gamma_values,     "gamma_values",     params.num_layers);
    requireLayerLength(params.beta_values,      "beta_values",      params.num_layers);
    requireLayerLength(params.eta_values,       "eta_values",       params.num_layers);
    requireLayerLength(params.lambda_values,    "lambda_values",    params.num_layers);
    requireLayerLength(params.kappa_min_values, "kappa_min_values", params.num_layers);
    requireLayerLength(params.Theta_values,     "Theta_values",     params.num_layers);
}

CoreParams makeDefaultParams(int num_layers) {
    if (num_layers < 1) {
        throw ConfigError("num_layers must be >= 1, got " + std::to_string(num_layers));
    }

    const CoreParams baseline{};
    CoreParams p = baseline;
    p.num_layers = num_layers;
    p.R_values         = resizeFromBaseline(baseline.R_values, num_layers);
    p.gamma_values     = resizeFromBaseline(baseline.gamma_values, num_layers);
    p.beta_values      = resizeFromBaseline(baseline.beta_values, num_layers);
    p.eta_values       = resizeFromBaseline(baseline.eta_values, num_layers);
    p.lambda_values    = resizeFromBaseline(baseline.lambda_values, num_layers);
    p.kappa_min_values = resizeFromBaseline(baseline.kappa_min_values, num_layers);
    p.Theta_values     = resizeFromBaseline(baseline.Theta_values, num_layers);
    return p;
}

ResidualMode residualModeOf(const CoreParams& params) {
    return params.residual.use_log_residual ? ResidualMode::LogSpace : ResidualMode::PhysicalSpace;
}

LeapPolicy selectLeapPolicy(const CoreParams& params) {
    // temperature_T <= 0 (or NaN) always falls back to the deterministic-biased path.
    if (params.enable_stochastic_leap && params.temperature_T > 0.0) {
        return LeapPolicy::Thermal;
    }
    return LeapPolicy::DeterministicBiased;
}

} // namespace ssd
