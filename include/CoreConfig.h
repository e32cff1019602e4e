#pragma once

#include <cstdint>
#include <vector>

#include "CoreTypes.h"

namespace ssd {

// ============================================================
// Engine configuration
//
// Rules:
// - Built once, validated by validateParams(), read-only afterwards.
// - Every per-layer vector has exactly num_layers entries.
// - Scalar tunables are not range-checked; degenerate values are absorbed
//   numerically by the engine (epsilon guards, clamps).
// ============================================================

struct LogAlignParams {
    bool enabled = true;

    // Adaptive gain: alpha_t = alpha0 / (epsilon + ema_norm), clipped.
    double alpha0 = 1.0;
    double log_base = 2.718281828459045;
    double ema_tau = 0.9;   // EMA decay for the running pressure magnitude
    double epsilon = 1e-6;
    double alpha_min = 0.01;
    double alpha_max = 10.0;

    // Session-level warmup: leap detection is suppressed while
    // step_count < warmup_steps.
    int warmup_steps = 10;
};

struct ResidualParams {
    // true: residual = max(0, |p_hat| - |j|)
    // false: residual = max(0, |p| - zeta * |j|) with zeta estimated online.
    bool use_log_residual = true;

    bool zeta_auto_estimate = true;
    double zeta_init = 1.0;
    double zeta_min = 0.01;
    double zeta_max = 100.0;
    double zeta_decay = 0.95;
};

struct CoreParams {
    int num_layers = 4;

    std::vector<double> R_values{1000.0, 100.0, 10.0, 1.0};
    std::vector<double> gamma_values{0.15, 0.10, 0.08, 0.05};
    std::vector<double> beta_values{0.001, 0.01, 0.05, 0.1};
    std::vector<double> eta_values{0.9, 0.5, 0.3, 0.2};
    std::vector<double> lambda_values{0.001, 0.01, 0.02, 0.05};
    std::vector<double> kappa_min_values{0.9, 0.8, 0.5, 0.3};
    std::vector<double> Theta_values{200.0, 100.0, 50.0, 30.0};

    // Dynamic threshold
    bool enable_dynamic_theta = true;
    double theta_sensitivity = 0.3;

    // Leap trigger policy
    bool enable_stochastic_leap = false;
    double temperature_T = 0.0;

    // Ohm's-law conductance: G = G0 + g * kappa
    double G0 = 0.5;
    double g = 0.7;

    LogAlignParams log_align{};
    ResidualParams residual{};

    // Leap execution: partial energy reset and inertia reinforcement.
    double leap_energy_retention = 0.1;
    double leap_kappa_increment = 0.1;
};

// Throws ConfigError if num_layers < 1 or any per-layer vector has the wrong length.
void validateParams(const CoreParams& params);

// Valid record for any num_layers >= 1; per-layer defaults are taken from the
// 4-layer baseline, repeating the last entry when more layers are requested.
CoreParams makeDefaultParams(int num_layers = 4);

ResidualMode residualModeOf(const CoreParams& params);
LeapPolicy selectLeapPolicy(const CoreParams& params);

} // namespace ssd
