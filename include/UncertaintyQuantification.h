#pragma once

#include <cstdint>
#include <vector>

#include "Scenario.h"

namespace ssd {

// Monte Carlo over independent seeded trials, optionally with Latin hypercube
// perturbation of selected tunables. Quantifies how leap timing and counts
// spread under the stochastic trigger policies.
class MonteCarloUQ {
public:
    struct ParameterRange {
        double min = 1.0;
        double max = 1.0;
    };

    struct UQResult {
        double mean = 0.0;
        double median = 0.0;
        double ci_lower_95 = 0.0;
        double ci_upper_95 = 0.0;
        double std_dev = 0.0;
    };

    struct UQSummary {
        UQResult leap_count{};
        // Trials without a leap contribute the scenario end time (censored).
        UQResult first_leap_t_s{};
        UQResult peak_total_energy{};
        // Fraction of trials with at least one leap.
        double leap_frequency = 0.0;
        int samples = 0;
    };

    // Multiplicative scales (Theta, gamma, G0) and an additive temperature
    // offset. Collapsed ranges (min == max) keep the nominal scenario, so the
    // default is a pure seed ensemble.
    struct UQRanges {
        ParameterRange theta_scale{1.0, 1.0};
        ParameterRange gamma_scale{1.0, 1.0};
        ParameterRange G0_scale{1.0, 1.0};
        ParameterRange temperature_offset{0.0, 0.0};
    };

    MonteCarloUQ();

    void setScenario(const ScenarioConfig& scenario);
    void setRanges(const UQRanges& ranges);
    void setBaseSeed(std::uint32_t seed);

    UQSummary runMonteCarlo(const ScenarioConfig& scenario, int num_samples = 100) const;
    UQSummary runMonteCarlo(int num_samples = 100) const;

private:
    ScenarioConfig scenario_{};
    UQRanges ranges_{};
    std::uint32_t base_seed_ = 1337u;

    UQResult summarize(const std::vector<double>& values) const;
};

} // namespace ssd
