#include "UncertaintyQuantification.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>

namespace ssd {

namespace {
std::vector<double> latinHypercubeSamples(double min_val, double max_val, int samples, std::mt19937& rng) {
    std::vector<double> bins;
    bins.reserve(static_cast<std::size_t>(samples));

    std::uniform_real_distribution<double> unit_dist(0.0, 1.0);
    for (int i = 0; i < samples; ++i) {
        const double u = (static_cast<double>(i) + unit_dist(rng)) / static_cast<double>(samples);
        bins.push_back(u);
    }
    std::shuffle(bins.begin(), bins.end(), rng);

    const double span = max_val - min_val;
    for (double& v : bins) {
        v = min_val + span * v;
    }
    return bins;
}

int clampSamples(int samples) {
    return samples < 1 ? 1 : samples;
}

void scaleAll(std::vector<double>& values, double s) {
    for (double& v : values) v *= s;
}
} // namespace

MonteCarloUQ::MonteCarloUQ() = default;

void MonteCarloUQ::setScenario(const ScenarioConfig& scenario) {
    scenario_ = scenario;
}

void MonteCarloUQ::setRanges(const UQRanges& ranges) {
    ranges_ = ranges;
}

void MonteCarloUQ::setBaseSeed(std::uint32_t seed) {
    base_seed_ = seed;
}

MonteCarloUQ::UQResult MonteCarloUQ::summarize(const std::vector<double>& values) const {
    UQResult result{};
    if (values.empty()) {
        return result;
    }

    const double mean = std::accumulate(values.begin(), values.end(), 0.0) / values.size();
    double variance = 0.0;
    for (double v : values) {
        const double d = v - mean;
        variance += d * d;
    }
    variance /= static_cast<double>(values.size());

    std::vector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());

    auto percentile = [&](double p) {
        if (sorted.size() == 1) return sorted.front();
        const double pos = p * (sorted.size() - 1);
        const std::size_t idx = static_cast<std::size_t>(pos);
        const double frac = pos - static_cast<double>(idx);
        if (idx + 1 >= sorted.size()) return sorted.back();
        return sorted[idx] * (1.0 - frac) + sorted[idx + 1] * frac;
    };

    result.mean = mean;
    result.median = percentile(0.5);
    result.ci_lower_95 = percentile(0.025);
    result.ci_upper_95 = percentile(0.975);
    result.std_dev = std::sqrt(variance);
    return result;
}

MonteCarloUQ::UQSummary MonteCarloUQ::runMonteCarlo(const ScenarioConfig& scenario, int num_samples) const {
    const int samples = clampSamples(num_samples);
    std::mt19937 rng(base_seed_);

    auto theta_samples = latinHypercubeSamples(ranges_.theta_scale.min,
                                               ranges_.theta_scale.max,
                                               samples,
                                               rng);
    auto gamma_samples = latinHypercubeSamples(ranges_.gamma_scale.min,
                                               ranges_.gamma_scale.max,
                                               samples,
                                               rng);
    auto G0_samples = latinHypercubeSamples(ranges_.G0_scale.min,
                                            ranges_.G0_scale.max,
                                            samples,
                                            rng);
    auto temp_samples = latinHypercubeSamples(ranges_.temperature_offset.min,
                                              ranges_.temperature_offset.max,
                                              samples,
                                              rng);

    const double t_end_s = scenario.dt_s * static_cast<double>(std::max(0, scenario.steps));

    std::vector<double> leap_count;
    std::vector<double> first_leap_t;
    std::vector<double> peak_E;
    leap_count.reserve(static_cast<std::size_t>(samples));
    first_leap_t.reserve(static_cast<std::size_t>(samples));
    peak_E.reserve(static_cast<std::size_t>(samples));

    int trials_with_leap = 0;
    for (int i = 0; i < samples; ++i) {
        ScenarioConfig varied = scenario;
        scaleAll(varied.params.Theta_values, theta_samples[i]);
        scaleAll(varied.params.gamma_values, gamma_samples[i]);
        varied.params.G0 *= G0_samples[i];
        varied.params.temperature_T = std::max(0.0, varied.params.temperature_T + temp_samples[i]);

        // Independent stream per trial, drawn from the ensemble seed stream.
        const std::uint32_t trial_seed = static_cast<std::uint32_t>(rng());
        const auto metrics = runScenario(varied, trial_seed);

        leap_count.push_back(static_cast<double>(metrics.leap_count));
        first_leap_t.push_back(metrics.leap_count > 0 ? metrics.first_leap_t_s : t_end_s);
        peak_E.push_back(metrics.peak_total_energy);
        if (metrics.leap_count > 0) trials_with_leap++;
    }

    UQSummary summary{};
    summary.leap_count = summarize(leap_count);
    summary.first_leap_t_s = summarize(first_leap_t);
    summary.peak_total_energy = summarize(peak_E);
    summary.leap_frequency = static_cast<double>(trials_with_leap) / static_cast<double>(samples);
    summary.samples = samples;
    return summary;
}

MonteCarloUQ::UQSummary MonteCarloUQ::runMonteCarlo(int num_samples) const {
    return runMonteCarlo(scenario_, num_samples);
}

} // namespace ssd
