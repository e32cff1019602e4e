#include "SensitivityAnalysis.h"

#include <algorithm>

namespace ssd {

SensitivityAnalyzer::SensitivityAnalyzer() = default;

void SensitivityAnalyzer::setScenario(const ScenarioConfig& scenario) {
    scenario_ = scenario;
}

void SensitivityAnalyzer::setSeed(std::uint32_t seed) {
    seed_ = seed;
}

void SensitivityAnalyzer::clearResults() {
    results_.clear();
}

std::vector<double> SensitivityAnalyzer::sampleValues(const ParameterRange& range) const {
    std::vector<double> values;
    if (range.samples <= 1 || range.max <= range.min) {
        values.push_back(range.nominal);
        return values;
    }

    values.reserve(static_cast<std::size_t>(range.samples));
    const double span = range.max - range.min;
    const int steps = range.samples - 1;
    for (int i = 0; i < range.samples; ++i) {
        const double t = static_cast<double>(i) / static_cast<double>(steps);
        values.push_back(range.min + span * t);
    }
    return values;
}

void SensitivityAnalyzer::analyzeThetaSensitivity(const ParameterRange& range) {
    clearResults();
    for (double value : sampleValues(range)) {
        ScenarioConfig scenario = scenario_;
        scenario.params.enable_dynamic_theta = true;
        scenario.params.theta_sensitivity = value;
        results_.push_back({"theta_sensitivity", value, runScenario(scenario, seed_)});
    }
}

void SensitivityAnalyzer::analyzeTemperature(const ParameterRange& range) {
    clearResults();
    for (double value : sampleValues(range)) {
        ScenarioConfig scenario = scenario_;
        scenario.params.enable_stochastic_leap = true;
        scenario.params.temperature_T = std::max(0.0, value);
        results_.push_back({"temperature_T", value, runScenario(scenario, seed_)});
    }
}

void SensitivityAnalyzer::analyzeBaseConductance(const ParameterRange& range) {
    clearResults();
    for (double value : sampleValues(range)) {
        ScenarioConfig scenario = scenario_;
        scenario.params.G0 = value;
        results_.push_back({"G0", value, runScenario(scenario, seed_)});
    }
}

void SensitivityAnalyzer::analyzeInertiaGain(const ParameterRange& range) {
    clearResults();
    for (double value : sampleValues(range)) {
        ScenarioConfig scenario = scenario_;
        scenario.params.g = value;
        results_.push_back({"g", value, runScenario(scenario, seed_)});
    }
}

const std::vector<SensitivityAnalyzer::SensitivityRow>& SensitivityAnalyzer::results() const {
    return results_;
}

} // namespace ssd
