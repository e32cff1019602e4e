#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "Scenario.h"

namespace ssd {

// One-parameter sweeps over engine tunables. Every sample runs with the same
// RNG seed so rows differ only by the swept value.
class SensitivityAnalyzer {
public:
    struct ParameterRange {
        double nominal = 0.0;
        double min = 0.0;
        double max = 0.0;
        int samples = 0;
    };

    struct SensitivityRow {
        std::string parameter_name;
        double parameter_value = 0.0;
        ScenarioMetrics metrics{};
    };

    SensitivityAnalyzer();

    void setScenario(const ScenarioConfig& scenario);
    void setSeed(std::uint32_t seed);
    void clearResults();

    void analyzeThetaSensitivity(const ParameterRange& range);
    void analyzeTemperature(const ParameterRange& range);
    void analyzeBaseConductance(const ParameterRange& range);
    void analyzeInertiaGain(const ParameterRange& range);

    const std::vector<SensitivityRow>& results() const;

private:
    ScenarioConfig scenario_{};
    std::uint32_t seed_ = 1337u;
    std::vector<SensitivityRow> results_{};

    std::vector<double> sampleValues(const ParameterRange& range) const;
};

} // namespace ssd
