#include "Scenario.h"

#include "CoreEngine.h"
#include "RunSignatures.h"
#include "Telemetry.h"

#include <algorithm>
#include <memory>

namespace ssd {

ScenarioMetrics runScenario(const ScenarioConfig& scenario, std::uint32_t rng_seed) {
    Mt19937Source rng(rng_seed);
    CoreEngine engine(scenario.params, rng);

    CoreState state = (scenario.E0.empty() && scenario.kappa0.empty())
        ? engine.initialState()
        : engine.initialState(scenario.E0.empty() ? LayerVector(static_cast<std::size_t>(engine.numLayers()), 0.0)
                                                  : scenario.E0,
                              scenario.kappa0.empty() ? scenario.params.kappa_min_values
                                                      : scenario.kappa0);

    auto telemetry = std::make_unique<TelemetryRecorder>();

    ScenarioMetrics m{};
    for (int i = 0; i < scenario.steps; ++i) {
        state = engine.advance(state, scenario.pressure, scenario.dt_s);
        telemetry->record(state);

        const TickDiagnostics& d = state.diagnostics();
        m.peak_total_energy = std::max(m.peak_total_energy, d.total_energy);
        if (d.leap_occurred) {
            if (m.leap_count == 0) {
                m.first_leap_t_s = state.leapHistory().back().t_s;
                m.first_leap_layer = d.leap_layer;
            }
            m.leap_count++;
        }
    }

    for (double k : state.kappa()) m.final_total_kappa += k;
    m.signatures.config_hash_u32 = paramsHash(scenario.params);
    m.signatures.telemetry_crc_u32 = telemetry->crc32();
    m.signatures.state_digest_u32 = stateDigest(state);
    return m;
}

} // namespace ssd
