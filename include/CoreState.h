#pragma once

#include <cstdint>
#include <utility>
#include <vector>

#include "CoreTypes.h"

namespace ssd {

// Persisted bookkeeping for Log-Alignment and physical-space residual scaling.
struct AdaptiveGainState {
    double ema_norm = 0.0; // running mean of ||p||
    double alpha_t = 1.0;  // adaptive gain used on the last tick
    double zeta = 1.0;     // physical residual scale factor
};

struct LeapRecord {
    double t_s = 0.0;
    std::int32_t kind = Leap_None;
    int layer = -1;
};

// Per-tick observability. Derived only; never read back by the update
// equations (zeta/alpha_t persist through AdaptiveGainState instead).
struct TickDiagnostics {
    LayerVector theta_dynamic;
    LayerVector power;
    LayerVector leap_probability;
    int dominant_layer = 0;
    double dominant_power = 0.0;

    bool leap_occurred = false;
    int leap_layer = -1;

    double alpha_t = 0.0;
    double zeta = 0.0;

    double pressure_norm = 0.0;
    double pressure_hat_norm = 0.0;
    double throughput_norm = 0.0;
    double residual_norm = 0.0;

    // ||j|| / ||p|| and ||j|| / ||p_hat||
    double alignment_efficiency_raw = 0.0;
    double alignment_efficiency_hat = 0.0;
    // ||p_hat|| / ||p||
    double compression_ratio = 0.0;

    // Fires exactly on the tick where step_count first reaches warmup_steps.
    bool warmup_completed = false;

    double total_energy = 0.0;
    ResidualMode residual_mode = ResidualMode::LogSpace;
    LeapPolicy leap_policy = LeapPolicy::DeterministicBiased;
};

// Read-only export. All members are copies owned by the caller.
struct CoreSnapshot {
    LayerVector E;
    LayerVector kappa;
    double alpha_t = 0.0;
    double zeta = 0.0;
    double ema_norm = 0.0;
    double t_s = 0.0;
    std::uint64_t step_count = 0;
};

class CoreStateBuilder;

// Immutable simulation state. Successor states are derived from a previous
// state through CoreStateBuilder; there is no in-place mutator.
class CoreState {
public:
    CoreState() = default;

    const LayerVector& E() const noexcept { return E_; }
    const LayerVector& kappa() const noexcept { return kappa_; }
    double t() const noexcept { return t_s_; }
    std::uint64_t stepCount() const noexcept { return step_count_; }
    const std::vector<LeapRecord>& leapHistory() const noexcept { return leap_history_; }
    const AdaptiveGainState& gain() const noexcept { return gain_; }
    const TickDiagnostics& diagnostics() const noexcept { return diagnostics_; }

    int numLayers() const noexcept { return static_cast<int>(E_.size()); }

private:
    friend class CoreStateBuilder;

    LayerVector E_;
    LayerVector kappa_;
    double t_s_ = 0.0;
    std::uint64_t step_count_ = 0;
    std::vector<LeapRecord> leap_history_;
    AdaptiveGainState gain_{};
    TickDiagnostics diagnostics_{};
};

// Field-by-field derivation of the next state from a previous one.
//
//   CoreState next = CoreStateBuilder(prev).time(t).energy(E).build();
//
// Fields not overwritten are carried over from the source state.
class CoreStateBuilder {
public:
    CoreStateBuilder() = default;
    explicit CoreStateBuilder(const CoreState& from) : s_(from) {}

    CoreStateBuilder& energy(LayerVector E) { s_.E_ = std::move(E); return *this; }
    CoreStateBuilder& inertia(LayerVector kappa) { s_.kappa_ = std::move(kappa); return *this; }
    CoreStateBuilder& time(double t_s) { s_.t_s_ = t_s; return *this; }
    CoreStateBuilder& stepCount(std::uint64_t n) { s_.step_count_ = n; return *this; }
    CoreStateBuilder& gain(const AdaptiveGainState& g) { s_.gain_ = g; return *this; }
    CoreStateBuilder& appendLeap(const LeapRecord& rec) { s_.leap_history_.push_back(rec); return *this; }
    CoreStateBuilder& diagnostics(TickDiagnostics d) { s_.diagnostics_ = std::move(d); return *this; }

    CoreState build() const { return s_; }

private:
    CoreState s_{};
};

} // namespace ssd
