#pragma once

#include <array>
#include <cstdint>

#include "CoreState.h"

namespace ssd {

// Fixed order, compact per-tick sample. Aggregates only, so the layout does
// not depend on the layer count.
struct TelemetrySample {
    float t_s = 0.0f;
    std::uint32_t step_u32 = 0u;
    float total_energy = 0.0f;
    float max_energy = 0.0f;
    float total_kappa = 0.0f;
    float alpha_t = 0.0f;
    float zeta = 0.0f;
    float residual_norm = 0.0f;
    float compression_ratio = 0.0f;
    std::int32_t dominant_layer_i32 = 0;
    std::int32_t leap_layer_i32 = -1; // -1 = no leap on this tick
};

// Ring buffer of telemetry samples (fixed capacity, no allocation per record)
// plus a running CRC32 over every sample ever recorded.
class TelemetryRecorder {
public:
    static constexpr int kCapacity = 2048;

    void reset();

    // Records one sample derived from a post-advance state.
    void record(const CoreState& state);

    int count() const noexcept { return count_; }
    std::uint64_t totalRecorded() const noexcept { return total_; }
    std::uint32_t crc32() const noexcept { return crc_u32_; }

    // Copies up to cap samples, oldest first. Returns the number written.
    int getSamples(TelemetrySample* out_ptr, int cap) const;

    // Most recent sample; false if nothing was recorded.
    bool latest(TelemetrySample* out) const;

private:
    std::array<TelemetrySample, kCapacity> rb_{};
    int head_ = 0;  // next write
    int count_ = 0; // number valid
    std::uint64_t total_ = 0;
    std::uint32_t crc_u32_ = 0u;
};

TelemetrySample makeTelemetrySample(const CoreState& state);

} // namespace ssd
