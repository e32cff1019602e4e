#include "Telemetry.h"

#include "RunSignatures.h"

#include <algorithm>
#include <cstring>

namespace ssd {

namespace {

inline std::uint32_t crcAddF32(std::uint32_t crc, float v) {
    std::uint32_t bits = 0;
    static_assert(sizeof(bits) == sizeof(v), "unexpected float size");
    std::memcpy(&bits, &v, sizeof(v));
    return crc32Update(crc, &bits, sizeof(bits));
}

inline std::uint32_t crcAddU32(std::uint32_t crc, std::uint32_t v) {
    return crc32Update(crc, &v, sizeof(v));
}

// Field by field so struct padding never reaches the checksum.
std::uint32_t crcAddSample(std::uint32_t crc, const TelemetrySample& s) {
    crc = crcAddF32(crc, s.t_s);
    crc = crcAddU32(crc, s.step_u32);
    crc = crcAddF32(crc, s.total_energy);
    crc = crcAddF32(crc, s.max_energy);
    crc = crcAddF32(crc, s.total_kappa);
    crc = crcAddF32(crc, s.alpha_t);
    crc = crcAddF32(crc, s.zeta);
    crc = crcAddF32(crc, s.residual_norm);
    crc = crcAddF32(crc, s.compression_ratio);
    crc = crcAddU32(crc, static_cast<std::uint32_t>(s.dominant_layer_i32));
    crc = crcAddU32(crc, static_cast<std::uint32_t>(s.leap_layer_i32));
    return crc;
}

} // namespace

TelemetrySample makeTelemetrySample(const CoreState& state) {
    TelemetrySample s{};
    s.t_s = static_cast<float>(state.t());
    s.step_u32 = static_cast<std::uint32_t>(state.stepCount());

    double total_E = 0.0;
    double max_E = 0.0;
    for (double e : state.E()) {
        total_E += e;
        max_E = std::max(max_E, e);
    }
    double total_kappa = 0.0;
    for (double k : state.kappa()) total_kappa += k;

    const TickDiagnostics& d = state.diagnostics();
    s.total_energy = static_cast<float>(total_E);
    s.max_energy = static_cast<float>(max_E);
    s.total_kappa = static_cast<float>(total_kappa);
    s.alpha_t = static_cast<float>(state.gain().alpha_t);
    s.zeta = static_cast<float>(state.gain().zeta);
    s.residual_norm = static_cast<float>(d.residual_norm);
    s.compression_ratio = static_cast<float>(d.compression_ratio);
    s.dominant_layer_i32 = d.dominant_layer;
    s.leap_layer_i32 = d.leap_occurred ? d.leap_layer : -1;
    return s;
}

void TelemetryRecorder::reset() {
    head_ = 0;
    count_ = 0;
    total_ = 0;
    crc_u32_ = 0u;
}

void TelemetryRecorder::record(const CoreState& state) {
    const TelemetrySample s = makeTelemetrySample(state);
    rb_[static_cast<std::size_t>(head_)] = s;
    head_ = (head_ + 1) % kCapacity;
    if (count_ < kCapacity) count_++;
    total_++;
    crc_u32_ = crcAddSample(crc_u32_, s);
}

int TelemetryRecorder::getSamples(TelemetrySample* out_ptr, int cap) const {
    if (!out_ptr || cap <= 0) return 0;
    const int n = std::min<int>(count_, cap);
    // Oldest sample index = head - count (mod capacity)
    int idx = (head_ - count_);
    while (idx < 0) idx += kCapacity;
    for (int i = 0; i < n; ++i) {
        out_ptr[i] = rb_[static_cast<std::size_t>((idx + i) % kCapacity)];
    }
    return n;
}

bool TelemetryRecorder::latest(TelemetrySample* out) const {
    if (!out || count_ == 0) return false;
    const int idx = (head_ - 1 + kCapacity) % kCapacity;
    *out = rb_[static_cast<std::size_t>(idx)];
    return true;
}

} // namespace ssd
