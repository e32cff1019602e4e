#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace ssd {

// Per-layer vector. Layer counts are small (typically 2-8) and fixed for the
// lifetime of an engine, so a flat vector indexed by layer is sufficient.
using LayerVector = std::vector<double>;

// Raised when a CoreParams record is malformed (per-layer array length does not
// match num_layers, or num_layers < 1). Never recovered.
class ConfigError : public std::invalid_argument {
public:
    explicit ConfigError(const std::string& what) : std::invalid_argument(what) {}
};

// Raised when a call-time vector does not match the configured layer count,
// or a layer index is out of range. Fatal to that call only.
class InvalidInputError : public std::invalid_argument {
public:
    explicit InvalidInputError(const std::string& what) : std::invalid_argument(what) {}
};

// Leap kind recorded in the history. 0 is reserved for "no leap"; layer i
// maps to kind i + 1 so the numbering stays stable for any layer count.
enum LeapKind : std::int32_t {
    Leap_None = 0,
    Leap_Layer1 = 1,
    Leap_Layer2 = 2,
    Leap_Layer3 = 3,
    Leap_Layer4 = 4,
};

inline std::int32_t leapKindForLayer(int layer) {
    return (layer < 0) ? static_cast<std::int32_t>(Leap_None)
                       : static_cast<std::int32_t>(layer + 1);
}

enum class ResidualMode : int {
    LogSpace = 0,      // residual in transformed (log-aligned) units
    PhysicalSpace = 1, // residual in raw units, throughput rescaled by zeta
};

enum class LeapPolicy : int {
    DeterministicBiased = 0,
    Thermal = 1,
};

// Guard for divides and norms.
constexpr double kEps = 1e-12;

// Scaled by the largest component so squares never overflow; saturates at
// DBL_MAX instead of returning inf.
inline double l2Norm(const LayerVector& v) {
    double m = 0.0;
    for (double x : v) m = std::max(m, std::abs(x));
    if (!(m > 0.0)) return 0.0;
    if (!std::isfinite(m)) return std::numeric_limits<double>::max();

    double s = 0.0;
    for (double x : v) {
        const double r = x / m;
        s += r * r;
    }
    const double n = m * std::sqrt(s);
    return std::isfinite(n) ? n : std::numeric_limits<double>::max();
}

inline void requireLayerCount(const LayerVector& v, int num_layers, const char* name) {
    if (v.size() != static_cast<std::size_t>(num_layers)) {
        throw InvalidInputError(std::string(name) + " has " + std::to_string(v.size()) +
                                " entries, expected " + std::to_string(num_layers));
    }
}

} // namespace ssd
