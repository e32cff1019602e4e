#include "RandomSource.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace ssd {

Mt19937Source::Mt19937Source(std::uint32_t seed) : rng_(seed) {}

double Mt19937Source::uniform01() {
    return dist_(rng_);
}

void Mt19937Source::reseed(std::uint32_t seed) {
    rng_.seed(seed);
    dist_.reset();
}

Xorshift32Source::Xorshift32Source(std::uint32_t seed) : s_(seed == 0u ? 2463534242u : seed) {}

double Xorshift32Source::uniform01() {
    s_ ^= (s_ << 13);
    s_ ^= (s_ >> 17);
    s_ ^= (s_ << 5);
    return static_cast<double>(s_) / 4294967296.0; // 2^32
}

SequenceSource::SequenceSource(std::vector<double> values) : values_(std::move(values)) {
    // Keep every replayed value inside [0,1).
    for (double& v : values_) {
        if (!std::isfinite(v)) v = 0.0;
        v = std::clamp(v, 0.0, std::nextafter(1.0, 0.0));
    }
}

double SequenceSource::uniform01() {
    ++draws_;
    if (values_.empty()) {
        return 0.0;
    }
    const double v = values_[next_];
    next_ = (next_ + 1) % values_.size();
    return v;
}

} // namespace ssd
