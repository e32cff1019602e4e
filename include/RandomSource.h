#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace ssd {

// Uniform [0,1) source used by both leap-trigger policies.
// Injected into CoreEngine by reference; the caller owns it and must keep it
// alive for the engine's lifetime. Never shared across concurrent sessions.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Returns a value in [0,1).
    virtual double uniform01() = 0;
};

// std::mt19937 backed source (seedable, reproducible within one standard library).
class Mt19937Source : public RandomSource {
public:
    explicit Mt19937Source(std::uint32_t seed = 1337u);

    double uniform01() override;
    void reseed(std::uint32_t seed);

private:
    std::mt19937 rng_;
    std::uniform_real_distribution<double> dist_{0.0, 1.0};
};

// Portable xorshift32: bit-identical sequence on every platform.
class Xorshift32Source : public RandomSource {
public:
    // Zero is not a valid xorshift state; it is replaced by a fixed nonzero seed.
    explicit Xorshift32Source(std::uint32_t seed = 2463534242u);

    double uniform01() override;
    std::uint32_t state() const noexcept { return s_; }

private:
    std::uint32_t s_;
};

// Replays a fixed list of draws, cycling when exhausted. Intended for tests
// and scripted replays.
class SequenceSource : public RandomSource {
public:
    explicit SequenceSource(std::vector<double> values);

    double uniform01() override;
    std::size_t drawCount() const noexcept { return draws_; }

private:
    std::vector<double> values_;
    std::size_t next_ = 0;
    std::size_t draws_ = 0;
};

} // namespace ssd
