#pragma once

/// @file random_source.hpp
/// @brief Injectable randomness for crit and evasion rolls.

#include <cstdint>
#include <random>

namespace gbe::battle {

/// Source of uniform rolls in [0, 1).
///
/// The engine draws every random number through this interface so a battle
/// can be replayed exactly from the same seed, or driven by scripted rolls.
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    /// Next uniform value in [0, 1).
    virtual double NextUnit() = 0;
};

/// Deterministic generator backed by std::mt19937_64.
///
/// Rolls take the top 53 bits of each engine output, so a seed yields the
/// same sequence with every standard library.
class SeededRandomSource final : public IRandomSource {
public:
    explicit SeededRandomSource(uint64_t seed) : engine_(seed) {}

    double NextUnit() override { return static_cast<double>(engine_() >> 11) * 0x1.0p-53; }

private:
    std::mt19937_64 engine_;
};

} // namespace gbe::battle
