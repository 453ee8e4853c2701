#pragma once
#include "random_source_interface.hpp"

#include <cstdint>
#include <random>

namespace contagion::sim
{
class RandomSource : public IRandomSource
{
public:
    // seed 0 draws the seed from std::random_device
    explicit RandomSource(uint32_t seed = 0);

    [[nodiscard]] float uniformFloat(float min, float max) const override;
    [[nodiscard]] int32_t uniformInt(int32_t min, int32_t max) const override;

private:
    mutable std::mt19937 rand_;
};

// Random part of `total`: floor(uniform(0, ratio) * total), never more than `total`.
[[nodiscard]] int32_t adaptedRandomNumber(const IRandomSource& random, float ratio, int32_t total);
} // namespace contagion::sim
