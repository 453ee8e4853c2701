#pragma once
#include <cstdint>

#include "contagion/sim/random_source_interface.hpp"

namespace test
{
// Deterministic source for tests: always draws the lower or the upper bound.
class FixedRandomSource : public contagion::sim::IRandomSource
{
public:
    explicit FixedRandomSource(bool upper = false)
        : upper_{upper}
    {
    }

    [[nodiscard]] float uniformFloat(float min, float max) const override
    {
        return upper_ ? max : min;
    }

    [[nodiscard]] int32_t uniformInt(int32_t min, int32_t max) const override
    {
        return upper_ ? max : min;
    }

private:
    bool upper_;
};
} // namespace test
