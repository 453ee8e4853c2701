#pragma once
#include <cstdint>

namespace contagion::sim
{
class IRandomSource
{
public:
    virtual ~IRandomSource() = default;

    // uniform in [min, max)
    [[nodiscard]] virtual float uniformFloat(float min, float max) const = 0;
    // uniform in [min, max]
    [[nodiscard]] virtual int32_t uniformInt(int32_t min, int32_t max) const = 0;
};
} // namespace contagion::sim
