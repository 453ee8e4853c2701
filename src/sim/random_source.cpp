#include "contagion/sim/random_source.hpp"

#include <algorithm>
#include <cmath>

namespace contagion::sim
{
RandomSource::RandomSource(uint32_t seed)
    : rand_(seed != 0 ? seed : std::random_device{}())
{
}

float RandomSource::uniformFloat(float min, float max) const
{
    if (!(min < max)) {
        return min;
    }
    std::uniform_real_distribution<float> dist{min, max};
    return dist(rand_);
}

int32_t RandomSource::uniformInt(int32_t min, int32_t max) const
{
    if (max <= min) {
        return min;
    }
    std::uniform_int_distribution<int32_t> dist{min, max};
    return dist(rand_);
}

int32_t adaptedRandomNumber(const IRandomSource& random, float ratio, int32_t total)
{
    if (ratio <= 0.0f || total <= 0) {
        return 0;
    }
    const auto part = static_cast<int32_t>(std::floor(random.uniformFloat(0.0f, ratio) * static_cast<float>(total)));
    return std::clamp(part, 0, total);
}
} // namespace contagion::sim
