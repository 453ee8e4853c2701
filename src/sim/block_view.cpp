#include "contagion/sim/block_view.hpp"

#include <algorithm>
#include <iomanip>

namespace contagion::sim
{
namespace
{
float barFraction(int32_t value, int32_t volume) noexcept
{
    if (volume <= 0) {
        return 0.0f;
    }
    return std::min(static_cast<float>(value), static_cast<float>(volume)) / static_cast<float>(volume);
}
} // namespace

BlockView makeView(BlockId id, const Block& block, bool god_view) noexcept
{
    const int32_t healthy  = god_view ? block.healthy() : block.healthy() + block.nextInfected();
    const int32_t infected = god_view ? block.currentInfected() + block.nextInfected() : block.currentInfected();
    const int32_t volume   = block.profile().population_volume;

    return BlockView{
        .id           = id,
        .type         = block.type(),
        .healthy      = healthy,
        .infected     = infected,
        .material     = block.material(),
        .healthy_bar  = barFraction(healthy, volume),
        .infected_bar = barFraction(infected, volume),
        .working      = block.isWorking(),
        .quarantined  = block.isQuarantined()};
}

bool operator==(const BlockView& lhs, const BlockView& rhs) noexcept
{
    return lhs.id == rhs.id && lhs.type == rhs.type && lhs.healthy == rhs.healthy && lhs.infected == rhs.infected && lhs.material == rhs.material &&
           lhs.working == rhs.working && lhs.quarantined == rhs.quarantined;
}

std::ostream& operator<<(std::ostream& os, const BlockView& view)
{
    os << std::setw(3) << view.id << "  " << std::left << std::setw(10) << toString(view.type) << std::right;
    os << "  healthy " << std::setw(6) << view.healthy;
    os << "  infected " << std::setw(6) << view.infected;
    os << "  material " << std::setw(7) << view.material;
    if (view.type == BlockType::FACTORY) {
        os << (view.working ? "  [working]" : "  [closed]");
    }
    if (view.quarantined) {
        os << "  [quarantined]";
    }
    return os;
}
} // namespace contagion::sim
