#pragma once
#include <cstdint>
#include <ostream>

#include "block.hpp"
#include "block_type.hpp"
#include "broadcast_value.hpp"

namespace contagion::sim
{
// Read-only picture of a block for a presentation layer.
struct BlockView {
    BlockId id;
    BlockType type;
    int32_t healthy;  // as displayed
    int32_t infected; // as displayed
    int32_t material;
    float healthy_bar;  // share of the population volume, at most 1
    float infected_bar; // share of the population volume, at most 1
    bool working;
    bool quarantined;
};

// The observed view counts incubating people as healthy and only shows the symptomatic cohort as
// infected. The god view shows both cohorts as infected.
[[nodiscard]] BlockView makeView(BlockId id, const Block& block, bool god_view) noexcept;

bool operator==(const BlockView& lhs, const BlockView& rhs) noexcept;
std::ostream& operator<<(std::ostream& os, const BlockView& view);
} // namespace contagion::sim
