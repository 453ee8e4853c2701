#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace contagion::sim
{
enum class BlockType : uint8_t {
    FACTORY = 0,
    HOUSING,
    HOSPITAL,
    QUARANTINE,
};

inline constexpr std::size_t BLOCK_TYPE_COUNT = 4;

[[nodiscard]] std::string_view toString(BlockType type) noexcept;
[[nodiscard]] std::optional<BlockType> parseBlockType(std::string_view name) noexcept;

// Constants tied to a block type. Rates are per round.
struct BlockTypeProfile {
    BlockType type;
    float reproduction;          // R0
    float death_rate;            // DR
    float material_rate;         // idle material change per head
    float working_material_rate; // material change per head while a factory works
    int32_t resource_min;
    float tax_rate;
    int32_t population_volume;     // display capacity
    float infected_priority;       // weight of this block's symptomatic cohort as a broadcast target
    float infected_offset;         // minimal target priority when broadcasting symptomatic infected
};

// Interned profiles, one per block type. Built once and shared read-only by every block.
class ProfileTable
{
public:
    ProfileTable();
    // Throws std::invalid_argument on a misplaced profile or a value that could drive a counter negative
    explicit ProfileTable(const std::array<BlockTypeProfile, BLOCK_TYPE_COUNT>& profiles);

    [[nodiscard]] const BlockTypeProfile& profile(BlockType type) const noexcept
    {
        return profiles_[static_cast<std::size_t>(type)];
    }

    [[nodiscard]] static BlockTypeProfile defaultProfile(BlockType type) noexcept;
    // Built-in per-type deviations from the shared defaults (hospital only)
    static void applyTypeOverrides(BlockTypeProfile& profile) noexcept;

private:
    std::array<BlockTypeProfile, BLOCK_TYPE_COUNT> profiles_;
};
} // namespace contagion::sim
