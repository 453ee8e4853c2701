#include "contagion/sim/block_type.hpp"

#include <stdexcept>
#include <string>

namespace contagion::sim
{
namespace
{
constexpr std::array<std::string_view, BLOCK_TYPE_COUNT> BLOCK_TYPE_NAMES = {"factory", "housing", "hospital", "quarantine"};

void validate(const BlockTypeProfile& profile)
{
    const std::string name{toString(profile.type)};
    if (profile.resource_min < 0) {
        throw std::invalid_argument("Profile " + name + ": resource_min must not be negative");
    }
    if (!(profile.tax_rate >= 0.0f && profile.tax_rate <= 1.0f)) {
        throw std::invalid_argument("Profile " + name + ": tax_rate must lie in [0, 1]");
    }
    if (!(profile.infected_priority >= 0.0f)) {
        throw std::invalid_argument("Profile " + name + ": infected_priority must not be negative");
    }
    if (profile.population_volume < 0) {
        throw std::invalid_argument("Profile " + name + ": population_volume must not be negative");
    }
}
} // namespace

std::string_view toString(BlockType type) noexcept
{
    const auto index = static_cast<std::size_t>(type);
    return index < BLOCK_TYPE_COUNT ? BLOCK_TYPE_NAMES[index] : "unknown";
}

std::optional<BlockType> parseBlockType(std::string_view name) noexcept
{
    for (std::size_t i = 0; i < BLOCK_TYPE_COUNT; ++i) {
        if (BLOCK_TYPE_NAMES[i] == name) {
            return static_cast<BlockType>(i);
        }
    }
    return std::nullopt;
}

BlockTypeProfile ProfileTable::defaultProfile(BlockType type) noexcept
{
    BlockTypeProfile profile{
        .type                  = type,
        .reproduction          = 2.0f,
        .death_rate            = 1.0f,
        .material_rate         = -0.01f,
        .working_material_rate = 1.0f,
        .resource_min          = 0,
        .tax_rate              = 0.05f,
        .population_volume     = 1000,
        .infected_priority     = 0.0f,
        .infected_offset       = 0.0f};

    applyTypeOverrides(profile);
    return profile;
}

void ProfileTable::applyTypeOverrides(BlockTypeProfile& profile) noexcept
{
    if (profile.type == BlockType::HOSPITAL) {
        profile.reproduction      = 0.5f;
        profile.death_rate        = 0.0f;
        profile.material_rate     = -0.1f;
        profile.infected_priority = 20.0f;
        profile.infected_offset   = 2.0f;
    }
}

ProfileTable::ProfileTable()
    : profiles_{
          defaultProfile(BlockType::FACTORY),
          defaultProfile(BlockType::HOUSING),
          defaultProfile(BlockType::HOSPITAL),
          defaultProfile(BlockType::QUARANTINE)}
{
}

ProfileTable::ProfileTable(const std::array<BlockTypeProfile, BLOCK_TYPE_COUNT>& profiles)
    : profiles_{profiles}
{
    for (std::size_t i = 0; i < BLOCK_TYPE_COUNT; ++i) {
        if (static_cast<std::size_t>(profiles_[i].type) != i) {
            throw std::invalid_argument("Profile slot " + std::to_string(i) + " holds a profile of type " + std::string(toString(profiles_[i].type)));
        }
        validate(profiles_[i]);
    }
}
} // namespace contagion::sim
