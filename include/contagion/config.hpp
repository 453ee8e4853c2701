#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sim/block_graph.hpp"
#include "sim/block_type.hpp"
#include "sim/broadcast_value.hpp"
#include "sim/random_source_interface.hpp"
#include "sim/stage_timer.hpp"

namespace contagion
{
struct ActionCosts {
    int32_t quarantine;
    int32_t stop_working;
    int32_t start_working;
    int32_t special_aid;
    int32_t taxing;
};

struct BlockSetup {
    sim::BlockType type;
    std::optional<int32_t> healthy; // sampled from the initial healthy range when empty
    int32_t infected;
    int32_t material;
};

struct EdgeSetup {
    sim::BlockId source;
    sim::BlockId target;
};

struct SimulationConfig {
    uint32_t seed;
    int32_t max_rounds;
    bool god_view;
    int32_t initial_healthy_min;
    int32_t initial_healthy_max;
    sim::DiseaseModel disease;
    std::shared_ptr<const sim::ProfileTable> profiles;

    int32_t treasury;
    int32_t quarantine_period;
    ActionCosts costs;

    std::vector<BlockSetup> blocks;
    std::vector<EdgeSetup> edges;
};

[[nodiscard]] SimulationConfig defaultConfig();

// Missing keys keep their defaults. Throws on malformed YAML, unknown block types and bad edges.
[[nodiscard]] SimulationConfig parseConfig(std::string_view yaml);

// Reads the file; any failure is reported on stderr and yields defaultConfig().
[[nodiscard]] SimulationConfig loadConfig(const std::string& config_file);

// Creates the blocks and edges described by the board section.
[[nodiscard]] sim::BlockGraph buildBoard(const SimulationConfig& config, const sim::IRandomSource& random);
} // namespace contagion
