#include "contagion/config.hpp"

#include <array>
#include <iostream>
#include <stdexcept>
#include <utility>

#include <yaml-cpp/yaml.h>

namespace contagion
{
namespace
{
sim::BlockTypeProfile readProfile(const YAML::Node& node, sim::BlockTypeProfile profile)
{
    if (!node) {
        return profile;
    }

    profile.reproduction          = node["reproduction"].as<float>(profile.reproduction);
    profile.death_rate            = node["death_rate"].as<float>(profile.death_rate);
    profile.material_rate         = node["material_rate"].as<float>(profile.material_rate);
    profile.working_material_rate = node["working_material_rate"].as<float>(profile.working_material_rate);
    profile.resource_min          = node["resource_min"].as<int32_t>(profile.resource_min);
    profile.tax_rate              = node["tax_rate"].as<float>(profile.tax_rate);
    profile.population_volume     = node["population_volume"].as<int32_t>(profile.population_volume);
    profile.infected_priority     = node["infected_priority"].as<float>(profile.infected_priority);
    profile.infected_offset       = node["infected_offset"].as<float>(profile.infected_offset);

    return profile;
}

std::vector<sim::InfectedStage> readStages(const YAML::Node& node, std::vector<sim::InfectedStage> stages)
{
    if (!node) {
        return stages;
    }
    if (!node.IsSequence()) {
        throw std::runtime_error("Stage list must be a sequence");
    }

    stages.clear();
    for (const auto& stage : node) {
        stages.push_back({.reproduction = stage["reproduction"].as<float>(0.0f), .death_rate = stage["death_rate"].as<float>(0.0f)});
    }
    return stages;
}

std::shared_ptr<const sim::ProfileTable> readProfiles(const YAML::Node& node)
{
    std::array<sim::BlockTypeProfile, sim::BLOCK_TYPE_COUNT> profiles{};

    for (std::size_t i = 0; i < sim::BLOCK_TYPE_COUNT; ++i) {
        const auto type = static_cast<sim::BlockType>(i);

        // shared defaults, then the `default` section, then built-in type overrides, then the type's own section
        sim::BlockTypeProfile profile = sim::ProfileTable::defaultProfile(sim::BlockType::FACTORY);
        profile.type                  = type;
        if (node) {
            profile = readProfile(node["default"], profile);
        }
        sim::ProfileTable::applyTypeOverrides(profile);
        if (node) {
            profile = readProfile(node[std::string(sim::toString(type))], profile);
        }
        profiles[i] = profile;
    }

    return std::make_shared<const sim::ProfileTable>(profiles);
}

void readBoard(const YAML::Node& node, SimulationConfig& config)
{
    if (!node) {
        return;
    }

    if (const auto& blocks = node["blocks"]; blocks) {
        // a new block list invalidates the default wiring
        config.blocks.clear();
        config.edges.clear();
        for (const auto& block : blocks) {
            const auto type_name = block["type"].as<std::string>();
            const auto type      = sim::parseBlockType(type_name);
            if (!type) {
                throw std::runtime_error("Unknown block type: " + type_name);
            }

            BlockSetup setup{.type = *type, .healthy = std::nullopt, .infected = block["infected"].as<int32_t>(0), .material = block["material"].as<int32_t>(0)};
            if (block["healthy"]) {
                setup.healthy = block["healthy"].as<int32_t>();
            }
            config.blocks.push_back(setup);
        }
    }

    if (const auto& edges = node["edges"]; edges) {
        config.edges.clear();
        for (const auto& edge : edges) {
            if (!edge.IsSequence() || edge.size() != 2) {
                throw std::runtime_error("Edge must be a [source, target] pair");
            }
            config.edges.push_back({.source = edge[0].as<sim::BlockId>(), .target = edge[1].as<sim::BlockId>()});
        }
    }

    for (const EdgeSetup& edge : config.edges) {
        if (edge.source >= config.blocks.size() || edge.target >= config.blocks.size()) {
            throw std::out_of_range("Edge " + std::to_string(edge.source) + " -> " + std::to_string(edge.target) + " refers to a missing block");
        }
    }
}

SimulationConfig readConfig(const YAML::Node& root)
{
    SimulationConfig config = defaultConfig();

    if (const auto& simulation = root["simulation"]; simulation) {
        config.seed                 = simulation["seed"].as<uint32_t>(config.seed);
        config.max_rounds           = simulation["max_rounds"].as<int32_t>(config.max_rounds);
        config.god_view             = simulation["god_view"].as<bool>(config.god_view);
        config.disease.timer_period = simulation["timer_period"].as<int32_t>(config.disease.timer_period);

        if (const auto& stages = simulation["stages"]; stages) {
            config.disease.current_stages = readStages(stages["current"], std::move(config.disease.current_stages));
            config.disease.next_stages    = readStages(stages["next"], std::move(config.disease.next_stages));
        }

        if (const auto& healthy = simulation["initial_healthy"]; healthy) {
            config.initial_healthy_min = healthy["min"].as<int32_t>(config.initial_healthy_min);
            config.initial_healthy_max = healthy["max"].as<int32_t>(config.initial_healthy_max);
        }
    }

    config.profiles = readProfiles(root["profiles"]);

    if (const auto& actions = root["actions"]; actions) {
        config.treasury          = actions["treasury"].as<int32_t>(config.treasury);
        config.quarantine_period = actions["quarantine_period"].as<int32_t>(config.quarantine_period);

        if (const auto& costs = actions["costs"]; costs) {
            config.costs.quarantine    = costs["quarantine"].as<int32_t>(config.costs.quarantine);
            config.costs.stop_working  = costs["stop_working"].as<int32_t>(config.costs.stop_working);
            config.costs.start_working = costs["start_working"].as<int32_t>(config.costs.start_working);
            config.costs.special_aid   = costs["special_aid"].as<int32_t>(config.costs.special_aid);
            config.costs.taxing        = costs["taxing"].as<int32_t>(config.costs.taxing);
        }
    }

    readBoard(root["board"], config);

    if (config.initial_healthy_max < config.initial_healthy_min) {
        std::swap(config.initial_healthy_min, config.initial_healthy_max);
    }

    return config;
}
} // namespace

SimulationConfig defaultConfig()
{
    using sim::BlockType;

    return SimulationConfig{
        .seed                = 0,
        .max_rounds          = 30,
        .god_view            = false,
        .initial_healthy_min = 400,
        .initial_healthy_max = 599,
        .disease             = sim::defaultDiseaseModel(),
        .profiles            = std::make_shared<const sim::ProfileTable>(),
        .treasury            = 100,
        .quarantine_period   = sim::Block::DEFAULT_QUARANTINE_PERIOD,
        .costs               = {.quarantine = 30, .stop_working = 10, .start_working = 10, .special_aid = 50, .taxing = 0},
        .blocks =
            {
                {.type = BlockType::FACTORY, .healthy = std::nullopt, .infected = 0, .material = 100},
                {.type = BlockType::HOUSING, .healthy = std::nullopt, .infected = 5, .material = 50},
                {.type = BlockType::HOUSING, .healthy = std::nullopt, .infected = 0, .material = 50},
                {.type = BlockType::FACTORY, .healthy = std::nullopt, .infected = 0, .material = 100},
                {.type = BlockType::HOSPITAL, .healthy = std::nullopt, .infected = 0, .material = 200},
                {.type = BlockType::QUARANTINE, .healthy = 0, .infected = 0, .material = 0},
            },
        .edges = {
            {0, 1}, {1, 0}, {1, 2}, {2, 1}, {2, 3}, {3, 2}, {1, 4}, {4, 1}, {2, 4}, {4, 2}, {4, 5}, {5, 4},
        }};
}

SimulationConfig parseConfig(std::string_view yaml)
{
    return readConfig(YAML::Load(std::string(yaml)));
}

SimulationConfig loadConfig(const std::string& config_file)
{
    try {
        return readConfig(YAML::LoadFile(config_file));
    } catch (const std::exception& ex) {
        std::cerr << "Cannot use config " << config_file << " (" << ex.what() << "), falling back to defaults" << std::endl;
    }
    return defaultConfig();
}

sim::BlockGraph buildBoard(const SimulationConfig& config, const sim::IRandomSource& random)
{
    sim::BlockGraph graph{config.profiles, config.disease};

    for (const BlockSetup& setup : config.blocks) {
        const int32_t healthy = setup.healthy ? *setup.healthy : random.uniformInt(config.initial_healthy_min, config.initial_healthy_max);
        graph.addBlock(setup.type, healthy, setup.infected, setup.material);
    }

    for (const EdgeSetup& edge : config.edges) {
        graph.connect(edge.source, edge.target);
    }

    return graph;
}
} // namespace contagion
