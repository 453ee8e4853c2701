#pragma once
#include <cstdint>
#include <memory>
#include <string_view>

#include "config.hpp"
#include "sim/block_graph.hpp"
#include "sim/random_source_interface.hpp"

namespace contagion
{
// Actions the player can take on a single block between rounds.
enum class ActionType {
    QUARANTINE,
    STOP_WORKING,
    START_WORKING,
    SPECIAL_AID,
    TAXING,
};

enum class ActionResult {
    OK,
    NOT_APPLICABLE,
    INSUFFICIENT_FUNDS,
    UNKNOWN_BLOCK,
};

[[nodiscard]] std::string_view toString(ActionResult result) noexcept;

// Rules layer above the board: pays for actions from the treasury, collects taxes and drives turns.
class GameSession
{
public:
    GameSession(SimulationConfig config, std::unique_ptr<sim::IRandomSource> random);

    // `period` is only used by QUARANTINE; a non-positive value selects the configured default.
    ActionResult apply(ActionType action, sim::BlockId block, int32_t period = 0);
    void endTurn();

    [[nodiscard]] bool finished() const noexcept
    {
        return graph_.roundsPlayed() >= config_.max_rounds;
    }

    [[nodiscard]] int32_t cost(ActionType action) const noexcept;

    [[nodiscard]] int32_t treasury() const noexcept
    {
        return treasury_;
    }

    [[nodiscard]] int32_t taxCollected() const noexcept
    {
        return tax_collected_;
    }

    [[nodiscard]] const sim::BlockGraph& graph() const noexcept
    {
        return graph_;
    }

    [[nodiscard]] const SimulationConfig& config() const noexcept
    {
        return config_;
    }

private:
    SimulationConfig config_;
    std::unique_ptr<sim::IRandomSource> random_;
    sim::BlockGraph graph_;
    int32_t treasury_;
    int32_t tax_collected_{};
};
} // namespace contagion
