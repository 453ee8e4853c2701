#include "contagion/game_session.hpp"

#include <stdexcept>
#include <utility>

namespace contagion
{
namespace
{
std::unique_ptr<sim::IRandomSource> requireSource(std::unique_ptr<sim::IRandomSource> random)
{
    if (!random) {
        throw std::invalid_argument("Random source cannot be null");
    }
    return random;
}
} // namespace

std::string_view toString(ActionResult result) noexcept
{
    switch (result) {
        case ActionResult::OK:
            return "ok";
        case ActionResult::NOT_APPLICABLE:
            return "not applicable to this block";
        case ActionResult::INSUFFICIENT_FUNDS:
            return "insufficient funds";
        case ActionResult::UNKNOWN_BLOCK:
            return "unknown block";
    }
    return "unknown";
}

GameSession::GameSession(SimulationConfig config, std::unique_ptr<sim::IRandomSource> random)
    : config_{std::move(config)}
    , random_{requireSource(std::move(random))}
    , graph_{buildBoard(config_, *random_)}
    , treasury_{config_.treasury}
{
}

int32_t GameSession::cost(ActionType action) const noexcept
{
    switch (action) {
        case ActionType::QUARANTINE:
            return config_.costs.quarantine;
        case ActionType::STOP_WORKING:
            return config_.costs.stop_working;
        case ActionType::START_WORKING:
            return config_.costs.start_working;
        case ActionType::SPECIAL_AID:
            return config_.costs.special_aid;
        case ActionType::TAXING:
            return config_.costs.taxing;
    }
    return 0;
}

ActionResult GameSession::apply(ActionType action, sim::BlockId id, int32_t period)
{
    if (id >= graph_.size()) {
        return ActionResult::UNKNOWN_BLOCK;
    }

    const int32_t price = cost(action);
    if (price > treasury_) {
        return ActionResult::INSUFFICIENT_FUNDS;
    }

    sim::Block& block = graph_.block(id);
    switch (action) {
        case ActionType::QUARANTINE:
            block.quarantined(period > 0 ? period : config_.quarantine_period);
            break;
        case ActionType::STOP_WORKING:
            block.stopWorking();
            break;
        case ActionType::START_WORKING:
            if (!block.startWorking()) {
                return ActionResult::NOT_APPLICABLE;
            }
            break;
        case ActionType::SPECIAL_AID:
            block.aided();
            break;
        case ActionType::TAXING: {
            const int32_t tax = block.taxed();
            treasury_ += tax;
            tax_collected_ += tax;
            break;
        }
    }

    treasury_ -= price;
    return ActionResult::OK;
}

void GameSession::endTurn()
{
    graph_.runRound(*random_);
}
} // namespace contagion
