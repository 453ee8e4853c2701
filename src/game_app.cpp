#include "contagion/game_app.hpp"

#include <charconv>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "contagion/sim/block_view.hpp"

using std::literals::string_view_literals::operator""sv;

namespace
{
// clang-format off
static constexpr std::string_view help_text =
"Commands:\n"
"  tax <block>                 collect tax from a block\n"
"  quarantine <block> [rounds] isolate a block\n"
"  aid <block>                 evacuate the population of a block\n"
"  stop <block>                stop a factory\n"
"  start <block>               restart a factory\n"
"  next                        end the turn (empty line does the same)\n"
"  q                           quit"sv;

static constexpr std::string_view prompt         = "> "sv;
static constexpr std::string_view replica_what   = "Unknown command, type 'help' for the list."sv;
static constexpr std::string_view replica_block  = "Expected a block number."sv;
static constexpr std::string_view replica_period = "Expected a quarantine period in rounds."sv;
// clang-format on

void clearConsole(std::ostream& out)
{
    static constexpr const char* CSI = "\033[";
    out << CSI << 'H' << CSI << "2J";
}

std::optional<int32_t> parseNumber(std::string_view token) noexcept
{
    int32_t value{};
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
    if (ec != std::errc() || ptr != token.data() + token.size() || value < 0) {
        return std::nullopt;
    }
    return value;
}

std::vector<std::string> splitWords(const std::string& line)
{
    std::vector<std::string> words;
    std::istringstream stream{line};
    for (std::string word; stream >> word;) {
        words.push_back(std::move(word));
    }
    return words;
}

std::optional<contagion::ActionType> parseAction(std::string_view word) noexcept
{
    using contagion::ActionType;

    if (word == "tax") {
        return ActionType::TAXING;
    }
    if (word == "quarantine") {
        return ActionType::QUARANTINE;
    }
    if (word == "aid") {
        return ActionType::SPECIAL_AID;
    }
    if (word == "stop") {
        return ActionType::STOP_WORKING;
    }
    if (word == "start") {
        return ActionType::START_WORKING;
    }
    return std::nullopt;
}

} // namespace

namespace contagion
{
GameApplication::GameApplication(std::unique_ptr<GameSession> session, std::istream& in, std::ostream& out, std::ostream& err)
    : session_{std::move(session)}
    , in_{in}
    , out_{out}
    , err_{err}
{
    if (!session_) {
        throw std::invalid_argument("Game session cannot be null");
    }
}

void GameApplication::run()
{
    game_status_ = Status::INGAME;

    // Main game Loop
    while (true) {
        switch (game_status_) {
            case Status::INGAME:
                render();
                update();
                break;
            case Status::FINAL:
                final();
                [[fallthrough]];
            case Status::EXIT:
                return;
            default:
                return;
        }
    }
}

void GameApplication::update()
{
    while (true) {
        out_ << prompt;
        out_.flush();

        std::string input;
        if (!std::getline(in_, input)) {
            game_status_ = Status::EXIT;
            return;
        }

        const std::vector<std::string> words = splitWords(input);
        if (words.empty() || words[0] == "next" || words[0] == "n") {
            break;
        }

        if (words[0] == "q" || words[0] == "Q") {
            game_status_ = Status::EXIT;
            return;
        }

        if (words[0] == "help") {
            out_ << help_text << std::endl;
            continue;
        }

        const auto action = parseAction(words[0]);
        if (!action) {
            err_ << replica_what << std::endl;
            continue;
        }

        const auto block = words.size() > 1 ? parseNumber(words[1]) : std::nullopt;
        if (!block) {
            err_ << replica_block << std::endl;
            continue;
        }

        int32_t period = 0;
        if (*action == ActionType::QUARANTINE && words.size() > 2) {
            const auto rounds = parseNumber(words[2]);
            if (!rounds) {
                err_ << replica_period << std::endl;
                continue;
            }
            period = *rounds;
        }

        const int32_t treasury_before = session_->treasury();
        const ActionResult result     = session_->apply(*action, static_cast<sim::BlockId>(*block), period);
        if (result != ActionResult::OK) {
            err_ << "Action refused: " << toString(result) << std::endl;
            continue;
        }

        out_ << "Done. Treasury " << treasury_before << " -> " << session_->treasury() << std::endl;
    }

    session_->endTurn();

    if (session_->finished()) {
        game_status_ = Status::FINAL;
    }
}

void GameApplication::render()
{
    clearConsole(out_);

    const sim::BlockGraph& graph = session_->graph();
    const bool god_view          = session_->config().god_view;

    out_ << "Round " << graph.roundsPlayed() + 1 << " of " << session_->config().max_rounds << "    treasury " << session_->treasury() << "\n\n";

    for (sim::BlockId id = 0; id < graph.size(); ++id) {
        out_ << sim::makeView(id, graph.block(id), god_view) << "\n";
    }

    const sim::GraphTotals totals = graph.totals();
    out_ << "\nTotal population " << totals.population() << ", material " << totals.material << "\n";
    out_ << help_text << std::endl;
}

void GameApplication::final()
{
    clearConsole(out_);

    const sim::GraphTotals totals = session_->graph().totals();
    const int64_t infected        = totals.current_infected + totals.next_infected;
    const double infected_share   = totals.population() > 0 ? static_cast<double>(infected) / static_cast<double>(totals.population()) : 0.0;

    out_ << "The epidemic ran for " << session_->graph().roundsPlayed() << " rounds.\n";
    out_ << "Population left: " << totals.population() << " (" << std::fixed << std::setprecision(1) << infected_share * 100.0 << "% infected)\n";
    out_ << "Material on the board: " << totals.material << "\n";
    out_ << "Taxes collected: " << session_->taxCollected() << ", treasury: " << session_->treasury() << std::endl;
}

} // namespace contagion
