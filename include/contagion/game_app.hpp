#pragma once

#include <iostream>
#include <memory>

#include "game_session.hpp"

namespace contagion
{

class GameApplication
{
public:
    GameApplication(std::unique_ptr<GameSession> session, std::istream& in = std::cin, std::ostream& out = std::cout, std::ostream& err = std::cerr);

    void run();

    [[nodiscard]] const GameSession& session() const noexcept
    {
        return *session_;
    }

private:
    enum class Status {
        INGAME,
        EXIT,
        FINAL,
    };

    void render();
    void update();
    void final();

    Status game_status_{Status::INGAME};
    std::unique_ptr<GameSession> session_;
    std::istream& in_;
    std::ostream& out_;
    std::ostream& err_;
};
} // namespace contagion
