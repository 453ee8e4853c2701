#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

#include "contagion/config.hpp"
#include "contagion/game_app.hpp"
#include "contagion/game_session.hpp"
#include "contagion/sim/random_source.hpp"
#include "path.h"

int main(int argc, char* argv[])
{
    const std::string config_file = argc > 1 ? argv[1] : CONTAGION_ROOT_DIR "configs/configs.yaml";

    try {
        contagion::SimulationConfig config = contagion::loadConfig(config_file);
        auto random                        = std::make_unique<contagion::sim::RandomSource>(config.seed);
        auto session                       = std::make_unique<contagion::GameSession>(std::move(config), std::move(random));
        auto gameApp                       = std::make_unique<contagion::GameApplication>(std::move(session));

        gameApp->run();
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
