#include <string>

#define SDL_MAIN_HANDLED
#include <SDL.h>

#include "../engine/core/Application.h"
#include "../engine/core/Errors.h"
#include "../engine/core/Logger.h"
#include "../game/GameConfig.h"
#include "../game/ShooterGame.h"

int main(int argc, char** argv) {
    SDL_SetMainReady();
    if (SDL_Init(SDL_INIT_TIMER | SDL_INIT_EVENTS) != 0) {
        Starfall::logError(std::string("SDL_Init failed: ") + SDL_GetError());
        return 1;
    }

    const std::string configPath = argc > 1 ? argv[1] : "config/starfall.json";
    Shooter::GameConfig config{};
    if (auto loaded = Shooter::GameConfigLoader::load(configPath)) {
        config = *loaded;
    } else {
        Starfall::logWarn("Config " + configPath + " not loaded; using defaults.");
    }

    int exitCode = 0;
    {
        Shooter::ShooterGame game(config);
        Starfall::ApplicationConfig appConfig{};
        appConfig.maxFrames = config.maxFrames > 0 ? static_cast<unsigned long>(config.maxFrames) : 0;

        Starfall::Application app(game, appConfig);
        try {
            if (!app.initialize()) {
                exitCode = 1;
            } else {
                app.run();
            }
        } catch (const Starfall::InvariantViolation& e) {
            Starfall::logError(std::string("Fatal world invariant: ") + e.what());
            exitCode = 2;
        }
    }

    SDL_Quit();
    return exitCode;
}
