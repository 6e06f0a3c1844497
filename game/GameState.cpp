#include "GameState.h"

#include <string>

#include "../engine/core/Logger.h"

namespace Shooter {

std::string_view gameStateName(GameState state) {
    switch (state) {
        case GameState::Menu:
            return "menu";
        case GameState::Playing:
            return "playing";
        case GameState::Paused:
            return "paused";
        case GameState::GameOver:
        default:
            return "game_over";
    }
}

bool GameStateController::request(GameState next) {
    if (next == state_) {
        return false;
    }
    Starfall::logInfo("Game state " + std::string(gameStateName(state_)) + " -> " +
                      std::string(gameStateName(next)));
    state_ = next;
    ++transitions_;
    return true;
}

}  // namespace Shooter
