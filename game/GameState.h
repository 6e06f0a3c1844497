// Top-level game state with idempotent transition requests.
#pragma once

#include <string_view>

namespace Shooter {

enum class GameState { Menu, Playing, Paused, GameOver };

std::string_view gameStateName(GameState state);

class GameStateController {
public:
    explicit GameStateController(GameState initial = GameState::Playing) : state_(initial) {}

    GameState state() const { return state_; }
    bool is(GameState state) const { return state_ == state; }

    // Returns false when the requested state is already active.
    bool request(GameState next);
    bool requestGameOver() { return request(GameState::GameOver); }

    int transitions() const { return transitions_; }

private:
    GameState state_;
    int transitions_{0};
};

}  // namespace Shooter
