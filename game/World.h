// Owns the entity store and runs the per-frame system order.
#pragma once

#include <cstddef>
#include <functional>
#include <utility>

#include "../engine/core/Time.h"
#include "../engine/ecs/Registry.h"
#include "../engine/geometry/WindowSize.h"
#include "GameConfig.h"
#include "GameState.h"
#include "systems/CollisionSystem.h"
#include "systems/ConfinementSystem.h"
#include "systems/DeathSystem.h"
#include "systems/DespawnSystem.h"
#include "systems/MovementSystem.h"
#include "systems/StarWrapSystem.h"

namespace Shooter {

struct FrameReport {
    PlayerHitReport player{};
    EnemyHitReport enemies{};
    std::size_t killed{0};
    std::size_t reaped{0};
};

class World {
public:
    explicit World(const GameConfig& config, GameState initial = GameState::Playing);

    Starfall::ECS::Registry& registry() { return registry_; }
    const Starfall::ECS::Registry& registry() const { return registry_; }
    const Starfall::WindowSize& window() const { return window_; }
    GameStateController& state() { return state_; }
    const GameStateController& state() const { return state_; }

    void setHitCue(std::function<void()> cue) { collision_.setHitCue(std::move(cue)); }

    // Movement, confinement, enemy-bullet pass, player-bullet pass and death
    // only run while Playing; reaping and star wrap run in every state.
    FrameReport update(const Starfall::TimeStep& step);

private:
    Starfall::ECS::Registry registry_{};
    Starfall::WindowSize window_{};
    GameStateController state_;

    MovementSystem movement_{};
    ConfinementSystem confinement_{};
    CollisionSystem collision_{};
    DeathSystem death_{};
    DespawnSystem despawn_{};
    StarWrapSystem starWrap_{};
};

}  // namespace Shooter
