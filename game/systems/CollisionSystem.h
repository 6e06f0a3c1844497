// Circle-hitbox collisions between bullets and actors of the opposing side.
#pragma once

#include <functional>
#include <utility>

#include "../../engine/core/Time.h"
#include "../../engine/ecs/Registry.h"
#include "../GameState.h"

namespace Shooter {

struct PlayerHitReport {
    int bulletsConsumed{0};
    int hitsApplied{0};
    bool gameOverRequested{false};
};

struct EnemyHitReport {
    int bulletsConsumed{0};
    int hitsApplied{0};
};

class CollisionSystem {
public:
    // Fire-and-forget cue played when a bullet actually damages the player.
    void setHitCue(std::function<void()> cue) { hitCue_ = std::move(cue); }

    // Enemy bullets vs the single player. Ticks the player's invulnerability
    // first; at most one hit lands per call. Throws Starfall::InvariantViolation
    // unless exactly one player actor exists.
    PlayerHitReport collideEnemyBullets(Starfall::ECS::Registry& registry, const Starfall::TimeStep& step,
                                        GameStateController& state);

    // Player bullets vs every enemy. Every overlapping pair deals damage; bullets
    // are removed once all enemies were tested.
    EnemyHitReport collidePlayerBullets(Starfall::ECS::Registry& registry);

private:
    std::function<void()> hitCue_{};
};

}  // namespace Shooter
