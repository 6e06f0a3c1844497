// Keeps the player sprite fully inside the viewport.
#pragma once

#include "../../engine/ecs/Registry.h"
#include "../../engine/geometry/WindowSize.h"

namespace Shooter {

class ConfinementSystem {
public:
    // Must run after movement so the clamp is the frame's final position.
    void update(Starfall::ECS::Registry& registry, const Starfall::WindowSize& window);
};

}  // namespace Shooter
