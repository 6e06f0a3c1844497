// Applies velocity to transform each frame.
#pragma once

#include "../../engine/core/Time.h"
#include "../../engine/ecs/Registry.h"

namespace Shooter {

class MovementSystem {
public:
    void update(Starfall::ECS::Registry& registry, const Starfall::TimeStep& step);
};

}  // namespace Shooter
