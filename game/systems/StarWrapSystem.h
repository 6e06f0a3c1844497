// Teleports stars that scrolled below the viewport back to the top edge.
#pragma once

#include "../../engine/ecs/Registry.h"
#include "../../engine/geometry/WindowSize.h"

namespace Shooter {

class StarWrapSystem {
public:
    void update(Starfall::ECS::Registry& registry, const Starfall::WindowSize& window);
};

}  // namespace Shooter
