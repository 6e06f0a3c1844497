// Simple velocity component, world units per second.
#pragma once

#include "../../math/Vec2.h"

namespace Starfall::ECS {

struct Velocity {
    Vec2 value{};
};

}  // namespace Starfall::ECS
