// Position and scale component (engine-agnostic).
#pragma once

#include "../../math/Vec2.h"

namespace Starfall::ECS {

struct Transform {
    Vec2 position{};
    Vec2 scale{1.0f, 1.0f};
};

}  // namespace Starfall::ECS
