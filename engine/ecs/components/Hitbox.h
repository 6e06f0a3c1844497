// Circular collision boundary centered on the entity position.
#pragma once

namespace Starfall::ECS {

struct Hitbox {
    float radius{0.0f};  // >= 0
};

}  // namespace Starfall::ECS
