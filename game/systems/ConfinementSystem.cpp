#include "ConfinementSystem.h"

#include <algorithm>

#include "ActorQueries.h"
#include "../../engine/ecs/components/Sprite.h"
#include "../../engine/ecs/components/Transform.h"
#include "../../engine/geometry/Bounds.h"

namespace Shooter {

void ConfinementSystem::update(Starfall::ECS::Registry& registry, const Starfall::WindowSize& window) {
    using Starfall::Geometry::innerBound;
    registry.view<Starfall::ECS::SpriteSize, Starfall::ECS::Transform>(
        [&](Starfall::ECS::Entity e, Starfall::ECS::SpriteSize& sprite, Starfall::ECS::Transform& tf) {
            if (!isActor(registry, e, Side::Player)) return;
            const float width = innerBound(window.width, sprite.width);
            const float height = innerBound(window.height, sprite.height);
            tf.position.x = std::max(std::min(tf.position.x, width), -width);
            tf.position.y = std::max(std::min(tf.position.y, height), -height);
        });
}

}  // namespace Shooter
