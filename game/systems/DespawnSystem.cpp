#include "DespawnSystem.h"

#include <vector>

#include "../../engine/ecs/components/Sprite.h"
#include "../../engine/ecs/components/Transform.h"
#include "../../engine/geometry/Bounds.h"
#include "../components/Markers.h"

namespace Shooter {

namespace {
bool outside(const Starfall::Vec2& pos, float halfWidth, float halfHeight) {
    return pos.x > halfWidth || pos.x < -halfWidth || pos.y > halfHeight || pos.y < -halfHeight;
}
}  // namespace

std::size_t DespawnSystem::update(Starfall::ECS::Registry& registry, const Starfall::WindowSize& window) {
    using Starfall::Geometry::outerBound;
    std::vector<Starfall::ECS::Entity> toDestroy;

    // Sprite-sheet entities carry a pre-scaled extent.
    registry.view<DespawnOutside, Starfall::ECS::SpriteSize, Starfall::ECS::Transform>(
        [&](Starfall::ECS::Entity e, DespawnOutside&, Starfall::ECS::SpriteSize& sprite, Starfall::ECS::Transform& tf) {
            const float width = outerBound(window.width, sprite.width) + margin_;
            const float height = outerBound(window.height, sprite.height) + margin_;
            if (outside(tf.position, width, height)) toDestroy.push_back(e);
        });

    // Plain sprites are scaled by their transform.
    registry.view<DespawnOutside, Starfall::ECS::Sprite, Starfall::ECS::Transform>(
        [&](Starfall::ECS::Entity e, DespawnOutside&, Starfall::ECS::Sprite& sprite, Starfall::ECS::Transform& tf) {
            const float width = outerBound(window.width, sprite.size.x * tf.scale.x) + margin_;
            const float height = outerBound(window.height, sprite.size.y * tf.scale.y) + margin_;
            if (outside(tf.position, width, height)) toDestroy.push_back(e);
        });

    std::size_t destroyed = 0;
    for (auto e : toDestroy) {
        if (registry.destroy(e)) ++destroyed;
    }
    return destroyed;
}

}  // namespace Shooter
