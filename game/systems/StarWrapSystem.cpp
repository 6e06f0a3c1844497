#include "StarWrapSystem.h"

#include "../../engine/ecs/components/Sprite.h"
#include "../../engine/ecs/components/Transform.h"
#include "../../engine/geometry/Bounds.h"
#include "../components/Markers.h"

namespace Shooter {

void StarWrapSystem::update(Starfall::ECS::Registry& registry, const Starfall::WindowSize& window) {
    registry.view<StarTag, Starfall::ECS::Sprite, Starfall::ECS::Transform>(
        [&](Starfall::ECS::Entity /*e*/, StarTag&, Starfall::ECS::Sprite& sprite, Starfall::ECS::Transform& tf) {
            const float height = Starfall::Geometry::outerBound(window.height, sprite.size.y * tf.scale.y);
            if (tf.position.y < -height) {
                tf.position.y = height;
            }
        });
}

}  // namespace Shooter
