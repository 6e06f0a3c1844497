#include "MovementSystem.h"

#include "../../engine/ecs/components/Transform.h"
#include "../../engine/ecs/components/Velocity.h"

namespace Shooter {

void MovementSystem::update(Starfall::ECS::Registry& registry, const Starfall::TimeStep& step) {
    const float dt = static_cast<float>(step.deltaSeconds);
    registry.view<Starfall::ECS::Transform, Starfall::ECS::Velocity>(
        [dt](Starfall::ECS::Entity /*e*/, Starfall::ECS::Transform& tf, Starfall::ECS::Velocity& vel) {
            tf.position += vel.value * dt;
        });
}

}  // namespace Shooter
