#include "DeathSystem.h"

#include <string>
#include <vector>

#include "ActorQueries.h"
#include "../../engine/core/Logger.h"
#include "../../engine/ecs/components/Health.h"

namespace Shooter {

std::size_t DeathSystem::update(Starfall::ECS::Registry& registry) {
    std::vector<Starfall::ECS::Entity> dead;
    registry.view<Starfall::ECS::Health>([&](Starfall::ECS::Entity e, Starfall::ECS::Health& health) {
        if (!health.alive() && isActor(registry, e, Side::Enemy)) dead.push_back(e);
    });

    std::size_t removed = 0;
    for (auto e : dead) {
        if (registry.destroy(e)) ++removed;
    }
    if (removed > 0) {
        Starfall::logDebug("Destroyed " + std::to_string(removed) + " enemies");
    }
    return removed;
}

}  // namespace Shooter
