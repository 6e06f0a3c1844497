// Predicates narrowing views to actors or bullets of one side.
#pragma once

#include "../../engine/ecs/Registry.h"
#include "../components/Bullet.h"
#include "../components/Faction.h"

namespace Shooter {

inline bool isBullet(const Starfall::ECS::Registry& registry, Starfall::ECS::Entity e, Side side) {
    const auto* faction = registry.get<Faction>(e);
    return faction && faction->side == side && registry.has<BulletTag>(e);
}

inline bool isActor(const Starfall::ECS::Registry& registry, Starfall::ECS::Entity e, Side side) {
    const auto* faction = registry.get<Faction>(e);
    return faction && faction->side == side && !registry.has<BulletTag>(e);
}

}  // namespace Shooter
