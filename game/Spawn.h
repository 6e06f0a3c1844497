// Factories for fully-formed shooter entities.
#pragma once

#include "../engine/ecs/Registry.h"
#include "../engine/math/Vec2.h"
#include "components/Faction.h"

namespace Shooter {

constexpr float kPlayerHitboxRadius = 12.0f;
constexpr float kEnemyHitboxRadius = 18.0f;
constexpr float kBulletHitboxRadius = 3.0f;

// The player spawns vulnerable.
Starfall::ECS::Entity spawnPlayer(Starfall::ECS::Registry& registry, const Starfall::Vec2& position, int health,
                                  float invulnSeconds);

Starfall::ECS::Entity spawnEnemy(Starfall::ECS::Registry& registry, const Starfall::Vec2& position,
                                 const Starfall::Vec2& velocity, int health);

Starfall::ECS::Entity spawnBullet(Starfall::ECS::Registry& registry, Side side, const Starfall::Vec2& position,
                                  const Starfall::Vec2& velocity, int damage);

Starfall::ECS::Entity spawnStar(Starfall::ECS::Registry& registry, const Starfall::Vec2& position, float scale,
                                float fallSpeed);

}  // namespace Shooter
