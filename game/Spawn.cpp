#include "Spawn.h"

#include "../engine/ecs/components/Health.h"
#include "../engine/ecs/components/Hitbox.h"
#include "../engine/ecs/components/Sprite.h"
#include "../engine/ecs/components/Transform.h"
#include "../engine/ecs/components/Velocity.h"
#include "components/Bullet.h"
#include "components/InvulnTimer.h"
#include "components/Markers.h"

namespace Shooter {

namespace {
// Sprite sheets are 16px frames drawn at 4x.
constexpr float kFramePixels = 16.0f;
constexpr float kSheetScale = 4.0f;
}  // namespace

Starfall::ECS::Entity spawnPlayer(Starfall::ECS::Registry& registry, const Starfall::Vec2& position, int health,
                                  float invulnSeconds) {
    using namespace Starfall::ECS;
    Entity e = registry.create();
    registry.emplace<Transform>(e, Transform{position, {1.0f, 1.0f}});
    registry.emplace<Velocity>(e);
    registry.emplace<SpriteSize>(e, SpriteSize::scaled(kFramePixels, kFramePixels, kSheetScale));
    registry.emplace<Hitbox>(e, Hitbox{kPlayerHitboxRadius});
    registry.emplace<Health>(e, Health{health, health});
    registry.emplace<InvulnTimer>(e, InvulnTimer::expired(invulnSeconds));
    registry.emplace<Faction>(e, Faction{Side::Player});
    return e;
}

Starfall::ECS::Entity spawnEnemy(Starfall::ECS::Registry& registry, const Starfall::Vec2& position,
                                 const Starfall::Vec2& velocity, int health) {
    using namespace Starfall::ECS;
    Entity e = registry.create();
    registry.emplace<Transform>(e, Transform{position, {1.0f, 1.0f}});
    registry.emplace<Velocity>(e, Velocity{velocity});
    registry.emplace<SpriteSize>(e, SpriteSize::scaled(12.0f, 12.0f, kSheetScale));
    registry.emplace<Hitbox>(e, Hitbox{kEnemyHitboxRadius});
    registry.emplace<Health>(e, Health{health, health});
    registry.emplace<Faction>(e, Faction{Side::Enemy});
    registry.emplace<DespawnOutside>(e);
    return e;
}

Starfall::ECS::Entity spawnBullet(Starfall::ECS::Registry& registry, Side side, const Starfall::Vec2& position,
                                  const Starfall::Vec2& velocity, int damage) {
    using namespace Starfall::ECS;
    Entity e = registry.create();
    registry.emplace<Transform>(e, Transform{position, {1.0f, 1.0f}});
    registry.emplace<Velocity>(e, Velocity{velocity});
    registry.emplace<Sprite>(e, Sprite{{6.0f, 12.0f}});
    registry.emplace<Hitbox>(e, Hitbox{kBulletHitboxRadius});
    registry.emplace<BulletTag>(e);
    registry.emplace<Damage>(e, Damage{damage < 0 ? 0 : damage});
    registry.emplace<Faction>(e, Faction{side});
    registry.emplace<DespawnOutside>(e);
    return e;
}

Starfall::ECS::Entity spawnStar(Starfall::ECS::Registry& registry, const Starfall::Vec2& position, float scale,
                                float fallSpeed) {
    using namespace Starfall::ECS;
    Entity e = registry.create();
    registry.emplace<Transform>(e, Transform{position, {scale, scale}});
    registry.emplace<Velocity>(e, Velocity{{0.0f, -fallSpeed}});
    registry.emplace<Sprite>(e, Sprite{{2.0f, 2.0f}});
    registry.emplace<StarTag>(e);
    return e;
}

}  // namespace Shooter
