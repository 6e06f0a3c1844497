#include "CollisionSystem.h"

#include <algorithm>
#include <string>
#include <vector>

#include "ActorQueries.h"
#include "../../engine/core/Errors.h"
#include "../../engine/core/Logger.h"
#include "../../engine/ecs/components/Health.h"
#include "../../engine/ecs/components/Hitbox.h"
#include "../../engine/ecs/components/Transform.h"
#include "../../engine/geometry/Bounds.h"
#include "../components/Bullet.h"
#include "../components/InvulnTimer.h"

namespace {
struct BulletSnapshot {
    Starfall::ECS::Entity entity{Starfall::ECS::kInvalidEntity};
    Starfall::Vec2 position{};
    float radius{0.0f};
    int damage{0};
};

std::vector<BulletSnapshot> collectBullets(Starfall::ECS::Registry& registry, Shooter::Side side) {
    std::vector<BulletSnapshot> out;
    registry.view<Shooter::BulletTag, Shooter::Damage, Starfall::ECS::Hitbox, Starfall::ECS::Transform>(
        [&](Starfall::ECS::Entity e, Shooter::BulletTag&, Shooter::Damage& dmg, Starfall::ECS::Hitbox& box,
            Starfall::ECS::Transform& tf) {
            if (!Shooter::isBullet(registry, e, side)) return;
            out.push_back(BulletSnapshot{e, tf.position, box.radius, dmg.amount});
        });
    return out;
}
}  // namespace

namespace Shooter {

PlayerHitReport CollisionSystem::collideEnemyBullets(Starfall::ECS::Registry& registry,
                                                     const Starfall::TimeStep& step, GameStateController& state) {
    std::vector<Starfall::ECS::Entity> players;
    registry.view<Starfall::ECS::Health, Starfall::ECS::Hitbox, InvulnTimer, Starfall::ECS::Transform>(
        [&](Starfall::ECS::Entity e, Starfall::ECS::Health&, Starfall::ECS::Hitbox&, InvulnTimer&,
            Starfall::ECS::Transform&) {
            if (isActor(registry, e, Side::Player)) players.push_back(e);
        });
    if (players.size() != 1) {
        const std::string msg = "expected a single player, found " + std::to_string(players.size());
        Starfall::logError(msg);
        throw Starfall::InvariantViolation(msg);
    }

    const Starfall::ECS::Entity player = players.front();
    auto& health = *registry.get<Starfall::ECS::Health>(player);
    auto& invuln = *registry.get<InvulnTimer>(player);
    const auto& playerBox = *registry.get<Starfall::ECS::Hitbox>(player);
    const Starfall::Vec2 playerPos = registry.get<Starfall::ECS::Transform>(player)->position;

    invuln.tick(static_cast<float>(step.deltaSeconds));
    // Sampled once: a reset below must not let a later bullet in this frame land.
    bool vulnerable = invuln.finished();

    PlayerHitReport report{};
    for (const auto& bullet : collectBullets(registry, Side::Enemy)) {
        if (!Starfall::Geometry::circlesOverlap(playerPos, playerBox.radius, bullet.position, bullet.radius)) {
            continue;
        }
        if (!registry.destroy(bullet.entity)) {
            continue;
        }
        ++report.bulletsConsumed;

        if (!vulnerable) {
            continue;
        }
        if (hitCue_) {
            hitCue_();
        }
        health.damage(bullet.damage);
        ++report.hitsApplied;
        Starfall::logDebug("Player hit for " + std::to_string(bullet.damage) + ", health " +
                           std::to_string(health.current) + "/" + std::to_string(health.max));
        if (health.current == 0 && state.requestGameOver()) {
            report.gameOverRequested = true;
        }
        invuln.reset();
        vulnerable = false;
    }
    return report;
}

EnemyHitReport CollisionSystem::collidePlayerBullets(Starfall::ECS::Registry& registry) {
    const auto bullets = collectBullets(registry, Side::Player);
    if (bullets.empty()) {
        return {};
    }

    EnemyHitReport report{};
    std::vector<Starfall::ECS::Entity> spent;
    registry.view<Starfall::ECS::Health, Starfall::ECS::Hitbox, Starfall::ECS::Transform>(
        [&](Starfall::ECS::Entity e, Starfall::ECS::Health& health, Starfall::ECS::Hitbox& box,
            Starfall::ECS::Transform& tf) {
            if (!isActor(registry, e, Side::Enemy)) return;
            for (const auto& bullet : bullets) {
                if (Starfall::Geometry::circlesOverlap(tf.position, box.radius, bullet.position, bullet.radius)) {
                    health.damage(bullet.damage);
                    ++report.hitsApplied;
                    spent.push_back(bullet.entity);
                }
            }
        });

    std::sort(spent.begin(), spent.end());
    spent.erase(std::unique(spent.begin(), spent.end()), spent.end());
    for (auto e : spent) {
        if (registry.destroy(e)) ++report.bulletsConsumed;
    }
    return report;
}

}  // namespace Shooter
