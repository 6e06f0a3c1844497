// Confinement, off-screen reaping and starfield wrap.
#include <cassert>

#include "../engine/ecs/Registry.h"
#include "../engine/ecs/components/Sprite.h"
#include "../engine/ecs/components/Transform.h"
#include "../game/components/Bullet.h"
#include "../game/components/Faction.h"
#include "../game/components/Markers.h"
#include "../game/Spawn.h"
#include "../game/systems/ConfinementSystem.h"
#include "../game/systems/DespawnSystem.h"
#include "../game/systems/StarWrapSystem.h"

using namespace Starfall::ECS;
using Shooter::Side;

namespace {
const Starfall::WindowSize kWindow{800.0f, 600.0f};

Entity placePlayer(Registry& registry, float x, float y) {
    Entity e = registry.create();
    registry.emplace<Transform>(e, Transform{{x, y}, {1.0f, 1.0f}});
    registry.emplace<SpriteSize>(e, SpriteSize{64.0f, 64.0f});
    registry.emplace<Shooter::Faction>(e, Shooter::Faction{Side::Player});
    return e;
}

Entity placeSheet(Registry& registry, float x, float y) {
    Entity e = registry.create();
    registry.emplace<Transform>(e, Transform{{x, y}, {1.0f, 1.0f}});
    registry.emplace<SpriteSize>(e, SpriteSize{64.0f, 64.0f});
    registry.emplace<Shooter::DespawnOutside>(e);
    return e;
}

Entity placeScaledSprite(Registry& registry, float x, float y, float scale) {
    Entity e = registry.create();
    registry.emplace<Transform>(e, Transform{{x, y}, {scale, scale}});
    registry.emplace<Sprite>(e, Sprite{{64.0f, 64.0f}});
    registry.emplace<Shooter::DespawnOutside>(e);
    return e;
}

Entity placeStar(Registry& registry, float y) {
    Entity e = registry.create();
    registry.emplace<Transform>(e, Transform{{25.0f, y}, {1.0f, 1.0f}});
    registry.emplace<Sprite>(e, Sprite{{2.0f, 64.0f}});
    registry.emplace<Shooter::StarTag>(e);
    return e;
}
}  // namespace

int main() {
    {
        // Player clamps to the inner bound on both sides of each axis.
        Registry registry;
        Entity right = placePlayer(registry, 1000.0f, 0.0f);
        Shooter::ConfinementSystem confinement;
        confinement.update(registry, kWindow);
        assert(registry.get<Transform>(right)->position.x == 368.0f);

        registry.get<Transform>(right)->position = {-1000.0f, 1000.0f};
        confinement.update(registry, kWindow);
        assert(registry.get<Transform>(right)->position.x == -368.0f);
        assert(registry.get<Transform>(right)->position.y == 268.0f);

        registry.get<Transform>(right)->position = {12.5f, -20.0f};
        confinement.update(registry, kWindow);
        assert(registry.get<Transform>(right)->position.x == 12.5f);
        assert(registry.get<Transform>(right)->position.y == -20.0f);
    }
    {
        // Only player actors are confined; enemies and player bullets are not.
        Registry registry;
        Entity enemy = Shooter::spawnEnemy(registry, {1000.0f, 0.0f}, {0.0f, 0.0f}, 3);
        Entity bullet = placePlayer(registry, 1000.0f, 0.0f);
        registry.emplace<Shooter::BulletTag>(bullet);
        Shooter::ConfinementSystem confinement;
        confinement.update(registry, kWindow);
        assert(registry.get<Transform>(enemy)->position.x == 1000.0f);
        assert(registry.get<Transform>(bullet)->position.x == 1000.0f);
    }
    {
        // Sprite-sheet extent: outer bound 432 (x) / 332 (y) plus a 12 unit margin.
        Registry registry;
        Shooter::DespawnSystem despawn;
        Entity keep[] = {placeSheet(registry, 444.0f, 0.0f), placeSheet(registry, -444.0f, 0.0f),
                         placeSheet(registry, 0.0f, 344.0f), placeSheet(registry, 0.0f, -344.0f)};
        Entity drop[] = {placeSheet(registry, 444.1f, 0.0f), placeSheet(registry, -444.1f, 0.0f),
                         placeSheet(registry, 0.0f, 344.1f), placeSheet(registry, 0.0f, -344.1f)};
        assert(despawn.update(registry, kWindow) == 4);
        for (Entity e : keep) assert(registry.alive(e));
        for (Entity e : drop) assert(!registry.alive(e));
    }
    {
        // Plain sprites are scaled by their transform: 64 * 2 gives a 476 / 376 limit.
        Registry registry;
        Shooter::DespawnSystem despawn;
        Entity keep[] = {placeScaledSprite(registry, 476.0f, 0.0f, 2.0f), placeScaledSprite(registry, -476.0f, 0.0f, 2.0f),
                         placeScaledSprite(registry, 0.0f, 376.0f, 2.0f), placeScaledSprite(registry, 0.0f, -376.0f, 2.0f)};
        Entity drop[] = {placeScaledSprite(registry, 476.1f, 0.0f, 2.0f), placeScaledSprite(registry, -476.1f, 0.0f, 2.0f),
                         placeScaledSprite(registry, 0.0f, 376.1f, 2.0f), placeScaledSprite(registry, 0.0f, -376.1f, 2.0f)};
        despawn.update(registry, kWindow);
        for (Entity e : keep) assert(registry.alive(e));
        for (Entity e : drop) assert(!registry.alive(e));
    }
    {
        // Entities without the marker are never reaped; the margin is configurable.
        Registry registry;
        Entity unmarked = registry.create();
        registry.emplace<Transform>(unmarked, Transform{{5000.0f, 5000.0f}, {1.0f, 1.0f}});
        registry.emplace<SpriteSize>(unmarked, SpriteSize{64.0f, 64.0f});
        Entity edge = placeSheet(registry, 433.0f, 0.0f);
        Shooter::DespawnSystem despawn;
        despawn.setMargin(0.0f);
        despawn.update(registry, kWindow);
        assert(registry.alive(unmarked));
        assert(!registry.alive(edge));
    }
    {
        // An entity matching both extent kinds is destroyed once without error.
        Registry registry;
        Entity both = placeSheet(registry, 2000.0f, 0.0f);
        registry.emplace<Sprite>(both, Sprite{{64.0f, 64.0f}});
        Shooter::DespawnSystem despawn;
        assert(despawn.update(registry, kWindow) == 1);
        assert(!registry.alive(both));
        assert(despawn.update(registry, kWindow) == 0);
    }
    {
        // Stars wrap only once fully below the bottom edge.
        Registry registry;
        Entity visible = placeStar(registry, -301.0f);
        Entity below = placeStar(registry, -333.0f);
        Entity above = placeStar(registry, 900.0f);
        Shooter::StarWrapSystem wrap;
        wrap.update(registry, kWindow);
        assert(registry.get<Transform>(visible)->position.y == -301.0f);
        assert(registry.get<Transform>(below)->position.y == 332.0f);
        assert(registry.get<Transform>(below)->position.x == 25.0f);
        assert(registry.get<Transform>(above)->position.y == 900.0f);
    }
    return 0;
}
