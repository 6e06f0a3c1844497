// Entity lifecycle and component storage.
#include <cassert>
#include <vector>

#include "../engine/ecs/Registry.h"
#include "../engine/ecs/components/Health.h"
#include "../engine/ecs/components/Hitbox.h"
#include "../engine/ecs/components/Transform.h"

using namespace Starfall::ECS;

int main() {
    {
        Registry registry;
        Entity a = registry.create();
        Entity b = registry.create();
        assert(a != kInvalidEntity && b != kInvalidEntity && a != b);
        assert(registry.alive(a) && registry.alive(b));
        assert(!registry.alive(kInvalidEntity));
        assert(registry.size() == 2);
    }
    {
        // Destroy is idempotent.
        Registry registry;
        Entity e = registry.create();
        registry.emplace<Health>(e, Health{5, 5});
        assert(registry.destroy(e));
        assert(!registry.destroy(e));
        assert(!registry.alive(e));
        assert(!registry.has<Health>(e));
        assert(registry.size() == 0);
        assert(!registry.destroy(kInvalidEntity));
    }
    {
        // A recycled slot gets a new version; the stale handle cannot touch it.
        Registry registry;
        Entity old = registry.create();
        registry.destroy(old);
        Entity fresh = registry.create();
        assert(entityIndex(fresh) == entityIndex(old));
        assert(fresh != old);
        registry.emplace<Hitbox>(fresh, Hitbox{2.0f});
        assert(!registry.destroy(old));
        assert(registry.alive(fresh));
        assert(registry.get<Hitbox>(fresh)->radius == 2.0f);
    }
    {
        // Hundreds of reuses of one slot never make an old handle match the live one.
        Registry registry;
        Entity first = registry.create();
        registry.destroy(first);
        Entity current = kInvalidEntity;
        for (int i = 0; i < 300; ++i) {
            current = registry.create();
            assert(entityIndex(current) == entityIndex(first));
            if (i + 1 < 300) registry.destroy(current);
        }
        assert(current != first);
        assert(entityVersion(current) == 300);
        assert(!registry.alive(first));
        assert(!registry.destroy(first));
        assert(registry.alive(current));
        assert(registry.retiredSlots() == 0);
    }
    {
        // Emplace replaces; remove detaches a single component.
        Registry registry;
        Entity e = registry.create();
        registry.emplace<Health>(e, Health{3, 10});
        registry.emplace<Health>(e, Health{7, 10});
        assert(registry.get<Health>(e)->current == 7);
        registry.emplace<Transform>(e);
        assert(registry.get<Transform>(e)->scale.x == 1.0f);
        registry.remove<Health>(e);
        assert(!registry.has<Health>(e));
        assert(registry.has<Transform>(e));
    }
    {
        // Views only visit entities carrying every requested component.
        Registry registry;
        Entity full = registry.create();
        registry.emplace<Health>(full, Health{1, 1});
        registry.emplace<Hitbox>(full, Hitbox{1.0f});
        Entity partial = registry.create();
        registry.emplace<Health>(partial, Health{1, 1});
        std::vector<Entity> seen;
        registry.view<Health, Hitbox>([&](Entity e, Health&, Hitbox&) { seen.push_back(e); });
        assert(seen.size() == 1 && seen.front() == full);

        const Registry& constRegistry = registry;
        int count = 0;
        constRegistry.view<Health>([&](Entity, const Health&) { ++count; });
        assert(count == 2);
    }
    {
        Health h{3, 10};
        h.damage(5);
        assert(h.current == 0);
        assert(!h.alive());
        h.damage(1);
        assert(h.current == 0);
        Health g{10, 10};
        g.damage(0);
        assert(g.current == 10);
    }
    return 0;
}
