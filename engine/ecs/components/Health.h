// Health component for damageable entities.
#pragma once

namespace Starfall::ECS {

struct Health {
    int current{100};
    int max{100};

    // Saturates at zero.
    void damage(int amount) {
        if (amount <= 0) return;
        current = amount >= current ? 0 : current - amount;
    }

    bool alive() const { return current > 0; }
};

}  // namespace Starfall::ECS
