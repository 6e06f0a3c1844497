// Projectile marker and the damage it deals on its first hit.
#pragma once

namespace Shooter {

struct BulletTag {};

struct Damage {
    int amount{1};  // non-negative
};

}  // namespace Shooter
