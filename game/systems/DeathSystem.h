// Removes enemies whose health ran out.
#pragma once

#include <cstddef>

#include "../../engine/ecs/Registry.h"

namespace Shooter {

class DeathSystem {
public:
    std::size_t update(Starfall::ECS::Registry& registry);
};

}  // namespace Shooter
