// Reaps DespawnOutside entities that left the viewport.
#pragma once

#include <cstddef>

#include "../../engine/ecs/Registry.h"
#include "../../engine/geometry/WindowSize.h"

namespace Shooter {

class DespawnSystem {
public:
    static constexpr float kDefaultMargin = 12.0f;

    void setMargin(float margin) { margin_ = margin; }
    float margin() const { return margin_; }

    // Returns the number of entities destroyed this call.
    std::size_t update(Starfall::ECS::Registry& registry, const Starfall::WindowSize& window);

private:
    float margin_{kDefaultMargin};
};

}  // namespace Shooter
