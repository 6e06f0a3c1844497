// Rendered extents used for viewport bound math.
#pragma once

#include "../../math/Vec2.h"

namespace Starfall::ECS {

// Extent of a sprite-sheet frame, already multiplied by its scale.
struct SpriteSize {
    float width{0.0f};
    float height{0.0f};

    static SpriteSize scaled(float width, float height, float scale) {
        return SpriteSize{width * scale, height * scale};
    }
};

// Plain sprite extent; combine with Transform::scale before use.
struct Sprite {
    Vec2 size{16.0f, 16.0f};
};

}  // namespace Starfall::ECS
