// Viewport dimensions in world units; read-only once the world is built.
#pragma once

namespace Starfall {

struct WindowSize {
    float width{800.0f};
    float height{600.0f};
};

}  // namespace Starfall
