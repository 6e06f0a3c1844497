// Non-repeating invulnerability countdown; the owner takes no damage until it finishes.
#pragma once

#include <algorithm>

namespace Shooter {

struct InvulnTimer {
    float duration{1.0f};
    float elapsed{0.0f};

    static InvulnTimer expired(float durationSeconds) { return InvulnTimer{durationSeconds, durationSeconds}; }
    static InvulnTimer running(float durationSeconds) { return InvulnTimer{durationSeconds, 0.0f}; }

    void tick(float dt) { elapsed = std::min(duration, elapsed + std::max(0.0f, dt)); }
    void reset() { elapsed = 0.0f; }
    bool finished() const { return elapsed >= duration; }
    float remaining() const { return duration - elapsed; }
};

}  // namespace Shooter
