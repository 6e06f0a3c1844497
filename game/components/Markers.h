// Opt-in markers for viewport passes.
#pragma once

namespace Shooter {

// Reaped once fully outside the viewport plus the despawn margin.
struct DespawnOutside {};

// Background decoration that wraps from the bottom edge to the top.
struct StarTag {};

}  // namespace Shooter
