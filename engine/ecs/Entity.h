// Generational entity handle: low 32 bits index a slot, high 32 bits carry its version.
#pragma once

#include <cstdint>
#include <limits>

namespace Starfall::ECS {

using Entity = std::uint64_t;
constexpr Entity kInvalidEntity = 0;

constexpr std::uint32_t kMaxEntityVersion = std::numeric_limits<std::uint32_t>::max();

constexpr std::uint32_t entityIndex(Entity e) { return static_cast<std::uint32_t>(e & 0xFFFFFFFFull); }
constexpr std::uint32_t entityVersion(Entity e) { return static_cast<std::uint32_t>(e >> 32); }
constexpr Entity makeEntity(std::uint32_t index, std::uint32_t version) {
    return (static_cast<Entity>(version) << 32) | static_cast<Entity>(index);
}

}  // namespace Starfall::ECS
