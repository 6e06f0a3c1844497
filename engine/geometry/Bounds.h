// Viewport bound math in a centered coordinate system (origin at the viewport center).
#pragma once

#include "../math/Vec2.h"

namespace Starfall::Geometry {

// Half-range within which an object of the given extent stays fully visible.
// Both arguments must be non-negative.
inline float innerBound(float dimension, float extent) { return (dimension - extent) / 2.0f; }

// Half-range at which an object of the given extent has fully left the viewport.
inline float outerBound(float dimension, float extent) { return (dimension + extent) / 2.0f; }

// Strict test: circles that merely touch do not overlap.
inline bool circlesOverlap(const Vec2& centerA, float radiusA, const Vec2& centerB, float radiusB) {
    const float radiusSum = radiusA + radiusB;
    return distanceSquared(centerA, centerB) < radiusSum * radiusSum;
}

}  // namespace Starfall::Geometry
