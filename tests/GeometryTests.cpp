// Viewport bound math and circle overlap checks.
#include <cassert>
#include <cmath>

#include "../engine/geometry/Bounds.h"

using namespace Starfall::Geometry;

int main() {
    {
        // Inner and outer bounds split the dimension and differ by the extent.
        const float dims[] = {0.0f, 1.0f, 600.0f, 800.0f, 1920.0f};
        const float extents[] = {0.0f, 2.0f, 48.0f, 64.0f, 128.5f};
        for (float d : dims) {
            for (float e : extents) {
                assert(std::abs(innerBound(d, e) + outerBound(d, e) - d) < 1e-3f);
                assert(std::abs(outerBound(d, e) - innerBound(d, e) - e) < 1e-3f);
            }
        }
    }
    {
        assert(innerBound(800.0f, 64.0f) == 368.0f);
        assert(outerBound(800.0f, 64.0f) == 432.0f);
        assert(outerBound(600.0f, 64.0f) == 332.0f);
        // An extent wider than the viewport leaves no room to move.
        assert(innerBound(100.0f, 120.0f) < 0.0f);
    }
    {
        // Strict inequality on squared distance.
        const Starfall::Vec2 origin{0.0f, 0.0f};
        assert(circlesOverlap(origin, 5.0f, Starfall::Vec2{9.99f, 0.0f}, 5.0f));
        assert(!circlesOverlap(origin, 5.0f, Starfall::Vec2{10.0f, 0.0f}, 5.0f));
        assert(!circlesOverlap(origin, 5.0f, Starfall::Vec2{0.0f, -10.5f}, 5.0f));
        assert(circlesOverlap(origin, 5.0f, Starfall::Vec2{6.0f, 6.0f}, 5.0f));
        assert(!circlesOverlap(origin, 5.0f, Starfall::Vec2{8.0f, 6.0f}, 5.0f));
    }
    {
        // Zero radii never overlap, even at a shared center.
        const Starfall::Vec2 p{3.0f, 4.0f};
        assert(!circlesOverlap(p, 0.0f, p, 0.0f));
        assert(Starfall::distanceSquared(p, Starfall::Vec2{0.0f, 0.0f}) == 25.0f);
    }
    return 0;
}
