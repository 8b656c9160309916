/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/Hitbox.hpp"

#include <cmath>

namespace KeeperEngine {

namespace {

bool circleOverlapsBox(const Vector2D& circleCenter, float radius, const AABB& box) {
    Vector2D closest = box.closestPoint(circleCenter);
    return Vector2D::distanceSquared(closest, circleCenter) < radius * radius;
}

} // anonymous namespace

bool Hitbox::isValid() const {
    if (shape == HitboxShape::Circle) {
        return std::isfinite(radius) && radius > 0.0f;
    }
    return std::isfinite(halfWidth) && std::isfinite(halfHeight) &&
           halfWidth > 0.0f && halfHeight > 0.0f;
}

AABB Hitbox::boundsAt(const Vector2D& center) const {
    if (shape == HitboxShape::Circle) {
        return AABB(center.getX(), center.getY(), radius, radius);
    }
    return AABB(center.getX(), center.getY(), halfWidth, halfHeight);
}

bool hitboxesOverlap(const Hitbox& a, const Vector2D& posA,
                     const Hitbox& b, const Vector2D& posB) {
    if (a.shape == HitboxShape::Circle && b.shape == HitboxShape::Circle) {
        float reach = a.radius + b.radius;
        return Vector2D::distanceSquared(posA, posB) < reach * reach;
    }
    if (a.shape == HitboxShape::Circle) {
        return circleOverlapsBox(posA, a.radius, b.boundsAt(posB));
    }
    if (b.shape == HitboxShape::Circle) {
        return circleOverlapsBox(posB, b.radius, a.boundsAt(posA));
    }
    return a.boundsAt(posA).intersects(b.boundsAt(posB));
}

} // namespace KeeperEngine
