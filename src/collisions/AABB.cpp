/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/AABB.hpp"

#include <algorithm>
#include <cmath>

namespace KeeperEngine {

bool AABB::intersects(const AABB& other) const {
    // Use non-strict separation so edge-touching is NOT a collision
    if (right() <= other.left() || other.right() <= left()) return false;
    if (bottom() <= other.top() || other.bottom() <= top()) return false;
    return true;
}

bool AABB::contains(const Vector2D& p) const {
    return p.getX() >= left() && p.getX() <= right() &&
           p.getY() >= top()  && p.getY() <= bottom();
}

Vector2D AABB::closestPoint(const Vector2D& p) const {
    float clampedX = std::clamp(p.getX(), left(), right());
    float clampedY = std::clamp(p.getY(), top(), bottom());
    return Vector2D{clampedX, clampedY};
}

Vector2D AABB::minimumTranslation(const AABB& other) const {
    if (!intersects(other)) {
        return Vector2D{0.0f, 0.0f};
    }

    // Penetration depth on each side; push toward the shallower one
    float pushLeft = right() - other.left();
    float pushRight = other.right() - left();
    float pushUp = bottom() - other.top();
    float pushDown = other.bottom() - top();

    float dx = (pushLeft < pushRight) ? -pushLeft : pushRight;
    float dy = (pushUp < pushDown) ? -pushUp : pushDown;

    if (std::abs(dx) < std::abs(dy)) {
        return Vector2D{dx, 0.0f};
    }
    return Vector2D{0.0f, dy};
}

} // namespace KeeperEngine
