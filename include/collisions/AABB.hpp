/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef AABB_HPP
#define AABB_HPP

#include "utils/Vector2D.hpp"

namespace KeeperEngine {

struct AABB {
    Vector2D center;   // world center
    Vector2D halfSize; // half extents (w/2, h/2)

    AABB() = default;
    AABB(float cx, float cy, float hw, float hh) : center(cx, cy), halfSize(hw, hh) {}

    // Build from the top-left corner and full size (level files describe walls this way)
    static AABB fromCorner(float x, float y, float width, float height) {
        return AABB(x + width * 0.5f, y + height * 0.5f, width * 0.5f, height * 0.5f);
    }

    float left() const { return center.getX() - halfSize.getX(); }
    float right() const { return center.getX() + halfSize.getX(); }
    float top() const { return center.getY() - halfSize.getY(); }
    float bottom() const { return center.getY() + halfSize.getY(); }
    float width() const { return halfSize.getX() * 2.0f; }
    float height() const { return halfSize.getY() * 2.0f; }

    bool intersects(const AABB& other) const;
    bool contains(const Vector2D& p) const;
    Vector2D closestPoint(const Vector2D& p) const;

    /**
     * @brief Smallest displacement that moves this box out of @p other.
     *
     * Resolves along the axis of least penetration. Returns a zero vector when
     * the boxes do not intersect.
     */
    Vector2D minimumTranslation(const AABB& other) const;
};

} // namespace KeeperEngine

#endif // AABB_HPP
