/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef HITBOX_HPP
#define HITBOX_HPP

#include "collisions/AABB.hpp"
#include "utils/Vector2D.hpp"
#include <cstdint>

namespace KeeperEngine {

enum class HitboxShape : uint8_t {
    Box = 0,
    Circle = 1
};

/**
 * @brief Collision shape centered on an entity's position
 *
 * Box hitboxes are axis-aligned. Touching edges do not count as overlap,
 * matching AABB::intersects.
 */
struct Hitbox {
    HitboxShape shape{HitboxShape::Box};
    float radius{0.0f};     // Circle only
    float halfWidth{0.0f};  // Box only
    float halfHeight{0.0f}; // Box only

    static Hitbox circle(float r) {
        Hitbox h;
        h.shape = HitboxShape::Circle;
        h.radius = r;
        return h;
    }

    static Hitbox box(float width, float height) {
        Hitbox h;
        h.shape = HitboxShape::Box;
        h.halfWidth = width * 0.5f;
        h.halfHeight = height * 0.5f;
        return h;
    }

    bool isValid() const;

    // Axis-aligned bounds of this shape when centered at @p center
    AABB boundsAt(const Vector2D& center) const;
};

/**
 * @brief Narrow-phase test between two placed hitboxes
 * @return true if the shapes strictly overlap
 */
bool hitboxesOverlap(const Hitbox& a, const Vector2D& posA,
                     const Hitbox& b, const Vector2D& posB);

} // namespace KeeperEngine

#endif // HITBOX_HPP
