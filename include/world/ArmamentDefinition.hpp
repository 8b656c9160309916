/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ARMAMENT_DEFINITION_HPP
#define ARMAMENT_DEFINITION_HPP

#include "entities/EntityRole.hpp"
#include "utils/Vector2D.hpp"
#include <vector>

namespace KeeperEngine {

/**
 * @brief Ship weapon as configured by the level
 *
 * One volley emits a projectile along every heading and costs
 * cost * headings.size() dark matter.
 */
struct WeaponDefinition {
    float cost{0.0f};           // dark matter per projectile
    float damage{0.0f};
    float speed{0.0f};          // world units per second
    float interval{0.25f};      // seconds between volleys while fire is held
    float radius{4.0f};         // projectile hitbox radius
    std::vector<Vector2D> headings{Vector2D(1.0f, 0.0f)};

    float volleyCost() const { return cost * static_cast<float>(headings.size()); }
};

/**
 * @brief Fixed-heading gun mounted on a hazard type
 */
struct CannonDefinition {
    ProjectileKind projectile{ProjectileKind::EnemyBullet};
    float damage{0.0f};
    float speed{0.0f};
    float interval{1.0f};
    float radius{4.0f};
    std::vector<Vector2D> headings{Vector2D(-1.0f, 0.0f)};
};

} // namespace KeeperEngine

#endif // ARMAMENT_DEFINITION_HPP
