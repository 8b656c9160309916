/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef HAZARD_CANNON_CONTROLLER_HPP
#define HAZARD_CANNON_CONTROLLER_HPP

#include "collisions/AABB.hpp"
#include <cstddef>

namespace KeeperEngine {

class EntityRegistry;

/**
 * @brief Fires the fixed-heading cannons of armed hazards
 *
 * A cannon only counts down and fires while its hazard is inside the
 * bounding box. No aiming.
 */
class HazardCannonController {
public:
    HazardCannonController() = default;

    /**
     * @return number of enemy projectiles spawned this tick
     */
    size_t update(EntityRegistry& registry, const AABB& boxBounds, float deltaTime);
};

} // namespace KeeperEngine

#endif // HAZARD_CANNON_CONTROLLER_HPP
