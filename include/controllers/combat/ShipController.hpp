/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SHIP_CONTROLLER_HPP
#define SHIP_CONTROLLER_HPP

/**
 * @file ShipController.hpp
 * @brief Applies the per-tick input intent to the ship
 *
 * ShipController handles:
 * - Velocity from the movement intent (separate forward, backward and
 *   vertical speeds)
 * - Weapon selection
 * - Fire cadence: one volley as soon as fire is held, then one per weapon
 *   interval; every volley is paid atomically through the ledger
 *
 * Runs before collision resolution. Owned by the Simulation.
 */

#include "core/InputIntent.hpp"
#include "world/LevelDefinition.hpp"

namespace KeeperEngine {

class EntityRegistry;
class ResourceLedger;
class EventBus;

class ShipController {
public:
    struct FireReport {
        int volleysFired{0};
        int volleysDry{0};
        float darkMatterSpent{0.0f};
    };

    ShipController(const ShipDefinition& ship, const WeaponSet& weapons);

    /**
     * @brief Steers and fires the registry's ship; no-op without a live ship
     */
    FireReport applyIntent(EntityRegistry& registry, ResourceLedger& ledger, EventBus& events,
                           const InputIntent& intent, float deltaTime);

    /**
     * @brief Velocity for @p movement, normalized when longer than 1
     */
    Vector2D velocityFor(const Vector2D& movement) const;

private:
    ShipDefinition m_ship;
    WeaponSet m_weapons;
};

} // namespace KeeperEngine

#endif // SHIP_CONTROLLER_HPP
