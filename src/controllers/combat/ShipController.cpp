/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/combat/ShipController.hpp"
#include "core/Logger.hpp"
#include "events/EventBus.hpp"
#include "managers/EntityRegistry.hpp"
#include "managers/ResourceLedger.hpp"

#include <algorithm>
#include <format>
#include <vector>

namespace KeeperEngine {

ShipController::ShipController(const ShipDefinition& ship, const WeaponSet& weapons)
    : m_ship(ship), m_weapons(weapons) {}

Vector2D ShipController::velocityFor(const Vector2D& movement) const {
    Vector2D direction(std::clamp(movement.getX(), -1.0f, 1.0f),
                       std::clamp(movement.getY(), -1.0f, 1.0f));
    if (direction.lengthSquared() > 1.0f) {
        direction = direction.normalized();
    }

    float speedX = direction.getX() >= 0.0f ? m_ship.speedForward : m_ship.speedBackward;
    return Vector2D(direction.getX() * speedX, direction.getY() * m_ship.speedVertical);
}

ShipController::FireReport ShipController::applyIntent(EntityRegistry& registry,
                                                       ResourceLedger& ledger, EventBus& events,
                                                       const InputIntent& intent,
                                                       float deltaTime) {
    FireReport report;
    EntityRecord* ship = registry.getShip();
    if (!ship || !ship->alive) {
        return report;
    }
    auto* payload = ship->payloadAs<ShipPayload>();
    if (!payload) {
        return report;
    }

    ship->velocity = velocityFor(intent.movement);

    if (payload->selectedWeapon != intent.weapon) {
        SHIP_DEBUG(std::format("Weapon switched to {}", RoleTraits::weaponToString(intent.weapon)));
        payload->selectedWeapon = intent.weapon;
        payload->fireCooldown = 0.0f;
    }

    if (!intent.fire) {
        payload->fireCooldown = 0.0f;
        return report;
    }

    payload->fireCooldown -= deltaTime;
    if (payload->fireCooldown > 0.0f) {
        return report;
    }

    const WeaponDefinition& weapon = m_weapons.get(payload->selectedWeapon);
    payload->fireCooldown = weapon.interval;

    // Copy what the spawns need; spawning invalidates the ship pointer
    const EntityID shipId = ship->id;
    const Vector2D origin = ship->position;
    const float volleyCost = weapon.volleyCost();

    WeaponCostResult cost = ledger.costWeaponFire(volleyCost);

    SimulationEvent event;
    event.entity = shipId;
    event.role = EntityRole::Ship;
    event.position = origin;
    event.amount = volleyCost;
    event.detail = RoleTraits::weaponToString(payload->selectedWeapon);

    if (!cost.paid) {
        ++report.volleysDry;
        event.type = SimulationEventType::WeaponDry;
        events.publish(std::move(event));
        SHIP_DEBUG(std::format("Volley needs {:.1f} dark matter, {:.1f} available", volleyCost,
                               ledger.getDarkMatter()));
        return report;
    }

    std::vector<EntitySpec> projectiles;
    projectiles.reserve(weapon.headings.size());
    const ProjectileKind kind = RoleTraits::friendlyProjectileFor(payload->selectedWeapon);
    for (const auto& heading : weapon.headings) {
        EntitySpec spec;
        spec.role = EntityRole::Projectile;
        spec.position = origin;
        spec.velocity = heading.normalized() * weapon.speed;
        spec.hitbox = Hitbox::circle(weapon.radius);
        spec.payload = ProjectilePayload{kind, shipId, weapon.damage};
        projectiles.push_back(std::move(spec));
    }
    for (const auto& spec : projectiles) {
        registry.spawn(spec);
    }

    ++report.volleysFired;
    report.darkMatterSpent = cost.debit.removed;
    event.type = SimulationEventType::WeaponFired;
    events.publish(std::move(event));
    return report;
}

} // namespace KeeperEngine
