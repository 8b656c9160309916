/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "entities/EntityRecord.hpp"

namespace KeeperEngine {

CollisionRole EntityRecord::collisionRole() const {
    switch (role) {
        case EntityRole::Ship:
            return CollisionRole::Ship;
        case EntityRole::Hazard:
            return CollisionRole::Hazard;
        case EntityRole::Pickup: {
            const auto* pickup = payloadAs<PickupPayload>();
            return (pickup && pickup->kind == PickupKind::RedBottle)
                       ? CollisionRole::RedPickup
                       : CollisionRole::BluePickup;
        }
        case EntityRole::Projectile: {
            const auto* projectile = payloadAs<ProjectilePayload>();
            return (projectile && RoleTraits::isFriendly(projectile->kind))
                       ? CollisionRole::FriendlyProjectile
                       : CollisionRole::EnemyProjectile;
        }
        case EntityRole::Wall:
        default:
            return CollisionRole::Wall;
    }
}

bool payloadMatchesRole(EntityRole role, const EntityPayload& payload) {
    switch (role) {
        case EntityRole::Ship:       return std::holds_alternative<ShipPayload>(payload);
        case EntityRole::Hazard:     return std::holds_alternative<HazardPayload>(payload);
        case EntityRole::Pickup:     return std::holds_alternative<PickupPayload>(payload);
        case EntityRole::Projectile: return std::holds_alternative<ProjectilePayload>(payload);
        case EntityRole::Wall:       return std::holds_alternative<WallPayload>(payload);
        default:                     return false;
    }
}

} // namespace KeeperEngine
