/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "collisions/InteractionTable.hpp"
#include "core/Logger.hpp"
#include "core/SimulationErrors.hpp"

#include <format>

namespace KeeperEngine {

namespace InteractionTraits {

const char* effectToString(InteractionEffect effect) noexcept {
    switch (effect) {
        case InteractionEffect::None:                 return "none";
        case InteractionEffect::ShipHazardContact:    return "shipHazardContact";
        case InteractionEffect::ShipProjectileHit:    return "shipProjectileHit";
        case InteractionEffect::ShipDarkMatterCredit: return "shipDarkMatterCredit";
        case InteractionEffect::ShipDarkMatterDrain:  return "shipDarkMatterDrain";
        case InteractionEffect::ShipWallContact:      return "shipWallContact";
        case InteractionEffect::HazardProjectileHit:  return "hazardProjectileHit";
        case InteractionEffect::ProjectileWallImpact: return "projectileWallImpact";
        default:                                      return "unknown";
    }
}

std::optional<InteractionEffect> effectFromString(std::string_view name) {
    for (size_t i = 0; i < static_cast<size_t>(InteractionEffect::COUNT); ++i) {
        auto effect = static_cast<InteractionEffect>(i);
        if (name == effectToString(effect)) {
            return effect;
        }
    }
    return std::nullopt;
}

namespace {

bool isPickup(CollisionRole role) {
    return role == CollisionRole::BluePickup || role == CollisionRole::RedPickup;
}

bool isProjectile(CollisionRole role) {
    return role == CollisionRole::FriendlyProjectile ||
           role == CollisionRole::EnemyProjectile;
}

// Ordered check; the public function tries both orders
bool fitsOrdered(InteractionEffect effect, CollisionRole a, CollisionRole b) {
    switch (effect) {
        case InteractionEffect::None:
            return true;
        case InteractionEffect::ShipHazardContact:
            return a == CollisionRole::Ship && b == CollisionRole::Hazard;
        case InteractionEffect::ShipProjectileHit:
            return a == CollisionRole::Ship && isProjectile(b);
        case InteractionEffect::ShipDarkMatterCredit:
        case InteractionEffect::ShipDarkMatterDrain:
            return a == CollisionRole::Ship && isPickup(b);
        case InteractionEffect::ShipWallContact:
            return a == CollisionRole::Ship && b == CollisionRole::Wall;
        case InteractionEffect::HazardProjectileHit:
            return a == CollisionRole::Hazard && isProjectile(b);
        case InteractionEffect::ProjectileWallImpact:
            return isProjectile(a) && b == CollisionRole::Wall;
        default:
            return false;
    }
}

} // anonymous namespace

bool effectFitsRoles(InteractionEffect effect, CollisionRole a, CollisionRole b) noexcept {
    return fitsOrdered(effect, a, b) || fitsOrdered(effect, b, a);
}

} // namespace InteractionTraits

InteractionTable InteractionTable::createDefault() {
    InteractionTable table;
    for (size_t i = 0; i < COLLISION_ROLE_COUNT; ++i) {
        for (size_t j = i; j < COLLISION_ROLE_COUNT; ++j) {
            table.set(static_cast<CollisionRole>(i), static_cast<CollisionRole>(j),
                      InteractionEffect::None);
        }
    }

    table.set(CollisionRole::Ship, CollisionRole::Hazard, InteractionEffect::ShipHazardContact);
    table.set(CollisionRole::Ship, CollisionRole::EnemyProjectile,
              InteractionEffect::ShipProjectileHit);
    table.set(CollisionRole::Ship, CollisionRole::BluePickup,
              InteractionEffect::ShipDarkMatterCredit);
    table.set(CollisionRole::Ship, CollisionRole::RedPickup,
              InteractionEffect::ShipDarkMatterDrain);
    table.set(CollisionRole::Ship, CollisionRole::Wall, InteractionEffect::ShipWallContact);
    table.set(CollisionRole::Hazard, CollisionRole::FriendlyProjectile,
              InteractionEffect::HazardProjectileHit);
    table.set(CollisionRole::FriendlyProjectile, CollisionRole::Wall,
              InteractionEffect::ProjectileWallImpact);
    table.set(CollisionRole::EnemyProjectile, CollisionRole::Wall,
              InteractionEffect::ProjectileWallImpact);
    return table;
}

void InteractionTable::set(CollisionRole a, CollisionRole b, InteractionEffect effect) {
    if (!InteractionTraits::effectFitsRoles(effect, a, b)) {
        std::string message = std::format("effect '{}' cannot apply to {} x {}",
                                          InteractionTraits::effectToString(effect),
                                          RoleTraits::collisionRoleToString(a),
                                          RoleTraits::collisionRoleToString(b));
        COLLISION_ERROR(message);
        throw ConfigError(message);
    }
    m_effects[RoleKey(a, b)] = effect;
}

void InteractionTable::erase(CollisionRole a, CollisionRole b) {
    m_effects.erase(RoleKey(a, b));
}

std::optional<InteractionEffect> InteractionTable::find(CollisionRole a, CollisionRole b) const {
    auto it = m_effects.find(RoleKey(a, b));
    if (it == m_effects.end()) {
        return std::nullopt;
    }
    return it->second;
}

InteractionEffect InteractionTable::lookup(CollisionRole a, CollisionRole b) const {
    auto effect = find(a, b);
    if (!effect) {
        throw ContractViolation(std::format("no interaction configured for {} x {}",
                                            RoleTraits::collisionRoleToString(a),
                                            RoleTraits::collisionRoleToString(b)));
    }
    return *effect;
}

std::vector<std::string> InteractionTable::missingPairs() const {
    std::vector<std::string> missing;
    for (size_t i = 0; i < COLLISION_ROLE_COUNT; ++i) {
        for (size_t j = i; j < COLLISION_ROLE_COUNT; ++j) {
            auto a = static_cast<CollisionRole>(i);
            auto b = static_cast<CollisionRole>(j);
            if (m_effects.find(RoleKey(a, b)) == m_effects.end()) {
                missing.push_back(std::format("{} x {}", RoleTraits::collisionRoleToString(a),
                                              RoleTraits::collisionRoleToString(b)));
            }
        }
    }
    return missing;
}

void InteractionTable::validate() const {
    auto missing = missingPairs();
    if (missing.empty()) {
        return;
    }

    std::string list;
    for (const auto& pair : missing) {
        if (!list.empty()) {
            list += ", ";
        }
        list += pair;
    }
    std::string message = std::format("interaction table is missing {} role pair(s): {}",
                                      missing.size(), list);
    COLLISION_ERROR(message);
    throw ConfigError(message);
}

} // namespace KeeperEngine
