/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_ROLE_HPP
#define ENTITY_ROLE_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace KeeperEngine {

/**
 * @brief Role tag of a simulation entity
 *
 * Every entity carries exactly one role; the role decides which payload
 * alternative the entity record holds.
 */
enum class EntityRole : uint8_t {
    Ship = 0,
    Hazard = 1,
    Pickup = 2,
    Projectile = 3,
    Wall = 4,
    COUNT
};

enum class HazardKind : uint8_t {
    Droid = 0,
    Refexa = 1,
    Gummbumm = 2,
    Goat = 3,
    AntimatterJet = 4,
    SnakeSegment = 5,
    COUNT
};

enum class PickupKind : uint8_t {
    BlueBottle = 0, // credits dark matter
    RedBottle = 1,  // drains dark matter
    COUNT
};

enum class ProjectileKind : uint8_t {
    FriendlyBullet = 0,
    FriendlyLaser = 1,
    EnemyBullet = 2,
    EnemyLaser = 3,
    COUNT
};

enum class WeaponType : uint8_t {
    Bullet = 0,
    Laser = 1,
    COUNT
};

/**
 * @brief Role as seen by the interaction table
 *
 * Finer than EntityRole where the effect differs: pickups split by colour and
 * projectiles split by side.
 */
enum class CollisionRole : uint8_t {
    Ship = 0,
    Hazard = 1,
    BluePickup = 2,
    RedPickup = 3,
    FriendlyProjectile = 4,
    EnemyProjectile = 5,
    Wall = 6,
    COUNT
};

inline constexpr size_t COLLISION_ROLE_COUNT = static_cast<size_t>(CollisionRole::COUNT);

/**
 * @brief Type trait helpers for roles and kinds
 */
namespace RoleTraits {

constexpr bool isFriendly(ProjectileKind kind) noexcept {
    return kind == ProjectileKind::FriendlyBullet || kind == ProjectileKind::FriendlyLaser;
}

constexpr ProjectileKind friendlyProjectileFor(WeaponType weapon) noexcept {
    return weapon == WeaponType::Laser ? ProjectileKind::FriendlyLaser
                                       : ProjectileKind::FriendlyBullet;
}

/// Returns true if an entity of this role is removed when it takes part in an effect
constexpr bool isConsumable(CollisionRole role) noexcept {
    return role == CollisionRole::BluePickup || role == CollisionRole::RedPickup ||
           role == CollisionRole::FriendlyProjectile ||
           role == CollisionRole::EnemyProjectile;
}

constexpr const char* roleToString(EntityRole role) noexcept {
    switch (role) {
        case EntityRole::Ship:       return "Ship";
        case EntityRole::Hazard:     return "Hazard";
        case EntityRole::Pickup:     return "Pickup";
        case EntityRole::Projectile: return "Projectile";
        case EntityRole::Wall:       return "Wall";
        default:                     return "Unknown";
    }
}

constexpr const char* collisionRoleToString(CollisionRole role) noexcept {
    switch (role) {
        case CollisionRole::Ship:               return "ship";
        case CollisionRole::Hazard:             return "hazard";
        case CollisionRole::BluePickup:         return "bluePickup";
        case CollisionRole::RedPickup:          return "redPickup";
        case CollisionRole::FriendlyProjectile: return "friendlyProjectile";
        case CollisionRole::EnemyProjectile:    return "enemyProjectile";
        case CollisionRole::Wall:               return "wall";
        default:                                return "unknown";
    }
}

constexpr const char* hazardToString(HazardKind kind) noexcept {
    switch (kind) {
        case HazardKind::Droid:         return "droid";
        case HazardKind::Refexa:        return "refexa";
        case HazardKind::Gummbumm:      return "gummbumm";
        case HazardKind::Goat:          return "goat";
        case HazardKind::AntimatterJet: return "antimatterJet";
        case HazardKind::SnakeSegment:  return "snakeSegment";
        default:                        return "unknown";
    }
}

constexpr const char* pickupToString(PickupKind kind) noexcept {
    switch (kind) {
        case PickupKind::BlueBottle: return "blueBottle";
        case PickupKind::RedBottle:  return "redBottle";
        default:                     return "unknown";
    }
}

constexpr const char* projectileToString(ProjectileKind kind) noexcept {
    switch (kind) {
        case ProjectileKind::FriendlyBullet: return "friendlyBullet";
        case ProjectileKind::FriendlyLaser:  return "friendlyLaser";
        case ProjectileKind::EnemyBullet:    return "enemyBullet";
        case ProjectileKind::EnemyLaser:     return "enemyLaser";
        default:                             return "unknown";
    }
}

constexpr const char* weaponToString(WeaponType weapon) noexcept {
    return weapon == WeaponType::Laser ? "laser" : "bullet";
}

inline std::optional<CollisionRole> collisionRoleFromString(std::string_view name) {
    for (size_t i = 0; i < COLLISION_ROLE_COUNT; ++i) {
        auto role = static_cast<CollisionRole>(i);
        if (name == collisionRoleToString(role)) {
            return role;
        }
    }
    return std::nullopt;
}

inline std::optional<HazardKind> hazardFromString(std::string_view name) {
    for (size_t i = 0; i < static_cast<size_t>(HazardKind::COUNT); ++i) {
        auto kind = static_cast<HazardKind>(i);
        if (name == hazardToString(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

inline std::optional<PickupKind> pickupFromString(std::string_view name) {
    if (name == "blueBottle") return PickupKind::BlueBottle;
    if (name == "redBottle") return PickupKind::RedBottle;
    return std::nullopt;
}

inline std::optional<ProjectileKind> projectileFromString(std::string_view name) {
    for (size_t i = 0; i < static_cast<size_t>(ProjectileKind::COUNT); ++i) {
        auto kind = static_cast<ProjectileKind>(i);
        if (name == projectileToString(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

inline std::optional<WeaponType> weaponFromString(std::string_view name) {
    if (name == "bullet") return WeaponType::Bullet;
    if (name == "laser") return WeaponType::Laser;
    return std::nullopt;
}

} // namespace RoleTraits

} // namespace KeeperEngine

#endif // ENTITY_ROLE_HPP
