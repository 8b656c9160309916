/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_RECORD_HPP
#define ENTITY_RECORD_HPP

#include "collisions/Hitbox.hpp"
#include "entities/EntityRole.hpp"
#include "utils/Vector2D.hpp"
#include "world/ArmamentDefinition.hpp"
#include <cstdint>
#include <optional>
#include <variant>

namespace KeeperEngine {

using EntityID = uint64_t;
inline constexpr EntityID INVALID_ENTITY_ID = 0;

struct ShipPayload {
    WeaponType selectedWeapon{WeaponType::Bullet};
    float fireCooldown{0.0f}; // seconds until the next volley may fire
};

struct HazardPayload {
    HazardKind kind{HazardKind::Droid};
    float contactDamage{0.0f};
    float health{1.0f};
    bool destroyedOnContact{false};
    std::optional<CannonDefinition> cannon;
    float fireCooldown{0.0f};
};

struct PickupPayload {
    PickupKind kind{PickupKind::BlueBottle};
    float amount{0.0f}; // restore (blue) or drain (red)
};

struct ProjectilePayload {
    ProjectileKind kind{ProjectileKind::FriendlyBullet};
    EntityID ownerId{INVALID_ENTITY_ID};
    float damage{0.0f};
};

struct WallPayload {};

using EntityPayload = std::variant<ShipPayload, HazardPayload, PickupPayload,
                                   ProjectilePayload, WallPayload>;

/**
 * @brief Everything needed to create an entity; the registry assigns the id
 */
struct EntitySpec {
    EntityRole role{EntityRole::Hazard};
    Vector2D position;
    Vector2D velocity;
    Hitbox hitbox;
    EntityPayload payload{HazardPayload{}};
};

/**
 * @brief Tagged-variant entity owned by the EntityRegistry
 */
struct EntityRecord {
    EntityID id{INVALID_ENTITY_ID};
    EntityRole role{EntityRole::Hazard};
    Vector2D position;
    Vector2D velocity;
    Hitbox hitbox;
    bool alive{true};
    EntityPayload payload{HazardPayload{}};

    template <typename T>
    T* payloadAs() { return std::get_if<T>(&payload); }

    template <typename T>
    const T* payloadAs() const { return std::get_if<T>(&payload); }

    AABB bounds() const { return hitbox.boundsAt(position); }

    CollisionRole collisionRole() const;
};

/// True if the payload alternative is the one the role requires
bool payloadMatchesRole(EntityRole role, const EntityPayload& payload);

} // namespace KeeperEngine

#endif // ENTITY_RECORD_HPP
