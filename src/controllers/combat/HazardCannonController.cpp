/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/combat/HazardCannonController.hpp"
#include "core/Logger.hpp"
#include "managers/EntityRegistry.hpp"

#include <format>
#include <vector>

namespace KeeperEngine {

size_t HazardCannonController::update(EntityRegistry& registry, const AABB& boxBounds,
                                      float deltaTime) {
    std::vector<EntitySpec> shots;

    auto armed = registry.forEachAlive([](const EntityRecord& e) {
        if (e.role != EntityRole::Hazard) {
            return false;
        }
        const auto* hazard = e.payloadAs<HazardPayload>();
        return hazard != nullptr && hazard->cannon.has_value();
    });

    for (EntityRecord& record : armed) {
        if (!boxBounds.contains(record.position)) {
            continue;
        }
        auto* hazard = record.payloadAs<HazardPayload>();
        hazard->fireCooldown -= deltaTime;
        if (hazard->fireCooldown > 0.0f) {
            continue;
        }

        const CannonDefinition& cannon = *hazard->cannon;
        hazard->fireCooldown = cannon.interval;
        for (const auto& heading : cannon.headings) {
            EntitySpec spec;
            spec.role = EntityRole::Projectile;
            spec.position = record.position;
            spec.velocity = heading.normalized() * cannon.speed;
            spec.hitbox = Hitbox::circle(cannon.radius);
            spec.payload = ProjectilePayload{cannon.projectile, record.id, cannon.damage};
            shots.push_back(std::move(spec));
        }
        CANNON_DEBUG(std::format("{} #{} fired {} shot(s)",
                                 RoleTraits::hazardToString(hazard->kind), record.id,
                                 cannon.headings.size()));
    }

    // Spawn after iteration; spawning reallocates registry storage
    for (const auto& spec : shots) {
        registry.spawn(spec);
    }
    return shots.size();
}

} // namespace KeeperEngine
