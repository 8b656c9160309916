/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/world/BoundingBoxController.hpp"
#include "core/Logger.hpp"
#include "core/SimulationErrors.hpp"
#include "managers/EntityRegistry.hpp"

#include <algorithm>
#include <format>
#include <string>

namespace KeeperEngine {

BoundingBoxController::BoundingBoxController(const Config& config) : m_config(config) {
    if (!m_config.isValid()) {
        std::string message = std::format("bounding box {}x{} advancing {} per tick is invalid",
                                          m_config.width, m_config.height,
                                          m_config.advancePerTick);
        BOUNDS_ERROR(message);
        throw ConfigError(message);
    }
}

void BoundingBoxController::reset(float anchor, EntityID shipId) {
    m_scroll = std::min(anchor, m_scrollLimit);
    m_shipId = shipId;
    m_paused = false;
    m_holdAtLimit = false;
    BOUNDS_DEBUG(std::format("Box reset at {:.1f} for ship #{}", m_scroll, shipId));
}

float BoundingBoxController::advance() {
    if (m_paused || m_scroll >= m_scrollLimit) {
        return 0.0f;
    }
    float next = std::min(m_scroll + m_config.advancePerTick, m_scrollLimit);
    float moved = next - m_scroll;
    m_scroll = next;
    return moved;
}

BoundingBoxController::ClampResult BoundingBoxController::update(EntityRegistry& registry,
                                                                 const InputIntent& intent) {
    float moved = advance();

    // Carry the ship with the box when the player is not steering along x
    EntityRecord* ship = registry.find(m_shipId);
    if (ship && ship->alive && intent.movement.getX() == 0.0f && moved > 0.0f) {
        ship->position.setX(ship->position.getX() + moved);
    }

    ClampResult result = clampShip(registry);
    result.advanced = moved;
    return result;
}

BoundingBoxController::ClampResult BoundingBoxController::clampShip(EntityRegistry& registry) const {
    ClampResult result;
    EntityRecord* ship = registry.find(m_shipId);
    if (!ship || !ship->alive) {
        return result;
    }

    float maxX = std::max(m_scroll, std::min(m_scroll + m_config.width, m_scrollLimit));
    float minX = m_holdAtLimit ? maxX : m_scroll;
    float x = ship->position.getX();
    float y = ship->position.getY();

    float clampedX = std::clamp(x, minX, maxX);
    float clampedY = std::clamp(y, 0.0f, m_config.height);

    result.pushedByTrailingEdge = x < m_scroll;
    result.clamped = (clampedX != x) || (clampedY != y);
    if (result.clamped) {
        ship->position = Vector2D(clampedX, clampedY);
    }
    return result;
}

AABB BoundingBoxController::getBounds() const {
    return AABB::fromCorner(m_scroll, 0.0f, m_config.width, m_config.height);
}

} // namespace KeeperEngine
