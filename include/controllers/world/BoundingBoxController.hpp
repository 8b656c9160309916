/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BOUNDING_BOX_CONTROLLER_HPP
#define BOUNDING_BOX_CONTROLLER_HPP

/**
 * @file BoundingBoxController.hpp
 * @brief Camera-synchronized box that forces the ship along the scroll axis
 *
 * The box anchor s only moves forward, by advancePerTick each tick unless
 * paused or already at the scroll limit (the level's Finish). The ship is
 * referenced by id; the registry owns it.
 */

#include "collisions/AABB.hpp"
#include "core/InputIntent.hpp"
#include "entities/EntityRecord.hpp"
#include <limits>

namespace KeeperEngine {

class EntityRegistry;

class BoundingBoxController {
public:
    struct Config {
        float width{800.0f};
        float height{600.0f};
        float advancePerTick{1.0f};

        bool isValid() const {
            return width > 0.0f && height > 0.0f && advancePerTick > 0.0f;
        }
    };

    struct ClampResult {
        float advanced{0.0f};              // distance the box moved this tick
        bool clamped{false};               // ship position was changed by the clamp
        bool pushedByTrailingEdge{false};  // ship was behind s and got carried forward
    };

    /**
     * @throws ConfigError if @p config is invalid
     */
    explicit BoundingBoxController(const Config& config);

    /**
     * @brief Places the box at @p anchor and binds it to @p shipId
     */
    void reset(float anchor, EntityID shipId);

    /**
     * @brief One tick: advance the box, carry the ship when it has no forward
     * input, then clamp it inside the box
     */
    ClampResult update(EntityRegistry& registry, const InputIntent& intent);

    /**
     * @brief Clamps the ship to [s, min(s+width, limit)] x [0, height], or
     * pins its x at the limit while held there.
     * Idempotent; a missing or dead ship is left alone.
     */
    ClampResult clampShip(EntityRegistry& registry) const;

    void setPaused(bool paused) { m_paused = paused; }
    bool isPaused() const { return m_paused; }

    /// Keeps the ship at the scroll limit until reset()
    void holdAtLimit() { m_holdAtLimit = true; }
    bool isHoldingAtLimit() const { return m_holdAtLimit; }

    void setScrollLimit(float limit) { m_scrollLimit = limit; }
    float getScrollLimit() const { return m_scrollLimit; }

    float getScroll() const { return m_scroll; }
    AABB getBounds() const;
    EntityID getShipId() const { return m_shipId; }
    const Config& getConfig() const { return m_config; }

private:
    float advance();

    Config m_config;
    float m_scroll{0.0f};
    float m_scrollLimit{std::numeric_limits<float>::max()};
    bool m_paused{false};
    bool m_holdAtLimit{false};
    EntityID m_shipId{INVALID_ENTITY_ID};
};

} // namespace KeeperEngine

#endif // BOUNDING_BOX_CONTROLLER_HPP
