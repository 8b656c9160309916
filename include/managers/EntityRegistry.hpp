/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_REGISTRY_HPP
#define ENTITY_REGISTRY_HPP

/**
 * @file EntityRegistry.hpp
 * @brief Owner of every live simulation entity (ship, hazards, pickups,
 * projectiles, walls)
 *
 * Records are stored contiguously in ascending id order. Ids are never reused,
 * so a despawned id can never come back.
 *
 * LIFECYCLE CONTRACT:
 * - despawn() only clears the alive flag; the record stays in storage until
 *   purgeDead(), which the simulation calls at the start of every tick.
 * - Dead records are invisible to forEachAlive() and queryOverlaps().
 * - Pointers returned by find() are invalidated by spawn() and purgeDead().
 */

#include "collisions/AABB.hpp"
#include "collisions/OverlapPair.hpp"
#include "entities/EntityRecord.hpp"
#include <cstddef>
#include <ranges>
#include <span>
#include <vector>

namespace KeeperEngine {

class EntityRegistry {
public:
    EntityRegistry() = default;

    /**
     * @brief Creates an entity from @p spec
     * @return the new entity's id
     * @throws ContractViolation if the payload does not match the role, the
     *         hitbox is invalid, or a second ship is requested
     */
    EntityID spawn(const EntitySpec& spec);

    /**
     * @brief Marks an entity dead. Idempotent.
     * @return true if the entity was alive before the call
     */
    bool despawn(EntityID id);

    /**
     * @brief Drops dead records from storage
     * @return number of records removed
     */
    size_t purgeDead();

    EntityRecord* find(EntityID id);
    const EntityRecord* find(EntityID id) const;
    bool isAlive(EntityID id) const;

    /**
     * @brief Lazy view over alive entities matching @p pred, in id order
     */
    template <typename Pred>
    auto forEachAlive(Pred pred) {
        return m_entities | std::views::filter([pred](const EntityRecord& e) {
                   return e.alive && pred(e);
               });
    }

    template <typename Pred>
    auto forEachAlive(Pred pred) const {
        return m_entities | std::views::filter([pred](const EntityRecord& e) {
                   return e.alive && pred(e);
               });
    }

    auto forEachAlive() {
        return forEachAlive([](const EntityRecord&) { return true; });
    }

    auto forEachAlive() const {
        return forEachAlive([](const EntityRecord&) { return true; });
    }

    /**
     * @brief Alive pairs whose hitboxes intersect at the current positions,
     * sorted by (lower id, higher id)
     */
    std::vector<OverlapPair> queryOverlaps() const;

    /**
     * @brief Sweep-and-prune on the scroll axis followed by the narrow phase.
     *
     * The result depends only on the records' positions and shapes, never on
     * their order in @p entities.
     */
    static std::vector<OverlapPair> computeOverlaps(std::span<const EntityRecord> entities);

    /// position += velocity * dt for every alive entity
    void integrate(float deltaTime);

    /**
     * @brief Despawns alive non-ship entities entirely outside @p keepRegion
     * @return number of entities despawned
     */
    size_t despawnOutOfBounds(const AABB& keepRegion);

    void clear();

    EntityID getShipId() const { return m_shipId; }
    EntityRecord* getShip() { return find(m_shipId); }
    const EntityRecord* getShip() const { return find(m_shipId); }

    size_t size() const { return m_entities.size(); }
    size_t aliveCount() const;
    std::span<const EntityRecord> records() const { return m_entities; }

private:
    std::vector<EntityRecord> m_entities; // ascending id
    EntityID m_nextId{1};
    EntityID m_shipId{INVALID_ENTITY_ID};
};

} // namespace KeeperEngine

#endif // ENTITY_REGISTRY_HPP
