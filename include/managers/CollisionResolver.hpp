/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef COLLISION_RESOLVER_HPP
#define COLLISION_RESOLVER_HPP

/**
 * @file CollisionResolver.hpp
 * @brief Turns the registry's overlap set into ledger and lifecycle effects
 *
 * Per tick:
 * 1. The overlap set is computed from current positions before any effect.
 * 2. Effects are applied pair by pair in (lower id, higher id) order.
 * 3. An entity consumed or killed by an earlier pair is skipped by every
 *    later pair of the same tick.
 *
 * Ship damage always goes through ResourceLedger::applyShipDamage so the
 * shield and dark matter never disagree within a tick. Contacts between two
 * surviving entities (ship x hazard, ship x wall) only take effect on the
 * first tick of the contact.
 */

#include "collisions/InteractionTable.hpp"
#include "collisions/OverlapPair.hpp"
#include "entities/EntityRecord.hpp"
#include <boost/container/flat_set.hpp>
#include <boost/container/small_vector.hpp>
#include <cstddef>
#include <vector>

namespace KeeperEngine {

class EntityRegistry;
class ResourceLedger;
class EventBus;

struct ResolutionReport {
    size_t pairsExamined{0};
    size_t effectsApplied{0};
    size_t pairsSkipped{0};        // consumed-this-tick guard or debounce
    bool shipDamaged{false};
    bool lethalHit{false};         // ship took unabsorbed damage at 0 dark matter
    std::vector<EntityID> destroyed;
    boost::container::small_vector<EntityID, 4> shipWallContacts; // distinct walls touching the ship
};

class CollisionResolver {
public:
    /**
     * @throws ConfigError if @p table is not exhaustive
     */
    CollisionResolver(InteractionTable table, float wallContactDamage);

    ResolutionReport resolve(EntityRegistry& registry, ResourceLedger& ledger, EventBus& events);

    /// Forgets contacts carried over from the previous tick
    void reset() { m_previousContacts.clear(); }

    const InteractionTable& getTable() const { return m_table; }
    float getWallContactDamage() const { return m_wallContactDamage; }

private:
    struct TickState;

    void applyShipDamage(EntityRecord& ship, const EntityRecord& source, float amount,
                         TickState& state);
    void destroy(EntityRecord& record, TickState& state);

    InteractionTable m_table;
    float m_wallContactDamage{0.0f};
    boost::container::flat_set<OverlapPair> m_previousContacts;
};

} // namespace KeeperEngine

#endif // COLLISION_RESOLVER_HPP
