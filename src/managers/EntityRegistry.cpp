/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/EntityRegistry.hpp"
#include "core/Logger.hpp"
#include "core/SimulationErrors.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <iterator>
#include <string>

namespace KeeperEngine {

namespace {

bool isFiniteVector(const Vector2D& v) {
    return std::isfinite(v.getX()) && std::isfinite(v.getY());
}

} // anonymous namespace

EntityID EntityRegistry::spawn(const EntitySpec& spec) {
    std::string problem;
    if (!payloadMatchesRole(spec.role, spec.payload)) {
        problem = "payload does not match role";
    } else if (!spec.hitbox.isValid()) {
        problem = "hitbox has non-positive size";
    } else if (!isFiniteVector(spec.position) || !isFiniteVector(spec.velocity)) {
        problem = "non-finite position or velocity";
    } else if (spec.role == EntityRole::Ship && isAlive(m_shipId)) {
        problem = "a ship is already alive";
    }

    if (!problem.empty()) {
        std::string message = std::format("spawn of {} rejected: {}",
                                          RoleTraits::roleToString(spec.role), problem);
        REGISTRY_ERROR(message);
        throw ContractViolation(message);
    }

    EntityRecord record;
    record.id = m_nextId++;
    record.role = spec.role;
    record.position = spec.position;
    record.velocity = spec.velocity;
    record.hitbox = spec.hitbox;
    record.alive = true;
    record.payload = spec.payload;

    if (spec.role == EntityRole::Ship) {
        m_shipId = record.id;
    }

    REGISTRY_DEBUG(std::format("Spawned {} #{} at ({:.1f}, {:.1f})",
                               RoleTraits::roleToString(record.role), record.id,
                               record.position.getX(), record.position.getY()));
    m_entities.push_back(std::move(record));
    return m_entities.back().id;
}

bool EntityRegistry::despawn(EntityID id) {
    EntityRecord* record = find(id);
    if (!record || !record->alive) {
        return false;
    }
    record->alive = false;
    REGISTRY_DEBUG(std::format("Despawned {} #{}", RoleTraits::roleToString(record->role), id));
    return true;
}

size_t EntityRegistry::purgeDead() {
    auto firstDead = std::remove_if(m_entities.begin(), m_entities.end(),
                                    [](const EntityRecord& e) { return !e.alive; });
    size_t removed = static_cast<size_t>(std::distance(firstDead, m_entities.end()));
    m_entities.erase(firstDead, m_entities.end());
    return removed;
}

EntityRecord* EntityRegistry::find(EntityID id) {
    auto it = std::lower_bound(m_entities.begin(), m_entities.end(), id,
                               [](const EntityRecord& e, EntityID value) { return e.id < value; });
    if (it == m_entities.end() || it->id != id) {
        return nullptr;
    }
    return &(*it);
}

const EntityRecord* EntityRegistry::find(EntityID id) const {
    auto it = std::lower_bound(m_entities.begin(), m_entities.end(), id,
                               [](const EntityRecord& e, EntityID value) { return e.id < value; });
    if (it == m_entities.end() || it->id != id) {
        return nullptr;
    }
    return &(*it);
}

bool EntityRegistry::isAlive(EntityID id) const {
    const EntityRecord* record = find(id);
    return record != nullptr && record->alive;
}

std::vector<OverlapPair> EntityRegistry::queryOverlaps() const {
    return computeOverlaps(m_entities);
}

std::vector<OverlapPair> EntityRegistry::computeOverlaps(std::span<const EntityRecord> entities) {
    struct Candidate {
        AABB bounds;
        const EntityRecord* record;
    };

    std::vector<Candidate> candidates;
    candidates.reserve(entities.size());
    for (const auto& record : entities) {
        if (record.alive) {
            candidates.push_back({record.bounds(), &record});
        }
    }

    // Tie-break on id so the sweep order never depends on input order
    std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        if (a.bounds.left() != b.bounds.left()) {
            return a.bounds.left() < b.bounds.left();
        }
        return a.record->id < b.record->id;
    });

    std::vector<OverlapPair> pairs;
    for (size_t i = 0; i < candidates.size(); ++i) {
        const Candidate& a = candidates[i];
        for (size_t j = i + 1; j < candidates.size(); ++j) {
            const Candidate& b = candidates[j];
            if (b.bounds.left() >= a.bounds.right()) {
                break;
            }
            if (!a.bounds.intersects(b.bounds)) {
                continue;
            }
            if (hitboxesOverlap(a.record->hitbox, a.record->position,
                                b.record->hitbox, b.record->position)) {
                pairs.emplace_back(a.record->id, b.record->id);
            }
        }
    }

    std::sort(pairs.begin(), pairs.end());
    return pairs;
}

void EntityRegistry::integrate(float deltaTime) {
    for (auto& record : m_entities) {
        if (record.alive) {
            record.position += record.velocity * deltaTime;
        }
    }
}

size_t EntityRegistry::despawnOutOfBounds(const AABB& keepRegion) {
    size_t count = 0;
    for (auto& record : m_entities) {
        if (!record.alive || record.role == EntityRole::Ship) {
            continue;
        }
        AABB bounds = record.bounds();
        bool outside = bounds.right() < keepRegion.left() || bounds.left() > keepRegion.right() ||
                       bounds.bottom() < keepRegion.top() || bounds.top() > keepRegion.bottom();
        if (outside) {
            record.alive = false;
            ++count;
        }
    }
    if (count > 0) {
        REGISTRY_DEBUG(std::format("Despawned {} out-of-bounds entities", count));
    }
    return count;
}

void EntityRegistry::clear() {
    m_entities.clear();
    m_shipId = INVALID_ENTITY_ID;
}

size_t EntityRegistry::aliveCount() const {
    return static_cast<size_t>(std::count_if(m_entities.begin(), m_entities.end(),
                                             [](const EntityRecord& e) { return e.alive; }));
}

} // namespace KeeperEngine
