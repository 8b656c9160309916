/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/LevelProgression.hpp"
#include "controllers/world/BoundingBoxController.hpp"
#include "core/Logger.hpp"
#include "core/SimulationErrors.hpp"
#include "events/EventBus.hpp"
#include "managers/EntityRegistry.hpp"

#include <algorithm>
#include <format>

namespace KeeperEngine {

const char* levelStateToString(LevelState state) noexcept {
    switch (state) {
        case LevelState::Running: return "Running";
        case LevelState::Won:     return "Won";
        case LevelState::Lost:    return "Lost";
        default:                  return "Unknown";
    }
}

namespace {

const LevelDefinition& validated(const LevelDefinition& level) {
    level.validate();
    return level;
}

} // anonymous namespace

LevelProgression::LevelProgression(const LevelDefinition& level)
    : m_level(validated(level)), m_ledger(m_level.constants.ledger) {
    std::stable_sort(m_level.walls.begin(), m_level.walls.end(),
                     [](const WallDefinition& a, const WallDefinition& b) { return a.x < b.x; });
    resetTo(0);
}

void LevelProgression::restart() {
    resetTo(0);
    LEVEL_INFO(std::format("Level '{}' restarted", m_level.name));
}

void LevelProgression::skipToSegment(size_t index) {
    if (index >= m_level.segments.size()) {
        std::string message = std::format("level '{}' has no segment {} ({} segments)",
                                          m_level.name, index, m_level.segments.size());
        LEVEL_ERROR(message);
        throw ContractViolation(message);
    }
    resetTo(index);
    LEVEL_INFO(std::format("Skipped to segment {} '{}' at scroll {:.0f} (dark matter {:.1f})",
                           index, m_level.segments[index].name, m_level.segmentStart(index),
                           m_ledger.getDarkMatter()));
}

void LevelProgression::resetTo(size_t segment) {
    m_ledger.reset();
    const auto& startDarkMatter = m_level.segments[segment].startDarkMatter;
    if (startDarkMatter && *startDarkMatter > m_ledger.getDarkMatter()) {
        m_ledger.credit(*startDarkMatter - m_ledger.getDarkMatter());
    }

    m_state = LevelState::Running;
    m_currentSegment = segment;
    m_finishReached = false;
    m_finishHeld = false;
    m_lossReason.clear();

    m_rng.seed(m_level.seed + static_cast<uint32_t>(segment));
    buildSchedule(segment);

    // Walls that end before the segment start are already out of view
    const float start = m_level.segmentStart(segment);
    m_nextWall = 0;
    while (m_nextWall < m_level.walls.size() &&
           m_level.walls[m_nextWall].x + m_level.walls[m_nextWall].width < start) {
        ++m_nextWall;
    }
}

void LevelProgression::buildSchedule(size_t firstSegment) {
    m_schedule.clear();
    m_nextSpawn = 0;

    std::uniform_real_distribution<float> unit(0.0f, 1.0f);
    for (size_t k = firstSegment; k < m_level.segments.size(); ++k) {
        const float start = m_level.segmentStart(k);
        const float length = m_level.segments[k].length;

        for (const SpawnEntry& entry : m_level.effectiveSpawnTable(k)) {
            for (int i = 0; i < entry.count; ++i) {
                const float fraction = static_cast<float>(i) / static_cast<float>(entry.count);
                float offset = 0.0f;
                switch (entry.distribution) {
                    case SpawnDistribution::Even:
                        offset = length * (static_cast<float>(i) + 0.5f) /
                                 static_cast<float>(entry.count);
                        break;
                    case SpawnDistribution::Clustered:
                        offset = length * entry.clusterSpan * fraction;
                        break;
                    case SpawnDistribution::Random:
                        offset = length * unit(m_rng);
                        break;
                }

                ScheduledSpawn spawn;
                spawn.trigger = start + std::min(offset, length);
                spawn.type = entry.type;
                spawn.lane = entry.laneMin + (entry.laneMax - entry.laneMin) * unit(m_rng);
                spawn.segment = k;
                m_schedule.push_back(spawn);
            }
        }
    }

    std::stable_sort(m_schedule.begin(), m_schedule.end(),
                     [](const ScheduledSpawn& a, const ScheduledSpawn& b) {
                         return a.trigger < b.trigger;
                     });
    LEVEL_DEBUG(std::format("Scheduled {} spawns from segment {}", m_schedule.size(), firstSegment));
}

EntitySpec LevelProgression::specFor(const ScheduledSpawn& spawn) const {
    const GameConstants& c = m_level.constants;
    EntitySpec spec;
    spec.position = Vector2D(spawn.trigger + c.box.width, spawn.lane * c.box.height);

    if (SpawnTraits::isHazard(spawn.type)) {
        const HazardKind kind = SpawnTraits::hazardKindOf(spawn.type);
        const HazardDefinition& hazard = c.hazards.at(kind);
        spec.role = EntityRole::Hazard;
        spec.velocity = hazard.velocity;
        spec.hitbox = hazard.hitbox;

        HazardPayload payload;
        payload.kind = kind;
        payload.contactDamage = hazard.contactDamage;
        payload.health = hazard.health;
        payload.destroyedOnContact = hazard.destroyedOnContact;
        payload.cannon = hazard.cannon;
        payload.fireCooldown = hazard.cannon ? hazard.cannon->interval : 0.0f;
        spec.payload = std::move(payload);
    } else {
        const PickupKind kind = SpawnTraits::pickupKindOf(spawn.type);
        const PickupDefinition& pickup = c.pickups.at(kind);
        spec.role = EntityRole::Pickup;
        spec.velocity = pickup.velocity;
        spec.hitbox = pickup.hitbox;
        spec.payload = PickupPayload{kind, pickup.amount};
    }
    return spec;
}

size_t LevelProgression::spawnDue(float scroll, EntityRegistry& registry) {
    size_t created = 0;
    while (m_nextSpawn < m_schedule.size() && m_schedule[m_nextSpawn].trigger <= scroll) {
        registry.spawn(specFor(m_schedule[m_nextSpawn]));
        ++m_nextSpawn;
        ++created;
    }

    const float leadingEdge = scroll + m_level.constants.box.width;
    while (m_nextWall < m_level.walls.size() && m_level.walls[m_nextWall].x <= leadingEdge) {
        const WallDefinition& wall = m_level.walls[m_nextWall];
        EntitySpec spec;
        spec.role = EntityRole::Wall;
        spec.position = wall.bounds().center;
        spec.hitbox = Hitbox::box(wall.width, wall.height);
        spec.payload = WallPayload{};
        registry.spawn(spec);
        ++m_nextWall;
        ++created;
    }
    return created;
}

float LevelProgression::getRequiredDarkMatter() const {
    return m_level.segments.back().minimumDarkMatter;
}

void LevelProgression::finish(LevelState outcome, const std::string& reason, EventBus& events) {
    m_state = outcome;
    m_finishHeld = false;

    SimulationEvent event;
    event.type = outcome == LevelState::Won ? SimulationEventType::LevelWon
                                            : SimulationEventType::LevelLost;
    event.amount = m_ledger.getDarkMatter();
    event.segment = static_cast<int>(m_currentSegment);
    event.detail = reason;
    events.publish(std::move(event));

    if (outcome == LevelState::Lost) {
        m_lossReason = reason;
        LEVEL_INFO(std::format("Level '{}' lost in segment {}: {}", m_level.name,
                               m_currentSegment, reason));
    } else {
        LEVEL_INFO(std::format("Level '{}' won with {:.1f} dark matter", m_level.name,
                               m_ledger.getDarkMatter()));
    }
}

ProgressionReport LevelProgression::evaluate(const ProgressionInput& input, float scroll,
                                             BoundingBoxController& box, EventBus& events) {
    ProgressionReport report;
    report.state = m_state;
    if (m_state != LevelState::Running) {
        return report;
    }

    if (input.lethalHit || !input.shipAlive) {
        finish(LevelState::Lost, "destroyed", events);
    } else if (input.squashed) {
        finish(LevelState::Lost, "squashed", events);
    }
    if (m_state != LevelState::Running) {
        box.setPaused(true);
        report.state = m_state;
        report.stateChanged = true;
        return report;
    }

    const size_t segment = m_level.segmentAt(scroll);
    while (m_currentSegment < segment) {
        ++m_currentSegment;
        report.segmentChanged = true;

        SimulationEvent event;
        event.type = SimulationEventType::SegmentEntered;
        event.segment = static_cast<int>(m_currentSegment);
        event.detail = m_level.segments[m_currentSegment].name;
        events.publish(std::move(event));
        LEVEL_INFO(std::format("Entered segment {} '{}'", m_currentSegment,
                               m_level.segments[m_currentSegment].name));
    }

    if (input.shipX >= m_level.finishPosition()) {
        m_finishReached = true;
    }
    if (m_finishReached) {
        if (m_ledger.getDarkMatter() >= getRequiredDarkMatter()) {
            finish(LevelState::Won, "finish reached", events);
            box.setPaused(true);
            report.state = m_state;
            report.stateChanged = true;
            return report;
        }

        box.setPaused(true);
        box.holdAtLimit();
        if (!m_finishHeld) {
            m_finishHeld = true;
            SimulationEvent event;
            event.type = SimulationEventType::FinishBlocked;
            event.amount = getRequiredDarkMatter() - m_ledger.getDarkMatter();
            event.segment = static_cast<int>(m_currentSegment);
            events.publish(std::move(event));
            LEVEL_INFO(std::format("Finish held: {:.1f} dark matter of {:.1f} required",
                                   m_ledger.getDarkMatter(), getRequiredDarkMatter()));
        }
    }

    report.state = m_state;
    report.finishHeld = m_finishHeld;
    return report;
}

} // namespace KeeperEngine
