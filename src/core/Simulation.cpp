/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/Simulation.hpp"
#include "core/Logger.hpp"

#include <format>
#include <utility>

namespace KeeperEngine {

namespace {

BoundingBoxController::Config boxConfigFor(const LevelDefinition& level) {
    const BoxDefinition& box = level.constants.box;
    return BoundingBoxController::Config{box.width, box.height, box.advancePerTick};
}

} // anonymous namespace

Simulation::Systems::Systems(const LevelDefinition& level)
    : progression(level)
    , resolver(level.interactions, level.constants.wallContactDamage)
    , box(boxConfigFor(level))
    , ship(level.constants.ship, level.constants.weapons) {}

Simulation::Simulation(const LevelDefinition& level)
    : m_systems(std::make_unique<Systems>(level)) {
    m_tickSeconds = getLevel().constants.tickSeconds();
    attachLedger();
    resetWorld(0.0f);
    SIMULATION_INFO(std::format("Level '{}' ready: {} segments, finish at {:.0f}",
                                getLevel().name, getLevel().segments.size(),
                                getLevel().finishPosition()));
}

void Simulation::loadLevel(const LevelDefinition& level) {
    // Built aside first so a rejected level leaves the current one intact
    auto systems = std::make_unique<Systems>(level);
    m_systems = std::move(systems);
    m_tickSeconds = getLevel().constants.tickSeconds();
    attachLedger();
    resetWorld(0.0f);
    SIMULATION_INFO(std::format("Loaded level '{}'", getLevel().name));
}

void Simulation::restart() {
    m_systems->progression.restart();
    resetWorld(0.0f);
}

void Simulation::skipToSegment(size_t index) {
    m_systems->progression.skipToSegment(index);
    resetWorld(getLevel().segmentStart(index));
}

void Simulation::attachLedger() {
    m_systems->progression.getLedger().setDepletionListener([this](DebitReason reason) {
        SimulationEvent event;
        event.type = SimulationEventType::Depletion;
        event.entity = m_registry.getShipId();
        event.role = EntityRole::Ship;
        if (const EntityRecord* ship = m_registry.getShip()) {
            event.position = ship->position;
        }
        event.detail = debitReasonToString(reason);
        m_events.publish(std::move(event));
    });
}

void Simulation::resetWorld(float anchor) {
    m_tick = 0;
    m_events.beginFrame(m_tick);
    m_registry.clear();
    m_systems->resolver.reset();

    const LevelDefinition& level = getLevel();
    const ShipDefinition& shipDef = level.constants.ship;

    EntitySpec ship;
    ship.role = EntityRole::Ship;
    ship.position = Vector2D(anchor + shipDef.start.getX(), shipDef.start.getY());
    ship.hitbox = shipDef.hitbox;
    ship.payload = ShipPayload{};
    EntityID shipId = m_registry.spawn(ship);

    BoundingBoxController& box = m_systems->box;
    box.setScrollLimit(level.finishPosition());
    box.reset(anchor, shipId);
    box.clampShip(m_registry);

    buildSnapshot();
    SIMULATION_DEBUG(std::format("World reset at scroll {:.0f}, ship {}", anchor, shipId));
}

AABB Simulation::keepRegion() const {
    const GameConstants& c = getLevel().constants;
    const AABB view = m_systems->box.getBounds();
    return AABB::fromCorner(view.left() - c.despawnMarginBehind,
                            view.top() - c.despawnMarginBehind,
                            view.width() + c.despawnMarginBehind + c.despawnMarginAhead,
                            view.height() + 2.0f * c.despawnMarginBehind);
}

const SimulationSnapshot& Simulation::tick(const InputIntent& intent) {
    if (m_paused || isFinished()) {
        return m_snapshot;
    }

    Systems& sys = *m_systems;
    ResourceLedger& ledger = sys.progression.getLedger();

    ++m_tick;
    m_events.beginFrame(m_tick);
    m_registry.purgeDead();

    sys.progression.spawnDue(sys.box.getScroll(), m_registry);

    sys.ship.applyIntent(m_registry, ledger, m_events, intent, m_tickSeconds);
    sys.cannons.update(m_registry, sys.box.getBounds(), m_tickSeconds);
    ledger.rechargeShield(m_tickSeconds);

    m_registry.integrate(m_tickSeconds);
    ResolutionReport resolution = sys.resolver.resolve(m_registry, ledger, m_events);

    BoundingBoxController::ClampResult clamp = sys.box.update(m_registry, intent);
    size_t culled = m_registry.despawnOutOfBounds(keepRegion());
    if (culled > 0) {
        SIMULATION_DEBUG(std::format("Tick {}: {} entities left the play area", m_tick, culled));
    }

    const EntityRecord* ship = m_registry.getShip();
    ProgressionInput input;
    input.shipAlive = ship != nullptr && ship->alive;
    input.shipX = input.shipAlive ? ship->position.getX() : 0.0f;
    input.lethalHit = resolution.lethalHit;
    input.squashed = input.shipAlive && clamp.pushedByTrailingEdge &&
                     resolution.shipWallContacts.size() >= 2;

    if (input.squashed) {
        SimulationEvent event;
        event.type = SimulationEventType::EntityDestroyed;
        event.entity = ship->id;
        event.role = EntityRole::Ship;
        event.position = ship->position;
        event.detail = "squashed";
        m_registry.despawn(event.entity);
        m_events.publish(std::move(event));
    }

    sys.progression.evaluate(input, sys.box.getScroll(), sys.box, m_events);

    buildSnapshot();
    return m_snapshot;
}

void Simulation::buildSnapshot() {
    const LevelProgression& progression = m_systems->progression;
    const ResourceLedger& ledger = progression.getLedger();

    m_snapshot.tick = m_tick;
    m_snapshot.state = progression.getState();
    m_snapshot.scroll = m_systems->box.getScroll();
    m_snapshot.segmentIndex = progression.getCurrentSegment();
    m_snapshot.darkMatter = ledger.getDarkMatter();
    m_snapshot.darkMatterMax = ledger.getDarkMatterMax();
    m_snapshot.shield = ledger.getShield();
    m_snapshot.shieldMax = ledger.getShieldMax();
    m_snapshot.finishHeld = progression.isFinishHeld();
    m_snapshot.lossReason = progression.getLossReason();

    m_snapshot.entities.clear();
    for (const EntityRecord& e : m_registry.forEachAlive()) {
        m_snapshot.entities.push_back(
            EntityView{e.id, e.role, e.collisionRole(), e.position, e.velocity, e.hitbox});
    }
    m_snapshot.events = m_events.frameEvents();
}

LevelOutcome Simulation::getOutcome() const {
    const ResourceLedger& ledger = getLedger();
    return LevelOutcome{getState(), ledger.getDarkMatter(), ledger.getShield(), m_tick,
                        getProgression().getLossReason()};
}

} // namespace KeeperEngine
