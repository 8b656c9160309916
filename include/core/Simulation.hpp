/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SIMULATION_HPP
#define SIMULATION_HPP

/**
 * @file Simulation.hpp
 * @brief One level run: owns every core system and advances them in a fixed
 * order, one deterministic step per tick
 *
 * Tick order:
 * 1. Purge entities despawned last tick
 * 2. Create scheduled spawns and walls the scroll has reached
 * 3. Ship intent (steering, weapon fire) and hazard cannons
 * 4. Shield recharge
 * 5. Kinematics (position += velocity * dt)
 * 6. Collision resolution into ledger and lifecycle effects
 * 7. Bounding box advance, drift and clamp
 * 8. Out-of-bounds despawn
 * 9. Win/lose and segment evaluation
 * 10. Snapshot for the render/audio sink
 *
 * Each Simulation owns its own ledger, registry and event bus, so several can
 * run side by side. The event bus outlives level reloads; handlers registered
 * on it stay attached across restart(), skipToSegment() and loadLevel().
 */

#include "collisions/Hitbox.hpp"
#include "controllers/combat/HazardCannonController.hpp"
#include "controllers/combat/ShipController.hpp"
#include "controllers/world/BoundingBoxController.hpp"
#include "core/InputIntent.hpp"
#include "events/EventBus.hpp"
#include "managers/CollisionResolver.hpp"
#include "managers/EntityRegistry.hpp"
#include "managers/LevelProgression.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace KeeperEngine {

/**
 * @brief Read-only view of one entity for drawing
 */
struct EntityView {
    EntityID id{INVALID_ENTITY_ID};
    EntityRole role{EntityRole::Hazard};
    CollisionRole collisionRole{CollisionRole::Hazard};
    Vector2D position;
    Vector2D velocity;
    Hitbox hitbox;
};

struct SimulationSnapshot {
    uint64_t tick{0};
    LevelState state{LevelState::Running};
    float scroll{0.0f};
    size_t segmentIndex{0};
    float darkMatter{0.0f};
    float darkMatterMax{0.0f};
    float shield{0.0f};
    float shieldMax{0.0f};
    bool finishHeld{false};
    std::string lossReason;
    std::vector<EntityView> entities;     // alive, ascending id
    std::vector<SimulationEvent> events;  // published during this tick
};

/**
 * @brief Value handed back to a driving harness once a level ends
 */
struct LevelOutcome {
    LevelState state{LevelState::Running};
    float darkMatter{0.0f};
    float shield{0.0f};
    uint64_t ticks{0};
    std::string lossReason;
};

class Simulation {
public:
    /**
     * @throws ConfigError if @p level is rejected
     */
    explicit Simulation(const LevelDefinition& level);

    // The ledger's depletion listener captures 'this'
    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;
    Simulation(Simulation&&) = delete;
    Simulation& operator=(Simulation&&) = delete;

    /**
     * @brief Advances one tick. A paused or finished simulation does not
     * advance and returns the last snapshot unchanged.
     */
    const SimulationSnapshot& tick(const InputIntent& intent);

    /**
     * @brief Replaces the running level. The new level is validated before
     * anything is touched; on ConfigError the current level keeps running.
     */
    void loadLevel(const LevelDefinition& level);

    /// Discards ledger, entities and progression and starts the level over
    void restart();

    /**
     * @brief Starts over at segment @p index without replaying earlier ones
     * @throws ContractViolation if @p index is not a segment
     */
    void skipToSegment(size_t index);

    void setPaused(bool paused) { m_paused = paused; }
    bool isPaused() const { return m_paused; }

    LevelState getState() const { return m_systems->progression.getState(); }
    bool isFinished() const { return getState() != LevelState::Running; }
    LevelOutcome getOutcome() const;

    uint64_t getTick() const { return m_tick; }
    float getTickSeconds() const { return m_tickSeconds; }
    const SimulationSnapshot& getSnapshot() const { return m_snapshot; }

    EventBus& getEventBus() { return m_events; }
    EntityRegistry& getRegistry() { return m_registry; }
    const EntityRegistry& getRegistry() const { return m_registry; }
    ResourceLedger& getLedger() { return m_systems->progression.getLedger(); }
    const ResourceLedger& getLedger() const { return m_systems->progression.getLedger(); }
    LevelProgression& getProgression() { return m_systems->progression; }
    const LevelProgression& getProgression() const { return m_systems->progression; }
    BoundingBoxController& getBox() { return m_systems->box; }
    const BoundingBoxController& getBox() const { return m_systems->box; }
    const LevelDefinition& getLevel() const { return m_systems->progression.getLevel(); }

private:
    /// Everything rebuilt when the level changes
    struct Systems {
        explicit Systems(const LevelDefinition& level);

        LevelProgression progression;
        CollisionResolver resolver;
        BoundingBoxController box;
        ShipController ship;
        HazardCannonController cannons;
    };

    void attachLedger();
    void resetWorld(float anchor);
    AABB keepRegion() const;
    void buildSnapshot();

    EventBus m_events;
    EntityRegistry m_registry;
    std::unique_ptr<Systems> m_systems;
    SimulationSnapshot m_snapshot;
    float m_tickSeconds{1.0f / 120.0f};
    uint64_t m_tick{0};
    bool m_paused{false};
};

} // namespace KeeperEngine

#endif // SIMULATION_HPP
