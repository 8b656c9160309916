/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LEVEL_PROGRESSION_HPP
#define LEVEL_PROGRESSION_HPP

/**
 * @file LevelProgression.hpp
 * @brief Segment sequencing, spawn scheduling and win/lose evaluation
 *
 * States: Running, then exactly one of Won or Lost (terminal until restart).
 * Owns the level's ResourceLedger; other systems mutate it only through the
 * ledger's debit/credit contract.
 *
 * Spawns are scheduled up front from each segment's cumulative spawn table
 * using the level seed, and created one by one as the camera scroll reaches
 * their trigger position.
 */

#include "entities/EntityRecord.hpp"
#include "managers/ResourceLedger.hpp"
#include "world/LevelDefinition.hpp"
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace KeeperEngine {

class EntityRegistry;
class EventBus;
class BoundingBoxController;

enum class LevelState : uint8_t {
    Running = 0,
    Won = 1,
    Lost = 2
};

const char* levelStateToString(LevelState state) noexcept;

struct ScheduledSpawn {
    float trigger{0.0f};  // camera scroll that releases this spawn
    SpawnableType type{SpawnableType::Droid};
    float lane{0.5f};     // fraction of box height
    size_t segment{0};
};

/**
 * @brief What the rest of the tick observed, fed to evaluate()
 */
struct ProgressionInput {
    float shipX{0.0f};
    bool shipAlive{true};
    bool lethalHit{false};
    bool squashed{false};
};

struct ProgressionReport {
    LevelState state{LevelState::Running};
    bool stateChanged{false};
    bool segmentChanged{false};
    bool finishHeld{false};
};

class LevelProgression {
public:
    /**
     * @throws ConfigError if the level definition has problems
     */
    explicit LevelProgression(const LevelDefinition& level);

    /**
     * @brief Back to the level start: fresh ledger, segment 0, full schedule
     */
    void restart();

    /**
     * @brief Jumps to the start state of segment @p index without replaying
     * earlier segments. The ledger starts from the level values, raised to
     * the segment's startDarkMatter when it has one.
     * @throws ContractViolation if @p index is not a segment
     */
    void skipToSegment(size_t index);

    /**
     * @brief Creates every scheduled spawn and wall the scroll has reached
     * @return number of entities created
     */
    size_t spawnDue(float scroll, EntityRegistry& registry);

    /**
     * @brief Applies the transitions for this tick
     *
     * Lost on a lethal hit, a dead ship or a squash. Segment changes follow
     * the scroll. Won once the ship has reached Finish with enough dark
     * matter; short of it the box is paused and the ship held at Finish.
     */
    ProgressionReport evaluate(const ProgressionInput& input, float scroll,
                               BoundingBoxController& box, EventBus& events);

    ResourceLedger& getLedger() { return m_ledger; }
    const ResourceLedger& getLedger() const { return m_ledger; }

    LevelState getState() const { return m_state; }
    size_t getCurrentSegment() const { return m_currentSegment; }
    bool isFinishHeld() const { return m_finishHeld; }
    const std::string& getLossReason() const { return m_lossReason; }
    float getRequiredDarkMatter() const;

    const LevelDefinition& getLevel() const { return m_level; }
    const std::vector<ScheduledSpawn>& getSchedule() const { return m_schedule; }
    size_t getPendingSpawnCount() const { return m_schedule.size() - m_nextSpawn; }

    std::vector<SpawnEntry> effectiveSpawnTable(size_t index) const {
        return m_level.effectiveSpawnTable(index);
    }

private:
    void resetTo(size_t segment);
    void buildSchedule(size_t firstSegment);
    EntitySpec specFor(const ScheduledSpawn& spawn) const;
    void finish(LevelState outcome, const std::string& reason, EventBus& events);

    LevelDefinition m_level;
    ResourceLedger m_ledger;
    std::mt19937 m_rng;

    LevelState m_state{LevelState::Running};
    size_t m_currentSegment{0};
    bool m_finishReached{false};
    bool m_finishHeld{false};
    std::string m_lossReason;

    std::vector<ScheduledSpawn> m_schedule; // ascending trigger
    size_t m_nextSpawn{0};
    size_t m_nextWall{0};                   // m_level.walls sorted by x
};

} // namespace KeeperEngine

#endif // LEVEL_PROGRESSION_HPP
