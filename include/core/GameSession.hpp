/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef GAME_SESSION_HPP
#define GAME_SESSION_HPP

/**
 * @file GameSession.hpp
 * @brief Ordered sequence of levels played through one Simulation
 *
 * After Won the session moves to the next level (and is finished after the
 * last one); after Lost the same level is retried. Restart, level-select and
 * skip-to-segment requests are queued and applied at the next tick boundary,
 * never in the middle of a tick.
 */

#include "core/Simulation.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

namespace KeeperEngine {

class GameSession {
public:
    /**
     * @throws ConfigError if @p levels is empty, any level is rejected, or
     *         @p initialLevel is out of range
     */
    explicit GameSession(std::vector<LevelDefinition> levels, size_t initialLevel = 0);

    /**
     * @brief Applies pending requests and outcome transitions, then advances
     * the current level one tick. No-op once finished.
     */
    const SimulationSnapshot& tick(const InputIntent& intent);

    void requestRestart();

    /// @throws ContractViolation if @p index is not a level
    void requestLevelSelect(size_t index);

    /// Skip within the current level; checked when applied
    void requestSkipToSegment(size_t index);

    bool isFinished() const { return m_finished; }
    size_t getCurrentLevelIndex() const { return m_currentLevel; }
    size_t getLevelCount() const { return m_levels.size(); }
    size_t getAttempts() const { return m_attempts; }
    size_t getLevelsWon() const { return m_levelsWon; }

    Simulation& getSimulation() { return *m_simulation; }
    const Simulation& getSimulation() const { return *m_simulation; }

private:
    void applyPendingRequests();
    void handleOutcome();

    std::vector<LevelDefinition> m_levels;
    std::unique_ptr<Simulation> m_simulation;
    size_t m_currentLevel{0};
    size_t m_attempts{1};   // attempts at the current level
    size_t m_levelsWon{0};
    bool m_finished{false};

    bool m_restartRequested{false};
    std::optional<size_t> m_levelRequest;
    std::optional<size_t> m_segmentRequest;
};

} // namespace KeeperEngine

#endif // GAME_SESSION_HPP
