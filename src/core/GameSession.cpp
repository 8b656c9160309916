/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/GameSession.hpp"
#include "core/Logger.hpp"
#include "core/SimulationErrors.hpp"

#include <format>
#include <utility>

namespace KeeperEngine {

GameSession::GameSession(std::vector<LevelDefinition> levels, size_t initialLevel)
    : m_levels(std::move(levels)), m_currentLevel(initialLevel) {
    if (m_levels.empty()) {
        SESSION_ERROR("Session created without levels");
        throw ConfigError("a session needs at least one level");
    }
    if (initialLevel >= m_levels.size()) {
        std::string message = std::format("initial level {} is out of range ({} levels)",
                                          initialLevel, m_levels.size());
        SESSION_ERROR(message);
        throw ConfigError(message);
    }
    // Reject a bad level now rather than when the session reaches it
    for (const LevelDefinition& level : m_levels) {
        level.validate();
    }

    m_simulation = std::make_unique<Simulation>(m_levels[m_currentLevel]);
    SESSION_INFO(std::format("Session started with {} levels at level {} '{}'", m_levels.size(),
                             m_currentLevel, m_levels[m_currentLevel].name));
}

void GameSession::requestRestart() {
    m_restartRequested = true;
}

void GameSession::requestLevelSelect(size_t index) {
    if (index >= m_levels.size()) {
        std::string message =
            std::format("no level {} to select ({} levels)", index, m_levels.size());
        SESSION_ERROR(message);
        throw ContractViolation(message);
    }
    m_levelRequest = index;
}

void GameSession::requestSkipToSegment(size_t index) {
    m_segmentRequest = index;
}

void GameSession::applyPendingRequests() {
    if (m_levelRequest) {
        m_currentLevel = *m_levelRequest;
        m_simulation->loadLevel(m_levels[m_currentLevel]);
        m_attempts = 1;
        m_finished = false;
        SESSION_INFO(std::format("Selected level {} '{}'", m_currentLevel,
                                 m_levels[m_currentLevel].name));
    } else if (m_restartRequested && !m_finished) {
        m_simulation->restart();
        ++m_attempts;
        SESSION_INFO(std::format("Restart requested, attempt {}", m_attempts));
    }

    std::optional<size_t> segment = m_segmentRequest;
    m_levelRequest.reset();
    m_segmentRequest.reset();
    m_restartRequested = false;

    if (segment && !m_finished) {
        m_simulation->skipToSegment(*segment);
    }
}

void GameSession::handleOutcome() {
    switch (m_simulation->getState()) {
        case LevelState::Won:
            // The last level finishes the session inside tick()
            ++m_currentLevel;
            m_attempts = 1;
            m_simulation->loadLevel(m_levels[m_currentLevel]);
            SESSION_INFO(std::format("Advanced to level {} '{}'", m_currentLevel,
                                     m_levels[m_currentLevel].name));
            break;
        case LevelState::Lost:
            ++m_attempts;
            m_simulation->restart();
            SESSION_INFO(std::format("Retrying level {} '{}', attempt {}", m_currentLevel,
                                     m_levels[m_currentLevel].name, m_attempts));
            break;
        case LevelState::Running:
            break;
    }
}

const SimulationSnapshot& GameSession::tick(const InputIntent& intent) {
    applyPendingRequests();
    if (m_finished) {
        return m_simulation->getSnapshot();
    }

    handleOutcome();
    if (m_finished) {
        return m_simulation->getSnapshot();
    }

    const SimulationSnapshot& snapshot = m_simulation->tick(intent);
    if (snapshot.state == LevelState::Won) {
        ++m_levelsWon;
        if (m_currentLevel + 1 >= m_levels.size()) {
            m_finished = true;
            SESSION_INFO(std::format("Session finished after {} levels", m_levels.size()));
        }
    }
    return snapshot;
}

} // namespace KeeperEngine
