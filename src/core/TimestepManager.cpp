/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/TimestepManager.hpp"

#include <SDL3/SDL.h>

#include <algorithm>

TimestepManager::TimestepManager(float targetFPS, float fixedTimestep)
    : m_targetFPS(0.0f)
    , m_fixedTimestep(fixedTimestep > 0.0f ? fixedTimestep : 1.0f / 120.0f)
{
    setTargetFPS(targetFPS);
    reset();
}

void TimestepManager::startFrame() {
    uint64_t now = SDL_GetTicksNS();

    if (m_firstFrame) {
        m_firstFrame = false;
        m_lastFrameNs = now;
        m_frameStartNs = now;
        m_accumulator = m_fixedTimestep;
        return;
    }

    double deltaTime = static_cast<double>(now - m_lastFrameNs) / 1e9;
    m_lastFrameNs = now;
    m_frameStartNs = now;
    updateFPS(deltaTime);

    if (!isPaced()) {
        // Exactly one update per frame
        m_accumulator = m_fixedTimestep;
        return;
    }
    m_accumulator += std::min(deltaTime, MAX_ACCUMULATOR);
}

bool TimestepManager::shouldUpdate() {
    if (m_accumulator >= m_fixedTimestep) {
        m_accumulator -= m_fixedTimestep;
        return true;
    }
    return false;
}

void TimestepManager::endFrame() const {
    if (!isPaced()) {
        return;
    }
    uint64_t targetEnd = m_frameStartNs + m_targetFrameNs;
    uint64_t now = SDL_GetTicksNS();
    if (now < targetEnd) {
        SDL_DelayPrecise(targetEnd - now);
    }
}

void TimestepManager::setTargetFPS(float fps) {
    m_targetFPS = fps > 0.0f ? fps : 0.0f;
    m_targetFrameNs = isPaced() ? static_cast<uint64_t>(1e9 / static_cast<double>(m_targetFPS)) : 0;
}

void TimestepManager::reset() {
    m_accumulator = 0.0;
    m_firstFrame = true;
    m_currentFPS = 0.0f;
    m_frameStartNs = SDL_GetTicksNS();
    m_lastFrameNs = m_frameStartNs;
}

void TimestepManager::updateFPS(double deltaSeconds) {
    if (deltaSeconds <= 0.0) {
        return;
    }
    float instantFPS = std::clamp(static_cast<float>(1.0 / deltaSeconds), 0.1f, 100000.0f);
    if (m_currentFPS <= 0.0f) {
        m_currentFPS = instantFPS;
    } else {
        m_currentFPS = m_smoothingAlpha * instantFPS + (1.0f - m_smoothingAlpha) * m_currentFPS;
    }
}
