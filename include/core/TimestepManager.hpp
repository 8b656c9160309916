/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef TIMESTEP_MANAGER_HPP
#define TIMESTEP_MANAGER_HPP

#include <cstdint>

/**
 * TimestepManager paces a fixed-timestep simulation loop.
 *
 * Paced mode (targetFPS > 0): wall-clock time feeds an accumulator that
 * releases fixed updates, and endFrame() sleeps out the rest of the frame with
 * SDL_DelayPrecise.
 * Unpaced mode (targetFPS <= 0): exactly one update per frame and no sleeping,
 * for headless runs that should finish as fast as possible.
 */
class TimestepManager {
public:
    /**
     * @param targetFPS Frames per second to pace to, or 0 for unpaced
     * @param fixedTimestep Seconds per simulation update (e.g. 1.0f/120.0f)
     */
    explicit TimestepManager(float targetFPS = 60.0f, float fixedTimestep = 1.0f / 120.0f);

    void startFrame();

    /**
     * Returns true while the accumulator holds another fixed update.
     * May return true several times per frame for catch-up.
     */
    bool shouldUpdate();

    float getUpdateDeltaTime() const { return m_fixedTimestep; }
    float getUpdateFrequencyHz() const { return 1.0f / m_fixedTimestep; }

    /**
     * Sleeps until the frame's target end time (paced mode only)
     */
    void endFrame() const;

    float getCurrentFPS() const { return m_currentFPS; }
    float getTargetFPS() const { return m_targetFPS; }
    bool isPaced() const { return m_targetFPS > 0.0f; }

    void setTargetFPS(float fps);
    void reset();

private:
    void updateFPS(double deltaSeconds);

    float m_targetFPS;
    float m_fixedTimestep;
    uint64_t m_targetFrameNs{0};
    uint64_t m_frameStartNs{0};
    uint64_t m_lastFrameNs{0};
    double m_accumulator{0.0};
    static constexpr double MAX_ACCUMULATOR = 0.25; // clamp against a spiral of catch-up updates

    float m_currentFPS{0.0f};
    float m_smoothingAlpha{0.03f};
    bool m_firstFrame{true};
};

#endif // TIMESTEP_MANAGER_HPP
