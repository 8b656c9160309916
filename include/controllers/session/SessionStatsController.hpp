/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SESSION_STATS_CONTROLLER_HPP
#define SESSION_STATS_CONTROLLER_HPP

/**
 * @file SessionStatsController.hpp
 * @brief Tallies simulation events for the driver's end-of-run summary
 *
 * Subscribes once to a Simulation's EventBus; the bus survives level reloads,
 * so the tallies span every level and attempt of a session.
 */

#include "controllers/ControllerBase.hpp"
#include <cstddef>
#include <string>

namespace KeeperEngine {

class SessionStatsController : public ControllerBase
{
public:
    struct Stats {
        size_t depletions{0};
        size_t hazardsDestroyed{0};
        size_t pickupsCollected{0};
        size_t volleysFired{0};
        size_t volleysDry{0};
        size_t shipHits{0};
        size_t levelsWon{0};
        size_t levelsLost{0};
        size_t segmentsEntered{0};
        float darkMatterSpentOnWeapons{0.0f};
        float damageTaken{0.0f};
    };

    SessionStatsController() = default;
    ~SessionStatsController() override = default;

    void subscribe(EventBus& bus) override;

    [[nodiscard]] std::string_view getName() const override { return "SessionStatsController"; }

    [[nodiscard]] const Stats& getStats() const { return m_stats; }

    void reset() { m_stats = Stats{}; }

    /**
     * @brief One-line summary, e.g. for the driver's final log line
     */
    [[nodiscard]] std::string summary() const;

private:
    void onEvent(const SimulationEvent& event);

    Stats m_stats;
};

} // namespace KeeperEngine

#endif // SESSION_STATS_CONTROLLER_HPP
