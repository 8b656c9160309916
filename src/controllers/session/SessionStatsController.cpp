/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "controllers/session/SessionStatsController.hpp"
#include "core/Logger.hpp"

#include <array>
#include <format>

namespace KeeperEngine {

void SessionStatsController::subscribe(EventBus& bus)
{
    if (checkAlreadySubscribed()) {
        return;
    }

    constexpr std::array<SimulationEventType, 8> tracked{
        SimulationEventType::Depletion,     SimulationEventType::EntityDestroyed,
        SimulationEventType::WeaponFired,   SimulationEventType::WeaponDry,
        SimulationEventType::ShipDamaged,   SimulationEventType::LevelWon,
        SimulationEventType::LevelLost,     SimulationEventType::SegmentEntered};

    for (SimulationEventType type : tracked) {
        addHandler(bus, type, [this](const SimulationEvent& event) { onEvent(event); });
    }

    setSubscribed(true);
    SIMULATION_DEBUG("SessionStatsController subscribed");
}

void SessionStatsController::onEvent(const SimulationEvent& event)
{
    switch (event.type) {
        case SimulationEventType::Depletion:
            ++m_stats.depletions;
            break;
        case SimulationEventType::EntityDestroyed:
            if (event.role == EntityRole::Hazard) {
                ++m_stats.hazardsDestroyed;
            } else if (event.role == EntityRole::Pickup) {
                ++m_stats.pickupsCollected;
            }
            break;
        case SimulationEventType::WeaponFired:
            ++m_stats.volleysFired;
            m_stats.darkMatterSpentOnWeapons += event.amount;
            break;
        case SimulationEventType::WeaponDry:
            ++m_stats.volleysDry;
            break;
        case SimulationEventType::ShipDamaged:
            ++m_stats.shipHits;
            m_stats.damageTaken += event.amount;
            break;
        case SimulationEventType::LevelWon:
            ++m_stats.levelsWon;
            break;
        case SimulationEventType::LevelLost:
            ++m_stats.levelsLost;
            break;
        case SimulationEventType::SegmentEntered:
            ++m_stats.segmentsEntered;
            break;
        default:
            break;
    }
}

std::string SessionStatsController::summary() const
{
    return std::format(
        "won {} lost {} | segments {} | hazards destroyed {} pickups {} | volleys {} ({} dry, "
        "{:.1f} dark matter) | hits {} ({:.1f} damage) | depletions {}",
        m_stats.levelsWon, m_stats.levelsLost, m_stats.segmentsEntered, m_stats.hazardsDestroyed,
        m_stats.pickupsCollected, m_stats.volleysFired, m_stats.volleysDry,
        m_stats.darkMatterSpentOnWeapons, m_stats.shipHits, m_stats.damageTaken,
        m_stats.depletions);
}

} // namespace KeeperEngine
