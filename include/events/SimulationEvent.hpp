/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SIMULATION_EVENT_HPP
#define SIMULATION_EVENT_HPP

#include "entities/EntityRecord.hpp"
#include "utils/Vector2D.hpp"
#include <cstdint>
#include <string>

namespace KeeperEngine {

/**
 * @brief Discrete things a render/audio sink may react to
 */
enum class SimulationEventType : uint8_t {
    Depletion = 0,       // dark matter reached 0 from above
    EntityDestroyed = 1, // consumed or killed by an effect
    LevelWon = 2,
    LevelLost = 3,
    SegmentEntered = 4,
    FinishBlocked = 5,   // ship at Finish below the required minimum
    WeaponFired = 6,
    WeaponDry = 7,       // fire held but the volley was unaffordable
    ShipDamaged = 8,
    COUNT
};

inline constexpr size_t SIMULATION_EVENT_TYPE_COUNT =
    static_cast<size_t>(SimulationEventType::COUNT);

constexpr const char* simulationEventToString(SimulationEventType type) noexcept {
    switch (type) {
        case SimulationEventType::Depletion:       return "Depletion";
        case SimulationEventType::EntityDestroyed: return "EntityDestroyed";
        case SimulationEventType::LevelWon:        return "LevelWon";
        case SimulationEventType::LevelLost:       return "LevelLost";
        case SimulationEventType::SegmentEntered:  return "SegmentEntered";
        case SimulationEventType::FinishBlocked:   return "FinishBlocked";
        case SimulationEventType::WeaponFired:     return "WeaponFired";
        case SimulationEventType::WeaponDry:       return "WeaponDry";
        case SimulationEventType::ShipDamaged:     return "ShipDamaged";
        default:                                   return "Unknown";
    }
}

struct SimulationEvent {
    SimulationEventType type{SimulationEventType::EntityDestroyed};
    uint64_t tick{0};                    // stamped by the EventBus
    EntityID entity{INVALID_ENTITY_ID};
    EntityRole role{EntityRole::Ship};
    Vector2D position;
    float amount{0.0f};                  // damage, cost or dark matter involved
    int segment{-1};                     // segment index where relevant
    std::string detail;                  // e.g. loss reason
};

} // namespace KeeperEngine

#endif // SIMULATION_EVENT_HPP
