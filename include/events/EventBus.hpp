/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef EVENT_BUS_HPP
#define EVENT_BUS_HPP

#include "events/SimulationEvent.hpp"
#include <array>
#include <cstdint>
#include <functional>
#include <vector>

namespace KeeperEngine {

using SimulationEventHandler = std::function<void(const SimulationEvent&)>;

/**
 * @brief Per-simulation event dispatcher
 *
 * Every published event is appended to the current frame's list (read by the
 * snapshot) and dispatched immediately to the handlers of its type.
 * Single-threaded: publish and registration happen inside the tick pass.
 */
class EventBus {
public:
    struct HandlerToken {
        SimulationEventType type{SimulationEventType::COUNT};
        uint64_t id{0};
    };

    EventBus() = default;

    HandlerToken registerHandler(SimulationEventType type, SimulationEventHandler handler);

    /**
     * @brief Removes a handler; safe to call from inside a handler
     * @return true if the token referred to a registered handler
     */
    bool removeHandler(const HandlerToken& token);

    void removeHandlers(SimulationEventType type);
    void clearAllHandlers();
    size_t getHandlerCount(SimulationEventType type) const;

    /**
     * @brief Starts a new frame: drops last frame's events and stamps @p tick
     * on everything published until the next call
     */
    void beginFrame(uint64_t tick);

    void publish(SimulationEvent event);

    const std::vector<SimulationEvent>& frameEvents() const { return m_frameEvents; }
    uint64_t currentTick() const { return m_tick; }
    bool isDispatching() const { return m_dispatchDepth > 0; }

private:
    struct HandlerEntry {
        SimulationEventHandler callable;
        uint64_t id{0};
        explicit operator bool() const { return static_cast<bool>(callable); }
    };

    class DispatchScope {
    public:
        explicit DispatchScope(EventBus& bus);
        ~DispatchScope();
        DispatchScope(const DispatchScope&) = delete;
        DispatchScope& operator=(const DispatchScope&) = delete;

    private:
        EventBus& m_bus;
    };

    void compactHandlers();

    std::array<std::vector<HandlerEntry>, SIMULATION_EVENT_TYPE_COUNT> m_handlersByType{};
    std::vector<SimulationEvent> m_frameEvents;
    uint64_t m_nextHandlerId{1};
    uint64_t m_tick{0};
    int m_dispatchDepth{0};
};

} // namespace KeeperEngine

#endif // EVENT_BUS_HPP
