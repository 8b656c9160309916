/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "events/EventBus.hpp"
#include "core/Logger.hpp"

#include <algorithm>
#include <exception>
#include <format>
#include <utility>

namespace KeeperEngine {

EventBus::HandlerToken EventBus::registerHandler(SimulationEventType type,
                                                 SimulationEventHandler handler) {
    const size_t idx = static_cast<size_t>(type);
    if (idx >= m_handlersByType.size() || !handler) {
        EVENTBUS_WARN("Ignoring handler registration with invalid type or empty callable");
        return HandlerToken{};
    }
    uint64_t id = m_nextHandlerId++;
    m_handlersByType[idx].push_back(HandlerEntry{std::move(handler), id});
    return HandlerToken{type, id};
}

bool EventBus::removeHandler(const HandlerToken& token) {
    const size_t idx = static_cast<size_t>(token.type);
    if (idx >= m_handlersByType.size()) {
        return false;
    }
    auto& entries = m_handlersByType[idx];
    auto it = std::find_if(entries.begin(), entries.end(),
                           [&token](const HandlerEntry& entry) { return entry.id == token.id; });
    if (it == entries.end() || !(*it)) {
        return false;
    }
    // Mark as invalid (filtered during dispatch, erased when not dispatching)
    *it = HandlerEntry();
    if (m_dispatchDepth == 0) {
        compactHandlers();
    }
    return true;
}

void EventBus::removeHandlers(SimulationEventType type) {
    const size_t idx = static_cast<size_t>(type);
    if (idx >= m_handlersByType.size()) {
        return;
    }
    for (auto& entry : m_handlersByType[idx]) {
        entry = HandlerEntry();
    }
    if (m_dispatchDepth == 0) {
        compactHandlers();
    }
}

void EventBus::clearAllHandlers() {
    for (size_t i = 0; i < m_handlersByType.size(); ++i) {
        removeHandlers(static_cast<SimulationEventType>(i));
    }
}

size_t EventBus::getHandlerCount(SimulationEventType type) const {
    const size_t idx = static_cast<size_t>(type);
    if (idx >= m_handlersByType.size()) {
        return 0;
    }
    const auto& entries = m_handlersByType[idx];
    return static_cast<size_t>(std::count_if(entries.begin(), entries.end(),
                                             [](const HandlerEntry& e) { return static_cast<bool>(e); }));
}

void EventBus::beginFrame(uint64_t tick) {
    m_tick = tick;
    m_frameEvents.clear();
}

void EventBus::publish(SimulationEvent event) {
    event.tick = m_tick;
    m_frameEvents.push_back(event);

    const size_t idx = static_cast<size_t>(event.type);
    if (idx >= m_handlersByType.size()) {
        return;
    }

    DispatchScope scope(*this);
    // Index loop: handlers may register more handlers while we dispatch
    auto& entries = m_handlersByType[idx];
    for (size_t i = 0; i < entries.size(); ++i) {
        if (!entries[i]) {
            continue;
        }
        SimulationEventHandler callable = entries[i].callable;
        try {
            callable(event);
        } catch (const std::exception& e) {
            EVENTBUS_ERROR(std::format("Handler exception for {}: {}",
                                       simulationEventToString(event.type), e.what()));
        }
    }
}

EventBus::DispatchScope::DispatchScope(EventBus& bus) : m_bus(bus) {
    ++m_bus.m_dispatchDepth;
}

// Also runs when a handler throws something other than std::exception
EventBus::DispatchScope::~DispatchScope() {
    if (--m_bus.m_dispatchDepth == 0) {
        m_bus.compactHandlers();
    }
}

void EventBus::compactHandlers() {
    for (auto& entries : m_handlersByType) {
        entries.erase(std::remove_if(entries.begin(), entries.end(),
                                     [](const HandlerEntry& e) { return !e; }),
                      entries.end());
    }
}

} // namespace KeeperEngine
