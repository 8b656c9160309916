/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CONTROLLER_BASE_HPP
#define CONTROLLER_BASE_HPP

/**
 * @file ControllerBase.hpp
 * @brief Base class for lightweight event-bus subscribers
 *
 * Controllers watch a Simulation's EventBus and react (tally, forward to a
 * sink). They do NOT own simulation data and never mutate it.
 *
 * Key characteristics:
 * - Owned by the driver or a test (not singletons)
 * - Auto-unsubscribe on destruction
 * - Minimal state (subscription tokens plus whatever they tally)
 *
 * The EventBus passed to subscribe() must outlive the controller or be
 * released first with unsubscribe().
 */

#include "events/EventBus.hpp"
#include <string_view>
#include <vector>

namespace KeeperEngine {

class ControllerBase
{
public:
    /**
     * @brief Virtual destructor auto-unsubscribes from all events
     */
    virtual ~ControllerBase() { unsubscribe(); }

    // Event handlers capture 'this'
    ControllerBase(const ControllerBase&) = delete;
    ControllerBase& operator=(const ControllerBase&) = delete;
    ControllerBase(ControllerBase&&) = delete;
    ControllerBase& operator=(ControllerBase&&) = delete;

    /**
     * @brief Register this controller's handlers on @p bus. Idempotent.
     */
    virtual void subscribe(EventBus& bus) = 0;

    [[nodiscard]] virtual std::string_view getName() const = 0;

    /**
     * @brief Unsubscribe from all registered event handlers
     * @note Safe to call multiple times
     */
    void unsubscribe()
    {
        if (!m_subscribed || !m_bus) {
            return;
        }

        for (const auto& token : m_handlerTokens) {
            m_bus->removeHandler(token);
        }
        m_handlerTokens.clear();
        m_bus = nullptr;
        m_subscribed = false;
    }

    [[nodiscard]] bool isSubscribed() const { return m_subscribed; }

protected:
    ControllerBase() = default;

    /**
     * @brief Registers @p handler on @p bus and keeps its token for cleanup
     */
    void addHandler(EventBus& bus, SimulationEventType type, SimulationEventHandler handler)
    {
        m_bus = &bus;
        m_handlerTokens.push_back(bus.registerHandler(type, std::move(handler)));
    }

    void setSubscribed(bool subscribed) { m_subscribed = subscribed; }

    [[nodiscard]] bool checkAlreadySubscribed() const { return m_subscribed; }

private:
    bool m_subscribed{false};
    EventBus* m_bus{nullptr};
    std::vector<EventBus::HandlerToken> m_handlerTokens;
};

} // namespace KeeperEngine

#endif // CONTROLLER_BASE_HPP
