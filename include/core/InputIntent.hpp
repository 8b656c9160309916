/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef INPUT_INTENT_HPP
#define INPUT_INTENT_HPP

#include "entities/EntityRole.hpp"
#include "utils/Vector2D.hpp"
#include <cstdint>

namespace KeeperEngine {

/**
 * @brief What the player wants this tick, independent of the input device
 *
 * movement components are in [-1, 1]; +x is forward along the scroll axis,
 * +y is down.
 */
struct InputIntent {
    Vector2D movement;
    bool fire{false};
    WeaponType weapon{WeaponType::Bullet};
};

/**
 * @brief Source of per-tick intents (keyboard mapping, replay, autopilot)
 */
class IInputProvider {
public:
    virtual ~IInputProvider() = default;
    virtual InputIntent poll(uint64_t tick) = 0;
};

/**
 * @brief Returns the same intent every tick
 */
class HeldInputProvider : public IInputProvider {
public:
    explicit HeldInputProvider(const InputIntent& intent) : m_intent(intent) {}

    InputIntent poll(uint64_t) override { return m_intent; }
    void setIntent(const InputIntent& intent) { m_intent = intent; }

private:
    InputIntent m_intent;
};

} // namespace KeeperEngine

#endif // INPUT_INTENT_HPP
