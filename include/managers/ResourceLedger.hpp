/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef RESOURCE_LEDGER_HPP
#define RESOURCE_LEDGER_HPP

#include <cstdint>
#include <functional>
#include <utility>

namespace KeeperEngine {

enum class DebitReason : uint8_t {
    WeaponFire = 0,
    ShieldCompensation = 1, // unabsorbed ship damage
    RedPickup = 2,
    ShieldRecharge = 3,
    Other = 4
};

const char* debitReasonToString(DebitReason reason) noexcept;

/**
 * @brief Bounds and starting values for a ledger
 */
struct LedgerConfig {
    float darkMatterMax{100.0f};
    float initialDarkMatter{100.0f};
    float shieldMax{50.0f};
    float initialShield{50.0f};
    float shieldRechargeAmount{0.0f};   // 0 disables recharge
    float shieldRechargeInterval{0.5f}; // seconds

    bool isValid() const {
        return darkMatterMax > 0.0f && shieldMax >= 0.0f &&
               initialDarkMatter >= 0.0f && initialDarkMatter <= darkMatterMax &&
               initialShield >= 0.0f && initialShield <= shieldMax &&
               shieldRechargeAmount >= 0.0f && shieldRechargeInterval > 0.0f;
    }
};

struct DebitResult {
    float requested{0.0f};
    float removed{0.0f};
    bool depleted{false};        // dark matter is 0 after the debit
    bool depletionEvent{false};  // this debit moved dark matter from >0 to 0
};

struct ShieldDamageResult {
    float absorbed{0.0f};
    float remainder{0.0f};
};

struct ShipDamageResult {
    float absorbed{0.0f};   // taken by the shield
    DebitResult debit;      // remainder routed to dark matter
    bool lethal{false};     // remainder arrived with dark matter already at 0
};

struct WeaponCostResult {
    bool paid{false};
    DebitResult debit;
};

/**
 * @brief Owns the dark-matter and shield quantities of one level run
 *
 * Both values stay inside [0, max] after every mutation. Negative or
 * non-finite amounts are rejected with ContractViolation. Not a singleton:
 * each simulation owns its own ledger.
 */
class ResourceLedger {
public:
    using DepletionListener = std::function<void(DebitReason)>;

    /**
     * @throws ConfigError if @p config is invalid
     */
    explicit ResourceLedger(const LedgerConfig& config);

    /**
     * @brief Removes dark matter, clamped at 0
     * @return amount removed and depletion flags; the depletion event is raised
     *         once per transition from >0 to 0
     */
    DebitResult debit(float amount, DebitReason reason = DebitReason::Other);

    /**
     * @brief Adds dark matter, clamped at the maximum
     * @return amount actually added
     */
    float credit(float amount);

    /**
     * @brief Subtracts from the shield, clamped at 0
     * @return absorbed part and the unabsorbed remainder
     */
    ShieldDamageResult damageShield(float amount);

    /**
     * @brief Shield damage with the remainder converted into a dark-matter
     * debit in the same call
     */
    ShipDamageResult applyShipDamage(float amount);

    /**
     * @brief All-or-nothing debit for firing; never goes into debt
     */
    WeaponCostResult costWeaponFire(float amount);

    /**
     * @brief Advances the recharge countdown, moving dark matter into the shield
     * each elapsed interval when affordable
     * @return the aggregated dark-matter debit for this step
     */
    DebitResult rechargeShield(float deltaTime);

    void reset();

    float getDarkMatter() const { return m_darkMatter; }
    float getShield() const { return m_shield; }
    float getDarkMatterMax() const { return m_config.darkMatterMax; }
    float getShieldMax() const { return m_config.shieldMax; }
    const LedgerConfig& getConfig() const { return m_config; }

    void setDepletionListener(DepletionListener listener) { m_depletionListener = std::move(listener); }

private:
    void requireValidAmount(float amount, const char* operation) const;
    DebitResult applyDebit(float amount, DebitReason reason);

    LedgerConfig m_config;
    float m_darkMatter{0.0f};
    float m_shield{0.0f};
    float m_rechargeTimer{0.0f};
    DepletionListener m_depletionListener;
};

} // namespace KeeperEngine

#endif // RESOURCE_LEDGER_HPP
