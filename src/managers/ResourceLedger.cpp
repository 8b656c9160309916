/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/ResourceLedger.hpp"
#include "core/Logger.hpp"
#include "core/SimulationErrors.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <string>

namespace KeeperEngine {

const char* debitReasonToString(DebitReason reason) noexcept {
    switch (reason) {
        case DebitReason::WeaponFire:         return "WeaponFire";
        case DebitReason::ShieldCompensation: return "ShieldCompensation";
        case DebitReason::RedPickup:          return "RedPickup";
        case DebitReason::ShieldRecharge:     return "ShieldRecharge";
        case DebitReason::Other:              return "Other";
        default:                              return "Unknown";
    }
}

ResourceLedger::ResourceLedger(const LedgerConfig& config) : m_config(config) {
    if (!m_config.isValid()) {
        std::string message = std::format(
            "ledger config out of range (darkMatter {}/{}, shield {}/{})",
            m_config.initialDarkMatter, m_config.darkMatterMax,
            m_config.initialShield, m_config.shieldMax);
        LEDGER_ERROR(message);
        throw ConfigError(message);
    }
    reset();
}

void ResourceLedger::reset() {
    m_darkMatter = m_config.initialDarkMatter;
    m_shield = m_config.initialShield;
    m_rechargeTimer = 0.0f;
}

void ResourceLedger::requireValidAmount(float amount, const char* operation) const {
    if (!std::isfinite(amount) || amount < 0.0f) {
        std::string message = std::format("{} rejected amount {}", operation, amount);
        LEDGER_ERROR(message);
        throw ContractViolation(message);
    }
}

DebitResult ResourceLedger::applyDebit(float amount, DebitReason reason) {
    DebitResult result;
    result.requested = amount;

    float before = m_darkMatter;
    result.removed = std::min(amount, before);
    m_darkMatter = std::max(0.0f, before - result.removed);
    if (m_darkMatter <= 0.0f) {
        m_darkMatter = 0.0f;
        result.depleted = true;
    }

    if (result.depleted && before > 0.0f) {
        result.depletionEvent = true;
        LEDGER_WARN(std::format("Dark matter depleted ({})", debitReasonToString(reason)));
        if (m_depletionListener) {
            m_depletionListener(reason);
        }
    }
    return result;
}

DebitResult ResourceLedger::debit(float amount, DebitReason reason) {
    requireValidAmount(amount, "debit");
    return applyDebit(amount, reason);
}

float ResourceLedger::credit(float amount) {
    requireValidAmount(amount, "credit");
    float before = m_darkMatter;
    m_darkMatter = std::min(m_config.darkMatterMax, before + amount);
    return m_darkMatter - before;
}

ShieldDamageResult ResourceLedger::damageShield(float amount) {
    requireValidAmount(amount, "damageShield");
    ShieldDamageResult result;
    result.absorbed = std::min(amount, m_shield);
    m_shield = std::max(0.0f, m_shield - result.absorbed);
    result.remainder = amount - result.absorbed;
    return result;
}

ShipDamageResult ResourceLedger::applyShipDamage(float amount) {
    ShipDamageResult result;
    ShieldDamageResult shield = damageShield(amount);
    result.absorbed = shield.absorbed;

    if (shield.remainder > 0.0f) {
        result.lethal = (m_darkMatter <= 0.0f);
        result.debit = applyDebit(shield.remainder, DebitReason::ShieldCompensation);
    }
    return result;
}

WeaponCostResult ResourceLedger::costWeaponFire(float amount) {
    requireValidAmount(amount, "costWeaponFire");
    WeaponCostResult result;
    if (amount > m_darkMatter) {
        result.debit.requested = amount;
        result.debit.depleted = (m_darkMatter <= 0.0f);
        return result;
    }
    result.paid = true;
    result.debit = applyDebit(amount, DebitReason::WeaponFire);
    return result;
}

DebitResult ResourceLedger::rechargeShield(float deltaTime) {
    requireValidAmount(deltaTime, "rechargeShield");
    DebitResult total;
    if (m_config.shieldRechargeAmount <= 0.0f) {
        return total;
    }

    m_rechargeTimer += deltaTime;
    while (m_rechargeTimer >= m_config.shieldRechargeInterval) {
        m_rechargeTimer -= m_config.shieldRechargeInterval;

        float room = m_config.shieldMax - m_shield;
        if (room <= 0.0f || m_darkMatter < m_config.shieldRechargeAmount) {
            continue;
        }

        float transfer = std::min(m_config.shieldRechargeAmount, room);
        DebitResult step = applyDebit(transfer, DebitReason::ShieldRecharge);
        m_shield = std::min(m_config.shieldMax, m_shield + step.removed);

        total.requested += step.requested;
        total.removed += step.removed;
        total.depleted = step.depleted;
        total.depletionEvent = total.depletionEvent || step.depletionEvent;
    }
    return total;
}

} // namespace KeeperEngine
