/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SIMULATION_ERRORS_HPP
#define SIMULATION_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace KeeperEngine {

/**
 * @brief Malformed level or interaction data, detected before any tick runs.
 *
 * Unrecoverable for the level load that raised it.
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what)
        : std::runtime_error("Keeper Engine - configuration rejected: " + what) {}
};

/**
 * @brief A caller broke an operation's documented contract
 * (negative ledger amount, role/payload mismatch on spawn, unknown segment).
 */
class ContractViolation : public std::logic_error {
public:
    explicit ContractViolation(const std::string& what)
        : std::logic_error("Keeper Engine - contract violation: " + what) {}
};

} // namespace KeeperEngine

#endif // SIMULATION_ERRORS_HPP
