/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef OVERLAP_PAIR_HPP
#define OVERLAP_PAIR_HPP

#include "entities/EntityRecord.hpp"
#include <compare>
#include <utility>

namespace KeeperEngine {

/**
 * @brief Unordered entity pair, stored with the lower id first
 *
 * Default ordering sorts by (lower, higher), the stable resolution order.
 */
struct OverlapPair {
    EntityID lower{INVALID_ENTITY_ID};
    EntityID higher{INVALID_ENTITY_ID};

    OverlapPair() = default;
    OverlapPair(EntityID a, EntityID b)
        : lower(a < b ? a : b), higher(a < b ? b : a) {}

    bool involves(EntityID id) const { return lower == id || higher == id; }
    EntityID other(EntityID id) const { return lower == id ? higher : lower; }

    auto operator<=>(const OverlapPair&) const = default;
};

} // namespace KeeperEngine

#endif // OVERLAP_PAIR_HPP
