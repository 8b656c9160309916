/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef INTERACTION_TABLE_HPP
#define INTERACTION_TABLE_HPP

#include "entities/EntityRole.hpp"
#include <boost/container/flat_map.hpp>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace KeeperEngine {

/**
 * @brief What happens when two collision roles overlap
 */
enum class InteractionEffect : uint8_t {
    None = 0,
    ShipHazardContact,     // shield damage = hazard contact damage
    ShipProjectileHit,     // shield damage = projectile damage, projectile despawns
    ShipDarkMatterCredit,  // credit = pickup amount, pickup despawns
    ShipDarkMatterDrain,   // debit = pickup amount, pickup despawns
    ShipWallContact,       // shield damage = wall contact damage, ship pushed out
    HazardProjectileHit,   // hazard health -= projectile damage, projectile despawns
    ProjectileWallImpact,  // projectile despawns
    COUNT
};

namespace InteractionTraits {

const char* effectToString(InteractionEffect effect) noexcept;
std::optional<InteractionEffect> effectFromString(std::string_view name);

/// True if @p effect can be applied to an overlap of roles @p a and @p b (either order)
bool effectFitsRoles(InteractionEffect effect, CollisionRole a, CollisionRole b) noexcept;

} // namespace InteractionTraits

/**
 * @brief Symmetric effect table keyed by unordered collision-role pair
 *
 * Must be exhaustive over every declared role pair before a simulation runs;
 * validate() rejects an incomplete table with a ConfigError.
 */
class InteractionTable {
public:
    struct RoleKey {
        CollisionRole first{CollisionRole::Ship};
        CollisionRole second{CollisionRole::Ship};

        RoleKey() = default;
        RoleKey(CollisionRole a, CollisionRole b)
            : first(a <= b ? a : b), second(a <= b ? b : a) {}

        auto operator<=>(const RoleKey&) const = default;
    };

    InteractionTable() = default;

    /**
     * @brief Table with every pair filled in with the stock effects
     */
    static InteractionTable createDefault();

    /**
     * @brief Sets the effect for an unordered role pair
     * @throws ConfigError if the effect cannot apply to these roles
     */
    void set(CollisionRole a, CollisionRole b, InteractionEffect effect);

    void erase(CollisionRole a, CollisionRole b);

    [[nodiscard]] std::optional<InteractionEffect> find(CollisionRole a, CollisionRole b) const;

    /**
     * @brief Effect for a role pair of a validated table
     * @throws ContractViolation if the pair was never configured
     */
    InteractionEffect lookup(CollisionRole a, CollisionRole b) const;

    std::vector<std::string> missingPairs() const;
    bool isComplete() const { return missingPairs().empty(); }

    /// @throws ConfigError listing every missing pair
    void validate() const;

    size_t size() const { return m_effects.size(); }

    static constexpr size_t REQUIRED_PAIRS =
        COLLISION_ROLE_COUNT * (COLLISION_ROLE_COUNT + 1) / 2;

private:
    boost::container::flat_map<RoleKey, InteractionEffect> m_effects;
};

} // namespace KeeperEngine

#endif // INTERACTION_TABLE_HPP
