/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/LevelDefinition.hpp"
#include "core/Logger.hpp"
#include "core/SimulationErrors.hpp"

#include <algorithm>
#include <bitset>
#include <cmath>
#include <format>

namespace KeeperEngine {

namespace SpawnTraits {

const char* typeToString(SpawnableType type) noexcept {
    switch (type) {
        case SpawnableType::BlueBottle: return "blueBottle";
        case SpawnableType::RedBottle:  return "redBottle";
        case SpawnableType::COUNT:      return "unknown";
        default:                        return RoleTraits::hazardToString(hazardKindOf(type));
    }
}

std::optional<SpawnableType> typeFromString(std::string_view name) {
    for (size_t i = 0; i < static_cast<size_t>(SpawnableType::COUNT); ++i) {
        auto type = static_cast<SpawnableType>(i);
        if (name == typeToString(type)) {
            return type;
        }
    }
    return std::nullopt;
}

const char* distributionToString(SpawnDistribution distribution) noexcept {
    switch (distribution) {
        case SpawnDistribution::Even:      return "even";
        case SpawnDistribution::Clustered: return "clustered";
        case SpawnDistribution::Random:    return "random";
        default:                           return "unknown";
    }
}

std::optional<SpawnDistribution> distributionFromString(std::string_view name) {
    if (name == "even") return SpawnDistribution::Even;
    if (name == "clustered") return SpawnDistribution::Clustered;
    if (name == "random") return SpawnDistribution::Random;
    return std::nullopt;
}

} // namespace SpawnTraits

namespace {

bool nonNegative(float value) {
    return std::isfinite(value) && value >= 0.0f;
}

bool positive(float value) {
    return std::isfinite(value) && value > 0.0f;
}

void checkHeadings(const std::vector<Vector2D>& headings, const std::string& owner,
                   std::vector<std::string>& errors) {
    if (headings.empty()) {
        errors.push_back(owner + " has no headings");
        return;
    }
    for (const auto& heading : headings) {
        if (heading.isZero()) {
            errors.push_back(owner + " has a zero heading");
            return;
        }
    }
}

void checkWeapon(const WeaponDefinition& weapon, const std::string& owner,
                 std::vector<std::string>& errors) {
    if (!nonNegative(weapon.cost)) errors.push_back(owner + " cost must be >= 0");
    if (!nonNegative(weapon.damage)) errors.push_back(owner + " damage must be >= 0");
    if (!nonNegative(weapon.speed)) errors.push_back(owner + " speed must be >= 0");
    if (!positive(weapon.interval)) errors.push_back(owner + " interval must be > 0");
    if (!positive(weapon.radius)) errors.push_back(owner + " radius must be > 0");
    checkHeadings(weapon.headings, owner, errors);
}

void checkCannon(const CannonDefinition& cannon, const std::string& owner,
                 std::vector<std::string>& errors) {
    if (RoleTraits::isFriendly(cannon.projectile)) {
        errors.push_back(owner + " must fire an enemy projectile");
    }
    if (!nonNegative(cannon.damage)) errors.push_back(owner + " damage must be >= 0");
    if (!nonNegative(cannon.speed)) errors.push_back(owner + " speed must be >= 0");
    if (!positive(cannon.interval)) errors.push_back(owner + " interval must be > 0");
    if (!positive(cannon.radius)) errors.push_back(owner + " radius must be > 0");
    checkHeadings(cannon.headings, owner, errors);
}

} // anonymous namespace

float LevelDefinition::finishPosition() const {
    float total = 0.0f;
    for (const auto& segment : segments) {
        total += segment.length;
    }
    return total;
}

float LevelDefinition::segmentStart(size_t index) const {
    float start = 0.0f;
    for (size_t i = 0; i < index && i < segments.size(); ++i) {
        start += segments[i].length;
    }
    return start;
}

size_t LevelDefinition::segmentAt(float scroll) const {
    if (segments.empty()) {
        return 0;
    }
    float end = 0.0f;
    for (size_t i = 0; i < segments.size(); ++i) {
        end += segments[i].length;
        if (scroll < end) {
            return i;
        }
    }
    return segments.size() - 1;
}

std::vector<SpawnEntry> LevelDefinition::effectiveSpawnTable(size_t index) const {
    if (index >= segments.size()) {
        return {};
    }

    // Walk backwards; a type is claimed by the newest segment that lists it
    std::bitset<static_cast<size_t>(SpawnableType::COUNT)> claimed;
    std::vector<std::vector<SpawnEntry>> blocks;
    for (size_t i = index + 1; i-- > 0;) {
        std::vector<SpawnEntry> block;
        decltype(claimed) listedHere;
        for (const auto& entry : segments[i].spawns) {
            size_t bit = static_cast<size_t>(entry.type);
            if (!claimed.test(bit)) {
                block.push_back(entry);
            }
            listedHere.set(bit);
        }
        claimed |= listedHere;
        blocks.push_back(std::move(block));
    }

    std::vector<SpawnEntry> table;
    for (auto it = blocks.rbegin(); it != blocks.rend(); ++it) {
        table.insert(table.end(), it->begin(), it->end());
    }
    return table;
}

std::vector<std::string> LevelDefinition::collectErrors() const {
    std::vector<std::string> errors;
    const GameConstants& c = constants;

    if (!c.ledger.isValid()) {
        errors.push_back(std::format(
            "ledger constants out of range (darkMatter {}/{}, shield {}/{}, recharge {} every {}s)",
            c.ledger.initialDarkMatter, c.ledger.darkMatterMax, c.ledger.initialShield,
            c.ledger.shieldMax, c.ledger.shieldRechargeAmount, c.ledger.shieldRechargeInterval));
    }
    if (!nonNegative(c.wallContactDamage)) errors.push_back("wallContactDamage must be >= 0");
    if (!nonNegative(c.despawnMarginBehind) || !nonNegative(c.despawnMarginAhead)) {
        errors.push_back("despawn margins must be >= 0");
    }
    if (c.ticksPerSecond <= 0) errors.push_back("ticksPerSecond must be > 0");
    if (!positive(c.box.width) || !positive(c.box.height)) {
        errors.push_back("box width and height must be > 0");
    }
    if (!positive(c.box.advancePerTick)) errors.push_back("box advancePerTick must be > 0");

    if (!c.ship.hitbox.isValid()) errors.push_back("ship hitbox is invalid");
    if (!nonNegative(c.ship.speedForward) || !nonNegative(c.ship.speedBackward) ||
        !nonNegative(c.ship.speedVertical)) {
        errors.push_back("ship speeds must be >= 0");
    }
    if (c.ship.start.getX() < 0.0f || c.ship.start.getX() > c.box.width ||
        c.ship.start.getY() < 0.0f || c.ship.start.getY() > c.box.height) {
        errors.push_back("ship start lies outside the bounding box");
    }

    checkWeapon(c.weapons.bullet, "weapon 'bullet'", errors);
    checkWeapon(c.weapons.laser, "weapon 'laser'", errors);

    for (const auto& [kind, hazard] : c.hazards) {
        std::string owner = std::format("hazard '{}'", RoleTraits::hazardToString(kind));
        if (!nonNegative(hazard.contactDamage)) errors.push_back(owner + " contactDamage must be >= 0");
        if (!positive(hazard.health)) errors.push_back(owner + " health must be > 0");
        if (!hazard.hitbox.isValid()) errors.push_back(owner + " hitbox is invalid");
        if (hazard.cannon) checkCannon(*hazard.cannon, owner + " cannon", errors);
    }
    for (const auto& [kind, pickup] : c.pickups) {
        std::string owner = std::format("pickup '{}'", RoleTraits::pickupToString(kind));
        if (!nonNegative(pickup.amount)) errors.push_back(owner + " amount must be >= 0");
        if (!pickup.hitbox.isValid()) errors.push_back(owner + " hitbox is invalid");
    }

    if (segments.empty()) {
        errors.push_back("level has no segments");
    }
    for (size_t i = 0; i < segments.size(); ++i) {
        const SegmentDefinition& segment = segments[i];
        std::string owner = std::format("segment {} '{}'", i, segment.name);
        if (!positive(segment.length)) errors.push_back(owner + " length must be > 0");
        if (!nonNegative(segment.minimumDarkMatter) ||
            segment.minimumDarkMatter > c.ledger.darkMatterMax) {
            errors.push_back(owner + " minimumDarkMatter must lie in [0, darkMatterMax]");
        }
        if (segment.startDarkMatter && (!nonNegative(*segment.startDarkMatter) ||
                                        *segment.startDarkMatter > c.ledger.darkMatterMax)) {
            errors.push_back(owner + " startDarkMatter must lie in [0, darkMatterMax]");
        }
        for (const auto& entry : segment.spawns) {
            std::string spawnOwner =
                std::format("{} spawn '{}'", owner, SpawnTraits::typeToString(entry.type));
            if (entry.count < 0 || entry.count > MAX_SPAWN_COUNT) {
                errors.push_back(std::format("{} count must lie in [0, {}]", spawnOwner,
                                             MAX_SPAWN_COUNT));
            }
            if (!(entry.laneMin >= 0.0f && entry.laneMin <= entry.laneMax && entry.laneMax <= 1.0f)) {
                errors.push_back(spawnOwner + " lanes must satisfy 0 <= laneMin <= laneMax <= 1");
            }
            if (!(entry.clusterSpan > 0.0f && entry.clusterSpan <= 1.0f)) {
                errors.push_back(spawnOwner + " clusterSpan must lie in (0, 1]");
            }
            if (SpawnTraits::isHazard(entry.type)) {
                if (c.hazards.find(SpawnTraits::hazardKindOf(entry.type)) == c.hazards.end()) {
                    errors.push_back(spawnOwner + " has no hazard constants");
                }
            } else if (c.pickups.find(SpawnTraits::pickupKindOf(entry.type)) == c.pickups.end()) {
                errors.push_back(spawnOwner + " has no pickup constants");
            }
        }
    }

    for (size_t i = 0; i < walls.size(); ++i) {
        if (!positive(walls[i].width) || !positive(walls[i].height)) {
            errors.push_back(std::format("wall {} width and height must be > 0", i));
        }
    }

    for (const auto& pair : interactions.missingPairs()) {
        errors.push_back("interaction table is missing " + pair);
    }
    return errors;
}

void LevelDefinition::validate() const {
    auto errors = collectErrors();
    if (errors.empty()) {
        return;
    }
    std::string message = std::format("level '{}' has {} problem(s)", name, errors.size());
    for (const auto& error : errors) {
        message += "\n  - " + error;
    }
    LEVEL_ERROR(message);
    throw ConfigError(message);
}

} // namespace KeeperEngine
