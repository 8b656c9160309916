/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LEVEL_DEFINITION_HPP
#define LEVEL_DEFINITION_HPP

#include "collisions/AABB.hpp"
#include "collisions/Hitbox.hpp"
#include "collisions/InteractionTable.hpp"
#include "entities/EntityRole.hpp"
#include "managers/ResourceLedger.hpp"
#include "utils/Vector2D.hpp"
#include "world/ArmamentDefinition.hpp"
#include <boost/container/flat_map.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace KeeperEngine {

enum class SpawnDistribution : uint8_t {
    Even = 0,      // evenly spaced over the segment length
    Clustered = 1, // packed at segment entry within clusterSpan
    Random = 2     // uniform over the segment, drawn from the level seed
};

/// Anything a spawn table may name: every hazard kind plus both pickups
enum class SpawnableType : uint8_t {
    Droid = 0,
    Refexa,
    Gummbumm,
    Goat,
    AntimatterJet,
    SnakeSegment,
    BlueBottle,
    RedBottle,
    COUNT
};

namespace SpawnTraits {

constexpr bool isHazard(SpawnableType type) noexcept {
    return type < SpawnableType::BlueBottle;
}

constexpr HazardKind hazardKindOf(SpawnableType type) noexcept {
    return static_cast<HazardKind>(type);
}

constexpr PickupKind pickupKindOf(SpawnableType type) noexcept {
    return type == SpawnableType::RedBottle ? PickupKind::RedBottle : PickupKind::BlueBottle;
}

const char* typeToString(SpawnableType type) noexcept;
std::optional<SpawnableType> typeFromString(std::string_view name);
const char* distributionToString(SpawnDistribution distribution) noexcept;
std::optional<SpawnDistribution> distributionFromString(std::string_view name);

} // namespace SpawnTraits

/// Upper bound on one spawn entry's count
inline constexpr int MAX_SPAWN_COUNT = 10000;

struct SpawnEntry {
    SpawnableType type{SpawnableType::Droid};
    int count{1};
    SpawnDistribution distribution{SpawnDistribution::Even};
    float laneMin{0.1f};     // fraction of box height
    float laneMax{0.9f};
    float clusterSpan{0.1f}; // fraction of segment length, Clustered only
};

struct SegmentDefinition {
    std::string name;
    float length{0.0f};
    std::vector<SpawnEntry> spawns;
    float minimumDarkMatter{0.0f};           // to be allowed to finish
    std::optional<float> startDarkMatter;    // skip-ahead prerequisite
};

struct WallDefinition {
    float x{0.0f}; // top-left corner
    float y{0.0f};
    float width{0.0f};
    float height{0.0f};

    AABB bounds() const { return AABB::fromCorner(x, y, width, height); }
};

struct HazardDefinition {
    float contactDamage{0.0f};
    float health{1.0f};
    bool destroyedOnContact{false};
    Hitbox hitbox{Hitbox::circle(16.0f)};
    Vector2D velocity;
    std::optional<CannonDefinition> cannon;
};

struct PickupDefinition {
    float amount{0.0f};
    Hitbox hitbox{Hitbox::circle(12.0f)};
    Vector2D velocity;
};

struct ShipDefinition {
    Vector2D start{100.0f, 300.0f}; // offset from the box anchor
    Hitbox hitbox{Hitbox::box(48.0f, 32.0f)};
    float speedForward{240.0f};
    float speedBackward{144.0f};
    float speedVertical{240.0f};
};

struct BoxDefinition {
    float width{800.0f};
    float height{600.0f};
    float advancePerTick{1.0f};
};

struct WeaponSet {
    WeaponDefinition bullet;
    WeaponDefinition laser;

    const WeaponDefinition& get(WeaponType type) const {
        return type == WeaponType::Laser ? laser : bullet;
    }
};

/**
 * @brief Level-wide tunables; every gameplay magnitude comes from here
 */
struct GameConstants {
    LedgerConfig ledger;
    float wallContactDamage{0.0f};
    float despawnMarginBehind{64.0f};
    float despawnMarginAhead{400.0f};
    int ticksPerSecond{120};
    BoxDefinition box;
    ShipDefinition ship;
    WeaponSet weapons;
    boost::container::flat_map<HazardKind, HazardDefinition> hazards;
    boost::container::flat_map<PickupKind, PickupDefinition> pickups;

    float tickSeconds() const { return 1.0f / static_cast<float>(ticksPerSecond); }
};

/**
 * @brief Static description of one level: ordered segments, constants,
 * geometry and the interaction table
 */
struct LevelDefinition {
    std::string name;
    uint32_t seed{1};
    GameConstants constants;
    std::vector<SegmentDefinition> segments;
    std::vector<WallDefinition> walls;
    InteractionTable interactions{InteractionTable::createDefault()};

    /// Sum of segment lengths
    float finishPosition() const;

    /// Scroll position where segment @p index begins
    float segmentStart(size_t index) const;

    /// Index of the segment containing @p scroll (the last one at or past Finish)
    size_t segmentAt(float scroll) const;

    /**
     * @brief Cumulative spawn table for segment @p index
     *
     * The segment's own entries, plus entries of earlier segments whose
     * spawn type no later segment up to @p index lists itself.
     */
    std::vector<SpawnEntry> effectiveSpawnTable(size_t index) const;

    /// Every problem found, empty when the definition is usable
    std::vector<std::string> collectErrors() const;

    /// @throws ConfigError listing every problem from collectErrors()
    void validate() const;
};

} // namespace KeeperEngine

#endif // LEVEL_DEFINITION_HPP
