/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef TEST_LEVELS_HPP
#define TEST_LEVELS_HPP

/**
 * @file TestLevels.hpp
 * @brief Level definitions and entity specs built in code for the unit tests
 *
 * Everything here is static: hazards and pickups do not move unless a test
 * gives them a velocity, and the default segment has no spawns, so a test
 * fully controls what is in the registry.
 */

#include "entities/EntityRecord.hpp"
#include "world/LevelDefinition.hpp"

namespace KeeperTest {

using namespace KeeperEngine;

inline LedgerConfig ledgerConfig(float darkMatterMax, float initialDarkMatter, float shieldMax,
                                 float initialShield) {
    LedgerConfig config;
    config.darkMatterMax = darkMatterMax;
    config.initialDarkMatter = initialDarkMatter;
    config.shieldMax = shieldMax;
    config.initialShield = initialShield;
    return config;
}

inline GameConstants basicConstants() {
    GameConstants c;
    c.ledger = ledgerConfig(100.0f, 100.0f, 50.0f, 50.0f);
    c.wallContactDamage = 10.0f;
    c.ticksPerSecond = 100;
    c.box = BoxDefinition{800.0f, 600.0f, 2.0f};
    c.ship.start = Vector2D(100.0f, 300.0f);
    c.ship.hitbox = Hitbox::box(48.0f, 32.0f);

    c.weapons.bullet.cost = 1.0f;
    c.weapons.bullet.damage = 1.0f;
    c.weapons.bullet.speed = 600.0f;
    c.weapons.laser.cost = 2.0f;
    c.weapons.laser.damage = 2.0f;
    c.weapons.laser.speed = 900.0f;
    c.weapons.laser.interval = 0.5f;

    HazardDefinition droid;
    droid.contactDamage = 15.0f;
    c.hazards[HazardKind::Droid] = droid;

    HazardDefinition goat;
    goat.contactDamage = 25.0f;
    goat.health = 3.0f;
    goat.hitbox = Hitbox::box(40.0f, 40.0f);
    c.hazards[HazardKind::Goat] = goat;

    PickupDefinition blue;
    blue.amount = 25.0f;
    c.pickups[PickupKind::BlueBottle] = blue;

    PickupDefinition red;
    red.amount = 30.0f;
    c.pickups[PickupKind::RedBottle] = red;
    return c;
}

inline SegmentDefinition segment(const std::string& name, float length,
                                 float minimumDarkMatter = 0.0f) {
    SegmentDefinition s;
    s.name = name;
    s.length = length;
    s.minimumDarkMatter = minimumDarkMatter;
    return s;
}

inline SpawnEntry spawnEntry(SpawnableType type, int count,
                             SpawnDistribution distribution = SpawnDistribution::Even) {
    SpawnEntry entry;
    entry.type = type;
    entry.count = count;
    entry.distribution = distribution;
    return entry;
}

/// One empty segment; nothing spawns on its own
inline LevelDefinition singleSegmentLevel(float length = 1000.0f, float minimumDarkMatter = 0.0f) {
    LevelDefinition level;
    level.name = "single";
    level.seed = 5;
    level.constants = basicConstants();
    level.segments.push_back(segment("only", length, minimumDarkMatter));
    return level;
}

/// Three segments with cumulative spawn tables
inline LevelDefinition threeSegmentLevel() {
    LevelDefinition level;
    level.name = "three";
    level.seed = 11;
    level.constants = basicConstants();

    SegmentDefinition first = segment("first", 400.0f);
    first.spawns.push_back(spawnEntry(SpawnableType::Droid, 4));

    SegmentDefinition second = segment("second", 600.0f);
    second.spawns.push_back(spawnEntry(SpawnableType::Goat, 2, SpawnDistribution::Clustered));
    second.spawns.push_back(spawnEntry(SpawnableType::BlueBottle, 3, SpawnDistribution::Random));

    SegmentDefinition third = segment("third", 500.0f, 40.0f);
    third.spawns.push_back(spawnEntry(SpawnableType::Droid, 1));
    third.startDarkMatter = 90.0f;

    level.segments = {first, second, third};
    return level;
}

inline EntitySpec shipSpec(float x, float y) {
    EntitySpec spec;
    spec.role = EntityRole::Ship;
    spec.position = Vector2D(x, y);
    spec.hitbox = Hitbox::box(48.0f, 32.0f);
    spec.payload = ShipPayload{};
    return spec;
}

inline EntitySpec hazardSpec(float x, float y, float contactDamage, float health = 1.0f,
                             bool destroyedOnContact = false) {
    EntitySpec spec;
    spec.role = EntityRole::Hazard;
    spec.position = Vector2D(x, y);
    spec.hitbox = Hitbox::circle(16.0f);
    HazardPayload payload;
    payload.kind = HazardKind::Droid;
    payload.contactDamage = contactDamage;
    payload.health = health;
    payload.destroyedOnContact = destroyedOnContact;
    spec.payload = payload;
    return spec;
}

inline EntitySpec pickupSpec(PickupKind kind, float x, float y, float amount) {
    EntitySpec spec;
    spec.role = EntityRole::Pickup;
    spec.position = Vector2D(x, y);
    spec.hitbox = Hitbox::circle(12.0f);
    spec.payload = PickupPayload{kind, amount};
    return spec;
}

inline EntitySpec projectileSpec(ProjectileKind kind, float x, float y, float damage,
                                 EntityID owner = INVALID_ENTITY_ID) {
    EntitySpec spec;
    spec.role = EntityRole::Projectile;
    spec.position = Vector2D(x, y);
    spec.hitbox = Hitbox::circle(4.0f);
    spec.payload = ProjectilePayload{kind, owner, damage};
    return spec;
}

/// Wall from its top-left corner, like WallDefinition
inline EntitySpec wallSpec(float x, float y, float width, float height) {
    EntitySpec spec;
    spec.role = EntityRole::Wall;
    spec.position = Vector2D(x + width * 0.5f, y + height * 0.5f);
    spec.hitbox = Hitbox::box(width, height);
    spec.payload = WallPayload{};
    return spec;
}

} // namespace KeeperTest

#endif // TEST_LEVELS_HPP
