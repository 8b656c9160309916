/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/LevelLoader.hpp"
#include "core/Logger.hpp"
#include "core/SimulationErrors.hpp"
#include "utils/JsonReader.hpp"

#include <format>
#include <optional>
#include <vector>

namespace KeeperEngine {

namespace {

using Errors = std::vector<std::string>;

// Reads a number member. A missing key falls back when a default exists,
// otherwise it is reported as required.
float readNumber(const JsonValue& object, const std::string& key, const std::string& path,
                 Errors& errors, std::optional<float> fallback = std::nullopt) {
    const JsonValue* value = object.find(key);
    if (!value) {
        if (!fallback) {
            errors.push_back(std::format("{}.{} is required", path, key));
            return 0.0f;
        }
        return *fallback;
    }
    auto number = value->tryAsNumber();
    if (!number) {
        errors.push_back(std::format("{}.{} must be a number", path, key));
        return fallback.value_or(0.0f);
    }
    return static_cast<float>(*number);
}

bool readBool(const JsonValue& object, const std::string& key, const std::string& path,
              Errors& errors, bool fallback) {
    const JsonValue* value = object.find(key);
    if (!value) {
        return fallback;
    }
    auto flag = value->tryAsBool();
    if (!flag) {
        errors.push_back(std::format("{}.{} must be true or false", path, key));
        return fallback;
    }
    return *flag;
}

std::optional<std::string> readString(const JsonValue& object, const std::string& key,
                                      const std::string& path, Errors& errors, bool required) {
    const JsonValue* value = object.find(key);
    if (!value) {
        if (required) {
            errors.push_back(std::format("{}.{} is required", path, key));
        }
        return std::nullopt;
    }
    auto text = value->tryAsString();
    if (!text) {
        errors.push_back(std::format("{}.{} must be a string", path, key));
    }
    return text;
}

// Object member that must be an object when present
const JsonValue* readObject(const JsonValue& object, const std::string& key,
                            const std::string& path, Errors& errors, bool required) {
    const JsonValue* value = object.find(key);
    if (!value) {
        if (required) {
            errors.push_back(std::format("{}.{} is required", path, key));
        }
        return nullptr;
    }
    if (!value->isObject()) {
        errors.push_back(std::format("{}.{} must be an object", path, key));
        return nullptr;
    }
    return value;
}

const JsonArray* readArray(const JsonValue& object, const std::string& key,
                           const std::string& path, Errors& errors, bool required) {
    const JsonValue* value = object.find(key);
    if (!value) {
        if (required) {
            errors.push_back(std::format("{}.{} is required", path, key));
        }
        return nullptr;
    }
    const JsonArray* array = value->tryAsArray();
    if (!array) {
        errors.push_back(std::format("{}.{} must be an array", path, key));
    }
    return array;
}

Vector2D readVector(const JsonValue& object, const std::string& key, const std::string& path,
                    Errors& errors, Vector2D fallback) {
    const JsonValue* value = readObject(object, key, path, errors, false);
    if (!value) {
        return fallback;
    }
    std::string inner = path + "." + key;
    return Vector2D(readNumber(*value, "x", inner, errors),
                    readNumber(*value, "y", inner, errors));
}

Hitbox readHitbox(const JsonValue& object, const std::string& path, Errors& errors,
                  const Hitbox& fallback) {
    const JsonValue* value = readObject(object, "hitbox", path, errors, false);
    if (!value) {
        return fallback;
    }
    std::string inner = path + ".hitbox";
    auto shape = readString(*value, "shape", inner, errors, true);
    if (!shape) {
        return fallback;
    }
    if (*shape == "circle") {
        return Hitbox::circle(readNumber(*value, "radius", inner, errors));
    }
    if (*shape == "box") {
        return Hitbox::box(readNumber(*value, "width", inner, errors),
                           readNumber(*value, "height", inner, errors));
    }
    errors.push_back(std::format("{}.shape '{}' is not 'circle' or 'box'", inner, *shape));
    return fallback;
}

std::vector<Vector2D> readHeadings(const JsonValue& object, const std::string& path,
                                   Errors& errors, const std::vector<Vector2D>& fallback) {
    const JsonArray* array = readArray(object, "headings", path, errors, false);
    if (!array) {
        return fallback;
    }
    std::vector<Vector2D> headings;
    for (size_t i = 0; i < array->size(); ++i) {
        const JsonValue& heading = (*array)[i];
        std::string inner = std::format("{}.headings[{}]", path, i);
        if (!heading.isObject()) {
            errors.push_back(inner + " must be an object");
            continue;
        }
        headings.emplace_back(readNumber(heading, "x", inner, errors),
                              readNumber(heading, "y", inner, errors));
    }
    return headings;
}

WeaponDefinition readWeapon(const JsonValue& object, const std::string& path, Errors& errors) {
    WeaponDefinition weapon;
    weapon.cost = readNumber(object, "cost", path, errors);
    weapon.damage = readNumber(object, "damage", path, errors);
    weapon.speed = readNumber(object, "speed", path, errors, 600.0f);
    weapon.interval = readNumber(object, "interval", path, errors, weapon.interval);
    weapon.radius = readNumber(object, "radius", path, errors, weapon.radius);
    weapon.headings = readHeadings(object, path, errors, weapon.headings);
    return weapon;
}

CannonDefinition readCannon(const JsonValue& object, const std::string& path, Errors& errors) {
    CannonDefinition cannon;
    if (auto projectile = readString(object, "projectile", path, errors, false)) {
        auto kind = RoleTraits::projectileFromString(*projectile);
        if (kind) {
            cannon.projectile = *kind;
        } else {
            errors.push_back(std::format("{}.projectile '{}' is unknown", path, *projectile));
        }
    }
    cannon.damage = readNumber(object, "damage", path, errors);
    cannon.speed = readNumber(object, "speed", path, errors, 300.0f);
    cannon.interval = readNumber(object, "interval", path, errors, cannon.interval);
    cannon.radius = readNumber(object, "radius", path, errors, cannon.radius);
    cannon.headings = readHeadings(object, path, errors, cannon.headings);
    return cannon;
}

void readHazards(const JsonValue& hazards, GameConstants& constants, Errors& errors) {
    for (const auto& [name, value] : hazards.asObject()) {
        std::string path = "constants.hazards." + name;
        auto kind = RoleTraits::hazardFromString(name);
        if (!kind) {
            errors.push_back(std::format("{} is not a known hazard", path));
            continue;
        }
        if (!value.isObject()) {
            errors.push_back(path + " must be an object");
            continue;
        }
        HazardDefinition hazard;
        hazard.contactDamage = readNumber(value, "contactDamage", path, errors);
        hazard.health = readNumber(value, "health", path, errors, 1.0f);
        hazard.destroyedOnContact = readBool(value, "destroyedOnContact", path, errors, false);
        hazard.hitbox = readHitbox(value, path, errors, hazard.hitbox);
        hazard.velocity = readVector(value, "velocity", path, errors, hazard.velocity);
        if (const JsonValue* cannon = readObject(value, "cannon", path, errors, false)) {
            hazard.cannon = readCannon(*cannon, path + ".cannon", errors);
        }
        constants.hazards[*kind] = std::move(hazard);
    }
}

void readPickups(const JsonValue& pickups, GameConstants& constants, Errors& errors) {
    for (const auto& [name, value] : pickups.asObject()) {
        std::string path = "constants.pickups." + name;
        auto kind = RoleTraits::pickupFromString(name);
        if (!kind) {
            errors.push_back(std::format("{} is not a known pickup", path));
            continue;
        }
        if (!value.isObject()) {
            errors.push_back(path + " must be an object");
            continue;
        }
        PickupDefinition pickup;
        pickup.amount = readNumber(value, "amount", path, errors);
        pickup.hitbox = readHitbox(value, path, errors, pickup.hitbox);
        pickup.velocity = readVector(value, "velocity", path, errors, pickup.velocity);
        constants.pickups[*kind] = pickup;
    }
}

void readConstants(const JsonValue& object, GameConstants& c, Errors& errors) {
    const std::string path = "constants";
    c.ledger.darkMatterMax = readNumber(object, "darkMatterMax", path, errors);
    c.ledger.initialDarkMatter =
        readNumber(object, "initialDarkMatter", path, errors, c.ledger.darkMatterMax);
    c.ledger.shieldMax = readNumber(object, "shieldMax", path, errors);
    c.ledger.initialShield = readNumber(object, "initialShield", path, errors, c.ledger.shieldMax);
    c.ledger.shieldRechargeAmount = readNumber(object, "shieldRechargeAmount", path, errors, 0.0f);
    c.ledger.shieldRechargeInterval =
        readNumber(object, "shieldRechargeInterval", path, errors, c.ledger.shieldRechargeInterval);
    c.wallContactDamage = readNumber(object, "wallContactDamage", path, errors);
    c.despawnMarginBehind =
        readNumber(object, "despawnMarginBehind", path, errors, c.despawnMarginBehind);
    c.despawnMarginAhead =
        readNumber(object, "despawnMarginAhead", path, errors, c.despawnMarginAhead);

    if (const JsonValue* box = readObject(object, "box", path, errors, true)) {
        c.box.width = readNumber(*box, "width", "constants.box", errors);
        c.box.height = readNumber(*box, "height", "constants.box", errors);
        c.box.advancePerTick = readNumber(*box, "advancePerTick", "constants.box", errors);
    }

    if (const JsonValue* ship = readObject(object, "ship", path, errors, false)) {
        const std::string shipPath = "constants.ship";
        c.ship.start = readVector(*ship, "start", shipPath, errors, c.ship.start);
        c.ship.hitbox = readHitbox(*ship, shipPath, errors, c.ship.hitbox);
        c.ship.speedForward = readNumber(*ship, "speedForward", shipPath, errors, c.ship.speedForward);
        c.ship.speedBackward = readNumber(*ship, "speedBackward", shipPath, errors, c.ship.speedBackward);
        c.ship.speedVertical = readNumber(*ship, "speedVertical", shipPath, errors, c.ship.speedVertical);
    }

    if (const JsonValue* weapons = readObject(object, "weapons", path, errors, true)) {
        if (const JsonValue* bullet = readObject(*weapons, "bullet", "constants.weapons", errors, true)) {
            c.weapons.bullet = readWeapon(*bullet, "constants.weapons.bullet", errors);
        }
        if (const JsonValue* laser = readObject(*weapons, "laser", "constants.weapons", errors, true)) {
            c.weapons.laser = readWeapon(*laser, "constants.weapons.laser", errors);
        }
    }

    if (const JsonValue* hazards = readObject(object, "hazards", path, errors, false)) {
        readHazards(*hazards, c, errors);
    }
    if (const JsonValue* pickups = readObject(object, "pickups", path, errors, false)) {
        readPickups(*pickups, c, errors);
    }
}

SpawnEntry readSpawn(const JsonValue& object, const std::string& path, Errors& errors) {
    SpawnEntry entry;
    if (auto type = readString(object, "type", path, errors, true)) {
        auto parsed = SpawnTraits::typeFromString(*type);
        if (parsed) {
            entry.type = *parsed;
        } else {
            errors.push_back(std::format("{}.type '{}' is unknown", path, *type));
        }
    }
    const JsonValue* count = object.find("count");
    if (count) {
        auto value = count->tryAsInt();
        if (value) {
            entry.count = *value;
        } else {
            errors.push_back(path + ".count must be an integer");
        }
    }
    if (auto distribution = readString(object, "distribution", path, errors, false)) {
        auto parsed = SpawnTraits::distributionFromString(*distribution);
        if (parsed) {
            entry.distribution = *parsed;
        } else {
            errors.push_back(std::format("{}.distribution '{}' is not even, clustered or random",
                                         path, *distribution));
        }
    }
    entry.laneMin = readNumber(object, "laneMin", path, errors, entry.laneMin);
    entry.laneMax = readNumber(object, "laneMax", path, errors, entry.laneMax);
    entry.clusterSpan = readNumber(object, "clusterSpan", path, errors, entry.clusterSpan);
    return entry;
}

void readSegments(const JsonArray& array, LevelDefinition& level, Errors& errors) {
    for (size_t i = 0; i < array.size(); ++i) {
        const JsonValue& value = array[i];
        std::string path = std::format("segments[{}]", i);
        if (!value.isObject()) {
            errors.push_back(path + " must be an object");
            continue;
        }
        SegmentDefinition segment;
        segment.name = readString(value, "name", path, errors, false)
                           .value_or(std::format("segment {}", i + 1));
        segment.length = readNumber(value, "length", path, errors);
        segment.minimumDarkMatter = readNumber(value, "minimumDarkMatter", path, errors, 0.0f);
        if (value.hasKey("startDarkMatter")) {
            segment.startDarkMatter = readNumber(value, "startDarkMatter", path, errors);
        }
        if (const JsonArray* spawns = readArray(value, "spawns", path, errors, false)) {
            for (size_t j = 0; j < spawns->size(); ++j) {
                std::string spawnPath = std::format("{}.spawns[{}]", path, j);
                if (!(*spawns)[j].isObject()) {
                    errors.push_back(spawnPath + " must be an object");
                    continue;
                }
                segment.spawns.push_back(readSpawn((*spawns)[j], spawnPath, errors));
            }
        }
        level.segments.push_back(std::move(segment));
    }
}

void readWalls(const JsonArray& array, LevelDefinition& level, Errors& errors) {
    for (size_t i = 0; i < array.size(); ++i) {
        const JsonValue& value = array[i];
        std::string path = std::format("walls[{}]", i);
        if (!value.isObject()) {
            errors.push_back(path + " must be an object");
            continue;
        }
        WallDefinition wall;
        wall.x = readNumber(value, "x", path, errors);
        wall.y = readNumber(value, "y", path, errors);
        wall.width = readNumber(value, "width", path, errors);
        wall.height = readNumber(value, "height", path, errors);
        level.walls.push_back(wall);
    }
}

void readInteractions(const JsonArray& array, LevelDefinition& level, Errors& errors) {
    for (size_t i = 0; i < array.size(); ++i) {
        const JsonValue& value = array[i];
        std::string path = std::format("interactions[{}]", i);
        if (!value.isObject()) {
            errors.push_back(path + " must be an object");
            continue;
        }
        auto a = readString(value, "a", path, errors, true);
        auto b = readString(value, "b", path, errors, true);
        auto effect = readString(value, "effect", path, errors, true);
        if (!a || !b || !effect) {
            continue;
        }

        auto roleA = RoleTraits::collisionRoleFromString(*a);
        auto roleB = RoleTraits::collisionRoleFromString(*b);
        auto parsedEffect = InteractionTraits::effectFromString(*effect);
        if (!roleA || !roleB) {
            errors.push_back(std::format("{} names an unknown role ({} x {})", path, *a, *b));
            continue;
        }
        if (!parsedEffect) {
            errors.push_back(std::format("{}.effect '{}' is unknown", path, *effect));
            continue;
        }
        if (!InteractionTraits::effectFitsRoles(*parsedEffect, *roleA, *roleB)) {
            errors.push_back(std::format("{}: effect '{}' cannot apply to {} x {}", path,
                                         *effect, *a, *b));
            continue;
        }
        level.interactions.set(*roleA, *roleB, *parsedEffect);
    }
}

} // anonymous namespace

bool LevelLoader::loadFromFile(const std::string& path) {
    JsonReader reader;
    if (!reader.loadFromFile(path)) {
        m_lastError = std::format("Level '{}': {}", path, reader.getLastError());
        LEVELLOADER_ERROR(m_lastError);
        return false;
    }
    return build(reader.getRoot(), path);
}

bool LevelLoader::parse(const std::string& json) {
    JsonReader reader;
    if (!reader.parse(json)) {
        m_lastError = std::format("Level '<string>': {}", reader.getLastError());
        LEVELLOADER_ERROR(m_lastError);
        return false;
    }
    return build(reader.getRoot(), "<string>");
}

bool LevelLoader::build(const JsonValue& root, const std::string& source) {
    m_level = LevelDefinition{};
    m_lastError.clear();
    Errors errors;

    if (!root.isObject()) {
        errors.push_back("root must be an object");
    } else {
        m_level.name = readString(root, "name", "level", errors, true).value_or("");
        const JsonValue* seed = root.find("seed");
        if (seed) {
            auto value = seed->tryAsInt();
            if (value && *value >= 0) {
                m_level.seed = static_cast<uint32_t>(*value);
            } else {
                errors.push_back("level.seed must be a non-negative integer");
            }
        }
        const JsonValue* ticks = root.find("ticksPerSecond");
        if (ticks) {
            auto value = ticks->tryAsInt();
            if (value) {
                m_level.constants.ticksPerSecond = *value;
            } else {
                errors.push_back("level.ticksPerSecond must be an integer");
            }
        }

        if (const JsonValue* constants = readObject(root, "constants", "level", errors, true)) {
            readConstants(*constants, m_level.constants, errors);
        }
        if (const JsonArray* segments = readArray(root, "segments", "level", errors, true)) {
            readSegments(*segments, m_level, errors);
        }
        if (const JsonArray* walls = readArray(root, "walls", "level", errors, false)) {
            readWalls(*walls, m_level, errors);
        }
        if (const JsonArray* interactions = readArray(root, "interactions", "level", errors, false)) {
            readInteractions(*interactions, m_level, errors);
        }
    }

    // Semantic checks only make sense once the structure parsed
    if (errors.empty()) {
        errors = m_level.collectErrors();
    }

    if (!errors.empty()) {
        m_lastError = std::format("Level '{}' rejected with {} problem(s):", source, errors.size());
        for (const auto& error : errors) {
            m_lastError += "\n  - " + error;
        }
        LEVELLOADER_ERROR(m_lastError);
        return false;
    }

    LEVELLOADER_INFO(std::format("Loaded level '{}' ({} segments, {} walls, finish at {:.0f})",
                                 m_level.name, m_level.segments.size(), m_level.walls.size(),
                                 m_level.finishPosition()));
    return true;
}

LevelDefinition LevelLoader::loadOrThrow(const std::string& path) {
    LevelLoader loader;
    if (!loader.loadFromFile(path)) {
        throw ConfigError(loader.getLastError());
    }
    return loader.getLevel();
}

} // namespace KeeperEngine
