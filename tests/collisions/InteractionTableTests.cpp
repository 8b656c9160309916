/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE InteractionTableTests
#include <boost/test/unit_test.hpp>

#include "collisions/InteractionTable.hpp"
#include "core/SimulationErrors.hpp"

#include <string>

using namespace KeeperEngine;

BOOST_AUTO_TEST_SUITE(DefaultTableTests)

BOOST_AUTO_TEST_CASE(TestDefaultTableIsComplete)
{
    InteractionTable table = InteractionTable::createDefault();
    BOOST_CHECK_EQUAL(InteractionTable::REQUIRED_PAIRS, 28u);
    BOOST_CHECK_EQUAL(table.size(), InteractionTable::REQUIRED_PAIRS);
    BOOST_CHECK(table.isComplete());
    BOOST_CHECK_NO_THROW(table.validate());
}

BOOST_AUTO_TEST_CASE(TestStockEffects)
{
    InteractionTable table = InteractionTable::createDefault();
    BOOST_CHECK(table.lookup(CollisionRole::Ship, CollisionRole::Hazard) ==
                InteractionEffect::ShipHazardContact);
    BOOST_CHECK(table.lookup(CollisionRole::RedPickup, CollisionRole::Ship) ==
                InteractionEffect::ShipDarkMatterDrain);
    BOOST_CHECK(table.lookup(CollisionRole::Ship, CollisionRole::BluePickup) ==
                InteractionEffect::ShipDarkMatterCredit);
    BOOST_CHECK(table.lookup(CollisionRole::Wall, CollisionRole::Ship) ==
                InteractionEffect::ShipWallContact);
    BOOST_CHECK(table.lookup(CollisionRole::FriendlyProjectile, CollisionRole::Hazard) ==
                InteractionEffect::HazardProjectileHit);
    BOOST_CHECK(table.lookup(CollisionRole::Ship, CollisionRole::FriendlyProjectile) ==
                InteractionEffect::None);
    BOOST_CHECK(table.lookup(CollisionRole::Hazard, CollisionRole::Hazard) ==
                InteractionEffect::None);
}

BOOST_AUTO_TEST_CASE(TestLookupIsOrderIndependent)
{
    InteractionTable table = InteractionTable::createDefault();
    for (size_t i = 0; i < COLLISION_ROLE_COUNT; ++i) {
        for (size_t j = 0; j < COLLISION_ROLE_COUNT; ++j) {
            auto a = static_cast<CollisionRole>(i);
            auto b = static_cast<CollisionRole>(j);
            BOOST_CHECK(table.lookup(a, b) == table.lookup(b, a));
        }
    }
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(ConfigurationTests)

BOOST_AUTO_TEST_CASE(TestOverrideReplacesEffect)
{
    InteractionTable table = InteractionTable::createDefault();
    table.set(CollisionRole::Wall, CollisionRole::EnemyProjectile, InteractionEffect::None);
    BOOST_CHECK(table.lookup(CollisionRole::EnemyProjectile, CollisionRole::Wall) ==
                InteractionEffect::None);
    BOOST_CHECK_EQUAL(table.size(), InteractionTable::REQUIRED_PAIRS);
}

BOOST_AUTO_TEST_CASE(TestMismatchedEffectRejected)
{
    InteractionTable table = InteractionTable::createDefault();
    BOOST_CHECK_THROW(table.set(CollisionRole::Hazard, CollisionRole::Wall,
                                InteractionEffect::ShipWallContact),
                      ConfigError);
    BOOST_CHECK_THROW(table.set(CollisionRole::Ship, CollisionRole::Hazard,
                                InteractionEffect::ShipDarkMatterCredit),
                      ConfigError);
    // Rejected sets leave the table untouched
    BOOST_CHECK(table.lookup(CollisionRole::Ship, CollisionRole::Hazard) ==
                InteractionEffect::ShipHazardContact);
}

BOOST_AUTO_TEST_CASE(TestMissingPairsAreListed)
{
    InteractionTable table = InteractionTable::createDefault();
    table.erase(CollisionRole::Ship, CollisionRole::Wall);
    table.erase(CollisionRole::Hazard, CollisionRole::RedPickup);

    auto missing = table.missingPairs();
    BOOST_REQUIRE_EQUAL(missing.size(), 2u);
    BOOST_CHECK_EQUAL(missing[0], "ship x wall");
    BOOST_CHECK_EQUAL(missing[1], "hazard x redPickup");
    BOOST_CHECK(!table.isComplete());
    BOOST_CHECK(!table.find(CollisionRole::Wall, CollisionRole::Ship).has_value());

    try {
        table.validate();
        BOOST_FAIL("validate() accepted an incomplete table");
    } catch (const ConfigError& e) {
        std::string what = e.what();
        BOOST_CHECK(what.find("ship x wall") != std::string::npos);
        BOOST_CHECK(what.find("hazard x redPickup") != std::string::npos);
    }
}

BOOST_AUTO_TEST_CASE(TestLookupOfMissingPairIsContractViolation)
{
    InteractionTable table;
    BOOST_CHECK_EQUAL(table.missingPairs().size(), InteractionTable::REQUIRED_PAIRS);
    BOOST_CHECK_THROW(table.lookup(CollisionRole::Ship, CollisionRole::Hazard), ContractViolation);
}

BOOST_AUTO_TEST_CASE(TestEffectNames)
{
    for (size_t i = 0; i < static_cast<size_t>(InteractionEffect::COUNT); ++i) {
        auto effect = static_cast<InteractionEffect>(i);
        auto parsed = InteractionTraits::effectFromString(InteractionTraits::effectToString(effect));
        BOOST_REQUIRE(parsed.has_value());
        BOOST_CHECK(*parsed == effect);
    }
    BOOST_CHECK(!InteractionTraits::effectFromString("explode").has_value());
}

BOOST_AUTO_TEST_SUITE_END()
