/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE CollisionResolverTests
#include <boost/test/unit_test.hpp>

#include "common/TestLevels.hpp"
#include "core/SimulationErrors.hpp"
#include "events/EventBus.hpp"
#include "managers/CollisionResolver.hpp"
#include "managers/EntityRegistry.hpp"
#include "managers/ResourceLedger.hpp"

#include <algorithm>

using namespace KeeperEngine;
using namespace KeeperTest;

namespace {

struct ResolverFixture {
    explicit ResolverFixture(const LedgerConfig& config = ledgerConfig(100.0f, 100.0f, 50.0f, 50.0f))
        : ledger(config), resolver(InteractionTable::createDefault(), 10.0f) {
        shipId = registry.spawn(shipSpec(100.0f, 100.0f));
        events.beginFrame(1);
    }

    size_t countEvents(SimulationEventType type) const {
        const auto& frame = events.frameEvents();
        return static_cast<size_t>(std::count_if(frame.begin(), frame.end(),
            [type](const SimulationEvent& e) { return e.type == type; }));
    }

    EntityRegistry registry;
    ResourceLedger ledger;
    EventBus events;
    CollisionResolver resolver;
    EntityID shipId{INVALID_ENTITY_ID};
};

struct EmptyLedgerFixture : ResolverFixture {
    EmptyLedgerFixture() : ResolverFixture(ledgerConfig(100.0f, 0.0f, 50.0f, 0.0f)) {}
};

} // anonymous namespace

BOOST_AUTO_TEST_SUITE(ConfigurationTests)

BOOST_AUTO_TEST_CASE(TestIncompleteTableIsRejected) {
    InteractionTable table = InteractionTable::createDefault();
    table.erase(CollisionRole::Ship, CollisionRole::Wall);
    BOOST_CHECK_THROW(CollisionResolver(table, 10.0f), ConfigError);
    BOOST_CHECK_NO_THROW(CollisionResolver(InteractionTable::createDefault(), 10.0f));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(PickupTests, ResolverFixture)

BOOST_AUTO_TEST_CASE(TestRedPickupDrainsDarkMatter) {
    EntityID pickup = registry.spawn(pickupSpec(PickupKind::RedBottle, 100.0f, 100.0f, 30.0f));

    ResolutionReport report = resolver.resolve(registry, ledger, events);
    BOOST_CHECK_EQUAL(report.effectsApplied, 1u);
    BOOST_CHECK_CLOSE(ledger.getDarkMatter(), 70.0f, 0.001f);
    BOOST_CHECK_CLOSE(ledger.getShield(), 50.0f, 0.001f);
    BOOST_CHECK(!registry.isAlive(pickup));
    BOOST_CHECK(registry.isAlive(shipId));
    BOOST_CHECK_EQUAL(countEvents(SimulationEventType::EntityDestroyed), 1u);
}

BOOST_AUTO_TEST_CASE(TestBluePickupCreditsOnce) {
    ledger.debit(50.0f);
    registry.spawn(pickupSpec(PickupKind::BlueBottle, 100.0f, 100.0f, 25.0f));

    resolver.resolve(registry, ledger, events);
    BOOST_CHECK_CLOSE(ledger.getDarkMatter(), 75.0f, 0.001f);

    // The consumed pickup cannot credit again
    resolver.resolve(registry, ledger, events);
    BOOST_CHECK_CLOSE(ledger.getDarkMatter(), 75.0f, 0.001f);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(HazardContactTests, ResolverFixture)

BOOST_AUTO_TEST_CASE(TestContactDamagesShieldAndHazardSurvives) {
    EntityID hazard = registry.spawn(hazardSpec(110.0f, 100.0f, 15.0f));

    ResolutionReport report = resolver.resolve(registry, ledger, events);
    BOOST_CHECK(report.shipDamaged);
    BOOST_CHECK(!report.lethalHit);
    BOOST_CHECK_CLOSE(ledger.getShield(), 35.0f, 0.001f);
    BOOST_CHECK_CLOSE(ledger.getDarkMatter(), 100.0f, 0.001f);
    BOOST_CHECK(registry.isAlive(hazard));
    BOOST_CHECK_EQUAL(countEvents(SimulationEventType::ShipDamaged), 1u);
}

BOOST_AUTO_TEST_CASE(TestPersistingContactIsDebounced) {
    EntityID hazard = registry.spawn(hazardSpec(110.0f, 100.0f, 15.0f));

    resolver.resolve(registry, ledger, events);
    ResolutionReport second = resolver.resolve(registry, ledger, events);
    BOOST_CHECK(!second.shipDamaged);
    BOOST_CHECK_EQUAL(second.pairsSkipped, 1u);
    BOOST_CHECK_CLOSE(ledger.getShield(), 35.0f, 0.001f);

    // Separate for a tick, then touch again
    registry.find(hazard)->position = Vector2D(400.0f, 100.0f);
    resolver.resolve(registry, ledger, events);
    registry.find(hazard)->position = Vector2D(110.0f, 100.0f);
    ResolutionReport again = resolver.resolve(registry, ledger, events);
    BOOST_CHECK(again.shipDamaged);
    BOOST_CHECK_CLOSE(ledger.getShield(), 20.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestContactDestructibleHazardIsRemoved) {
    EntityID hazard = registry.spawn(hazardSpec(110.0f, 100.0f, 10.0f, 1.0f, true));

    ResolutionReport report = resolver.resolve(registry, ledger, events);
    BOOST_CHECK(!registry.isAlive(hazard));
    BOOST_CHECK_CLOSE(ledger.getShield(), 40.0f, 0.001f);
    BOOST_REQUIRE_EQUAL(report.destroyed.size(), 1u);
    BOOST_CHECK_EQUAL(report.destroyed[0], hazard);
}

BOOST_AUTO_TEST_CASE(TestEnemyProjectileHitsShip) {
    EntityID bullet = registry.spawn(projectileSpec(ProjectileKind::EnemyBullet, 100.0f, 100.0f, 8.0f));

    resolver.resolve(registry, ledger, events);
    BOOST_CHECK(!registry.isAlive(bullet));
    BOOST_CHECK_CLOSE(ledger.getShield(), 42.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestFriendlyProjectileIgnoresShip) {
    EntityID bullet = registry.spawn(
        projectileSpec(ProjectileKind::FriendlyBullet, 100.0f, 100.0f, 8.0f, shipId));

    ResolutionReport report = resolver.resolve(registry, ledger, events);
    BOOST_CHECK_EQUAL(report.effectsApplied, 0u);
    BOOST_CHECK(registry.isAlive(bullet));
    BOOST_CHECK_CLOSE(ledger.getShield(), 50.0f, 0.001f);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(LethalTests, EmptyLedgerFixture)

BOOST_AUTO_TEST_CASE(TestUnabsorbedHitAtZeroIsLethal) {
    registry.spawn(hazardSpec(110.0f, 100.0f, 5.0f));

    ResolutionReport report = resolver.resolve(registry, ledger, events);
    BOOST_CHECK(report.lethalHit);
    BOOST_CHECK(!registry.isAlive(shipId));
    BOOST_CHECK(std::find(report.destroyed.begin(), report.destroyed.end(), shipId) !=
                report.destroyed.end());
}

BOOST_AUTO_TEST_CASE(TestDeadShipTakesNoFurtherEffects) {
    // Hazard (id 2) kills the ship first; the pickup (id 3) is never credited
    registry.spawn(hazardSpec(110.0f, 100.0f, 5.0f));
    EntityID pickup = registry.spawn(pickupSpec(PickupKind::BlueBottle, 95.0f, 100.0f, 25.0f));

    ResolutionReport report = resolver.resolve(registry, ledger, events);
    BOOST_CHECK(report.lethalHit);
    BOOST_CHECK_EQUAL(ledger.getDarkMatter(), 0.0f);
    BOOST_CHECK(registry.isAlive(pickup));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(ProjectileTests, ResolverFixture)

BOOST_AUTO_TEST_CASE(TestOneProjectileDamagesOneHazard) {
    EntityID left = registry.spawn(hazardSpec(290.0f, 300.0f, 5.0f));
    EntityID right = registry.spawn(hazardSpec(310.0f, 300.0f, 5.0f));
    EntityID bullet = registry.spawn(
        projectileSpec(ProjectileKind::FriendlyBullet, 300.0f, 300.0f, 1.0f, shipId));

    ResolutionReport report = resolver.resolve(registry, ledger, events);
    BOOST_CHECK(!registry.isAlive(bullet));
    BOOST_CHECK(!registry.isAlive(left));
    BOOST_CHECK(registry.isAlive(right));
    BOOST_CHECK_EQUAL(report.effectsApplied, 1u);
    BOOST_CHECK_EQUAL(report.pairsSkipped, 1u);
}

BOOST_AUTO_TEST_CASE(TestPartialDamageLeavesHazardAlive) {
    EntityID goat = registry.spawn(hazardSpec(300.0f, 300.0f, 5.0f, 3.0f));
    registry.spawn(projectileSpec(ProjectileKind::FriendlyLaser, 300.0f, 300.0f, 2.0f, shipId));

    resolver.resolve(registry, ledger, events);
    const EntityRecord* record = registry.find(goat);
    BOOST_REQUIRE(record != nullptr);
    BOOST_CHECK(record->alive);
    BOOST_CHECK_CLOSE(record->payloadAs<HazardPayload>()->health, 1.0f, 0.001f);

    registry.spawn(projectileSpec(ProjectileKind::FriendlyLaser, 300.0f, 300.0f, 2.0f, shipId));
    resolver.resolve(registry, ledger, events);
    BOOST_CHECK(!registry.isAlive(goat));
}

BOOST_AUTO_TEST_CASE(TestProjectileStopsAtWall) {
    EntityID wall = registry.spawn(wallSpec(500.0f, 0.0f, 50.0f, 600.0f));
    EntityID bullet = registry.spawn(
        projectileSpec(ProjectileKind::FriendlyBullet, 502.0f, 300.0f, 1.0f, shipId));

    resolver.resolve(registry, ledger, events);
    BOOST_CHECK(!registry.isAlive(bullet));
    BOOST_CHECK(registry.isAlive(wall));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(WallTests, ResolverFixture)

BOOST_AUTO_TEST_CASE(TestWallPushesShipOutAndDamagesOnce) {
    EntityID wall = registry.spawn(wallSpec(120.0f, 0.0f, 100.0f, 300.0f));

    ResolutionReport report = resolver.resolve(registry, ledger, events);
    BOOST_REQUIRE_EQUAL(report.shipWallContacts.size(), 1u);
    BOOST_CHECK_EQUAL(report.shipWallContacts[0], wall);
    BOOST_CHECK_CLOSE(ledger.getShield(), 40.0f, 0.001f);
    BOOST_CHECK_CLOSE(registry.getShip()->position.getX(), 96.0f, 0.001f);
    BOOST_CHECK(registry.isAlive(wall));

    // Pushed flush against the wall; touching is not a contact
    ResolutionReport next = resolver.resolve(registry, ledger, events);
    BOOST_CHECK(next.shipWallContacts.empty());
    BOOST_CHECK_CLOSE(ledger.getShield(), 40.0f, 0.001f);
}

BOOST_AUTO_TEST_SUITE_END()
