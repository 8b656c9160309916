/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE ResourceLedgerTests
#include <boost/test/unit_test.hpp>

#include "common/TestLevels.hpp"
#include "core/SimulationErrors.hpp"
#include "managers/ResourceLedger.hpp"

#include <cmath>
#include <limits>
#include <random>

using namespace KeeperEngine;
using KeeperTest::ledgerConfig;

namespace {

struct LedgerFixture {
    LedgerFixture() : ledger(ledgerConfig(100.0f, 100.0f, 50.0f, 50.0f)) {
        ledger.setDepletionListener([this](DebitReason reason) {
            ++depletions;
            lastReason = reason;
        });
    }

    ResourceLedger ledger;
    int depletions{0};
    DebitReason lastReason{DebitReason::Other};
};

} // anonymous namespace

BOOST_AUTO_TEST_SUITE(ConstructionTests)

BOOST_AUTO_TEST_CASE(TestInitialValues) {
    ResourceLedger ledger(ledgerConfig(120.0f, 80.0f, 40.0f, 10.0f));
    BOOST_CHECK_CLOSE(ledger.getDarkMatter(), 80.0f, 0.001f);
    BOOST_CHECK_CLOSE(ledger.getShield(), 10.0f, 0.001f);
    BOOST_CHECK_CLOSE(ledger.getDarkMatterMax(), 120.0f, 0.001f);
    BOOST_CHECK_CLOSE(ledger.getShieldMax(), 40.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestRejectsInvalidConfig) {
    BOOST_CHECK_THROW(ResourceLedger(ledgerConfig(-1.0f, 0.0f, 10.0f, 10.0f)), ConfigError);
    BOOST_CHECK_THROW(ResourceLedger(ledgerConfig(100.0f, 150.0f, 10.0f, 10.0f)), ConfigError);
    BOOST_CHECK_THROW(ResourceLedger(ledgerConfig(100.0f, 50.0f, 10.0f, 20.0f)), ConfigError);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(DebitCreditTests, LedgerFixture)

BOOST_AUTO_TEST_CASE(TestDebitRemovesRequestedAmount) {
    DebitResult result = ledger.debit(30.0f, DebitReason::RedPickup);
    BOOST_CHECK_CLOSE(result.requested, 30.0f, 0.001f);
    BOOST_CHECK_CLOSE(result.removed, 30.0f, 0.001f);
    BOOST_CHECK(!result.depleted);
    BOOST_CHECK(!result.depletionEvent);
    BOOST_CHECK_CLOSE(ledger.getDarkMatter(), 70.0f, 0.001f);
    BOOST_CHECK_CLOSE(ledger.getShield(), 50.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestDebitClampsAtZero) {
    ledger.debit(80.0f);
    DebitResult result = ledger.debit(50.0f);
    BOOST_CHECK_CLOSE(result.removed, 20.0f, 0.001f);
    BOOST_CHECK(result.depleted);
    BOOST_CHECK(result.depletionEvent);
    BOOST_CHECK_EQUAL(ledger.getDarkMatter(), 0.0f);
}

BOOST_AUTO_TEST_CASE(TestDepletionFiresOncePerTransition) {
    ledger.debit(100.0f, DebitReason::WeaponFire);
    BOOST_CHECK_EQUAL(depletions, 1);
    BOOST_CHECK(lastReason == DebitReason::WeaponFire);

    // Further debits at zero stay silent
    DebitResult again = ledger.debit(10.0f);
    BOOST_CHECK(again.depleted);
    BOOST_CHECK(!again.depletionEvent);
    BOOST_CHECK_EQUAL(again.removed, 0.0f);
    ledger.debit(0.0f);
    BOOST_CHECK_EQUAL(depletions, 1);

    // 0 -> >0 -> 0 is a new cycle
    ledger.credit(5.0f);
    ledger.debit(5.0f, DebitReason::RedPickup);
    BOOST_CHECK_EQUAL(depletions, 2);
    BOOST_CHECK(lastReason == DebitReason::RedPickup);
}

BOOST_AUTO_TEST_CASE(TestCreditClampsAtMax) {
    ledger.debit(10.0f);
    float added = ledger.credit(30.0f);
    BOOST_CHECK_CLOSE(added, 10.0f, 0.001f);
    BOOST_CHECK_CLOSE(ledger.getDarkMatter(), 100.0f, 0.001f);
    BOOST_CHECK_EQUAL(depletions, 0);
}

BOOST_AUTO_TEST_CASE(TestNegativeAmountsAreRejected) {
    BOOST_CHECK_THROW(ledger.debit(-1.0f), ContractViolation);
    BOOST_CHECK_THROW(ledger.credit(-1.0f), ContractViolation);
    BOOST_CHECK_THROW(ledger.damageShield(-5.0f), ContractViolation);
    BOOST_CHECK_THROW(ledger.costWeaponFire(-2.0f), ContractViolation);
    BOOST_CHECK_THROW(ledger.debit(std::numeric_limits<float>::quiet_NaN()), ContractViolation);
    BOOST_CHECK_THROW(ledger.credit(std::numeric_limits<float>::infinity()), ContractViolation);

    // Rejections leave the values alone
    BOOST_CHECK_CLOSE(ledger.getDarkMatter(), 100.0f, 0.001f);
    BOOST_CHECK_CLOSE(ledger.getShield(), 50.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestRandomSequencesStayInBounds) {
    std::mt19937 rng(1234);
    std::uniform_real_distribution<float> amount(0.0f, 60.0f);
    std::uniform_int_distribution<int> operation(0, 4);

    for (int i = 0; i < 5000; ++i) {
        float value = amount(rng);
        switch (operation(rng)) {
            case 0: ledger.debit(value); break;
            case 1: ledger.credit(value); break;
            case 2: ledger.damageShield(value); break;
            case 3: ledger.applyShipDamage(value); break;
            case 4: ledger.costWeaponFire(value); break;
        }
        BOOST_REQUIRE(ledger.getDarkMatter() >= 0.0f);
        BOOST_REQUIRE(ledger.getDarkMatter() <= ledger.getDarkMatterMax());
        BOOST_REQUIRE(ledger.getShield() >= 0.0f);
        BOOST_REQUIRE(ledger.getShield() <= ledger.getShieldMax());
    }
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(ShieldTests, LedgerFixture)

BOOST_AUTO_TEST_CASE(TestShieldAbsorbsUpToItsValue) {
    ShieldDamageResult first = ledger.damageShield(20.0f);
    BOOST_CHECK_CLOSE(first.absorbed, 20.0f, 0.001f);
    BOOST_CHECK_EQUAL(first.remainder, 0.0f);

    ShieldDamageResult second = ledger.damageShield(40.0f);
    BOOST_CHECK_CLOSE(second.absorbed, 30.0f, 0.001f);
    BOOST_CHECK_CLOSE(second.remainder, 10.0f, 0.001f);
    BOOST_CHECK_EQUAL(ledger.getShield(), 0.0f);

    // damageShield alone never touches dark matter
    BOOST_CHECK_CLOSE(ledger.getDarkMatter(), 100.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestShipDamageRoutesRemainderToDarkMatter) {
    ShipDamageResult result = ledger.applyShipDamage(65.0f);
    BOOST_CHECK_CLOSE(result.absorbed, 50.0f, 0.001f);
    BOOST_CHECK_CLOSE(result.debit.removed, 15.0f, 0.001f);
    BOOST_CHECK(!result.lethal);
    BOOST_CHECK_CLOSE(ledger.getDarkMatter(), 85.0f, 0.001f);
    BOOST_CHECK_EQUAL(ledger.getShield(), 0.0f);
}

BOOST_AUTO_TEST_CASE(TestShipDamageLethalOnlyWhenAlreadyEmpty) {
    ResourceLedger lean(ledgerConfig(100.0f, 20.0f, 50.0f, 0.0f));
    int events = 0;
    lean.setDepletionListener([&events](DebitReason) { ++events; });

    ShipDamageResult first = lean.applyShipDamage(15.0f);
    BOOST_CHECK_EQUAL(first.absorbed, 0.0f);
    BOOST_CHECK_CLOSE(lean.getDarkMatter(), 5.0f, 0.001f);
    BOOST_CHECK(!first.lethal);
    BOOST_CHECK_EQUAL(events, 0);

    ShipDamageResult second = lean.applyShipDamage(15.0f);
    BOOST_CHECK_EQUAL(lean.getDarkMatter(), 0.0f);
    BOOST_CHECK(second.debit.depletionEvent);
    BOOST_CHECK(!second.lethal);
    BOOST_CHECK_EQUAL(events, 1);

    ShipDamageResult third = lean.applyShipDamage(1.0f);
    BOOST_CHECK(third.lethal);
    BOOST_CHECK_EQUAL(events, 1);
}

BOOST_AUTO_TEST_CASE(TestFullyAbsorbedHitIsNeverLethal) {
    ResourceLedger empty(ledgerConfig(100.0f, 0.0f, 50.0f, 50.0f));
    ShipDamageResult result = empty.applyShipDamage(10.0f);
    BOOST_CHECK(!result.lethal);
    BOOST_CHECK_CLOSE(empty.getShield(), 40.0f, 0.001f);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(WeaponCostTests, LedgerFixture)

BOOST_AUTO_TEST_CASE(TestUnaffordableShotChargesNothing) {
    ledger.debit(95.0f);
    WeaponCostResult result = ledger.costWeaponFire(6.0f);
    BOOST_CHECK(!result.paid);
    BOOST_CHECK_EQUAL(result.debit.removed, 0.0f);
    BOOST_CHECK_CLOSE(ledger.getDarkMatter(), 5.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestExactCostEmptiesAndSignals) {
    ledger.debit(95.0f);
    WeaponCostResult result = ledger.costWeaponFire(5.0f);
    BOOST_CHECK(result.paid);
    BOOST_CHECK(result.debit.depletionEvent);
    BOOST_CHECK_EQUAL(ledger.getDarkMatter(), 0.0f);
    BOOST_CHECK_EQUAL(depletions, 1);
    BOOST_CHECK(lastReason == DebitReason::WeaponFire);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(RechargeTests)

BOOST_AUTO_TEST_CASE(TestRechargeMovesDarkMatterIntoShield) {
    LedgerConfig config = ledgerConfig(100.0f, 100.0f, 50.0f, 40.0f);
    config.shieldRechargeAmount = 5.0f;
    config.shieldRechargeInterval = 0.5f;
    ResourceLedger ledger(config);

    DebitResult partial = ledger.rechargeShield(0.25f);
    BOOST_CHECK_EQUAL(partial.removed, 0.0f);
    BOOST_CHECK_CLOSE(ledger.getShield(), 40.0f, 0.001f);

    DebitResult step = ledger.rechargeShield(0.25f);
    BOOST_CHECK_CLOSE(step.removed, 5.0f, 0.001f);
    BOOST_CHECK_CLOSE(ledger.getShield(), 45.0f, 0.001f);
    BOOST_CHECK_CLOSE(ledger.getDarkMatter(), 95.0f, 0.001f);

    // Two intervals elapse; the second finds the shield full
    DebitResult burst = ledger.rechargeShield(1.0f);
    BOOST_CHECK_CLOSE(burst.removed, 5.0f, 0.001f);
    BOOST_CHECK_CLOSE(ledger.getShield(), 50.0f, 0.001f);
    BOOST_CHECK_CLOSE(ledger.getDarkMatter(), 90.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestRechargeNeedsEnoughDarkMatter) {
    LedgerConfig config = ledgerConfig(100.0f, 3.0f, 50.0f, 0.0f);
    config.shieldRechargeAmount = 5.0f;
    config.shieldRechargeInterval = 0.5f;
    ResourceLedger ledger(config);

    ledger.rechargeShield(2.0f);
    BOOST_CHECK_CLOSE(ledger.getDarkMatter(), 3.0f, 0.001f);
    BOOST_CHECK_EQUAL(ledger.getShield(), 0.0f);
}

BOOST_AUTO_TEST_CASE(TestRechargeCanDeplete) {
    LedgerConfig config = ledgerConfig(100.0f, 5.0f, 50.0f, 0.0f);
    config.shieldRechargeAmount = 5.0f;
    config.shieldRechargeInterval = 0.5f;
    ResourceLedger ledger(config);
    int events = 0;
    ledger.setDepletionListener([&events](DebitReason reason) {
        BOOST_CHECK(reason == DebitReason::ShieldRecharge);
        ++events;
    });

    DebitResult result = ledger.rechargeShield(0.5f);
    BOOST_CHECK(result.depletionEvent);
    BOOST_CHECK_EQUAL(ledger.getDarkMatter(), 0.0f);
    BOOST_CHECK_CLOSE(ledger.getShield(), 5.0f, 0.001f);
    BOOST_CHECK_EQUAL(events, 1);
}

BOOST_AUTO_TEST_CASE(TestDisabledRechargeIsANoOp) {
    ResourceLedger ledger(ledgerConfig(100.0f, 100.0f, 50.0f, 10.0f));
    ledger.rechargeShield(10.0f);
    BOOST_CHECK_CLOSE(ledger.getShield(), 10.0f, 0.001f);
    BOOST_CHECK_CLOSE(ledger.getDarkMatter(), 100.0f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestResetRestoresInitialValues) {
    ResourceLedger ledger(ledgerConfig(100.0f, 60.0f, 50.0f, 30.0f));
    ledger.applyShipDamage(70.0f);
    ledger.reset();
    BOOST_CHECK_CLOSE(ledger.getDarkMatter(), 60.0f, 0.001f);
    BOOST_CHECK_CLOSE(ledger.getShield(), 30.0f, 0.001f);
}

BOOST_AUTO_TEST_SUITE_END()
