/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE GameSessionTests
#include <boost/test/unit_test.hpp>

#include "common/TestLevels.hpp"
#include "core/GameSession.hpp"
#include "core/Logger.hpp"
#include "core/SimulationErrors.hpp"

using namespace KeeperEngine;
using namespace KeeperTest;

namespace {

LevelDefinition namedLevel(const std::string& name, float length) {
    LevelDefinition level = singleSegmentLevel(length);
    level.name = name;
    return level;
}

// Ticks until the predicate holds or the cap is hit
template <typename Pred>
int tickUntil(GameSession& session, Pred done, int cap = 1000) {
    int ticks = 0;
    while (!done() && ticks < cap) {
        session.tick(InputIntent{});
        ++ticks;
    }
    return ticks;
}

void killShip(GameSession& session) {
    Simulation& sim = session.getSimulation();
    const Vector2D at = sim.getRegistry().getShip()->position;
    sim.getRegistry().spawn(hazardSpec(at.getX(), at.getY(), 500.0f));
}

struct QuietLogs {
    QuietLogs() { KEEPER_ENABLE_BENCHMARK_MODE(); }
    ~QuietLogs() { KEEPER_DISABLE_BENCHMARK_MODE(); }
};

} // anonymous namespace

BOOST_GLOBAL_FIXTURE(QuietLogs);

BOOST_AUTO_TEST_SUITE(SessionConstructionTests)

BOOST_AUTO_TEST_CASE(TestRejectsEmptyLevelList) {
    BOOST_CHECK_THROW(GameSession session(std::vector<LevelDefinition>{}), ConfigError);
}

BOOST_AUTO_TEST_CASE(TestRejectsInitialLevelOutOfRange) {
    std::vector<LevelDefinition> levels{namedLevel("a", 200.0f)};
    BOOST_CHECK_THROW(GameSession session(levels, 1), ConfigError);
}

BOOST_AUTO_TEST_CASE(TestRejectsBrokenLaterLevel) {
    LevelDefinition broken = namedLevel("broken", 200.0f);
    broken.segments.clear();
    std::vector<LevelDefinition> levels{namedLevel("a", 200.0f), broken};
    BOOST_CHECK_THROW(GameSession session(levels), ConfigError);
}

BOOST_AUTO_TEST_CASE(TestStartsAtInitialLevel) {
    std::vector<LevelDefinition> levels{namedLevel("a", 200.0f), namedLevel("b", 200.0f)};
    GameSession session(levels, 1);
    BOOST_CHECK_EQUAL(session.getCurrentLevelIndex(), 1u);
    BOOST_CHECK_EQUAL(session.getLevelCount(), 2u);
    BOOST_CHECK_EQUAL(session.getAttempts(), 1u);
    BOOST_CHECK_EQUAL(session.getSimulation().getLevel().name, "b");
    BOOST_CHECK(!session.isFinished());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(SessionProgressTests)

BOOST_AUTO_TEST_CASE(TestWinAdvancesThenFinishes) {
    std::vector<LevelDefinition> levels{namedLevel("a", 200.0f), namedLevel("b", 200.0f)};
    GameSession session(levels);

    tickUntil(session, [&] { return session.getCurrentLevelIndex() == 1; });
    BOOST_REQUIRE_EQUAL(session.getCurrentLevelIndex(), 1u);
    BOOST_CHECK_EQUAL(session.getLevelsWon(), 1u);
    BOOST_CHECK_EQUAL(session.getSimulation().getLevel().name, "b");
    BOOST_CHECK(session.getSimulation().getState() == LevelState::Running);

    tickUntil(session, [&] { return session.isFinished(); });
    BOOST_REQUIRE(session.isFinished());
    BOOST_CHECK_EQUAL(session.getLevelsWon(), 2u);
    BOOST_CHECK_EQUAL(session.getCurrentLevelIndex(), 1u);

    // Finished sessions stay put
    const uint64_t tick = session.getSimulation().getTick();
    const SimulationSnapshot& snapshot = session.tick(InputIntent{});
    BOOST_CHECK(snapshot.state == LevelState::Won);
    BOOST_CHECK_EQUAL(session.getSimulation().getTick(), tick);
    BOOST_CHECK_EQUAL(session.getLevelsWon(), 2u);
}

BOOST_AUTO_TEST_CASE(TestLossRetriesSameLevel) {
    LevelDefinition level = namedLevel("fragile", 1000.0f);
    level.constants.ledger.initialDarkMatter = 0.0f;
    level.constants.ledger.initialShield = 0.0f;
    GameSession session(std::vector<LevelDefinition>{level});

    killShip(session);
    const SimulationSnapshot& lost = session.tick(InputIntent{});
    BOOST_REQUIRE(lost.state == LevelState::Lost);
    BOOST_CHECK_EQUAL(session.getAttempts(), 1u);

    const SimulationSnapshot& retry = session.tick(InputIntent{});
    BOOST_CHECK(retry.state == LevelState::Running);
    BOOST_CHECK_EQUAL(retry.tick, 1u);
    BOOST_CHECK_EQUAL(session.getAttempts(), 2u);
    BOOST_CHECK_EQUAL(session.getCurrentLevelIndex(), 0u);
    BOOST_CHECK_EQUAL(session.getLevelsWon(), 0u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(SessionRequestTests)

BOOST_AUTO_TEST_CASE(TestRestartAppliedAtNextTick) {
    GameSession session(std::vector<LevelDefinition>{namedLevel("a", 1000.0f)});
    for (int i = 0; i < 10; ++i) {
        session.tick(InputIntent{});
    }
    BOOST_CHECK_EQUAL(session.getSimulation().getTick(), 10u);

    session.requestRestart();
    BOOST_CHECK_EQUAL(session.getSimulation().getTick(), 10u);

    session.tick(InputIntent{});
    BOOST_CHECK_EQUAL(session.getSimulation().getTick(), 1u);
    BOOST_CHECK_EQUAL(session.getAttempts(), 2u);
}

BOOST_AUTO_TEST_CASE(TestLevelSelect) {
    std::vector<LevelDefinition> levels{namedLevel("a", 1000.0f), namedLevel("b", 1000.0f)};
    GameSession session(levels);
    session.requestRestart();
    session.tick(InputIntent{});
    BOOST_CHECK_EQUAL(session.getAttempts(), 2u);

    BOOST_CHECK_THROW(session.requestLevelSelect(2), ContractViolation);

    session.requestLevelSelect(1);
    BOOST_CHECK_EQUAL(session.getCurrentLevelIndex(), 0u);
    session.tick(InputIntent{});
    BOOST_CHECK_EQUAL(session.getCurrentLevelIndex(), 1u);
    BOOST_CHECK_EQUAL(session.getSimulation().getLevel().name, "b");
    BOOST_CHECK_EQUAL(session.getAttempts(), 1u);
}

BOOST_AUTO_TEST_CASE(TestSkipToSegment) {
    GameSession session(std::vector<LevelDefinition>{threeSegmentLevel()});
    session.requestSkipToSegment(2);
    const SimulationSnapshot& snapshot = session.tick(InputIntent{});
    BOOST_CHECK_EQUAL(snapshot.segmentIndex, 2u);
    BOOST_CHECK_GE(snapshot.scroll, 1000.0f);
}

BOOST_AUTO_TEST_CASE(TestBadSkipRaisedOnceWhenApplied) {
    GameSession session(std::vector<LevelDefinition>{threeSegmentLevel()});
    session.requestSkipToSegment(7);
    BOOST_CHECK_THROW(session.tick(InputIntent{}), ContractViolation);

    // The rejected request is not replayed
    BOOST_CHECK_NO_THROW(session.tick(InputIntent{}));
    BOOST_CHECK_EQUAL(session.getSimulation().getTick(), 1u);
}

BOOST_AUTO_TEST_SUITE_END()
