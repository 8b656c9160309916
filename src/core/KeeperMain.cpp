/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "controllers/session/SessionStatsController.hpp"
#include "core/GameSession.hpp"
#include "core/Logger.hpp"
#include "core/SimulationErrors.hpp"
#include "core/TimestepManager.hpp"
#include "managers/SettingsManager.hpp"
#include "world/LevelLoader.hpp"
#include <cstdint>
#include <exception>
#include <format>
#include <memory>
#include <string>
#include <vector>

namespace {

constexpr int EXIT_SESSION_FINISHED{0};
constexpr int EXIT_CONFIG_ERROR{1};
constexpr int EXIT_TICK_BUDGET{2};

const std::string DEFAULT_SETTINGS_PATH{"res/settings.json"};

KeeperEngine::InputIntent autopilotIntent(const KeeperEngine::SettingsManager& settings) {
  using namespace KeeperEngine;
  InputIntent intent;
  intent.movement = Vector2D(settings.get<float>("autopilot", "move_x", 0.0f),
                             settings.get<float>("autopilot", "move_y", 0.0f));
  intent.fire = settings.get<bool>("autopilot", "fire", false);
  const std::string weapon = settings.get<std::string>("autopilot", "weapon", "bullet");
  if (auto parsed = RoleTraits::weaponFromString(weapon)) {
    intent.weapon = *parsed;
  } else {
    GAMELOOP_WARN(std::format("Unknown autopilot weapon '{}', using bullet", weapon));
  }
  return intent;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
  using namespace KeeperEngine;

  const std::string settingsPath = argc > 1 ? argv[1] : DEFAULT_SETTINGS_PATH;
  auto& settings = SettingsManager::Instance();
  if (!settings.loadFromFile(settingsPath)) {
    GAMELOOP_WARN(std::format("Failed to load {} - using defaults", settingsPath));
  }

  if (settings.get<bool>("logging", "quiet", false)) {
    Logger::SetBenchmarkMode(true);
  }

  const auto levelPaths = settings.get<SettingsManager::StringList>(
      "session", "levels", {"res/levels/level_1.json", "res/levels/level_2.json"});
  const int initialLevel = settings.get<int>("session", "initial_level", 0);
  const float targetFPS = settings.get<float>("loop", "target_fps", 0.0f);
  const int maxTicksSetting = settings.get<int>("loop", "max_ticks", 200000);
  const uint64_t maxTicks = maxTicksSetting > 0 ? static_cast<uint64_t>(maxTicksSetting) : 0;

  std::vector<LevelDefinition> levels;
  std::unique_ptr<GameSession> session;
  try {
    for (const std::string& path : levelPaths) {
      levels.push_back(LevelLoader::loadOrThrow(path));
    }
    if (initialLevel < 0) {
      throw ConfigError(std::format("session.initial_level must not be negative (got {})",
                                    initialLevel));
    }
    session = std::make_unique<GameSession>(std::move(levels), static_cast<size_t>(initialLevel));
  } catch (const ConfigError& e) {
    GAMELOOP_CRITICAL(e.what());
    return EXIT_CONFIG_ERROR;
  }

  SessionStatsController stats;
  stats.subscribe(session->getSimulation().getEventBus());

  HeldInputProvider input(autopilotIntent(settings));
  size_t pacedLevel = session->getCurrentLevelIndex();
  TimestepManager ts(targetFPS, session->getSimulation().getTickSeconds());

  GAMELOOP_INFO(std::format("Running {} levels, {} pacing, tick budget {}",
                            session->getLevelCount(),
                            ts.isPaced() ? std::format("{:.0f} fps", ts.getTargetFPS())
                                         : std::string("unpaced"),
                            maxTicks));

  uint64_t ticks = 0;
  try {
    while (!session->isFinished() && (maxTicks == 0 || ticks < maxTicks)) {
      ts.startFrame();
      while (ts.shouldUpdate() && !session->isFinished() &&
             (maxTicks == 0 || ticks < maxTicks)) {
        session->tick(input.poll(ticks));
        ++ticks;
      }

      if (session->getCurrentLevelIndex() != pacedLevel) {
        // Levels may run at different tick rates
        pacedLevel = session->getCurrentLevelIndex();
        ts = TimestepManager(targetFPS, session->getSimulation().getTickSeconds());
      }
      ts.endFrame();
    }
  } catch (const std::exception& e) {
    GAMELOOP_CRITICAL(std::format("Session aborted after {} ticks: {}", ticks, e.what()));
    return EXIT_CONFIG_ERROR;
  }

  const LevelOutcome outcome = session->getSimulation().getOutcome();
  GAMELOOP_INFO(std::format("Level {} ended {} with {:.1f} dark matter, {:.1f} shield after {} ticks",
                            session->getCurrentLevelIndex(), levelStateToString(outcome.state),
                            outcome.darkMatter, outcome.shield, outcome.ticks));
  GAMELOOP_INFO("Session stats: " + stats.summary());

  if (!session->isFinished()) {
    GAMELOOP_WARN(std::format("Tick budget of {} exhausted at level {} (attempt {})", maxTicks,
                              session->getCurrentLevelIndex(), session->getAttempts()));
    return EXIT_TICK_BUDGET;
  }

  GAMELOOP_INFO(std::format("Session finished: {} levels won in {} ticks",
                            session->getLevelsWon(), ticks));
  return EXIT_SESSION_FINISHED;
}
