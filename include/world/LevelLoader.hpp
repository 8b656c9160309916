/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef LEVEL_LOADER_HPP
#define LEVEL_LOADER_HPP

#include "world/LevelDefinition.hpp"
#include <string>

namespace KeeperEngine {

class JsonValue;

/**
 * @brief Builds a LevelDefinition from a level JSON file
 *
 * Damage, restore, drain and weapon-cost magnitudes must be present in the
 * file; structural numbers fall back to defaults. A successful load implies
 * LevelDefinition::collectErrors() is empty.
 */
class LevelLoader {
public:
    LevelLoader() = default;

    /**
     * @brief Loads and validates a level file
     * @return false on I/O, syntax or validation failure; see getLastError()
     */
    bool loadFromFile(const std::string& path);

    /**
     * @brief Parses and validates a level from a JSON string
     */
    bool parse(const std::string& json);

    const LevelDefinition& getLevel() const { return m_level; }
    const std::string& getLastError() const { return m_lastError; }

    /**
     * @brief Convenience for callers that treat a bad level as fatal
     * @throws ConfigError with the loader's error text
     */
    static LevelDefinition loadOrThrow(const std::string& path);

private:
    bool build(const JsonValue& root, const std::string& source);

    LevelDefinition m_level;
    std::string m_lastError;
};

} // namespace KeeperEngine

#endif // LEVEL_LOADER_HPP
