/**
 * @file GameCatalog.hpp
 * @brief Read-only catalog resolving game ids to launchable artifacts
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 *
 * A games directory holds one JSON index per game:
 *
 * ```json
 * {
 *   "name": "Tic Tac Toe",
 *   "author": "Alice",
 *   "email": "alice@example.com",
 *   "kind": "executable",
 *   "command": ["python3", "main.py"],
 *   "exitCodes": {"0": "win", "1": "loss", "2": "draw"},
 *   "scoring": {"win": 3, "draw": 1}
 * }
 * ```
 *
 * The game id is the local part of the author email. Container games run
 * the image `gamebattle-<id>` unless "image" is given.
 */

#pragma once

#ifndef GAMEBATTLE_ORCHESTRATOR_GAME_CATALOG_HPP
#define GAMEBATTLE_ORCHESTRATOR_GAME_CATALOG_HPP

#include <Gamebattle/Core/Types.hpp>
#include <Gamebattle/Core/ErrorCodes.hpp>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace Gamebattle::Orchestrator {

/**
 * @brief How a game is launched
 */
enum class ArtifactKind {
    Executable,  ///< Direct process with rlimits
    Container    ///< Container image run through the docker CLI
};

/**
 * @brief Per-game mapping from exit status to result and points
 */
struct ScoringTable {
    std::map<int, std::string> exitCodeResults;   ///< Exit code to result name
    std::map<std::string, int64_t> points;        ///< Result name to points
};

/**
 * @brief Immutable description of a launchable game
 */
struct GameArtifact {
    GameId id;
    std::string name;
    std::string author;
    std::string authorEmail;
    ArtifactKind kind = ArtifactKind::Executable;
    std::vector<std::string> command;   ///< argv for executables
    std::string image;                  ///< Image for containers
    std::string workingDirectory;       ///< Working directory for executables
    ScoringTable scoring;

    /// True when the user is the author of this game
    [[nodiscard]] bool isAuthoredBy(const UserId& userId) const {
        return !userId.empty() && (userId == authorEmail || userId == id);
    }
};

/// Game id for an author email (its local part)
std::string gameIdForEmail(const std::string& email);

/**
 * @brief Parse one game index document
 * @param json Index file contents
 * @param baseDirectory Directory relative paths are resolved against
 */
Result<GameArtifact> parseGameIndex(const std::string& json, const std::string& baseDirectory);

/**
 * @brief Game lookup interface
 */
class GameCatalog {
public:
    virtual ~GameCatalog() = default;

    /**
     * @brief Resolve a game id
     * @return Artifact or ArtifactNotFound
     */
    virtual Result<GameArtifact> resolve(const GameId& gameId) const = 0;

    /**
     * @brief All known games ordered by id
     */
    virtual std::vector<GameArtifact> list() const = 0;
};

/**
 * @brief Catalog backed by `*.json` index files in a directory
 */
class DirectoryGameCatalog : public GameCatalog {
public:
    explicit DirectoryGameCatalog(std::string directory);

    /**
     * @brief Rescan the directory
     * @return Number of games loaded; malformed indexes are skipped and logged
     */
    Result<size_t> reload();

    Result<GameArtifact> resolve(const GameId& gameId) const override;
    std::vector<GameArtifact> list() const override;

private:
    std::string m_directory;
    mutable std::mutex m_mutex;
    std::map<GameId, GameArtifact> m_games;
};

/**
 * @brief Catalog populated in code
 */
class MemoryGameCatalog : public GameCatalog {
public:
    void add(GameArtifact artifact);

    Result<GameArtifact> resolve(const GameId& gameId) const override;
    std::vector<GameArtifact> list() const override;

private:
    mutable std::mutex m_mutex;
    std::map<GameId, GameArtifact> m_games;
};

} // namespace Gamebattle::Orchestrator

#endif // GAMEBATTLE_ORCHESTRATOR_GAME_CATALOG_HPP
