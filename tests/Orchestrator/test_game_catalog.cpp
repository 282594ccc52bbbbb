/**
 * @file test_game_catalog.cpp
 * @brief Unit tests for game index parsing and catalogs
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 */

#include <Gamebattle/Orchestrator/GameCatalog.hpp>
#include "TestHarness.hpp"
#include <gtest/gtest.h>

using namespace Gamebattle;
using namespace Gamebattle::Orchestrator;
using namespace Gamebattle::Testing;

// ============================================================================
// Index Parsing
// ============================================================================

TEST(GameIndex, ExecutableWithFile) {
    auto artifact = parseGameIndex(R"({
        "name": "Maze Runner",
        "email": "alice@example.edu",
        "file": "maze.py",
        "exitCodes": {"0": "win", "1": "loss"},
        "scoring": {"win": 3, "loss": 0}
    })", "/srv/games/alice");
    ASSERT_RESULT_OK(artifact);

    const auto& game = artifact.value();
    EXPECT_EQ(game.id, "alice");
    EXPECT_EQ(game.name, "Maze Runner");
    EXPECT_EQ(game.author, "alice");
    EXPECT_EQ(game.kind, ArtifactKind::Executable);
    ASSERT_EQ(game.command.size(), 1u);
    EXPECT_EQ(game.command[0], "/srv/games/alice/maze.py");
    EXPECT_EQ(game.workingDirectory, "/srv/games/alice");
    EXPECT_EQ(game.scoring.exitCodeResults.at(1), "loss");
    EXPECT_EQ(game.scoring.points.at("win"), 3);
}

TEST(GameIndex, ContainerDefaultsImageFromId) {
    auto artifact = parseGameIndex(R"({"name": "Tetris", "email": "Bob Smith@example.edu",
                                       "kind": "container"})", "/srv/games");
    ASSERT_RESULT_OK(artifact);
    EXPECT_EQ(artifact.value().kind, ArtifactKind::Container);
    EXPECT_EQ(artifact.value().image, "gamebattle-bob-smith");
}

TEST(GameIndex, ImageImpliesContainer) {
    auto artifact = parseGameIndex(R"({"name": "Chess", "email": "carol@example.edu",
                                       "image": "registry.local/chess:1"})", "/srv/games");
    ASSERT_RESULT_OK(artifact);
    EXPECT_EQ(artifact.value().kind, ArtifactKind::Container);
    EXPECT_EQ(artifact.value().image, "registry.local/chess:1");
}

TEST(GameIndex, RejectsMalformedDocuments) {
    EXPECT_RESULT_ERROR(parseGameIndex("{not json", "/"), ErrorCode::JsonParseFailed);
    EXPECT_RESULT_ERROR(parseGameIndex(R"({"name": "x"})", "/"), ErrorCode::InvalidFormat);
    EXPECT_RESULT_ERROR(parseGameIndex(R"({"name": "x", "email": "d@example.edu"})", "/"),
                        ErrorCode::InvalidFormat);
    EXPECT_RESULT_ERROR(parseGameIndex(R"({"name": "x", "email": "d@example.edu", "kind": "vm"})", "/"),
                        ErrorCode::InvalidFormat);
    EXPECT_RESULT_ERROR(parseGameIndex(R"({"name": "x", "email": "d@example.edu", "file": "g",
                                          "exitCodes": {"zero": "win"}})", "/"),
                        ErrorCode::InvalidFormat);
}

TEST(GameIndex, AuthorshipMatchesEmailOrId) {
    auto game = scriptGame("dave", "true", "dave@example.edu");
    EXPECT_TRUE(game.isAuthoredBy("dave@example.edu"));
    EXPECT_TRUE(game.isAuthoredBy("dave"));
    EXPECT_FALSE(game.isAuthoredBy("erin@example.edu"));
    EXPECT_FALSE(game.isAuthoredBy(""));
}

TEST(GameIndex, GameIdForEmail) {
    EXPECT_EQ(gameIdForEmail("frank@example.edu"), "frank");
    EXPECT_EQ(gameIdForEmail("no-at-sign"), "no-at-sign");
}

// ============================================================================
// Catalogs
// ============================================================================

TEST(DirectoryGameCatalog, LoadsValidIndexesAndSkipsBrokenOnes) {
    TempDirectory dir;
    dir.write("alice.json", R"({"name": "A", "email": "alice@example.edu", "command": ["/bin/cat"]})");
    dir.write("bob.json", R"({"name": "B", "email": "bob@example.edu", "file": "run.sh"})");
    dir.write("broken.json", "{");
    dir.write("alice-copy.json", R"({"name": "A2", "email": "alice@example.edu", "command": ["/bin/true"]})");
    dir.write("notes.txt", "not an index");

    DirectoryGameCatalog catalog(dir.path());
    auto loaded = catalog.reload();
    ASSERT_RESULT_OK(loaded);
    EXPECT_EQ(loaded.value(), 2u);

    auto games = catalog.list();
    ASSERT_EQ(games.size(), 2u);
    EXPECT_EQ(games[0].id, "alice");
    EXPECT_EQ(games[1].id, "bob");

    EXPECT_TRUE(catalog.resolve("bob").isSuccess());
    EXPECT_RESULT_ERROR(catalog.resolve("mallory"), ErrorCode::ArtifactNotFound);
}

TEST(DirectoryGameCatalog, MissingDirectory) {
    DirectoryGameCatalog catalog("/nonexistent/gamebattle/games");
    EXPECT_RESULT_ERROR(catalog.reload(), ErrorCode::FileNotFound);
    EXPECT_TRUE(catalog.list().empty());
}

TEST(MemoryGameCatalog, AddReplacesById) {
    MemoryGameCatalog catalog;
    catalog.add(scriptGame("echo", "cat"));
    catalog.add(scriptGame("echo", "cat -n"));

    auto games = catalog.list();
    ASSERT_EQ(games.size(), 1u);
    EXPECT_EQ(games[0].command[2], "cat -n");
    EXPECT_RESULT_ERROR(catalog.resolve("missing"), ErrorCode::ArtifactNotFound);
}
