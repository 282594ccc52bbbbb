/**
 * @file test_competition_engine.cpp
 * @brief Tests for scoring and the leaderboard
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 */

#include <Gamebattle/Orchestrator/CompetitionEngine.hpp>
#include <Gamebattle/Orchestrator/StateStore.hpp>
#include "TestHarness.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <functional>
#include <thread>
#include <vector>

using namespace Gamebattle;
using namespace Gamebattle::Orchestrator;
using namespace Gamebattle::Testing;

namespace {

ExitOutcome exitedWith(int code) {
    ExitOutcome outcome;
    outcome.status = ExitOutcome::Exited{code};
    return outcome;
}

ExitOutcome killedFor(KillReason reason) {
    ExitOutcome outcome;
    outcome.status = ExitOutcome::Killed{reason, 9};
    return outcome;
}

TerminatedSession finished(const std::string& sid, const std::string& user, const std::string& game,
                           ExitOutcome outcome) {
    TerminatedSession session;
    session.sessionId = sid;
    session.userId = user;
    session.gameId = game;
    session.terminatedAt = nowEpochMillis();
    session.outcome = outcome;
    return session;
}

/// Store that runs a hook when a named lock is taken
class InterleavingStore : public StateStore {
public:
    explicit InterleavingStore(std::shared_ptr<MemoryStateStore> inner) : m_inner(std::move(inner)) {}

    Result<std::optional<std::string>> get(const std::string& key) override { return m_inner->get(key); }

    Result<void> set(const std::string& key, const std::string& value,
                     std::optional<Milliseconds> ttl) override {
        return m_inner->set(key, value, ttl);
    }

    Result<void> compareAndSet(const std::string& key, const std::optional<std::string>& expected,
                               const std::optional<std::string>& desired,
                               std::optional<Milliseconds> ttl) override {
        return m_inner->compareAndSet(key, expected, desired, ttl);
    }

    Result<void> remove(const std::string& key) override { return m_inner->remove(key); }

    Result<std::vector<std::pair<std::string, std::string>>> scan(const std::string& prefix) override {
        return m_inner->scan(prefix);
    }

    Result<LockLease> acquireLock(const std::string& name, Milliseconds lease, Milliseconds wait) override {
        auto acquired = m_inner->acquireLock(name, lease, wait);
        if (acquired.isSuccess() && name == m_hookLock && m_hook) {
            auto hook = std::move(m_hook);
            m_hook = nullptr;
            hook();
        }
        return acquired;
    }

    Result<void> releaseLock(const LockLease& lease) override { return m_inner->releaseLock(lease); }

    void onLock(std::string name, std::function<void()> hook) {
        m_hookLock = std::move(name);
        m_hook = std::move(hook);
    }

private:
    std::shared_ptr<MemoryStateStore> m_inner;
    std::string m_hookLock;
    std::function<void()> m_hook;
};

} // namespace

// ============================================================================
// Scoring Policy
// ============================================================================

TEST(ExitCodeScoringPolicy, Defaults) {
    ExitCodeScoringPolicy policy;
    GameArtifact game = scriptGame("maze", "true");

    EXPECT_EQ(policy.score(game, exitedWith(0)).result, "win");
    EXPECT_EQ(policy.score(game, exitedWith(0)).points, 3);
    EXPECT_EQ(policy.score(game, exitedWith(1)).result, "loss");
    EXPECT_EQ(policy.score(game, exitedWith(1)).points, 0);
    EXPECT_EQ(policy.score(game, exitedWith(2)).result, "draw");
    EXPECT_EQ(policy.score(game, exitedWith(2)).points, 1);
    EXPECT_EQ(policy.score(game, exitedWith(77)).result, "loss");

    ExitOutcome crashed;
    crashed.status = ExitOutcome::Crashed{11};
    EXPECT_EQ(policy.score(game, crashed).result, "crash");
    EXPECT_EQ(policy.score(game, killedFor(KillReason::OwnerDisconnected)).result, "crash");
    EXPECT_EQ(policy.score(game, killedFor(KillReason::OwnerDisconnected)).points, 0);
}

TEST(ExitCodeScoringPolicy, GameTableOverridesDefaults) {
    ExitCodeScoringPolicy policy;
    GameArtifact game = scriptGame("quiz", "true");
    game.scoring.exitCodeResults = {{5, "perfect"}};
    game.scoring.points = {{"perfect", 10}, {"win", 4}};

    EXPECT_EQ(policy.score(game, exitedWith(5)).result, "perfect");
    EXPECT_EQ(policy.score(game, exitedWith(5)).points, 10);
    EXPECT_EQ(policy.score(game, exitedWith(0)).points, 4);
    EXPECT_EQ(policy.score(game, exitedWith(2)).points, 1);
}

// ============================================================================
// Engine
// ============================================================================

class CompetitionEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto cfg = testConfig(dir.path());
        cfg.competitionEnabled = true;
        config = std::make_shared<const OrchestratorConfig>(cfg);

        store = std::make_shared<MemoryStateStore>();
        catalog = std::make_shared<MemoryGameCatalog>();
        catalog->add(scriptGame("maze", "true"));
        catalog->add(scriptGame("quiz", "true"));

        transport = std::make_shared<FakeWebhookTransport>();
        WebhookNotifier::Options options;
        options.url = "http://hooks.invalid/";
        options.baseDelay = Milliseconds(1);
        notifier = std::make_shared<WebhookNotifier>(options, transport);
        notifier->start();

        engine = std::make_shared<CompetitionEngine>(config, store, catalog, nullptr, notifier);
    }

    void TearDown() override {
        notifier->stop();
    }

    TempDirectory dir;
    std::shared_ptr<const OrchestratorConfig> config;
    std::shared_ptr<MemoryStateStore> store;
    std::shared_ptr<MemoryGameCatalog> catalog;
    std::shared_ptr<FakeWebhookTransport> transport;
    std::shared_ptr<WebhookNotifier> notifier;
    std::shared_ptr<CompetitionEngine> engine;
};

TEST_F(CompetitionEngineTest, DisabledEngineRecordsNothing) {
    auto cfg = *config;
    cfg.competitionEnabled = false;
    CompetitionEngine disabled(std::make_shared<const OrchestratorConfig>(cfg), store, catalog, nullptr, nullptr);

    EXPECT_FALSE(disabled.enabled());
    EXPECT_RESULT_ERROR(disabled.onSessionTerminated(finished("s1", "alice", "maze", exitedWith(0))),
                        ErrorCode::CompetitionDisabled);
    EXPECT_EQ(store->size(), 0u);
}

TEST_F(CompetitionEngineTest, ScoresAndNotifies) {
    auto record = engine->onSessionTerminated(finished("s1", "alice@example.edu", "maze", exitedWith(0)));
    ASSERT_RESULT_OK(record);
    EXPECT_EQ(record.value().result, "win");
    EXPECT_EQ(record.value().score, 3);
    EXPECT_EQ(record.value().status, "applied");
    EXPECT_EQ(record.value().rankDelta, 0);

    auto board = engine->leaderboard(10);
    ASSERT_RESULT_OK(board);
    ASSERT_EQ(board.value().size(), 1u);
    EXPECT_EQ(board.value()[0].userId, "alice@example.edu");
    EXPECT_EQ(board.value()[0].score, 3);
    EXPECT_EQ(board.value()[0].sessions, 1);

    ASSERT_TRUE(notifier->flush(Milliseconds(2000)));
    auto bodies = transport->bodies();
    ASSERT_EQ(bodies.size(), 1u);
    auto payload = nlohmann::json::parse(bodies[0]);
    EXPECT_EQ(payload["event"], "score");
    EXPECT_EQ(payload["sessionId"], "s1");
    EXPECT_EQ(payload["totalScore"], 3);
}

TEST_F(CompetitionEngineTest, RepeatedTerminationIsIdempotent) {
    auto session = finished("s1", "alice", "maze", exitedWith(0));

    auto first = engine->onSessionTerminated(session);
    ASSERT_RESULT_OK(first);
    for (int i = 0; i < 3; ++i) {
        auto again = engine->onSessionTerminated(session);
        ASSERT_RESULT_OK(again);
        EXPECT_EQ(again.value().score, first.value().score);
        EXPECT_EQ(again.value().rankDelta, first.value().rankDelta);
    }

    auto board = engine->leaderboard(0);
    ASSERT_RESULT_OK(board);
    ASSERT_EQ(board.value().size(), 1u);
    EXPECT_EQ(board.value()[0].score, 3);
    EXPECT_EQ(board.value()[0].sessions, 1);

    ASSERT_TRUE(notifier->flush(Milliseconds(2000)));
    EXPECT_EQ(transport->bodies().size(), 1u);
}

TEST_F(CompetitionEngineTest, ConcurrentTerminationCountsOnce) {
    auto session = finished("s-race", "bob", "maze", exitedWith(0));
    std::atomic<int> successes{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 6; ++i) {
        threads.emplace_back([&] {
            if (engine->onSessionTerminated(session).isSuccess()) {
                ++successes;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_GE(successes.load(), 1);
    auto board = engine->leaderboard(0);
    ASSERT_RESULT_OK(board);
    ASSERT_EQ(board.value().size(), 1u);
    EXPECT_EQ(board.value()[0].score, 3);
    EXPECT_EQ(board.value()[0].sessions, 1);
}

TEST_F(CompetitionEngineTest, PendingRecordIsCompletedOnRetry) {
    // A previous attempt claimed the record but failed before merging
    CompetitionRecord pending;
    pending.sessionId = "s-pending";
    pending.userId = "carol";
    pending.gameId = "maze";
    pending.result = "draw";
    pending.score = 1;
    pending.status = "pending";
    ASSERT_TRUE(store->set("competition:record:s-pending", pending.toJson().dump()).isSuccess());

    auto record = engine->onSessionTerminated(finished("s-pending", "carol", "maze", exitedWith(0)));
    ASSERT_RESULT_OK(record);
    EXPECT_EQ(record.value().result, "draw");
    EXPECT_EQ(record.value().status, "applied");

    auto stored = engine->record("s-pending");
    ASSERT_RESULT_OK(stored);
    ASSERT_TRUE(stored.value().has_value());
    EXPECT_EQ(stored.value()->status, "applied");
}

TEST_F(CompetitionEngineTest, SlowerCallNeverOverwritesAppliedRankDelta) {
    // The faster call already merged the score but has not written its record
    CompetitionRecord pending;
    pending.sessionId = "s-slow";
    pending.userId = "hal";
    pending.gameId = "maze";
    pending.result = "win";
    pending.score = 3;
    pending.status = "pending";
    ASSERT_TRUE(store->set("competition:record:s-slow", pending.toJson().dump()).isSuccess());

    LeaderboardEntry merged;
    merged.userId = "hal";
    merged.score = 3;
    merged.sessions = 1;
    merged.recentSessions = {"s-slow"};
    ASSERT_TRUE(store->set("leaderboard:user:hal", merged.toJson().dump()).isSuccess());

    // It writes the applied record while the slower call holds the entry lock
    CompetitionRecord applied = pending;
    applied.status = "applied";
    applied.rankDelta = 4;
    auto interleaving = std::make_shared<InterleavingStore>(store);
    interleaving->onLock("leaderboard:hal", [&] {
        ASSERT_TRUE(store->set("competition:record:s-slow", applied.toJson().dump()).isSuccess());
    });
    CompetitionEngine slower(config, interleaving, catalog, nullptr, nullptr);

    auto record = slower.onSessionTerminated(finished("s-slow", "hal", "maze", exitedWith(0)));
    ASSERT_RESULT_OK(record);
    EXPECT_EQ(record.value().status, "applied");
    EXPECT_EQ(record.value().rankDelta, 4);

    auto stored = engine->record("s-slow");
    ASSERT_RESULT_OK(stored);
    ASSERT_TRUE(stored.value().has_value());
    EXPECT_EQ(stored.value()->rankDelta, 4);

    auto board = engine->leaderboard(0);
    ASSERT_RESULT_OK(board);
    ASSERT_EQ(board.value().size(), 1u);
    EXPECT_EQ(board.value()[0].score, 3);
}

TEST_F(CompetitionEngineTest, ExcludedGameIsNotScored) {
    ASSERT_TRUE(engine->excludeGame("quiz").isSuccess());
    ASSERT_TRUE(engine->excludeGame("maze").isSuccess());
    ASSERT_TRUE(engine->excludeGame("maze").isSuccess());
    auto excluded = engine->excludedGames();
    ASSERT_RESULT_OK(excluded);
    EXPECT_EQ(excluded.value(), (std::vector<GameId>{"maze", "quiz"}));

    auto skipped = engine->onSessionTerminated(finished("s1", "ivan", "maze", exitedWith(0)));
    ASSERT_RESULT_OK(skipped);
    EXPECT_EQ(skipped.value().status, "excluded");
    EXPECT_FALSE(skipped.value().rankDelta.has_value());
    auto none = engine->record("s1");
    ASSERT_RESULT_OK(none);
    EXPECT_FALSE(none.value().has_value());
    auto board = engine->leaderboard(0);
    ASSERT_RESULT_OK(board);
    EXPECT_TRUE(board.value().empty());

    ASSERT_TRUE(engine->includeGame("maze").isSuccess());
    ASSERT_TRUE(engine->includeGame("maze").isSuccess());
    excluded = engine->excludedGames();
    ASSERT_RESULT_OK(excluded);
    EXPECT_EQ(excluded.value(), std::vector<GameId>{"quiz"});

    auto scored = engine->onSessionTerminated(finished("s2", "ivan", "maze", exitedWith(0)));
    ASSERT_RESULT_OK(scored);
    EXPECT_EQ(scored.value().status, "applied");

    ASSERT_TRUE(engine->includeGame("quiz").isSuccess());
    auto emptied = store->get("competition:excluded");
    ASSERT_RESULT_OK(emptied);
    EXPECT_FALSE(emptied.value().has_value());
    EXPECT_RESULT_ERROR(engine->excludeGame(""), ErrorCode::InvalidArgument);

    ASSERT_TRUE(notifier->flush(Milliseconds(2000)));
    EXPECT_EQ(transport->bodies().size(), 1u);
}

TEST_F(CompetitionEngineTest, ExclusionKeepsEarlierScores) {
    ASSERT_TRUE(engine->onSessionTerminated(finished("s1", "judy", "maze", exitedWith(0))).isSuccess());
    ASSERT_TRUE(engine->excludeGame("maze").isSuccess());

    // A repeated notification of an already scored session returns its record
    auto again = engine->onSessionTerminated(finished("s1", "judy", "maze", exitedWith(0)));
    ASSERT_RESULT_OK(again);
    EXPECT_EQ(again.value().status, "applied");

    auto standing = engine->standing("judy");
    ASSERT_RESULT_OK(standing);
    EXPECT_EQ(standing.value().score, 3);
}

TEST_F(CompetitionEngineTest, StandingReportsPlaceAmongPlayers) {
    ASSERT_TRUE(engine->onSessionTerminated(finished("s1", "kim", "maze", exitedWith(0))).isSuccess());
    ASSERT_TRUE(engine->onSessionTerminated(finished("s2", "lou", "quiz", exitedWith(2))).isSuccess());

    auto lou = engine->standing("lou");
    ASSERT_RESULT_OK(lou);
    EXPECT_EQ(lou.value().place, 2);
    EXPECT_EQ(lou.value().places, 2);
    EXPECT_EQ(lou.value().score, 1);
    EXPECT_EQ(lou.value().sessions, 1);

    auto stranger = engine->standing("nobody");
    ASSERT_RESULT_OK(stranger);
    EXPECT_EQ(stranger.value().place, 0);
    EXPECT_EQ(stranger.value().places, 2);
    EXPECT_TRUE(stranger.value().toJson()["place"].is_null());
}

TEST_F(CompetitionEngineTest, GameStatsCountAppliedSessions) {
    ASSERT_TRUE(engine->onSessionTerminated(finished("s1", "mia", "maze", exitedWith(0))).isSuccess());
    ASSERT_TRUE(engine->onSessionTerminated(finished("s2", "ned", "maze", exitedWith(1))).isSuccess());
    ASSERT_TRUE(engine->onSessionTerminated(finished("s3", "ned", "maze", killedFor(KillReason::LimitExceeded)))
                    .isSuccess());
    ASSERT_TRUE(engine->excludeGame("quiz").isSuccess());

    // Scored earlier, no longer in the catalog
    CompetitionRecord retired;
    retired.sessionId = "s-old";
    retired.userId = "mia";
    retired.gameId = "retired";
    retired.result = "draw";
    retired.score = 1;
    retired.status = "applied";
    ASSERT_TRUE(store->set("competition:record:s-old", retired.toJson().dump()).isSuccess());

    auto stats = engine->gameStats();
    ASSERT_RESULT_OK(stats);
    ASSERT_EQ(stats.value().size(), 3u);

    const auto& maze = stats.value()[0];
    EXPECT_EQ(maze.gameId, "maze");
    EXPECT_EQ(maze.gameName, "Game maze");
    EXPECT_EQ(maze.timesPlayed, 3);
    EXPECT_EQ(maze.totalScore, 3);
    EXPECT_EQ(maze.results.at("win"), 1);
    EXPECT_EQ(maze.results.at("loss"), 1);
    EXPECT_EQ(maze.results.at("crash"), 1);
    EXPECT_FALSE(maze.excluded);

    const auto& quiz = stats.value()[1];
    EXPECT_EQ(quiz.gameId, "quiz");
    EXPECT_EQ(quiz.timesPlayed, 0);
    EXPECT_TRUE(quiz.excluded);

    const auto& old = stats.value()[2];
    EXPECT_EQ(old.gameId, "retired");
    EXPECT_TRUE(old.gameName.empty());
    EXPECT_EQ(old.timesPlayed, 1);
}

TEST_F(CompetitionEngineTest, LeaderboardOrdering) {
    // dave: 3, erin: 3 later, frank: 1
    ASSERT_TRUE(engine->onSessionTerminated(finished("s1", "dave", "maze", exitedWith(0))).isSuccess());
    std::this_thread::sleep_for(Milliseconds(5));
    ASSERT_TRUE(engine->onSessionTerminated(finished("s2", "erin", "maze", exitedWith(0))).isSuccess());
    ASSERT_TRUE(engine->onSessionTerminated(finished("s3", "frank", "quiz", exitedWith(2))).isSuccess());

    auto board = engine->leaderboard(0);
    ASSERT_RESULT_OK(board);
    ASSERT_EQ(board.value().size(), 3u);
    EXPECT_EQ(board.value()[0].userId, "dave");
    EXPECT_EQ(board.value()[1].userId, "erin");
    EXPECT_EQ(board.value()[2].userId, "frank");

    auto top = engine->leaderboard(2);
    ASSERT_RESULT_OK(top);
    EXPECT_EQ(top.value().size(), 2u);

    // frank overtakes both and moves up two places
    auto climb = engine->onSessionTerminated(finished("s4", "frank", "maze", exitedWith(0)));
    ASSERT_RESULT_OK(climb);
    EXPECT_EQ(climb.value().rankDelta, 2);
}

TEST_F(CompetitionEngineTest, StoreOutageSurfaces) {
    store->setAvailable(false);
    EXPECT_RESULT_ERROR(engine->onSessionTerminated(finished("s1", "gina", "maze", exitedWith(0))),
                        ErrorCode::StoreUnavailable);
    EXPECT_RESULT_ERROR(engine->leaderboard(10), ErrorCode::StoreUnavailable);

    store->setAvailable(true);
    EXPECT_TRUE(engine->onSessionTerminated(finished("s1", "gina", "maze", exitedWith(0))).isSuccess());
}

TEST(CompetitionRecord, JsonRoundTripKeepsNullRankDelta) {
    CompetitionRecord record;
    record.sessionId = "s1";
    record.userId = "alice";
    record.gameId = "maze";
    record.result = "win";
    record.score = 3;
    record.status = "pending";

    auto doc = record.toJson();
    EXPECT_TRUE(doc["rankDelta"].is_null());

    auto parsed = CompetitionRecord::fromJson(doc.dump());
    ASSERT_RESULT_OK(parsed);
    EXPECT_FALSE(parsed.value().rankDelta.has_value());
    EXPECT_RESULT_ERROR(CompetitionRecord::fromJson("{}"), ErrorCode::JsonParseFailed);
}
