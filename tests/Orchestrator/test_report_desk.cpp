/**
 * @file test_report_desk.cpp
 * @brief Tests for game reports
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 */

#include <Gamebattle/Orchestrator/ReportDesk.hpp>
#include <Gamebattle/Orchestrator/SessionManager.hpp>
#include <Gamebattle/Orchestrator/StateStore.hpp>
#include <Gamebattle/Core/Crypto.hpp>
#include "TestHarness.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <csignal>

using namespace Gamebattle;
using namespace Gamebattle::Orchestrator;
using namespace Gamebattle::Testing;

namespace {

const Identity kAlice{"alice@example.edu", false};
const Identity kBob{"bob@example.edu", false};
const Identity kAdmin{"admin@example.edu", true};

} // namespace

TEST(ReportReason, Parse) {
    EXPECT_EQ(parseReportReason("unclear").valueOr(ReportReason::Other), ReportReason::Unclear);
    EXPECT_EQ(parseReportReason("buggy").valueOr(ReportReason::Other), ReportReason::Buggy);
    EXPECT_EQ(parseReportReason("other").valueOr(ReportReason::Buggy), ReportReason::Other);
    EXPECT_RESULT_ERROR(parseReportReason("boring"), ErrorCode::InvalidArgument);
}

class ReportDeskTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        std::signal(SIGPIPE, SIG_IGN);
    }

    void SetUp() override {
        catalog = std::make_shared<MemoryGameCatalog>();
        catalog->add(scriptGame("maze", "cat", "carol@example.edu"));
        catalog->add(scriptGame("alice", "cat", "alice@example.edu"));
        store = std::make_shared<MemoryStateStore>();

        auto cfg = testConfig(dir.path());
        cfg.competitionEnabled = true;
        config = std::make_shared<const OrchestratorConfig>(cfg);

        sandboxes = std::make_shared<ProcessSandboxController>(catalog, ProcessSandboxController::optionsFrom(*config));
        sessions = std::make_unique<SessionManager>(config, catalog, sandboxes, store, nullptr);
        sessions->start();

        transport = std::make_shared<FakeWebhookTransport>();
        WebhookNotifier::Options options;
        options.url = "http://hooks.invalid/";
        notifier = std::make_shared<WebhookNotifier>(options, transport);
        notifier->start();

        desk = std::make_unique<ReportDesk>(config, store, catalog, *sessions, notifier);
    }

    void TearDown() override {
        desk.reset();
        sessions->shutdown();
        notifier->stop();
    }

    SessionId play(const Identity& who, const GameId& game, const std::string& input = "") {
        auto client = std::make_shared<RecordingConnection>();
        auto handle = sessions->createOrAttach(who, game, client);
        EXPECT_TRUE(handle.isSuccess());
        if (!input.empty()) {
            client->type(input);
            EXPECT_TRUE(waitUntil([&] { return client->output() == input; }));
        }
        return handle.valueOr(SessionHandle{}).sessionId;
    }

    TempDirectory dir;
    std::shared_ptr<MemoryGameCatalog> catalog;
    std::shared_ptr<MemoryStateStore> store;
    std::shared_ptr<const OrchestratorConfig> config;
    std::shared_ptr<ProcessSandboxController> sandboxes;
    std::unique_ptr<SessionManager> sessions;
    std::shared_ptr<FakeWebhookTransport> transport;
    std::shared_ptr<WebhookNotifier> notifier;
    std::unique_ptr<ReportDesk> desk;
};

TEST_F(ReportDeskTest, FilesReportAndNotifies) {
    SessionId sid = play(kAlice, "maze");

    auto total = desk->fileReport(kAlice, sid, ReportReason::Buggy, "walls move", false);
    ASSERT_RESULT_OK(total);
    EXPECT_EQ(total.value(), 1u);

    auto reports = desk->reports("maze", kAdmin);
    ASSERT_RESULT_OK(reports);
    ASSERT_EQ(reports.value().size(), 1u);
    EXPECT_EQ(reports.value()[0].sessionId, sid);
    EXPECT_EQ(reports.value()[0].author, kAlice.userId);
    EXPECT_EQ(reports.value()[0].shortReason, ReportReason::Buggy);
    EXPECT_EQ(reports.value()[0].reason, "walls move");
    EXPECT_FALSE(reports.value()[0].output.has_value());

    ASSERT_TRUE(notifier->flush(Milliseconds(2000)));
    auto bodies = transport->bodies();
    ASSERT_EQ(bodies.size(), 1u);
    auto payload = nlohmann::json::parse(bodies[0]);
    EXPECT_EQ(payload["event"], "report");
    EXPECT_EQ(payload["gameId"], "maze");
    EXPECT_EQ(payload["shortReason"], "buggy");
    EXPECT_EQ(payload["totalReports"], 1);
}

TEST_F(ReportDeskTest, AttachesCapturedOutput) {
    SessionId sid = play(kAlice, "maze", "north\n");

    ASSERT_RESULT_OK(desk->fileReport(kAlice, sid, ReportReason::Unclear, "", true));

    auto reports = desk->reports("maze", kAdmin);
    ASSERT_RESULT_OK(reports);
    ASSERT_EQ(reports.value().size(), 1u);
    ASSERT_TRUE(reports.value()[0].output.has_value());
    auto decoded = Crypto::fromBase64(*reports.value()[0].output);
    ASSERT_RESULT_OK(decoded);
    EXPECT_EQ(Gamebattle::toString(decoded.value()), "north\n");
}

TEST_F(ReportDeskTest, ReportsAccumulatePerGame) {
    SessionId a = play(kAlice, "maze");
    SessionId b = play(kBob, "maze");

    EXPECT_EQ(desk->fileReport(kAlice, a, ReportReason::Other, "one", false).valueOr(0), 1u);
    EXPECT_EQ(desk->fileReport(kBob, b, ReportReason::Other, "two", false).valueOr(0), 2u);
    EXPECT_EQ(desk->fileReport(kAlice, a, ReportReason::Other, "three", false).valueOr(0), 3u);
}

TEST_F(ReportDeskTest, LongReasonIsTruncated) {
    SessionId sid = play(kAlice, "maze");
    std::string reason(ReportDesk::kMaxReasonLength + 500, 'r');

    ASSERT_RESULT_OK(desk->fileReport(kAlice, sid, ReportReason::Other, reason, false));
    auto reports = desk->reports("maze", kAdmin);
    ASSERT_RESULT_OK(reports);
    EXPECT_EQ(reports.value()[0].reason.size(), ReportDesk::kMaxReasonLength);
}

TEST_F(ReportDeskTest, AuthorsCannotReportTheirOwnGame) {
    SessionId sid = play(kAlice, "alice");
    EXPECT_RESULT_ERROR(desk->fileReport(kAlice, sid, ReportReason::Buggy, "", false),
                        ErrorCode::SelfReportNotAllowed);
}

TEST_F(ReportDeskTest, OnlyTheSessionOwnerCanReport) {
    SessionId sid = play(kAlice, "maze");
    EXPECT_RESULT_ERROR(desk->fileReport(kBob, sid, ReportReason::Buggy, "", false), ErrorCode::Forbidden);
    EXPECT_RESULT_ERROR(desk->fileReport(kBob, "missing", ReportReason::Buggy, "", false),
                        ErrorCode::SessionNotFound);
}

TEST_F(ReportDeskTest, ListingRequiresAdmin) {
    EXPECT_RESULT_ERROR(desk->reports("maze", kAlice), ErrorCode::Forbidden);
    auto empty = desk->reports("maze", kAdmin);
    ASSERT_RESULT_OK(empty);
    EXPECT_TRUE(empty.value().empty());
}

TEST_F(ReportDeskTest, DisabledWithoutCompetition) {
    auto cfg = *config;
    cfg.competitionEnabled = false;
    ReportDesk disabled(std::make_shared<const OrchestratorConfig>(cfg), store, catalog, *sessions, nullptr);

    SessionId sid = play(kAlice, "maze");
    EXPECT_RESULT_ERROR(disabled.fileReport(kAlice, sid, ReportReason::Buggy, "", false),
                        ErrorCode::CompetitionDisabled);
}
