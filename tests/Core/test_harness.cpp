/**
 * @file test_harness.cpp
 * @brief Meta-tests for the test harness utilities
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 */

#include "TestHarness.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <filesystem>
#include <fstream>

using namespace Gamebattle;
using namespace Gamebattle::Orchestrator;
using namespace Gamebattle::Testing;

namespace {

ByteBuffer bytesOf(const std::string& text) {
    return ByteBuffer(text.begin(), text.end());
}

} // namespace

// ============================================================================
// Timing and Random Data
// ============================================================================

TEST(TestHarness, waitUntil_ReturnsWhenConditionHolds) {
    std::atomic<bool> flag{false};
    std::thread setter([&flag] {
        std::this_thread::sleep_for(Milliseconds(30));
        flag = true;
    });

    EXPECT_TRUE(waitUntil([&flag] { return flag.load(); }, Milliseconds(2000)));
    setter.join();
}

TEST(TestHarness, waitUntil_TimesOut) {
    auto start = Clock::now();
    EXPECT_FALSE(waitUntil([] { return false; }, Milliseconds(50)));
    EXPECT_GE(Clock::now() - start, Milliseconds(50));
}

TEST(TestHarness, randomBytes_GeneratesDifferentData) {
    auto a = randomBytes(64);
    auto b = randomBytes(64);
    EXPECT_EQ(a.size(), 64u);
    EXPECT_NE(a, b);
}

TEST(TestHarness, randomString_ContainsValidCharacters) {
    std::string s = randomString(200);
    ASSERT_EQ(s.size(), 200u);
    for (char c : s) {
        EXPECT_TRUE(std::isalnum(static_cast<unsigned char>(c)));
    }
}

// ============================================================================
// TempDirectory
// ============================================================================

TEST(TestHarness, TempDirectory_RemovedOnDestruction) {
    std::string path;
    {
        TempDirectory dir;
        path = dir.path();
        std::string file = dir.write("note.txt", "hello");
        std::ifstream in(file);
        std::string content;
        std::getline(in, content);
        EXPECT_EQ(content, "hello");
    }
    EXPECT_FALSE(std::filesystem::exists(path));
}

// ============================================================================
// RecordingConnection
// ============================================================================

TEST(TestHarness, RecordingConnection_RecordsFrames) {
    RecordingConnection conn;

    ASSERT_RESULT_OK(conn.send(Frame::output(bytesOf("abc")), Milliseconds(10)));
    ASSERT_RESULT_OK(conn.send(Frame::droppedBytes(5), Milliseconds(10)));
    ASSERT_RESULT_OK(conn.send(Frame::output(bytesOf("def")), Milliseconds(10)));
    ASSERT_RESULT_OK(conn.send(Frame::endOfSession(EndReason::NormalExit), Milliseconds(10)));

    EXPECT_EQ(conn.output(), "abcdef");
    EXPECT_EQ(conn.droppedBytes(), 5u);
    EXPECT_EQ(conn.count(Frame::Type::Output), 2u);
    EXPECT_EQ(conn.endReason(), EndReason::NormalExit);
}

TEST(TestHarness, RecordingConnection_StallTimesOut) {
    RecordingConnection conn;
    conn.stall(true);
    EXPECT_RESULT_ERROR(conn.send(Frame::output(bytesOf("x")), Milliseconds(20)), ErrorCode::Timeout);

    conn.stall(false);
    EXPECT_TRUE(conn.send(Frame::output(bytesOf("x")), Milliseconds(20)).isSuccess());
}

TEST(TestHarness, RecordingConnection_DisconnectFailsSendAndReceive) {
    RecordingConnection conn;
    conn.type("input");
    conn.disconnect();

    EXPECT_RESULT_ERROR(conn.send(Frame::output(bytesOf("x")), Milliseconds(10)),
                        ErrorCode::ClientDisconnected);
    EXPECT_RESULT_ERROR(conn.receive(Milliseconds(10)), ErrorCode::ClientDisconnected);
}

TEST(TestHarness, RecordingConnection_ReceiveReplaysTypedInput) {
    RecordingConnection conn;
    conn.type("move north\n");

    auto chunk = conn.receive(Milliseconds(100));
    ASSERT_RESULT_OK(chunk);
    EXPECT_EQ(Gamebattle::toString(chunk.value()), "move north\n");
    EXPECT_RESULT_ERROR(conn.receive(Milliseconds(10)), ErrorCode::Timeout);
}

// ============================================================================
// FakeWebhookTransport
// ============================================================================

TEST(TestHarness, FakeWebhookTransport_FailsConfiguredTimes) {
    FakeWebhookTransport transport;
    transport.failNext(2);

    EXPECT_TRUE(transport.post("u", "a", {}, Milliseconds(10)).isFailure());
    EXPECT_TRUE(transport.post("u", "b", {}, Milliseconds(10)).isFailure());
    EXPECT_TRUE(transport.post("u", "c", {{"X-Key", "v"}}, Milliseconds(10)).isSuccess());

    EXPECT_EQ(transport.attempts(), 3);
    ASSERT_EQ(transport.bodies().size(), 1u);
    EXPECT_EQ(transport.bodies()[0], "c");
    EXPECT_EQ(transport.headers()[0].at("X-Key"), "v");
}

// ============================================================================
// Configuration Helpers
// ============================================================================

TEST(TestHarness, testConfig_IsValid) {
    TempDirectory dir;
    auto config = testConfig(dir.path());
    EXPECT_TRUE(config.validate().isSuccess());
    EXPECT_TRUE(config.isAdmin("admin@example.edu"));
}

TEST(TestHarness, scriptGame_DefaultsAuthorEmail) {
    auto game = scriptGame("echo", "cat");
    EXPECT_EQ(game.authorEmail, "echo@example.edu");
    EXPECT_EQ(game.kind, ArtifactKind::Executable);
    ASSERT_EQ(game.command.size(), 3u);
    EXPECT_EQ(game.command[2], "cat");
}
