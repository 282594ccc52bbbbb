/**
 * @file test_io_bridge.cpp
 * @brief Tests for the session I/O relay
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 */

#include <Gamebattle/Orchestrator/IoBridge.hpp>
#include "TestHarness.hpp"
#include <gtest/gtest.h>

#include <atomic>
#include <cstring>
#include <thread>
#include <vector>

using namespace Gamebattle;
using namespace Gamebattle::Orchestrator;
using namespace Gamebattle::Testing;

namespace {

/// Sandbox output fed by the test
class ScriptedOutput : public ByteReader {
public:
    Result<size_t> read(MutableByteSpan buffer, Milliseconds timeout) override {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait_for(lock, timeout, [this] { return !m_data.empty() || m_eof || m_closed; });
        if (!m_data.empty()) {
            size_t n = std::min(buffer.size(), m_data.size());
            std::copy(m_data.begin(), m_data.begin() + static_cast<std::ptrdiff_t>(n), buffer.begin());
            m_data.erase(m_data.begin(), m_data.begin() + static_cast<std::ptrdiff_t>(n));
            return n;
        }
        if (m_eof || m_closed) {
            return static_cast<size_t>(0);
        }
        return ErrorCode::Timeout;
    }

    void close() override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
        m_cv.notify_all();
    }

    void emit(const std::string& text) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_data.insert(m_data.end(), text.begin(), text.end());
        m_cv.notify_all();
    }

    void finish() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_eof = true;
        m_cv.notify_all();
    }

    size_t pending() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_data.size();
    }

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<Byte> m_data;
    bool m_eof = false;
    bool m_closed = false;
};

/// Sandbox input that records what the bridge wrote
class RecordingInput : public ByteWriter {
public:
    Result<size_t> write(ByteSpan data, Milliseconds) override {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_sandboxClosed || m_closed) {
            return ErrorCode::EndOfInput;
        }
        m_received.append(reinterpret_cast<const char*>(data.data()), data.size());
        return data.size();
    }

    void close() override {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
    }

    /// Simulate the game closing its stdin
    void closeBySandbox() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_sandboxClosed = true;
    }

    std::string received() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_received;
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed;
    }

private:
    mutable std::mutex m_mutex;
    std::string m_received;
    bool m_sandboxClosed = false;
    bool m_closed = false;
};

/// Sandbox input of a game that never reads its stdin
class StuckInput : public ByteWriter {
public:
    Result<size_t> write(ByteSpan, Milliseconds timeout) override {
        ++m_attempts;
        std::this_thread::sleep_for(timeout);
        return ErrorCode::Timeout;
    }

    void close() override { m_closed = true; }

    int attempts() const { return m_attempts.load(); }
    bool isClosed() const { return m_closed.load(); }

private:
    std::atomic<int> m_attempts{0};
    std::atomic<bool> m_closed{false};
};

} // namespace

class IoBridgeTest : public ::testing::Test {
protected:
    void SetUp() override {
        options.bufferBytes = 1024;
        options.replayCapacity = 1024;
        options.stallTimeout = Milliseconds(100);
        options.pollInterval = Milliseconds(10);
        options.onClientDetached = [this] { ++detachEvents; };
    }

    std::unique_ptr<IoBridge> openBridge(std::shared_ptr<ClientConnection> client) {
        auto in = std::make_unique<RecordingInput>();
        input = in.get();
        return openBridgeWith(std::move(client), std::move(in));
    }

    std::unique_ptr<IoBridge> openBridgeWith(std::shared_ptr<ClientConnection> client,
                                             std::unique_ptr<ByteWriter> in) {
        auto out = std::make_unique<ScriptedOutput>();
        output = out.get();

        SandboxStreams streams;
        streams.output = std::move(out);
        streams.input = std::move(in);
        auto bridge = IoBridge::open(std::move(streams), std::move(client), options);
        EXPECT_TRUE(bridge.isSuccess());
        return bridge.isSuccess() ? std::move(bridge).value() : nullptr;
    }

    IoBridge::Options options;
    std::atomic<int> detachEvents{0};
    ScriptedOutput* output = nullptr;
    RecordingInput* input = nullptr;
};

TEST_F(IoBridgeTest, RelaysBothDirectionsInOrder) {
    auto client = std::make_shared<RecordingConnection>();
    auto bridge = openBridge(client);
    ASSERT_NE(bridge, nullptr);
    EXPECT_TRUE(bridge->isAttached());

    output->emit("Welcome\n");
    output->emit("> ");
    ASSERT_TRUE(waitUntil([&] { return client->output() == "Welcome\n> "; }));

    client->type("north\n");
    client->type("take lamp\n");
    client->type("quit\n");
    ASSERT_TRUE(waitUntil([&] { return input->received() == "north\ntake lamp\nquit\n"; }));

    EXPECT_TRUE(waitUntil([&] { return bridge->stats().bytesToClient == 10u; }));
    EXPECT_TRUE(waitUntil([&] { return bridge->stats().bytesToSandbox == 21u; }));
    EXPECT_EQ(bridge->stats().attachments, 1u);
}

TEST_F(IoBridgeTest, LargeOutputKeepsByteOrder) {
    auto client = std::make_shared<RecordingConnection>();
    auto bridge = openBridge(client);
    ASSERT_NE(bridge, nullptr);

    std::string expected;
    for (int i = 0; i < 200; ++i) {
        std::string line = "line " + std::to_string(i) + "\n";
        expected += line;
        output->emit(line);
    }
    ASSERT_TRUE(waitUntil([&] { return client->output().size() >= expected.size(); }));
    EXPECT_EQ(client->output(), expected);
    EXPECT_EQ(client->droppedBytes(), 0u);
}

TEST_F(IoBridgeTest, DetachedOutputIsReplayedOnAttach) {
    options.detachedPolicy = DetachedOutputPolicy::ReplayBounded;
    auto bridge = openBridge(nullptr);
    ASSERT_NE(bridge, nullptr);
    EXPECT_FALSE(bridge->isAttached());
    EXPECT_TRUE(bridge->detachedSince().has_value());

    output->emit("turn 1\n");
    ASSERT_TRUE(waitUntil([&] { return output->pending() == 0; }));

    auto client = std::make_shared<RecordingConnection>();
    ASSERT_TRUE(bridge->attach(client).isSuccess());
    ASSERT_TRUE(waitUntil([&] { return client->output() == "turn 1\n"; }));
    EXPECT_EQ(client->droppedBytes(), 0u);
    EXPECT_FALSE(bridge->detachedSince().has_value());
}

TEST_F(IoBridgeTest, DetachedReplayIsBounded) {
    options.detachedPolicy = DetachedOutputPolicy::ReplayBounded;
    options.replayCapacity = 8;
    auto bridge = openBridge(nullptr);
    ASSERT_NE(bridge, nullptr);

    output->emit("0123456789abcdefghij");
    ASSERT_TRUE(waitUntil([&] { return output->pending() == 0; }));

    auto client = std::make_shared<RecordingConnection>();
    ASSERT_TRUE(bridge->attach(client).isSuccess());
    ASSERT_TRUE(waitUntil([&] { return client->output() == "cdefghij"; }));
    EXPECT_EQ(client->droppedBytes(), 12u);

    // The marker precedes the replayed bytes
    auto frames = client->frames();
    ASSERT_GE(frames.size(), 2u);
    EXPECT_EQ(frames[0].type, Frame::Type::Dropped);
    EXPECT_EQ(bridge->snapshotOutput().size(), 8u);
}

TEST_F(IoBridgeTest, DetachedOutputDroppedWithMarker) {
    options.detachedPolicy = DetachedOutputPolicy::DropWithMarker;
    auto bridge = openBridge(nullptr);
    ASSERT_NE(bridge, nullptr);

    output->emit("while you were away");
    ASSERT_TRUE(waitUntil([&] { return output->pending() == 0; }));

    auto client = std::make_shared<RecordingConnection>();
    ASSERT_TRUE(bridge->attach(client).isSuccess());
    ASSERT_TRUE(waitUntil([&] { return client->droppedBytes() == 19u; }));

    output->emit("now");
    ASSERT_TRUE(waitUntil([&] { return client->output() == "now"; }));
    EXPECT_EQ(bridge->stats().droppedBytes, 19u);
}

TEST_F(IoBridgeTest, StalledClientLosesOldestOutputButNeverBlocksSandbox) {
    options.bufferBytes = 16;
    auto client = std::make_shared<RecordingConnection>();
    auto bridge = openBridge(client);
    ASSERT_NE(bridge, nullptr);

    client->stall(true);
    std::string emitted;
    for (int i = 0; i < 10; ++i) {
        std::string chunk(8, static_cast<char>('a' + i));
        emitted += chunk;
        output->emit(chunk);
    }
    // The pump keeps draining the sandbox while the client is stuck
    ASSERT_TRUE(waitUntil([&] { return output->pending() == 0; }, Milliseconds(5000)));

    client->stall(false);
    ASSERT_TRUE(waitUntil([&] {
        return client->output().size() + client->droppedBytes() == emitted.size();
    }));

    EXPECT_GT(client->droppedBytes(), 0u);
    std::string received = client->output();
    ASSERT_FALSE(received.empty());
    EXPECT_EQ(received.back(), 'j');
    EXPECT_TRUE(bridge->isAttached());
}

TEST_F(IoBridgeTest, InputAfterSandboxClosedStdinYieldsEndOfInput) {
    auto client = std::make_shared<RecordingConnection>();
    auto bridge = openBridge(client);
    ASSERT_NE(bridge, nullptr);

    input->closeBySandbox();
    client->type("anyone there?\n");
    ASSERT_TRUE(waitUntil([&] { return client->count(Frame::Type::EndOfInput) == 1; }));
    EXPECT_EQ(bridge->stats().endOfInputFrames, 1u);

    // Output still flows
    output->emit("still talking\n");
    ASSERT_TRUE(waitUntil([&] { return client->output() == "still talking\n"; }));
}

TEST_F(IoBridgeTest, DisconnectDetachesWithoutTouchingSandbox) {
    auto first = std::make_shared<RecordingConnection>();
    auto bridge = openBridge(first);
    ASSERT_NE(bridge, nullptr);

    output->emit("a");
    ASSERT_TRUE(waitUntil([&] { return first->output() == "a"; }));

    first->disconnect();
    output->emit("b");
    ASSERT_TRUE(waitUntil([&] { return !bridge->isAttached(); }));
    EXPECT_EQ(detachEvents.load(), 1);
    EXPECT_TRUE(bridge->detachedSince().has_value());
    EXPECT_FALSE(input->isClosed());

    auto second = std::make_shared<RecordingConnection>();
    ASSERT_TRUE(bridge->attach(second).isSuccess());
    output->emit("c");
    ASSERT_TRUE(waitUntil([&] { return second->output() == "bc"; }));
    EXPECT_EQ(bridge->stats().attachments, 2u);
}

TEST_F(IoBridgeTest, AttachReplacesPreviousClient) {
    auto first = std::make_shared<RecordingConnection>();
    auto bridge = openBridge(first);
    ASSERT_NE(bridge, nullptr);

    auto second = std::make_shared<RecordingConnection>();
    ASSERT_TRUE(bridge->attach(second).isSuccess());
    EXPECT_TRUE(first->isClosed());

    output->emit("only for the new client");
    ASSERT_TRUE(waitUntil([&] { return second->output() == "only for the new client"; }));
    EXPECT_EQ(first->output(), "");
}

TEST_F(IoBridgeTest, CloseFlushesThenEndsSession) {
    auto client = std::make_shared<RecordingConnection>();
    auto bridge = openBridge(client);
    ASSERT_NE(bridge, nullptr);

    output->emit("final words\n");
    output->finish();
    bridge->close(EndReason::NormalExit);
    bridge->close(EndReason::Crash);

    EXPECT_TRUE(bridge->isClosed());
    EXPECT_EQ(client->output(), "final words\n");
    EXPECT_EQ(client->endReason(), EndReason::NormalExit);
    EXPECT_EQ(client->count(Frame::Type::EndOfSession), 1u);
    EXPECT_TRUE(client->isClosed());
    EXPECT_TRUE(input->isClosed());

    auto late = std::make_shared<RecordingConnection>();
    EXPECT_RESULT_ERROR(bridge->attach(late), ErrorCode::BridgeClosed);
}

TEST_F(IoBridgeTest, SnapshotKeepsRecentOutput) {
    options.replayCapacity = 4;
    auto client = std::make_shared<RecordingConnection>();
    auto bridge = openBridge(client);
    ASSERT_NE(bridge, nullptr);

    output->emit("abcdef");
    ASSERT_TRUE(waitUntil([&] { return client->output() == "abcdef"; }));
    EXPECT_EQ(Gamebattle::toString(bridge->snapshotOutput()), "cdef");
}

TEST_F(IoBridgeTest, OpenRejectsMissingStreams) {
    SandboxStreams streams;
    EXPECT_RESULT_ERROR(IoBridge::open(std::move(streams), nullptr, options), ErrorCode::InvalidArgument);
}

TEST_F(IoBridgeTest, UnreadInputNeverHidesDisconnect) {
    auto stuck = std::make_unique<StuckInput>();
    StuckInput* sandboxInput = stuck.get();
    auto first = std::make_shared<RecordingConnection>();
    auto bridge = openBridgeWith(first, std::move(stuck));
    ASSERT_NE(bridge, nullptr);

    first->type("0123456789");
    ASSERT_TRUE(waitUntil([&] { return sandboxInput->attempts() > 0; }));
    first->disconnect();

    ASSERT_TRUE(waitUntil([&] { return !bridge->isAttached(); }));
    EXPECT_TRUE(bridge->detachedSince().has_value());
    EXPECT_EQ(detachEvents.load(), 1);

    auto second = std::make_shared<RecordingConnection>();
    auto started = std::chrono::steady_clock::now();
    ASSERT_TRUE(bridge->attach(second).isSuccess());
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(1));
    EXPECT_TRUE(bridge->isAttached());

    output->emit("still here");
    ASSERT_TRUE(waitUntil([&] { return second->output() == "still here"; }));

    output->finish();
    started = std::chrono::steady_clock::now();
    bridge->close(EndReason::NormalExit);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(2));
    EXPECT_EQ(second->count(Frame::Type::EndOfSession), 1u);
    EXPECT_TRUE(sandboxInput->isClosed());
    EXPECT_EQ(bridge->stats().bytesToSandbox, 0u);
}

TEST_F(IoBridgeTest, ConcurrentCloseEndsSessionOnce) {
    auto client = std::make_shared<RecordingConnection>();
    auto bridge = openBridge(client);
    ASSERT_NE(bridge, nullptr);

    output->emit("last line\n");
    output->finish();

    std::atomic<bool> go{false};
    std::vector<std::thread> closers;
    for (int i = 0; i < 6; ++i) {
        closers.emplace_back([&, i] {
            while (!go.load()) {
                std::this_thread::yield();
            }
            bridge->close(i % 2 == 0 ? EndReason::NormalExit : EndReason::Crash);
        });
    }
    go = true;
    for (auto& t : closers) {
        t.join();
    }

    ASSERT_TRUE(waitUntil([&] { return client->isClosed(); }));
    EXPECT_TRUE(bridge->isClosed());
    EXPECT_EQ(client->count(Frame::Type::EndOfSession), 1u);
    EXPECT_EQ(client->output(), "last line\n");
}
