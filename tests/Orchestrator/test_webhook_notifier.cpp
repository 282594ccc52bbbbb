/**
 * @file test_webhook_notifier.cpp
 * @brief Tests for asynchronous webhook delivery
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 */

#include <Gamebattle/Orchestrator/WebhookNotifier.hpp>
#include <Gamebattle/Core/Crypto.hpp>
#include "TestHarness.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace Gamebattle;
using namespace Gamebattle::Orchestrator;
using namespace Gamebattle::Testing;

namespace {

WebhookNotifier::Options fastOptions(const std::string& url = "http://hooks.invalid/report") {
    WebhookNotifier::Options options;
    options.url = url;
    options.secret = "s3cret";
    options.maxAttempts = 3;
    options.baseDelay = Milliseconds(5);
    options.timeout = Milliseconds(2000);
    return options;
}

} // namespace

TEST(WebhookNotifier, DeliversSignedPayloads) {
    auto transport = std::make_shared<FakeWebhookTransport>();
    WebhookNotifier notifier(fastOptions(), transport);
    notifier.start();

    notifier.enqueue({{"event", "score"}, {"userId", "alice@example.edu"}, {"score", 3}});
    ASSERT_TRUE(notifier.flush(Milliseconds(2000)));

    auto bodies = transport->bodies();
    ASSERT_EQ(bodies.size(), 1u);
    auto doc = nlohmann::json::parse(bodies[0]);
    EXPECT_EQ(doc["event"], "score");
    EXPECT_EQ(doc["score"], 3);

    auto mac = Crypto::HMAC::sha256(asBytes("s3cret"), asBytes(bodies[0]));
    ASSERT_RESULT_OK(mac);
    EXPECT_EQ(transport->headers()[0].at(kSignatureHeader), "sha256=" + Crypto::toHex(mac.value()));

    EXPECT_EQ(notifier.stats().delivered, 1u);
    notifier.stop();
}

TEST(WebhookNotifier, RetriesThenSucceeds) {
    auto transport = std::make_shared<FakeWebhookTransport>();
    transport->failNext(2);
    WebhookNotifier notifier(fastOptions(), transport);
    notifier.start();

    notifier.enqueue({{"event", "report"}});
    ASSERT_TRUE(notifier.flush(Milliseconds(2000)));

    EXPECT_EQ(transport->attempts(), 3);
    EXPECT_EQ(transport->bodies().size(), 1u);
    EXPECT_EQ(notifier.stats().delivered, 1u);
    EXPECT_EQ(notifier.stats().failed, 0u);
}

TEST(WebhookNotifier, GivesUpAfterBudgetAndKeepsGoing) {
    auto transport = std::make_shared<FakeWebhookTransport>();
    transport->failNext(3);
    WebhookNotifier notifier(fastOptions(), transport);
    notifier.start();

    notifier.enqueue({{"n", 1}});
    notifier.enqueue({{"n", 2}});
    ASSERT_TRUE(notifier.flush(Milliseconds(2000)));

    auto stats = notifier.stats();
    EXPECT_EQ(stats.enqueued, 2u);
    EXPECT_EQ(stats.failed, 1u);
    EXPECT_EQ(stats.delivered, 1u);
    ASSERT_EQ(transport->bodies().size(), 1u);
    EXPECT_EQ(nlohmann::json::parse(transport->bodies()[0])["n"], 2);
}

TEST(WebhookNotifier, PayloadsKeepOrder) {
    auto transport = std::make_shared<FakeWebhookTransport>();
    WebhookNotifier notifier(fastOptions(), transport);
    notifier.start();

    for (int i = 0; i < 20; ++i) {
        notifier.enqueue({{"n", i}});
    }
    ASSERT_TRUE(notifier.flush(Milliseconds(2000)));

    auto bodies = transport->bodies();
    ASSERT_EQ(bodies.size(), 20u);
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(nlohmann::json::parse(bodies[static_cast<size_t>(i)])["n"], i);
    }
}

TEST(WebhookNotifier, FullQueueDropsOldest) {
    auto transport = std::make_shared<FakeWebhookTransport>();
    auto options = fastOptions();
    options.maxQueue = 2;
    WebhookNotifier notifier(options, transport);

    // Not started: payloads accumulate
    notifier.enqueue({{"n", 1}});
    notifier.enqueue({{"n", 2}});
    notifier.enqueue({{"n", 3}});
    EXPECT_EQ(notifier.stats().discarded, 1u);

    notifier.start();
    ASSERT_TRUE(notifier.flush(Milliseconds(2000)));
    auto bodies = transport->bodies();
    ASSERT_EQ(bodies.size(), 2u);
    EXPECT_EQ(nlohmann::json::parse(bodies[0])["n"], 2);
}

TEST(WebhookNotifier, DisabledWithoutUrl) {
    auto transport = std::make_shared<FakeWebhookTransport>();
    WebhookNotifier notifier(fastOptions(""), transport);
    EXPECT_FALSE(notifier.enabled());

    notifier.start();
    notifier.enqueue({{"event", "score"}});
    EXPECT_TRUE(notifier.flush(Milliseconds(10)));
    EXPECT_EQ(transport->attempts(), 0);
    EXPECT_EQ(notifier.stats().enqueued, 0u);
}

TEST(WebhookNotifier, StopDropsUndelivered) {
    auto transport = std::make_shared<FakeWebhookTransport>();
    WebhookNotifier notifier(fastOptions(), transport);

    notifier.enqueue({{"n", 1}});
    notifier.start();
    notifier.stop();
    auto stats = notifier.stats();
    EXPECT_EQ(stats.delivered + stats.discarded + stats.failed, 1u);
}

TEST(HttpWebhookTransport, PostsToLoopbackServer) {
    LoopbackHttpServer server(200, "{}");
    auto transport = std::make_shared<HttpWebhookTransport>();
    WebhookNotifier notifier(fastOptions(server.url("/hooks/gamebattle")), transport);
    notifier.start();

    notifier.enqueue({{"event", "score"}, {"content", "alice scored 3"}});
    ASSERT_TRUE(notifier.flush(Milliseconds(5000)));
    EXPECT_EQ(notifier.stats().delivered, 1u);

    auto requests = server.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_NE(requests[0].find("POST /hooks/gamebattle"), std::string::npos);
    EXPECT_NE(requests[0].find("X-Gamebattle-Signature: sha256="), std::string::npos);
    EXPECT_NE(requests[0].find("alice scored 3"), std::string::npos);
}

TEST(HttpWebhookTransport, NonSuccessStatusIsFailure) {
    LoopbackHttpServer server(500, "{}");
    HttpWebhookTransport transport;

    auto posted = transport.post(server.url("/hook"), "{}", {}, Milliseconds(2000));
    EXPECT_RESULT_ERROR(posted, ErrorCode::HttpError);
}
