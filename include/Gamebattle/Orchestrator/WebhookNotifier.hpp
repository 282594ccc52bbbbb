/**
 * @file WebhookNotifier.hpp
 * @brief Fire-and-forget webhook delivery with bounded retries
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 *
 * Payloads are queued and posted by one background thread. Failed posts are
 * retried with exponential backoff, then logged and dropped. When a secret
 * is configured the body is signed with HMAC-SHA256 and the signature sent
 * as `X-Gamebattle-Signature: sha256=<hex>`.
 */

#pragma once

#ifndef GAMEBATTLE_ORCHESTRATOR_WEBHOOK_NOTIFIER_HPP
#define GAMEBATTLE_ORCHESTRATOR_WEBHOOK_NOTIFIER_HPP

#include <Gamebattle/Core/Types.hpp>
#include <Gamebattle/Core/ErrorCodes.hpp>
#include <Gamebattle/Core/HttpClient.hpp>
#include <Gamebattle/Orchestrator/OrchestratorConfig.hpp>
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

namespace Gamebattle::Orchestrator {

/// Header carrying the payload signature
constexpr const char* kSignatureHeader = "X-Gamebattle-Signature";

/**
 * @brief Delivers one webhook body
 */
class WebhookTransport {
public:
    virtual ~WebhookTransport() = default;

    /**
     * @brief POST a JSON body
     * @return Failure for transport errors and non-2xx responses
     */
    virtual Result<void> post(const std::string& url, const std::string& body,
                              const Network::HttpHeaders& headers, Milliseconds timeout) = 0;
};

/**
 * @brief Transport over the libcurl HttpClient
 */
class HttpWebhookTransport : public WebhookTransport {
public:
    HttpWebhookTransport();

    Result<void> post(const std::string& url, const std::string& body,
                      const Network::HttpHeaders& headers, Milliseconds timeout) override;

private:
    Network::HttpClient m_client;
};

class WebhookNotifier {
public:
    struct Options {
        std::string url;
        std::string secret;
        int maxAttempts = 3;
        Milliseconds baseDelay{500};
        Milliseconds timeout{5000};
        size_t maxQueue = 1000;
    };

    struct Statistics {
        uint64_t enqueued = 0;
        uint64_t delivered = 0;
        uint64_t failed = 0;     ///< Gave up after the retry budget
        uint64_t discarded = 0;  ///< Evicted from a full queue
    };

    WebhookNotifier(Options options, std::shared_ptr<WebhookTransport> transport);
    ~WebhookNotifier();

    WebhookNotifier(const WebhookNotifier&) = delete;
    WebhookNotifier& operator=(const WebhookNotifier&) = delete;

    /// Options from the orchestrator configuration
    static Options optionsFrom(const OrchestratorConfig& config);

    /// False when no URL is configured; enqueue() is then a no-op
    [[nodiscard]] bool enabled() const;

    void start();

    /// Stop the worker; undelivered payloads are logged and dropped
    void stop();

    /**
     * @brief Queue a payload; never blocks on the network
     */
    void enqueue(nlohmann::json payload);

    /**
     * @brief Wait until the queue is empty and nothing is in flight
     * @return false on timeout
     */
    bool flush(Milliseconds timeout);

    [[nodiscard]] Statistics stats() const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace Gamebattle::Orchestrator

#endif // GAMEBATTLE_ORCHESTRATOR_WEBHOOK_NOTIFIER_HPP
