/**
 * @file WebhookNotifier.cpp
 * @brief Webhook queue and delivery thread
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 */

#include <Gamebattle/Orchestrator/WebhookNotifier.hpp>
#include <Gamebattle/Core/Crypto.hpp>
#include <Gamebattle/Core/Logger.hpp>

#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>

namespace Gamebattle::Orchestrator {

using json = nlohmann::json;

// ============================================================================
// HttpWebhookTransport
// ============================================================================

HttpWebhookTransport::HttpWebhookTransport() {
    // Retries are owned by the notifier
    m_client.setMaxAttempts(1);
}

Result<void> HttpWebhookTransport::post(const std::string& url, const std::string& body,
                                        const Network::HttpHeaders& headers, Milliseconds timeout) {
    Network::HttpRequest request;
    request.method = Network::HttpMethod::POST;
    request.url = url;
    request.headers = headers;
    request.headers["Content-Type"] = "application/json";
    request.body.assign(body.begin(), body.end());
    request.timeout = timeout;

    GAMEBATTLE_TRY_ASSIGN(response, m_client.send(request));
    if (!response.isSuccess()) {
        GAMEBATTLE_LOG_WARNING_F("Webhook answered HTTP %d", response.statusCode);
        return ErrorCode::HttpError;
    }
    return Result<void>::Success();
}

// ============================================================================
// WebhookNotifier::Impl
// ============================================================================

class WebhookNotifier::Impl {
public:
    Impl(Options opts, std::shared_ptr<WebhookTransport> transport)
        : options_(std::move(opts))
        , transport_(std::move(transport)) {
    }

    ~Impl() {
        stop();
    }

    void start() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_ || !enabled()) {
            return;
        }
        running_ = true;
        worker_ = std::thread(&Impl::deliveryThread, this);
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_) {
                return;
            }
            running_ = false;
        }
        cv_.notify_all();
        if (worker_.joinable()) {
            worker_.join();
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (!queue_.empty()) {
            GAMEBATTLE_LOG_WARNING_F("Dropping %zu undelivered webhook payloads", queue_.size());
            stats_.discarded += queue_.size();
            queue_.clear();
        }
    }

    bool enabled() const {
        return !options_.url.empty() && transport_ != nullptr;
    }

    void enqueue(json payload) {
        if (!enabled()) {
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.size() >= options_.maxQueue) {
            queue_.pop_front();
            ++stats_.discarded;
            GAMEBATTLE_LOG_WARNING("Webhook queue full; dropped the oldest payload");
        }
        queue_.push_back(std::move(payload));
        ++stats_.enqueued;
        cv_.notify_all();
    }

    bool flush(Milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return queue_.empty() && !inFlight_; });
    }

    Statistics stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

private:
    void deliveryThread() {
        for (;;) {
            json payload;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return !running_ || !queue_.empty(); });
                if (!running_) {
                    return;
                }
                payload = std::move(queue_.front());
                queue_.pop_front();
                inFlight_ = true;
            }

            bool delivered = sendWithRetry(payload);

            std::lock_guard<std::mutex> lock(mutex_);
            inFlight_ = false;
            if (delivered) {
                ++stats_.delivered;
            } else {
                ++stats_.failed;
            }
            cv_.notify_all();
        }
    }

    bool sendWithRetry(const json& payload) {
        std::string body = payload.dump();
        Network::HttpHeaders headers;
        if (!options_.secret.empty()) {
            auto mac = Crypto::HMAC::sha256(asBytes(options_.secret), asBytes(body));
            if (mac.isSuccess()) {
                headers[kSignatureHeader] = "sha256=" + Crypto::toHex(mac.value());
            } else {
                GAMEBATTLE_LOG_ERROR("Webhook signing failed; sending unsigned");
            }
        }

        Milliseconds delay = options_.baseDelay;
        for (int attempt = 1; attempt <= options_.maxAttempts; ++attempt) {
            auto posted = transport_->post(options_.url, body, headers, options_.timeout);
            if (posted.isSuccess()) {
                return true;
            }
            GAMEBATTLE_LOG_WARNING_F("Webhook attempt %d/%d failed: %s", attempt, options_.maxAttempts,
                                     getErrorMessage(posted.error()).data());
            if (attempt == options_.maxAttempts) {
                break;
            }

            std::unique_lock<std::mutex> lock(mutex_);
            if (cv_.wait_for(lock, delay, [this] { return !running_; })) {
                break;
            }
            delay *= 2;
        }

        GAMEBATTLE_LOG_ERROR_F("Giving up on webhook payload: %s", body.c_str());
        return false;
    }

    Options options_;
    std::shared_ptr<WebhookTransport> transport_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<json> queue_;
    bool running_ = false;
    bool inFlight_ = false;
    Statistics stats_;
    std::thread worker_;
};

// ============================================================================
// WebhookNotifier - Public API
// ============================================================================

WebhookNotifier::WebhookNotifier(Options options, std::shared_ptr<WebhookTransport> transport)
    : m_impl(std::make_unique<Impl>(std::move(options), std::move(transport))) {
}

WebhookNotifier::~WebhookNotifier() = default;

WebhookNotifier::Options WebhookNotifier::optionsFrom(const OrchestratorConfig& config) {
    Options options;
    options.url = config.webhookUrl;
    options.secret = config.webhookSecret;
    options.maxAttempts = config.webhookMaxAttempts;
    options.baseDelay = config.webhookBaseDelay;
    options.timeout = config.webhookTimeout;
    return options;
}

bool WebhookNotifier::enabled() const {
    return m_impl->enabled();
}

void WebhookNotifier::start() {
    m_impl->start();
}

void WebhookNotifier::stop() {
    m_impl->stop();
}

void WebhookNotifier::enqueue(json payload) {
    m_impl->enqueue(std::move(payload));
}

bool WebhookNotifier::flush(Milliseconds timeout) {
    return m_impl->flush(timeout);
}

WebhookNotifier::Statistics WebhookNotifier::stats() const {
    return m_impl->stats();
}

} // namespace Gamebattle::Orchestrator
