/**
 * @file HttpClient.hpp
 * @brief Outbound HTTP client
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 *
 * Blocking HTTP client used for webhook delivery.
 */

#pragma once

#ifndef GAMEBATTLE_CORE_HTTP_CLIENT_HPP
#define GAMEBATTLE_CORE_HTTP_CLIENT_HPP

#include <Gamebattle/Core/Types.hpp>
#include <Gamebattle/Core/ErrorCodes.hpp>
#include <string>
#include <map>
#include <memory>

namespace Gamebattle::Network {

// ============================================================================
// HTTP Types
// ============================================================================

/**
 * @brief HTTP methods
 */
enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE_  // DELETE is a macro on some platforms
};

/**
 * @brief HTTP header map
 */
using HttpHeaders = std::map<std::string, std::string>;

/**
 * @brief HTTP request configuration
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    ByteBuffer body;

    /// Timeout for the whole request; zero means the client default
    Milliseconds timeout{0};

    /// Follow redirects
    bool followRedirects = true;

    /// User agent string
    std::string userAgent = "Gamebattle/1.0";
};

/**
 * @brief HTTP response
 */
struct HttpResponse {
    /// HTTP status code
    int statusCode = 0;

    /// Response headers, names lowercased
    HttpHeaders headers;

    /// Response body
    ByteBuffer body;

    /// Total time taken
    Milliseconds elapsed{0};

    /// Check if request was successful (2xx)
    [[nodiscard]] bool isSuccess() const noexcept {
        return statusCode >= 200 && statusCode < 300;
    }

    /// Check if request had client error (4xx)
    [[nodiscard]] bool isClientError() const noexcept {
        return statusCode >= 400 && statusCode < 500;
    }

    /// Check if request had server error (5xx)
    [[nodiscard]] bool isServerError() const noexcept {
        return statusCode >= 500 && statusCode < 600;
    }

    /// Get body as string
    [[nodiscard]] std::string bodyAsString() const {
        return std::string(body.begin(), body.end());
    }

    /// Get header value (case-insensitive), empty if absent
    [[nodiscard]] std::string getHeader(const std::string& name) const;
};

// ============================================================================
// HTTP Client
// ============================================================================

/**
 * @brief libcurl-based HTTP client
 *
 * Transient transport failures are retried with exponential backoff
 * before an error is returned. HTTP status codes are not errors.
 *
 * @example
 * ```cpp
 * HttpClient client;
 * auto response = client.postJson(url, payload.dump());
 * if (response.isSuccess() && response.value().isSuccess()) { ... }
 * ```
 */
class HttpClient {
public:
    HttpClient();
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpClient(HttpClient&&) noexcept;
    HttpClient& operator=(HttpClient&&) noexcept;

    /**
     * @brief Send HTTP request
     * @param request Request configuration
     * @return Response or transport error
     */
    Result<HttpResponse> send(const HttpRequest& request);

    /**
     * @brief Send GET request
     */
    Result<HttpResponse> get(const std::string& url, const HttpHeaders& headers = {});

    /**
     * @brief Send POST request
     */
    Result<HttpResponse> post(const std::string& url, const ByteBuffer& body,
                              const HttpHeaders& headers = {});

    /**
     * @brief Send POST request with a JSON body
     */
    Result<HttpResponse> postJson(const std::string& url, const std::string& json,
                                  const HttpHeaders& headers = {});

    /**
     * @brief Add a header sent with every request
     */
    void addDefaultHeader(const std::string& name, const std::string& value);

    /**
     * @brief Set the timeout used when a request leaves it at zero
     */
    void setDefaultTimeout(Milliseconds timeout);

    /**
     * @brief Set the number of attempts for transient transport failures
     */
    void setMaxAttempts(int attempts);

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace Gamebattle::Network

#endif // GAMEBATTLE_CORE_HTTP_CLIENT_HPP
