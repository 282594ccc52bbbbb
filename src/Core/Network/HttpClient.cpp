/**
 * @file HttpClient.cpp
 * @brief HTTP client implementation using libcurl
 * @author Gamebattle Platform Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Gamebattle Platform. All rights reserved.
 */

#include <Gamebattle/Core/HttpClient.hpp>
#include <Gamebattle/Core/Logger.hpp>

#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <mutex>
#include <thread>

namespace Gamebattle::Network {

// ============================================================================
// Global cURL initialization
// ============================================================================

namespace {
    std::once_flag g_curlInitFlag;
    bool g_curlInitialized = false;

    void initializeCurl() {
        std::call_once(g_curlInitFlag, []() {
            CURLcode res = curl_global_init(CURL_GLOBAL_ALL);
            g_curlInitialized = (res == CURLE_OK);
        });
    }

    // curl_global_cleanup() is not thread-safe; the process exit reclaims it
}

// ============================================================================
// cURL callbacks
// ============================================================================

namespace {
    size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
        size_t realsize = size * nmemb;
        auto* buffer = static_cast<ByteBuffer*>(userp);
        const Byte* data = static_cast<const Byte*>(contents);
        buffer->insert(buffer->end(), data, data + realsize);
        return realsize;
    }

    size_t headerCallback(char* buffer, size_t size, size_t nmemb, void* userp) {
        size_t realsize = size * nmemb;
        auto* headers = static_cast<HttpHeaders*>(userp);

        std::string header(buffer, realsize);

        // "Name: Value\r\n"
        size_t colonPos = header.find(':');
        if (colonPos != std::string::npos && colonPos > 0) {
            std::string name = header.substr(0, colonPos);
            std::string value = header.substr(colonPos + 1);

            value.erase(0, value.find_first_not_of(" \t"));
            value.erase(value.find_last_not_of(" \t\r\n") + 1);

            std::transform(name.begin(), name.end(), name.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

            (*headers)[name] = value;
        }

        return realsize;
    }

    bool isTransient(CURLcode res) {
        return res == CURLE_COULDNT_CONNECT ||
               res == CURLE_RECV_ERROR ||
               res == CURLE_SEND_ERROR ||
               res == CURLE_PARTIAL_FILE ||
               res == CURLE_GOT_NOTHING;
    }

    ErrorCode mapCurlError(CURLcode res) {
        switch (res) {
            case CURLE_COULDNT_RESOLVE_HOST:
                return ErrorCode::DnsResolutionFailed;
            case CURLE_COULDNT_CONNECT:
                return ErrorCode::ConnectionFailed;
            case CURLE_OPERATION_TIMEDOUT:
                return ErrorCode::Timeout;
            case CURLE_SSL_CONNECT_ERROR:
            case CURLE_PEER_FAILED_VERIFICATION:
                return ErrorCode::TlsHandshakeFailed;
            case CURLE_URL_MALFORMAT:
            case CURLE_UNSUPPORTED_PROTOCOL:
                return ErrorCode::InvalidArgument;
            default:
                return ErrorCode::NetworkError;
        }
    }
}

// ============================================================================
// HttpClient::Impl
// ============================================================================

class HttpClient::Impl {
public:
    Impl() {
        initializeCurl();
    }

    Result<HttpResponse> send(const HttpRequest& request) {
        if (!g_curlInitialized) {
            return ErrorCode::CurlInitFailed;
        }
        if (request.url.empty()) {
            return ErrorCode::InvalidArgument;
        }

        HttpHeaders allHeaders;
        Milliseconds timeout;
        int maxAttempts;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            allHeaders = m_defaultHeaders;
            timeout = request.timeout.count() > 0 ? request.timeout : m_defaultTimeout;
            maxAttempts = m_maxAttempts;
        }
        for (const auto& [name, value] : request.headers) {
            allHeaders[name] = value;
        }

        CURL* curl = curl_easy_init();
        if (!curl) {
            return ErrorCode::CurlInitFailed;
        }

        struct CurlGuard {
            CURL* handle;
            curl_slist* headers;
            ~CurlGuard() {
                if (headers) curl_slist_free_all(headers);
                if (handle) curl_easy_cleanup(handle);
            }
        } guard{curl, nullptr};

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        switch (request.method) {
            case HttpMethod::GET:
                curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
                break;
            case HttpMethod::POST:
                curl_easy_setopt(curl, CURLOPT_POST, 1L);
                break;
            case HttpMethod::PUT:
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "PUT");
                break;
            case HttpMethod::DELETE_:
                curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
                break;
        }

        for (const auto& [name, value] : allHeaders) {
            std::string header = name + ": " + value;
            guard.headers = curl_slist_append(guard.headers, header.c_str());
        }
        if (guard.headers) {
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, guard.headers);
        }

        if (request.method != HttpMethod::GET) {
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS,
                             reinterpret_cast<const char*>(request.body.data()));
        }

        long timeoutMs = static_cast<long>(timeout.count());
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeoutMs);
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeoutMs);

        if (request.followRedirects) {
            curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
            curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
        }

        curl_easy_setopt(curl, CURLOPT_USERAGENT, request.userAgent.c_str());

        HttpResponse response;
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

        // Timeouts are not retried
        CURLcode res = CURLE_OK;
        Milliseconds retryDelay{250};
        auto startTime = Clock::now();

        for (int attempt = 0; attempt < maxAttempts; ++attempt) {
            response.body.clear();
            response.headers.clear();
            res = curl_easy_perform(curl);

            if (res == CURLE_OK || !isTransient(res) || attempt == maxAttempts - 1) {
                break;
            }

            GAMEBATTLE_LOG_DEBUG_F("HTTP %s failed (%s), retrying",
                                   request.url.c_str(), curl_easy_strerror(res));
            std::this_thread::sleep_for(retryDelay);
            retryDelay *= 2;
        }

        response.elapsed = std::chrono::duration_cast<Milliseconds>(Clock::now() - startTime);

        if (res != CURLE_OK) {
            return mapCurlError(res);
        }

        long httpCode = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
        response.statusCode = static_cast<int>(httpCode);

        return response;
    }

    void addDefaultHeader(const std::string& name, const std::string& value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_defaultHeaders[name] = value;
    }

    void setDefaultTimeout(Milliseconds timeout) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_defaultTimeout = timeout;
    }

    void setMaxAttempts(int attempts) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_maxAttempts = std::max(1, attempts);
    }

private:
    std::mutex m_mutex;
    HttpHeaders m_defaultHeaders;
    Milliseconds m_defaultTimeout{30000};
    int m_maxAttempts{3};
};

// ============================================================================
// HttpClient public interface
// ============================================================================

HttpClient::HttpClient() : m_impl(std::make_unique<Impl>()) {}

HttpClient::~HttpClient() = default;

HttpClient::HttpClient(HttpClient&&) noexcept = default;
HttpClient& HttpClient::operator=(HttpClient&&) noexcept = default;

Result<HttpResponse> HttpClient::send(const HttpRequest& request) {
    return m_impl->send(request);
}

Result<HttpResponse> HttpClient::get(const std::string& url, const HttpHeaders& headers) {
    HttpRequest request;
    request.method = HttpMethod::GET;
    request.url = url;
    request.headers = headers;
    return send(request);
}

Result<HttpResponse> HttpClient::post(const std::string& url, const ByteBuffer& body,
                                      const HttpHeaders& headers) {
    HttpRequest request;
    request.method = HttpMethod::POST;
    request.url = url;
    request.body = body;
    request.headers = headers;
    return send(request);
}

Result<HttpResponse> HttpClient::postJson(const std::string& url, const std::string& json,
                                          const HttpHeaders& headers) {
    ByteBuffer body(json.begin(), json.end());
    auto allHeaders = headers;
    allHeaders["Content-Type"] = "application/json";
    return post(url, body, allHeaders);
}

void HttpClient::addDefaultHeader(const std::string& name, const std::string& value) {
    m_impl->addDefaultHeader(name, value);
}

void HttpClient::setDefaultTimeout(Milliseconds timeout) {
    m_impl->setDefaultTimeout(timeout);
}

void HttpClient::setMaxAttempts(int attempts) {
    m_impl->setMaxAttempts(attempts);
}

// ============================================================================
// HttpResponse helper methods
// ============================================================================

std::string HttpResponse::getHeader(const std::string& name) const {
    std::string lowerName = name;
    std::transform(lowerName.begin(), lowerName.end(), lowerName.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = headers.find(lowerName);
    if (it != headers.end()) {
        return it->second;
    }
    return "";
}

} // namespace Gamebattle::Network
