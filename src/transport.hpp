#pragma once

#include "http_client.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace product_sync {

/// Explicit client configuration handed to the transport and API layers.
struct ClientConfig {
    std::string apiBase    = "https://apis.roblox.com";
    std::string userAgent  = "product_sync/1.0";
    int         timeoutMs  = 30000;
    int         maxRetries = 5;          // rate-limit retries per request
    std::chrono::milliseconds cushion{75};
};

/// Thread-safe settable cell holding the API key.
class ApiCredential {
public:
    ApiCredential() = default;
    explicit ApiCredential(std::optional<std::string> token)
        : mToken(std::move(token)) {}

    void set(std::optional<std::string> token);
    std::optional<std::string> get() const;

private:
    mutable std::mutex         mMutex;
    std::optional<std::string> mToken;
};

/// Wraps an HttpSender with the API credential header and HTTP 429 handling.
///
/// A 429 response is retried after the server's retry-after (or
/// x-ratelimit-reset) seconds, default 1, plus a small cushion.  After
/// maxRetries retries the last 429 is returned to the caller, as is any
/// other status.  Safe for concurrent use.
class RateLimitedTransport {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    static constexpr const char* kApiKeyHeader = "x-api-key";

    RateLimitedTransport(HttpSender& sender,
                         const ApiCredential& credential,
                         const ClientConfig& config = ClientConfig{},
                         Sleeper sleeper = nullptr);

    HttpResponse send(HttpRequest request);

    /// Wait suggested by a 429 response, without the cushion.
    static std::chrono::seconds retryWaitFromHeaders(const HttpResponse& response);

    // ---- accessors for summary report ----
    int    totalRequests()     const { return mTotalRequests.load(); }
    int    totalRetries()      const { return mTotalRetries.load(); }
    double totalSleepSeconds() const { return mTotalSleepMs.load() / 1000.0; }

private:
    HttpSender&          mSender;
    const ApiCredential& mCredential;
    int                  mMaxRetries;
    std::chrono::milliseconds mCushion;
    Sleeper              mSleeper;

    std::atomic<int>     mTotalRequests{0};
    std::atomic<int>     mTotalRetries{0};
    std::atomic<int64_t> mTotalSleepMs{0};
};

} // namespace product_sync
