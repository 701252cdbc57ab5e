#include "transport.hpp"
#include "util.hpp"

#include <iostream>
#include <stdexcept>
#include <thread>

namespace product_sync {

namespace {

constexpr unsigned int kTooManyRequests = 429;

std::optional<int64_t> parseSeconds(const std::string& raw) {
    const std::string value = trim(raw);
    if (value.empty()) return std::nullopt;

    for (char c : value) {
        if (c < '0' || c > '9') return std::nullopt;
    }
    try {
        return std::stoll(value);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

} // namespace

// ---------------------------------------------------------------------------
// ApiCredential
// ---------------------------------------------------------------------------

void ApiCredential::set(std::optional<std::string> token) {
    std::lock_guard<std::mutex> lock(mMutex);
    mToken = std::move(token);
}

std::optional<std::string> ApiCredential::get() const {
    std::lock_guard<std::mutex> lock(mMutex);
    return mToken;
}

// ---------------------------------------------------------------------------
// RateLimitedTransport
// ---------------------------------------------------------------------------

RateLimitedTransport::RateLimitedTransport(HttpSender& sender,
                                           const ApiCredential& credential,
                                           const ClientConfig& config,
                                           Sleeper sleeper)
    : mSender(sender)
    , mCredential(credential)
    , mMaxRetries(config.maxRetries)
    , mCushion(config.cushion)
    , mSleeper(std::move(sleeper))
{
    if (!mSleeper) {
        mSleeper = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

std::chrono::seconds
RateLimitedTransport::retryWaitFromHeaders(const HttpResponse& response) {
    auto secs = parseSeconds(response.header("retry-after"));
    if (!secs) {
        secs = parseSeconds(response.header("x-ratelimit-reset"));
    }
    return std::chrono::seconds(secs.value_or(1));
}

HttpResponse RateLimitedTransport::send(HttpRequest request) {
    if (auto token = mCredential.get()) {
        request.headers[kApiKeyHeader] = *token;
    }

    for (int attempt = 0; ; ++attempt) {
        ++mTotalRequests;
        HttpResponse response = mSender.send(request);

        if (response.httpStatus != kTooManyRequests) {
            return response;
        }

        if (attempt >= mMaxRetries || !request.replayable) {
            return response;
        }

        const auto wait = retryWaitFromHeaders(response);

        std::cerr << "[Transport] Rate limited on attempt " << (attempt + 1)
                  << ", retrying after " << wait.count() << " seconds...\n";

        const auto total =
            std::chrono::duration_cast<std::chrono::milliseconds>(wait) + mCushion;

        ++mTotalRetries;
        mTotalSleepMs += total.count();
        mSleeper(total);
    }
}

} // namespace product_sync
