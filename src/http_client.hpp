#pragma once

#include <map>
#include <string>

namespace product_sync {

struct HttpRequest {
    std::string                        method = "GET";   // GET, POST, PATCH
    std::string                        url;
    std::map<std::string, std::string> headers;
    std::string                        body;
    std::string                        contentType;
    /// False for bodies that cannot be sent twice; such requests are never retried.
    bool                               replayable = true;
};

struct HttpResponse {
    unsigned int                       httpStatus = 0;
    std::map<std::string, std::string> headers;   // names lower-cased
    std::string                        body;

    bool ok() const { return httpStatus >= 200 && httpStatus < 300; }

    /// Header value by case-insensitive name, or "" when absent.
    std::string header(const std::string& name) const;
};

/// Sends one HTTP request and returns the raw response.
/// Implementations must be safe to call from several threads at once.
class HttpSender {
public:
    virtual ~HttpSender() = default;

    /// @throws std::runtime_error on network / timeout errors.
    virtual HttpResponse send(const HttpRequest& request) = 0;
};

/// Blocking HTTP(S) sender built on Boost.Beast.  Every call opens its own
/// connection, so concurrent calls share no state.
class BeastHttpSender : public HttpSender {
public:
    /// @param userAgent  Value of the User-Agent header
    /// @param timeoutMs  Per-operation timeout in milliseconds
    explicit BeastHttpSender(std::string userAgent = "product_sync/1.0",
                             int timeoutMs = 30000);

    HttpResponse send(const HttpRequest& request) override;

    void setVerbose(bool v) { mVerbose = v; }

private:
    std::string mUserAgent;
    int         mTimeoutMs;
    bool        mVerbose = false;

    HttpResponse doHttpRequest(const HttpRequest& request);
    HttpResponse doHttpsRequest(const HttpRequest& request);
};

} // namespace product_sync
