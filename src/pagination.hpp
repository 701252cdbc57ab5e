#pragma once

#include "transport.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace product_sync {

/// Walks a cursor-paginated list endpoint to the end.
class Paginator {
public:
    struct Stats {
        int totalFetched  = 0;
        int totalRequests = 0;
    };

    static constexpr const char* kPageSizeParam  = "pageSize";
    static constexpr const char* kPageTokenParam = "pageToken";

    explicit Paginator(RateLimitedTransport& transport, bool verbose = false);

    /// Fetch every item of @p url (items read from @p itemsKey) in pages of
    /// @p pageSize.  The first request carries no cursor; later requests
    /// carry the server's cursor verbatim.
    /// @throws std::runtime_error on the first network, status or parse
    ///         error.  No partial result is returned.
    std::vector<nlohmann::json> fetchAll(const std::string& url,
                                         const std::string& itemsKey,
                                         int pageSize);

    Stats getStats() const { return mStats; }

private:
    RateLimitedTransport& mTransport;
    bool                  mVerbose;
    Stats                 mStats{};

    static std::string pageUrl(const std::string& url, int pageSize,
                               const std::optional<std::string>& cursor);
};

} // namespace product_sync
