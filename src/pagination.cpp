#include "pagination.hpp"
#include "mapping.hpp"
#include "util.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>

namespace product_sync {

Paginator::Paginator(RateLimitedTransport& transport, bool verbose)
    : mTransport(transport)
    , mVerbose(verbose) {}

// ---------------------------------------------------------------------------
// Public: paginated fetch
// ---------------------------------------------------------------------------

std::vector<nlohmann::json> Paginator::fetchAll(const std::string& url,
                                                const std::string& itemsKey,
                                                int pageSize)
{
    if (pageSize <= 0) {
        throw std::invalid_argument("Page size must be positive");
    }

    std::vector<nlohmann::json> allItems;
    std::optional<std::string> cursor;

    while (true) {
        HttpRequest request;
        request.method = "GET";
        request.url    = pageUrl(url, pageSize, cursor);

        if (mVerbose) {
            std::cerr << "[Paginator] Fetching page: " << kPageSizeParam << "=" << pageSize;
            if (cursor) std::cerr << ", " << kPageTokenParam << "=" << *cursor;
            std::cerr << "\n";
        }

        const HttpResponse response = mTransport.send(request);
        ++mStats.totalRequests;

        ensureSuccess(response, request);
        const PageResult page = parsePage(parseJsonBody(response, request), itemsKey);

        allItems.insert(allItems.end(), page.items.begin(), page.items.end());

        if (mVerbose) {
            std::cerr << "[Paginator] Got " << page.items.size()
                      << " items (total so far: " << allItems.size() << ")\n";
        }

        if (!page.nextCursor) {
            if (mVerbose) {
                std::cerr << "[Paginator] No more pages.\n";
            }
            break;
        }

        cursor = page.nextCursor;
    }

    mStats.totalFetched += static_cast<int>(allItems.size());
    return allItems;
}

std::string Paginator::pageUrl(const std::string& url, int pageSize,
                               const std::optional<std::string>& cursor)
{
    std::string out = url;
    out += (url.find('?') == std::string::npos) ? '?' : '&';
    out += kPageSizeParam;
    out += "=" + std::to_string(pageSize);
    if (cursor) {
        out += "&";
        out += kPageTokenParam;
        out += "=" + urlEncode(*cursor);
    }
    return out;
}

} // namespace product_sync
