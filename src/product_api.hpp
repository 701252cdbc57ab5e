#pragma once

#include "models.hpp"
#include "pagination.hpp"
#include "transport.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace product_sync {

/// Remote operations the sync engine needs from the platform.
class ProductApi {
public:
    virtual ~ProductApi() = default;

    /// Every pass followed by every developer product of the universe.
    virtual std::vector<RemoteProduct> fetchAllProducts(uint64_t universeId) = 0;

    /// Create a record and return its new id.
    virtual uint64_t createProduct(ProductKind kind, uint64_t universeId,
                                   const ProductUpdateRequest& request) = 0;

    virtual void updateProduct(ProductKind kind, uint64_t universeId, uint64_t id,
                               const ProductUpdateRequest& request) = 0;
};

/// Roblox Open Cloud game-pass and developer-product endpoints.
/// Safe to call createProduct/updateProduct from several threads.
class RobloxProductApi : public ProductApi {
public:
    RobloxProductApi(RateLimitedTransport& transport,
                     const ClientConfig& config,
                     int pageSize = 100,
                     bool verbose = false);

    std::vector<RemoteProduct> fetchAllProducts(uint64_t universeId) override;
    uint64_t createProduct(ProductKind kind, uint64_t universeId,
                           const ProductUpdateRequest& request) override;
    void updateProduct(ProductKind kind, uint64_t universeId, uint64_t id,
                       const ProductUpdateRequest& request) override;

    std::vector<GamePass>   fetchAllGamePasses(uint64_t universeId);
    std::vector<DevProduct> fetchAllDevProducts(uint64_t universeId);

    GamePass   createGamePass(uint64_t universeId, const ProductUpdateRequest& request);
    DevProduct createDevProduct(uint64_t universeId, const ProductUpdateRequest& request);

    void updateGamePass(uint64_t universeId, uint64_t gamePassId,
                        const ProductUpdateRequest& request);
    void updateDevProduct(uint64_t universeId, uint64_t productId,
                          const ProductUpdateRequest& request);

    Paginator::Stats paginationStats() const { return mPaginator.getStats(); }

private:
    RateLimitedTransport& mTransport;
    Paginator             mPaginator;
    std::string           mApiBase;
    int                   mPageSize;
    bool                  mVerbose;

    std::string gamePassesUrl(uint64_t universeId) const;
    std::string devProductsUrl(uint64_t universeId) const;

    /// Attach @p update as a multipart body, send, and fail on any non-2xx status.
    HttpResponse sendForm(HttpRequest& request, const ProductUpdateRequest& update);
};

} // namespace product_sync
