#include "product_api.hpp"
#include "mapping.hpp"
#include "util.hpp"

#include <iostream>
#include <random>
#include <stdexcept>

namespace product_sync {

namespace {

std::string makeBoundary() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    return "----product_sync" + std::to_string(rng());
}

} // namespace

RobloxProductApi::RobloxProductApi(RateLimitedTransport& transport,
                                   const ClientConfig& config,
                                   int pageSize,
                                   bool verbose)
    : mTransport(transport)
    , mPaginator(transport, verbose)
    , mApiBase(config.apiBase)
    , mPageSize(pageSize)
    , mVerbose(verbose)
{
    while (!mApiBase.empty() && mApiBase.back() == '/') {
        mApiBase.pop_back();
    }
}

// ---------------------------------------------------------------------------
// Endpoints
// ---------------------------------------------------------------------------

std::string RobloxProductApi::gamePassesUrl(uint64_t universeId) const {
    return mApiBase + "/game-passes/v1/universes/" + std::to_string(universeId) +
           "/game-passes";
}

std::string RobloxProductApi::devProductsUrl(uint64_t universeId) const {
    return mApiBase + "/developer-products/v2/universes/" + std::to_string(universeId) +
           "/developer-products";
}

// ---------------------------------------------------------------------------
// Listing
// ---------------------------------------------------------------------------

std::vector<GamePass> RobloxProductApi::fetchAllGamePasses(uint64_t universeId) {
    const auto items =
        mPaginator.fetchAll(gamePassesUrl(universeId) + "/creator", "gamePasses", mPageSize);

    std::vector<GamePass> passes;
    passes.reserve(items.size());
    for (const auto& item : items) {
        passes.push_back(parseGamePassNode(item));
    }
    return passes;
}

std::vector<DevProduct> RobloxProductApi::fetchAllDevProducts(uint64_t universeId) {
    const auto items = mPaginator.fetchAll(devProductsUrl(universeId) + "/creator",
                                           "developerProducts", mPageSize);

    std::vector<DevProduct> products;
    products.reserve(items.size());
    for (const auto& item : items) {
        products.push_back(parseDevProductNode(item));
    }
    return products;
}

std::vector<RemoteProduct> RobloxProductApi::fetchAllProducts(uint64_t universeId) {
    const auto passes   = fetchAllGamePasses(universeId);
    const auto products = fetchAllDevProducts(universeId);

    std::vector<RemoteProduct> all;
    all.reserve(passes.size() + products.size());
    for (const auto& gp : passes) {
        all.push_back(RemoteProduct{ProductKind::GamePass, toProduct(gp)});
    }
    for (const auto& dp : products) {
        all.push_back(RemoteProduct{ProductKind::DevProduct, toProduct(dp)});
    }
    return all;
}

// ---------------------------------------------------------------------------
// Mutations
// ---------------------------------------------------------------------------

HttpResponse RobloxProductApi::sendForm(HttpRequest& request,
                                        const ProductUpdateRequest& update)
{
    const std::string boundary = makeBoundary();
    request.contentType = "multipart/form-data; boundary=" + boundary;
    request.body        = buildMultipartBody(toFormFields(update), boundary);

    if (mVerbose) {
        std::cerr << "[ProductApi] " << request.method << " '" << update.name << "'\n";
    }

    HttpResponse response = mTransport.send(request);
    ensureSuccess(response, request);
    return response;
}

GamePass RobloxProductApi::createGamePass(uint64_t universeId,
                                          const ProductUpdateRequest& update) {
    HttpRequest request;
    request.method = "POST";
    request.url    = gamePassesUrl(universeId);

    const auto response = sendForm(request, update);
    return parseGamePassNode(parseJsonBody(response, request));
}

DevProduct RobloxProductApi::createDevProduct(uint64_t universeId,
                                              const ProductUpdateRequest& update) {
    HttpRequest request;
    request.method = "POST";
    request.url    = devProductsUrl(universeId);

    const auto response = sendForm(request, update);
    return parseDevProductNode(parseJsonBody(response, request));
}

void RobloxProductApi::updateGamePass(uint64_t universeId, uint64_t gamePassId,
                                      const ProductUpdateRequest& update) {
    HttpRequest request;
    request.method = "PATCH";
    request.url    = gamePassesUrl(universeId) + "/" + std::to_string(gamePassId);
    sendForm(request, update);
}

void RobloxProductApi::updateDevProduct(uint64_t universeId, uint64_t productId,
                                        const ProductUpdateRequest& update) {
    HttpRequest request;
    request.method = "PATCH";
    request.url    = devProductsUrl(universeId) + "/" + std::to_string(productId);
    sendForm(request, update);
}

uint64_t RobloxProductApi::createProduct(ProductKind kind, uint64_t universeId,
                                         const ProductUpdateRequest& request) {
    switch (kind) {
        case ProductKind::GamePass:
            return createGamePass(universeId, request).gamePassId;
        case ProductKind::DevProduct:
            return createDevProduct(universeId, request).productId;
    }
    throw std::invalid_argument("Unknown product kind");
}

void RobloxProductApi::updateProduct(ProductKind kind, uint64_t universeId, uint64_t id,
                                     const ProductUpdateRequest& request) {
    switch (kind) {
        case ProductKind::GamePass:
            updateGamePass(universeId, id, request);
            return;
        case ProductKind::DevProduct:
            updateDevProduct(universeId, id, request);
            return;
    }
    throw std::invalid_argument("Unknown product kind");
}

} // namespace product_sync
