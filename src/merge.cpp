#include "merge.hpp"
#include "naming.hpp"

#include <iostream>

namespace product_sync {

namespace {

std::map<std::string, Product>::const_iterator
findById(const std::map<std::string, Product>& items, uint64_t id) {
    for (auto it = items.begin(); it != items.end(); ++it) {
        if (it->second.id == id) return it;
    }
    return items.end();
}

std::string newKey(const std::map<std::string, Product>& items,
                   const std::string& canonical, uint64_t id) {
    std::string key = slugify(canonical);
    if (key.empty()) {
        return std::to_string(id);
    }
    auto clash = items.find(key);
    if (clash != items.end() && clash->second.id != id) {
        key += "-" + std::to_string(id);
    }
    return key;
}

} // namespace

Catalog mergeRemoteProducts(const Catalog& local,
                            const std::vector<RemoteProduct>& remote,
                            bool overwrite,
                            MergeStats* stats)
{
    Catalog merged = local;
    const auto& filters = merged.metadata.nameFilters;

    for (const auto& [kind, incoming] : remote) {
        if (!incoming.id) continue;

        auto& items = merged.collection(kind);
        auto match  = findById(items, *incoming.id);
        const Product* existing = (match != items.end()) ? &match->second : nullptr;

        const bool takeRemote = overwrite || existing == nullptr;

        Product product;
        product.id     = incoming.id;
        product.name   = canonicalName(takeRemote ? incoming.name : existing->name, filters);
        product.prefix = takeRemote ? std::nullopt : existing->prefix;
        product.active = incoming.active;

        product.description = takeRemote ? incoming.description : existing->description;
        if (existing != nullptr && incoming.description && isCensored(*incoming.description)) {
            product.description = existing->description;
        }

        if (existing != nullptr && existing->hasDiscount()) {
            product.discount = existing->discount;
        }

        product.price           = takeRemote ? incoming.price : existing->price;
        product.regionalPricing = takeRemote ? incoming.regionalPricing
                                             : existing->regionalPricing;
        if (product.regionalPricing == false) {
            product.regionalPricing.reset();
        }

        if (existing != nullptr) {
            const std::string key = match->first;
            items[key] = std::move(product);
            if (stats) ++stats->matched;
        } else {
            const std::string key = newKey(items, product.name, *incoming.id);
            items[key] = std::move(product);
            if (stats) ++stats->added;
        }
    }

    return merged;
}

// ---------------------------------------------------------------------------
// Downloader
// ---------------------------------------------------------------------------

Downloader::Downloader(ProductApi& api, const CatalogStore& store, bool verbose)
    : mApi(api)
    , mStore(store)
    , mVerbose(verbose) {}

void Downloader::download(bool overwrite) {
    std::cerr << "[Download] Loading local products from " << mStore.path() << "\n";
    Catalog local = mStore.load();

    std::cerr << "[Download] Fetching remote products for universe "
              << local.metadata.universeId << "\n";
    const auto remote = mApi.fetchAllProducts(local.metadata.universeId);

    mStats.localProducts  = static_cast<int>(local.size());
    mStats.remoteProducts = static_cast<int>(remote.size());

    std::cerr << "[Download] Merging " << remote.size() << " remote into "
              << local.size() << " local products (overwrite: "
              << (overwrite ? "yes" : "no") << ")\n";

    MergeStats merge;
    Catalog merged = mergeRemoteProducts(local, remote, overwrite, &merge);
    mStats.matched = merge.matched;
    mStats.added   = merge.added;

    if (mVerbose) {
        std::cerr << "[Download] " << merge.matched << " matched, "
                  << merge.added << " new\n";
    }

    mStore.save(merged);
    mStore.exportLuau(merged);
    std::cerr << "[Download] Saved " << mStore.path() << "\n";
}

} // namespace product_sync
