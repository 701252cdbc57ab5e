#pragma once

#include "catalog_store.hpp"
#include "models.hpp"
#include "product_api.hpp"

#include <vector>

namespace product_sync {

struct MergeStats {
    int matched = 0;
    int added   = 0;
};

/// Fold fetched remote records into @p local.
///
/// Records are matched by kind and id.  A matched record keeps its key,
/// prefix, description, price and regional pricing unless @p overwrite is
/// set; a censored remote description never replaces an existing one.
/// Discounts survive only when the local record has an active one.
/// Unmatched records are added under a slug derived from their name.
Catalog mergeRemoteProducts(const Catalog& local,
                            const std::vector<RemoteProduct>& remote,
                            bool overwrite,
                            MergeStats* stats = nullptr);

/// Pulls the remote state into the catalog file and re-exports it.
class Downloader {
public:
    struct Stats {
        int localProducts  = 0;
        int remoteProducts = 0;
        int matched        = 0;
        int added          = 0;
    };

    Downloader(ProductApi& api, const CatalogStore& store, bool verbose = false);

    void download(bool overwrite);

    Stats getStats() const { return mStats; }

private:
    ProductApi&         mApi;
    const CatalogStore& mStore;
    bool                mVerbose;
    Stats               mStats{};
};

} // namespace product_sync
