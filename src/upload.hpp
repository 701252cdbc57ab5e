#pragma once

#include "catalog_store.hpp"
#include "confirm.hpp"
#include "models.hpp"
#include "product_api.hpp"

#include <cstddef>
#include <vector>

namespace product_sync {

/// Pushes local catalog changes to the platform in two phases:
///   1. create every product that has no remote id yet;
///   2. update every product whose effective values differ from remote.
/// The catalog file is saved and re-exported after phase 1 and once more
/// at the end, also when phase 2 fails.
class Uploader {
public:
    struct Stats {
        int localProducts  = 0;
        int remoteProducts = 0;
        int created        = 0;
        int createFailed   = 0;
        int updated        = 0;
    };

    /// Upper bound on createProduct calls in flight during phase 1.
    static constexpr std::size_t kMaxConcurrentCreates = 8;

    Uploader(ProductApi& api, const CatalogStore& store, Confirmer& confirmer,
             bool verbose = false);

    /// Load, fetch, run both phases, persist.  Rethrows a phase-2 failure
    /// after the catalog has been written.
    void upload(bool overwrite);

    /// Phase 1.  Without @p overwrite the batch needs a single approval.
    /// Creations run on at most kMaxConcurrentCreates workers.  Per-item
    /// failures are logged and leave that item without an id.
    void createMissing(Catalog& catalog, bool overwrite);

    /// Phase 2.  Without @p overwrite the operator selects diffs and then
    /// approves the sync.  The first failed update aborts the phase.
    void syncModified(Catalog& catalog, const std::vector<RemoteProduct>& remote,
                      bool overwrite);

    Stats getStats() const { return mStats; }

private:
    ProductApi&         mApi;
    const CatalogStore& mStore;
    Confirmer&          mConfirmer;
    bool                mVerbose;
    Stats               mStats{};

    void persist(const Catalog& catalog);
};

} // namespace product_sync
