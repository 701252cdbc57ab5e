#include "upload.hpp"
#include "diff.hpp"
#include "mapping.hpp"
#include "naming.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <future>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <system_error>

namespace product_sync {

namespace {

struct CreateCandidate {
    ProductKind          kind;
    std::string          key;
    ProductUpdateRequest request;
};

} // namespace

Uploader::Uploader(ProductApi& api, const CatalogStore& store, Confirmer& confirmer,
                   bool verbose)
    : mApi(api)
    , mStore(store)
    , mConfirmer(confirmer)
    , mVerbose(verbose) {}

void Uploader::persist(const Catalog& catalog) {
    mStore.save(catalog);
    mStore.exportLuau(catalog);
}

// ---------------------------------------------------------------------------
// Phase 1: creation
// ---------------------------------------------------------------------------

void Uploader::createMissing(Catalog& catalog, bool overwrite) {
    std::vector<CreateCandidate> candidates;
    for (ProductKind kind : {ProductKind::GamePass, ProductKind::DevProduct}) {
        for (const auto& [key, product] : catalog.collection(kind)) {
            if (product.id) continue;

            Product decorated = product;
            applyDiscountPrefix(decorated, catalog.metadata.discountPrefix);
            candidates.push_back(CreateCandidate{kind, key, toUpdateRequest(decorated)});
        }
    }

    if (candidates.empty()) return;

    if (!overwrite &&
        !mConfirmer.approve("Would you like to upload " + std::to_string(candidates.size()) +
                            " non-existent product(s)?")) {
        std::cerr << "[Upload] Not uploading non-existent products\n";
        return;
    }

    const uint64_t universeId = catalog.metadata.universeId;
    std::cerr << "[Upload] Creating " << candidates.size()
              << " product(s) in universe " << universeId << "\n";

    // A fixed pool of workers drains the candidate list; outcomes land in
    // candidate order so commits stay deterministic.
    struct Outcome {
        std::optional<uint64_t> id;
        std::string             error;
    };
    std::vector<Outcome>     outcomes(candidates.size());
    std::atomic<std::size_t> next{0};

    auto worker = [&]() {
        for (std::size_t i = next++; i < candidates.size(); i = next++) {
            const auto& c = candidates[i];
            try {
                outcomes[i].id = mApi.createProduct(c.kind, universeId, c.request);
            } catch (const std::exception& e) {
                outcomes[i].error = e.what();
            }
        }
    };

    const std::size_t workerCount = std::min(candidates.size(), kMaxConcurrentCreates);
    std::vector<std::future<void>> workers;
    workers.reserve(workerCount);
    for (std::size_t w = 0; w < workerCount; ++w) {
        try {
            workers.push_back(std::async(std::launch::async, worker));
        } catch (const std::system_error& e) {
            // The workers already running pick up the remaining candidates.
            std::cerr << "[Upload] Could not start creation worker " << w << ": "
                      << e.what() << "\n";
            break;
        }
    }
    if (workers.empty()) {
        worker();
    }
    for (auto& w : workers) {
        w.get();
    }

    for (std::size_t i = 0; i < candidates.size(); ++i) {
        const auto& c = candidates[i];
        if (outcomes[i].id) {
            catalog.collection(c.kind)[c.key].id = *outcomes[i].id;
            ++mStats.created;
            std::cerr << "[Upload] Created " << kindName(c.kind) << " '" << c.key
                      << "' with id " << *outcomes[i].id << "\n";
        } else {
            ++mStats.createFailed;
            std::cerr << "[Upload] Failed to create " << kindName(c.kind) << " '"
                      << c.key << "': " << outcomes[i].error << "\n";
        }
    }

    persist(catalog);
}

// ---------------------------------------------------------------------------
// Phase 2: modification
// ---------------------------------------------------------------------------

void Uploader::syncModified(Catalog& catalog, const std::vector<RemoteProduct>& remote,
                            bool overwrite) {
    const auto diffs = diffCatalog(catalog, remote, mVerbose);

    if (diffs.empty()) {
        std::cerr << "[Upload] No differences found between local and universe products.\n";
        return;
    }

    std::vector<ConfirmedChange> selected;
    if (!overwrite) {
        selected = mConfirmer.selectDiffs(diffs);

        if (!mConfirmer.approve("Would you like to sync products?")) {
            std::cerr << "[Upload] User aborted sync.\n";
            return;
        }
    } else {
        for (const auto& d : diffs) {
            selected.push_back(ConfirmedChange{d.kind, d.diff.id});
        }
    }

    if (selected.empty()) {
        std::cerr << "[Upload] No changes to apply.\n";
        return;
    }

    std::cerr << "[Upload] Syncing " << selected.size() << " product(s)\n";

    const uint64_t universeId = catalog.metadata.universeId;
    for (const auto& change : selected) {
        const Product* local = nullptr;
        for (const auto& [key, product] : catalog.collection(change.kind)) {
            if (product.id == change.id) {
                local = &product;
                break;
            }
        }
        if (local == nullptr) {
            throw std::runtime_error(std::string("No local ") + kindName(change.kind) +
                                     " with id " + std::to_string(change.id));
        }

        Product decorated = *local;
        applyDiscountPrefix(decorated, catalog.metadata.discountPrefix);

        try {
            mApi.updateProduct(change.kind, universeId, change.id,
                               toUpdateRequest(decorated));
        } catch (const std::exception& e) {
            throw std::runtime_error(std::string("Failed to update ") +
                                     kindName(change.kind) + " '" + local->name +
                                     "' (id " + std::to_string(change.id) + "): " +
                                     e.what());
        }

        ++mStats.updated;
        std::cerr << "[Upload] Synced " << kindName(change.kind) << " '" << local->name
                  << "' (id: " << change.id << ")\n";
    }

    std::cerr << "[Upload] Finished syncing all gamepasses/products\n";
}

// ---------------------------------------------------------------------------
// Entry point
// ---------------------------------------------------------------------------

void Uploader::upload(bool overwrite) {
    std::cerr << "[Upload] Loading local products from " << mStore.path() << "\n";
    Catalog catalog = mStore.load();

    std::cerr << "[Upload] Fetching remote products for universe "
              << catalog.metadata.universeId << "\n";
    const auto remote = mApi.fetchAllProducts(catalog.metadata.universeId);

    mStats.localProducts  = static_cast<int>(catalog.size());
    mStats.remoteProducts = static_cast<int>(remote.size());

    std::exception_ptr failure;
    try {
        createMissing(catalog, overwrite);
        syncModified(catalog, remote, overwrite);
    } catch (const std::exception& e) {
        std::cerr << "[Upload] Upload failed: " << e.what() << "; saving catalog\n";
        failure = std::current_exception();
    }

    persist(catalog);

    if (failure) {
        std::rethrow_exception(failure);
    }
}

} // namespace product_sync
