#include "diff.hpp"

#include <algorithm>
#include <iostream>
#include <type_traits>

namespace product_sync {

namespace {

template <typename T>
void compareField(std::vector<FieldChange>& out, DiffField field,
                  const T& remoteValue, const T& localValue) {
    const ChangeKind change =
        (remoteValue == localValue) ? ChangeKind::Unchanged : ChangeKind::Changed;
    out.push_back(FieldChange{change, field, ValuePair<T>{remoteValue, localValue}});
}

const Product* findRemote(const std::vector<RemoteProduct>& remote,
                          ProductKind kind, uint64_t id) {
    for (const auto& r : remote) {
        if (r.kind == kind && r.product.id == id) {
            return &r.product;
        }
    }
    return nullptr;
}

} // namespace

std::optional<ProductDiff> diffProduct(const Product& local,
                                       const Product& remote) {
    std::vector<FieldChange> changes;
    changes.reserve(5);

    compareField<std::string>(changes, DiffField::Title,
                              remote.name, local.effectiveTitle());
    compareField<std::string>(changes, DiffField::Description,
                              remote.description.value_or(""),
                              local.description.value_or(""));
    compareField<uint64_t>(changes, DiffField::Price,
                           static_cast<uint64_t>(std::max<int64_t>(remote.price, 0)),
                           local.effectivePrice());
    compareField<bool>(changes, DiffField::RegionalPricing,
                       remote.regionalPricing.value_or(false),
                       local.regionalPricing.value_or(false));
    compareField<bool>(changes, DiffField::Active, remote.active, local.active);

    ProductDiff diff;
    diff.name    = local.name;
    diff.id      = local.id.value_or(0);
    diff.changes = std::move(changes);

    if (!diff.hasChanges()) {
        return std::nullopt;
    }
    return diff;
}

std::vector<KindedDiff> diffCatalog(const Catalog& catalog,
                                    const std::vector<RemoteProduct>& remote,
                                    bool verbose) {
    std::vector<KindedDiff> diffs;

    for (ProductKind kind : {ProductKind::GamePass, ProductKind::DevProduct}) {
        for (const auto& [key, local] : catalog.collection(kind)) {
            if (!local.id) continue;

            const Product* match = findRemote(remote, kind, *local.id);
            if (match == nullptr) {
                if (verbose) {
                    std::cerr << "[Diff] " << kindName(kind) << " '" << key
                              << "' (id " << *local.id
                              << ") not found remotely; skipping\n";
                }
                continue;
            }

            if (auto diff = diffProduct(local, *match)) {
                diffs.push_back(KindedDiff{kind, std::move(*diff)});
            }
        }
    }

    // One-time products first, then passes; ascending id within a kind.
    std::sort(diffs.begin(), diffs.end(), [](const KindedDiff& a, const KindedDiff& b) {
        if (a.kind != b.kind) {
            return a.kind == ProductKind::DevProduct;
        }
        return a.diff.id < b.diff.id;
    });

    return diffs;
}

std::string formatDiffValue(const DiffValues& values, bool after) {
    return std::visit([after](const auto& pair) -> std::string {
        using T = std::decay_t<decltype(pair.before)>;
        const T& v = after ? pair.after : pair.before;
        if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else {
            return std::to_string(v);
        }
    }, values);
}

} // namespace product_sync
