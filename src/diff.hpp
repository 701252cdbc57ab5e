#pragma once

#include "models.hpp"

#include <optional>
#include <string>
#include <vector>

namespace product_sync {

/// Compare a local product against the remote record sharing its id.
///
/// Local values are taken in their effective form (effectiveTitle,
/// effectivePrice, regional pricing defaulted to false); remote values are
/// taken raw.  A missing remote description compares as "".
/// Returns std::nullopt when every field matches.
std::optional<ProductDiff> diffProduct(const Product& local,
                                       const Product& remote);

/// Diff every local product that has a remote id against the remote record
/// of the same kind and id.  Local ids without a remote counterpart are
/// skipped.  Result is ordered DevProduct before GamePass, then by id.
std::vector<KindedDiff> diffCatalog(const Catalog& catalog,
                                    const std::vector<RemoteProduct>& remote,
                                    bool verbose = false);

/// Render a single field value for display ("true", "120", text).
std::string formatDiffValue(const DiffValues& values, bool after);

} // namespace product_sync
