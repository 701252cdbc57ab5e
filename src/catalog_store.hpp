#pragma once

#include "models.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace product_sync {

/// Reads and writes the catalog document and its generated Luau module.
///
/// The document is JSON:
///   { "metadata":   { "universe-id", "discount-prefix"?, "luau-file"?, "name-filters" },
///     "gamepasses": { slug: product },
///     "products":   { slug: product } }
/// Comments are allowed.  Saving edits the existing text in place: only the
/// values the catalog owns that actually changed are rewritten, so comments,
/// formatting, unknown keys and key order already in the file are kept.
class CatalogStore {
public:
    explicit CatalogStore(std::string path);

    const std::string& path() const { return mPath; }
    bool exists() const;

    /// @throws std::runtime_error when the file is unreadable or malformed.
    Catalog load() const;

    /// Merge @p catalog into the existing document (if any) and write it.
    void save(const Catalog& catalog) const;

    /// Write the Luau module named by metadata.luauFile, resolved against the
    /// catalog file's directory.  No-op when no luau file is configured.
    void exportLuau(const Catalog& catalog) const;

    /// Write a fresh catalog with default metadata.  Refuses to overwrite.
    void init(uint64_t universeId) const;

    static Catalog fromJson(const nlohmann::ordered_json& doc);
    static void    mergeInto(nlohmann::ordered_json& doc, const Catalog& catalog);
    static std::string renderLuau(const Catalog& catalog);

private:
    std::string mPath;

    std::string            readText() const;
    nlohmann::ordered_json parseDocument(const std::string& text) const;
};

} // namespace product_sync
