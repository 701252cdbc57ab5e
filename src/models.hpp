#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace product_sync {

/// The two monetization record kinds served by the platform.
enum class ProductKind {
    GamePass,
    DevProduct,
};

const char* kindName(ProductKind kind);

/// One locally versioned product or pass.
struct Product {
    std::optional<uint64_t>    id;           // absent until created remotely
    std::string                name;
    std::optional<std::string> prefix;
    std::optional<std::string> description;
    bool                       active = false;
    std::optional<int>         discount;     // percent, 0..100
    int64_t                    price  = 0;   // Robux
    std::optional<bool>        regionalPricing;

    bool hasDiscount() const { return discount.has_value() && *discount > 0; }

    /// floor(price * (1 - discount/100)) when a discount is active.
    uint64_t effectivePrice() const;

    /// Name as it is displayed: the raw name while discounted, otherwise
    /// "<prefix> <name>" when a prefix is set.
    std::string effectiveTitle() const;
};

/// A user-supplied name filter, kept as source text for saving.
struct NameFilter {
    std::string pattern;
    std::regex  regex;
};

struct Metadata {
    uint64_t                   universeId = 0;
    std::optional<std::string> luauFile;
    std::optional<std::string> discountPrefix;
    std::vector<NameFilter>    nameFilters;   // empty => built-in defaults
};

/// Full local state: metadata plus both keyed collections.
struct Catalog {
    Metadata                       metadata;
    std::map<std::string, Product> gamepasses;
    std::map<std::string, Product> products;

    std::map<std::string, Product>&       collection(ProductKind kind);
    const std::map<std::string, Product>& collection(ProductKind kind) const;

    std::size_t size() const { return gamepasses.size() + products.size(); }
};

// ---------------------------------------------------------------------------
// Remote records
// ---------------------------------------------------------------------------

struct PriceInformation {
    uint64_t                                defaultPriceInRobux = 0;
    std::optional<std::vector<std::string>> enabledFeatures;
};

struct GamePass {
    uint64_t                        gamePassId = 0;
    std::string                     name;
    std::optional<std::string>      description;
    bool                            isForSale  = false;
    uint64_t                        iconAssetId = 0;
    std::string                     createdTimestamp;
    std::string                     updatedTimestamp;
    std::optional<PriceInformation> priceInformation;
};

struct DevProduct {
    uint64_t                        productId  = 0;
    std::string                     name;
    std::optional<std::string>      description;
    uint64_t                        universeId = 0;
    bool                            isForSale  = false;
    bool                            storePageEnabled = false;
    bool                            isImmutable = false;
    std::string                     createdTimestamp;
    std::string                     updatedTimestamp;
    std::optional<PriceInformation> priceInformation;
};

/// A fetched record already converted to a Product, tagged with its kind.
struct RemoteProduct {
    ProductKind kind;
    Product     product;
};

/// Body of a create/update call.
struct ProductUpdateRequest {
    std::string                name;
    std::optional<std::string> description;
    std::optional<bool>        isForSale;
    std::optional<uint64_t>    price;
    std::optional<bool>        isRegionalPricingEnabled;
};

// ---------------------------------------------------------------------------
// Diffs
// ---------------------------------------------------------------------------

enum class DiffField {
    Title,
    Description,
    Price,
    RegionalPricing,
    Active,
};

enum class ChangeKind {
    Unchanged,
    Changed,
    Created,
};

template <typename T>
struct ValuePair {
    T before;   // remote
    T after;    // local
};

using DiffValues = std::variant<ValuePair<std::string>,
                                ValuePair<uint64_t>,
                                ValuePair<bool>>;

struct FieldChange {
    ChangeKind change;
    DiffField  field;
    DiffValues values;
};

struct ProductDiff {
    std::string              name;
    uint64_t                 id = 0;
    std::vector<FieldChange> changes;   // Title, Description, Price, RegionalPricing, Active

    bool hasChanges() const;
};

struct KindedDiff {
    ProductKind kind;
    ProductDiff diff;
};

/// A (kind, id) pair the operator accepted for upload.
struct ConfirmedChange {
    ProductKind kind;
    uint64_t    id = 0;

    bool operator==(const ConfirmedChange& o) const {
        return kind == o.kind && id == o.id;
    }
};

const char* fieldName(DiffField field);

} // namespace product_sync
