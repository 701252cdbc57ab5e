#include "models.hpp"

#include <algorithm>

namespace product_sync {

const char* kindName(ProductKind kind) {
    switch (kind) {
        case ProductKind::GamePass:   return "GamePass";
        case ProductKind::DevProduct: return "DevProduct";
    }
    return "Unknown";
}

const char* fieldName(DiffField field) {
    switch (field) {
        case DiffField::Title:           return "Title";
        case DiffField::Description:     return "Description";
        case DiffField::Price:           return "Price";
        case DiffField::RegionalPricing: return "Regional Pricing";
        case DiffField::Active:          return "Active";
    }
    return "Unknown";
}

uint64_t Product::effectivePrice() const {
    const int64_t base = std::max<int64_t>(price, 0);
    if (!hasDiscount()) {
        return static_cast<uint64_t>(base);
    }
    // Integer form of floor(price * (1 - discount / 100)), exact for all inputs.
    const int64_t pct = std::min(*discount, 100);
    return static_cast<uint64_t>((base * (100 - pct)) / 100);
}

std::string Product::effectiveTitle() const {
    if (hasDiscount()) {
        return name;
    }
    if (prefix) {
        return *prefix + " " + name;
    }
    return name;
}

std::map<std::string, Product>& Catalog::collection(ProductKind kind) {
    return kind == ProductKind::GamePass ? gamepasses : products;
}

const std::map<std::string, Product>& Catalog::collection(ProductKind kind) const {
    return kind == ProductKind::GamePass ? gamepasses : products;
}

bool ProductDiff::hasChanges() const {
    return std::any_of(changes.begin(), changes.end(), [](const FieldChange& c) {
        return c.change == ChangeKind::Changed;
    });
}

} // namespace product_sync
