/// @file test_diff.cpp
/// Unit tests for models.hpp effective values and diff.hpp field comparison.

#include "diff.hpp"
#include "models.hpp"

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

using namespace product_sync;

namespace {

Product makeProduct(uint64_t id, const std::string& name, int64_t price,
                    bool active = true) {
    Product p;
    p.id     = id;
    p.name   = name;
    p.price  = price;
    p.active = active;
    return p;
}

const FieldChange& changeFor(const ProductDiff& diff, DiffField field) {
    for (const auto& c : diff.changes) {
        if (c.field == field) return c;
    }
    throw std::runtime_error("field not present");
}

} // namespace

// ============================================================================
// Product effective values
// ============================================================================

TEST(EffectivePrice, NoDiscountIsBasePrice) {
    EXPECT_EQ(makeProduct(1, "A", 499).effectivePrice(), 499u);
}

TEST(EffectivePrice, DiscountFloorsResult) {
    Product p = makeProduct(1, "A", 999);
    p.discount = 15;
    // 999 * 0.85 = 849.15
    EXPECT_EQ(p.effectivePrice(), 849u);

    p.price    = 1000;
    p.discount = 20;
    EXPECT_EQ(p.effectivePrice(), 800u);
}

TEST(EffectivePrice, ZeroAndFullDiscount) {
    Product p = makeProduct(1, "A", 250);
    p.discount = 0;
    EXPECT_FALSE(p.hasDiscount());
    EXPECT_EQ(p.effectivePrice(), 250u);

    p.discount = 100;
    EXPECT_EQ(p.effectivePrice(), 0u);
}

TEST(EffectiveTitle, PrefixIsJoinedWithSpace) {
    Product p = makeProduct(1, "Coins", 10);
    EXPECT_EQ(p.effectiveTitle(), "Coins");

    p.prefix = "[2x]";
    EXPECT_EQ(p.effectiveTitle(), "[2x] Coins");
}

TEST(EffectiveTitle, DiscountSuppressesPrefix) {
    Product p = makeProduct(1, "Coins", 10);
    p.prefix   = "[2x]";
    p.discount = 10;
    EXPECT_EQ(p.effectiveTitle(), "Coins");
}

// ============================================================================
// diffProduct
// ============================================================================

TEST(DiffProduct, IdenticalProductsHaveNoDiff) {
    Product local  = makeProduct(7, "VIP", 100);
    Product remote = makeProduct(7, "VIP", 100);
    EXPECT_FALSE(diffProduct(local, remote).has_value());
}

TEST(DiffProduct, SinglePriceChange) {
    Product local  = makeProduct(7, "VIP", 150);
    Product remote = makeProduct(7, "VIP", 100);

    auto diff = diffProduct(local, remote);
    ASSERT_TRUE(diff.has_value());
    EXPECT_EQ(diff->id, 7u);
    EXPECT_EQ(diff->name, "VIP");
    ASSERT_EQ(diff->changes.size(), 5u);

    int changed = 0;
    for (const auto& c : diff->changes) {
        if (c.change == ChangeKind::Changed) ++changed;
    }
    EXPECT_EQ(changed, 1);

    const auto& price = changeFor(*diff, DiffField::Price);
    EXPECT_EQ(price.change, ChangeKind::Changed);
    const auto& values = std::get<ValuePair<uint64_t>>(price.values);
    EXPECT_EQ(values.before, 100u);
    EXPECT_EQ(values.after, 150u);
}

TEST(DiffProduct, FieldOrderIsFixed) {
    Product local  = makeProduct(7, "VIP", 150);
    Product remote = makeProduct(7, "VIP", 100);
    auto diff = diffProduct(local, remote);
    ASSERT_TRUE(diff.has_value());

    const std::vector<DiffField> expected = {
        DiffField::Title, DiffField::Description, DiffField::Price,
        DiffField::RegionalPricing, DiffField::Active,
    };
    ASSERT_EQ(diff->changes.size(), expected.size());
    for (std::size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(diff->changes[i].field, expected[i]);
    }
}

TEST(DiffProduct, DiscountComparesEffectivePrice) {
    Product local = makeProduct(7, "VIP", 1000);
    local.discount = 20;
    Product remote = makeProduct(7, "VIP", 800);

    EXPECT_FALSE(diffProduct(local, remote).has_value());
}

TEST(DiffProduct, PrefixComparesEffectiveTitle) {
    Product local = makeProduct(7, "Coins", 10);
    local.prefix = "[2x]";
    Product remote = makeProduct(7, "[2x] Coins", 10);

    EXPECT_FALSE(diffProduct(local, remote).has_value());
}

TEST(DiffProduct, MissingRegionalPricingDefaultsToFalse) {
    Product local  = makeProduct(7, "VIP", 10);
    Product remote = makeProduct(7, "VIP", 10);
    remote.regionalPricing = false;
    EXPECT_FALSE(diffProduct(local, remote).has_value());

    local.regionalPricing = true;
    auto diff = diffProduct(local, remote);
    ASSERT_TRUE(diff.has_value());
    EXPECT_EQ(changeFor(*diff, DiffField::RegionalPricing).change, ChangeKind::Changed);
}

TEST(DiffProduct, MissingRemoteDescriptionComparesAsEmpty) {
    Product local  = makeProduct(7, "VIP", 10);
    Product remote = makeProduct(7, "VIP", 10);
    local.description = "";
    EXPECT_FALSE(diffProduct(local, remote).has_value());

    local.description = "Now with hats";
    auto diff = diffProduct(local, remote);
    ASSERT_TRUE(diff.has_value());
    const auto& values =
        std::get<ValuePair<std::string>>(changeFor(*diff, DiffField::Description).values);
    EXPECT_EQ(values.before, "");
    EXPECT_EQ(values.after, "Now with hats");
}

TEST(DiffProduct, ActiveFlagChange) {
    Product local  = makeProduct(7, "VIP", 10, /*active=*/false);
    Product remote = makeProduct(7, "VIP", 10, /*active=*/true);

    auto diff = diffProduct(local, remote);
    ASSERT_TRUE(diff.has_value());
    EXPECT_EQ(changeFor(*diff, DiffField::Active).change, ChangeKind::Changed);
    EXPECT_EQ(changeFor(*diff, DiffField::Title).change, ChangeKind::Unchanged);
}

// ============================================================================
// diffCatalog
// ============================================================================

TEST(DiffCatalog, OrdersDevProductsFirstThenById) {
    Catalog catalog;
    catalog.gamepasses["b"] = makeProduct(5, "B", 20);
    catalog.gamepasses["a"] = makeProduct(3, "A", 20);
    catalog.products["z"]   = makeProduct(9, "Z", 20);
    catalog.products["y"]   = makeProduct(8, "Y", 20);

    std::vector<RemoteProduct> remote = {
        {ProductKind::GamePass,   makeProduct(5, "B", 10)},
        {ProductKind::GamePass,   makeProduct(3, "A", 10)},
        {ProductKind::DevProduct, makeProduct(9, "Z", 10)},
        {ProductKind::DevProduct, makeProduct(8, "Y", 10)},
    };

    auto diffs = diffCatalog(catalog, remote);
    ASSERT_EQ(diffs.size(), 4u);
    EXPECT_EQ(diffs[0].kind, ProductKind::DevProduct);
    EXPECT_EQ(diffs[0].diff.id, 8u);
    EXPECT_EQ(diffs[1].kind, ProductKind::DevProduct);
    EXPECT_EQ(diffs[1].diff.id, 9u);
    EXPECT_EQ(diffs[2].kind, ProductKind::GamePass);
    EXPECT_EQ(diffs[2].diff.id, 3u);
    EXPECT_EQ(diffs[3].kind, ProductKind::GamePass);
    EXPECT_EQ(diffs[3].diff.id, 5u);
}

TEST(DiffCatalog, SkipsUncreatedAndUnmatchedProducts) {
    Catalog catalog;
    Product pending;
    pending.name = "Pending";
    catalog.gamepasses["pending"] = pending;
    catalog.gamepasses["stale"]   = makeProduct(404, "Stale", 5);

    EXPECT_TRUE(diffCatalog(catalog, {}).empty());
}

TEST(DiffCatalog, MatchesWithinSameKindOnly) {
    Catalog catalog;
    catalog.gamepasses["vip"] = makeProduct(11, "VIP", 50);

    // Same id, different kind: not a counterpart.
    std::vector<RemoteProduct> remote = {
        {ProductKind::DevProduct, makeProduct(11, "Other", 1)},
    };
    EXPECT_TRUE(diffCatalog(catalog, remote).empty());
}

// ============================================================================
// formatDiffValue
// ============================================================================

TEST(FormatDiffValue, RendersEachValueType) {
    EXPECT_EQ(formatDiffValue(ValuePair<std::string>{"old", "new"}, false), "old");
    EXPECT_EQ(formatDiffValue(ValuePair<std::string>{"old", "new"}, true), "new");
    EXPECT_EQ(formatDiffValue(ValuePair<uint64_t>{10, 20}, true), "20");
    EXPECT_EQ(formatDiffValue(ValuePair<bool>{true, false}, false), "true");
    EXPECT_EQ(formatDiffValue(ValuePair<bool>{true, false}, true), "false");
}
