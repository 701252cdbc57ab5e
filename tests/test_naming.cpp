/// @file test_naming.cpp
/// Unit tests for naming.hpp: name canonicalization, slugs, censor detection
/// and discount prefixes.

#include "naming.hpp"

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

using namespace product_sync;

// ============================================================================
// canonicalName
// ============================================================================

TEST(CanonicalName, DefaultFiltersStripDiscountPrefixAndBrackets) {
    EXPECT_EQ(canonicalName("💲20% OFF💲 VIP Pass [LIMITED]", {}), "VIP Pass");
}

TEST(CanonicalName, DefaultFiltersDropSymbols) {
    EXPECT_EQ(canonicalName("Super Sword™ x2!", {}), "Super Sword x2!");
}

TEST(CanonicalName, WhitespaceRunsCollapse) {
    EXPECT_EQ(canonicalName("  Double \t  Coins  ", {}), "Double Coins");
}

TEST(CanonicalName, KeepsAllowedPunctuation) {
    EXPECT_EQ(canonicalName("Ready? Set, Go - now.", {}), "Ready? Set, Go - now.");
}

TEST(CanonicalName, IsIdempotent) {
    const std::vector<std::string> inputs = {
        "💲50% OFF💲 Mega [NEW] Pack ★★★",
        "  spaced    out  ",
        "[only brackets]",
        "plain",
    };
    for (const auto& in : inputs) {
        const std::string once = canonicalName(in, {});
        EXPECT_EQ(canonicalName(once, {}), once) << "input: " << in;
    }
}

TEST(CanonicalName, CustomFiltersReplaceDefaults) {
    std::vector<NameFilter> filters = {makeNameFilter("Pass")};
    // Brackets survive because the defaults are not applied.
    EXPECT_EQ(canonicalName("VIP Pass [x]", filters), "VIP [x]");
}

TEST(MakeNameFilter, InvalidPatternThrows) {
    EXPECT_THROW(makeNameFilter("(unclosed"), std::runtime_error);
}

TEST(MakeNameFilter, KeepsSourcePattern) {
    auto f = makeNameFilter(R"(\d+x)");
    EXPECT_EQ(f.pattern, R"(\d+x)");
}

// ============================================================================
// slugify
// ============================================================================

TEST(Slugify, LowercasesAndJoinsWithDash) {
    EXPECT_EQ(slugify("VIP Pass"), "vip-pass");
}

TEST(Slugify, DropsPunctuationAndTrims) {
    EXPECT_EQ(slugify("  Double  Coins! "), "double-coins");
}

TEST(Slugify, NonAsciiOnlyBecomesEmpty) {
    EXPECT_EQ(slugify("💲★"), "");
}

TEST(Slugify, OutputUsesOnlySlugCharacters) {
    const std::vector<std::string> inputs = {
        "Hello,   World", "  -- weird -- ", "Tab\tSeparated\nLines", "a1 B2 c3",
    };
    for (const auto& in : inputs) {
        const std::string slug = slugify(in);
        for (char c : slug) {
            EXPECT_TRUE((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-')
                << "input: " << in << " slug: " << slug;
        }
        EXPECT_EQ(slug.find("--"), std::string::npos) << slug;
        if (!slug.empty()) {
            EXPECT_NE(slug.front(), '-');
            EXPECT_NE(slug.back(), '-');
        }
    }
}

// ============================================================================
// isCensored
// ============================================================================

TEST(IsCensored, HashesAndSpacesAreCensored) {
    EXPECT_TRUE(isCensored("####"));
    EXPECT_TRUE(isCensored("## ### #"));
}

TEST(IsCensored, EmptyTextCountsAsCensored) {
    EXPECT_TRUE(isCensored(""));
}

TEST(IsCensored, AnyOtherCharacterIsNotCensored) {
    EXPECT_FALSE(isCensored("## a ##"));
    EXPECT_FALSE(isCensored("Gives 2x coins"));
}

// ============================================================================
// Discount prefix
// ============================================================================

TEST(FormatDiscountPrefix, SubstitutesEverySlot) {
    EXPECT_EQ(formatDiscountPrefix(kDefaultDiscountPrefix, 20), "💲20% OFF💲");
    EXPECT_EQ(formatDiscountPrefix("{} / {}", 5), "5 / 5");
    EXPECT_EQ(formatDiscountPrefix("SALE", 5), "SALE");
}

TEST(ApplyDiscountPrefix, DiscountedProductUsesDefaultTemplate) {
    Product p;
    p.name     = "VIP";
    p.discount = 20;
    p.price    = 1000;

    applyDiscountPrefix(p, std::nullopt);

    EXPECT_EQ(p.name, "💲20% OFF💲 VIP");
    EXPECT_EQ(p.effectivePrice(), 800u);
}

TEST(ApplyDiscountPrefix, CustomTemplate) {
    Product p;
    p.name     = "VIP";
    p.discount = 15;

    applyDiscountPrefix(p, std::string("[-{}%]"));
    EXPECT_EQ(p.name, "[-15%] VIP");
}

TEST(ApplyDiscountPrefix, NoActiveDiscountLeavesNameAlone) {
    Product none;
    none.name = "VIP";
    applyDiscountPrefix(none, std::nullopt);
    EXPECT_EQ(none.name, "VIP");

    Product zero;
    zero.name     = "VIP";
    zero.discount = 0;
    applyDiscountPrefix(zero, std::nullopt);
    EXPECT_EQ(zero.name, "VIP");
}

TEST(ApplyDiscountPrefix, PrefixedNameIsCanonicalizedBack) {
    Product p;
    p.name     = "Mega Pack";
    p.discount = 40;
    applyDiscountPrefix(p, std::nullopt);

    EXPECT_EQ(canonicalName(p.name, {}), "Mega Pack");
}
