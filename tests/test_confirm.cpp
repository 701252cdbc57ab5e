/// @file test_confirm.cpp
/// Unit tests for confirm.hpp: scripted console answers and diff rendering.

#include "confirm.hpp"
#include "diff.hpp"

#include <gtest/gtest.h>
#include <sstream>

using namespace product_sync;

// ---------------------------------------------------------------------------
// Helper: build a one-field price diff
// ---------------------------------------------------------------------------

static KindedDiff priceDiff(ProductKind kind, uint64_t id, const std::string& name,
                            int64_t remotePrice, int64_t localPrice) {
    Product local;
    local.id    = id;
    local.name  = name;
    local.price = localPrice;
    Product remote = local;
    remote.price = remotePrice;
    return KindedDiff{kind, *diffProduct(local, remote)};
}

static std::vector<KindedDiff> threeDiffs() {
    return {
        priceDiff(ProductKind::DevProduct, 1, "Coins", 10, 20),
        priceDiff(ProductKind::GamePass, 2, "VIP", 100, 150),
        priceDiff(ProductKind::GamePass, 3, "Speed", 5, 6),
    };
}

// ============================================================================
// AutoConfirmer
// ============================================================================

TEST(AutoConfirmer, ApprovesAndSelectsEverything) {
    AutoConfirmer confirmer;
    EXPECT_TRUE(confirmer.approve("anything?"));

    auto selected = confirmer.selectDiffs(threeDiffs());
    ASSERT_EQ(selected.size(), 3u);
    EXPECT_EQ(selected[0], (ConfirmedChange{ProductKind::DevProduct, 1}));
    EXPECT_EQ(selected[2], (ConfirmedChange{ProductKind::GamePass, 3}));
}

// ============================================================================
// ConsoleConfirmer::approve
// ============================================================================

TEST(ConsoleConfirmer, ApproveAcceptsYesVariants) {
    std::istringstream in("y\n Yes \nYES\n");
    std::ostringstream out;
    ConsoleConfirmer confirmer(in, out);

    EXPECT_TRUE(confirmer.approve("Go?"));
    EXPECT_TRUE(confirmer.approve("Go?"));
    EXPECT_TRUE(confirmer.approve("Go?"));
    EXPECT_NE(out.str().find("Go? [y/N] "), std::string::npos);
}

TEST(ConsoleConfirmer, ApproveDefaultsToNo) {
    std::istringstream in("\nn\nmaybe\n");
    std::ostringstream out;
    ConsoleConfirmer confirmer(in, out);

    EXPECT_FALSE(confirmer.approve("Go?"));
    EXPECT_FALSE(confirmer.approve("Go?"));
    EXPECT_FALSE(confirmer.approve("Go?"));
    // End of input.
    EXPECT_FALSE(confirmer.approve("Go?"));
}

// ============================================================================
// ConsoleConfirmer::selectDiffs
// ============================================================================

TEST(ConsoleConfirmer, PerItemAnswers) {
    std::istringstream in("y\nn\ny\n");
    std::ostringstream out;
    ConsoleConfirmer confirmer(in, out);

    auto selected = confirmer.selectDiffs(threeDiffs());
    ASSERT_EQ(selected.size(), 2u);
    EXPECT_EQ(selected[0].id, 1u);
    EXPECT_EQ(selected[1].id, 3u);

    const std::string text = out.str();
    EXPECT_NE(text.find("3 product(s) differ"), std::string::npos);
    EXPECT_NE(text.find("Confirm GamePass 'VIP'? [y/N/a/q]"), std::string::npos);
    EXPECT_NE(text.find("2 of 3 change(s) selected."), std::string::npos);
}

TEST(ConsoleConfirmer, AllAcceptsRemaining) {
    std::istringstream in("n\na\n");
    std::ostringstream out;
    ConsoleConfirmer confirmer(in, out);

    auto selected = confirmer.selectDiffs(threeDiffs());
    ASSERT_EQ(selected.size(), 2u);
    EXPECT_EQ(selected[0].id, 2u);
    EXPECT_EQ(selected[1].id, 3u);
}

TEST(ConsoleConfirmer, QuitStopsSelecting) {
    std::istringstream in("y\nq\ny\n");
    std::ostringstream out;
    ConsoleConfirmer confirmer(in, out);

    auto selected = confirmer.selectDiffs(threeDiffs());
    ASSERT_EQ(selected.size(), 1u);
    EXPECT_EQ(selected[0].id, 1u);
    EXPECT_EQ(out.str().find("Confirm GamePass 'Speed'"), std::string::npos);
}

TEST(ConsoleConfirmer, EndOfInputSelectsNothingFurther) {
    std::istringstream in("");
    std::ostringstream out;
    ConsoleConfirmer confirmer(in, out);

    EXPECT_TRUE(confirmer.selectDiffs(threeDiffs()).empty());
}

// ============================================================================
// ConsoleConfirmer::renderDiff
// ============================================================================

TEST(ConsoleConfirmer, RenderMarksChangedRows) {
    const std::string text =
        ConsoleConfirmer::renderDiff(priceDiff(ProductKind::GamePass, 2, "VIP", 100, 150));

    EXPECT_NE(text.find("GamePass: VIP (ID: 2)"), std::string::npos);
    EXPECT_NE(text.find("- Price: 100"), std::string::npos);
    EXPECT_NE(text.find("+ Price: 150"), std::string::npos);
    EXPECT_NE(text.find("  Title: VIP"), std::string::npos);
    EXPECT_EQ(text.find("- Title"), std::string::npos);
    EXPECT_NE(text.find("Regional Pricing: false"), std::string::npos);
}

TEST(ConsoleConfirmer, RenderClipsLongValues) {
    Product local;
    local.id          = 4;
    local.name        = "Long";
    local.description = std::string(120, 'x');
    Product remote = local;
    remote.description = "short";

    const std::string text =
        ConsoleConfirmer::renderDiff(KindedDiff{ProductKind::DevProduct,
                                                *diffProduct(local, remote)});
    EXPECT_EQ(text.find(std::string(120, 'x')), std::string::npos);
    EXPECT_NE(text.find("..."), std::string::npos);
}
