#include <gtest/gtest.h>
#include "bubblefit/layout/placement.h"
#include "bubblefit/text/fixed_advance_metrics.h"

using namespace bubblefit;
using namespace bubblefit::layout;

class PlacementTest : public ::testing::Test {
protected:
    text::FixedAdvanceMetrics metrics;
    FitConfig config{8, 40, 4};
    const Rect editBox{0, 0, 200, 80};

    RenderPlan place(TextAlign align) {
        FitSolver solver(metrics, config);
        FitRequest request;
        request.text = "HELLO THERE WORLD";
        request.family = "Test";
        request.editBox = editBox;
        const FitResult fit = solver.solve(request);

        RenderPlan plan;
        placeLines(fit, editBox, config.innerPaddingPx, align, Orientation::Horizontal, plan);
        return plan;
    }

    // Two 10px-wide columns with a 2px gap.
    static FitResult twoColumns(float columnLength) {
        FitResult fit;
        fit.fontSizePx = 10;
        fit.layout.lineGap = 2.0f;
        fit.layout.lines.push_back(text::BrokenLine{"first", 10.0f, columnLength, false});
        fit.layout.lines.push_back(text::BrokenLine{"second", 10.0f, columnLength, false});
        fit.blockWidth = 22.0f;
        fit.blockHeight = columnLength;
        return fit;
    }
};

// =============================================================================
// Horizontal
// =============================================================================

TEST_F(PlacementTest, LeftAlignAnchorsToInteriorEdge) {
    RenderPlan plan = place(TextAlign::Left);
    ASSERT_EQ(plan.lines.size(), 2u);
    EXPECT_EQ(plan.fontSizePx, 29);
    EXPECT_FLOAT_EQ(plan.lines[0].x, 4.0f);
    EXPECT_FLOAT_EQ(plan.lines[1].x, 4.0f);
}

TEST_F(PlacementTest, BlockIsCenteredVertically) {
    RenderPlan plan = place(TextAlign::Left);
    ASSERT_EQ(plan.lines.size(), 2u);
    // (72 - 63.8) / 2 = 4.1 below the interior top
    EXPECT_NEAR(plan.lines[0].y, 8.1f, 1e-3f);
    EXPECT_NEAR(plan.lines[1].y, 8.1f + 29.0f + 5.8f, 1e-3f);
    EXPECT_NEAR(plan.blockHeight, 63.8f, 1e-3f);
}

TEST_F(PlacementTest, CenterAlign) {
    RenderPlan plan = place(TextAlign::Center);
    ASSERT_EQ(plan.lines.size(), 2u);
    // WORLD: 5 * 0.6 * 29 = 87px
    EXPECT_NEAR(plan.lines[1].width, 87.0f, 1e-3f);
    EXPECT_NEAR(plan.lines[1].x, 4.0f + (192.0f - 87.0f) * 0.5f, 1e-3f);
    EXPECT_NEAR(plan.lines[0].x, 4.0f + (192.0f - plan.lines[0].width) * 0.5f, 1e-3f);
}

TEST_F(PlacementTest, RightAlign) {
    RenderPlan plan = place(TextAlign::Right);
    ASSERT_EQ(plan.lines.size(), 2u);
    EXPECT_NEAR(plan.lines[1].x + plan.lines[1].width, 196.0f, 1e-3f);
    EXPECT_NEAR(plan.lines[0].x + plan.lines[0].width, 196.0f, 1e-3f);
}

TEST_F(PlacementTest, PlanCarriesFitFields) {
    RenderPlan plan = place(TextAlign::Left);
    EXPECT_EQ(plan.interior, (Rect{4, 4, 192, 72}));
    EXPECT_EQ(plan.align, TextAlign::Left);
    EXPECT_EQ(plan.orientation, Orientation::Horizontal);
    EXPECT_FALSE(plan.overflow);
    EXPECT_TRUE(plan.renderable());
}

TEST_F(PlacementTest, OversizedBlockStartsAtInteriorTop) {
    FitResult fit;
    fit.fontSizePx = 8;
    fit.overflow = true;
    fit.layout.lineGap = 1.0f;
    for (int i = 0; i < 6; ++i) {
        fit.layout.lines.push_back(text::BrokenLine{"line", 20.0f, 8.0f, false});
    }
    fit.blockWidth = 20.0f;
    fit.blockHeight = 6 * 8.0f + 5 * 1.0f;

    RenderPlan plan;
    placeLines(fit, Rect{0, 0, 40, 30}, 2, TextAlign::Left, Orientation::Horizontal, plan);
    ASSERT_EQ(plan.lines.size(), 6u);
    EXPECT_FLOAT_EQ(plan.lines[0].y, 2.0f);
    EXPECT_FLOAT_EQ(plan.lines[1].y, 11.0f);
    EXPECT_TRUE(plan.overflow);
}

TEST_F(PlacementTest, DegenerateFitPlacesNothing) {
    FitResult fit;
    fit.degenerate = true;
    fit.issue = RegionIssue::DegenerateBox;

    RenderPlan plan;
    placeLines(fit, Rect{0, 0, 10, 10}, 20, TextAlign::Center, Orientation::Horizontal, plan);
    EXPECT_TRUE(plan.lines.empty());
    EXPECT_EQ(plan.issue, RegionIssue::DegenerateBox);
    EXPECT_FALSE(plan.renderable());
}

// =============================================================================
// Vertical
// =============================================================================

TEST_F(PlacementTest, VerticalColumnsRunRightToLeft) {
    RenderPlan plan;
    placeLines(twoColumns(50.0f), Rect{0, 0, 100, 100}, 0, TextAlign::Center, Orientation::Vertical, plan);
    ASSERT_EQ(plan.lines.size(), 2u);
    // Block of 22px centered in 100px starts at 39
    EXPECT_FLOAT_EQ(plan.lines[0].x, 51.0f);
    EXPECT_FLOAT_EQ(plan.lines[1].x, 39.0f);
    EXPECT_GT(plan.lines[0].x, plan.lines[1].x);
    EXPECT_FLOAT_EQ(plan.lines[0].y, 25.0f);
}

TEST_F(PlacementTest, VerticalAlignmentPicksColumnStart) {
    RenderPlan top;
    placeLines(twoColumns(50.0f), Rect{0, 0, 100, 100}, 0, TextAlign::Left, Orientation::Vertical, top);
    ASSERT_EQ(top.lines.size(), 2u);
    EXPECT_FLOAT_EQ(top.lines[0].y, 0.0f);

    RenderPlan bottom;
    placeLines(twoColumns(50.0f), Rect{0, 0, 100, 100}, 0, TextAlign::Right, Orientation::Vertical, bottom);
    ASSERT_EQ(bottom.lines.size(), 2u);
    EXPECT_FLOAT_EQ(bottom.lines[0].y, 50.0f);
}
