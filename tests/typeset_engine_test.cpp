#include <gtest/gtest.h>
#include "bubblefit/layout/typeset_engine.h"
#include "bubblefit/text/fixed_advance_metrics.h"

using namespace bubblefit;
using namespace bubblefit::layout;

class TypesetEngineTest : public ::testing::Test {
protected:
    EngineConfig config;

    void SetUp() override {
        config.fit = FitConfig{8, 40, 4};
        config.font.defaultFamily = "Default Sans";
    }

    TypesetInput input(const std::string& content) {
        TypesetInput in;
        in.regionId = 7;
        in.version = 3;
        in.editBox = Rect{0, 0, 200, 80};
        in.text = content;
        in.style.align = TextAlign::Left;
        in.style.colorRGBA = 0x112233FF;
        return in;
    }
};

TEST_F(TypesetEngineTest, ProducesPlacedPlan) {
    TypesetEngine engine(text::FixedAdvanceMetrics{}, config);
    RenderPlan plan = engine.layout(input("HELLO THERE WORLD"));

    EXPECT_EQ(plan.regionId, 7u);
    EXPECT_EQ(plan.version, 3u);
    EXPECT_EQ(plan.colorRGBA, 0x112233FFu);
    EXPECT_EQ(plan.fontSizePx, 29);
    ASSERT_EQ(plan.lines.size(), 2u);
    EXPECT_FLOAT_EQ(plan.lines[0].x, 4.0f);
    EXPECT_TRUE(plan.renderable());
}

TEST_F(TypesetEngineTest, EmptyFamilyResolvesToDefault) {
    TypesetEngine engine(text::FixedAdvanceMetrics{}, config);
    EXPECT_EQ(engine.layout(input("Hi")).fontFamily, "Default Sans");

    TypesetInput styled = input("Hi");
    styled.style.fontFamily = "Comic";
    EXPECT_EQ(engine.layout(styled).fontFamily, "Comic");
}

TEST_F(TypesetEngineTest, TranslatedTextIsNormalized) {
    TypesetEngine engine(text::FixedAdvanceMetrics{}, config);
    RenderPlan plan = engine.layout(input("Wait\xE2\x80\xA6 what. . ."));
    ASSERT_EQ(plan.lines.size(), 2u);
    EXPECT_EQ(plan.lines[0].text, "Wait.");
    EXPECT_EQ(plan.lines[1].text, "what...");
}

TEST_F(TypesetEngineTest, UnknownFamilyReported) {
    text::FixedAdvanceMetrics metrics;
    metrics.knownFamilies = {"Default Sans"};
    TypesetEngine engine(metrics, config);

    TypesetInput styled = input("Hi");
    styled.style.fontFamily = "Missing Font";
    RenderPlan plan = engine.layout(styled);
    EXPECT_TRUE(plan.fontFallback);
    EXPECT_EQ(plan.issue, RegionIssue::UnknownFont);
    EXPECT_TRUE(plan.renderable());
}

TEST_F(TypesetEngineTest, DegenerateRegionIsNotRenderable) {
    config.fit.innerPaddingPx = 20;
    TypesetEngine engine(text::FixedAdvanceMetrics{}, config);
    TypesetInput in = input("Hi");
    in.editBox = Rect{0, 0, 10, 10};

    RenderPlan plan = engine.layout(in);
    EXPECT_TRUE(plan.degenerate);
    EXPECT_EQ(plan.issue, RegionIssue::DegenerateBox);
    EXPECT_FALSE(plan.renderable());
}
