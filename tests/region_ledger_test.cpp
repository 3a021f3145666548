#include <gtest/gtest.h>
#include "bubblefit/ledger/region_ledger.h"
#include "bubblefit/text/fixed_advance_metrics.h"
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace bubblefit;
using namespace bubblefit::ledger;

// =============================================================================
// Test Fixture
// =============================================================================

class RegionLedgerTest : public ::testing::Test {
protected:
    std::unique_ptr<RegionLedger> ledger;

    void SetUp() override {
        EngineConfig config;
        config.fit = FitConfig{8, 40, 4};
        config.mask.paddingPx = 10;
        config.mask.dilationPx = 0;
        auto engine = std::make_shared<const layout::TypesetEngine>(text::FixedAdvanceMetrics{}, config);
        ledger = std::make_unique<RegionLedger>(engine);
    }

    std::uint32_t addBox(Rect box, const std::string& sourceText = "src") {
        RegionSeed seed;
        seed.sourceBox = box;
        seed.sourceText = sourceText;
        seed.style.align = TextAlign::Left;
        return ledger->addRegion(std::move(seed));
    }
};

// =============================================================================
// Ids and lifecycle
// =============================================================================

TEST_F(RegionLedgerTest, IdsAreNeverReused) {
    const std::uint32_t a = addBox(Rect{0, 0, 10, 10});
    const std::uint32_t b = addBox(Rect{20, 0, 10, 10});
    EXPECT_NE(a, 0u);
    EXPECT_LT(a, b);

    EXPECT_EQ(ledger->removeRegion(a), EngineError::Ok);
    const std::uint32_t c = addBox(Rect{40, 0, 10, 10});
    EXPECT_GT(c, b);

    ledger->clear();
    EXPECT_EQ(ledger->size(), 0u);
    const std::uint32_t d = addBox(Rect{0, 0, 10, 10});
    EXPECT_GT(d, c);
    EXPECT_FALSE(ledger->snapshot(a).has_value());
    EXPECT_FALSE(ledger->snapshot(b).has_value());
}

TEST_F(RegionLedgerTest, RemoveEverythingThenAdd) {
    const std::uint32_t a = addBox(Rect{0, 0, 10, 10});
    EXPECT_EQ(ledger->removeRegion(a), EngineError::Ok);
    EXPECT_EQ(ledger->removeRegion(a), EngineError::NotFound);
    const std::uint32_t b = addBox(Rect{0, 0, 10, 10});
    EXPECT_GT(b, a);
    ASSERT_TRUE(ledger->snapshot(b).has_value());
    EXPECT_EQ(ledger->ids(), std::vector<std::uint32_t>{b});
}

TEST_F(RegionLedgerTest, SeedInitializesRegion) {
    const std::uint32_t id = addBox(Rect{5, 6, 70, 80}, "\xE3\x81\x93\xE3\x82\x93");
    auto region = ledger->snapshot(id);
    ASSERT_TRUE(region.has_value());
    EXPECT_EQ(region->id, id);
    EXPECT_EQ(region->sourceBox, (Rect{5, 6, 70, 80}));
    EXPECT_EQ(region->editBox, region->sourceBox);
    EXPECT_EQ(region->sourceText, "\xE3\x81\x93\xE3\x82\x93");
    EXPECT_TRUE(region->translatedText.empty());
}

TEST_F(RegionLedgerTest, EmptySeedBoxIsRejected) {
    EXPECT_EQ(addBox(Rect{0, 0, 0, 10}), 0u);
    EXPECT_EQ(ledger->size(), 0u);
}

TEST_F(RegionLedgerTest, UnknownIdsReportNotFound) {
    EXPECT_EQ(ledger->setTranslatedText(99, "x"), EngineError::NotFound);
    EXPECT_EQ(ledger->setEditBox(99, Rect{0, 0, 5, 5}), EngineError::NotFound);
    EXPECT_EQ(ledger->resetEditBox(99), EngineError::NotFound);
    EXPECT_EQ(ledger->setStyle(99, TextStyle{}), EngineError::NotFound);
    EXPECT_EQ(ledger->setOrientation(99, Orientation::Vertical), EngineError::NotFound);
    EXPECT_FALSE(ledger->renderPlan(99).has_value());
    EXPECT_FALSE(ledger->version(99).has_value());
}

// =============================================================================
// Mutations and versions
// =============================================================================

TEST_F(RegionLedgerTest, MutationsBumpVersion) {
    const std::uint32_t id = addBox(Rect{0, 0, 200, 80});
    const std::uint64_t v0 = *ledger->version(id);

    EXPECT_EQ(ledger->setTranslatedText(id, "HELLO"), EngineError::Ok);
    const std::uint64_t v1 = *ledger->version(id);
    EXPECT_GT(v1, v0);

    EXPECT_EQ(ledger->setEditBox(id, Rect{0, 0, 300, 80}), EngineError::Ok);
    const std::uint64_t v2 = *ledger->version(id);
    EXPECT_GT(v2, v1);

    EXPECT_EQ(ledger->setOrientation(id, Orientation::Vertical), EngineError::Ok);
    EXPECT_GT(*ledger->version(id), v2);
}

TEST_F(RegionLedgerTest, UnchangedTranslationIsNoOp) {
    const std::uint32_t id = addBox(Rect{0, 0, 200, 80});
    ASSERT_EQ(ledger->setTranslatedText(id, "HELLO"), EngineError::Ok);
    ASSERT_TRUE(ledger->renderPlan(id).has_value());
    const std::uint64_t version = *ledger->version(id);
    const std::uint64_t layouts = ledger->layoutCount();

    EXPECT_EQ(ledger->setTranslatedText(id, "HELLO"), EngineError::Ok);
    EXPECT_EQ(*ledger->version(id), version);
    EXPECT_TRUE(ledger->dirtyIds().empty());
    ASSERT_TRUE(ledger->renderPlan(id).has_value());
    EXPECT_EQ(ledger->layoutCount(), layouts);
}

TEST_F(RegionLedgerTest, InvalidEditBoxIsRejected) {
    const std::uint32_t id = addBox(Rect{0, 0, 200, 80});
    const std::uint64_t version = *ledger->version(id);

    EXPECT_EQ(ledger->setEditBox(id, Rect{0, 0, 0, 50}), EngineError::InvalidOperation);
    EXPECT_EQ(ledger->setEditBox(id, Rect{0, 0, 50, -5}), EngineError::InvalidOperation);
    EXPECT_EQ(ledger->snapshot(id)->editBox, (Rect{0, 0, 200, 80}));
    EXPECT_EQ(*ledger->version(id), version);
}

TEST_F(RegionLedgerTest, ResetEditBoxRestoresSourceBox) {
    const std::uint32_t id = addBox(Rect{10, 10, 100, 50});
    ASSERT_EQ(ledger->setEditBox(id, Rect{0, 0, 300, 300}), EngineError::Ok);
    ASSERT_EQ(ledger->resetEditBox(id), EngineError::Ok);
    EXPECT_EQ(ledger->snapshot(id)->editBox, (Rect{10, 10, 100, 50}));
}

// =============================================================================
// Lazy render plans
// =============================================================================

TEST_F(RegionLedgerTest, PlanIsComputedLazilyAndCached) {
    const std::uint32_t id = addBox(Rect{0, 0, 200, 80});
    ASSERT_EQ(ledger->setTranslatedText(id, "HELLO THERE WORLD"), EngineError::Ok);
    EXPECT_EQ(ledger->dirtyIds(), std::vector<std::uint32_t>{id});
    EXPECT_EQ(ledger->layoutCount(), 0u);

    auto plan = ledger->renderPlan(id);
    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan->fontSizePx, 29);
    EXPECT_EQ(plan->lines.size(), 2u);
    EXPECT_EQ(plan->version, *ledger->version(id));
    EXPECT_TRUE(ledger->dirtyIds().empty());
    EXPECT_EQ(ledger->layoutCount(), 1u);

    ASSERT_TRUE(ledger->renderPlan(id).has_value());
    EXPECT_EQ(ledger->layoutCount(), 1u);
}

TEST_F(RegionLedgerTest, EditInvalidatesPlan) {
    const std::uint32_t id = addBox(Rect{0, 0, 200, 80});
    ledger->setTranslatedText(id, "HELLO THERE WORLD");
    const int before = ledger->renderPlan(id)->fontSizePx;

    ASSERT_EQ(ledger->setEditBox(id, Rect{0, 0, 100, 80}), EngineError::Ok);
    EXPECT_EQ(ledger->dirtyIds(), std::vector<std::uint32_t>{id});
    auto plan = ledger->renderPlan(id);
    ASSERT_TRUE(plan.has_value());
    EXPECT_LT(plan->fontSizePx, before);
    EXPECT_EQ(ledger->layoutCount(), 2u);
}

TEST_F(RegionLedgerTest, StyleChangesInvalidateSelectively) {
    const std::uint32_t id = addBox(Rect{0, 0, 200, 80});
    ledger->setTranslatedText(id, "HELLO THERE WORLD");
    ASSERT_TRUE(ledger->renderPlan(id).has_value());

    TextStyle style = ledger->snapshot(id)->style;
    style.colorRGBA = 0xFF0000FF;
    ASSERT_EQ(ledger->setStyle(id, style), EngineError::Ok);
    EXPECT_TRUE(ledger->dirtyIds().empty());
    auto recolored = ledger->renderPlan(id);
    ASSERT_TRUE(recolored.has_value());
    EXPECT_EQ(recolored->colorRGBA, 0xFF0000FFu);
    EXPECT_EQ(recolored->version, *ledger->version(id));
    EXPECT_EQ(ledger->layoutCount(), 1u);

    style.fontSizeHint = 12;
    ASSERT_EQ(ledger->setStyle(id, style), EngineError::Ok);
    EXPECT_EQ(ledger->dirtyIds(), std::vector<std::uint32_t>{id});
    EXPECT_EQ(ledger->renderPlan(id)->fontSizePx, 12);

    style.align = TextAlign::Right;
    ASSERT_EQ(ledger->setStyle(id, style), EngineError::Ok);
    EXPECT_EQ(ledger->dirtyIds(), std::vector<std::uint32_t>{id});
    EXPECT_EQ(ledger->renderPlan(id)->align, TextAlign::Right);
}

TEST_F(RegionLedgerTest, DegenerateRegionDoesNotAffectOthers) {
    const std::uint32_t bad = addBox(Rect{0, 0, 6, 6});
    const std::uint32_t good = addBox(Rect{0, 100, 200, 80});
    ledger->setTranslatedText(bad, "HELLO");
    ledger->setTranslatedText(good, "HELLO THERE WORLD");

    auto badPlan = ledger->renderPlan(bad);
    ASSERT_TRUE(badPlan.has_value());
    EXPECT_EQ(badPlan->issue, RegionIssue::DegenerateBox);
    EXPECT_FALSE(badPlan->renderable());

    auto goodPlan = ledger->renderPlan(good);
    ASSERT_TRUE(goodPlan.has_value());
    EXPECT_EQ(goodPlan->issue, RegionIssue::None);
    EXPECT_EQ(goodPlan->fontSizePx, 29);
    EXPECT_TRUE(goodPlan->renderable());
}

TEST_F(RegionLedgerTest, PartialTranslationsAreIndependent) {
    std::vector<std::uint32_t> ids;
    for (int i = 0; i < 10; ++i) {
        ids.push_back(addBox(Rect{0, i * 100, 200, 80}));
    }
    for (int i = 0; i < 3; ++i) {
        ledger->setTranslatedText(ids[static_cast<std::size_t>(i)], "HELLO THERE WORLD");
    }

    for (std::size_t i = 0; i < ids.size(); ++i) {
        auto plan = ledger->renderPlan(ids[i]);
        ASSERT_TRUE(plan.has_value());
        if (i < 3) {
            EXPECT_EQ(plan->fontSizePx, 29);
        } else {
            EXPECT_TRUE(plan->lines.empty());
        }
    }
}

TEST_F(RegionLedgerTest, ConcurrentEditsNeverYieldStalePlans) {
    const std::uint32_t id = addBox(Rect{0, 0, 200, 80});
    ledger->setTranslatedText(id, "start");

    std::atomic<bool> done{false};
    std::thread writer([&]() {
        for (int i = 0; i < 200; ++i) {
            ledger->setTranslatedText(id, "text " + std::to_string(i));
        }
        done = true;
    });

    while (!done) {
        auto plan = ledger->renderPlan(id);
        EXPECT_TRUE(plan.has_value());
    }
    writer.join();

    auto plan = ledger->renderPlan(id);
    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan->version, *ledger->version(id));
    ASSERT_EQ(plan->lines.size(), 1u);
    EXPECT_EQ(plan->lines[0].text, "text 199");
}

// =============================================================================
// Mask
// =============================================================================

TEST_F(RegionLedgerTest, MaskCoversAllEditBoxes) {
    addBox(Rect{10, 10, 50, 50});
    addBox(Rect{55, 10, 50, 50});

    auto result = ledger->buildMask(200, 100);
    ASSERT_EQ(result.status, EngineError::Ok);
    ASSERT_EQ(result.components.size(), 1u);
    EXPECT_EQ(result.components[0].bounds.x, 0);
    EXPECT_EQ(result.components[0].bounds.right(), 115);
}

TEST_F(RegionLedgerTest, MaskFollowsEditBoxChanges) {
    const std::uint32_t a = addBox(Rect{10, 10, 50, 50});
    addBox(Rect{55, 10, 50, 50});
    ASSERT_EQ(ledger->setEditBox(a, Rect{150, 80, 10, 10}), EngineError::Ok);

    auto result = ledger->buildMask(400, 200);
    EXPECT_EQ(result.components.size(), 2u);

    auto again = ledger->buildMask(400, 200);
    EXPECT_EQ(mask::maskDigest(result.mask), mask::maskDigest(again.mask));
}

TEST_F(RegionLedgerTest, MaskRejectsInvalidCanvas) {
    addBox(Rect{10, 10, 50, 50});
    EXPECT_EQ(ledger->buildMask(0, 0).status, EngineError::InvalidOperation);
}
