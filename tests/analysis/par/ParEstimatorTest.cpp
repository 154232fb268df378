#include <gtest/gtest.h>
#include "../../../src/analysis/par/ParEstimator.h"
#include "../../../src/analysis/metrics/StrokeModel.h"

#include <algorithm>

using namespace puttcraft;

namespace {

bool hasNote(const ParEstimate& estimate, const std::string& prefix) {
    return std::any_of(estimate.notes.begin(), estimate.notes.end(),
                       [&](const std::string& note) { return note.rfind(prefix, 0) == 0; });
}

}  // namespace

class ParEstimatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        fairway_ = Rect{0, 0, 800, 600};
        level_.tee = {60, 300};
        level_.cup.position = {740, 300};
    }

    Level level_;
    Rect fairway_;
    ParEstimator estimator_;
};

// ============== Reachable ==============

TEST_F(ParEstimatorTest, OpenFairwayIsParThree) {
    ParEstimate estimate = estimator_.estimate(level_, fairway_, 20.0f);

    EXPECT_TRUE(estimate.reachable);
    EXPECT_FLOAT_EQ(estimate.pathLengthPx, 680.0f);
    EXPECT_EQ(estimate.suggestedPar, 3);
    EXPECT_TRUE(estimate.notes.empty());
}

TEST_F(ParEstimatorTest, WallWithGapRaisesPar) {
    level_.walls.push_back(Rect{400, 60, 20, 540});

    ParEstimate estimate = estimator_.estimate(level_, fairway_, 20.0f);

    EXPECT_TRUE(estimate.reachable);
    EXPECT_GT(estimate.pathLengthPx, 680.0f);
    EXPECT_GE(estimate.suggestedPar, 4);
    EXPECT_TRUE(hasNote(estimate, "turns ~"));
    EXPECT_TRUE(hasNote(estimate, "corridor contact ~"));
}

TEST_F(ParEstimatorTest, SandAcrossRouteAddsLength) {
    ParEstimate open = estimator_.estimate(level_, fairway_, 20.0f);

    level_.sand.push_back(Rect{300, 0, 100, 600});
    ParEstimate sandy = estimator_.estimate(level_, fairway_, 20.0f);

    EXPECT_TRUE(sandy.reachable);
    EXPECT_GT(sandy.pathLengthPx, open.pathLengthPx);
    EXPECT_GE(sandy.suggestedPar, open.suggestedPar);
    EXPECT_TRUE(hasNote(sandy, "sand cells ~5"));
}

TEST_F(ParEstimatorTest, SlopeAddsHillNote) {
    level_.slopes.push_back(SlopeField{fairway_, CompassDirection::E, 1.0f});

    ParEstimate estimate = estimator_.estimate(level_, fairway_, 20.0f);

    EXPECT_TRUE(estimate.reachable);
    EXPECT_TRUE(hasNote(estimate, "hills on path ~35"));
    EXPECT_FLOAT_EQ(estimate.pathLengthPx, 34 * GridCell::SLOPE_COST * 20.0f);
}

TEST_F(ParEstimatorTest, LongHoleClampsToMaxPar) {
    Rect longFairway{0, 0, 4000, 100};
    level_.tee = {20, 50};
    level_.cup.position = {3980, 50};

    ParEstimate estimate = estimator_.estimate(level_, longFairway, 20.0f);

    EXPECT_TRUE(estimate.reachable);
    EXPECT_EQ(estimate.suggestedPar, 7);
}

TEST_F(ParEstimatorTest, ShortHoleClampsToMinPar) {
    level_.cup.position = {100, 300};

    EXPECT_EQ(estimator_.estimate(level_, fairway_, 20.0f).suggestedPar, 2);
}

TEST_F(ParEstimatorTest, LowerFrictionLowersPar) {
    level_.walls.push_back(Rect{400, 60, 20, 540});

    ParModelConfig slick;
    slick.frictionK = 0.4f;
    ParModelConfig frozen;
    frozen.frictionK = 0.0f;   // floored at minFrictionK

    const int normalPar = estimator_.estimate(level_, fairway_, 20.0f).suggestedPar;
    const int slickPar = ParEstimator(slick).estimate(level_, fairway_, 20.0f).suggestedPar;
    const int frozenPar = ParEstimator(frozen).estimate(level_, fairway_, 20.0f).suggestedPar;

    EXPECT_LT(slickPar, normalPar);
    EXPECT_GE(frozenPar, 2);
    EXPECT_LE(frozenPar, slickPar);
}

// ============== Unreachable ==============

TEST_F(ParEstimatorTest, UnreachableCupUsesStraightLineFallback) {
    level_.walls.push_back(Rect{300, 0, 20, 600});

    ParEstimate estimate = estimator_.estimate(level_, fairway_, 20.0f);

    EXPECT_FALSE(estimate.reachable);
    EXPECT_FLOAT_EQ(estimate.pathLengthPx, 680.0f);
    EXPECT_EQ(estimate.suggestedPar, 3);   // round(680/260 + 0.3)
    ASSERT_EQ(estimate.notes.size(), 1u);
    EXPECT_EQ(estimate.notes[0], "no path, fallback used");
}

TEST_F(ParEstimatorTest, FallbackCountsWallAndWaterShapesOnly) {
    level_.walls.push_back(Rect{300, 0, 20, 600});
    level_.water.push_back(Rect{500, 0, 20, 600});
    level_.water.push_back(Circle({200, 100}, 20));
    level_.sand.push_back(Rect{600, 0, 50, 50});

    // round(680/260 + 3 * 0.3) = round(3.515)
    EXPECT_EQ(estimator_.fallbackPar(level_), 4);
}

// ============== Stroke model ==============

TEST(StrokeModelTest, EffectiveShotDistanceScalesWithFriction) {
    ParModelConfig config;
    EXPECT_FLOAT_EQ(config.effectiveShotPx(), 320.0f);

    config.frictionK = 0.6f;
    EXPECT_FLOAT_EQ(config.effectiveShotPx(), 640.0f);

    config.frictionK = -1.0f;
    EXPECT_FLOAT_EQ(config.effectiveShotPx(), 320.0f * 1.2f / 0.05f);
}

TEST(StrokeModelTest, ZeroShotDistanceClampsToMaxPar) {
    ParModelConfig config;
    config.baselineShotPx = 0.0f;
    config.fallbackShotPx = 0.0f;
    StrokeModel model{config};

    PathSummary summary;
    summary.lengthPx = 400.0f;
    summary.cellCount = 20;

    EXPECT_EQ(model.parForStrokes(model.baseStrokes(summary)), config.maxPar);
    EXPECT_EQ(model.fallbackPar(400.0f, 0), config.maxPar);
}

TEST(StrokeModelTest, PenaltiesAreCapped) {
    StrokeModel model{ParModelConfig{}};
    PathSummary summary;
    summary.lengthPx = 0.0f;
    summary.turns = 100;
    summary.corridorContact = 50.0f;
    summary.cellCount = 10;

    EXPECT_FLOAT_EQ(model.baseStrokes(summary), 1.5f + 1.0f);
}

TEST(StrokeModelTest, HillBumpScalesWithCoverage) {
    StrokeModel model{ParModelConfig{}};
    PathSummary summary;
    summary.cellCount = 10;

    summary.slopeCells = 5;
    EXPECT_NEAR(model.baseStrokes(summary), 0.15f, 1e-6f);

    summary.slopeCells = 1;
    EXPECT_NEAR(model.baseStrokes(summary), 0.15f * (0.5f + 0.5f * 0.2f), 1e-6f);
}

TEST(StrokeModelTest, SlopeAssistIsFloored) {
    StrokeModel model{ParModelConfig{}};
    TraversalAnalysis traversal;
    traversal.downhillMomentum = 20.0f;

    // 2.0 - 1.6 = 0.4, then the auto-assist bonus hits the 0.35 floor
    EXPECT_FLOAT_EQ(model.applySlopeAssist(2.0f, traversal), 0.35f);

    TraversalAnalysis none;
    EXPECT_FLOAT_EQ(model.applySlopeAssist(2.0f, none), 2.0f);
}

TEST(StrokeModelTest, AutoAssistNeedsSegmentsOrNetMomentum) {
    StrokeModel model{ParModelConfig{}};
    TraversalAnalysis traversal;
    traversal.downhillMomentum = 1.0f;
    traversal.uphillResistance = 0.0f;

    // Net momentum 1.0 is below 1.35 and no segments: only the downhill bonus
    EXPECT_NEAR(model.applySlopeAssist(3.0f, traversal), 3.0f - 0.18f, 1e-5f);

    traversal.autoAssistSegments = 3;
    EXPECT_NEAR(model.applySlopeAssist(3.0f, traversal), 3.0f - 0.18f - 0.45f, 1e-5f);
}
