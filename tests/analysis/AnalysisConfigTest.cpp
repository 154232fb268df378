#include <gtest/gtest.h>
#include <puttcraft/analysis/config/AnalysisConfig.h>
#include <puttcraft/common/Logger.h>

#include <limits>

using namespace puttcraft;

TEST(AnalysisConfigTest, Defaults) {
    AnalysisConfig config;

    EXPECT_FLOAT_EQ(config.par.baselineShotPx, 320.0f);
    EXPECT_FLOAT_EQ(config.par.frictionK, 1.2f);
    EXPECT_EQ(config.par.autoAssistSegmentThreshold, 3);
    EXPECT_EQ(config.par.minPar, 2);
    EXPECT_EQ(config.par.maxPar, 7);
    EXPECT_FALSE(config.cups.edgeMargin.has_value());
    EXPECT_FLOAT_EQ(config.cups.minStraightnessRatio, 1.08f);
    EXPECT_FLOAT_EQ(config.cellSize, 20.0f);
    EXPECT_EQ(config.candidateCount, 3);
}

TEST(AnalysisConfigTest, ParForStrokesIsClamped) {
    ParModelConfig par;

    EXPECT_EQ(par.parForStrokes(0.0f), 2);
    EXPECT_EQ(par.parForStrokes(2.125f), 3);
    EXPECT_EQ(par.parForStrokes(2.5f), 4);
    EXPECT_EQ(par.parForStrokes(40.0f), 7);
}

TEST(AnalysisConfigTest, ParForNonFiniteStrokes) {
    ParModelConfig par;

    EXPECT_EQ(par.parForStrokes(std::numeric_limits<float>::infinity()), 7);
    EXPECT_EQ(par.parForStrokes(-std::numeric_limits<float>::infinity()), 2);
    EXPECT_EQ(par.parForStrokes(std::numeric_limits<float>::quiet_NaN()), 7);
    EXPECT_EQ(par.parForStrokes(1e30f), 7);
}

TEST(AnalysisConfigTest, JsonRoundTripPreservesValues) {
    AnalysisConfig config;
    config.par.frictionK = 0.8f;
    config.par.sandFrictionMultiplier = 4.5f;
    config.par.autoAssistSegmentThreshold = 5;
    config.cups.edgeMargin = 32.0f;
    config.cups.minTurns = 2;
    config.cups.regionPolygon = {{0, 0}, {100, 0}, {100, 80}};
    config.cellSize = 16.0f;
    config.cupSuggestionCount = 8;

    AnalysisConfig restored = AnalysisConfigSerializer::fromJson(AnalysisConfigSerializer::toJson(config));

    EXPECT_FLOAT_EQ(restored.par.frictionK, 0.8f);
    EXPECT_FLOAT_EQ(restored.par.sandFrictionMultiplier, 4.5f);
    EXPECT_EQ(restored.par.autoAssistSegmentThreshold, 5);
    ASSERT_TRUE(restored.cups.edgeMargin.has_value());
    EXPECT_FLOAT_EQ(*restored.cups.edgeMargin, 32.0f);
    EXPECT_FALSE(restored.cups.minDistancePx.has_value());
    EXPECT_EQ(restored.cups.minTurns, 2);
    ASSERT_EQ(restored.cups.regionPolygon.size(), 3u);
    EXPECT_EQ(restored.cups.regionPolygon[2], Point(100, 80));
    EXPECT_FLOAT_EQ(restored.cellSize, 16.0f);
    EXPECT_EQ(restored.cupSuggestionCount, 8);
}

TEST(AnalysisConfigTest, PartialJsonKeepsDefaults) {
    AnalysisConfig config = AnalysisConfigSerializer::fromJson(
        R"({"par": {"baselineShotPx": 400, "turnPenaltyMax": "high"}, "candidateCount": 5})");

    EXPECT_FLOAT_EQ(config.par.baselineShotPx, 400.0f);
    EXPECT_FLOAT_EQ(config.par.turnPenaltyMax, 1.5f);
    EXPECT_FLOAT_EQ(config.par.frictionK, 1.2f);
    EXPECT_EQ(config.candidateCount, 5);
    EXPECT_FLOAT_EQ(config.cellSize, 20.0f);
}

TEST(AnalysisConfigTest, NonPositiveShotDistancesKeepDefaults) {
    Logger::enableCapture(true);
    Logger::clearCapturedLogs();

    AnalysisConfig config = AnalysisConfigSerializer::fromJson(
        R"({"par": {"baselineShotPx": 0, "fallbackShotPx": -50, "frictionK": 0.9}})");

    EXPECT_FLOAT_EQ(config.par.baselineShotPx, 320.0f);
    EXPECT_FLOAT_EQ(config.par.fallbackShotPx, 260.0f);
    EXPECT_FLOAT_EQ(config.par.frictionK, 0.9f);
    EXPECT_EQ(Logger::getCapturedLogs("expected a positive distance").size(), 2u);

    Logger::enableCapture(false);
    Logger::clearCapturedLogs();
}

TEST(AnalysisConfigTest, MalformedJsonYieldsDefaults) {
    Logger::enableCapture(true);
    Logger::clearCapturedLogs();

    AnalysisConfig config = AnalysisConfigSerializer::fromJson("{\"par\": {\"frictionK\": 0.4");

    EXPECT_FLOAT_EQ(config.par.frictionK, 1.2f);
    EXPECT_EQ(config.candidateCount, 3);
    EXPECT_FALSE(Logger::getCapturedLogs("failed to parse analysis config").empty());

    Logger::enableCapture(false);
    Logger::clearCapturedLogs();
}

TEST(AnalysisConfigTest, NonObjectJsonYieldsDefaults) {
    AnalysisConfig config = AnalysisConfigSerializer::fromJson("[1, 2, 3]");

    EXPECT_FLOAT_EQ(config.par.baselineShotPx, 320.0f);
    EXPECT_FLOAT_EQ(config.cellSize, 20.0f);
}
