#include <gtest/gtest.h>
#include "../../../src/analysis/placement/CupPlacementAdvisor.h"
#include "../../../src/analysis/grid/GridBuilder.h"

#include <algorithm>

using namespace puttcraft;

class CupPlacementAdvisorTest : public ::testing::Test {
protected:
    void SetUp() override {
        fairway_ = Rect{0, 0, 800, 600};
        level_.tee = {60, 300};
        level_.cup.position = {740, 300};
    }

    void addGappedWall() {
        level_.walls.push_back(Rect{400, 60, 20, 540});
    }

    Level level_;
    Rect fairway_;
    CupPlacementAdvisor advisor_;
};

// ============== Suggestions ==============

TEST_F(CupPlacementAdvisorTest, SuggestionsRespectFilters) {
    addGappedWall();
    TerrainGrid grid = GridBuilder::build(level_, fairway_, 20.0f);

    std::vector<CupCandidate> cups = advisor_.suggest(level_, fairway_, 20.0f, 5);

    ASSERT_FALSE(cups.empty());
    EXPECT_LE(cups.size(), 5u);
    for (size_t i = 0; i < cups.size(); ++i) {
        const CupCandidate& cup = cups[i];
        EXPECT_FALSE(grid.at(grid.worldToCell(cup.position)).blocked);
        EXPECT_GE(cup.position.x, 40.0f);
        EXPECT_LE(cup.position.x, 760.0f);
        EXPECT_GE(cup.position.y, 40.0f);
        EXPECT_LE(cup.position.y, 560.0f);
        EXPECT_GE(cup.position.distanceTo(level_.tee), 200.0f);
        EXPECT_GE(cup.lengthPx, cup.position.distanceTo(level_.tee) * 1.08f);

        if (i > 0) {
            EXPECT_GE(cups[i - 1].score, cup.score);
        }
        for (size_t j = 0; j < i; ++j) {
            EXPECT_GE(cups[j].position.distanceTo(cup.position), 120.0f);
        }
    }
}

TEST_F(CupPlacementAdvisorTest, HardestCandidateIsBehindTheWall) {
    addGappedWall();

    std::vector<CupCandidate> cups = advisor_.suggest(level_, fairway_, 20.0f, 3);

    ASSERT_FALSE(cups.empty());
    EXPECT_GT(cups[0].position.x, 420.0f);
    EXPECT_GE(cups[0].turns, 1);
}

TEST_F(CupPlacementAdvisorTest, CountLimitsResults) {
    addGappedWall();

    EXPECT_LE(advisor_.suggest(level_, fairway_, 20.0f, 1).size(), 1u);
    EXPECT_TRUE(advisor_.suggest(level_, fairway_, 20.0f, 0).empty());
}

TEST_F(CupPlacementAdvisorTest, StraightRoutesAreRejected) {
    CupSuggestionOptions options;
    options.minStraightnessRatio = 1.2f;

    EXPECT_TRUE(advisor_.suggest(level_, fairway_, 20.0f, 5, options).empty());
}

TEST_F(CupPlacementAdvisorTest, MinTurnsRejectsSimpleRoutes) {
    addGappedWall();
    CupSuggestionOptions options;
    options.minTurns = 1000;

    EXPECT_TRUE(advisor_.suggest(level_, fairway_, 20.0f, 5, options).empty());
}

TEST_F(CupPlacementAdvisorTest, RegionPolygonConstrainsCandidates) {
    addGappedWall();
    CupSuggestionOptions options;
    options.regionPolygon = {{600, 300}, {800, 300}, {800, 600}, {600, 600}};

    std::vector<CupCandidate> cups = advisor_.suggest(level_, fairway_, 20.0f, 5, options);

    ASSERT_FALSE(cups.empty());
    for (const auto& cup : cups) {
        EXPECT_GE(cup.position.x, 600.0f);
        EXPECT_GE(cup.position.y, 300.0f);
    }
}

TEST_F(CupPlacementAdvisorTest, DegenerateRegionAcceptsNoCandidates) {
    addGappedWall();
    CupSuggestionOptions options;
    options.regionPolygon = {{600, 300}, {800, 300}};

    EXPECT_TRUE(advisor_.suggest(level_, fairway_, 20.0f, 5, options).empty());

    options.regionPolygon = {{700, 400}};
    EXPECT_TRUE(advisor_.suggest(level_, fairway_, 20.0f, 5, options).empty());
}

TEST_F(CupPlacementAdvisorTest, DefaultEdgeMargin) {
    EXPECT_FLOAT_EQ(CupPlacementAdvisor::defaultEdgeMargin(20.0f), 40.0f);
    EXPECT_FLOAT_EQ(CupPlacementAdvisor::defaultEdgeMargin(5.0f), 20.0f);
    EXPECT_FLOAT_EQ(CupPlacementAdvisor::defaultEdgeMargin(12.3f), 25.0f);
}

// ============== Lint ==============

TEST_F(CupPlacementAdvisorTest, OpenHoleHasNoWarnings) {
    EXPECT_TRUE(advisor_.lint(level_, fairway_, 20.0f).empty());
}

TEST_F(CupPlacementAdvisorTest, WallWithGapHasNoWarnings) {
    addGappedWall();
    EXPECT_TRUE(advisor_.lint(level_, fairway_, 20.0f).empty());
}

TEST_F(CupPlacementAdvisorTest, UnreachableCupReportsSingleWarning) {
    level_.walls.push_back(Rect{300, 0, 20, 600});
    level_.cup.position = {790, 300};   // also near the edge

    std::vector<std::string> warnings = advisor_.lint(level_, fairway_, 20.0f);

    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0], CupPlacementAdvisor::UNREACHABLE_WARNING);
}

TEST_F(CupPlacementAdvisorTest, StraightRoutePastObstaclesIsFlagged) {
    level_.walls.push_back(Rect{0, 0, 40, 40});

    std::vector<std::string> warnings = advisor_.lint(level_, fairway_, 20.0f);

    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0], CupPlacementAdvisor::BYPASS_WARNING);
}

TEST_F(CupPlacementAdvisorTest, CupNearEdgeIsFlagged) {
    level_.cup.position = {785, 300};

    std::vector<std::string> warnings = advisor_.lint(level_, fairway_, 20.0f);

    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0], CupPlacementAdvisor::EDGE_WARNING);
}
