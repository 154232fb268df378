#include <puttcraft/puttcraft.h>
#include <puttcraft/common/Logger.h>

#include <fstream>
#include <sstream>

int main(int argc, char** argv) {
    using namespace puttcraft;

    Logger::initialize();

    // Optional analysis config: hole_report [config.json]
    AnalysisConfig config;
    if (argc > 1) {
        std::ifstream in(argv[1]);
        if (!in) {
            LOG_ERROR("cannot open config file {}", argv[1]);
            return 1;
        }
        std::stringstream buffer;
        buffer << in.rdbuf();
        config = AnalysisConfigSerializer::fromJson(buffer.str());
    }

    // Dog-leg hole: wall with a gap at the top, sand before the cup, a
    // downhill slope past the wall and a post guarding the gap
    const Rect fairway{0, 0, 800, 600};
    Level level;
    level.tee = {60, 300};
    level.cup.position = {700, 420};
    level.walls.push_back(Rect{400, 60, 20, 540});
    level.water.push_back(Polygon::fromFlat({160, 420, 260, 400, 300, 520, 180, 560}));
    level.sand.push_back(Circle({620, 360}, 40));
    level.slopes.push_back(SlopeField{Rect{430, 0, 200, 300}, CompassDirection::SE, 1.2f});
    level.posts.push_back(Post{{300, 60}, 8});

    HoleAnalyzer analyzer(config);
    LOG_INFO("puttcraft {} ({})", versionString(), analyzer.pathFinder().algorithmName());

    ParEstimate estimate = analyzer.estimatePar(level, fairway);
    LOG_INFO("par {} ({}), path {:.0f}px", estimate.suggestedPar,
             estimate.reachable ? "reachable" : "unreachable", estimate.pathLengthPx);
    for (const auto& note : estimate.notes) {
        LOG_INFO("  {}", note);
    }

    ParSuggestions routes = analyzer.suggestParCandidates(level, fairway);
    for (size_t i = 0; i < routes.candidates.size(); ++i) {
        const CandidatePath& route = routes.candidates[i];
        LOG_INFO("route {}: par {} strokes {:.2f} length {:.0f}px turns {} momentum {:.2f}{}",
                 i + 1, route.par, route.strokes, route.lengthPx, route.turns,
                 route.downhillMomentum, static_cast<int>(i) == routes.bestIndex ? " (best)" : "");
    }

    for (const auto& cup : analyzer.suggestCupPositions(level, fairway)) {
        LOG_INFO("cup suggestion ({:.0f}, {:.0f}) score {:.1f} turns {}",
                 cup.position.x, cup.position.y, cup.score, cup.turns);
    }

    for (const auto& warning : analyzer.lintCup(level, fairway)) {
        LOG_WARN("lint: {}", warning);
    }

    Logger::flush();
    return 0;
}
