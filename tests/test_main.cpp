#include "braid.hpp"
#include "difficulty.hpp"
#include "endpoints.hpp"
#include "level.hpp"
#include "maze.hpp"
#include "maze_algorithms.hpp"
#include "maze_grid.hpp"
#include "progress.hpp"
#include "rng.hpp"
#include "settings.hpp"
#include "slot_utils.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

int failures = 0;

void expect(bool cond, const std::string& msg) {
    if (!cond) {
        ++failures;
        std::cerr << "[FAIL] " << msg << "\n";
    }
}

namespace fs = std::filesystem;

fs::path tempFile(const std::string& name) {
    return fs::temp_directory_path() / name;
}

void writeText(const fs::path& p, const std::string& text) {
    std::ofstream out(p, std::ios::trunc);
    out << text;
}

std::string label(MazeAlgorithm a, int w, int h, uint32_t seed) {
    return std::string(mazeAlgorithmKey(a)) + " " + std::to_string(w) + "x" + std::to_string(h) +
           " seed " + std::to_string(seed);
}

void test_rng_reproducible() {
    RNG rng(123u);
    const std::vector<uint32_t> expected = {
        31682556u,
        4018661298u,
        2101636938u,
        3842487452u,
        1628673942u,
    };

    for (size_t i = 0; i < expected.size(); ++i) {
        const uint32_t v = rng.nextU32();
        expect(v == expected[i], "RNG sequence mismatch at index " + std::to_string(i));
    }

    for (int i = 0; i < 1000; ++i) {
        int r = rng.range(-3, 7);
        expect(r >= -3 && r <= 7, "RNG range() out of bounds");
    }

    RNG a(99u);
    RNG b(99u);
    for (int i = 0; i < 64; ++i) {
        expect(a.nextU32() == b.nextU32(), "RNG same seed diverged");
    }
}

void test_every_algorithm_carves_a_spanning_tree() {
    const int sizes[][2] = {{15, 15}, {21, 11}, {16, 16}, {5, 5}, {40, 7}};

    for (const MazeAlgorithmInfo& info : mazeAlgorithms()) {
        for (const auto& sz : sizes) {
            for (uint32_t seed = 1; seed <= 5; ++seed) {
                MazeRequest req;
                req.width = sz[0];
                req.height = sz[1];
                req.algorithm = info.algorithm;

                MazeReport rep;
                const Maze m = Maze::generate(req, seed, &rep);
                const std::string what = label(info.algorithm, sz[0], sz[1], seed);

                expect(!rep.degenerate, what + ": unexpectedly degenerate");
                expect(rep.warnings.empty(), what + ": unexpected warnings: " + rep.warnings);
                expect(rep.treePassages > 1, what + ": nothing carved");
                expect(rep.treeEdges == rep.treePassages - 1, what + ": edges != passages - 1");
                expect(isFullyConnected(m.grid()), what + ": not connected");
                expect(m.dimensions().width == sz[0] && m.dimensions().height == sz[1],
                       what + ": dimensions changed");
            }
        }
    }
}

void test_generation_is_deterministic() {
    for (const MazeAlgorithmInfo& info : mazeAlgorithms()) {
        MazeRequest req;
        req.width = 23;
        req.height = 17;
        req.algorithm = info.algorithm;
        req.braidPercent = 40;

        const Maze a = Maze::generate(req, 777u);
        const Maze b = Maze::generate(req, 777u);
        const std::string what = label(info.algorithm, 23, 17, 777u);

        expect(a.grid().cells == b.grid().cells, what + ": same seed gave different walls");
        expect(a.startPosition() == b.startPosition(), what + ": same seed gave different start");
        expect(a.exitPosition() == b.exitPosition(), what + ": same seed gave different exit");
    }

    MazeRequest req;
    req.width = 31;
    req.height = 31;
    req.algorithm = MazeAlgorithm::Prim;
    const Maze a = Maze::generate(req, 1u);
    const Maze b = Maze::generate(req, 2u);
    expect(a.grid().cells != b.grid().cells, "different seeds gave identical 31x31 prim mazes");
}

void test_braid_zero_is_noop() {
    for (const MazeAlgorithmInfo& info : mazeAlgorithms()) {
        MazeRequest req;
        req.width = 21;
        req.height = 21;
        req.algorithm = info.algorithm;
        req.braidPercent = 0;

        MazeReport rep;
        Maze::generate(req, 5u, &rep);
        const std::string what = label(info.algorithm, 21, 21, 5u);
        expect(rep.passages == rep.treePassages, what + ": braid 0 changed passages");
        expect(rep.braid.cellsCarved == 0, what + ": braid 0 carved cells");
        expect(rep.braid.deadEndsAfter == rep.braid.deadEndsBefore, what + ": braid 0 changed dead ends");
    }
}

void test_braid_adds_loops_and_keeps_connectivity() {
    int deadEndsBefore = 0;
    int deadEndsAfter = 0;

    for (uint32_t seed = 1; seed <= 20; ++seed) {
        for (int pct : {10, 90, 100}) {
            MazeRequest req;
            req.width = 25;
            req.height = 25;
            req.algorithm = MazeAlgorithm::Kruskal;
            req.braidPercent = pct;

            MazeReport rep;
            const Maze m = Maze::generate(req, seed, &rep);
            const std::string what = "braid " + std::to_string(pct) + "% seed " + std::to_string(seed);

            expect(rep.passages >= rep.treePassages, what + ": braiding removed passages");
            expect(rep.passages == rep.treePassages + rep.braid.cellsCarved, what + ": carve count mismatch");
            expect(isFullyConnected(m.grid()), what + ": braided maze disconnected");
            expect(rep.braid.deadEndsAfter <= rep.braid.deadEndsBefore, what + ": dead ends increased");

            if (pct == 100) {
                deadEndsBefore += rep.braid.deadEndsBefore;
                deadEndsAfter += rep.braid.deadEndsAfter;
                expect(rep.braid.attempts == rep.braid.deadEndsBefore, what + ": 100% skipped a dead end");
            }
        }
    }

    expect(deadEndsAfter < deadEndsBefore, "full braiding did not reduce dead ends");
}

void test_braid_more_percent_never_fewer_passages() {
    for (uint32_t seed = 1; seed <= 40; ++seed) {
        int prevPassages = -1;
        int prevPct = 0;
        for (int pct = 0; pct <= 100; pct += 3) {
            MazeRequest req;
            req.width = 25;
            req.height = 25;
            req.algorithm = MazeAlgorithm::Kruskal;
            req.braidPercent = pct;

            MazeReport rep;
            Maze::generate(req, seed, &rep);
            expect(rep.passages >= prevPassages,
                   "seed " + std::to_string(seed) + ": braid " + std::to_string(pct) + "% gave " +
                   std::to_string(rep.passages) + " passages, " + std::to_string(prevPct) + "% gave " +
                   std::to_string(prevPassages));
            prevPassages = rep.passages;
            prevPct = pct;
        }
    }

    // Cell by cell: what a lower percentage opens, a higher one opens too.
    MazeGrid tree(21, 21);
    RNG carve(17u);
    carvePerfectMaze(tree, MazeAlgorithm::Prim, carve);
    for (uint32_t seed = 1; seed <= 40; ++seed) {
        MazeGrid low = tree;
        MazeGrid high = tree;
        RNG lowRng(seed);
        RNG highRng(seed);
        applyBraiding(low, 35, lowRng);
        applyBraiding(high, 70, highRng);

        bool subset = true;
        for (size_t i = 0; i < low.cells.size(); ++i) {
            if (low.cells[i] == CellType::Passage && high.cells[i] != CellType::Passage) subset = false;
        }
        expect(subset, "braid 35% opened a cell 70% did not (seed " + std::to_string(seed) + ")");
    }
}

void test_braid_on_grid_directly() {
    MazeGrid g(11, 11);
    RNG carve(3u);
    carvePerfectMaze(g, MazeAlgorithm::Wilson, carve);

    const MazeGrid before = g;
    RNG braid(4u);
    const BraidResult none = applyBraiding(g, -5, braid);
    expect(g.cells == before.cells, "negative braid percentage changed the grid");
    expect(none.cellsCarved == 0, "negative braid percentage carved");

    for (const Vec2i& p : findDeadEnds(before)) {
        expect(isDeadEnd(before, p.x, p.y) && passageDegree(before, p.x, p.y) == 1, "dead end degree");
    }
    expect(!isDeadEnd(before, 0, 0), "wall corner is not a dead end");

    const BraidResult all = applyBraiding(g, 250, braid);
    expect(all.deadEndsBefore == static_cast<int>(findDeadEnds(before).size()), "dead end count mismatch");
    expect(all.cellsCarved > 0, "braid above 100% carved nothing");
    expect(isFullyConnected(g), "braided grid disconnected");
}

void test_endpoints_are_maximal_border_pair() {
    const MazeAlgorithm algos[] = {MazeAlgorithm::BinaryTree, MazeAlgorithm::Eller, MazeAlgorithm::Icey,
                                   MazeAlgorithm::DividedDivision, MazeAlgorithm::GrowingTreeMixed};

    for (MazeAlgorithm algo : algos) {
        for (int braid : {0, 50}) {
            for (uint32_t seed = 10; seed < 14; ++seed) {
                MazeRequest req;
                req.width = 19;
                req.height = 15;
                req.algorithm = algo;
                req.braidPercent = braid;

                MazeReport rep;
                const Maze m = Maze::generate(req, seed, &rep);
                const MazeGrid& g = m.grid();
                const Vec2i s = m.startPosition();
                const Vec2i e = m.exitPosition();
                const std::string what = label(algo, 19, 15, seed) + " braid " + std::to_string(braid);

                expect(!rep.endpointFallback, what + ": used fallback endpoints");
                expect(s != e, what + ": start == exit");
                expect(m.isPassage(s.x, s.y), what + ": start is a wall");
                expect(m.isPassage(e.x, e.y), what + ": exit is a wall");
                expect(isBorderCell(g, s.x, s.y), what + ": start not on border");
                expect(isBorderCell(g, e.x, e.y), what + ": exit not on border");
                expect(s.x + s.y <= e.x + e.y, what + ": start is not the cell nearer the origin");

                const std::vector<int> fromStart = bfsDistanceMap(g, s);
                const int d = fromStart[static_cast<size_t>(e.y * g.width + e.x)];
                expect(d == rep.endpointDistance, what + ": reported distance differs from BFS");
                expect(d >= manhattan(s, e), what + ": path shorter than manhattan distance");

                int best = 0;
                const std::vector<Vec2i> border = collectBorderCells(g);
                expect(static_cast<int>(border.size()) == rep.borderCells, what + ": border cell count");
                for (const Vec2i& a : border) {
                    const std::vector<int> dist = bfsDistanceMap(g, a);
                    for (const Vec2i& b : border) {
                        best = std::max(best, dist[static_cast<size_t>(b.y * g.width + b.x)]);
                    }
                }
                expect(d == best, what + ": endpoints are not the farthest border pair");
            }
        }
    }
}

MazeGrid openGrid(int w, int h) {
    MazeGrid g(w, h);
    g.fill(CellType::Passage);
    return g;
}

void test_endpoints_tie_break_and_repeatability() {
    // Open 5x5: (0,0)-(4,4) and (4,0)-(0,4) are both 8 apart; the first pair
    // in row-major order wins.
    {
        const MazeGrid g = openGrid(5, 5);
        const EndpointSelection a = selectEndpoints(g);
        const EndpointSelection b = selectEndpoints(g);

        expect(a.borderCells == 24, "open 5x5 has 24 border cells");
        expect(a.distance == 8, "open 5x5 farthest distance");
        expect(a.start == Vec2i{0, 0}, "open 5x5 start should be (0,0)");
        expect(a.exit == Vec2i{4, 4}, "open 5x5 exit should be (4,4)");
        expect(b.start == a.start && b.exit == a.exit && b.distance == a.distance,
               "repeated selection on one grid should match");
    }

    // Corners (0,0) and (4,4) walled: the farthest pair is (4,0)/(0,4), whose
    // x+y sums are equal, so the later cell of the pair becomes the start.
    {
        MazeGrid g = openGrid(5, 5);
        g.at(0, 0) = CellType::Wall;
        g.at(4, 4) = CellType::Wall;
        const EndpointSelection a = selectEndpoints(g);
        const EndpointSelection b = selectEndpoints(g);

        expect(a.distance == 8, "clipped 5x5 farthest distance");
        expect(a.start == Vec2i{0, 4}, "equal x+y: later cell of the pair is the start");
        expect(a.exit == Vec2i{4, 0}, "equal x+y: earlier cell of the pair is the exit");
        expect(b.start == a.start && b.exit == a.exit, "repeated selection on clipped grid should match");
    }

    // L-shaped corridor: (1,1) down to (1,5) then right to (5,5). Its two ends
    // are the only pair 8 apart.
    {
        MazeGrid g(7, 7);
        for (int y = 1; y <= 5; ++y) g.carve(1, y);
        for (int x = 1; x <= 5; ++x) g.carve(x, 5);
        const EndpointSelection a = selectEndpoints(g);

        expect(a.distance == 8, "L corridor length");
        expect(a.start == Vec2i{1, 1} && a.exit == Vec2i{5, 5}, "L corridor endpoints");
        expect(!a.usedFallback, "L corridor should not fall back");
    }
}

void test_degenerate_sizes() {
    {
        MazeRequest req;
        req.width = 1;
        req.height = 1;
        MazeReport rep;
        const Maze m = Maze::generate(req, 1u, &rep);
        expect(rep.degenerate, "1x1 should be degenerate");
        expect(!rep.warnings.empty(), "1x1 should warn");
        expect(m.isPassage(0, 0), "1x1 cell should be open");
        expect(rep.endpointFallback, "1x1 should use fallback endpoints");
        expect(m.startPosition() == Vec2i{0, 0} && m.exitPosition() == Vec2i{0, 0},
               "1x1 fallback endpoints should clamp to (0,0)");
    }
    {
        MazeRequest req;
        req.width = 2;
        req.height = 5;
        req.algorithm = MazeAlgorithm::Wilson;
        MazeReport rep;
        const Maze m = Maze::generate(req, 1u, &rep);
        expect(rep.degenerate, "2x5 should be degenerate");
        expect(rep.passages == 10, "2x5 should be fully open");
        expect(isFullyConnected(m.grid()), "2x5 should be connected");
        expect(m.startPosition() != m.exitPosition(), "2x5 start == exit");
        expect(rep.warnings.find("warning:") != std::string::npos, "2x5 warning text");
    }
    {
        MazeRequest req;
        req.width = 3;
        req.height = 3;
        MazeReport rep;
        const Maze m = Maze::generate(req, 1u, &rep);
        expect(rep.degenerate, "3x3 should be degenerate");
        expect(static_cast<int>(m.walkablePositions().size()) == 9, "3x3 should be fully open");
    }
    {
        MazeRequest req;
        req.width = 0;
        req.height = -4;
        MazeReport rep;
        const Maze m = Maze::generate(req, 1u, &rep);
        expect(m.dimensions().width == 1 && m.dimensions().height == 1, "non-positive size should clamp to 1x1");
        expect(!rep.warnings.empty(), "non-positive size should warn");
    }

    expect(!isDegenerateMazeSize(5, 3), "5x3 has two rooms");
    expect(isDegenerateMazeSize(4, 4), "4x4 has one room");
}

void test_maze_accessors() {
    MazeRequest req;
    req.width = 15;
    req.height = 9;
    req.algorithm = MazeAlgorithm::HuntAndKill;
    req.braidPercent = 30;
    MazeReport rep;
    const Maze m = Maze::generate(req, 21u, &rep);

    expect(static_cast<int>(m.walkablePositions().size()) == rep.passages, "walkable count != passages");
    expect(m.isWall(-1, 0) && m.isWall(0, -1) && m.isWall(15, 0) && m.isWall(0, 9), "out of bounds should be wall");
    expect(!m.inBounds(15, 9) && m.inBounds(14, 8), "inBounds edges");
    expect(m.algorithm() == MazeAlgorithm::HuntAndKill, "algorithm accessor");
    expect(m.braidPercent() == 30 && m.seed() == 21u, "braid/seed accessors");
}

void test_algorithm_keys() {
    expect(mazeAlgorithms().size() == 11, "expected 11 algorithms");

    for (const MazeAlgorithmInfo& info : mazeAlgorithms()) {
        const auto byKey = parseMazeAlgorithm(info.key);
        expect(byKey && *byKey == info.algorithm, std::string("key does not parse: ") + info.key);
        const MazeAlgorithmInfo& looked = mazeAlgorithmInfo(info.algorithm);
        expect(looked.algorithm == info.algorithm && std::string(looked.key) == info.key,
               std::string("info lookup mismatch for ") + info.key);
        expect(looked.name[0] != '\0', std::string("algorithm without a display name: ") + info.key);

        if (info.alias[0] == '\0') continue;
        const auto byAlias = parseMazeAlgorithm(info.alias);
        expect(byAlias && *byAlias == info.algorithm, std::string("alias does not parse: ") + info.alias);
    }

    expect(parseMazeAlgorithm("Hunt-And-Kill") == MazeAlgorithm::HuntAndKill, "mixed-case alias");
    expect(parseMazeAlgorithm("binary tree") == MazeAlgorithm::BinaryTree, "spaced alias");
    expect(parseMazeAlgorithm("GrowingTree_Mixed") == MazeAlgorithm::GrowingTreeMixed, "growing tree mixed");
    expect(parseMazeAlgorithm("growingtree") == MazeAlgorithm::GrowingTree, "growing tree");
    expect(!parseMazeAlgorithm("bogus").has_value(), "unknown key should not parse");
    expect(!parseMazeAlgorithm("").has_value(), "empty key should not parse");

    std::string warnings;
    expect(resolveMazeAlgorithm("bogus", &warnings) == DEFAULT_MAZE_ALGORITHM, "unknown key should fall back");
    expect(warnings.find("bogus") != std::string::npos, "fallback warning should name the key");

    warnings.clear();
    expect(resolveMazeAlgorithm("eller", &warnings) == MazeAlgorithm::Eller, "known key resolves");
    expect(warnings.empty(), "known key should not warn");
}

void test_difficulty_tiers() {
    const Difficulty l1 = difficultyForLevel(1);
    expect(l1.tierName == "Learning", "level 1 tier");
    expect(l1.mazeSize == 15 && l1.braidPercent == 0, "level 1 size/braid");
    expect(l1.algorithm == MazeAlgorithm::Sidewinder, "level 1 algorithm");

    const Difficulty l10 = difficultyForLevel(10);
    expect(l10.tierName == "Learning" && l10.mazeSize == 25, "level 10 size");
    expect(l10.algorithm == MazeAlgorithm::BinaryTree, "level 10 algorithm");

    const Difficulty l11 = difficultyForLevel(11);
    expect(l11.tierName == "Skill Building" && l11.mazeSize == 25 && l11.braidPercent == 0, "level 11");
    expect(l11.algorithm == MazeAlgorithm::Kruskal, "level 11 algorithm");

    const Difficulty l18 = difficultyForLevel(18);
    expect(l18.mazeSize == 32 && l18.braidPercent == 5, "level 18 interpolation floors");

    const Difficulty l50 = difficultyForLevel(50);
    expect(l50.tierName == "Challenge" && l50.mazeSize == 60 && l50.braidPercent == 25, "level 50");
    expect(l50.algorithm == MazeAlgorithm::HuntAndKill, "level 50 algorithm");

    const Difficulty l100 = difficultyForLevel(100);
    expect(l100.tierName == "Expert" && l100.mazeSize == 80 && l100.braidPercent == 50, "level 100");
    expect(l100.algorithm == MazeAlgorithm::Wilson, "level 100 algorithm");

    const Difficulty l101 = difficultyForLevel(101);
    expect(l101.tierName == "Master" && l101.mazeSize == 80 && l101.braidPercent == 50, "level 101");
    expect(l101.algorithm == MazeAlgorithm::Kruskal, "level 101 algorithm");

    const Difficulty l500 = difficultyForLevel(500);
    expect(l500.tierName == "Master" && l500.mazeSize == 80, "open tier stays at its start values");
    expect(l500.algorithm == MazeAlgorithm::Prim, "level 500 algorithm");

    expect(difficultyForLevel(0).level == 1 && difficultyForLevel(-7).tierName == "Learning",
           "levels below 1 clamp to 1");
}

void test_scoring() {
    const ScoreBreakdown fast = computeLevelScore(1, 0, 0, 15);
    expect(fast.base == 100 && fast.timeBonus == 1000 && fast.moveBonus == 500 && fast.total == 1600,
           "instant level 1 score");

    const ScoreBreakdown slow = computeLevelScore(1, 225000, 100, 15);
    expect(slow.timeBonus == 0 && slow.moveBonus == 0 && slow.total == 100, "slow level 1 score");

    const ScoreBreakdown half = computeLevelScore(2, 200000, 15, 20);
    expect(half.base == 200 && half.timeBonus == 1000 && half.moveBonus == 500 && half.total == 1700,
           "half-target level 2 score");

    ProgressState st;
    recordLevelCompletion(st, fast, 1234);
    expect(st.score == 1600 && st.highScore == 1600, "score recorded");
    expect(st.currentLevel == 2 && st.levelsCompleted == 1 && st.lastCompletionMs == 1234, "level advanced");

    resetProgress(st);
    expect(st.currentLevel == 1 && st.score == 0 && st.levelsCompleted == 0, "reset clears run");
    expect(st.highScore == 1600, "reset keeps high score");

    const uint32_t maxU32 = std::numeric_limits<uint32_t>::max();
    const ScoreBreakdown huge = computeLevelScore(std::numeric_limits<int>::max(), 0, 0, 15);
    expect(huge.base == maxU32 && huge.timeBonus == maxU32 && huge.moveBonus == maxU32, "huge level parts clamp");
    expect(huge.total == maxU32, "huge level total clamps");

    ProgressState big;
    big.score = maxU32 - 10;
    big.currentLevel = std::numeric_limits<int>::max();
    recordLevelCompletion(big, fast, 1);
    expect(big.score == maxU32 && big.highScore == maxU32, "running score saturates");
    expect(big.currentLevel == std::numeric_limits<int>::max(), "current level does not wrap");
}

void test_resolve_start_level() {
    ProgressState saved;
    saved.currentLevel = 12;
    int level = 0;
    std::string err;

    expect(resolveStartLevel(0, false, nullptr, level, &err) && level == 1, "fresh run starts at 1");
    expect(resolveStartLevel(0, false, &saved, level, &err) && level == 12, "saved level used by default");
    expect(resolveStartLevel(5, false, &saved, level, &err) && level == 5, "explicit level wins");
    expect(resolveStartLevel(0, true, &saved, level, &err) && level == 12, "resume uses saved level");

    level = 7;
    expect(!resolveStartLevel(0, true, nullptr, level, &err), "resume without progress fails");
    expect(!err.empty() && level == 7, "resume failure reported and level untouched");
}

void test_cap_maze_request() {
    MazeRequest req;
    req.width = 3000;
    req.height = 41;
    std::string warnings;
    expect(capMazeRequest(req, 60, &warnings), "oversized request should be capped");
    expect(req.width == 60 && req.height == 41, "only the oversized side shrinks");
    expect(warnings.find("3000x41") != std::string::npos, "cap warning names the requested size");

    warnings.clear();
    expect(!capMazeRequest(req, 60, &warnings) && warnings.empty(), "in-range request untouched");

    req.width = 50;
    req.height = 50;
    expect(capMazeRequest(req, 2, &warnings) && req.width == 5 && req.height == 5, "cap never goes below 5");

    Settings settings;
    settings.maxMazeSize = 30;
    warnings.clear();
    const MazeRequest level = makeMazeRequest(difficultyForLevel(60), settings, &warnings);
    expect(level.width == 30 && level.height == 30, "level request capped by settings");
    expect(warnings.empty(), "level cap is quiet");
}

void test_progress_roundtrip() {
    const fs::path path = tempFile("mazerunner_progress_roundtrip_test.dat");
    std::error_code ec;
    fs::remove(path, ec);

    ProgressState missing;
    std::string err = "x";
    expect(!loadProgress(path.string(), missing, &err), "missing progress should not load");
    expect(err.empty(), "missing progress should not be an error");

    ProgressState st;
    st.currentLevel = 7;
    st.score = 4321;
    st.highScore = 9000;
    st.levelsCompleted = 6;
    st.lastCompletionMs = 55555;
    st.lastDifficulty = difficultyForLevel(7);
    expect(saveProgress(path.string(), st, &err), "saveProgress failed: " + err);
    expect(!st.savedAt.empty(), "saveProgress should stamp savedAt");

    ProgressState r;
    expect(loadProgress(path.string(), r, &err), "loadProgress failed: " + err);
    expect(r.currentLevel == 7 && r.score == 4321 && r.highScore == 9000, "progress core fields");
    expect(r.levelsCompleted == 6 && r.lastCompletionMs == 55555, "progress counters");
    expect(r.savedAt == st.savedAt, "progress timestamp");
    expect(r.lastDifficulty.tierName == "Learning" && r.lastDifficulty.level == 7, "progress difficulty");
    expect(r.lastDifficulty.algorithm == st.lastDifficulty.algorithm, "progress difficulty algorithm");
    expect(r.lastDifficulty.mazeSize == st.lastDifficulty.mazeSize, "progress difficulty size");

    fs::remove(path, ec);
}

void test_progress_rejects_bad_files() {
    const fs::path path = tempFile("mazerunner_progress_bad_test.dat");
    std::error_code ec;
    ProgressState st;
    std::string err;

    writeText(path, "version = 99\ncurrent_level = 3\n");
    expect(!loadProgress(path.string(), st, &err), "future version should be rejected");
    expect(!err.empty(), "version mismatch should explain itself");

    writeText(path, "version = 1\ncurrent_level = abc\n");
    expect(!loadProgress(path.string(), st, &err), "malformed level should be rejected");

    writeText(path, "version = 1\nscore = 10\n");
    expect(!loadProgress(path.string(), st, &err), "missing current_level should be rejected");

    writeText(path, "# comment\nversion = 1\ncurrent_level = 4\nsome_future_key = 1\n");
    expect(loadProgress(path.string(), st, &err), "unknown keys should be ignored");
    expect(st.currentLevel == 4, "level parsed next to unknown key");

    fs::remove(path, ec);
}

void test_settings_parse() {
    const fs::path path = tempFile("mazerunner_settings_test.ini");
    std::error_code ec;

    writeText(path,
              "# test\n"
              "max_maze_size = 500\n"
              "force_algorithm = Wilson\n"
              "braid_override = 150\n"
              "default_slot = My Slot!\n"
              "print_maze = no ; trailing comment\n"
              "bogus_key = 1\n");

    std::string warnings;
    Settings s = loadSettings(path.string(), &warnings);
    expect(s.maxMazeSize == 200, "max_maze_size clamps to 200");
    expect(s.forceAlgorithm == "Wilson", "force_algorithm kept");
    expect(s.braidOverride == 100, "braid_override clamps to 100");
    expect(s.defaultSlot == "my_slot", "default_slot sanitized");
    expect(!s.printMaze, "print_maze parsed");
    expect(warnings.find("bogus_key") != std::string::npos, "unknown key should warn");

    writeText(path, "force_algorithm = mystery\nbraid_override = -20\nmax_maze_size = lots\n");
    warnings.clear();
    s = loadSettings(path.string(), &warnings);
    expect(s.forceAlgorithm.empty(), "unknown algorithm ignored");
    expect(s.braidOverride == -1, "negative braid_override disables it");
    expect(s.maxMazeSize == 60, "bad max_maze_size keeps default");
    expect(warnings.find("mystery") != std::string::npos, "unknown algorithm should warn");
    expect(warnings.find("max_maze_size") != std::string::npos, "bad value should warn");

    expect(writeDefaultSettings(path.string()), "writeDefaultSettings failed");
    warnings.clear();
    s = loadSettings(path.string(), &warnings);
    expect(warnings.empty(), "default settings should load cleanly: " + warnings);
    expect(s.maxMazeSize == 60 && s.braidOverride == -1 && s.printMaze, "default settings values");

    expect(updateIniKey(path.string(), "max_maze_size", "30"), "updateIniKey failed");
    expect(updateIniKey(path.string(), "force_algorithm", "prim"), "updateIniKey failed");
    s = loadSettings(path.string());
    expect(s.maxMazeSize == 30 && s.forceAlgorithm == "prim", "updateIniKey values");

    fs::remove(path, ec);
    expect(!updateIniKey(path.string(), "max_maze_size", "30"), "updateIniKey on missing file");
    s = loadSettings(path.string());
    expect(s.maxMazeSize == 60, "missing settings file gives defaults");
}

void test_slot_names() {
    expect(sanitizeSlotName("  ../Evil Slot  ") == "evil_slot", "slot path characters stripped");
    expect(sanitizeSlotName("") == "slot", "empty slot name");
    expect(sanitizeSlotName("CON") == "_con", "reserved slot name");
    expect(sanitizeSlotName(std::string(50, 'a')).size() == 32, "slot name truncated");
    expect(progressFileName("") == "mazerunner_progress.dat", "default progress file");
    expect(progressFileName("default") == "mazerunner_progress.dat", "named default progress file");
    expect(progressFileName("alpha") == "mazerunner_progress_alpha.dat", "slot progress file");
}

void test_level_session() {
    Settings settings;
    LevelSession s;
    std::string err;

    expect(buildLevel(1, 42u, settings, s, &err), "level 1 failed: " + err);
    expect(s.levelNumber() == 1 && s.difficulty().tierName == "Learning", "level 1 session");
    expect(s.maze().dimensions().width == 15 && s.maze().dimensions().height == 15, "level 1 maze size");
    expect(s.maze().algorithm() == MazeAlgorithm::Sidewinder, "level 1 maze algorithm");
    expect(!s.completed(), "fresh level is not complete");
    expect(s.elapsedMs() < 60000u, "elapsed time counts from the build");

    expect(s.complete(1234), "first completion counts");
    expect(!s.complete(99), "second completion ignored");
    expect(s.completed() && s.completionTimeMs() == 1234, "completion time kept");

    const LevelMetadata meta = s.metadata();
    expect(meta.levelNumber == 1 && meta.completed && meta.completionTimeMs == 1234, "metadata");
    expect(meta.mazeSize.width == 15 && meta.difficulty.algorithm == MazeAlgorithm::Sidewinder, "metadata maze");

    settings.maxMazeSize = 20;
    settings.forceAlgorithm = "kruskal";
    settings.braidOverride = 0;
    expect(buildLevel(50, 42u, settings, s, &err), "level 50 failed: " + err);
    expect(s.difficulty().mazeSize == 60, "difficulty keeps table size");
    expect(s.maze().dimensions().width == 20, "size capped by settings");
    expect(s.maze().algorithm() == MazeAlgorithm::Kruskal, "forced algorithm used");
    expect(s.request().braidPercent == 0 && s.maze().braidPercent() == 0, "braid override used");

    settings.forceAlgorithm = "nonsense";
    expect(buildLevel(2, 1u, settings, s, &err), "level with bad forced algorithm failed");
    expect(s.maze().algorithm() == DEFAULT_MAZE_ALGORITHM, "bad forced algorithm falls back");
    expect(s.report().warnings.find("nonsense") != std::string::npos, "bad forced algorithm warns");
}

void test_level_restart_on_failure() {
    Settings settings;
    const MazeFactory smallOnly = [](const MazeRequest& req, uint32_t seed, MazeReport* rep) {
        if (req.width > 15) throw std::runtime_error("maze too large for this test");
        return Maze::generate(req, seed, rep);
    };

    LevelSession s;
    std::string err;
    expect(buildLevel(1, 9u, settings, s, &err, smallOnly), "level 1 should build");

    expect(!buildLevel(30, 9u, settings, s, &err, smallOnly), "level 30 should fail");
    expect(err.find("too large") != std::string::npos, "failure reason reported");
    expect(s.levelNumber() == 1, "failed build leaves the session untouched");

    const int built = buildLevelOrRestart(30, 9u, settings, s, &err, smallOnly);
    expect(built == 1 && s.levelNumber() == 1, "failure restarts at level 1");
    expect(err.find("restarted at level 1") != std::string::npos, "restart reported");

    const MazeFactory alwaysFails = [](const MazeRequest&, uint32_t, MazeReport*) -> Maze {
        throw std::runtime_error("out of memory");
    };
    expect(buildLevelOrRestart(5, 9u, settings, s, &err, alwaysFails) == 0, "double failure returns 0");
    expect(!err.empty(), "double failure reported");

    expect(buildLevelOrRestart(3, 9u, settings, s, &err) == 3 && err.empty(), "normal build keeps level");
}

} // namespace

int main() {
    std::cout << "Running MazeRunner tests...\n";

    test_rng_reproducible();

    test_every_algorithm_carves_a_spanning_tree();
    test_generation_is_deterministic();
    test_braid_zero_is_noop();
    test_braid_adds_loops_and_keeps_connectivity();
    test_braid_more_percent_never_fewer_passages();
    test_braid_on_grid_directly();
    test_endpoints_are_maximal_border_pair();
    test_endpoints_tie_break_and_repeatability();
    test_degenerate_sizes();
    test_maze_accessors();
    test_algorithm_keys();

    test_difficulty_tiers();
    test_scoring();
    test_resolve_start_level();
    test_cap_maze_request();
    test_progress_roundtrip();
    test_progress_rejects_bad_files();
    test_settings_parse();
    test_slot_names();
    test_level_session();
    test_level_restart_on_failure();

    if (failures == 0) {
        std::cout << "All tests passed.\n";
        return 0;
    }

    std::cerr << failures << " test(s) failed.\n";
    return 1;
}
