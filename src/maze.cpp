#include "maze.hpp"

#include "endpoints.hpp"
#include "rng.hpp"

#include <algorithm>
#include <string>

Maze Maze::generate(const MazeRequest& req, uint32_t seed, MazeReport* report) {
    MazeReport local;
    MazeReport& rep = report ? *report : local;
    rep = MazeReport{};

    int w = req.width;
    int h = req.height;
    if (w < 1 || h < 1) {
        appendWarning(&rep.warnings, "maze size " + std::to_string(w) + "x" + std::to_string(h) +
                                     " clamped to at least 1x1");
        w = std::max(1, w);
        h = std::max(1, h);
    }

    Maze m;
    m.grid_ = MazeGrid(w, h);
    m.algorithm_ = req.algorithm;
    m.seed_ = seed;
    m.braidPercent_ = clampi(req.braidPercent, 0, 100);

    // Carving and braiding draw from independent streams.
    RNG carveRng(hashCombine(seed, tag32("CARVE")));
    RNG braidRng(hashCombine(seed, tag32("BRAID")));

    rep.degenerate = isDegenerateMazeSize(w, h);
    carvePerfectMaze(m.grid_, m.algorithm_, carveRng, &rep.warnings);
    rep.treePassages = passageCount(m.grid_);
    rep.treeEdges = passageEdgeCount(m.grid_);

    rep.braid = applyBraiding(m.grid_, m.braidPercent_, braidRng);
    rep.passages = passageCount(m.grid_);
    rep.edges = passageEdgeCount(m.grid_);

    const EndpointSelection sel = selectEndpoints(m.grid_);
    m.start_ = sel.start;
    m.exit_ = sel.exit;
    rep.endpointDistance = sel.distance;
    rep.borderCells = sel.borderCells;
    rep.endpointFallback = sel.usedFallback;
    if (sel.usedFallback) {
        appendWarning(&rep.warnings, "only " + std::to_string(sel.borderCells) +
                                     " border cell(s); using default start/exit");
    }

    return m;
}
