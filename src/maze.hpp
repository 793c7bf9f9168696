#pragma once

#include "braid.hpp"
#include "common.hpp"
#include "maze_algorithms.hpp"
#include "maze_grid.hpp"

#include <cstdint>
#include <string>
#include <vector>

struct MazeDimensions {
    int width = 0;
    int height = 0;
};

struct MazeRequest {
    int width = 15;
    int height = 15;
    MazeAlgorithm algorithm = DEFAULT_MAZE_ALGORITHM;
    int braidPercent = 0; // 0..100
};

// Diagnostics gathered while generating one maze.
struct MazeReport {
    int treePassages = 0;   // passage count right after carving
    int treeEdges = 0;      // edge count right after carving
    int passages = 0;       // after braiding
    int edges = 0;
    BraidResult braid;
    int endpointDistance = 0;
    int borderCells = 0;
    bool degenerate = false;
    bool endpointFallback = false;

    // One "warning: ..." line per degenerate-input fallback.
    std::string warnings;
};

// A generated maze level: wall map plus start/exit.
//
// generate() runs the whole pipeline (carve -> braid -> endpoints) before
// returning, and the result only exposes read accessors. Allocation failures
// on oversized requests propagate as exceptions; degenerate sizes do not.
class Maze {
public:
    Maze() = default;

    static Maze generate(const MazeRequest& req, uint32_t seed, MazeReport* report = nullptr);

    bool isWall(int x, int y) const { return grid_.isWall(x, y); }
    bool isPassage(int x, int y) const { return grid_.isPassage(x, y); }
    bool inBounds(int x, int y) const { return grid_.inBounds(x, y); }

    MazeDimensions dimensions() const { return {grid_.width, grid_.height}; }
    Vec2i startPosition() const { return start_; }
    Vec2i exitPosition() const { return exit_; }

    std::vector<Vec2i> walkablePositions() const { return passagePositions(grid_); }

    const MazeGrid& grid() const { return grid_; }
    MazeAlgorithm algorithm() const { return algorithm_; }
    uint32_t seed() const { return seed_; }
    int braidPercent() const { return braidPercent_; }

private:
    MazeGrid grid_;
    Vec2i start_{0, 0};
    Vec2i exit_{0, 0};
    MazeAlgorithm algorithm_ = DEFAULT_MAZE_ALGORITHM;
    uint32_t seed_ = 0;
    int braidPercent_ = 0;
};
