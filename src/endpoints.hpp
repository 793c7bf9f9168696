#pragma once

#include "maze_grid.hpp"

#include <vector>

// Start/exit selection.
//
// Candidates are passage cells in the two outermost rows/columns on every
// side. A BFS from each candidate gives the shortest-path distance to every
// other candidate; the pair with the largest distance wins (first pair found
// on ties, in row-major candidate order). Of that pair, the cell with the
// smaller x+y becomes the start.
//
// Cost is one BFS per candidate, so callers should cap the maze size.

struct EndpointSelection {
    Vec2i start{1, 1};
    Vec2i exit{1, 1};
    int distance = 0;       // shortest-path steps between start and exit
    int borderCells = 0;    // number of candidates considered
    bool usedFallback = false;
};

// 4-way BFS over passages. Unreachable cells (and walls) are -1.
std::vector<int> bfsDistanceMap(const MazeGrid& g, Vec2i from);

bool isBorderCell(const MazeGrid& g, int x, int y);

// Passage cells within two cells of any edge, row-major.
std::vector<Vec2i> collectBorderCells(const MazeGrid& g);

// With fewer than two candidates this falls back to (1,1) / (w-2,h-2),
// clamped into the grid, and sets usedFallback.
EndpointSelection selectEndpoints(const MazeGrid& g);
