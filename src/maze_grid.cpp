#include "maze_grid.hpp"

#include <algorithm>
#include <deque>

const int DIRS4[4][2] = {{0,-1},{1,0},{0,1},{-1,0}};

MazeGrid::MazeGrid(int w, int h)
    : width(std::max(0, w)), height(std::max(0, h)),
      cells(static_cast<size_t>(width) * static_cast<size_t>(height), CellType::Wall) {}

void MazeGrid::fill(CellType t) {
    std::fill(cells.begin(), cells.end(), t);
}

int passageDegree(const MazeGrid& g, int x, int y) {
    int deg = 0;
    for (const auto& dv : DIRS4) {
        if (g.isPassage(x + dv[0], y + dv[1])) deg++;
    }
    return deg;
}

bool isDeadEnd(const MazeGrid& g, int x, int y) {
    if (g.isWall(x, y)) return false;
    return passageDegree(g, x, y) == 1;
}

std::vector<Vec2i> findDeadEnds(const MazeGrid& g) {
    std::vector<Vec2i> out;
    for (int y = 0; y < g.height; ++y) {
        for (int x = 0; x < g.width; ++x) {
            if (isDeadEnd(g, x, y)) out.push_back({x, y});
        }
    }
    return out;
}

int passageCount(const MazeGrid& g) {
    return static_cast<int>(std::count(g.cells.begin(), g.cells.end(), CellType::Passage));
}

int passageEdgeCount(const MazeGrid& g) {
    // Count each edge once: only look east and south.
    int edges = 0;
    for (int y = 0; y < g.height; ++y) {
        for (int x = 0; x < g.width; ++x) {
            if (g.isWall(x, y)) continue;
            if (g.isPassage(x + 1, y)) edges++;
            if (g.isPassage(x, y + 1)) edges++;
        }
    }
    return edges;
}

bool isFullyConnected(const MazeGrid& g) {
    const auto it = std::find(g.cells.begin(), g.cells.end(), CellType::Passage);
    if (it == g.cells.end()) return true;

    const int first = static_cast<int>(it - g.cells.begin());
    std::vector<uint8_t> seen(g.cells.size(), 0);
    std::deque<Vec2i> q;
    q.push_back({first % g.width, first / g.width});
    seen[static_cast<size_t>(first)] = 1;
    int reached = 1;

    while (!q.empty()) {
        const Vec2i p = q.front();
        q.pop_front();
        for (const auto& dv : DIRS4) {
            const int nx = p.x + dv[0];
            const int ny = p.y + dv[1];
            if (g.isWall(nx, ny)) continue;
            const size_t ii = static_cast<size_t>(ny * g.width + nx);
            if (seen[ii] != 0) continue;
            seen[ii] = 1;
            reached++;
            q.push_back({nx, ny});
        }
    }

    return reached == passageCount(g);
}

std::vector<Vec2i> passagePositions(const MazeGrid& g) {
    std::vector<Vec2i> out;
    out.reserve(static_cast<size_t>(passageCount(g)));
    for (int y = 0; y < g.height; ++y) {
        for (int x = 0; x < g.width; ++x) {
            if (g.isPassage(x, y)) out.push_back({x, y});
        }
    }
    return out;
}
