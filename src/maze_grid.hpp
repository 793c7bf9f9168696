#pragma once
#include "common.hpp"
#include <cstdint>
#include <vector>

enum class CellType : uint8_t {
    Wall = 0,
    Passage,
};

// Rectangular wall/passage map. Cells are stored row-major (y * width + x).
// A grid is created fully walled and never resized afterwards.
class MazeGrid {
public:
    int width = 0;
    int height = 0;
    std::vector<CellType> cells;

    MazeGrid() = default;
    MazeGrid(int w, int h);

    bool inBounds(int x, int y) const {
        return x >= 0 && y >= 0 && x < width && y < height;
    }

    CellType& at(int x, int y) { return cells[static_cast<size_t>(y * width + x)]; }
    const CellType& at(int x, int y) const { return cells[static_cast<size_t>(y * width + x)]; }

    // Out-of-bounds coordinates read as wall.
    bool isWall(int x, int y) const {
        return !inBounds(x, y) || at(x, y) == CellType::Wall;
    }
    bool isPassage(int x, int y) const { return !isWall(x, y); }

    void carve(int x, int y) { at(x, y) = CellType::Passage; }
    void fill(CellType t);
};

// 4-way neighbour offsets in N, E, S, W order.
extern const int DIRS4[4][2];

// Number of orthogonal passage neighbours of (x,y).
int passageDegree(const MazeGrid& g, int x, int y);

// A passage with exactly one passage neighbour.
bool isDeadEnd(const MazeGrid& g, int x, int y);

// Dead ends in row-major scan order.
std::vector<Vec2i> findDeadEnds(const MazeGrid& g);

int passageCount(const MazeGrid& g);

// Number of orthogonally adjacent passage pairs (undirected edges).
int passageEdgeCount(const MazeGrid& g);

// True if a flood fill from any passage reaches every passage.
// A grid without passages counts as connected.
bool isFullyConnected(const MazeGrid& g);

// Every passage cell, row-major.
std::vector<Vec2i> passagePositions(const MazeGrid& g);
