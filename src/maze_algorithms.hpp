#pragma once

#include "maze_grid.hpp"
#include "rng.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Perfect-maze carving algorithms.
//
// Every algorithm carves onto the same lattice: rooms sit on odd tile
// coordinates (2*cx+1, 2*cy+1) and two rooms are linked by opening the tile
// between them. Even/even tiles always stay wall, so a finished maze has a
// passage graph that is a spanning tree (edges == passages - 1).
//
// Grids whose lattice holds fewer than two rooms (width or height below 3,
// or exactly 3x3) are degenerate: the builder opens every tile instead and
// records a warning.

enum class MazeAlgorithm : uint8_t {
    BinaryTree = 0,
    Sidewinder,
    Eller,
    Icey,
    DividedDivision,
    Prim,
    Kruskal,
    HuntAndKill,
    Wilson,
    GrowingTree,
    GrowingTreeMixed,
};

constexpr MazeAlgorithm DEFAULT_MAZE_ALGORITHM = MazeAlgorithm::DividedDivision;

struct MazeAlgorithmInfo {
    MazeAlgorithm algorithm = MazeAlgorithm::BinaryTree;
    const char* key = "";   // canonical key used by difficulty tables and settings
    const char* alias = ""; // spelled-out alternative ("binary-tree")
    const char* name = "";  // human readable
};

// All algorithms, in enum order.
const std::vector<MazeAlgorithmInfo>& mazeAlgorithms();

const MazeAlgorithmInfo& mazeAlgorithmInfo(MazeAlgorithm a);
const char* mazeAlgorithmKey(MazeAlgorithm a);

// Case-insensitive; '-', '_' and spaces are ignored ("Hunt-And-Kill" == "huntandkill").
std::optional<MazeAlgorithm> parseMazeAlgorithm(const std::string& key);

// Like parseMazeAlgorithm, but unknown keys fall back to DEFAULT_MAZE_ALGORITHM
// and append a warning.
MazeAlgorithm resolveMazeAlgorithm(const std::string& key, std::string* warnings = nullptr);

bool isDegenerateMazeSize(int width, int height);

// Resets the grid to walls and carves a perfect maze with the given algorithm.
void carvePerfectMaze(MazeGrid& g, MazeAlgorithm algo, RNG& rng, std::string* warnings = nullptr);
