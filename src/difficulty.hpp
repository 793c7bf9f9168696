#pragma once

#include "maze_algorithms.hpp"

#include <string>
#include <vector>

// Level -> maze parameters.
//
// Levels are grouped into named tiers. Inside a tier the maze size and braid
// percentage are interpolated linearly from the first to the last level; the
// algorithm rotates through the tier's pool by level number.

struct DifficultyTier {
    const char* name = "";
    int firstLevel = 1;
    int lastLevel = 1;        // -1 = open-ended
    std::vector<MazeAlgorithm> algorithms;
    int minSize = 15;
    int maxSize = 15;
    int minBraid = 0;
    int maxBraid = 0;
    const char* description = "";

    bool contains(int level) const {
        return level >= firstLevel && (lastLevel < 0 || level <= lastLevel);
    }
};

struct Difficulty {
    std::string tierName;
    int mazeSize = 15;
    int braidPercent = 0;
    MazeAlgorithm algorithm = DEFAULT_MAZE_ALGORITHM;
    int level = 1;
};

const std::vector<DifficultyTier>& difficultyTiers();

// Levels below 1 are treated as level 1.
const DifficultyTier& tierForLevel(int level);
Difficulty difficultyForLevel(int level);
