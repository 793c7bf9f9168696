#pragma once

#include "maze_grid.hpp"
#include "rng.hpp"

// Dead-end braiding pass
//
// Turns a perfect maze into a partially looped one: every dead end (a passage
// with exactly one passage neighbour) independently, with probability
// percent/100, opens one randomly chosen adjacent wall. The pass only ever
// adds passages, so connectivity is preserved.
//
// Dead ends and their candidate walls are taken from the grid as it was
// before the pass. Every dead end draws its roll and its wall pick whether or
// not the roll passes, so for one RNG state the cells opened at a lower
// percentage are a subset of those opened at a higher one.

struct BraidResult {
    int deadEndsBefore = 0;
    int deadEndsAfter = 0;
    int attempts = 0;     // dead ends whose roll passed
    int cellsCarved = 0;  // wall->passage conversions
};

// percent <= 0 leaves the grid untouched; values above 100 act as 100.
BraidResult applyBraiding(MazeGrid& g, int percent, RNG& rng);
