#include "difficulty.hpp"

#include <algorithm>
#include <cmath>

namespace {

int lerpFloor(int lo, int hi, double t) {
    return static_cast<int>(std::floor(static_cast<double>(lo) + static_cast<double>(hi - lo) * t));
}

} // namespace

const std::vector<DifficultyTier>& difficultyTiers() {
    using A = MazeAlgorithm;
    static const std::vector<DifficultyTier> tiers = {
        {"Learning", 1, 10,
         {A::BinaryTree, A::Sidewinder},
         15, 25, 0, 0,
         "Predictable patterns help players learn mechanics"},
        {"Skill Building", 11, 25,
         {A::Prim, A::Kruskal},
         25, 40, 0, 10,
         "True branching without bias and multiple short paths"},
        {"Challenge", 26, 50,
         {A::HuntAndKill, A::GrowingTree},
         40, 60, 10, 25,
         "Balanced corridors and branches with harder navigation"},
        {"Expert", 51, 100,
         {A::Wilson, A::GrowingTreeMixed},
         60, 80, 25, 50,
         "Complex decision trees where loops make tracking difficult"},
        {"Master", 101, -1,
         {A::Prim, A::Kruskal, A::HuntAndKill, A::Wilson, A::GrowingTree},
         80, 100, 50, 100,
         "Maximum variety prevents pattern recognition"},
    };
    return tiers;
}

const DifficultyTier& tierForLevel(int level) {
    level = std::max(1, level);
    const auto& tiers = difficultyTiers();
    for (const auto& t : tiers) {
        if (t.contains(level)) return t;
    }
    return tiers.back();
}

Difficulty difficultyForLevel(int level) {
    level = std::max(1, level);
    const DifficultyTier& tier = tierForLevel(level);

    // The open-ended tier stays at its starting values.
    double progress = 0.0;
    if (tier.lastLevel > tier.firstLevel) {
        progress = static_cast<double>(level - tier.firstLevel) /
                   static_cast<double>(tier.lastLevel - tier.firstLevel);
    }

    Difficulty d;
    d.tierName = tier.name;
    d.level = level;
    d.mazeSize = lerpFloor(tier.minSize, tier.maxSize, progress);
    d.braidPercent = lerpFloor(tier.minBraid, tier.maxBraid, progress);
    d.algorithm = tier.algorithms[static_cast<size_t>(level) % tier.algorithms.size()];
    return d;
}
