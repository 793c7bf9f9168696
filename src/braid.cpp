#include "braid.hpp"

#include <algorithm>
#include <vector>

BraidResult applyBraiding(MazeGrid& g, int percent, RNG& rng) {
    BraidResult out;
    if (g.width <= 0 || g.height <= 0) return out;

    const std::vector<Vec2i> deadEnds = findDeadEnds(g);
    out.deadEndsBefore = static_cast<int>(deadEnds.size());

    if (percent <= 0) {
        out.deadEndsAfter = out.deadEndsBefore;
        return out;
    }
    percent = std::min(percent, 100);

    // Pick targets against the unbraided grid.
    std::vector<Vec2i> targets;
    targets.reserve(deadEnds.size());

    std::vector<Vec2i> walls;
    walls.reserve(4);

    for (const Vec2i& p : deadEnds) {
        // One roll in [0,100) and one pick per dead end, always drawn.
        const int roll = rng.range(0, 99);
        const uint32_t pick = rng.nextU32();
        if (roll >= percent) continue;
        out.attempts++;

        walls.clear();
        for (const auto& dv : DIRS4) {
            const int nx = p.x + dv[0];
            const int ny = p.y + dv[1];
            if (!g.inBounds(nx, ny)) continue;
            if (g.at(nx, ny) != CellType::Wall) continue;
            walls.push_back({nx, ny});
        }
        if (walls.empty()) continue;

        targets.push_back(walls[pick % walls.size()]);
    }

    // Two dead ends can share a wall; it is only opened once.
    for (const Vec2i& t : targets) {
        if (g.at(t.x, t.y) != CellType::Wall) continue;
        g.carve(t.x, t.y);
        out.cellsCarved++;
    }

    out.deadEndsAfter = static_cast<int>(findDeadEnds(g).size());
    return out;
}
