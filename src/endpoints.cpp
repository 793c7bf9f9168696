#include "endpoints.hpp"

#include <algorithm>
#include <deque>

std::vector<int> bfsDistanceMap(const MazeGrid& g, Vec2i from) {
    std::vector<int> dist(g.cells.size(), -1);
    auto idx = [&](int x, int y) { return static_cast<size_t>(y * g.width + x); };

    if (g.isWall(from.x, from.y)) return dist;
    dist[idx(from.x, from.y)] = 0;

    std::deque<Vec2i> q;
    q.push_back(from);

    while (!q.empty()) {
        const Vec2i p = q.front();
        q.pop_front();
        const int cd = dist[idx(p.x, p.y)];

        for (const auto& dv : DIRS4) {
            const int nx = p.x + dv[0];
            const int ny = p.y + dv[1];
            if (g.isWall(nx, ny)) continue;
            int& nd = dist[idx(nx, ny)];
            if (nd != -1) continue;
            nd = cd + 1;
            q.push_back({nx, ny});
        }
    }

    return dist;
}

bool isBorderCell(const MazeGrid& g, int x, int y) {
    if (g.isWall(x, y)) return false;
    return x <= 1 || y <= 1 || x >= g.width - 2 || y >= g.height - 2;
}

std::vector<Vec2i> collectBorderCells(const MazeGrid& g) {
    std::vector<Vec2i> out;
    for (int y = 0; y < g.height; ++y) {
        for (int x = 0; x < g.width; ++x) {
            if (isBorderCell(g, x, y)) out.push_back({x, y});
        }
    }
    return out;
}

EndpointSelection selectEndpoints(const MazeGrid& g) {
    EndpointSelection sel;

    const std::vector<Vec2i> border = collectBorderCells(g);
    sel.borderCells = static_cast<int>(border.size());

    if (border.size() < 2) {
        const int maxX = std::max(0, g.width - 1);
        const int maxY = std::max(0, g.height - 1);
        sel.start = {clampi(1, 0, maxX), clampi(1, 0, maxY)};
        sel.exit = {clampi(g.width - 2, 0, maxX), clampi(g.height - 2, 0, maxY)};
        sel.usedFallback = true;
        return sel;
    }

    int best = 0;
    size_t bestA = 0;
    size_t bestB = 1;

    for (size_t i = 0; i < border.size(); ++i) {
        const std::vector<int> dist = bfsDistanceMap(g, border[i]);
        for (size_t j = i + 1; j < border.size(); ++j) {
            const int d = dist[static_cast<size_t>(border[j].y * g.width + border[j].x)];
            if (d > best) {
                best = d;
                bestA = i;
                bestB = j;
            }
        }
    }

    const Vec2i a = border[bestA];
    const Vec2i b = border[bestB];
    if (a.x + a.y < b.x + b.y) {
        sel.start = a;
        sel.exit = b;
    } else {
        sel.start = b;
        sel.exit = a;
    }

    sel.distance = best;
    return sel;
}
