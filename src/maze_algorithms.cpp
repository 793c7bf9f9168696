#include "maze_algorithms.hpp"

#include <algorithm>
#include <cstddef>
#include <numeric>
#include <utility>

namespace {

// Room lattice over a MazeGrid. Room (cx,cy) lives at tile (2*cx+1, 2*cy+1).
struct Lattice {
    MazeGrid& g;
    int w = 0;
    int h = 0;

    explicit Lattice(MazeGrid& grid)
        : g(grid), w((grid.width - 1) / 2), h((grid.height - 1) / 2) {}

    int count() const { return w * h; }
    int index(int cx, int cy) const { return cy * w + cx; }
    int cxOf(int i) const { return i % w; }
    int cyOf(int i) const { return i / w; }

    void open(int i) { g.carve(2 * cxOf(i) + 1, 2 * cyOf(i) + 1); }

    // Opens both rooms and the connector tile between them (they must be adjacent).
    void link(int a, int b) {
        open(a);
        open(b);
        g.carve(cxOf(a) + cxOf(b) + 1, cyOf(a) + cyOf(b) + 1);
    }

    void unlink(int a, int b) {
        g.at(cxOf(a) + cxOf(b) + 1, cyOf(a) + cyOf(b) + 1) = CellType::Wall;
    }

    // Fills `out` with adjacent room indices; returns how many.
    int neighbors(int i, int out[4]) const {
        int n = 0;
        const int cx = cxOf(i);
        const int cy = cyOf(i);
        for (const auto& dv : DIRS4) {
            const int nx = cx + dv[0];
            const int ny = cy + dv[1];
            if (nx < 0 || ny < 0 || nx >= w || ny >= h) continue;
            out[n++] = index(nx, ny);
        }
        return n;
    }
};

using CarveFn = void (*)(Lattice&, RNG&);

// Neighbours of i whose visited flag equals `want`.
int filteredNeighbors(const Lattice& L, int i, const std::vector<uint8_t>& visited, uint8_t want, int out[4]) {
    int all[4];
    const int n = L.neighbors(i, all);
    int k = 0;
    for (int j = 0; j < n; ++j) {
        if (visited[static_cast<size_t>(all[j])] == want) out[k++] = all[j];
    }
    return k;
}

void carveBinaryTree(Lattice& L, RNG& rng) {
    for (int cy = 0; cy < L.h; ++cy) {
        for (int cx = 0; cx < L.w; ++cx) {
            const int i = L.index(cx, cy);
            L.open(i);
            const bool canNorth = cy > 0;
            const bool canWest = cx > 0;
            if (canNorth && canWest) {
                if (rng.range(0, 1) == 0) L.link(i, L.index(cx, cy - 1));
                else L.link(i, L.index(cx - 1, cy));
            } else if (canNorth) {
                L.link(i, L.index(cx, cy - 1));
            } else if (canWest) {
                L.link(i, L.index(cx - 1, cy));
            }
        }
    }
}

void carveSidewinder(Lattice& L, RNG& rng) {
    std::vector<int> run;
    run.reserve(static_cast<size_t>(L.w));

    for (int cy = 0; cy < L.h; ++cy) {
        run.clear();
        for (int cx = 0; cx < L.w; ++cx) {
            const int i = L.index(cx, cy);
            L.open(i);
            run.push_back(i);

            const bool atEast = (cx == L.w - 1);
            const bool atNorth = (cy == 0);
            const bool closeRun = atEast || (!atNorth && rng.range(0, 1) == 0);

            if (closeRun) {
                if (!atNorth) {
                    const int member = run[rng.pick(run.size())];
                    L.link(member, L.index(L.cxOf(member), cy - 1));
                }
                run.clear();
            } else {
                L.link(i, L.index(cx + 1, cy));
            }
        }
    }
}

void carveEller(Lattice& L, RNG& rng) {
    std::vector<int> rowSet(static_cast<size_t>(L.w), 0);
    int nextSet = 1;

    for (int cy = 0; cy < L.h; ++cy) {
        const bool lastRow = (cy == L.h - 1);

        for (int cx = 0; cx < L.w; ++cx) {
            if (rowSet[static_cast<size_t>(cx)] == 0) rowSet[static_cast<size_t>(cx)] = nextSet++;
            L.open(L.index(cx, cy));
        }

        // Join horizontally adjacent rooms from different sets.
        for (int cx = 0; cx + 1 < L.w; ++cx) {
            const int a = rowSet[static_cast<size_t>(cx)];
            const int b = rowSet[static_cast<size_t>(cx + 1)];
            if (a == b) continue;
            if (!lastRow && rng.range(0, 1) != 0) continue;

            L.link(L.index(cx, cy), L.index(cx + 1, cy));
            for (int& s : rowSet) {
                if (s == b) s = a;
            }
        }

        if (lastRow) break;

        // Every set sends at least one room down into the next row.
        std::vector<std::pair<int, int>> bySet; // (set, cx)
        bySet.reserve(static_cast<size_t>(L.w));
        for (int cx = 0; cx < L.w; ++cx) bySet.push_back({rowSet[static_cast<size_t>(cx)], cx});
        std::stable_sort(bySet.begin(), bySet.end(),
            [](const auto& p, const auto& q) { return p.first < q.first; });

        std::vector<int> nextRow(static_cast<size_t>(L.w), 0);
        size_t begin = 0;
        while (begin < bySet.size()) {
            size_t end = begin;
            while (end < bySet.size() && bySet[end].first == bySet[begin].first) ++end;

            std::vector<int> members;
            for (size_t k = begin; k < end; ++k) members.push_back(bySet[k].second);
            shuffleInPlace(members, rng);

            const int downCount = rng.range(1, static_cast<int>(members.size()));
            for (int k = 0; k < downCount; ++k) {
                const int cx = members[static_cast<size_t>(k)];
                L.link(L.index(cx, cy), L.index(cx, cy + 1));
                nextRow[static_cast<size_t>(cx)] = bySet[begin].first;
            }
            begin = end;
        }
        rowSet.swap(nextRow);
    }
}

// Random walk that, when boxed in, resumes from a random visited room that still
// has unvisited neighbours.
void carveIcey(Lattice& L, RNG& rng) {
    const int n = L.count();
    std::vector<uint8_t> visited(static_cast<size_t>(n), 0);
    std::vector<int> resumable;
    resumable.reserve(static_cast<size_t>(n));

    int cur = rng.range(0, n - 1);
    L.open(cur);
    visited[static_cast<size_t>(cur)] = 1;
    resumable.push_back(cur);

    int nb[4];
    while (!resumable.empty()) {
        const int k = filteredNeighbors(L, cur, visited, 0, nb);
        if (k > 0) {
            const int nxt = nb[rng.range(0, k - 1)];
            L.link(cur, nxt);
            visited[static_cast<size_t>(nxt)] = 1;
            resumable.push_back(nxt);
            cur = nxt;
            continue;
        }

        const size_t pickI = rng.pick(resumable.size());
        const int cand = resumable[pickI];
        if (filteredNeighbors(L, cand, visited, 0, nb) == 0) {
            resumable[pickI] = resumable.back();
            resumable.pop_back();
        } else {
            cur = cand;
        }
    }
}

// Recursive division: start fully open and split regions with single-gap walls.
void carveDividedDivision(Lattice& L, RNG& rng) {
    for (int cy = 0; cy < L.h; ++cy) {
        for (int cx = 0; cx < L.w; ++cx) {
            const int i = L.index(cx, cy);
            L.open(i);
            if (cx > 0) L.link(i, L.index(cx - 1, cy));
            if (cy > 0) L.link(i, L.index(cx, cy - 1));
        }
    }

    struct Region {
        int x, y, w, h;
    };

    std::vector<Region> stack;
    stack.push_back({0, 0, L.w, L.h});

    while (!stack.empty()) {
        const Region r = stack.back();
        stack.pop_back();

        // A single row or column is already a simple path.
        if (r.w < 2 || r.h < 2) continue;

        bool horizontal;
        if (r.w < r.h) horizontal = true;
        else if (r.h < r.w) horizontal = false;
        else horizontal = (rng.range(0, 1) == 0);

        if (horizontal) {
            const int row = rng.range(r.y, r.y + r.h - 2);
            const int gap = rng.range(r.x, r.x + r.w - 1);
            for (int x = r.x; x < r.x + r.w; ++x) {
                if (x == gap) continue;
                L.unlink(L.index(x, row), L.index(x, row + 1));
            }
            stack.push_back({r.x, r.y, r.w, row - r.y + 1});
            stack.push_back({r.x, row + 1, r.w, r.y + r.h - row - 1});
        } else {
            const int col = rng.range(r.x, r.x + r.w - 2);
            const int gap = rng.range(r.y, r.y + r.h - 1);
            for (int y = r.y; y < r.y + r.h; ++y) {
                if (y == gap) continue;
                L.unlink(L.index(col, y), L.index(col + 1, y));
            }
            stack.push_back({r.x, r.y, col - r.x + 1, r.h});
            stack.push_back({col + 1, r.y, r.x + r.w - col - 1, r.h});
        }
    }
}

void carvePrim(Lattice& L, RNG& rng) {
    const int n = L.count();
    // 0 = outside, 1 = frontier, 2 = in maze
    std::vector<uint8_t> state(static_cast<size_t>(n), 0);
    std::vector<int> frontier;

    auto addFrontier = [&](int i) {
        int nb[4];
        const int k = L.neighbors(i, nb);
        for (int j = 0; j < k; ++j) {
            uint8_t& s = state[static_cast<size_t>(nb[j])];
            if (s != 0) continue;
            s = 1;
            frontier.push_back(nb[j]);
        }
    };

    const int start = rng.range(0, n - 1);
    L.open(start);
    state[static_cast<size_t>(start)] = 2;
    addFrontier(start);

    int in[4];
    while (!frontier.empty()) {
        const size_t fi = rng.pick(frontier.size());
        const int cell = frontier[fi];
        frontier[fi] = frontier.back();
        frontier.pop_back();

        const int k = filteredNeighbors(L, cell, state, 2, in);
        L.link(cell, in[rng.range(0, k - 1)]);
        state[static_cast<size_t>(cell)] = 2;
        addFrontier(cell);
    }
}

void carveKruskal(Lattice& L, RNG& rng) {
    const int n = L.count();
    std::vector<int> parent(static_cast<size_t>(n));
    std::iota(parent.begin(), parent.end(), 0);

    auto find = [&](int i) {
        while (parent[static_cast<size_t>(i)] != i) {
            parent[static_cast<size_t>(i)] = parent[static_cast<size_t>(parent[static_cast<size_t>(i)])];
            i = parent[static_cast<size_t>(i)];
        }
        return i;
    };

    std::vector<std::pair<int, int>> edges;
    edges.reserve(static_cast<size_t>(n) * 2);
    for (int cy = 0; cy < L.h; ++cy) {
        for (int cx = 0; cx < L.w; ++cx) {
            const int i = L.index(cx, cy);
            L.open(i);
            if (cx + 1 < L.w) edges.push_back({i, L.index(cx + 1, cy)});
            if (cy + 1 < L.h) edges.push_back({i, L.index(cx, cy + 1)});
        }
    }

    shuffleInPlace(edges, rng);

    for (const auto& e : edges) {
        const int ra = find(e.first);
        const int rb = find(e.second);
        if (ra == rb) continue;
        parent[static_cast<size_t>(rb)] = ra;
        L.link(e.first, e.second);
    }
}

void carveHuntAndKill(Lattice& L, RNG& rng) {
    const int n = L.count();
    std::vector<uint8_t> visited(static_cast<size_t>(n), 0);

    int cur = rng.range(0, n - 1);
    L.open(cur);
    visited[static_cast<size_t>(cur)] = 1;

    // Rows above huntRow are known to be fully visited.
    int huntRow = 0;
    int nb[4];

    while (true) {
        const int k = filteredNeighbors(L, cur, visited, 0, nb);
        if (k > 0) {
            const int nxt = nb[rng.range(0, k - 1)];
            L.link(cur, nxt);
            visited[static_cast<size_t>(nxt)] = 1;
            cur = nxt;
            continue;
        }

        bool found = false;
        for (int cy = huntRow; cy < L.h && !found; ++cy) {
            bool rowComplete = true;
            for (int cx = 0; cx < L.w; ++cx) {
                const int i = L.index(cx, cy);
                if (visited[static_cast<size_t>(i)] != 0) continue;
                rowComplete = false;

                const int kv = filteredNeighbors(L, i, visited, 1, nb);
                if (kv == 0) continue;

                L.link(i, nb[rng.range(0, kv - 1)]);
                visited[static_cast<size_t>(i)] = 1;
                cur = i;
                found = true;
                break;
            }
            if (rowComplete && cy == huntRow) huntRow++;
        }

        if (!found) break;
    }
}

// Loop-erased random walks (uniform spanning tree).
void carveWilson(Lattice& L, RNG& rng) {
    const int n = L.count();
    std::vector<uint8_t> inTree(static_cast<size_t>(n), 0);
    std::vector<int> walkNext(static_cast<size_t>(n), -1);

    const int root = rng.range(0, n - 1);
    L.open(root);
    inTree[static_cast<size_t>(root)] = 1;

    std::vector<int> order(static_cast<size_t>(n));
    std::iota(order.begin(), order.end(), 0);
    shuffleInPlace(order, rng);

    int nb[4];
    for (int start : order) {
        if (inTree[static_cast<size_t>(start)] != 0) continue;

        // Overwriting walkNext erases loops as the walk revisits rooms.
        int cur = start;
        while (inTree[static_cast<size_t>(cur)] == 0) {
            const int k = L.neighbors(cur, nb);
            const int nxt = nb[rng.range(0, k - 1)];
            walkNext[static_cast<size_t>(cur)] = nxt;
            cur = nxt;
        }

        cur = start;
        while (inTree[static_cast<size_t>(cur)] == 0) {
            const int nxt = walkNext[static_cast<size_t>(cur)];
            L.link(cur, nxt);
            inTree[static_cast<size_t>(cur)] = 1;
            cur = nxt;
        }
    }
}

// randomPick = 0 always grows from the newest room (recursive backtracker).
void growTree(Lattice& L, RNG& rng, float randomPick) {
    const int n = L.count();
    std::vector<uint8_t> visited(static_cast<size_t>(n), 0);
    std::vector<int> active;
    active.reserve(static_cast<size_t>(n));

    const int start = rng.range(0, n - 1);
    L.open(start);
    visited[static_cast<size_t>(start)] = 1;
    active.push_back(start);

    int nb[4];
    while (!active.empty()) {
        size_t ai = active.size() - 1;
        if (randomPick > 0.0f && rng.chance(randomPick)) ai = rng.pick(active.size());

        const int cur = active[ai];
        const int k = filteredNeighbors(L, cur, visited, 0, nb);
        if (k == 0) {
            active.erase(active.begin() + static_cast<std::ptrdiff_t>(ai));
            continue;
        }

        const int nxt = nb[rng.range(0, k - 1)];
        L.link(cur, nxt);
        visited[static_cast<size_t>(nxt)] = 1;
        active.push_back(nxt);
    }
}

void carveGrowingTree(Lattice& L, RNG& rng) {
    growTree(L, rng, 0.0f);
}

void carveGrowingTreeMixed(Lattice& L, RNG& rng) {
    growTree(L, rng, 0.5f);
}

struct AlgorithmEntry {
    MazeAlgorithmInfo info;
    CarveFn carve;
};

const std::vector<AlgorithmEntry>& entries() {
    static const std::vector<AlgorithmEntry> table = {
        {{MazeAlgorithm::BinaryTree,       "binary",            "binary-tree",        "Binary Tree"},        carveBinaryTree},
        {{MazeAlgorithm::Sidewinder,       "sidewinder",        "",                   "Sidewinder"},         carveSidewinder},
        {{MazeAlgorithm::Eller,            "eller",             "",                   "Eller"},              carveEller},
        {{MazeAlgorithm::Icey,             "icey",              "",                   "Icey"},               carveIcey},
        {{MazeAlgorithm::DividedDivision,  "divided",           "divided-division",   "Divided Division"},   carveDividedDivision},
        {{MazeAlgorithm::Prim,             "prim",              "",                   "Prim"},               carvePrim},
        {{MazeAlgorithm::Kruskal,          "kruskal",           "",                   "Kruskal"},            carveKruskal},
        {{MazeAlgorithm::HuntAndKill,      "huntandkill",       "hunt-and-kill",      "Hunt and Kill"},      carveHuntAndKill},
        {{MazeAlgorithm::Wilson,           "wilson",            "",                   "Wilson"},             carveWilson},
        {{MazeAlgorithm::GrowingTree,      "growingtree",       "growing-tree",       "Growing Tree"},       carveGrowingTree},
        {{MazeAlgorithm::GrowingTreeMixed, "growingtree_mixed", "growing-tree-mixed", "Growing Tree (mixed)"}, carveGrowingTreeMixed},
    };
    return table;
}

const AlgorithmEntry& entryFor(MazeAlgorithm a) {
    const auto& t = entries();
    const size_t i = static_cast<size_t>(a);
    if (i < t.size()) return t[i];
    return t[static_cast<size_t>(DEFAULT_MAZE_ALGORITHM)];
}

std::string normalizeKey(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : toLower(s)) {
        if (c == '-' || c == '_' || c == ' ' || c == '\t') continue;
        out.push_back(c);
    }
    return out;
}

} // namespace

const std::vector<MazeAlgorithmInfo>& mazeAlgorithms() {
    static const std::vector<MazeAlgorithmInfo> infos = [] {
        std::vector<MazeAlgorithmInfo> v;
        for (const auto& e : entries()) v.push_back(e.info);
        return v;
    }();
    return infos;
}

const MazeAlgorithmInfo& mazeAlgorithmInfo(MazeAlgorithm a) {
    return entryFor(a).info;
}

const char* mazeAlgorithmKey(MazeAlgorithm a) {
    return entryFor(a).info.key;
}

std::optional<MazeAlgorithm> parseMazeAlgorithm(const std::string& key) {
    const std::string k = normalizeKey(key);
    if (k.empty()) return std::nullopt;

    for (const auto& e : entries()) {
        if (k == normalizeKey(e.info.key)) return e.info.algorithm;
        if (e.info.alias[0] != '\0' && k == normalizeKey(e.info.alias)) return e.info.algorithm;
    }
    return std::nullopt;
}

MazeAlgorithm resolveMazeAlgorithm(const std::string& key, std::string* warnings) {
    if (auto a = parseMazeAlgorithm(key)) return *a;
    appendWarning(warnings, "unknown maze algorithm '" + key + "', using '" +
                            std::string(mazeAlgorithmKey(DEFAULT_MAZE_ALGORITHM)) + "'");
    return DEFAULT_MAZE_ALGORITHM;
}

bool isDegenerateMazeSize(int width, int height) {
    const int cellW = (width - 1) / 2;
    const int cellH = (height - 1) / 2;
    return cellW < 1 || cellH < 1 || cellW * cellH < 2;
}

void carvePerfectMaze(MazeGrid& g, MazeAlgorithm algo, RNG& rng, std::string* warnings) {
    g.fill(CellType::Wall);
    if (g.width <= 0 || g.height <= 0) return;

    if (isDegenerateMazeSize(g.width, g.height)) {
        appendWarning(warnings, "maze size " + std::to_string(g.width) + "x" + std::to_string(g.height) +
                                " is too small for " + mazeAlgorithmKey(algo) + "; using an open grid");
        g.fill(CellType::Passage);
        return;
    }

    Lattice lattice(g);
    entryFor(algo).carve(lattice, rng);
}
