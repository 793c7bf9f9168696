#pragma once

#include "difficulty.hpp"
#include "maze.hpp"
#include "settings.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

struct LevelMetadata {
    int levelNumber = 1;
    Difficulty difficulty;
    bool completed = false;
    uint32_t completionTimeMs = 0;
    MazeDimensions mazeSize;
};

// Builds a maze for a request. An empty factory means Maze::generate.
using MazeFactory = std::function<Maze(const MazeRequest& req, uint32_t seed, MazeReport* report)>;

// One playable level: its difficulty, the generated maze and completion state.
class LevelSession {
public:
    LevelSession() = default;

    int levelNumber() const { return levelNumber_; }
    const Difficulty& difficulty() const { return difficulty_; }
    const MazeRequest& request() const { return request_; }
    const Maze& maze() const { return maze_; }
    const MazeReport& report() const { return report_; }
    uint32_t seed() const { return seed_; }

    bool completed() const { return completed_; }
    uint32_t completionTimeMs() const { return completionTimeMs_; }

    // Milliseconds since the level was built.
    uint32_t elapsedMs() const;

    // Marks the level complete; only the first call counts (returns false afterwards).
    bool complete(uint32_t elapsedMs);

    LevelMetadata metadata() const;

private:
    friend bool buildLevel(int level, uint32_t seed, const Settings& settings, LevelSession& out,
                           std::string* err, const MazeFactory& factory);

    int levelNumber_ = 1;
    Difficulty difficulty_;
    MazeRequest request_;
    Maze maze_;
    MazeReport report_;
    uint32_t seed_ = 0;
    std::chrono::steady_clock::time_point startedAt_{};
    bool completed_ = false;
    uint32_t completionTimeMs_ = 0;
};

// Shrinks either side of `req` above `maxSize` (never below 5) down to it.
// Returns true if anything changed; a warning is appended when it does.
bool capMazeRequest(MazeRequest& req, int maxSize, std::string* warnings = nullptr);

// Difficulty table values with the user's settings applied: size cap, forced
// algorithm and braid override. Settings problems are reported as warnings.
MazeRequest makeMazeRequest(const Difficulty& d, const Settings& settings, std::string* warnings = nullptr);

// Generates the maze for `level`. Exceptions from generation are caught and
// reported through `err` (returns false; `out` is left untouched).
bool buildLevel(int level, uint32_t seed, const Settings& settings, LevelSession& out,
                std::string* err = nullptr, const MazeFactory& factory = MazeFactory());

// buildLevel, and if that fails, one more attempt at level 1 so the
// progression restarts from a known-good level. Returns the level number that
// was built, or 0 if both attempts failed.
int buildLevelOrRestart(int level, uint32_t seed, const Settings& settings, LevelSession& out,
                        std::string* err = nullptr, const MazeFactory& factory = MazeFactory());
