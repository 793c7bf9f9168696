#include "level.hpp"

#include "common.hpp"

#include <algorithm>
#include <exception>

uint32_t LevelSession::elapsedMs() const {
    const auto dt = std::chrono::steady_clock::now() - startedAt_;
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(dt).count();
    return static_cast<uint32_t>(std::max<long long>(0, static_cast<long long>(ms)));
}

bool LevelSession::complete(uint32_t elapsedMs) {
    if (completed_) return false;
    completed_ = true;
    completionTimeMs_ = elapsedMs;
    return true;
}

LevelMetadata LevelSession::metadata() const {
    LevelMetadata m;
    m.levelNumber = levelNumber_;
    m.difficulty = difficulty_;
    m.completed = completed_;
    m.completionTimeMs = completionTimeMs_;
    m.mazeSize = maze_.dimensions();
    return m;
}

bool capMazeRequest(MazeRequest& req, int maxSize, std::string* warnings) {
    const int cap = std::max(5, maxSize);
    if (req.width <= cap && req.height <= cap) return false;

    const int w = std::min(req.width, cap);
    const int h = std::min(req.height, cap);
    appendWarning(warnings, "maze size " + std::to_string(req.width) + "x" + std::to_string(req.height) +
                            " capped to " + std::to_string(w) + "x" + std::to_string(h) +
                            " (max_maze_size = " + std::to_string(cap) + ")");
    req.width = w;
    req.height = h;
    return true;
}

MazeRequest makeMazeRequest(const Difficulty& d, const Settings& settings, std::string* warnings) {
    MazeRequest req;
    req.width = d.mazeSize;
    req.height = d.mazeSize;

    // Level sizes are capped quietly.
    capMazeRequest(req, settings.maxMazeSize);

    req.algorithm = d.algorithm;
    if (!settings.forceAlgorithm.empty()) {
        req.algorithm = resolveMazeAlgorithm(settings.forceAlgorithm, warnings);
    }

    req.braidPercent = (settings.braidOverride >= 0) ? std::min(settings.braidOverride, 100) : d.braidPercent;
    return req;
}

bool buildLevel(int level, uint32_t seed, const Settings& settings, LevelSession& out,
                std::string* err, const MazeFactory& factory) {
    if (err) err->clear();
    level = std::max(1, level);

    LevelSession s;
    s.levelNumber_ = level;
    s.difficulty_ = difficultyForLevel(level);
    s.seed_ = seed;

    std::string warnings;
    s.request_ = makeMazeRequest(s.difficulty_, settings, &warnings);

    try {
        if (factory) s.maze_ = factory(s.request_, seed, &s.report_);
        else s.maze_ = Maze::generate(s.request_, seed, &s.report_);
    } catch (const std::exception& e) {
        if (err) *err = "failed to generate level " + std::to_string(level) + ": " + e.what();
        return false;
    }

    s.report_.warnings = warnings + s.report_.warnings;
    s.startedAt_ = std::chrono::steady_clock::now();
    out = std::move(s);
    return true;
}

int buildLevelOrRestart(int level, uint32_t seed, const Settings& settings, LevelSession& out,
                        std::string* err, const MazeFactory& factory) {
    std::string firstErr;
    if (buildLevel(level, seed, settings, out, &firstErr, factory)) {
        if (err) err->clear();
        return std::max(1, level);
    }

    std::string retryErr;
    if (level > 1 && buildLevel(1, seed, settings, out, &retryErr, factory)) {
        if (err) *err = firstErr + "; restarted at level 1";
        return 1;
    }

    if (err) *err = retryErr.empty() ? firstErr : firstErr + "; " + retryErr;
    return 0;
}
