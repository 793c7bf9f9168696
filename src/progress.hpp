#pragma once

#include "difficulty.hpp"

#include <cstdint>
#include <string>

// Run progress that survives between sessions.
//
// Only metadata is stored: the maze for a level is always regenerated from the
// level number on resume. The file is a small versioned key = value text file.

struct ProgressState {
    int currentLevel = 1;
    uint32_t score = 0;
    uint32_t highScore = 0;
    int levelsCompleted = 0;
    uint32_t lastCompletionMs = 0;

    // Difficulty of the most recently generated level (informational).
    Difficulty lastDifficulty;

    // Local time of the last save, "YYYY-MM-DD HH:MM:SS". Filled in by saveProgress.
    std::string savedAt;
};

struct ScoreBreakdown {
    uint32_t total = 0;
    uint32_t base = 0;
    uint32_t timeBonus = 0;
    uint32_t moveBonus = 0;
};

// base = 100 * level; bonuses reward beating ~1s per cell and ~1.5*size moves.
ScoreBreakdown computeLevelScore(int level, uint32_t completionMs, int moves, int mazeSize);

// Adds the level's score, bumps the high score if needed and advances to the next level.
void recordLevelCompletion(ProgressState& st, const ScoreBreakdown& score, uint32_t completionMs);

// Keeps the high score, everything else goes back to a fresh run.
void resetProgress(ProgressState& st);

// Returns false if the file is missing (err left empty), unreadable, from a
// different format version, or malformed (err describes the problem).
bool loadProgress(const std::string& path, ProgressState& out, std::string* err = nullptr);

// Level a run starts from. An explicit level (> 0) wins, otherwise the saved
// current level, otherwise level 1. With `resume` set, the saved progress must
// exist (`saved` non-null); if it does not, returns false with `err` set.
bool resolveStartLevel(int explicitLevel, bool resume, const ProgressState* saved, int& level,
                       std::string* err = nullptr);

// Atomic write (temp file + rename).
bool saveProgress(const std::string& path, ProgressState& st, std::string* err = nullptr);
