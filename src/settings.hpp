#pragma once

#include <string>

// Simple user-editable settings file (INI-ish: key = value).
// The file is created next to the progress file on first run.
struct Settings {
    // Mazes larger than this are shrunk before generation. Endpoint selection
    // runs one BFS per border cell, so very large mazes get slow.
    int maxMazeSize = 60; // 5..200

    // Algorithm key to use for every level instead of the tier's pool.
    // Empty means "follow the difficulty table".
    std::string forceAlgorithm;

    // -1 = use the tier's braid percentage, otherwise 0..100.
    int braidOverride = -1;

    // Default progress slot.
    // - Empty means "default" (mazerunner_progress.dat)
    // - Non-empty means mazerunner_progress_<slot>.dat
    // This is overridden by the CLI flag: --slot <name>
    std::string defaultSlot;

    // Print the generated maze as text after each generation.
    bool printMaze = true;
};

// Loads settings from disk. If the file is missing or invalid, defaults are used.
// Lines that cannot be understood are reported through `warnings` (optional).
Settings loadSettings(const std::string& path, std::string* warnings = nullptr);

// Update (or append) a single key=value entry in the settings file.
// Returns false if the file could not be read/written.
bool updateIniKey(const std::string& path, const std::string& key, const std::string& value);

// Writes a commented default settings file. Returns true on success.
bool writeDefaultSettings(const std::string& path);
