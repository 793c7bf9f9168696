#define SDL_MAIN_HANDLED
#include <SDL.h>

#include <algorithm>
#include <cstdint>
#include <ctime>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>

#include "level.hpp"
#include "maze.hpp"
#include "progress.hpp"
#include "rng.hpp"
#include "settings.hpp"
#include "slot_utils.hpp"
#include "version.hpp"

namespace {

struct CliOptions {
    std::optional<int> level;
    bool continueRun = false;
    std::optional<uint32_t> completeMs;
    int moves = 0;

    std::optional<int> width;
    std::optional<int> height;
    std::optional<std::string> algo;
    std::optional<int> braid;

    std::optional<uint32_t> seed;
    bool daily = false;

    std::optional<std::string> dataDir;
    std::optional<std::string> slot;
    bool portable = false;
    bool reset = false;
    bool resetSettings = false;
    bool quiet = false;

    bool listAlgorithms = false;
    bool version = false;
    bool help = false;

    bool customMaze() const { return width || height || algo || braid; }
};

void printUsage(const char* exe) {
    std::cout
        << MAZERUNNER_APPNAME << " " << MAZERUNNER_VERSION << "\n"
        << "Usage: " << (exe ? exe : "mazerunner") << " [options]\n\n"
        << "Progression:\n"
        << "  --level <n>          Generate level n (default: the saved current level)\n"
        << "  --continue           Resume from the saved progress file (fails if there is none)\n"
        << "  --complete <ms>      Mark the level complete after <ms>, score it and advance\n"
        << "  --moves <n>          Move count used for scoring (default: 0)\n"
        << "  --reset              Reset progress (the high score is kept)\n"
        << "\n"
        << "One-off maze (no progress is touched):\n"
        << "  --width <n>          Maze width in tiles\n"
        << "  --height <n>         Maze height in tiles\n"
        << "  --algo <key>         Carving algorithm (see --list-algorithms)\n"
        << "  --braid <pct>        Braid percentage 0..100\n"
        << "\n"
        << "Seeds and storage:\n"
        << "  --seed <n>           Generate with a specific seed\n"
        << "  --daily              Use the deterministic UTC-date seed\n"
        << "  --data-dir <path>    Override the progress/config directory\n"
        << "  --slot <name>        Use a named progress slot\n"
        << "  --portable           Store progress/config next to the executable\n"
        << "  --reset-settings     Overwrite settings with fresh defaults\n"
        << "  --quiet              Do not print the maze\n"
        << "\n"
        << "  --list-algorithms    Print the algorithm keys and exit\n"
        << "  --version, -v        Print version and exit\n"
        << "  --help, -h           Show this help and exit\n";
}

bool argValue(int& i, int argc, char** argv, std::string& out) {
    if (i + 1 >= argc) return false;
    out = argv[++i];
    return true;
}

bool parseU32(const std::string& s, uint32_t& out) {
    if (s.empty() || s[0] == '-') return false;
    try {
        size_t used = 0;
        const unsigned long long v = std::stoull(s, &used, 0);
        if (used != s.size() || v > 0xFFFFFFFFull) return false;
        out = static_cast<uint32_t>(v);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseInt(const std::string& s, int& out) {
    try {
        size_t used = 0;
        const int v = std::stoi(s, &used, 10);
        if (used != s.size()) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

// Returns false (after printing the problem) on a usage error.
bool parseArgs(int argc, char** argv, CliOptions& opt) {
    auto usageError = [](const std::string& msg) {
        std::cerr << "error: " << msg << " (see --help)\n";
        return false;
    };

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        std::string v;

        auto needValue = [&]() { return argValue(i, argc, argv, v); };
        auto needInt = [&](std::optional<int>& dst) {
            int n = 0;
            if (!needValue() || !parseInt(v, n)) return false;
            dst = n;
            return true;
        };
        auto needU32 = [&](std::optional<uint32_t>& dst) {
            uint32_t n = 0;
            if (!needValue() || !parseU32(v, n)) return false;
            dst = n;
            return true;
        };

        if (a == "--help" || a == "-h") {
            opt.help = true;
        } else if (a == "--version" || a == "-v") {
            opt.version = true;
        } else if (a == "--list-algorithms") {
            opt.listAlgorithms = true;
        } else if (a == "--level") {
            if (!needInt(opt.level) || *opt.level < 1) return usageError("--level expects a number >= 1");
        } else if (a == "--continue") {
            opt.continueRun = true;
        } else if (a == "--complete") {
            if (!needU32(opt.completeMs)) return usageError("--complete expects milliseconds");
        } else if (a == "--moves") {
            std::optional<int> m;
            if (!needInt(m) || *m < 0) return usageError("--moves expects a number >= 0");
            opt.moves = *m;
        } else if (a == "--width") {
            if (!needInt(opt.width)) return usageError("--width expects a number");
        } else if (a == "--height") {
            if (!needInt(opt.height)) return usageError("--height expects a number");
        } else if (a == "--algo") {
            if (!needValue()) return usageError("--algo expects an algorithm key");
            opt.algo = v;
        } else if (a == "--braid") {
            if (!needInt(opt.braid) || *opt.braid < 0 || *opt.braid > 100) {
                return usageError("--braid expects a percentage 0..100");
            }
        } else if (a == "--seed") {
            if (!needU32(opt.seed)) return usageError("--seed expects an unsigned 32-bit number");
        } else if (a == "--daily") {
            opt.daily = true;
        } else if (a == "--data-dir") {
            if (!needValue()) return usageError("--data-dir expects a path");
            opt.dataDir = v;
        } else if (a == "--slot") {
            if (!needValue()) return usageError("--slot expects a name");
            opt.slot = v;
        } else if (a == "--portable") {
            opt.portable = true;
        } else if (a == "--reset") {
            opt.reset = true;
        } else if (a == "--reset-settings") {
            opt.resetSettings = true;
        } else if (a == "--quiet") {
            opt.quiet = true;
        } else {
            return usageError("unknown option '" + a + "'");
        }
    }

    if (opt.customMaze() && (opt.level || opt.continueRun || opt.completeMs)) {
        return usageError("--width/--height/--algo/--braid cannot be combined with level options");
    }
    if (opt.continueRun && (opt.level || opt.reset)) {
        return usageError("--continue cannot be combined with --level or --reset");
    }
    if (opt.seed && opt.daily) {
        return usageError("--seed and --daily are mutually exclusive");
    }
    return true;
}

uint32_t dailySeedUtc(std::string* outDateIso) {
    const std::time_t t = std::time(nullptr);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif

    const int year = tm.tm_year + 1900;
    const int mon = tm.tm_mon + 1;
    const int day = tm.tm_mday;

    if (outDateIso) {
        std::ostringstream ss;
        ss << std::setfill('0') << std::setw(4) << year << "-" << std::setw(2) << mon << "-" << std::setw(2) << day;
        *outDateIso = ss.str();
    }

    // YYYYMMDD -> stable hash.
    const uint32_t ymd = static_cast<uint32_t>(year * 10000 + mon * 100 + day);
    return hash32(ymd ^ 0x3A2E5EEDu);
}

void printWarnings(const std::string& warnings) {
    if (!warnings.empty()) std::cerr << warnings;
}

void printMaze(const Maze& m) {
    const MazeDimensions d = m.dimensions();
    const Vec2i s = m.startPosition();
    const Vec2i e = m.exitPosition();

    std::string row;
    for (int y = 0; y < d.height; ++y) {
        row.clear();
        for (int x = 0; x < d.width; ++x) {
            if (x == s.x && y == s.y) row.push_back('S');
            else if (x == e.x && y == e.y) row.push_back('E');
            else row.push_back(m.isWall(x, y) ? '#' : '.');
        }
        std::cout << row << "\n";
    }
}

void printReport(const Maze& m, const MazeReport& r) {
    const MazeDimensions d = m.dimensions();
    std::cout << "maze " << d.width << "x" << d.height
              << "  algorithm=" << mazeAlgorithmInfo(m.algorithm()).name
              << "  braid=" << m.braidPercent() << "%"
              << "  seed=" << m.seed() << "\n";
    std::cout << "passages=" << r.passages << "  edges=" << r.edges
              << "  dead ends " << r.braid.deadEndsBefore << " -> " << r.braid.deadEndsAfter
              << "  start=(" << m.startPosition().x << "," << m.startPosition().y << ")"
              << "  exit=(" << m.exitPosition().x << "," << m.exitPosition().y << ")"
              << "  distance=" << r.endpointDistance << "\n";
}

std::filesystem::path resolveDataDir(const CliOptions& opt) {
    std::filesystem::path baseDir;
    if (opt.dataDir && !opt.dataDir->empty()) {
        baseDir = std::filesystem::path(*opt.dataDir);
    } else if (opt.portable) {
        if (char* p = SDL_GetBasePath()) {
            baseDir = std::filesystem::path(p);
            SDL_free(p);
        } else {
            baseDir = std::filesystem::current_path();
        }
    } else {
        if (char* p = SDL_GetPrefPath("mazerunner", MAZERUNNER_APPNAME)) {
            baseDir = std::filesystem::path(p);
            SDL_free(p);
        } else {
            baseDir = std::filesystem::current_path();
        }
    }
    return baseDir;
}

// SDL_Quit on every exit path once SDL_Init succeeded.
struct SdlSession {
    SdlSession() = default;
    SdlSession(const SdlSession&) = delete;
    SdlSession& operator=(const SdlSession&) = delete;
    ~SdlSession() { SDL_Quit(); }
};

int runCustomMaze(const CliOptions& opt, const Settings& settings, uint32_t seed) {
    MazeRequest req;
    req.width = opt.width.value_or(opt.height.value_or(req.width));
    req.height = opt.height.value_or(opt.width.value_or(req.height));
    req.braidPercent = opt.braid.value_or(0);

    std::string warnings;
    capMazeRequest(req, settings.maxMazeSize, &warnings);
    if (opt.algo) req.algorithm = resolveMazeAlgorithm(*opt.algo, &warnings);
    printWarnings(warnings);

    MazeReport report;
    Maze maze;
    try {
        maze = Maze::generate(req, seed, &report);
    } catch (const std::exception& e) {
        std::cerr << "error: maze generation failed: " << e.what() << "\n";
        return 1;
    }

    printWarnings(report.warnings);
    printReport(maze, report);
    if (!opt.quiet && settings.printMaze) printMaze(maze);
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    CliOptions opt;
    if (!parseArgs(argc, argv, opt)) return 2;

    if (opt.help) {
        printUsage(argc > 0 ? argv[0] : "mazerunner");
        return 0;
    }
    if (opt.version) {
        std::cout << MAZERUNNER_APPNAME << " " << MAZERUNNER_VERSION << "\n";
        return 0;
    }
    if (opt.listAlgorithms) {
        for (const MazeAlgorithmInfo& info : mazeAlgorithms()) {
            std::cout << std::left << std::setw(20) << info.key << info.name;
            if (info.algorithm == DEFAULT_MAZE_ALGORITHM) std::cout << " (default)";
            std::cout << "\n";
        }
        return 0;
    }

    SDL_SetMainReady();
    if (SDL_Init(SDL_INIT_TIMER) != 0) {
        std::cerr << "SDL_Init failed: " << SDL_GetError() << "\n";
        return 1;
    }
    SdlSession sdl;

    const std::filesystem::path baseDir = resolveDataDir(opt);
    {
        std::error_code ec;
        std::filesystem::create_directories(baseDir, ec);
        if (ec) {
            std::cerr << "warning: could not create " << baseDir.string() << ": " << ec.message() << "\n";
        }
    }

    // Settings.
    const std::filesystem::path settingsPathFs = baseDir / "mazerunner_settings.ini";
    const std::string settingsPath = settingsPathFs.string();
    if (opt.resetSettings) {
        std::error_code ec;
        const std::filesystem::path bak = settingsPath + ".bak";
        std::filesystem::remove(bak, ec);
        if (std::filesystem::exists(settingsPathFs, ec)) {
            std::filesystem::rename(settingsPathFs, bak, ec);
        }
        if (!writeDefaultSettings(settingsPath)) {
            std::cerr << "warning: could not write " << settingsPath << "\n";
        }
    } else if (!std::filesystem::exists(settingsPathFs)) {
        if (!writeDefaultSettings(settingsPath)) {
            std::cerr << "warning: could not write " << settingsPath << "\n";
        }
    }

    std::string settingsWarnings;
    const Settings settings = loadSettings(settingsPath, &settingsWarnings);
    printWarnings(settingsWarnings);

    std::string dailyDate;
    const uint32_t dailySeed = opt.daily ? dailySeedUtc(&dailyDate) : 0u;
    if (opt.daily) std::cout << "daily seed for " << dailyDate << ": " << dailySeed << "\n";

    if (opt.customMaze()) {
        const uint32_t seed = opt.seed ? *opt.seed
                            : opt.daily ? dailySeed
                            : hashCombine(static_cast<uint32_t>(SDL_GetTicks()), tag32("CUSTOM"));
        return runCustomMaze(opt, settings, seed);
    }

    // Progress slot: CLI flag wins over the settings file.
    std::string slot;
    if (opt.slot) slot = sanitizeSlotName(*opt.slot);
    else if (!settings.defaultSlot.empty()) slot = settings.defaultSlot;
    if (isDefaultSlotName(slot)) slot.clear();

    const std::string progressPath = (baseDir / progressFileName(slot)).string();

    ProgressState progress;
    std::string progressErr;
    const bool haveProgress = loadProgress(progressPath, progress, &progressErr);
    if (!haveProgress && !progressErr.empty()) {
        std::cerr << "warning: " << progressErr << (opt.continueRun ? "\n" : "; starting a new run\n");
    }

    if (opt.reset) {
        resetProgress(progress);
        std::cout << "progress reset (high score " << progress.highScore << " kept)\n";
    }

    int requestedLevel = 1;
    std::string resumeErr;
    if (!resolveStartLevel(opt.level.value_or(0), opt.continueRun, haveProgress ? &progress : nullptr,
                           requestedLevel, &resumeErr)) {
        std::cerr << "error: " << resumeErr << " in " << progressPath << "\n";
        return 1;
    }

    const uint32_t seed = opt.seed ? *opt.seed
                        : opt.daily ? hashCombine(dailySeed, static_cast<uint32_t>(requestedLevel))
                        : hashCombine(static_cast<uint32_t>(SDL_GetTicks()),
                                      static_cast<uint32_t>(requestedLevel),
                                      static_cast<uint32_t>(progress.levelsCompleted));

    LevelSession session;
    std::string buildErr;
    const int builtLevel = buildLevelOrRestart(requestedLevel, seed, settings, session, &buildErr);
    if (builtLevel == 0) {
        std::cerr << "error: " << buildErr << "\n";
        return 1;
    }
    if (!buildErr.empty()) std::cerr << "warning: " << buildErr << "\n";
    if (builtLevel != requestedLevel) resetProgress(progress);
    progress.currentLevel = builtLevel;

    printWarnings(session.report().warnings);

    const Difficulty& diff = session.difficulty();
    std::cout << "level " << builtLevel << " [" << diff.tierName << "]"
              << (slot.empty() ? "" : "  slot=" + slot) << "\n";
    printReport(session.maze(), session.report());
    if (!opt.quiet && settings.printMaze) printMaze(session.maze());

    progress.lastDifficulty = diff;

    if (opt.completeMs) {
        session.complete(*opt.completeMs);
        const ScoreBreakdown score = computeLevelScore(builtLevel, session.completionTimeMs(), opt.moves,
                                                       session.maze().dimensions().width);
        recordLevelCompletion(progress, score, session.completionTimeMs());
        std::cout << "level " << builtLevel << " complete in " << session.completionTimeMs() << " ms"
                  << ": +" << score.total
                  << " (base " << score.base << ", time " << score.timeBonus << ", moves " << score.moveBonus << ")"
                  << "  score=" << progress.score << "  high=" << progress.highScore
                  << "  next level " << progress.currentLevel << "\n";
    }

    std::string saveErr;
    if (!saveProgress(progressPath, progress, &saveErr)) {
        std::cerr << "error: " << saveErr << "\n";
        return 1;
    }

    return 0;
}
