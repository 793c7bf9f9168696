#include "progress.hpp"

#include "common.hpp"
#include "version.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

namespace {

std::string trimStr(std::string s) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    return s;
}

bool parseU32(const std::string& s, uint32_t& out) {
    const std::string t = trimStr(s);
    if (t.empty() || t[0] == '-') return false;
    try {
        const unsigned long long v = std::stoull(t);
        if (v > 0xFFFFFFFFull) return false;
        out = static_cast<uint32_t>(v);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseI32(const std::string& s, int& out) {
    try {
        out = std::stoi(trimStr(s));
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

std::string nowTimestampLocal() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

bool atomicWriteTextFile(const std::string& path, const std::string& contents) {
    std::error_code ec;
    const fs::path p(path);
    const fs::path tmp = p.string() + ".tmp";

    {
        std::ofstream out(tmp, std::ios::binary);
        if (!out) return false;
        out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        out.flush();
        if (!out.good()) return false;
    }

    // Try rename; on Windows this fails if destination exists.
    fs::rename(tmp, p, ec);
    if (ec) {
        std::error_code ec2;
        fs::remove(p, ec2);
        ec.clear();
        fs::rename(tmp, p, ec);
    }
    if (ec) {
        // Fallback: copy then remove tmp
        std::error_code ec2;
        fs::copy_file(tmp, p, fs::copy_options::overwrite_existing, ec2);
        std::error_code ec3;
        fs::remove(tmp, ec3);
        return !ec2;
    }
    return true;
}

uint32_t clampToU32(double v) {
    if (!(v > 0.0)) return 0;
    if (v >= 4294967295.0) return 0xFFFFFFFFu;
    return static_cast<uint32_t>(v);
}

uint32_t addSaturating(uint32_t a, uint32_t b) {
    return (a > 0xFFFFFFFFu - b) ? 0xFFFFFFFFu : a + b;
}

void setErr(std::string* err, const std::string& msg) {
    if (err) *err = msg;
}

} // namespace

ScoreBreakdown computeLevelScore(int level, uint32_t completionMs, int moves, int mazeSize) {
    ScoreBreakdown s;
    level = std::max(1, level);
    mazeSize = std::max(1, mazeSize);

    const double base = 100.0 * static_cast<double>(level);

    const double targetMs = static_cast<double>(mazeSize) * static_cast<double>(mazeSize) * 1000.0;
    const double timeRatio = std::max(0.0, (targetMs - static_cast<double>(completionMs)) / targetMs);
    const double timeBonus = std::floor(base * timeRatio * 10.0);

    const double optimalMoves = static_cast<double>(mazeSize) * 1.5;
    const double moveRatio = std::max(0.0, (optimalMoves - static_cast<double>(std::max(0, moves))) / optimalMoves);
    const double moveBonus = std::floor(base * moveRatio * 5.0);

    s.base = clampToU32(base);
    s.timeBonus = clampToU32(timeBonus);
    s.moveBonus = clampToU32(moveBonus);
    s.total = clampToU32(base + timeBonus + moveBonus);
    return s;
}

void recordLevelCompletion(ProgressState& st, const ScoreBreakdown& score, uint32_t completionMs) {
    st.score = addSaturating(st.score, score.total);
    st.highScore = std::max(st.highScore, st.score);
    if (st.levelsCompleted < std::numeric_limits<int>::max()) st.levelsCompleted++;
    st.lastCompletionMs = completionMs;
    st.currentLevel = std::max(1, st.currentLevel);
    if (st.currentLevel < std::numeric_limits<int>::max()) st.currentLevel++;
}

void resetProgress(ProgressState& st) {
    const uint32_t high = st.highScore;
    st = ProgressState{};
    st.highScore = high;
}

bool loadProgress(const std::string& path, ProgressState& out, std::string* err) {
    setErr(err, "");

    std::ifstream in(path);
    if (!in) return false;

    ProgressState st;
    bool sawVersion = false;
    bool sawLevel = false;

    std::string line;
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = trimStr(std::move(line));
        if (line.empty() || line[0] == '#') continue;

        const auto eq = line.find('=');
        if (eq == std::string::npos) {
            setErr(err, path + ":" + std::to_string(lineNo) + ": expected key = value");
            return false;
        }

        const std::string key = toLower(trimStr(line.substr(0, eq)));
        const std::string val = trimStr(line.substr(eq + 1));
        bool ok = true;

        if (key == "version") {
            int v = 0;
            ok = parseI32(val, v);
            if (ok && v != MAZERUNNER_PROGRESS_VERSION) {
                setErr(err, "progress file version " + std::to_string(v) + " is not supported (expected " +
                            std::to_string(MAZERUNNER_PROGRESS_VERSION) + ")");
                return false;
            }
            sawVersion = ok;
        } else if (key == "current_level") {
            ok = parseI32(val, st.currentLevel) && st.currentLevel >= 1;
            sawLevel = ok;
        } else if (key == "score") {
            ok = parseU32(val, st.score);
        } else if (key == "high_score") {
            ok = parseU32(val, st.highScore);
        } else if (key == "levels_completed") {
            ok = parseI32(val, st.levelsCompleted);
        } else if (key == "last_completion_ms") {
            ok = parseU32(val, st.lastCompletionMs);
        } else if (key == "saved_at") {
            st.savedAt = val;
        } else if (key == "last_tier") {
            st.lastDifficulty.tierName = val;
        } else if (key == "last_level") {
            ok = parseI32(val, st.lastDifficulty.level);
        } else if (key == "last_maze_size") {
            ok = parseI32(val, st.lastDifficulty.mazeSize);
        } else if (key == "last_braid") {
            ok = parseI32(val, st.lastDifficulty.braidPercent);
        } else if (key == "last_algorithm") {
            const auto a = parseMazeAlgorithm(val);
            ok = a.has_value();
            if (ok) st.lastDifficulty.algorithm = *a;
        }
        // Unknown keys are ignored so newer files with extra fields still load.

        if (!ok) {
            setErr(err, path + ":" + std::to_string(lineNo) + ": bad value for '" + key + "'");
            return false;
        }
    }

    if (!sawVersion || !sawLevel) {
        setErr(err, path + ": missing " + std::string(!sawVersion ? "version" : "current_level"));
        return false;
    }

    st.highScore = std::max(st.highScore, st.score);
    out = st;
    return true;
}

bool resolveStartLevel(int explicitLevel, bool resume, const ProgressState* saved, int& level,
                       std::string* err) {
    setErr(err, "");
    if (resume && !saved) {
        setErr(err, "no saved progress to continue");
        return false;
    }
    if (explicitLevel > 0) level = explicitLevel;
    else if (saved) level = std::max(1, saved->currentLevel);
    else level = 1;
    return true;
}

bool saveProgress(const std::string& path, ProgressState& st, std::string* err) {
    st.savedAt = nowTimestampLocal();

    std::ostringstream ss;
    ss << "# " << MAZERUNNER_APPNAME << " progress\n";
    ss << "version = " << MAZERUNNER_PROGRESS_VERSION << "\n";
    ss << "saved_at = " << st.savedAt << "\n";
    ss << "current_level = " << st.currentLevel << "\n";
    ss << "score = " << st.score << "\n";
    ss << "high_score = " << st.highScore << "\n";
    ss << "levels_completed = " << st.levelsCompleted << "\n";
    ss << "last_completion_ms = " << st.lastCompletionMs << "\n";
    if (!st.lastDifficulty.tierName.empty()) {
        ss << "last_tier = " << st.lastDifficulty.tierName << "\n";
        ss << "last_level = " << st.lastDifficulty.level << "\n";
        ss << "last_maze_size = " << st.lastDifficulty.mazeSize << "\n";
        ss << "last_braid = " << st.lastDifficulty.braidPercent << "\n";
        ss << "last_algorithm = " << mazeAlgorithmKey(st.lastDifficulty.algorithm) << "\n";
    }

    if (!atomicWriteTextFile(path, ss.str())) {
        setErr(err, "failed to write " + path);
        return false;
    }
    return true;
}
