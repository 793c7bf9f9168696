#include "settings.hpp"

#include "common.hpp"
#include "maze_algorithms.hpp"
#include "slot_utils.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::string ltrim(std::string s) {
    s.erase(s.begin(),
        std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
    return s;
}

std::string rtrim(std::string s) {
    s.erase(
        std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base(),
        s.end());
    return s;
}

std::string trim(std::string s) {
    return rtrim(ltrim(std::move(s)));
}

bool parseBool(const std::string& v, bool& out) {
    const std::string s = toLower(trim(v));
    if (s == "1" || s == "true" || s == "yes" || s == "on") {
        out = true;
        return true;
    }
    if (s == "0" || s == "false" || s == "no" || s == "off") {
        out = false;
        return true;
    }
    return false;
}

bool parseInt(const std::string& v, int& out) {
    try {
        out = std::stoi(trim(v));
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

Settings loadSettings(const std::string& path, std::string* warnings) {
    Settings s;

    std::ifstream f(path);
    if (!f) return s;

    std::string line;
    int lineNo = 0;
    while (std::getline(f, line)) {
        ++lineNo;

        // Strip comments (# or ;)
        auto hash = line.find('#');
        auto semi = line.find(';');
        size_t cut = std::min(hash == std::string::npos ? line.size() : hash,
                              semi == std::string::npos ? line.size() : semi);
        line = line.substr(0, cut);

        line = trim(line);
        if (line.empty()) continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            appendWarning(warnings, path + ":" + std::to_string(lineNo) + ": expected key = value");
            continue;
        }

        std::string key = toLower(trim(line.substr(0, eq)));
        std::string val = trim(line.substr(eq + 1));
        bool ok = true;

        if (key == "max_maze_size") {
            int v = 0;
            ok = parseInt(val, v);
            if (ok) s.maxMazeSize = std::clamp(v, 5, 200);
        } else if (key == "force_algorithm") {
            if (val.empty() || toLower(val) == "none" || toLower(val) == "off") {
                s.forceAlgorithm.clear();
            } else if (parseMazeAlgorithm(val)) {
                s.forceAlgorithm = val;
            } else {
                appendWarning(warnings, path + ":" + std::to_string(lineNo) +
                                        ": unknown algorithm '" + val + "' ignored");
            }
        } else if (key == "braid_override") {
            int v = 0;
            ok = parseInt(val, v);
            if (ok) s.braidOverride = (v < 0) ? -1 : std::min(v, 100);
        } else if (key == "default_slot") {
            s.defaultSlot = val.empty() ? std::string() : sanitizeSlotName(val);
        } else if (key == "print_maze") {
            bool b = true;
            ok = parseBool(val, b);
            if (ok) s.printMaze = b;
        } else {
            appendWarning(warnings, path + ":" + std::to_string(lineNo) + ": unknown key '" + key + "'");
        }

        if (!ok) {
            appendWarning(warnings, path + ":" + std::to_string(lineNo) + ": bad value for '" + key + "'");
        }
    }

    return s;
}

bool writeDefaultSettings(const std::string& path) {
    std::ofstream f(path);
    if (!f) return false;

    f << R"INI(# MazeRunner settings
#
# Lines are: key = value
# Comments start with # or ;
#
# This file is auto-created on first run.

# Largest maze edge length that will be generated (5..200).
max_maze_size = 60

# Use one algorithm for every level instead of the difficulty table.
# Empty = follow the table. Run `mazerunner --list-algorithms` for keys.
force_algorithm =

# -1 = use the difficulty table, otherwise a braid percentage 0..100.
braid_override = -1

# Progress slot used when --slot is not given (empty = default).
default_slot =

# Print the maze as text after generating it.
print_maze = true
)INI";

    return f.good();
}

bool updateIniKey(const std::string& path, const std::string& key, const std::string& value) {
    std::ifstream in(path);
    if (!in) return false;

    std::vector<std::string> lines;
    std::string line;

    bool found = false;
    while (std::getline(in, line)) {
        std::string raw = line;

        // Strip comments for matching, but preserve the original line for output when not matching.
        auto commentPos = raw.find_first_of("#;");
        if (commentPos != std::string::npos) raw = raw.substr(0, commentPos);

        auto eq = raw.find('=');
        if (eq != std::string::npos) {
            std::string k = trim(raw.substr(0, eq));
            if (!k.empty() && toLower(k) == toLower(key)) {
                lines.push_back(key + " = " + value);
                found = true;
                continue;
            }
        }

        lines.push_back(line);
    }
    in.close();

    if (!found) {
        lines.push_back(key + " = " + value);
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out) return false;

    for (size_t i = 0; i < lines.size(); ++i) {
        out << lines[i];
        if (i + 1 < lines.size()) out << "\n";
    }
    return out.good();
}
