#pragma once
#include <cstdint>
#include <cstdlib>
#include <string>
#include <vector>

struct Vec2i {
    int x = 0;
    int y = 0;
};

inline bool operator==(const Vec2i& a, const Vec2i& b) {
    return a.x == b.x && a.y == b.y;
}

inline bool operator!=(const Vec2i& a, const Vec2i& b) {
    return !(a == b);
}

inline int manhattan(const Vec2i& a, const Vec2i& b) {
    return std::abs(a.x - b.x) + std::abs(a.y - b.y);
}

inline int clampi(int v, int lo, int hi) {
    if (v < lo) return lo;
    if (v > hi) return hi;
    return v;
}

inline std::string toLower(std::string s) {
    for (char& c : s) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return s;
}

// Appends one "warning: ..." line to a warnings buffer.
// Generation and loading code collect warnings this way; front ends decide
// where (and whether) to print them.
inline void appendWarning(std::string* warnings, const std::string& msg) {
    if (!warnings) return;
    *warnings += "warning: ";
    *warnings += msg;
    *warnings += "\n";
}
