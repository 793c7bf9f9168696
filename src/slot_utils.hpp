#pragma once

#include <algorithm>
#include <cctype>
#include <string>

// Small shared helpers for progress-slot naming.
//
// Kept SDL-free so it can be used by:
//   - cli_main.cpp (--slot parsing)
//   - settings.cpp (default_slot parsing)
//   - unit tests
//
// Notes:
// - Slot names are used as a suffix in filenames (mazerunner_progress_<slot>.dat).
// - We sanitize aggressively to keep progress files portable across platforms.

namespace mazerunner_slot_detail {

inline std::string trim(std::string s) {
    auto isNotSpace = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), isNotSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), isNotSpace).base(), s.end());
    return s;
}

inline std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

inline bool isWindowsReservedBasename(const std::string& lower) {
    // Windows device names are invalid as file basenames (even with extensions).
    static const char* reserved[] = {
        "con", "prn", "aux", "nul",
        "com1", "com2", "com3", "com4", "com5", "com6", "com7", "com8", "com9",
        "lpt1", "lpt2", "lpt3", "lpt4", "lpt5", "lpt6", "lpt7", "lpt8", "lpt9"
    };
    for (const char* r : reserved) {
        if (lower == r) return true;
    }
    return false;
}

} // namespace mazerunner_slot_detail

inline std::string sanitizeSlotName(std::string raw) {
    namespace detail = mazerunner_slot_detail;

    // Keep only filename-safe characters for a slot name (portable + predictable).
    raw = detail::lower(detail::trim(std::move(raw)));

    std::string out;
    out.reserve(raw.size());

    for (unsigned char c : raw) {
        if (std::isalnum(c) || c == '_' || c == '-') {
            out.push_back(static_cast<char>(c));
        } else {
            // Whitespace, path separators, dots and other punctuation.
            out.push_back('_');
        }
    }

    // Collapse repeated underscores.
    out.erase(std::unique(out.begin(), out.end(), [](char a, char b) {
        return a == '_' && b == '_';
    }), out.end());

    // Trim underscores/hyphens from ends.
    while (!out.empty() && (out.front() == '_' || out.front() == '-')) out.erase(out.begin());
    while (!out.empty() && (out.back() == '_' || out.back() == '-')) out.pop_back();

    if (out.empty()) out = "slot";
    if (out.size() > 32) out.resize(32);

    if (detail::isWindowsReservedBasename(out)) {
        out = "_" + out;
    }

    return out;
}

// "default", "none" and "off" all mean the unnamed slot.
inline bool isDefaultSlotName(const std::string& slot) {
    return slot.empty() || slot == "default" || slot == "none" || slot == "off";
}

inline std::string progressFileName(const std::string& slot) {
    if (isDefaultSlotName(slot)) return "mazerunner_progress.dat";
    return "mazerunner_progress_" + slot + ".dat";
}
