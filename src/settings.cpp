#include "settings.hpp"
#include "common.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <string>

namespace {

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

bool parseU32(const std::string& v, uint32_t& out) {
    const std::string s = trim(v);
    if (s.empty() || s[0] == '-') return false;
    try {
        size_t used = 0;
        const unsigned long long n = std::stoull(s, &used, 0);
        if (used != s.size() || n > 0xFFFFFFFFull) return false;
        out = static_cast<uint32_t>(n);
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

} // namespace

const char* logLevelName(LogLevel l) {
    switch (l) {
        case LogLevel::Quiet: return "quiet";
        case LogLevel::Info:  return "info";
        case LogLevel::Debug: return "debug";
    }
    return "quiet";
}

bool parseLogLevel(const std::string& s, LogLevel& out) {
    const std::string v = toLower(trim(s));
    if (v == "quiet" || v == "warn" || v == "off") { out = LogLevel::Quiet; return true; }
    if (v == "info") { out = LogLevel::Info; return true; }
    if (v == "debug" || v == "verbose") { out = LogLevel::Debug; return true; }
    return false;
}

Settings loadSettings(const std::string& path) {
    Settings s;

    std::ifstream f(path);
    if (!f) return s;

    std::string line;
    while (std::getline(f, line)) {
        // Strip comments (# or ;)
        auto hash = line.find('#');
        auto semi = line.find(';');
        size_t cut = std::min(hash == std::string::npos ? line.size() : hash,
                              semi == std::string::npos ? line.size() : semi);
        line = line.substr(0, cut);

        line = trim(line);
        if (line.empty()) continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = toLower(trim(line.substr(0, eq)));
        std::string val = trim(line.substr(eq + 1));

        if (key == "seed") {
            uint32_t v = 0;
            if (parseU32(val, v)) s.seed = v;
        } else if (key == "player_name") {
            if (!val.empty()) s.playerName = val.substr(0, 24);
        } else if (key == "show_map_on_move") {
            bool b = true;
            if (parseBool(val, b)) s.showMapOnMove = b;
        } else if (key == "reveal_map_on_end") {
            bool b = true;
            if (parseBool(val, b)) s.revealMapOnEnd = b;
        } else if (key == "log_level") {
            LogLevel l = LogLevel::Quiet;
            if (parseLogLevel(val, l)) s.logLevel = l;
        }
    }

    return s;
}

bool writeDefaultSettings(const std::string& path) {
    std::ofstream f(path);
    if (!f) return false;

    f << R"INI(# GridCrawl settings
#
# Lines are: key = value
# Comments start with # or ;
#
# This file is auto-created on first run. Edit it and restart the game.

# Run
# seed: 0 = new random dungeon every run; any other number replays that dungeon.
seed = 0
player_name = PLAYER

# Console output
show_map_on_move = true
reveal_map_on_end = true

# Diagnostics on stderr: quiet | info | debug
log_level = quiet

# -----------------------------------------------------------------------------
# Command aliases
#
# Add extra words for a command:
#   alias_<action> = word[, word, ...]
#
# Actions: north south east west map revealmap look take fight use inventory help quit
# Built-in words (n/s/e/w, get, attack, ...) always work.
# Set an alias list to "none" to clear it.
# -----------------------------------------------------------------------------

# alias_north = k
# alias_south = j
# alias_east = l
# alias_west = h
# alias_take = pickup
)INI";

    return static_cast<bool>(f);
}
