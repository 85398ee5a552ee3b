#pragma once

#include <cstdint>
#include <string>

enum class LogLevel : uint8_t {
    Quiet = 0, // warnings and errors only
    Info,
    Debug,
};

const char* logLevelName(LogLevel l);
bool parseLogLevel(const std::string& s, LogLevel& out);

// Simple user-editable settings file (INI-ish: key = value).
// The file is created in the data directory (SDL_GetPrefPath) on first run.
// Command aliases (alias_<action>) live in the same file; see commands.hpp.
struct Settings {
    // 0 = derive a fresh seed from the clock each run.
    uint32_t seed = 0;

    // Player identity (used for the run summary)
    std::string playerName = "PLAYER";

    // Console output
    bool showMapOnMove = true;   // print the map after every successful move
    bool revealMapOnEnd = true;  // print the fully revealed map when the run ends

    // Diagnostics (stderr)
    LogLevel logLevel = LogLevel::Quiet;
};

// Loads settings from disk. If the file is missing or invalid, defaults are used.
Settings loadSettings(const std::string& path);

// Writes a commented default settings file. Returns true on success.
bool writeDefaultSettings(const std::string& path);
