#include "log.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>

#include "commands.hpp"
#include "console.hpp"
#include "game.hpp"
#include "settings.hpp"
#include "version.hpp"

static bool hasFlag(int argc, char** argv, const char* flag) {
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == flag) return true;
    }
    return false;
}

static std::optional<std::string> parseStringArg(int argc, char** argv, const char* opt) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == opt && i + 1 < argc) {
            return std::string(argv[i + 1]);
        }
    }
    return std::nullopt;
}

static bool parseSeed(const std::string& s, uint32_t& out) {
    if (s.empty() || s[0] == '-') return false;
    try {
        size_t used = 0;
        const unsigned long long v = std::stoull(s, &used, 0);
        if (used != s.size() || v > 0xFFFFFFFFull) return false;
        out = static_cast<uint32_t>(v);
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

static uint32_t clockSeed() {
    const auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    const uint64_t t = static_cast<uint64_t>(now);
    uint32_t s = hashCombine(static_cast<uint32_t>(t), static_cast<uint32_t>(t >> 32));
    return s ? s : 1u;
}

static void printUsage(const char* exe) {
    std::cout
        << GRIDCRAWL_APPNAME << " " << GRIDCRAWL_VERSION << "\n"
        << "Usage: " << (exe ? exe : "gridcrawl") << " [options]\n\n"
        << "Options:\n"
        << "  --seed <n>           Play the dungeon generated from seed n\n"
        << "  --daily              Daily run (deterministic UTC-date seed)\n"
        << "  --settings <path>    Use a specific settings file\n"
        << "  --data-dir <path>    Override the config directory\n"
        << "  --reset-settings     Overwrite settings with fresh defaults\n"
        << "  --reveal             Always show the whole map\n"
        << "\n"
        << "  --version, -v        Print version and exit\n"
        << "  --help, -h           Show this help and exit\n";
}

int main(int argc, char** argv) {
    if (hasFlag(argc, argv, "--help") || hasFlag(argc, argv, "-h")) {
        printUsage(argc > 0 ? argv[0] : "gridcrawl");
        return 0;
    }
    if (hasFlag(argc, argv, "--version") || hasFlag(argc, argv, "-v")) {
        std::cout << GRIDCRAWL_APPNAME << " " << GRIDCRAWL_VERSION << "\n";
        return 0;
    }

    SDL_SetMainReady();
    if (SDL_Init(0) != 0) {
        std::cerr << "SDL_Init failed: " << SDL_GetError() << "\n";
        return 1;
    }

    std::optional<uint32_t> seedArg;
    if (const auto s = parseStringArg(argc, argv, "--seed")) {
        uint32_t v = 0;
        if (!parseSeed(*s, v)) {
            std::cerr << "Invalid --seed value: " << *s << "\n";
            SDL_Quit();
            return 2;
        }
        seedArg = v;
    }

    // Where settings live: --settings file > --data-dir > SDL pref path > cwd.
    const std::optional<std::string> settingsArg = parseStringArg(argc, argv, "--settings");
    const std::optional<std::string> dataDirArg = parseStringArg(argc, argv, "--data-dir");

    std::filesystem::path settingsPathFs;
    if (settingsArg && !settingsArg->empty()) {
        settingsPathFs = std::filesystem::path(*settingsArg);
    } else {
        std::filesystem::path baseDir;
        if (dataDirArg && !dataDirArg->empty()) {
            baseDir = std::filesystem::path(*dataDirArg);
        } else if (char* p = SDL_GetPrefPath("gridcrawl", GRIDCRAWL_APPNAME)) {
            baseDir = std::filesystem::path(p);
            SDL_free(p);
        } else {
            baseDir = std::filesystem::current_path();
        }

        std::error_code ec;
        std::filesystem::create_directories(baseDir, ec);
        if (ec) {
            SDL_LogWarn(LOG_APP, "Could not create data directory %s: %s",
                        baseDir.string().c_str(), ec.message().c_str());
        }
        settingsPathFs = baseDir / "gridcrawl_settings.ini";
    }
    const std::string settingsPath = settingsPathFs.string();

    // Load or create settings.
    if (hasFlag(argc, argv, "--reset-settings")) {
        // Keep one backup (<file>.bak), overwriting any older one.
        std::error_code ec;
        const std::filesystem::path bak = settingsPathFs.string() + ".bak";
        std::filesystem::remove(bak, ec);
        if (std::filesystem::exists(settingsPathFs, ec)) {
            std::filesystem::rename(settingsPathFs, bak, ec);
            if (ec) SDL_LogWarn(LOG_APP, "Could not back up %s: %s", settingsPath.c_str(), ec.message().c_str());
        }
        if (!writeDefaultSettings(settingsPath)) {
            SDL_LogWarn(LOG_APP, "Could not write default settings to %s", settingsPath.c_str());
        }
    } else {
        std::error_code ec;
        if (!std::filesystem::exists(settingsPathFs, ec) && !writeDefaultSettings(settingsPath)) {
            SDL_LogWarn(LOG_APP, "Could not write default settings to %s", settingsPath.c_str());
        }
    }

    const Settings settings = loadSettings(settingsPath);
    applyLogLevel(settings.logLevel);
    SDL_LogInfo(LOG_APP, "%s %s, settings: %s (log level %s)", GRIDCRAWL_APPNAME, GRIDCRAWL_VERSION,
                settingsPath.c_str(), logLevelName(settings.logLevel));

    CommandTable commands = CommandTable::defaults();
    commands.loadOverridesFromIni(settingsPath);

    // Seed priority: --seed > --daily > settings seed > clock.
    uint32_t seed = 0;
    if (seedArg) {
        seed = *seedArg;
    } else if (hasFlag(argc, argv, "--daily")) {
        std::string date;
        seed = dailySeedUtc(&date);
        SDL_LogInfo(LOG_APP, "Daily run for %s", date.c_str());
    } else if (settings.seed != 0) {
        seed = settings.seed;
    } else {
        seed = clockSeed();
    }

    Game game;
    game.newGame(seed);

    {
        const Dungeon& d = game.dungeon();
        int enemies = 0;
        int items = 0;
        for (const auto& kv : d.rooms) {
            if (kv.second.hasLiveEnemy()) ++enemies;
            if (kv.second.item) ++items;
        }
        SDL_LogInfo(LOG_GEN, "Seed %u: %d rooms, %d enemies, %d items", seed, d.roomCount(), enemies, items);
    }

    ConsoleOptions opt;
    opt.playerName = settings.playerName;
    opt.showMapOnMove = settings.showMapOnMove;
    opt.revealMapOnEnd = settings.revealMapOnEnd;
    opt.revealAll = hasFlag(argc, argv, "--reveal");

    Console console(game, commands, std::cin, std::cout, opt);
    const LoopExit why = console.run();

    SDL_LogInfo(LOG_APP, "Run ended (%s) after %u turns", loopExitName(why), game.turns());
    SDL_LogDebug(LOG_APP, "Final state: %s", game.statusLine().c_str());

    SDL_Quit();
    return 0;
}
