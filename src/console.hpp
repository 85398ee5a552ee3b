#pragma once

#include "commands.hpp"
#include "game.hpp"

#include <cstdint>
#include <iosfwd>
#include <string>

struct ConsoleOptions {
    std::string playerName = "PLAYER";
    bool showMapOnMove = true;
    bool revealMapOnEnd = true;
    bool revealAll = false; // every "map" prints the revealed view
};

enum class LoopExit : uint8_t {
    Won = 0,
    Lost,
    Quit,
    EndOfInput, // input closed; a normal way to leave
};

const char* loopExitName(LoopExit e);

// Line-oriented front end. Reads one command per line from `in`, applies it to the
// game and writes messages/maps to `out`. Owns no game state of its own.
class Console {
public:
    Console(Game& game, const CommandTable& commands, std::istream& in, std::ostream& out,
            ConsoleOptions opt = {});

    // Intro, command loop, summary.
    LoopExit run();

    // Applies a single input line. Returns false once the loop should stop
    // (run finished or quit requested).
    bool step(const std::string& line);

    void printIntro();
    void printSummary(LoopExit why);
    void printHelp();
    void printMap(bool revealAll);

private:
    Game& game;
    const CommandTable& commands;
    std::istream& in;
    std::ostream& out;
    ConsoleOptions opt;
    bool quitRequested = false;

    void flushMessages();
};
