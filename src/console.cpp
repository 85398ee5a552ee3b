#include "console.hpp"

#include "render.hpp"

#include <istream>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

const char* loopExitName(LoopExit e) {
    switch (e) {
        case LoopExit::Won:        return "won";
        case LoopExit::Lost:       return "lost";
        case LoopExit::Quit:       return "quit";
        case LoopExit::EndOfInput: return "end-of-input";
    }
    return "quit";
}

Console::Console(Game& game_, const CommandTable& commands_, std::istream& in_, std::ostream& out_,
                 ConsoleOptions opt_)
    : game(game_), commands(commands_), in(in_), out(out_), opt(std::move(opt_)) {}

void Console::flushMessages() {
    for (const Message& m : game.takeMessages()) {
        out << m.text;
        if (m.repeat > 1) out << " (x" << m.repeat << ")";
        out << "\n";
    }
}

void Console::printMap(bool revealAll) {
    const Game& g = game;
    out << "\n" << renderMap(g.dungeon(), g.player().pos, revealAll || opt.revealAll) << "\n\n";
    out << mapLegend() << "\n";
}

void Console::printHelp() {
    out << "Commands:\n";
    for (const auto& kv : commands.describeAll()) {
        out << "  " << kv.first << ": " << kv.second << "\n";
    }
}

void Console::printIntro() {
    const std::string bar(50, '=');
    out << "\n" << bar << "\n";
    out << "     DUNGEON CRAWLER - Random Grid Edition\n";
    out << bar << "\n";
    out << "Reach the EXIT [X] at the bottom-right to win!\n";
    out << "Commands: north/south/east/west (or n/s/e/w)\n";
    out << "          look, map, take, fight, use potion, quit\n";

    printMap(false);
    game.look();
    flushMessages();
}

bool Console::step(const std::string& line) {
    if (game.isFinished() || quitRequested) return false;

    const Command cmd = commands.parse(line);
    if (cmd.raw.empty()) return true;

    bool moved = false;
    switch (cmd.action) {
        case Action::North: moved = game.move(Direction::North); break;
        case Action::South: moved = game.move(Direction::South); break;
        case Action::East:  moved = game.move(Direction::East); break;
        case Action::West:  moved = game.move(Direction::West); break;
        case Action::Map:
            printMap(false);
            break;
        case Action::RevealMap:
            printMap(true);
            break;
        case Action::Look:
            game.look();
            break;
        case Action::Take:
            (void)game.take();
            break;
        case Action::Fight:
            (void)game.fight();
            break;
        case Action::Use:
            if (cmd.arg.empty()) {
                game.pushMsg("USE WHAT? (e.g. 'use potion')", MessageKind::Warning);
            } else {
                (void)game.useItem(cmd.arg);
            }
            break;
        case Action::Inventory:
            game.showStatus();
            break;
        case Action::Help:
            printHelp();
            break;
        case Action::Quit:
            out << "Thanks for playing!\n";
            quitRequested = true;
            break;
        case Action::None:
            game.pushMsg("UNKNOWN COMMAND. TYPE 'help'.", MessageKind::Warning);
            break;
    }

    if (moved) {
        // The win message is held back until the new room has been shown.
        std::vector<Message> pending = game.takeMessages();
        if (opt.showMapOnMove) printMap(false);
        game.look();
        for (Message& m : pending) game.pushMsg(m.text, m.kind);
    }

    flushMessages();
    return !(game.isFinished() || quitRequested);
}

void Console::printSummary(LoopExit why) {
    const Game& g = game;
    const Dungeon& d = g.dungeon();

    out << "\n";
    switch (why) {
        case LoopExit::Won:
            out << "*** YOU FOUND THE EXIT! CONGRATULATIONS - YOU WIN! ***\n";
            break;
        case LoopExit::Lost:
            out << "--- GAME OVER ---\n";
            break;
        case LoopExit::EndOfInput:
            out << "Bye!\n";
            break;
        case LoopExit::Quit:
            break;
    }

    out << "\n" << opt.playerName;
    if (!g.endCause().empty()) out << " - " << g.endCause();
    out << "\n";
    out << "Seed: " << g.seed() << "  Turns: " << g.turns() << "  Enemies slain: " << g.kills() << "\n";
    out << "Rooms explored: " << d.visitedCount() << "/" << d.roomCount() << "\n";
    out << g.statusLine() << "\n";

    if (why == LoopExit::Lost || (g.isFinished() && opt.revealMapOnEnd)) {
        out << "\nFinal map (revealed):";
        printMap(true);
    }
}

LoopExit Console::run() {
    printIntro();

    LoopExit why = LoopExit::EndOfInput;
    std::string line;
    for (;;) {
        out << "\n> " << std::flush;
        if (!std::getline(in, line)) {
            why = LoopExit::EndOfInput;
            out << "\n";
            break;
        }
        if (!step(line)) {
            if (game.isGameWon()) why = LoopExit::Won;
            else if (game.isGameOver()) why = LoopExit::Lost;
            else why = LoopExit::Quit;
            break;
        }
    }

    printSummary(why);
    return why;
}
