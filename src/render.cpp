#include "render.hpp"

#include <sstream>

std::string cellText(const Dungeon& dung, Pos cell, Pos player, bool revealAll) {
    if (cell == player) return " @ ";
    if (!dung.isRoom(cell)) return "///";

    const Room* room = dung.roomAt(cell);
    if (!room) return "///";

    if (!room->visited && !revealAll) return " # ";
    if (cell == dung.exit) return " X ";
    if (room->hasLiveEnemy()) return " E ";
    if (room->item) return " ? ";
    return "   ";
}

std::string renderMap(const Dungeon& dung, Pos player, bool revealAll) {
    std::ostringstream out;

    out << "+";
    for (int c = 0; c < Dungeon::WIDTH; ++c) out << "---+";

    for (int r = 0; r < Dungeon::HEIGHT; ++r) {
        std::string mid = "|";
        std::string bot = "+";
        for (int c = 0; c < Dungeon::WIDTH; ++c) {
            const Pos p{ r, c };
            mid += cellText(dung, p, player, revealAll);
            mid += dung.connectedEast(p) ? " " : "|";
            bot += dung.connectedSouth(p) ? "   " : "---";
            bot += "+";
        }
        out << "\n" << mid << "\n" << bot;
    }

    return out.str();
}

const char* mapLegend() {
    return "@ = You   X = Exit   E = Enemy   ? = Item   # = Unexplored   /// = Wall";
}
