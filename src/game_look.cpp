#include "game.hpp"

#include "combat_rules.hpp"

#include <sstream>

void Game::look() {
    const Pos p = player_.pos;
    const Room& room = currentRoom();

    {
        std::ostringstream ss;
        ss << "--- ROOM (" << p.row << "," << p.col << ") ---";
        pushMsg(ss.str(), MessageKind::System);
    }
    pushMsg(room.description);

    if (room.hasLiveEnemy()) {
        const Enemy& e = *room.enemy;
        std::ostringstream ss;
        ss << "  !! A " << toUpper(e.name) << " IS HERE! (HP:" << e.hp
           << " ATK:" << e.atk << ", HITS " << diceToString(attackDice(e.atk)) << ")";
        pushMsg(ss.str(), MessageKind::Warning);
    }
    if (room.item) {
        pushMsg(std::string("  YOU SEE ") + itemDef(*room.item).text + " ON THE GROUND.", MessageKind::Loot);
    }

    std::string exits;
    for (Direction d : ALL_DIRECTIONS) {
        if (!dung.isRoom(stepPos(p, d))) continue;
        if (!exits.empty()) exits += ", ";
        exits += directionName(d);
    }
    pushMsg("  EXITS: " + (exits.empty() ? std::string("none") : exits));

    showStatus();
}
