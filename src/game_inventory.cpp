#include "game.hpp"

#include <sstream>

bool Game::take() {
    if (refuseIfFinished()) return false;

    Room* room = currentRoomMut();
    if (!room || !room->item) {
        pushMsg("NOTHING TO PICK UP.");
        return false;
    }

    const ItemKind kind = *room->item;
    const ItemDef& def = itemDef(kind);

    player_.inventory.push_back(kind);
    if (applyOnPickup(kind, player_)) {
        pushMsg(std::string("PICKED UP AND EQUIPPED ") + def.text + "!", MessageKind::Loot);
    } else {
        pushMsg(std::string("PICKED UP ") + def.text + ". USE WITH 'use " + def.key + "'.", MessageKind::Loot);
    }

    room->item.reset();
    ++turnCount;
    showStatus();
    return true;
}

bool Game::useItem(const std::string& key, int* healedOut) {
    if (refuseIfFinished()) return false;

    ItemKind kind;
    if (!parseItemKey(key, kind) || !isUsable(kind) || countItem(player_.inventory, kind) == 0) {
        pushMsg("YOU DON'T HAVE THAT OR CAN'T USE IT.", MessageKind::Warning);
        return false;
    }

    const int healed = applyOnUse(kind, player_);
    (void)removeOneItem(player_.inventory, kind);
    ++turnCount;

    if (healedOut) *healedOut = healed;

    std::ostringstream ss;
    ss << "HEALED " << healed << " HP! (HP: " << player_.hp << "/" << player_.maxHp << ")";
    pushMsg(ss.str(), MessageKind::Success);
    return true;
}
