#include "items.hpp"
#include "game.hpp"

#include <algorithm>
#include <sstream>

const ItemDef& itemDef(ItemKind k) {
    // Keep in sync with enum ordering.
    static const ItemDef defs[] = {
        { ItemKind::Sword,  "sword",  "a Sword (+2 ATK)",          2, 0, 0, false, 0 },
        { ItemKind::Potion, "potion", "a Healing Potion (+5 HP)",  0, 0, 0, true,  5 },
        { ItemKind::Shield, "shield", "a Shield (+3 max HP)",      0, 3, 3, false, 0 },
        { ItemKind::Dagger, "dagger", "a Dagger (+1 ATK)",         1, 0, 0, false, 0 },
    };

    const size_t idx = static_cast<size_t>(k);
    if (idx >= (sizeof(defs) / sizeof(defs[0]))) {
        return defs[0];
    }
    return defs[idx];
}

bool parseItemKey(const std::string& key, ItemKind& out) {
    for (int k = 0; k < ITEM_KIND_COUNT; ++k) {
        const ItemKind kind = static_cast<ItemKind>(k);
        if (key == itemDef(kind).key) {
            out = kind;
            return true;
        }
    }
    return false;
}

std::vector<ItemKind> itemCatalog() {
    std::vector<ItemKind> out;
    out.reserve(ITEM_KIND_COUNT);
    for (int k = 0; k < ITEM_KIND_COUNT; ++k) out.push_back(static_cast<ItemKind>(k));
    return out;
}

bool applyOnPickup(ItemKind k, Player& p) {
    const ItemDef& def = itemDef(k);
    if (def.usable) return false;

    p.atk += def.atkBonus;
    p.maxHp += def.maxHpBonus;
    p.hp += def.hpBonus;
    return true;
}

int applyOnUse(ItemKind k, Player& p) {
    const ItemDef& def = itemDef(k);
    if (!def.usable) return -1;

    const int before = p.hp;
    p.hp = std::min(p.hp + def.healAmount, p.maxHp);
    return p.hp - before;
}

int countItem(const std::vector<ItemKind>& inv, ItemKind k) {
    return static_cast<int>(std::count(inv.begin(), inv.end(), k));
}

bool removeOneItem(std::vector<ItemKind>& inv, ItemKind k) {
    auto it = std::find(inv.begin(), inv.end(), k);
    if (it == inv.end()) return false;
    inv.erase(it);
    return true;
}

std::string inventoryToString(const std::vector<ItemKind>& inv) {
    if (inv.empty()) return "none";

    std::ostringstream ss;
    for (size_t i = 0; i < inv.size(); ++i) {
        if (i) ss << ", ";
        ss << itemKey(inv[i]);
    }
    return ss.str();
}
