#pragma once
#include <cstdint>
#include <string>
#include <vector>

// Forward declaration (defined in game.hpp).
struct Player;

enum class ItemKind : uint8_t {
    Sword = 0,
    Potion,
    Shield,
    Dagger,
};

// Keep in sync with the last enum value.
inline constexpr int ITEM_KIND_COUNT = static_cast<int>(ItemKind::Dagger) + 1;

struct ItemDef {
    ItemKind kind;
    const char* key;   // command-line identifier ("use potion")
    const char* text;  // "a Sword (+2 ATK)"

    // Applied once on pickup.
    int atkBonus = 0;
    int maxHpBonus = 0;
    int hpBonus = 0;

    // Deferred effect: nothing happens on pickup, the item is consumed by `use`.
    bool usable = false;
    int healAmount = 0;
};

const ItemDef& itemDef(ItemKind k);

inline const char* itemKey(ItemKind k) { return itemDef(k).key; }
inline bool isUsable(ItemKind k) { return itemDef(k).usable; }

// Exact, lowercase item key ("sword", "potion", ...). Returns false if unknown.
// Case folding is the command surface's job.
bool parseItemKey(const std::string& key, ItemKind& out);

// Catalog in definition order (used by the generator before shuffling).
std::vector<ItemKind> itemCatalog();

// Pickup branch: applies the permanent stat modifiers.
// Returns false (and leaves the player untouched) for deferred items.
bool applyOnPickup(ItemKind k, Player& p);

// Use branch: applies a deferred item's effect. Returns the hp actually restored,
// or -1 if the item kind cannot be used.
int applyOnUse(ItemKind k, Player& p);

// Inventory helpers
int countItem(const std::vector<ItemKind>& inv, ItemKind k);

// Removes the first instance of `k`. Returns true if one was removed.
bool removeOneItem(std::vector<ItemKind>& inv, ItemKind k);

// "sword, potion" or "none".
std::string inventoryToString(const std::vector<ItemKind>& inv);
