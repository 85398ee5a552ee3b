#include "content.hpp"

const std::vector<Enemy>& enemyCatalog() {
    static const std::vector<Enemy> catalog = {
        { "Goblin",   3, 1 },
        { "Skeleton", 4, 2 },
        { "Troll",    6, 2 },
        { "Wraith",   5, 3 },
    };
    return catalog;
}

const std::vector<std::string>& roomDescriptions() {
    static const std::vector<std::string> descs = {
        "A damp stone chamber. Water drips from the ceiling.",
        "A dusty room with cobwebs in every corner.",
        "A narrow passage with scratch marks on the walls.",
        "A cold room. Your breath is visible.",
        "A musty chamber with broken furniture.",
        "Glowing mushrooms light this cavern.",
        "An old storage room with empty barrels.",
        "The walls are covered in strange runes.",
        "A crossroads of crumbling passages.",
        "A quiet alcove with a mossy floor.",
    };
    return descs;
}

const char* entranceDescription() {
    return "The dungeon entrance. Faint light behind you.";
}

const char* exitDescription() {
    return "A grand door with golden runes. The EXIT!";
}
