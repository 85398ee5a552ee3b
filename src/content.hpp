#pragma once

#include <string>
#include <vector>

// Static game content: enemy templates and room flavor text.

struct Enemy {
    std::string name;
    int hp = 1;
    int atk = 1; // max damage per hit

    bool alive() const { return hp > 0; }
};

// Template catalog. Callers receive copies; placing an enemy never mutates the catalog.
const std::vector<Enemy>& enemyCatalog();

// Flavor text drawn (with replacement) for every ordinary room.
const std::vector<std::string>& roomDescriptions();

const char* entranceDescription();
const char* exitDescription();
