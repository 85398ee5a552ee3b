#pragma once

#include "dungeon.hpp"

#include <string>

// Text presentation of the dungeon map.
//
// Each cell is three characters wide and framed by '+', '-' and '|' walls.
// Walls between two carved neighbours are left open so corridors read at a glance.
//
//   " @ " you       " X " exit      " E " live enemy
//   " ? " item      " # " unexplored "///" solid rock
//   "   " explored, empty room

// Three-character body for one cell. Precedence: player, rock, fog, exit, enemy, item.
std::string cellText(const Dungeon& dung, Pos cell, Pos player, bool revealAll);

// Full framed map, one line per text row, newline separated (no trailing newline).
std::string renderMap(const Dungeon& dung, Pos player, bool revealAll);

const char* mapLegend();
