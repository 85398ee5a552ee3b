#pragma once

#include "rng.hpp"

#include <string>

// A tiny dice expression: `count` d `sides` + `bonus`.
// Examples:
//   {1,6,0}  => 1d6
//   {2,4,2}  => 2d4+2
struct DiceExpr {
    int count = 1;
    int sides = 4;
    int bonus = 0;
};

// Rolls the dice expression using the game's deterministic RNG.
int rollDice(RNG& rng, DiceExpr d);

// Every attacker (player or enemy) hits for 1..ATK inclusive, i.e. 1dATK.
// An ATK of 1 always deals exactly 1.
DiceExpr attackDice(int atk);

// Pretty-prints a dice expression (e.g., "1d6+2").
std::string diceToString(DiceExpr d, bool includeBonus = true);
