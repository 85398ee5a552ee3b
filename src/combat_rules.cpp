#include "combat_rules.hpp"

#include <algorithm>
#include <sstream>

int rollDice(RNG& rng, DiceExpr d) {
    d.count = std::max(0, d.count);
    d.sides = std::max(0, d.sides);

    int sum = d.bonus;
    if (d.count <= 0 || d.sides <= 0) return sum;
    for (int i = 0; i < d.count; ++i) {
        sum += rng.range(1, d.sides);
    }
    return sum;
}

DiceExpr attackDice(int atk) {
    return { 1, std::max(1, atk), 0 };
}

std::string diceToString(DiceExpr d, bool includeBonus) {
    std::ostringstream ss;
    ss << std::max(0, d.count) << "d" << std::max(0, d.sides);
    if (includeBonus && d.bonus != 0) {
        if (d.bonus > 0) ss << "+";
        ss << d.bonus;
    }
    return ss.str();
}
