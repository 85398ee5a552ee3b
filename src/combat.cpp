#include "game.hpp"

#include "combat_rules.hpp"

#include <algorithm>
#include <sstream>

namespace {

std::string articleFor(const std::string& name) {
    if (name.empty()) return "A";
    switch (name[0]) {
        case 'A': case 'E': case 'I': case 'O': case 'U':
        case 'a': case 'e': case 'i': case 'o': case 'u':
            return "AN";
        default:
            return "A";
    }
}

} // namespace

// One call resolves the whole encounter: the player strikes first each round and
// the exchange stops as soon as either side drops to 0.
FightResult Game::fight() {
    if (isFinished()) {
        (void)refuseIfFinished();
        return FightResult::Finished;
    }

    Room* room = currentRoomMut();
    if (!room || !room->hasLiveEnemy()) {
        pushMsg("NOTHING TO FIGHT HERE.");
        return FightResult::NoEnemy;
    }

    Enemy& e = *room->enemy;
    const std::string name = toUpper(e.name);

    phase_ = GamePhase::InCombat;
    ++turnCount;
    pushMsg("=== BATTLE: YOU VS " + name + "! ===", MessageKind::Combat);

    while (e.alive() && player_.alive()) {
        const int dmg = rollDice(rng, attackDice(player_.atk));
        e.hp -= dmg;
        {
            std::ostringstream ss;
            ss << "YOU DEAL " << dmg << " DMG -> " << name << " HP: " << std::max(0, e.hp);
            pushMsg(ss.str(), MessageKind::Combat);
        }

        if (!e.alive()) {
            pushMsg("VICTORY! THE " + name + " IS SLAIN!", MessageKind::Success);
            room->enemy.reset();
            ++killCount;
            phase_ = GamePhase::Exploring;
            return FightResult::EnemySlain;
        }

        const int edmg = rollDice(rng, attackDice(e.atk));
        player_.hp -= edmg;
        {
            std::ostringstream ss;
            ss << name << " DEALS " << edmg << " DMG -> YOUR HP: " << std::max(0, player_.hp);
            pushMsg(ss.str(), MessageKind::Combat);
        }
    }

    // Only reachable with the player at or below 0.
    phase_ = GamePhase::Lost;
    endCause_ = "KILLED BY " + articleFor(name) + " " + name;
    pushMsg("YOU HAVE FALLEN... GAME OVER.", MessageKind::Warning);
    return FightResult::PlayerDied;
}
