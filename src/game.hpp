#pragma once
#include "common.hpp"
#include "dungeon.hpp"
#include "items.hpp"
#include "rng.hpp"

#include <cstdint>
#include <string>
#include <vector>

enum class MessageKind : uint8_t {
    Info = 0,
    Combat,
    Loot,
    System,
    Warning,
    Success,
};

// Whole-run state machine.
// InCombat is only ever observed from inside fight(); callers see Exploring, Won or Lost.
enum class GamePhase : uint8_t {
    Exploring = 0,
    InCombat,
    Won,
    Lost,
};

enum class FightResult : uint8_t {
    NoEnemy = 0,
    EnemySlain,
    PlayerDied,
    Finished, // run already over; nothing happened
};

struct Message {
    std::string text;
    MessageKind kind = MessageKind::Info;

    // Consecutive duplicate messages are compacted by incrementing this counter.
    int repeat = 1;
};

struct Player {
    static constexpr int START_HP = 12;
    static constexpr int START_ATK = 2;

    int hp = START_HP;
    int maxHp = START_HP;
    int atk = START_ATK;
    Pos pos{ 0, 0 };

    // Pickup order; duplicates allowed.
    std::vector<ItemKind> inventory;

    bool alive() const { return hp > 0; }
};

// Deterministic "daily" seed derived from the current UTC date.
// If outDateIso is non-null, it receives an ISO date like "2025-12-27".
uint32_t dailySeedUtc(std::string* outDateIso = nullptr);

class Game {
public:
    Game();

    void newGame(uint32_t seed);

    // Starts a run on a prebuilt dungeon (fixed layouts). The RNG is still seeded
    // from `seed` and drives combat rolls.
    // Returns false, leaving the current run untouched, if the start or exit cell
    // is not carved.
    bool newGameWithDungeon(Dungeon d, uint32_t seed);

    // Transitions. None of these throw; invalid actions are reported to the
    // message log and leave the state untouched.
    bool move(Direction d);
    bool move(const std::string& direction);
    FightResult fight();
    bool take();
    bool useItem(const std::string& key, int* healedOut = nullptr);

    // Pushes the current room's description, contents, exits and status.
    void look();
    void showStatus();

    const Dungeon& dungeon() const { return dung; }
    Dungeon& dungeonMut() { return dung; }

    const Player& player() const { return player_; }
    Player& playerMut() { return player_; }

    const Room& currentRoom() const;

    GamePhase phase() const { return phase_; }
    bool isGameOver() const { return phase_ == GamePhase::Lost; }
    bool isGameWon() const { return phase_ == GamePhase::Won; }
    bool isFinished() const { return isGameOver() || isGameWon(); }

    // Run meta
    uint32_t seed() const { return seed_; }
    uint32_t turns() const { return turnCount; }
    uint32_t kills() const { return killCount; }

    // End-of-run cause (e.g., "KILLED BY A TROLL", "ESCAPED THE DUNGEON")
    const std::string& endCause() const { return endCause_; }

    // "[HP: 12/12  ATK: 2  Items: none]"
    std::string statusLine() const;

    void pushMsg(const std::string& s, MessageKind kind = MessageKind::Info);
    const std::vector<Message>& messages() const { return msgs; }

    // Hands the pending messages to the caller and clears the log.
    std::vector<Message> takeMessages();

private:
    Dungeon dung;
    Player player_;
    RNG rng;

    GamePhase phase_ = GamePhase::Exploring;
    uint32_t seed_ = 0;
    uint32_t turnCount = 0;
    uint32_t killCount = 0;
    std::string endCause_;

    std::vector<Message> msgs;

    void startRun(uint32_t seed);
    bool refuseIfFinished();
    Room* currentRoomMut();
};
