#include "game.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

uint32_t dailySeedUtc(std::string* outDateIso) {
    const std::time_t t = std::time(nullptr);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif

    const int year = tm.tm_year + 1900;
    const int mon = tm.tm_mon + 1;
    const int day = tm.tm_mday;

    if (outDateIso) {
        std::ostringstream ss;
        ss << std::setfill('0') << std::setw(4) << year << "-" << std::setw(2) << mon << "-" << std::setw(2) << day;
        *outDateIso = ss.str();
    }

    // YYYYMMDD -> stable hash (not crypto; just deterministic across platforms).
    const uint32_t ymd = static_cast<uint32_t>(year * 10000 + mon * 100 + day);
    return hashCombine(ymd, tag32("DAILY"));
}

Game::Game() = default;

void Game::startRun(uint32_t seed) {
    seed_ = seed;
    rng = RNG(seed);
    phase_ = GamePhase::Exploring;
    turnCount = 0;
    killCount = 0;
    endCause_.clear();
    msgs.clear();
}

void Game::newGame(uint32_t seed) {
    startRun(seed);
    dung.generate(rng);

    player_ = Player{};
    player_.pos = dung.start;
}

bool Game::newGameWithDungeon(Dungeon d, uint32_t seed) {
    if (!d.isRoom(d.start) || !d.isRoom(d.exit)) {
        pushMsg("REFUSED DUNGEON: START AND EXIT MUST BE ROOMS.", MessageKind::Warning);
        return false;
    }

    startRun(seed);
    dung = std::move(d);

    player_ = Player{};
    player_.pos = dung.start;
    if (Room* r = dung.roomAt(dung.start)) r->visited = true;
    return true;
}

const Room& Game::currentRoom() const {
    const Room* r = dung.roomAt(player_.pos);
    // Runs only ever place the player on carved cells; this covers a Game with no run yet.
    static const Room empty{};
    return r ? *r : empty;
}

// Null only before the first run starts.
Room* Game::currentRoomMut() {
    return dung.roomAt(player_.pos);
}

void Game::pushMsg(const std::string& s, MessageKind kind) {
    // Coalesce consecutive identical messages to reduce spam.
    if (!msgs.empty()) {
        Message& last = msgs.back();
        if (last.text == s && last.kind == kind) {
            if (last.repeat < 9999) {
                ++last.repeat;
            }
            return;
        }
    }

    // Keep some scrollback if nobody drains the log.
    if (msgs.size() > 400) {
        msgs.erase(msgs.begin(), msgs.begin() + 100);
    }
    msgs.push_back({ s, kind });
}

std::vector<Message> Game::takeMessages() {
    std::vector<Message> out;
    out.swap(msgs);
    return out;
}

bool Game::refuseIfFinished() {
    if (!isFinished()) return false;
    pushMsg(isGameWon() ? "YOU HAVE ALREADY ESCAPED." : "YOU ARE DEAD.", MessageKind::Warning);
    return true;
}

bool Game::move(const std::string& direction) {
    Direction d;
    if (!parseDirection(direction, d)) {
        pushMsg("INVALID DIRECTION.", MessageKind::Warning);
        return false;
    }
    return move(d);
}

bool Game::move(Direction d) {
    if (refuseIfFinished()) return false;

    const Pos dest = stepPos(player_.pos, d);
    if (!dung.isRoom(dest)) {
        pushMsg("YOU CAN'T GO THAT WAY!", MessageKind::Warning);
        return false;
    }

    const Room& here = currentRoom();
    if (here.hasLiveEnemy()) {
        pushMsg("THE " + toUpper(here.enemy->name) + " BLOCKS YOUR WAY! FIGHT FIRST!", MessageKind::Warning);
        return false;
    }

    player_.pos = dest;
    if (Room* r = currentRoomMut()) r->visited = true;
    ++turnCount;

    if (player_.pos == dung.exit) {
        phase_ = GamePhase::Won;
        endCause_ = "ESCAPED THE DUNGEON";
        pushMsg("YOU FOUND THE EXIT! CONGRATULATIONS, YOU WIN!", MessageKind::Success);
    }
    return true;
}

std::string Game::statusLine() const {
    std::ostringstream ss;
    ss << "[HP: " << player_.hp << "/" << player_.maxHp
       << "  ATK: " << player_.atk
       << "  Items: " << inventoryToString(player_.inventory) << "]";
    return ss.str();
}

void Game::showStatus() {
    pushMsg(statusLine(), MessageKind::System);
}
