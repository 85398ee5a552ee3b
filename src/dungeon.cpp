#include "dungeon.hpp"

#include <algorithm>
#include <queue>

namespace {

constexpr int FORWARD_WEIGHT = 3;
constexpr int BACKWARD_WEIGHT = 1;

void clearLayout(Dungeon& d) {
    d.grid.fill(false);
    d.rooms.clear();
    d.start = { 0, 0 };
    d.exit = { Dungeon::HEIGHT - 1, Dungeon::WIDTH - 1 };
}

void setCarved(Dungeon& d, Pos p) {
    d.grid[static_cast<size_t>(p.row * Dungeon::WIDTH + p.col)] = true;
}

bool hasRoomNeighbour(const Dungeon& d, Pos p) {
    for (Direction dir : ALL_DIRECTIONS) {
        if (d.isRoom(stepPos(p, dir))) return true;
    }
    return false;
}

// Random walk from start to exit. Moves that increase row/col are weighted
// FORWARD_WEIGHT:BACKWARD_WEIGHT against moves that decrease them, so the walk
// always arrives but may wander back on itself.
void carveGuaranteedPath(Dungeon& d, RNG& rng) {
    Pos cur = d.start;
    setCarved(d, cur);

    // Candidate order is fixed (down, right, up, left) so a seed always yields the same walk.
    static const Direction order[] = {
        Direction::South, Direction::East, Direction::North, Direction::West,
    };

    std::vector<Direction> weighted;
    while (cur != d.exit) {
        weighted.clear();
        for (Direction dir : order) {
            if (!d.inBounds(stepPos(cur, dir))) continue;
            const bool forward = (dir == Direction::South || dir == Direction::East);
            const int w = forward ? FORWARD_WEIGHT : BACKWARD_WEIGHT;
            weighted.insert(weighted.end(), static_cast<size_t>(w), dir);
        }

        cur = stepPos(cur, rng.pick(weighted));
        if (!d.isRoom(cur)) setCarved(d, cur);
    }
}

// Extra side rooms. Only cells touching the carved set are accepted, which keeps
// the dungeon a single connected component.
void carveExtraRooms(Dungeon& d, RNG& rng) {
    const int attempts = Dungeon::WIDTH * Dungeon::HEIGHT / 3;
    for (int i = 0; i < attempts; ++i) {
        Pos p;
        p.row = rng.range(0, Dungeon::HEIGHT - 1);
        p.col = rng.range(0, Dungeon::WIDTH - 1);
        if (d.isRoom(p)) continue;
        if (hasRoomNeighbour(d, p)) setCarved(d, p);
    }
}

void buildRoomRecords(Dungeon& d) {
    for (const Pos& p : d.roomPositions()) {
        d.rooms[p] = Room{};
    }

    Room& startRoom = d.rooms[d.start];
    startRoom.visited = true;
    startRoom.description = entranceDescription();

    d.rooms[d.exit].description = exitDescription();
}

// Returns the eligible rooms that did not receive an enemy.
std::vector<Pos> placeEnemies(Dungeon& d, RNG& rng, std::vector<Pos> eligible) {
    rng.shuffle(eligible);

    const size_t want = std::max<size_t>(2, eligible.size() / 3);
    const size_t n = std::min(want, eligible.size());

    const std::vector<Enemy>& catalog = enemyCatalog();
    for (size_t i = 0; i < n; ++i) {
        // Copy: combat damages the instance, never the template.
        d.rooms[eligible[i]].enemy = rng.pick(catalog);
    }

    return std::vector<Pos>(eligible.begin() + static_cast<std::ptrdiff_t>(n), eligible.end());
}

void placeItems(Dungeon& d, RNG& rng, std::vector<Pos> remaining) {
    rng.shuffle(remaining);

    const size_t want = std::max<size_t>(2, remaining.size() / 2);
    const size_t n = std::min(want, remaining.size());

    std::vector<ItemKind> pool = itemCatalog();
    rng.shuffle(pool);

    for (size_t i = 0; i < n; ++i) {
        d.rooms[remaining[i]].item = pool[i % pool.size()];
    }
}

void assignDescriptions(Dungeon& d, RNG& rng) {
    const std::vector<std::string>& descs = roomDescriptions();
    for (const Pos& p : d.roomPositions()) {
        Room& r = d.rooms[p];
        if (r.description.empty()) r.description = rng.pick(descs);
    }
}

} // namespace

const char* directionName(Direction d) {
    switch (d) {
        case Direction::North: return "north";
        case Direction::South: return "south";
        case Direction::East:  return "east";
        case Direction::West:  return "west";
    }
    return "north";
}

bool parseDirection(const std::string& name, Direction& out) {
    const std::string s = toLower(trim(name));
    for (Direction d : ALL_DIRECTIONS) {
        if (s == directionName(d)) {
            out = d;
            return true;
        }
    }
    return false;
}

Room* Dungeon::roomAt(Pos p) {
    auto it = rooms.find(p);
    return it == rooms.end() ? nullptr : &it->second;
}

const Room* Dungeon::roomAt(Pos p) const {
    auto it = rooms.find(p);
    return it == rooms.end() ? nullptr : &it->second;
}

void Dungeon::carve(Pos p) {
    if (!inBounds(p)) return;
    setCarved(*this, p);
    rooms.emplace(p, Room{});
}

bool Dungeon::connectedEast(Pos p) const {
    return isRoom(p) && isRoom(stepPos(p, Direction::East));
}

bool Dungeon::connectedSouth(Pos p) const {
    return isRoom(p) && isRoom(stepPos(p, Direction::South));
}

std::vector<Pos> Dungeon::roomPositions() const {
    std::vector<Pos> out;
    for (int r = 0; r < HEIGHT; ++r) {
        for (int c = 0; c < WIDTH; ++c) {
            if (isRoom({ r, c })) out.push_back({ r, c });
        }
    }
    return out;
}

int Dungeon::visitedCount() const {
    int n = 0;
    for (const auto& kv : rooms) {
        if (kv.second.visited) ++n;
    }
    return n;
}

bool Dungeon::isFullyConnected() const {
    if (!isRoom(start)) return false;

    std::array<bool, WIDTH * HEIGHT> seen{};
    auto idx = [](Pos p) { return static_cast<size_t>(p.row * WIDTH + p.col); };

    std::queue<Pos> q;
    q.push(start);
    seen[idx(start)] = true;
    int reached = 1;

    while (!q.empty()) {
        const Pos p = q.front();
        q.pop();
        for (Direction dir : ALL_DIRECTIONS) {
            const Pos n = stepPos(p, dir);
            if (!isRoom(n) || seen[idx(n)]) continue;
            seen[idx(n)] = true;
            ++reached;
            q.push(n);
        }
    }

    return reached == static_cast<int>(roomPositions().size());
}

void Dungeon::generate(RNG& rng) {
    clearLayout(*this);

    carveGuaranteedPath(*this, rng);
    carveExtraRooms(*this, rng);
    buildRoomRecords(*this);

    std::vector<Pos> eligible;
    for (const Pos& p : roomPositions()) {
        if (p != start && p != exit) eligible.push_back(p);
    }

    std::vector<Pos> remaining = placeEnemies(*this, rng, std::move(eligible));
    placeItems(*this, rng, std::move(remaining));
    assignDescriptions(*this, rng);
}
