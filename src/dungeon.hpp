#pragma once
#include "common.hpp"
#include "content.hpp"
#include "items.hpp"
#include "rng.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

enum class Direction : uint8_t {
    North = 0,
    South,
    East,
    West,
};

inline constexpr Direction ALL_DIRECTIONS[] = {
    Direction::North, Direction::South, Direction::East, Direction::West,
};

inline Pos stepPos(Pos p, Direction d) {
    switch (d) {
        case Direction::North: return { p.row - 1, p.col };
        case Direction::South: return { p.row + 1, p.col };
        case Direction::East:  return { p.row, p.col + 1 };
        case Direction::West:  return { p.row, p.col - 1 };
    }
    return p;
}

const char* directionName(Direction d);

// Accepts "north".."west" (any case). Single-letter aliases are a command-surface
// concern and are handled by CommandTable.
bool parseDirection(const std::string& name, Direction& out);

struct Room {
    std::optional<Enemy> enemy;
    std::optional<ItemKind> item;
    bool visited = false; // false -> true only
    std::string description;

    bool hasLiveEnemy() const { return enemy.has_value() && enemy->alive(); }
};

class Dungeon {
public:
    static constexpr int WIDTH = 7;
    static constexpr int HEIGHT = 5;

    // Carved cells, row-major. Topology is fixed once generate() returns.
    std::array<bool, WIDTH * HEIGHT> grid{};

    // One record per carved cell.
    std::unordered_map<Pos, Room> rooms;

    Pos start{ 0, 0 };
    Pos exit{ HEIGHT - 1, WIDTH - 1 };

    Dungeon() = default;

    bool inBounds(Pos p) const {
        return p.row >= 0 && p.col >= 0 && p.row < HEIGHT && p.col < WIDTH;
    }

    bool isRoom(Pos p) const {
        return inBounds(p) && grid[static_cast<size_t>(p.row * WIDTH + p.col)];
    }

    Room* roomAt(Pos p);
    const Room* roomAt(Pos p) const;

    // Marks a cell carved and creates its (empty) room record.
    // Builds fixed layouts to hand to Game::newGameWithDungeon.
    void carve(Pos p);

    // Wall rendering: true when both this cell and its neighbour are rooms.
    bool connectedEast(Pos p) const;
    bool connectedSouth(Pos p) const;

    // Carved positions in row-major order (stable iteration order).
    std::vector<Pos> roomPositions() const;

    int roomCount() const { return static_cast<int>(rooms.size()); }
    int visitedCount() const;

    // Flood fill (4-adjacent) from start covers every carved cell.
    bool isFullyConnected() const;

    // Builds a fresh dungeon; replaces any previous contents.
    void generate(RNG& rng);
};
