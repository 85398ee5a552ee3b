#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

enum class Action : uint8_t {
    None = 0, // unrecognised input

    // Movement
    North,
    South,
    East,
    West,

    Map,
    RevealMap,
    Look,
    Take,
    Fight,
    Use,       // takes an item key argument
    Inventory,
    Help,
    Quit,
};

struct ActionHash {
    size_t operator()(Action a) const noexcept { return static_cast<size_t>(a); }
};

struct Command {
    Action action = Action::None;
    std::string arg; // only used by Action::Use
    std::string raw; // normalised input line (lowercase, trimmed)
};

// Command words, loaded from gridcrawl_settings.ini.
//
// Built-in words are always recognised. Extra words can be added per action:
//   alias_<action> = word[, word, ...]
// e.g.
//   alias_north = k, up
//   alias_take = pickup
// Setting an alias list to "none" clears earlier additions for that action.
// A user alias never shadows a built-in word.
class CommandTable {
public:
    static CommandTable defaults();
    void loadOverridesFromIni(const std::string& settingsPath);

    // Replaces the user aliases for one action. Returns false for an unknown action name.
    bool setAliases(const std::string& actionName, const std::string& wordList);

    // Case-insensitive. Empty input yields Action::None with an empty `raw`.
    Command parse(const std::string& line) const;

    // One line per action: "north: north, n, k".
    std::vector<std::pair<std::string, std::string>> describeAll() const;
    std::string describeAction(Action a) const;

    static const char* actionName(Action a);
    static std::optional<Action> parseActionName(const std::string& name);

private:
    std::unordered_map<std::string, Action> builtin;
    std::unordered_map<Action, std::vector<std::string>, ActionHash> aliases;

    std::optional<Action> lookup(const std::string& word) const;
    static std::vector<std::string> split(const std::string& s, char delim);
};
