#include "commands.hpp"
#include "common.hpp"

#include <algorithm>
#include <fstream>
#include <initializer_list>
#include <sstream>

namespace {

const Action kAllActions[] = {
    Action::North, Action::South, Action::East, Action::West,
    Action::Map, Action::RevealMap, Action::Look, Action::Take,
    Action::Fight, Action::Use, Action::Inventory, Action::Help, Action::Quit,
};

} // namespace

CommandTable CommandTable::defaults() {
    CommandTable t;
    auto bind = [&](Action a, std::initializer_list<const char*> words) {
        for (const char* w : words) t.builtin[w] = a;
    };

    bind(Action::North, { "north", "n" });
    bind(Action::South, { "south", "s" });
    bind(Action::East,  { "east", "e" });
    bind(Action::West,  { "west", "w" });
    bind(Action::Map, { "map" });
    bind(Action::RevealMap, { "revealmap" });
    bind(Action::Look, { "look" });
    bind(Action::Take, { "take", "get" });
    bind(Action::Fight, { "fight", "attack" });
    bind(Action::Use, { "use" });
    bind(Action::Inventory, { "inventory", "i", "stats" });
    bind(Action::Help, { "help" });
    bind(Action::Quit, { "quit", "q" });
    return t;
}

const char* CommandTable::actionName(Action a) {
    switch (a) {
        case Action::North:     return "north";
        case Action::South:     return "south";
        case Action::East:      return "east";
        case Action::West:      return "west";
        case Action::Map:       return "map";
        case Action::RevealMap: return "revealmap";
        case Action::Look:      return "look";
        case Action::Take:      return "take";
        case Action::Fight:     return "fight";
        case Action::Use:       return "use";
        case Action::Inventory: return "inventory";
        case Action::Help:      return "help";
        case Action::Quit:      return "quit";
        case Action::None:      break;
    }
    return "none";
}

std::optional<Action> CommandTable::parseActionName(const std::string& nameIn) {
    const std::string name = toLower(trim(nameIn));
    for (Action a : kAllActions) {
        if (name == actionName(a)) return a;
    }
    if (name == "reveal_map") return Action::RevealMap;
    if (name == "inv") return Action::Inventory;
    return std::nullopt;
}

std::vector<std::string> CommandTable::split(const std::string& s, char delim) {
    std::vector<std::string> out;
    std::string cur;
    std::istringstream ss(s);
    while (std::getline(ss, cur, delim)) {
        cur = toLower(trim(cur));
        if (!cur.empty()) out.push_back(cur);
    }
    return out;
}

bool CommandTable::setAliases(const std::string& actionNameIn, const std::string& wordList) {
    const auto act = parseActionName(actionNameIn);
    if (!act.has_value()) return false;

    std::vector<std::string> words = split(wordList, ',');
    if (words.size() == 1 && words.front() == "none") words.clear();

    std::vector<std::string> kept;
    for (const auto& w : words) {
        // Multi-word aliases can't be matched against the first token.
        if (w.find_first_of(" \t") != std::string::npos) continue;
        kept.push_back(w);
    }
    aliases[*act] = std::move(kept);
    return true;
}

void CommandTable::loadOverridesFromIni(const std::string& settingsPath) {
    std::ifstream in(settingsPath);
    if (!in) return;

    std::string line;
    while (std::getline(in, line)) {
        // Strip comments
        auto commentPos = line.find_first_of("#;");
        if (commentPos != std::string::npos) line = line.substr(0, commentPos);

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        const std::string key = toLower(trim(line.substr(0, eq)));
        const std::string val = trim(line.substr(eq + 1));

        if (key.rfind("alias_", 0) != 0) continue;
        (void)setAliases(key.substr(6), val);
    }
}

std::optional<Action> CommandTable::lookup(const std::string& word) const {
    auto it = builtin.find(word);
    if (it != builtin.end()) return it->second;

    for (const auto& kv : aliases) {
        for (const auto& w : kv.second) {
            if (w == word) return kv.first;
        }
    }
    return std::nullopt;
}

Command CommandTable::parse(const std::string& line) const {
    Command cmd;
    cmd.raw = toLower(trim(line));
    if (cmd.raw.empty()) return cmd;

    const size_t sp = cmd.raw.find_first_of(" \t");
    const std::string head = cmd.raw.substr(0, sp);
    const std::string rest = (sp == std::string::npos) ? std::string() : trim(cmd.raw.substr(sp + 1));

    const auto act = lookup(head);
    if (!act.has_value()) return cmd;

    if (*act == Action::Use) {
        cmd.action = Action::Use;
        cmd.arg = rest;
        return cmd;
    }

    // Every other command is a single word.
    if (!rest.empty()) return cmd;

    cmd.action = *act;
    return cmd;
}

std::string CommandTable::describeAction(Action a) const {
    std::vector<std::string> words;
    // Built-ins first, in a stable order.
    for (const auto& kv : builtin) {
        if (kv.second == a) words.push_back(kv.first);
    }
    std::sort(words.begin(), words.end(), [](const std::string& x, const std::string& y) {
        if (x.size() != y.size()) return x.size() > y.size();
        return x < y;
    });

    auto it = aliases.find(a);
    if (it != aliases.end()) {
        for (const auto& w : it->second) {
            if (builtin.count(w) == 0) words.push_back(w);
        }
    }

    std::string out;
    for (size_t i = 0; i < words.size(); ++i) {
        if (i) out += ", ";
        out += words[i];
    }
    if (a == Action::Use) out += " <item>";
    return out;
}

std::vector<std::pair<std::string, std::string>> CommandTable::describeAll() const {
    std::vector<std::pair<std::string, std::string>> out;
    for (Action a : kAllActions) {
        out.emplace_back(actionName(a), describeAction(a));
    }
    return out;
}
