#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

// Grid position: row-major, 0-indexed.
struct Pos {
    int row = 0;
    int col = 0;
};

inline bool operator==(const Pos& a, const Pos& b) {
    return a.row == b.row && a.col == b.col;
}

inline bool operator!=(const Pos& a, const Pos& b) {
    return !(a == b);
}

namespace std {
template <>
struct hash<Pos> {
    size_t operator()(const Pos& p) const noexcept {
        return (static_cast<size_t>(static_cast<uint32_t>(p.row)) << 16) ^
               static_cast<size_t>(static_cast<uint32_t>(p.col));
    }
};
} // namespace std

inline std::string toUpper(std::string s) {
    for (char& c : s) {
        if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
    }
    return s;
}

inline std::string toLower(std::string s) {
    for (char& c : s) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return s;
}

inline std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    const size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos) return std::string();
    const size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}
