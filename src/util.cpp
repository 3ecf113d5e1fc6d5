#include "util.hpp"

#include <cctype>
#include <cstdlib>
#include <limits>

namespace decaf {

std::string trim(const std::string& s) {
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        ++start;
    }
    auto end = s.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        --end;
    }
    return std::string(start, end);
}

std::string expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

bool parse_positive_uint(const std::string& s, uint32_t& out) {
    std::string t = trim(s);
    if (t.empty() || t.size() > 10) return false;

    uint64_t value = 0;
    for (char c : t) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }
    if (value == 0 || value > std::numeric_limits<uint32_t>::max()) return false;

    out = static_cast<uint32_t>(value);
    return true;
}

} // namespace decaf
