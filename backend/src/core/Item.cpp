#include "Item.hpp"
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>

bool parseAmount(const std::string& text, double& out) {
    std::string t = text;
    // trim spaces
    while (!t.empty() && std::isspace((unsigned char)t.front())) t.erase(t.begin());
    while (!t.empty() && std::isspace((unsigned char)t.back())) t.pop_back();
    if (t.empty()) return false;

    bool sawDigit = false;
    for (char c : t) {
        if (std::isdigit((unsigned char)c)) { sawDigit = true; continue; }
        if (c == '.' || c == '+' || c == '-' || c == 'e' || c == 'E') continue;
        return false;
    }
    if (!sawDigit) return false;

    errno = 0;
    char* end = nullptr;
    double v = std::strtod(t.c_str(), &end);
    if (end != t.c_str() + t.size() || errno == ERANGE || !std::isfinite(v))
        return false;

    out = v;
    return true;
}
