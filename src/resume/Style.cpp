#include "resume/Style.hpp"

#include <cctype>
#include <stdexcept>

namespace resume {

static int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    const char l = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (l >= 'a' && l <= 'f') return 10 + (l - 'a');
    return -1;
}

Rgb rgb_from_hex(const std::string& hex) {
    const std::string s = (!hex.empty() && hex[0] == '#') ? hex.substr(1) : hex;
    if (s.size() != 6) throw std::invalid_argument("bad color: " + hex);

    int v[6];
    for (size_t i = 0; i < 6; ++i) {
        v[i] = hex_digit(s[i]);
        if (v[i] < 0) throw std::invalid_argument("bad color: " + hex);
    }

    Rgb c;
    c.r = (v[0] * 16 + v[1]) / 255.0;
    c.g = (v[2] * 16 + v[3]) / 255.0;
    c.b = (v[4] * 16 + v[5]) / 255.0;
    return c;
}

}  // namespace resume
