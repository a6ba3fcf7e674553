#include "text/TextUtil.hpp"
#include <cctype>

namespace textutil {

static constexpr char32_t kReplacementChar = 0xFFFD;

// Decodes one code point at s[i]. Returns the number of bytes consumed;
// an invalid sequence consumes one byte and yields U+FFFD.
static size_t decode_at(const std::string& s, size_t i, char32_t& cp) {
    const unsigned char c0 = static_cast<unsigned char>(s[i]);
    if (c0 < 0x80) {
        cp = c0;
        return 1;
    }

    size_t len = 0;
    char32_t value = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;

    if (c0 >= 0xC2 && c0 <= 0xDF) {
        len = 2;
        value = c0 & 0x1F;
    } else if (c0 >= 0xE0 && c0 <= 0xEF) {
        len = 3;
        value = c0 & 0x0F;
        if (c0 == 0xE0) lo = 0xA0;  // overlong
        if (c0 == 0xED) hi = 0x9F;  // surrogates
    } else if (c0 >= 0xF0 && c0 <= 0xF4) {
        len = 4;
        value = c0 & 0x07;
        if (c0 == 0xF0) lo = 0x90;
        if (c0 == 0xF4) hi = 0x8F;
    } else {
        cp = kReplacementChar;
        return 1;
    }

    if (i + len > s.size()) {
        cp = kReplacementChar;
        return 1;
    }

    for (size_t k = 1; k < len; ++k) {
        const unsigned char c = static_cast<unsigned char>(s[i + k]);
        const unsigned char min = (k == 1) ? lo : 0x80;
        const unsigned char max = (k == 1) ? hi : 0xBF;
        if (c < min || c > max) {
            cp = kReplacementChar;
            return 1;
        }
        value = (value << 6) | (c & 0x3F);
    }

    cp = value;
    return len;
}

// nullptr = not in the table
static const char* sanitize_replacement(char32_t cp) {
    switch (cp) {
        case 0x2010:  // hyphen
        case 0x2011:  // non-breaking hyphen
        case 0x2012:  // figure dash
        case 0x2013:  // en dash
        case 0x2014:  // em dash
        case 0x2015:  // horizontal bar
        case 0x00AD:  // soft hyphen
        case 0x2022:  // bullet
        case 0x2500:  // box drawings light horizontal
        case 0x2501:  // box drawings heavy horizontal
        case 0x25A0:  // black square
        case 0x25AA:  // black small square
        case 0x25BA:  // black right-pointing pointer
        case 0x25CF:  // black circle
        case 0x25E6:  // white bullet
            return "-";
        case 0x2018:
        case 0x2019:
            return "'";
        case 0x201C:
        case 0x201D:
            return "\"";
        case 0x2026:
            return "...";
        case 0x00A0:
            return " ";
        case 0x200B:  // zero-width space
        case 0xFEFF:  // byte order mark
            return "";
        default:
            return nullptr;
    }
}

std::string sanitize(const std::string& s) {
    std::string out;
    out.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        if (static_cast<unsigned char>(s[i]) < 0x80) {
            out.push_back(s[i]);
            ++i;
            continue;
        }

        char32_t cp = 0;
        const size_t n = decode_at(s, i, cp);
        if (cp == kReplacementChar) {
            // invalid bytes never survive, so a deleted zero-width char
            // cannot glue stray bytes into a new code point
            append_utf8(out, kReplacementChar);
        } else if (const char* rep = sanitize_replacement(cp)) {
            out += rep;
        } else {
            out.append(s, i, n);
        }
        i += n;
    }

    return out;
}

static bool is_space_byte(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

std::string trim(const std::string& s) {
    size_t a = 0;
    while (a < s.size() && is_space_byte(s[a])) ++a;

    size_t b = s.size();
    while (b > a && is_space_byte(s[b - 1])) --b;

    return s.substr(a, b - a);
}

std::vector<std::string> split_lines(const std::string& s) {
    std::vector<std::string> lines;
    size_t i = 0;
    while (i <= s.size()) {
        size_t j = s.find('\n', i);
        if (j == std::string::npos) j = s.size();
        lines.push_back(trim(s.substr(i, j - i)));
        i = j + 1;
    }
    return lines;
}

std::u32string decode_utf8(const std::string& s) {
    std::u32string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        char32_t cp = 0;
        i += decode_at(s, i, cp);
        out.push_back(cp);
    }
    return out;
}

void append_utf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::string encode_utf8(const std::u32string& cps) {
    std::string out;
    out.reserve(cps.size());
    for (char32_t cp : cps) append_utf8(out, cp);
    return out;
}

std::string make_valid_utf8(const std::string& s) {
    return encode_utf8(decode_utf8(s));
}

size_t utf8_length(const std::string& s) {
    size_t n = 0;
    size_t i = 0;
    while (i < s.size()) {
        char32_t cp = 0;
        i += decode_at(s, i, cp);
        ++n;
    }
    return n;
}

// Latin Extended-A alternates upper/lower, with the parity flipping twice.
static bool ext_a_is_upper(char32_t cp) {
    if (cp >= 0x0100 && cp <= 0x0137) return cp % 2 == 0;
    if (cp >= 0x0139 && cp <= 0x0148) return cp % 2 == 1;
    if (cp >= 0x014A && cp <= 0x0177) return cp % 2 == 0;
    if (cp == 0x0178) return true;
    if (cp >= 0x0179 && cp <= 0x017E) return cp % 2 == 1;
    return false;
}

static bool is_upper_cp(char32_t cp) {
    if (cp >= 'A' && cp <= 'Z') return true;
    if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) return true;
    if (cp >= 0x0100 && cp <= 0x017F) return ext_a_is_upper(cp);
    return false;
}

static bool is_lower_cp(char32_t cp) {
    if (cp >= 'a' && cp <= 'z') return true;
    if (cp >= 0xDF && cp <= 0xFF && cp != 0xF7) return true;
    if (cp >= 0x0100 && cp <= 0x017F) return !ext_a_is_upper(cp);
    return false;
}

bool is_upper_text(const std::string& s) {
    bool cased = false;
    for (char32_t cp : decode_utf8(s)) {
        if (is_lower_cp(cp)) return false;
        if (is_upper_cp(cp)) cased = true;
    }
    return cased;
}

static char32_t upper_cp(char32_t cp) {
    if (cp >= 'a' && cp <= 'z') return cp - 0x20;
    if (cp >= 0xE0 && cp <= 0xFE && cp != 0xF7) return cp - 0x20;
    if (cp == 0xFF) return 0x0178;
    if (cp == 0x0131) return 'I';
    if (cp == 0x017F) return 'S';
    if (cp >= 0x0100 && cp <= 0x017E && cp != 0x0138 && cp != 0x0149 && !ext_a_is_upper(cp)) return cp - 1;
    return cp;
}

std::string to_upper_text(const std::string& s) {
    std::u32string cps = decode_utf8(s);
    for (char32_t& cp : cps) cp = upper_cp(cp);
    return encode_utf8(cps);
}

static const char* fold_latin1(char32_t cp) {
    if (cp >= 0xE0 && cp <= 0xFE && cp != 0xF7) cp -= 0x20;
    switch (cp) {
        case 0xC0: case 0xC1: case 0xC2: case 0xC3: case 0xC4: case 0xC5: return "a";
        case 0xC6: return "ae";
        case 0xC7: return "c";
        case 0xC8: case 0xC9: case 0xCA: case 0xCB: return "e";
        case 0xCC: case 0xCD: case 0xCE: case 0xCF: return "i";
        case 0xD0: return "d";
        case 0xD1: return "n";
        case 0xD2: case 0xD3: case 0xD4: case 0xD5: case 0xD6: case 0xD8: return "o";
        case 0xD9: case 0xDA: case 0xDB: case 0xDC: return "u";
        case 0xDD: case 0xFF: return "y";
        case 0xDE: return "th";
        case 0xDF: return "ss";
        default: return nullptr;
    }
}

std::string fold_lower(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char32_t cp : decode_utf8(s)) {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(std::tolower(static_cast<int>(cp))));
            continue;
        }
        const char* folded = (cp <= 0xFF) ? fold_latin1(cp) : nullptr;
        if (folded) out += folded;
        else append_utf8(out, cp);
    }
    return out;
}

std::string collapse_spaces(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool prev_space = true;

    for (char c : s) {
        if (is_space_byte(c)) {
            if (!prev_space) {
                out.push_back(' ');
                prev_space = true;
            }
        } else {
            out.push_back(c);
            prev_space = false;
        }
    }

    if (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with_ci(const std::string& s, const std::string& suffix) {
    if (s.size() < suffix.size()) return false;
    const size_t off = s.size() - suffix.size();
    for (size_t i = 0; i < suffix.size(); ++i) {
        const int a = std::tolower(static_cast<unsigned char>(s[off + i]));
        const int b = std::tolower(static_cast<unsigned char>(suffix[i]));
        if (a != b) return false;
    }
    return true;
}

}
