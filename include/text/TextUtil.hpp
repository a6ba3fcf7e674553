#pragma once
#include <string>
#include <vector>

namespace textutil {

// Replace typographic unicode (dashes, curly quotes, bullet glyphs, ellipsis,
// zero-width chars, BOM, box drawing, marker glyphs) with ASCII-safe text.
// Invalid UTF-8 becomes U+FFFD, so the result is always valid UTF-8.
// Total and idempotent.
std::string sanitize(const std::string& s);

std::string trim(const std::string& s);

// split on '\n', every line trimmed (so "\r\n" input works too)
std::vector<std::string> split_lines(const std::string& s);

// UTF-8 decode; invalid bytes become U+FFFD
std::u32string decode_utf8(const std::string& s);
std::string encode_utf8(const std::u32string& cps);
void append_utf8(std::string& out, char32_t cp);

// invalid sequences replaced by U+FFFD
std::string make_valid_utf8(const std::string& s);

// number of code points
size_t utf8_length(const std::string& s);

// true if the text has at least one cased letter and no lowercase ones
// (ASCII, Latin-1 and Latin Extended-A letters are considered)
bool is_upper_text(const std::string& s);

std::string to_upper_text(const std::string& s);

// lowercase + strip Latin-1 accents ("Experiência" -> "experiencia")
std::string fold_lower(const std::string& s);

// collapse whitespace runs into one space, trimmed
std::string collapse_spaces(const std::string& s);

bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with_ci(const std::string& s, const std::string& suffix);

}
