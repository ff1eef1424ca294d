#pragma once

#include <oxenc/hex.h>

#include <cstddef>
#include <iterator>
#include <string>
#include <string_view>

#include "crockid/types.hpp"

inline crockid::ustring operator""_hexbytes(const char* x, size_t n) {
    crockid::ustring bytes;
    oxenc::from_hex(x, x + n, std::back_inserter(bytes));
    return bytes;
}

// Returns `s` with the character at `pos` replaced by `c`.
inline std::string replace_at(std::string s, size_t pos, char c) {
    s[pos] = c;
    return s;
}
