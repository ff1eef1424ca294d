#pragma once

#include <oxenc/common.h>

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

#include "types.hpp"

namespace crockid {

// Helper function to go to/from char pointers to unsigned char pointers:
inline const unsigned char* to_unsigned(const char* x) {
    return reinterpret_cast<const unsigned char*>(x);
}
inline const char* from_unsigned(const unsigned char* x) {
    return reinterpret_cast<const char*>(x);
}
// Helper function to switch between basic_string_view<C> and ustring_view
inline ustring_view to_unsigned_sv(std::string_view v) {
    return {to_unsigned(v.data()), v.size()};
}
inline std::string_view from_unsigned_sv(ustring_view v) {
    return {from_unsigned(v.data()), v.size()};
}
template <oxenc::basic_char Char, size_t N>
inline std::basic_string_view<Char> to_sv(const std::array<Char, N>& v) {
    return {v.data(), N};
}

/// Returns a copy of `s` with the ASCII letters a-z replaced by A-Z; all other bytes (including
/// non-ASCII utf-8 sequences) are left untouched.
inline std::string ascii_upper(std::string_view s) {
    std::string result{s};
    for (auto& c : result)
        if (c >= 'a' && c <= 'z')
            c -= 'a' - 'A';
    return result;
}

}  // namespace crockid
