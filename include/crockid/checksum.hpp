#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "types.hpp"

namespace crockid {

/// Checksum values are taken modulo 37, the smallest prime larger than the 32 symbol Base32
/// alphabet.
inline constexpr unsigned CHECKSUM_MODULUS = 37;

/// Symbols for checksum values 0-36: the Crockford Base32 alphabet followed by Crockford's five
/// check-only symbols.
inline constexpr std::string_view checksum_alphabet = "0123456789ABCDEFGHJKMNPQRSTVWXYZ*~$=U";

namespace detail {
    constexpr bool all_distinct(std::string_view s) {
        for (size_t i = 0; i < s.size(); i++)
            for (size_t j = i + 1; j < s.size(); j++)
                if (s[i] == s[j])
                    return false;
        return true;
    }
}  // namespace detail

static_assert(checksum_alphabet.size() == CHECKSUM_MODULUS);
static_assert(detail::all_distinct(checksum_alphabet));

/// API: crockid/derive_checksum
///
/// Computes the checksum of a payload: the payload read as a big-endian unsigned integer, modulo
/// 37.  Bytes are reduced one at a time so payloads of any length are handled exactly.
///
/// Inputs:
/// - `payload` -- the bytes to checksum; an empty payload has checksum 0.
///
/// Outputs:
/// - a value in [0, 36].
uint8_t derive_checksum(ustring_view payload);

/// API: crockid/checksum_symbol
///
/// Returns the checksum symbol for a value in [0, 36].  Passing anything larger is a programming
/// error.
char checksum_symbol(uint8_t value);

}  // namespace crockid
