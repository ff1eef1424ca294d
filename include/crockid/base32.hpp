#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

#include "types.hpp"

// Crockford's Base32 (https://www.crockford.com/base32.html) without the optional check symbol and
// without hyphen handling: 5 bits per symbol, most significant bits first, no padding characters.

namespace crockid::base32 {

/// The 32 encoding symbols, in value order.  I, L, O and U are excluded.
inline constexpr std::string_view alphabet = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

/// Thrown by `decode` when the input contains a character that is not a Crockford symbol, even
/// after folding lower case and the O -> 0, I/L -> 1 confusables.
class decode_error : public std::invalid_argument {
  public:
    decode_error(char c, size_t position);

    /// The offending input character.
    char character() const { return character_; }
    /// Index of the offending character in the input.
    size_t position() const { return position_; }

  private:
    char character_;
    size_t position_;
};

/// Number of symbols needed to encode `byte_size` bytes: ceil(byte_size * 8 / 5).
constexpr size_t encoded_size(size_t byte_size) {
    return (byte_size * 8 + 4) / 5;
}

/// Number of whole bytes carried by `symbol_size` symbols: floor(symbol_size * 5 / 8).
constexpr size_t decoded_size(size_t symbol_size) {
    return symbol_size * 5 / 8;
}

/// Returns the 5-bit value of a single symbol, or -1 if `c` is not an acceptable symbol.  Lower
/// case is accepted, and O/o decode as 0 while I/i/L/l decode as 1.
int symbol_value(char c);

/// API: base32/encode
///
/// Encodes bytes into upper case Crockford Base32.  The final symbol is zero-padded on the right
/// when the bit count is not a multiple of 5.
///
/// Inputs:
/// - `bytes` -- the bytes to encode.
///
/// Outputs:
/// - a string of `encoded_size(bytes.size())` symbols.
std::string encode(ustring_view bytes);

/// API: base32/is_valid
///
/// Returns true if every character of `text` is acceptable to `decode`.
bool is_valid(std::string_view text);

/// API: base32/decode
///
/// Decodes Crockford Base32 text, case-insensitively and with the confusable substitutions
/// described for `symbol_value`.  Trailing bits that do not complete a byte are dropped.
///
/// Inputs:
/// - `text` -- the encoded symbols.
///
/// Outputs:
/// - `decoded_size(text.size())` bytes.
///
/// Throws `decode_error` on the first unacceptable character.
ustring decode(std::string_view text);

}  // namespace crockid::base32
