#include "crockid/base32.hpp"

#include <oxen/log/format.hpp>

#include <array>
#include <cstdint>

using namespace oxen::log::literals;

namespace crockid::base32 {

namespace {

    // Reverse lookup for every byte value; -1 marks characters that are not symbols.
    constexpr std::array<int8_t, 256> symbol_table = [] {
        std::array<int8_t, 256> table{};
        table.fill(-1);
        for (size_t i = 0; i < alphabet.size(); i++) {
            auto c = static_cast<unsigned char>(alphabet[i]);
            table[c] = static_cast<int8_t>(i);
            if (c >= 'A' && c <= 'Z')
                table[c + ('a' - 'A')] = static_cast<int8_t>(i);
        }
        table['O'] = table['o'] = 0;
        table['I'] = table['i'] = table['L'] = table['l'] = 1;
        return table;
    }();

    static_assert(alphabet.size() == 32);
    static_assert(symbol_table['U'] == -1 && symbol_table['u'] == -1);

}  // namespace

decode_error::decode_error(char c, size_t position) :
        std::invalid_argument{
                "Invalid Crockford base32 character '{}' at position {}"_format(c, position)},
        character_{c},
        position_{position} {}

int symbol_value(char c) {
    return symbol_table[static_cast<unsigned char>(c)];
}

std::string encode(ustring_view bytes) {
    std::string out;
    out.reserve(encoded_size(bytes.size()));

    uint32_t buffer = 0;
    int bits = 0;
    for (auto b : bytes) {
        buffer = (buffer << 8) | b;
        bits += 8;
        while (bits >= 5) {
            bits -= 5;
            out.push_back(alphabet[(buffer >> bits) & 0x1f]);
        }
    }
    if (bits > 0)
        out.push_back(alphabet[(buffer << (5 - bits)) & 0x1f]);

    return out;
}

bool is_valid(std::string_view text) {
    for (auto c : text)
        if (symbol_value(c) < 0)
            return false;
    return true;
}

ustring decode(std::string_view text) {
    ustring out;
    out.reserve(decoded_size(text.size()));

    uint32_t buffer = 0;
    int bits = 0;
    for (size_t i = 0; i < text.size(); i++) {
        int v = symbol_value(text[i]);
        if (v < 0)
            throw decode_error{text[i], i};
        buffer = (buffer << 5) | static_cast<uint32_t>(v);
        bits += 5;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<unsigned char>(buffer >> bits));
        }
    }

    return out;
}

}  // namespace crockid::base32
