#include "crockid/checksum.hpp"

#include <cassert>

namespace crockid {

uint8_t derive_checksum(ustring_view payload) {
    unsigned acc = 0;
    for (auto b : payload)
        acc = (acc * 256 + b) % CHECKSUM_MODULUS;
    return static_cast<uint8_t>(acc);
}

char checksum_symbol(uint8_t value) {
    assert(value < CHECKSUM_MODULUS);
    return checksum_alphabet[value];
}

}  // namespace crockid
