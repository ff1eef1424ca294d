#include "crockid/identifier.hpp"

#include <oxenc/hex.h>

#include <cstring>
#include <iterator>
#include <oxen/log.hpp>
#include <oxen/log/format.hpp>
#include <vector>

#include "crockid/export.h"
#include "crockid/identifier.h"
#include "crockid/logging.hpp"

using namespace std::literals;
using namespace oxen::log::literals;

namespace crockid {

namespace log = oxen::log;
namespace mp = boost::multiprecision;

namespace {

    inline auto cat = log::Cat(std::string{LOG_CATEGORY});

}  // namespace

std::string_view to_string(parse_errc e) {
    switch (e) {
        case parse_errc::invalid_length: return "invalid length"sv;
        case parse_errc::invalid_encoding: return "invalid encoding"sv;
        case parse_errc::checksum_mismatch: return "checksum mismatch"sv;
    }
    return "unknown error"sv;
}

parse_error::parse_error(parse_errc code) :
        std::invalid_argument{"Invalid identifier: {}"_format(to_string(code))}, code_{code} {}

namespace detail {

    std::optional<parse_errc> parse_into(
            std::string_view text, unsigned char* payload, size_t payload_size, uint8_t& checksum) {
        const auto expected_size = canonical_size(payload_size);
        if (text.size() != expected_size) {
            log::debug(
                    cat,
                    "Rejected identifier: length {} instead of {}",
                    text.size(),
                    expected_size);
            return parse_errc::invalid_length;
        }

        auto upper = ascii_upper(text);
        auto body = std::string_view{upper}.substr(0, expected_size - 1);
        auto symbol = upper.back();

        ustring decoded;
        try {
            decoded = base32::decode(body);
        } catch (const base32::decode_error& e) {
            log::debug(cat, "Rejected identifier {}: {}", upper, e.what());
            return parse_errc::invalid_encoding;
        }

        // When 8N is not a multiple of 5 the low bits of the last body symbol are padding, which
        // the canonical form always writes as zero.
        if (auto pad = body.size() * 5 - payload_size * 8;
            pad > 0 && (base32::symbol_value(body.back()) & ((1 << pad) - 1)) != 0) {
            log::debug(
                    cat,
                    "Rejected identifier {}: final body symbol {} has non-zero padding bits",
                    upper,
                    body.back());
            return parse_errc::invalid_encoding;
        }

        auto derived = derive_checksum(decoded);
        if (checksum_symbol(derived) != symbol) {
            log::debug(
                    cat,
                    "Rejected identifier {}: checksum symbol {} does not match payload {} "
                    "(expected {})",
                    upper,
                    symbol,
                    oxenc::to_hex(decoded.begin(), decoded.end()),
                    checksum_symbol(derived));
            return parse_errc::checksum_mismatch;
        }

        std::memcpy(payload, decoded.data(), payload_size);
        checksum = derived;
        return std::nullopt;
    }

    bigint to_integer(ustring_view payload) {
        bigint value;
        mp::import_bits(value, payload.begin(), payload.end());
        return value;
    }

    void from_integer(const bigint& value, unsigned char* payload, size_t size) {
        if (value < 0)
            throw std::out_of_range{"Identifier value cannot be negative"};
        if (value != 0 && mp::msb(value) >= size * 8)
            throw std::out_of_range{"Identifier value {} does not fit in {} bytes"_format(
                    value.str(), size)};

        std::memset(payload, 0, size);
        if (value == 0)
            return;

        std::vector<unsigned char> be;
        mp::export_bits(value, std::back_inserter(be), 8);
        std::memcpy(payload + (size - be.size()), be.data(), be.size());
    }

}  // namespace detail

}  // namespace crockid

namespace {

static_assert(crockid::identifier::payload_size == CROCKID_PAYLOAD_SIZE);
static_assert(crockid::identifier::string_size == CROCKID_STRING_SIZE);
static_assert(
        static_cast<int>(crockid::parse_errc::invalid_length) == CROCKID_PARSE_INVALID_LENGTH &&
        static_cast<int>(crockid::parse_errc::invalid_encoding) == CROCKID_PARSE_INVALID_ENCODING &&
        static_cast<int>(crockid::parse_errc::checksum_mismatch) ==
                CROCKID_PARSE_CHECKSUM_MISMATCH);

inline bool set_error(char* error, const std::exception& e) {
    if (!error)
        return false;

    std::string msg = e.what();
    if (msg.size() > 255)
        msg.resize(255);
    std::memcpy(error, msg.c_str(), msg.size() + 1);
    return false;
}

void write_string(const crockid::identifier& id, char* out) {
    auto s = id.to_string();
    std::memcpy(out, s.c_str(), s.size() + 1);
}

}  // namespace

extern "C" {

CROCKID_C_API bool crockid_generate(char* out, char* error) {
    try {
        write_string(crockid::identifier::generate(), out);
        return true;
    } catch (const std::exception& e) {
        return set_error(error, e);
    }
}

CROCKID_C_API CROCKID_PARSE_RESULT
crockid_parse(const char* text, unsigned char* payload_out, char* canonical_out) {
    if (!text)
        return CROCKID_PARSE_INVALID_LENGTH;

    crockid::identifier::payload_type payload;
    uint8_t checksum = 0;
    if (auto err = crockid::detail::parse_into(
                text, payload.data(), crockid::identifier::payload_size, checksum))
        return static_cast<CROCKID_PARSE_RESULT>(*err);

    if (payload_out)
        std::memcpy(payload_out, payload.data(), payload.size());
    if (canonical_out)
        write_string(crockid::identifier{payload}, canonical_out);
    return CROCKID_PARSE_OK;
}

CROCKID_C_API void crockid_from_bytes(const unsigned char* payload, char* out) {
    crockid::identifier::payload_type p;
    std::memcpy(p.data(), payload, p.size());
    write_string(crockid::identifier{p}, out);
}

CROCKID_C_API bool crockid_equal(const char* a, const char* b) {
    if (!a || !b)
        return false;
    auto id = crockid::identifier::try_parse(a);
    return id && *id == std::string_view{b};
}

CROCKID_C_API unsigned char crockid_checksum(const unsigned char* data, size_t size) {
    return crockid::derive_checksum({data, size});
}

}  // extern "C"
