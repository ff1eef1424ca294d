#pragma once

#include <algorithm>
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

#include "base32.hpp"
#include "checksum.hpp"
#include "random.hpp"
#include "types.hpp"
#include "util.hpp"

namespace crockid {

using bigint = boost::multiprecision::cpp_int;

/// Payload width, in bytes, of `crockid::identifier`.
inline constexpr size_t DEFAULT_PAYLOAD_SIZE = 15;

/// Length of the canonical string form of an identifier with a `payload_size`-byte payload: the
/// Base32 body followed by one checksum symbol.
constexpr size_t canonical_size(size_t payload_size) {
    return base32::encoded_size(payload_size) + 1;
}

/// Reasons a string is rejected by `basic_identifier::parse`, in the order they are checked.
enum class parse_errc {
    invalid_length = 1,  // not exactly `canonical_size(N)` characters
    invalid_encoding,    // body contains a non-Crockford character
    checksum_mismatch,   // body decodes but the final symbol does not match its checksum
};

std::string_view to_string(parse_errc e);

class parse_error : public std::invalid_argument {
  public:
    explicit parse_error(parse_errc code);

    parse_errc code() const { return code_; }

  private:
    parse_errc code_;
};

namespace detail {

    // Validates `text` as the canonical form of a `payload_size`-byte identifier.  On success the
    // decoded payload is written to `payload` (which must have room for `payload_size` bytes),
    // its checksum to `checksum`, and std::nullopt is returned; otherwise returns the first failed
    // check without touching the outputs.  Rejections are logged at debug level.
    std::optional<parse_errc> parse_into(
            std::string_view text, unsigned char* payload, size_t payload_size, uint8_t& checksum);

    // Big-endian payload value.
    bigint to_integer(ustring_view payload);

    // Writes `value` as a `size`-byte big-endian number (left-padded with zero bytes).  Throws
    // std::out_of_range if the value is negative or needs more than `size` bytes.
    void from_integer(const bigint& value, unsigned char* payload, size_t size);

}  // namespace detail

/// An immutable identifier made of `N` random payload bytes plus a mod-37 checksum, written as
/// `ceil(N*8/5)` Crockford Base32 symbols followed by one checksum symbol, e.g. (for N = 15):
///
///     4S0Y2VZ7SF4VGHNZNYTZ9GVQ6
///
/// Identifiers compare equal when their canonical (upper case) strings are equal.
template <size_t N>
class basic_identifier {
    static_assert(N > 0, "identifier payloads cannot be empty");

  public:
    static constexpr size_t payload_size = N;
    static constexpr size_t body_size = base32::encoded_size(N);
    static constexpr size_t string_size = canonical_size(N);

    using payload_type = std::array<unsigned char, N>;

    /// Constructs an identifier over the given payload, deriving its checksum.
    explicit basic_identifier(const payload_type& payload) :
            payload_{payload}, checksum_{derive_checksum(to_sv(payload_))} {}

    /// API: crockid/basic_identifier::generate
    ///
    /// Creates a new identifier from N bytes of fresh secure randomness.
    ///
    /// Throws `random::entropy_error` if no entropy is available.
    static basic_identifier generate() {
        payload_type payload;
        random::fill(payload.data(), payload.size());
        return basic_identifier{payload};
    }

    /// API: crockid/basic_identifier::parse
    ///
    /// Parses and validates an identifier string.  Input is case-insensitive and the body may use
    /// the Crockford confusables (O for 0, I or L for 1).  The checks are applied in order: length,
    /// body encoding, then checksum.
    ///
    /// Throws `parse_error` naming the failed check.
    static basic_identifier parse(std::string_view text) {
        payload_type payload;
        uint8_t check = 0;
        if (auto err = detail::parse_into(text, payload.data(), N, check))
            throw parse_error{*err};
        return basic_identifier{payload, check};
    }

    /// Same as `parse`, but returns std::nullopt instead of throwing.
    static std::optional<basic_identifier> try_parse(std::string_view text) {
        payload_type payload;
        uint8_t check = 0;
        if (detail::parse_into(text, payload.data(), N, check))
            return std::nullopt;
        return basic_identifier{payload, check};
    }

    /// Constructs an identifier from exactly N raw payload bytes.  Throws std::invalid_argument for
    /// any other size.
    static basic_identifier from_bytes(ustring_view bytes) {
        if (bytes.size() != N)
            throw std::invalid_argument{
                    "Invalid identifier payload: expected " + std::to_string(N) + " bytes, got " +
                    std::to_string(bytes.size())};
        payload_type payload;
        std::copy(bytes.begin(), bytes.end(), payload.begin());
        return basic_identifier{payload};
    }

    /// Constructs an identifier from its integer value.  The payload is always N bytes wide, so
    /// values with fewer significant bytes are left-padded with zeros (this restores any leading
    /// zero bytes lost in the integer form).  Throws std::out_of_range for negative values or values
    /// of 2^(8N) or more.
    static basic_identifier from_integer(const bigint& value) {
        payload_type payload;
        detail::from_integer(value, payload.data(), N);
        return basic_identifier{payload};
    }

    const payload_type& payload() const { return payload_; }

    /// Checksum value in [0, 36].
    uint8_t checksum() const { return checksum_; }

    ustring bytes() const { return ustring(payload_.data(), payload_.size()); }

    /// The payload as a big-endian unsigned integer.  The checksum is not part of this value.
    bigint to_integer() const { return detail::to_integer(to_sv(payload_)); }

    /// The Base32 body, without the checksum symbol.
    std::string body() const { return base32::encode(to_sv(payload_)); }

    /// The canonical string form: upper case body followed by the checksum symbol.
    std::string to_string() const {
        auto s = body();
        s += checksum_symbol(checksum_);
        return s;
    }

    bool operator==(const basic_identifier& other) const { return to_string() == other.to_string(); }

    /// Compares against a string by parsing it first; strings that do not parse are never equal.
    bool operator==(std::string_view other) const {
        auto id = try_parse(other);
        return id && *this == *id;
    }

  private:
    basic_identifier(const payload_type& payload, uint8_t checksum) :
            payload_{payload}, checksum_{checksum} {}

    payload_type payload_;
    uint8_t checksum_;
};

template <size_t N>
std::ostream& operator<<(std::ostream& o, const basic_identifier<N>& id) {
    return o << id.to_string();
}

using identifier = basic_identifier<DEFAULT_PAYLOAD_SIZE>;

}  // namespace crockid

template <size_t N>
struct std::hash<crockid::basic_identifier<N>> {
    size_t operator()(const crockid::basic_identifier<N>& id) const {
        return std::hash<std::string>{}(id.to_string());
    }
};
