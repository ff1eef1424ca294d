#pragma once

#ifdef __cplusplus
extern "C" {
#endif

#include <stdbool.h>
#include <stddef.h>

#include "export.h"

// Payload width and canonical string length of the identifiers handled by this API (the C++
// `crockid::identifier` type).  String output buffers need one more byte for the null terminator.
#define CROCKID_PAYLOAD_SIZE 15
#define CROCKID_STRING_SIZE 25

typedef enum CROCKID_PARSE_RESULT {
    CROCKID_PARSE_OK = 0,
    CROCKID_PARSE_INVALID_LENGTH = 1,
    CROCKID_PARSE_INVALID_ENCODING = 2,
    CROCKID_PARSE_CHECKSUM_MISMATCH = 3,
} CROCKID_PARSE_RESULT;

/// API: crockid/crockid_generate
///
/// Generates a new random identifier.
///
/// Inputs:
/// - `out` -- [out] buffer of at least `CROCKID_STRING_SIZE + 1` bytes that receives the
///   null-terminated canonical identifier string.
/// - `error` -- [out] the pointer to a buffer in which we will write an error string if an error
///   occurs; error messages are discarded if this is given as NULL.  If non-NULL this must be a
///   buffer of at least 256 bytes.
///
/// Outputs:
/// - `bool` -- Returns true on success; returns false and writes the exception message as a
///   C-string into `error` (if not NULL) if secure random bytes are unavailable.
CROCKID_EXPORT bool crockid_generate(char* out, char* error) CROCKID_WARN_UNUSED;

/// API: crockid/crockid_parse
///
/// Parses and validates an identifier string (case-insensitive).
///
/// Inputs:
/// - `text` -- [in] null-terminated identifier string.
/// - `payload_out` -- [out] buffer of `CROCKID_PAYLOAD_SIZE` bytes that receives the payload on
///   success; may be NULL.
/// - `canonical_out` -- [out] buffer of `CROCKID_STRING_SIZE + 1` bytes that receives the
///   canonical (upper case) string on success; may be NULL.
///
/// Outputs:
/// - `CROCKID_PARSE_RESULT` -- `CROCKID_PARSE_OK`, or the first validation check that failed.  The
///   output buffers are only written on success.
CROCKID_EXPORT CROCKID_PARSE_RESULT
crockid_parse(const char* text, unsigned char* payload_out, char* canonical_out);

/// API: crockid/crockid_from_bytes
///
/// Writes the canonical identifier string for a payload.
///
/// Inputs:
/// - `payload` -- [in] `CROCKID_PAYLOAD_SIZE` payload bytes.
/// - `out` -- [out] buffer of at least `CROCKID_STRING_SIZE + 1` bytes.
CROCKID_EXPORT void crockid_from_bytes(const unsigned char* payload, char* out);

/// API: crockid/crockid_equal
///
/// Returns true if both strings are valid identifiers with the same canonical form.
CROCKID_EXPORT bool crockid_equal(const char* a, const char* b);

/// API: crockid/crockid_checksum
///
/// Returns the checksum value (0-36) of an arbitrary byte buffer: its big-endian value mod 37.
CROCKID_EXPORT unsigned char crockid_checksum(const unsigned char* data, size_t size);

#ifdef __cplusplus
}
#endif
