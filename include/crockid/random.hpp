#pragma once

#include <cstddef>
#include <functional>
#include <stdexcept>

#include "types.hpp"

namespace crockid::random {

/// Thrown when cryptographically secure random bytes cannot be produced (libsodium failed to
/// initialize, or an installed source reported failure).  This is never retried internally.
class entropy_error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/// Signature of a replacement entropy source: must fill `size` bytes at `buf` with
/// cryptographically secure random data, or throw (preferably `entropy_error`) if it cannot.
using source = std::function<void(unsigned char* buf, size_t size)>;

/// API: random/fill
///
/// Fills a buffer with cryptographically secure random bytes from the active source (libsodium's
/// randombytes_buf unless replaced with `set_source`).  libsodium is initialized on first use.
///
/// Inputs:
/// - `buf` -- the buffer to fill.
/// - `size` -- the number of bytes to write into `buf`.
///
/// Throws `entropy_error` if the source is unavailable.  Whatever a replacement source throws is
/// logged at critical level and propagated unchanged.
void fill(unsigned char* buf, size_t size);

/// API: random/random
///
/// Wrapper around `fill` returning a new buffer.
///
/// Inputs:
/// - `size` -- the number of random bytes to be generated.
///
/// Outputs:
/// - random bytes of the specified length.
ustring random(size_t size);

/// API: random/set_source
///
/// Replaces the process-wide entropy source used by `fill`, `random` and identifier generation.
/// Passing an empty function restores the default libsodium source.
///
/// This is an initialization-time setting: it must not be called while other threads may be
/// generating identifiers.
void set_source(source src);

}  // namespace crockid::random
