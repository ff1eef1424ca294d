#include "crockid/random.hpp"

#include <sodium/core.h>
#include <sodium/randombytes.h>

#include <oxen/log.hpp>

#include "crockid/logging.hpp"

namespace crockid::random {

namespace log = oxen::log;

namespace {

    inline auto cat = log::Cat(std::string{LOG_CATEGORY});

    source& installed_source() {
        static source src;
        return src;
    }

    void sodium_fill(unsigned char* buf, size_t size) {
        // sodium_init() is itself thread-safe, but there is no need to call it more than once.
        static const bool initialized = sodium_init() >= 0;
        if (!initialized)
            throw entropy_error{"libsodium initialization failed; no secure entropy available"};
        randombytes_buf(buf, size);
    }

}  // namespace

void fill(unsigned char* buf, size_t size) {
    try {
        if (auto& src = installed_source())
            src(buf, size);
        else
            sodium_fill(buf, size);
    } catch (const std::exception& e) {
        log::critical(cat, "Unable to obtain {} random bytes: {}", size, e.what());
        throw;
    }
}

ustring random(size_t size) {
    ustring result;
    result.resize(size);
    fill(result.data(), size);

    return result;
}

void set_source(source src) {
    installed_source() = std::move(src);
}

}  // namespace crockid::random
