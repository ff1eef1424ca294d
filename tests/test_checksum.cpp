#include <boost/multiprecision/cpp_int.hpp>
#include <catch2/catch_test_macros.hpp>
#include <crockid/checksum.hpp>
#include <crockid/identifier.hpp>
#include <crockid/random.hpp>
#include <crockid/util.hpp>
#include <set>

#include "utils.hpp"

using namespace crockid;

TEST_CASE("Checksum alphabet", "[checksum][alphabet]") {
    CHECK(checksum_alphabet.size() == 37);
    CHECK(std::set<char>(checksum_alphabet.begin(), checksum_alphabet.end()).size() == 37);
    CHECK(checksum_alphabet.substr(0, 32) == base32::alphabet);

    CHECK(checksum_symbol(0) == '0');
    CHECK(checksum_symbol(9) == '9');
    CHECK(checksum_symbol(10) == 'A');
    CHECK(checksum_symbol(31) == 'Z');
    CHECK(checksum_symbol(32) == '*');
    CHECK(checksum_symbol(33) == '~');
    CHECK(checksum_symbol(34) == '$');
    CHECK(checksum_symbol(35) == '=');
    CHECK(checksum_symbol(36) == 'U');
}

TEST_CASE("Checksum derivation", "[checksum][derive]") {
    CHECK(derive_checksum(ustring_view{}) == 0);
    CHECK(derive_checksum("00"_hexbytes) == 0);
    CHECK(derive_checksum(to_unsigned_sv("f")) == 28);
    CHECK(derive_checksum(to_unsigned_sv("foobar")) == 6);
    CHECK(derive_checksum("ff"_hexbytes) == 33);
    CHECK(derive_checksum("25"_hexbytes) == 0);  // 37
    CHECK(derive_checksum("26"_hexbytes) == 1);
    CHECK(derive_checksum("000000000000000000000000000001"_hexbytes) == 1);
    CHECK(derive_checksum("ffffffffffffffffffffffffffffff"_hexbytes) == 25);
    CHECK(derive_checksum("2641e16fe7cbc9b846bfafb5f4c377"_hexbytes) == 6);
    CHECK(derive_checksum("ffffffffffffffffffffffffffffffffffffffff"_hexbytes) == 8);
    CHECK(derive_checksum("0bdc1773cb3021b7c8e1f348ab86efd7cad9f272"_hexbytes) == 2);

    SECTION("leading zero bytes do not change the checksum") {
        CHECK(derive_checksum("0000000026"_hexbytes) == derive_checksum("26"_hexbytes));
        CHECK(derive_checksum("00ffffffffffffffffffffffffffff"_hexbytes) ==
              derive_checksum("ffffffffffffffffffffffffffff"_hexbytes));
    }
}

TEST_CASE("Checksum matches arbitrary precision modulus", "[checksum][bigint]") {
    for (size_t size : {1, 2, 7, 8, 9, 15, 16, 20, 32, 33, 64, 100}) {
        for (int i = 0; i < 20; i++) {
            auto payload = random::random(size);
            auto value = detail::to_integer(payload);
            auto checksum = derive_checksum(payload);
            INFO("payload size " << size);
            CHECK(checksum < 37);
            CHECK(checksum == static_cast<unsigned>(bigint{value % 37}));
            CHECK(derive_checksum(payload) == checksum);
        }
    }
}
