// tests/unit/test_parameters.cpp - Unit tests for radix and modulus resolution.

#include <cstddef>
#include <iostream>
#include <stdexcept>
#include <string_view>

#include <iso7064/iso7064.hpp>

namespace {

using iso7064::core::InvalidCharacterSet;
using iso7064::core::Parameters;
using iso7064::core::resolve_parameters;

bool throws_invalid_character_set(std::size_t length, bool double_digit) {
    try {
        (void)resolve_parameters(length, double_digit);
    } catch (const InvalidCharacterSet&) {
        return true;
    }
    return false;
}

bool throws_invalid_character_set(std::string_view charset, bool double_digit) {
    try {
        (void)resolve_parameters(charset, double_digit);
    } catch (const InvalidCharacterSet&) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    bool all_good = true;
    const auto expect = [&](bool condition, const char* message) {
        if (!condition) {
            all_good = false;
            std::cerr << "parameter test failed: " << message << '\n';
        }
    };

    expect(resolve_parameters(std::size_t{10}, false) == Parameters{10, 11}, "numeric single is MOD 11-10");
    expect(resolve_parameters(std::size_t{16}, false) == Parameters{16, 17}, "hex single is MOD 17-16");
    expect(resolve_parameters(std::size_t{26}, false) == Parameters{26, 27}, "alpha single is MOD 27-26");
    expect(resolve_parameters(std::size_t{36}, false) == Parameters{36, 37},
           "alphanumeric single is MOD 37-36");
    expect(resolve_parameters(std::size_t{2}, false) == Parameters{2, 3}, "binary single is MOD 3-2");

    expect(resolve_parameters(std::size_t{10}, true) == Parameters{10, 97}, "numeric double is MOD 97-10");
    expect(resolve_parameters(std::size_t{26}, true) == Parameters{26, 661}, "alpha double is MOD 661-26");
    expect(resolve_parameters(std::size_t{36}, true) == Parameters{36, 1271},
           "alphanumeric double is MOD 1271-36");
#if ISO7064_ENABLE_MOD251_16
    expect(resolve_parameters(std::size_t{16}, true) == Parameters{16, 251}, "hex double is MOD 251-16");
#else
    expect(throws_invalid_character_set(std::size_t{16}, true), "MOD 251-16 disabled");
#endif

    expect(resolve_parameters(std::size_t{11}, false) == Parameters{2, 11},
           "eleven characters select MOD 11-2");
    expect(resolve_parameters(std::size_t{37}, false) == Parameters{2, 37},
           "thirty-seven characters select MOD 37-2");

    for (const std::size_t length : {0U, 1U, 3U, 5U, 9U, 12U, 17U, 27U, 38U, 64U}) {
        expect(throws_invalid_character_set(length, false), "unsupported single-digit length");
        expect(throws_invalid_character_set(length, true), "unsupported double-digit length");
    }
    expect(throws_invalid_character_set(std::size_t{11}, true), "MOD 11-2 has no double-digit form");
    expect(throws_invalid_character_set(std::size_t{37}, true), "MOD 37-2 has no double-digit form");
    expect(resolve_parameters(std::size_t{2}, true) == Parameters{2, 3},
           "binary double keeps MOD 3-2");

    expect(resolve_parameters(iso7064::charset::NUMERIC, true) == Parameters{10, 97},
           "charset overload uses the alphabet size");
    expect(resolve_parameters(iso7064::charset::ALPHANUMERIC_WITH_STAR, false) == Parameters{2, 37},
           "charset overload resolves MOD 37-2");
    expect(throws_invalid_character_set(std::string_view("01234"), false), "five characters rejected");
    expect(throws_invalid_character_set(std::string_view("0123456780"), false),
           "duplicate characters rejected");

    try {
        (void)resolve_parameters(std::size_t{5}, false);
        expect(false, "length five must throw");
    } catch (const std::invalid_argument& err) {
        expect(std::string_view(err.what()).find("5 characters") != std::string_view::npos,
               "message names the offending length");
    }

    expect(iso7064::core::check_digit_count(false) == 1, "single digit count");
    expect(iso7064::core::check_digit_count(true) == 2, "double digit count");
    expect(Parameters{10, 11}.is_hybrid(), "MOD 11-10 is hybrid");
    expect(!Parameters{10, 97}.is_hybrid(), "MOD 97-10 is pure");
    expect(!Parameters{2, 11}.is_hybrid(), "MOD 11-2 is pure");

    if (!all_good) {
        std::cerr << "parameter tests failed\n";
        return 1;
    }
    std::cout << "parameter tests passed\n";
    return 0;
}
