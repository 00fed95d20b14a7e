// include/iso7064/iso7064.hpp - Umbrella header that exposes iso7064lib components.

#pragma once

// Umbrella header for iso7064lib.
// Users should generally include only this file.

#include <iso7064/core/charset.hpp>
#include <iso7064/core/check_digits.hpp>
#include <iso7064/core/hybrid_system.hpp>
#include <iso7064/core/parameters.hpp>
#include <iso7064/core/pure_system.hpp>
#include <iso7064/core/scheme.hpp>
#include <iso7064/io/format.hpp>
#include <iso7064/util/debug.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace iso7064 {

    using core::calculate_check_digit;
    using core::calculate_hybrid_system;
    using core::calculate_pure_system;
    using core::InvalidCharacterSet;
    using core::Parameters;
    using core::resolve_parameters;
    using core::Scheme;
    using core::verify_check_digit;

    // MOD 11-10 single digit, MOD 97-10 double digit.
    inline std::optional<std::string> calculate_numeric_check_digit(std::string_view value,
                                                                    bool double_digit) {
        return calculate_check_digit(value, charset::NUMERIC, double_digit);
    }

    inline bool verify_numeric_check_digit(std::string_view value, bool double_digit) {
        return verify_check_digit(value, charset::NUMERIC, double_digit);
    }

    // MOD 17-16 single digit, MOD 251-16 double digit.
    inline std::optional<std::string> calculate_hex_check_digit(std::string_view value,
                                                                bool double_digit) {
        return calculate_check_digit(value, charset::HEXADECIMAL, double_digit);
    }

    inline bool verify_hex_check_digit(std::string_view value, bool double_digit) {
        return verify_check_digit(value, charset::HEXADECIMAL, double_digit);
    }

    // MOD 27-26 single digit, MOD 661-26 double digit.
    inline std::optional<std::string> calculate_alpha_check_digit(std::string_view value,
                                                                  bool double_digit) {
        return calculate_check_digit(value, charset::ALPHABETIC, double_digit);
    }

    inline bool verify_alpha_check_digit(std::string_view value, bool double_digit) {
        return verify_check_digit(value, charset::ALPHABETIC, double_digit);
    }

    // MOD 37-36 single digit, MOD 1271-36 double digit.
    inline std::optional<std::string> calculate_alphanumeric_check_digit(std::string_view value,
                                                                         bool double_digit) {
        return calculate_check_digit(value, charset::ALPHANUMERIC, double_digit);
    }

    inline bool verify_alphanumeric_check_digit(std::string_view value, bool double_digit) {
        return verify_check_digit(value, charset::ALPHANUMERIC, double_digit);
    }

    inline std::optional<std::string> calculate_mod11_2_check_digit(std::string_view value) {
        return calculate_check_digit(value, charset::NUMERIC_WITH_X, false);
    }

    inline bool verify_mod11_2_check_digit(std::string_view value) {
        return verify_check_digit(value, charset::NUMERIC_WITH_X, false);
    }

    inline std::optional<std::string> calculate_mod37_2_check_digit(std::string_view value) {
        return calculate_check_digit(value, charset::ALPHANUMERIC_WITH_STAR, false);
    }

    inline bool verify_mod37_2_check_digit(std::string_view value) {
        return verify_check_digit(value, charset::ALPHANUMERIC_WITH_STAR, false);
    }

    inline constexpr int ISO7064_VERSION_MAJOR = 0;
    inline constexpr int ISO7064_VERSION_MINOR = 1;
    inline constexpr int ISO7064_VERSION_PATCH = 0;

} // namespace iso7064
