// include/iso7064/core/check_digits.hpp - Calculation and verification entry points.

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <iso7064/core/hybrid_system.hpp>
#include <iso7064/core/parameters.hpp>
#include <iso7064/core/pure_system.hpp>

namespace iso7064::core {

    // Resolves the system for `charset` and appends its check character(s) to
    // the uppercased `value`. std::nullopt signals unrepresentable data (empty,
    // null or out-of-alphabet characters); InvalidCharacterSet signals an
    // alphabet that maps onto no ISO 7064 system.
    std::optional<std::string> calculate_check_digit(std::string_view value,
                                                     std::string_view charset,
                                                     bool double_digit);

    std::optional<std::string> calculate_check_digit(const char *value, std::string_view charset,
                                                     bool double_digit);

    // True when the trailing check character(s) of `value` match the ones
    // recomputed from the rest of it. Values no longer than the check itself,
    // and null values, are never valid.
    bool verify_check_digit(std::string_view value, std::string_view charset, bool double_digit);

    bool verify_check_digit(const char *value, std::string_view charset, bool double_digit);

    bool verify_check_digit(std::string_view value, int radix, int modulus,
                            std::string_view charset, bool double_digit);

    bool verify_check_digit(const char *value, int radix, int modulus, std::string_view charset,
                            bool double_digit);

} // namespace iso7064::core
