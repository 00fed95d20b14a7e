// include/iso7064/core/pure_system.hpp - ISO 7064 pure systems (weighted sum under a modulus).

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <iso7064/core/charset.hpp>

namespace iso7064::core {

    // Appends one (or, with `double_digit`, two) check characters computed with
    // Horner's rule under `modulus`: p = ((p + value) * radix) mod modulus.
    // Returns std::nullopt for an empty value or one containing a character
    // outside `charset`; lowercase letters are folded to uppercase first.
    // Throws std::invalid_argument unless 2 <= radix < modulus, and
    // std::out_of_range when a check index falls outside `charset`.
    inline std::optional<std::string> calculate_pure_system(std::string_view value, int radix,
                                                            int modulus, std::string_view charset,
                                                            bool double_digit) {
        if (radix < 2 || modulus <= radix) {
            throw std::invalid_argument("pure system requires 2 <= radix < modulus");
        }
        if (value.empty()) {
            return std::nullopt;
        }

        std::string result = detail::to_upper(value);
        std::int64_t p = 0;
        for (const char ch : result) {
            const int index = detail::charset_index(charset, ch);
            if (index < 0) {
                return std::nullopt;
            }
            p = ((p + index) * radix) % modulus;
        }
        if (double_digit) {
            p = (p * radix) % modulus;
        }

        const std::int64_t check = (modulus - p + 1) % modulus;
        if (double_digit) {
            const std::int64_t second = check % radix;
            const std::int64_t first = (check - second) / radix;
            result.push_back(detail::checked_charset_at(charset, first));
            result.push_back(detail::checked_charset_at(charset, second));
        } else {
            result.push_back(detail::checked_charset_at(charset, check));
        }
        return result;
    }

    inline std::optional<std::string> calculate_pure_system(const char *value, int radix,
                                                            int modulus, std::string_view charset,
                                                            bool double_digit) {
        if (value == nullptr) {
            return std::nullopt;
        }
        return calculate_pure_system(std::string_view(value), radix, modulus, charset,
                                     double_digit);
    }

} // namespace iso7064::core
