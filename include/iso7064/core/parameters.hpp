// include/iso7064/core/parameters.hpp - Radix and modulus selection for ISO 7064 systems.

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

#ifndef ISO7064_ENABLE_MOD251_16
#define ISO7064_ENABLE_MOD251_16 1
#endif

namespace iso7064::core {

    // Raised when an alphabet does not map onto any supported ISO 7064 system.
    // This is a configuration error of the caller, never a property of the data.
    class InvalidCharacterSet : public std::invalid_argument {
      public:
        explicit InvalidCharacterSet(const std::string &message)
            : std::invalid_argument(message) {}
    };

    struct Parameters {
        int radix = 0;
        int modulus = 0;

        // The dispatcher's structural rule: modulus one above radix selects the
        // hybrid recurrence, everything else the pure weighted sum.
        constexpr bool is_hybrid() const noexcept { return modulus == radix + 1; }

        friend constexpr bool operator==(const Parameters &, const Parameters &) = default;
    };

    constexpr int check_digit_count(bool double_digit) noexcept { return double_digit ? 2 : 1; }

    namespace detail {

        // Double-digit moduli fixed by ISO 7064. MOD 251-16 is not part of the
        // standard and can be compiled out. Returns 0 when no modulus is defined.
        constexpr int double_digit_modulus(int radix) noexcept {
            switch (radix) {
                case 10:
                    return 97;
#if ISO7064_ENABLE_MOD251_16
                case 16:
                    return 251;
#endif
                case 26:
                    return 661;
                case 36:
                    return 1271;
                default:
                    return 0;
            }
        }

        constexpr bool supported_radix(int radix) noexcept {
            return radix == 2 || radix == 10 || radix == 16 || radix == 26 || radix == 36;
        }

    } // namespace detail

    // Resolves (radix, modulus) for an alphabet of `length` characters.
    // Throws InvalidCharacterSet when no ISO 7064 system applies.
    Parameters resolve_parameters(std::size_t length, bool double_digit);

    // Same as above, additionally rejecting alphabets with repeated characters.
    Parameters resolve_parameters(std::string_view charset, bool double_digit);

} // namespace iso7064::core
