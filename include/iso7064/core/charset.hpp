// include/iso7064/core/charset.hpp - Predefined ISO 7064 alphabets and character lookup helpers.

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace iso7064::charset {

    // MOD 11-10 / MOD 97-10
    inline constexpr std::string_view NUMERIC = "0123456789";
    // MOD 11-2, the trailing 'X' only ever appears as a check character
    inline constexpr std::string_view NUMERIC_WITH_X = "0123456789X";
    // MOD 17-16 / MOD 251-16
    inline constexpr std::string_view HEXADECIMAL = "0123456789ABCDEF";
    // MOD 27-26 / MOD 661-26
    inline constexpr std::string_view ALPHABETIC = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
    // MOD 37-36 / MOD 1271-36
    inline constexpr std::string_view ALPHANUMERIC = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ";
    // MOD 37-2, the trailing '*' only ever appears as a check character
    inline constexpr std::string_view ALPHANUMERIC_WITH_STAR =
        "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ*";

} // namespace iso7064::charset

namespace iso7064::core::detail {

    constexpr char fold_upper(char ch) noexcept {
        if (ch >= 'a' && ch <= 'z') {
            return static_cast<char>(ch - 'a' + 'A');
        }
        return ch;
    }

    inline std::string to_upper(std::string_view text) {
        std::string result;
        result.reserve(text.size());
        for (const char ch : text) {
            result.push_back(fold_upper(ch));
        }
        return result;
    }

    // Zero-based value of `ch` within `charset`, or -1 when absent.
    inline int charset_index(std::string_view charset, char ch) noexcept {
        const std::size_t position = charset.find(ch);
        if (position == std::string_view::npos) {
            return -1;
        }
        return static_cast<int>(position);
    }

    // Throws std::out_of_range when `index` falls outside `charset`.
    inline char checked_charset_at(std::string_view charset, std::int64_t index) {
        if (index < 0 || static_cast<std::size_t>(index) >= charset.size()) {
            throw std::out_of_range("check value does not fit the character set");
        }
        return charset[static_cast<std::size_t>(index)];
    }

    inline bool has_distinct_characters(std::string_view charset) noexcept {
        std::array<bool, 256> seen{};
        for (const char ch : charset) {
            const auto slot = static_cast<unsigned char>(ch);
            if (seen[slot]) {
                return false;
            }
            seen[slot] = true;
        }
        return true;
    }

} // namespace iso7064::core::detail
