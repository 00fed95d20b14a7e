// include/iso7064/core/hybrid_system.hpp - ISO 7064 hybrid systems MOD (N+1)-N.

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <iso7064/core/charset.hpp>

namespace iso7064::core {

    // Double-add-double recurrence over an alphabet of radix N, reduced modulo
    // N and N + 1 alternately. Yields a single check character from `charset`.
    // Soft failures match calculate_pure_system.
    // Throws std::out_of_range when the check index falls outside `charset`.
    inline std::optional<std::string> calculate_hybrid_system(std::string_view value,
                                                              std::string_view charset) {
        if (value.empty()) {
            return std::nullopt;
        }

        std::string result = detail::to_upper(value);
        const int radix = static_cast<int>(charset.size());
        int pos = radix;
        for (const char ch : result) {
            const int index = detail::charset_index(charset, ch);
            if (index < 0) {
                return std::nullopt;
            }
            pos += index;
            if (pos > radix) {
                pos -= radix;
            }
            pos *= 2;
            if (pos >= radix + 1) {
                pos -= radix + 1;
            }
        }

        pos = radix + 1 - pos;
        if (pos == radix) {
            pos = 0;
        }
        result.push_back(detail::checked_charset_at(charset, pos));
        return result;
    }

    inline std::optional<std::string> calculate_hybrid_system(const char *value,
                                                              std::string_view charset) {
        if (value == nullptr) {
            return std::nullopt;
        }
        return calculate_hybrid_system(std::string_view(value), charset);
    }

} // namespace iso7064::core
