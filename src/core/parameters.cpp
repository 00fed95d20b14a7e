#include <iso7064/core/charset.hpp>
#include <iso7064/core/parameters.hpp>

#include <limits>
#include <string>

namespace iso7064::core {

namespace {

std::string describe_length(std::size_t length, bool double_digit) {
    return "invalid character set: no ISO 7064 " +
           std::string(double_digit ? "double" : "single") + "-digit system for " +
           std::to_string(length) + " characters";
}

} // namespace

Parameters resolve_parameters(std::size_t length, bool double_digit) {
    if (length > static_cast<std::size_t>(std::numeric_limits<int>::max() - 1)) {
        throw InvalidCharacterSet(describe_length(length, double_digit));
    }
    Parameters params;
    params.radix = static_cast<int>(length);
    params.modulus = params.radix + 1;

    if (double_digit) {
        // radices without a table entry keep radix + 1 and are judged below
        const int modulus = detail::double_digit_modulus(params.radix);
        if (modulus != 0) {
            params.modulus = modulus;
        }
#if !ISO7064_ENABLE_MOD251_16
        if (params.radix == 16) {
            throw InvalidCharacterSet(describe_length(length, double_digit));
        }
#endif
    } else if (params.radix == 11) {
        // MOD 11-2: decimal digits plus 'X' as an extra check character
        params.modulus = 11;
        params.radix = 2;
    } else if (params.radix == 37) {
        // MOD 37-2: alphanumerics plus '*' as an extra check character
        params.modulus = 37;
        params.radix = 2;
    }

    if (!detail::supported_radix(params.radix)) {
        throw InvalidCharacterSet(describe_length(length, double_digit));
    }
    return params;
}

Parameters resolve_parameters(std::string_view charset, bool double_digit) {
    if (!detail::has_distinct_characters(charset)) {
        throw InvalidCharacterSet("invalid character set: characters must be distinct");
    }
    return resolve_parameters(charset.size(), double_digit);
}

} // namespace iso7064::core
