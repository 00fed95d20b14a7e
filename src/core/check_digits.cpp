#include <iso7064/core/check_digits.hpp>

#include <cstddef>

namespace iso7064::core {

namespace {

// Keep this a literal modulus comparison: the double-digit pure systems share
// radices with the hybrid ones and only differ in their modulus.
std::optional<std::string> dispatch(std::string_view value, int radix, int modulus,
                                    std::string_view charset, bool double_digit) {
    if (modulus != radix + 1) {
        return calculate_pure_system(value, radix, modulus, charset, double_digit);
    }
    return calculate_hybrid_system(value, charset);
}

} // namespace

std::optional<std::string> calculate_check_digit(std::string_view value,
                                                 std::string_view charset,
                                                 bool double_digit) {
    const Parameters params = resolve_parameters(charset, double_digit);
    return dispatch(value, params.radix, params.modulus, charset, double_digit);
}

std::optional<std::string> calculate_check_digit(const char *value, std::string_view charset,
                                                 bool double_digit) {
    if (value == nullptr) {
        // an invalid alphabet throws even when there is no data
        resolve_parameters(charset, double_digit);
        return std::nullopt;
    }
    return calculate_check_digit(std::string_view(value), charset, double_digit);
}

bool verify_check_digit(std::string_view value, std::string_view charset, bool double_digit) {
    const Parameters params = resolve_parameters(charset, double_digit);
    return verify_check_digit(value, params.radix, params.modulus, charset, double_digit);
}

bool verify_check_digit(const char *value, std::string_view charset, bool double_digit) {
    const Parameters params = resolve_parameters(charset, double_digit);
    return verify_check_digit(value, params.radix, params.modulus, charset, double_digit);
}

bool verify_check_digit(std::string_view value, int radix, int modulus,
                        std::string_view charset, bool double_digit) {
    const auto digits = static_cast<std::size_t>(check_digit_count(double_digit));
    if (value.size() <= digits) {
        return false;
    }
    const std::string normalized = detail::to_upper(value);
    const std::string_view payload =
        std::string_view(normalized).substr(0, normalized.size() - digits);
    const auto expected = dispatch(payload, radix, modulus, charset, double_digit);
    return expected.has_value() && *expected == normalized;
}

bool verify_check_digit(const char *value, int radix, int modulus, std::string_view charset,
                        bool double_digit) {
    if (value == nullptr) {
        return false;
    }
    return verify_check_digit(std::string_view(value), radix, modulus, charset, double_digit);
}

} // namespace iso7064::core
