// tests/unit/test_pure_system.cpp - Unit tests for the pure system calculator.

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include <iso7064/core/charset.hpp>
#include <iso7064/core/pure_system.hpp>

namespace {

namespace charset = iso7064::charset;
using iso7064::core::calculate_pure_system;

bool test_reference_vectors() {
    std::cerr << "test_reference_vectors start" << std::endl;
    if (calculate_pure_system("079", 2, 11, charset::NUMERIC_WITH_X, false) != "079X") {
        std::cerr << "MOD 11-2 079" << std::endl;
        return false;
    }
    if (calculate_pure_system("0794", 2, 11, charset::NUMERIC_WITH_X, false) != "07940") {
        std::cerr << "MOD 11-2 0794" << std::endl;
        return false;
    }
    if (calculate_pure_system("G123498654321", 2, 37, charset::ALPHANUMERIC_WITH_STAR, false) !=
        "G123498654321H") {
        std::cerr << "MOD 37-2" << std::endl;
        return false;
    }
    if (calculate_pure_system("794", 10, 97, charset::NUMERIC, true) != "79444") {
        std::cerr << "MOD 97-10" << std::endl;
        return false;
    }
    if (calculate_pure_system("ISO79", 36, 1271, charset::ALPHANUMERIC, true) != "ISO793W") {
        std::cerr << "MOD 1271-36" << std::endl;
        return false;
    }
    if (calculate_pure_system("ISOHJ", 26, 661, charset::ALPHABETIC, true) != "ISOHJTC") {
        std::cerr << "MOD 661-26" << std::endl;
        return false;
    }
    if (calculate_pure_system("DEADBEEF", 16, 251, charset::HEXADECIMAL, true) != "DEADBEEF5E") {
        std::cerr << "MOD 251-16" << std::endl;
        return false;
    }
    std::cerr << "test_reference_vectors end" << std::endl;
    return true;
}

bool test_double_digit_decomposition() {
    // "0" under MOD 97-10 has check value 1, written as two radix digits
    if (calculate_pure_system("0", 10, 97, charset::NUMERIC, true) != "001") {
        std::cerr << "leading zero check digit" << std::endl;
        return false;
    }
    if (calculate_pure_system("1234567890", 10, 97, charset::NUMERIC, true) != "123456789092") {
        std::cerr << "ten digit MOD 97-10" << std::endl;
        return false;
    }
    return true;
}

bool test_case_folding() {
    if (calculate_pure_system("abc", 36, 1271, charset::ALPHANUMERIC, true) != "ABC22") {
        std::cerr << "lowercase input must be uppercased" << std::endl;
        return false;
    }
    return true;
}

bool test_soft_failures() {
    const char* absent = nullptr;
    if (calculate_pure_system(absent, 10, 97, charset::NUMERIC, true).has_value()) {
        std::cerr << "null value" << std::endl;
        return false;
    }
    if (calculate_pure_system("", 10, 97, charset::NUMERIC, true).has_value()) {
        std::cerr << "empty value" << std::endl;
        return false;
    }
    if (calculate_pure_system("12A4", 10, 97, charset::NUMERIC, true).has_value()) {
        std::cerr << "out of alphabet character" << std::endl;
        return false;
    }
    if (calculate_pure_system("12-4", 2, 11, charset::NUMERIC_WITH_X, false).has_value()) {
        std::cerr << "punctuation" << std::endl;
        return false;
    }
    return true;
}

bool test_distinct_from_hybrid() {
    // explicit (10, 11) runs the weighted sum, not the hybrid recurrence
    if (calculate_pure_system("0794", 10, 11, charset::NUMERIC, false) != "07943") {
        std::cerr << "explicit pure MOD 11-10 parameters" << std::endl;
        return false;
    }
    return true;
}

bool test_configuration_errors() {
    try {
        // MOD 11-2 may need 'X', which the plain numeric alphabet lacks
        (void)calculate_pure_system("1", 2, 11, charset::NUMERIC, false);
        std::cerr << "check value outside alphabet must throw" << std::endl;
        return false;
    } catch (const std::out_of_range&) {
        // expected
    }
    try {
        (void)calculate_pure_system("1", 10, 10, charset::NUMERIC, false);
        std::cerr << "modulus must exceed radix" << std::endl;
        return false;
    } catch (const std::invalid_argument&) {
    }
    try {
        (void)calculate_pure_system("1", 1, 7, charset::NUMERIC, false);
        std::cerr << "radix below two must throw" << std::endl;
        return false;
    } catch (const std::invalid_argument&) {
    }
    return true;
}

} // namespace

int main() {
    const bool ok = test_reference_vectors() && test_double_digit_decomposition() &&
                    test_case_folding() && test_soft_failures() && test_distinct_from_hybrid() &&
                    test_configuration_errors();
    if (!ok) {
        std::cerr << "pure system tests failed\n";
        return 1;
    }
    std::cout << "pure system tests passed\n";
    return 0;
}
