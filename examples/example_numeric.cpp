// examples/example_numeric.cpp - Appends and checks numeric ISO 7064 check digits.

#include <iostream>
#include <string>
#include <utility>

#include <iso7064/iso7064.hpp>

int
main() {
    const std::string account = "510007547061";

    const auto single = iso7064::calculate_numeric_check_digit(account, false);
    const auto dual = iso7064::calculate_numeric_check_digit(account, true);
    std::cout << "MOD 11-10: " << *single << "\n";
    std::cout << "MOD 97-10: " << *dual << "\n";

    std::cout << "verify " << *dual << " -> " << std::boolalpha
              << iso7064::verify_numeric_check_digit(*dual, true) << "\n";

    std::string typo = *dual;
    std::swap(typo[5], typo[6]);
    std::cout << "verify " << typo << " -> " << iso7064::verify_numeric_check_digit(typo, true)
              << "\n";

    if (!iso7064::calculate_numeric_check_digit("51000-7547061", false)) {
        std::cout << "\"51000-7547061\" is not representable in the numeric alphabet\n";
    }

    const auto special = iso7064::calculate_mod11_2_check_digit("079");
    std::cout << "MOD 11-2: " << *special << "\n";
    return 0;
}
