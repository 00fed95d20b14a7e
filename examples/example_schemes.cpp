// examples/example_schemes.cpp - Shows which ISO 7064 system each alphabet resolves to.

#include <iostream>
#include <string_view>

#include <iso7064/iso7064.hpp>

int
main() {
    const std::string_view alphabets[] = {
        iso7064::charset::NUMERIC,      iso7064::charset::NUMERIC_WITH_X,
        iso7064::charset::HEXADECIMAL,  iso7064::charset::ALPHABETIC,
        iso7064::charset::ALPHANUMERIC, iso7064::charset::ALPHANUMERIC_WITH_STAR,
    };

    for (const auto alphabet : alphabets) {
        for (const bool double_digit : {false, true}) {
            std::cout << alphabet << (double_digit ? " [double]: " : " [single]: ");
            try {
                const auto params = iso7064::resolve_parameters(alphabet, double_digit);
                iso7064::util::dump(std::cout, iso7064::core::scheme_for(params)) << "\n";
            } catch (const iso7064::InvalidCharacterSet &err) {
                std::cout << err.what() << "\n";
            }
        }
    }

    try {
        (void)iso7064::calculate_check_digit("1234", "01234", false);
    } catch (const iso7064::InvalidCharacterSet &err) {
        std::cout << "five characters: " << err.what() << "\n";
    }
    return 0;
}
