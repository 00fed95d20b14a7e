#pragma once

#include <cstddef>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>

#include <iso7064/core/charset.hpp>

namespace iso7064::util {

inline char random_character(std::mt19937_64& generator, std::string_view charset) {
    if (charset.empty()) {
        throw std::invalid_argument("cannot draw from an empty character set");
    }
    std::uniform_int_distribution<std::size_t> index_dist(0, charset.size() - 1);
    return charset[index_dist(generator)];
}

// Identifier of `length` characters drawn from `charset`; with `mixed_case`,
// letters are randomly lowered to exercise the case folding of the calculators.
inline std::string random_identifier(std::mt19937_64& generator,
                                     std::string_view charset,
                                     std::size_t length,
                                     bool mixed_case = false) {
    std::string result;
    result.reserve(length);
    std::bernoulli_distribution lower_dist(0.5);
    for (std::size_t index = 0; index < length; ++index) {
        char ch = random_character(generator, charset);
        if (mixed_case && ch >= 'A' && ch <= 'Z' && lower_dist(generator)) {
            ch = static_cast<char>(ch - 'A' + 'a');
        }
        result.push_back(ch);
    }
    return result;
}

} // namespace iso7064::util
