// include/iso7064/io/format.hpp - Text forms of resolved parameters and scheme names.

#pragma once

#include <ostream>
#include <string>

#include <iso7064/core/parameters.hpp>
#include <iso7064/core/scheme.hpp>

namespace iso7064::io {

    inline std::string to_string(iso7064::core::Scheme scheme) {
        return std::string(iso7064::core::scheme_name(scheme));
    }

    // "MOD 97-10" for pairs the resolver produces, "MOD m-r" spelled out otherwise.
    inline std::string to_string(const iso7064::core::Parameters &params) {
        for (const auto scheme : iso7064::core::ALL_SCHEMES) {
            if (iso7064::core::scheme_parameters(scheme) == params) {
                return to_string(scheme);
            }
        }
        return "MOD " + std::to_string(params.modulus) + '-' + std::to_string(params.radix);
    }

    inline std::ostream &operator<<(std::ostream &os, iso7064::core::Scheme scheme) {
        return os << iso7064::core::scheme_name(scheme);
    }

    inline std::ostream &operator<<(std::ostream &os, const iso7064::core::Parameters &params) {
        return os << to_string(params);
    }

} // namespace iso7064::io
