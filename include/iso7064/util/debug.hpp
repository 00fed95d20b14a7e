#pragma once

#include <ostream>

#include <iso7064/core/parameters.hpp>
#include <iso7064/core/scheme.hpp>
#include <iso7064/io/format.hpp>

namespace iso7064::util {

inline std::ostream& dump(std::ostream& os, const iso7064::core::Parameters& params) {
    return os << "Parameters(radix=" << params.radix << ", modulus=" << params.modulus
              << ", " << (params.is_hybrid() ? "hybrid" : "pure") << ')';
}

inline std::ostream& dump(std::ostream& os, iso7064::core::Scheme scheme) {
    os << "Scheme(" << iso7064::io::to_string(scheme) << ", ";
    return dump(os, iso7064::core::scheme_parameters(scheme)) << ')';
}

} // namespace iso7064::util
