// include/iso7064/core/scheme.hpp - Names for the ISO 7064 systems the resolver can select.

#pragma once

#include <array>
#include <stdexcept>
#include <string_view>

#include <iso7064/core/parameters.hpp>

namespace iso7064::core {

    enum class Scheme {
        // pure systems
        Mod11_2,
        Mod37_2,
        Mod97_10,
        Mod251_16,
        Mod661_26,
        Mod1271_36,
        // hybrid systems
        Mod3_2,
        Mod11_10,
        Mod17_16,
        Mod27_26,
        Mod37_36,
    };

    inline constexpr std::array<Scheme, 11> ALL_SCHEMES = {
        Scheme::Mod11_2,  Scheme::Mod37_2,  Scheme::Mod97_10, Scheme::Mod251_16,
        Scheme::Mod661_26, Scheme::Mod1271_36, Scheme::Mod3_2, Scheme::Mod11_10,
        Scheme::Mod17_16, Scheme::Mod27_26, Scheme::Mod37_36};

    inline constexpr bool is_hybrid(Scheme scheme) noexcept {
        switch (scheme) {
            case Scheme::Mod3_2:
            case Scheme::Mod11_10:
            case Scheme::Mod17_16:
            case Scheme::Mod27_26:
            case Scheme::Mod37_36:
                return true;
            default:
                return false;
        }
    }

    inline constexpr bool is_hybrid(const Parameters &params) noexcept {
        return params.is_hybrid();
    }

    inline constexpr Parameters scheme_parameters(Scheme scheme) noexcept {
        switch (scheme) {
            case Scheme::Mod11_2:
                return {2, 11};
            case Scheme::Mod37_2:
                return {2, 37};
            case Scheme::Mod97_10:
                return {10, 97};
            case Scheme::Mod251_16:
                return {16, 251};
            case Scheme::Mod661_26:
                return {26, 661};
            case Scheme::Mod1271_36:
                return {36, 1271};
            case Scheme::Mod3_2:
                return {2, 3};
            case Scheme::Mod11_10:
                return {10, 11};
            case Scheme::Mod17_16:
                return {16, 17};
            case Scheme::Mod27_26:
                return {26, 27};
            case Scheme::Mod37_36:
                return {36, 37};
        }
        return {};
    }

    inline Scheme scheme_for(const Parameters &params) {
        for (const Scheme scheme : ALL_SCHEMES) {
            if (scheme_parameters(scheme) == params) {
                return scheme;
            }
        }
        throw std::invalid_argument("parameters do not name an ISO 7064 system");
    }

    inline constexpr std::string_view scheme_name(Scheme scheme) noexcept {
        switch (scheme) {
            case Scheme::Mod11_2:
                return "MOD 11-2";
            case Scheme::Mod37_2:
                return "MOD 37-2";
            case Scheme::Mod97_10:
                return "MOD 97-10";
            case Scheme::Mod251_16:
                return "MOD 251-16";
            case Scheme::Mod661_26:
                return "MOD 661-26";
            case Scheme::Mod1271_36:
                return "MOD 1271-36";
            case Scheme::Mod3_2:
                return "MOD 3-2";
            case Scheme::Mod11_10:
                return "MOD 11-10";
            case Scheme::Mod17_16:
                return "MOD 17-16";
            case Scheme::Mod27_26:
                return "MOD 27-26";
            case Scheme::Mod37_36:
                return "MOD 37-36";
        }
        return "unknown";
    }

} // namespace iso7064::core
