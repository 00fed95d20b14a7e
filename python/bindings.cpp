// python/bindings.cpp - Pybind11 bindings for the iso7064 module.

#include <optional>
#include <string>

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <iso7064/iso7064.hpp>

namespace py = pybind11;
namespace core = iso7064::core;

namespace {

// Python None arrives as std::nullopt and is the "absent" identifier.
std::optional<std::string> calculate(const std::optional<std::string>& value,
                                     const std::string& charset, bool double_digit) {
    if (!value) {
        return core::calculate_check_digit(static_cast<const char*>(nullptr), charset, double_digit);
    }
    return core::calculate_check_digit(*value, charset, double_digit);
}

bool verify(const std::optional<std::string>& value, const std::string& charset, bool double_digit) {
    if (!value) {
        return core::verify_check_digit(static_cast<const char*>(nullptr), charset, double_digit);
    }
    return core::verify_check_digit(*value, charset, double_digit);
}

bool verify_explicit(const std::optional<std::string>& value, int radix, int modulus,
                     const std::string& charset, bool double_digit) {
    if (!value) {
        return false;
    }
    return core::verify_check_digit(*value, radix, modulus, charset, double_digit);
}

} // namespace

PYBIND11_MODULE(iso7064, module) {
    module.doc() = "ISO 7064 check digit calculation and verification";

    py::register_exception<core::InvalidCharacterSet>(module, "InvalidCharacterSet",
                                                      PyExc_ValueError);

    module.attr("NUMERIC") = std::string(iso7064::charset::NUMERIC);
    module.attr("NUMERIC_WITH_X") = std::string(iso7064::charset::NUMERIC_WITH_X);
    module.attr("HEXADECIMAL") = std::string(iso7064::charset::HEXADECIMAL);
    module.attr("ALPHABETIC") = std::string(iso7064::charset::ALPHABETIC);
    module.attr("ALPHANUMERIC") = std::string(iso7064::charset::ALPHANUMERIC);
    module.attr("ALPHANUMERIC_WITH_STAR") = std::string(iso7064::charset::ALPHANUMERIC_WITH_STAR);
    module.attr("__version__") = std::to_string(iso7064::ISO7064_VERSION_MAJOR) + "." +
                                 std::to_string(iso7064::ISO7064_VERSION_MINOR) + "." +
                                 std::to_string(iso7064::ISO7064_VERSION_PATCH);

    py::class_<core::Parameters>(module, "Parameters")
        .def(py::init<>())
        .def(py::init([](int radix, int modulus) { return core::Parameters{radix, modulus}; }),
             py::arg("radix"), py::arg("modulus"))
        .def_readwrite("radix", &core::Parameters::radix)
        .def_readwrite("modulus", &core::Parameters::modulus)
        .def_property_readonly("is_hybrid", &core::Parameters::is_hybrid)
        .def("__eq__", [](const core::Parameters& lhs, const core::Parameters& rhs) {
            return lhs == rhs;
        })
        .def("__str__", [](const core::Parameters& params) { return iso7064::io::to_string(params); })
        .def("__repr__", [](const core::Parameters& params) {
            return "<iso7064.Parameters radix=" + std::to_string(params.radix) +
                   " modulus=" + std::to_string(params.modulus) + ">";
        });

    py::enum_<core::Scheme> scheme(module, "Scheme");
    for (const auto value : core::ALL_SCHEMES) {
        std::string name(core::scheme_name(value));
        for (auto& ch : name) {
            if (ch == ' ' || ch == '-') {
                ch = '_';
            }
        }
        scheme.value(name.c_str(), value);
    }
    scheme.def_property_readonly("parameters",
                                [](core::Scheme value) { return core::scheme_parameters(value); })
        .def("__str__", [](core::Scheme value) { return iso7064::io::to_string(value); });

    module.def(
        "resolve_parameters",
        [](const std::string& charset, bool double_digit) {
            return core::resolve_parameters(charset, double_digit);
        },
        py::arg("charset"), py::arg("double_digit") = false,
        "Radix and modulus of the ISO 7064 system for an alphabet");
    module.def("scheme_for", &core::scheme_for, py::arg("parameters"),
               "Scheme named by a resolved parameter pair");

    module.def("calculate_check_digit", &calculate, py::arg("value"), py::arg("charset"),
               py::arg("double_digit") = false,
               "Append check character(s); None when the value is empty or not representable");
    module.def(
        "calculate_pure_system",
        [](const std::optional<std::string>& value, int radix, int modulus,
           const std::string& charset, bool double_digit) -> std::optional<std::string> {
            if (!value) {
                return std::nullopt;
            }
            return core::calculate_pure_system(*value, radix, modulus, charset, double_digit);
        },
        py::arg("value"), py::arg("radix"), py::arg("modulus"), py::arg("charset"),
        py::arg("double_digit") = false);
    module.def(
        "calculate_hybrid_system",
        [](const std::optional<std::string>& value,
           const std::string& charset) -> std::optional<std::string> {
            if (!value) {
                return std::nullopt;
            }
            return core::calculate_hybrid_system(*value, charset);
        },
        py::arg("value"), py::arg("charset"));
    module.def("verify_check_digit", &verify, py::arg("value"), py::arg("charset"),
               py::arg("double_digit") = false);
    module.def("verify_check_digit", &verify_explicit, py::arg("value"), py::arg("radix"),
               py::arg("modulus"), py::arg("charset"), py::arg("double_digit") = false);

    module.def(
        "calculate_numeric_check_digit",
        [](const std::string& value, bool double_digit) {
            return iso7064::calculate_numeric_check_digit(value, double_digit);
        },
        py::arg("value"), py::arg("double_digit") = false, "MOD 11-10 / MOD 97-10");
    module.def(
        "verify_numeric_check_digit",
        [](const std::string& value, bool double_digit) {
            return iso7064::verify_numeric_check_digit(value, double_digit);
        },
        py::arg("value"), py::arg("double_digit") = false);
    module.def(
        "calculate_hex_check_digit",
        [](const std::string& value, bool double_digit) {
            return iso7064::calculate_hex_check_digit(value, double_digit);
        },
        py::arg("value"), py::arg("double_digit") = false, "MOD 17-16 / MOD 251-16");
    module.def(
        "verify_hex_check_digit",
        [](const std::string& value, bool double_digit) {
            return iso7064::verify_hex_check_digit(value, double_digit);
        },
        py::arg("value"), py::arg("double_digit") = false);
    module.def(
        "calculate_alpha_check_digit",
        [](const std::string& value, bool double_digit) {
            return iso7064::calculate_alpha_check_digit(value, double_digit);
        },
        py::arg("value"), py::arg("double_digit") = false, "MOD 27-26 / MOD 661-26");
    module.def(
        "verify_alpha_check_digit",
        [](const std::string& value, bool double_digit) {
            return iso7064::verify_alpha_check_digit(value, double_digit);
        },
        py::arg("value"), py::arg("double_digit") = false);
    module.def(
        "calculate_alphanumeric_check_digit",
        [](const std::string& value, bool double_digit) {
            return iso7064::calculate_alphanumeric_check_digit(value, double_digit);
        },
        py::arg("value"), py::arg("double_digit") = false, "MOD 37-36 / MOD 1271-36");
    module.def(
        "verify_alphanumeric_check_digit",
        [](const std::string& value, bool double_digit) {
            return iso7064::verify_alphanumeric_check_digit(value, double_digit);
        },
        py::arg("value"), py::arg("double_digit") = false);
    module.def(
        "calculate_mod11_2_check_digit",
        [](const std::string& value) { return iso7064::calculate_mod11_2_check_digit(value); },
        py::arg("value"));
    module.def(
        "verify_mod11_2_check_digit",
        [](const std::string& value) { return iso7064::verify_mod11_2_check_digit(value); },
        py::arg("value"));
    module.def(
        "calculate_mod37_2_check_digit",
        [](const std::string& value) { return iso7064::calculate_mod37_2_check_digit(value); },
        py::arg("value"));
    module.def(
        "verify_mod37_2_check_digit",
        [](const std::string& value) { return iso7064::verify_mod37_2_check_digit(value); },
        py::arg("value"));
}
