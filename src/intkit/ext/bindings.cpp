/**
 * IntKit Python Bindings (pybind11)
 *
 * Exposes the C++ core as `_intkit_native`.
 *
 * Build:
 *   pip install pybind11
 *   cmake -S . -B build -DINTKIT_BUILD_PYTHON=ON
 *   cmake --build build
 */

// MinGW workaround: include these before pybind11
#include <mutex>
#include <cstring>

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <intkit/intkit.hpp>
#include <optional>
#include <string>

namespace py = pybind11;

// ============================================================================
// Helper Functions
// ============================================================================

/**
 * Identifier buffer as Python bytes
 */
py::bytes guid_bytes_py(int32_t value) {
    const intkit::GuidBytes b = intkit::guid_bytes(value);
    return py::bytes(reinterpret_cast<const char*>(b.data()), b.size());
}

/**
 * Calendar fields for a Unix timestamp
 */
intkit::CivilTime from_unix_seconds_py(int32_t value) {
    return intkit::to_civil(intkit::from_unix_seconds(value));
}

// ============================================================================
// Python Module Definition
// ============================================================================

PYBIND11_MODULE(_intkit_native, m) {
    m.doc() = R"doc(
IntKit (Native C++ Extension)

Deterministic int32 conversions: thousands-separated display text,
GUID-style identifiers, exact powers of ten, Unix time and jitter.
)doc";

    // Version info
    m.attr("__version__") = INTKIT_VERSION_STRING;

    // ========================================================================
    // Core
    // ========================================================================
    m.def("mix32", py::overload_cast<int32_t>(&intkit::mix32),
        py::arg("value"),
        "Murmur3 finalizer over a signed 32-bit value");

    m.def("to_guid_string", &intkit::to_guid_string,
        py::arg("value"),
        "Deterministic identifier text (36 chars, lowercase hex)");

    m.def("guid_bytes", &guid_bytes_py,
        py::arg("value"),
        "Raw 16-byte identifier buffer in written order");

    m.def("to_display", py::overload_cast<const std::optional<int32_t>&, bool>(&intkit::to_display),
        py::arg("value"),
        py::arg("dash_if_null") = false,
        "Thousands-separated text; None stays None unless dash_if_null");

    // ========================================================================
    // Auxiliary converters
    // ========================================================================
    m.def("to_char", &intkit::to_char,
        py::arg("value"),
        py::arg("is_caps") = false,
        "1-based alphabet letter (value in [1, 26], unchecked)");

    m.def("to_hex_char", &intkit::to_hex_char,
        py::arg("value"),
        "Uppercase hex digit (value in [0, 15], unchecked)");

    py::class_<intkit::Decimal>(m, "Decimal",
        "Exact 96-bit unsigned integer value")
        .def("to_string", &intkit::Decimal::to_string)
        .def("to_double", &intkit::Decimal::to_double)
        .def("__str__", &intkit::Decimal::to_string)
        .def("__int__", [](const intkit::Decimal& d) {
            return py::int_(py::str(d.to_string()));
        })
        .def("__float__", &intkit::Decimal::to_double)
        .def("__eq__", [](const intkit::Decimal& a, const intkit::Decimal& b) { return a == b; })
        .def("__lt__", [](const intkit::Decimal& a, const intkit::Decimal& b) { return a < b; })
        .def("__repr__", [](const intkit::Decimal& d) {
            return "Decimal(" + d.to_string() + ")";
        });

    m.def("pow10", &intkit::pow10,
        py::arg("exponent"),
        "10**exponent for exponent in [0, 28]; IndexError otherwise");

    py::class_<intkit::CivilTime>(m, "CivilTime",
        "UTC calendar fields")
        .def_readonly("year", &intkit::CivilTime::year)
        .def_readonly("month", &intkit::CivilTime::month)
        .def_readonly("day", &intkit::CivilTime::day)
        .def_readonly("hour", &intkit::CivilTime::hour)
        .def_readonly("minute", &intkit::CivilTime::minute)
        .def_readonly("second", &intkit::CivilTime::second)
        .def("iso8601", py::overload_cast<const intkit::CivilTime&>(&intkit::to_iso8601))
        .def("__repr__", py::overload_cast<const intkit::CivilTime&>(&intkit::to_iso8601));

    m.def("from_unix_seconds", &from_unix_seconds_py,
        py::arg("value"),
        "UTC calendar time for seconds since 1970-01-01T00:00:00Z");

    // ========================================================================
    // Jitter
    // ========================================================================
    py::class_<intkit::UniformIntSource>(m, "UniformIntSource")
        .def("next", &intkit::UniformIntSource::next,
            py::arg("low"), py::arg("high_inclusive"),
            "Uniform integer in [low, high_inclusive]");

    py::class_<intkit::SplitMix64Source, intkit::UniformIntSource>(m, "SplitMix64Source",
        "Seedable SplitMix64 uniform integer source (not thread-safe)")
        .def(py::init<uint64_t>(), py::arg("seed"));

    m.def("apply_jitter",
        [](int32_t value, double percent, int32_t min_delta) {
            return intkit::apply_jitter(value, percent, min_delta);
        },
        py::arg("value"),
        py::arg("percent") = 0.1,
        py::arg("min_delta") = 1,
        "value plus a uniform offset in [-delta, delta] from the shared source");

    m.def("apply_jitter_with",
        [](int32_t value, double percent, int32_t min_delta, intkit::UniformIntSource& source) {
            return intkit::apply_jitter(value, percent, min_delta, source);
        },
        py::arg("value"),
        py::arg("percent"),
        py::arg("min_delta"),
        py::arg("source"),
        "apply_jitter drawing from an explicit source");

    py::class_<intkit::JitterPolicy>(m, "JitterPolicy",
        R"doc(
Reusable jitter settings with a private seeded source.

Args:
    percent: Window half-width as a fraction of |value| (default 0.1)
    min_delta: Smallest half-width (default 1)
    seed: Source seed (default 42)
)doc")
        .def(py::init<double, int32_t, uint64_t>(),
            py::arg("percent") = 0.1,
            py::arg("min_delta") = 1,
            py::arg("seed") = 42)
        .def("__call__", &intkit::JitterPolicy::operator(), py::arg("value"))
        .def("delta_for", &intkit::JitterPolicy::delta_for, py::arg("value"))
        .def("percent", &intkit::JitterPolicy::percent)
        .def("min_delta", &intkit::JitterPolicy::min_delta)
        .def("seed", &intkit::JitterPolicy::seed);
}
