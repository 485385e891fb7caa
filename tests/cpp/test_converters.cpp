/**
 * IntKit C++ Tests: Auxiliary Converters
 *
 * Character mapping, power-of-ten table and Unix time conversion.
 */

#ifdef NDEBUG
#undef NDEBUG
#endif

#include <intkit/intkit.hpp>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <limits>
#include <stdexcept>
#include <string>

void test_to_char() {
    static_assert(intkit::to_char(1) == 'a', "to_char must be constexpr");
    assert(intkit::to_char(1) == 'a');
    assert(intkit::to_char(1, true) == 'A');
    assert(intkit::to_char(26) == 'z');
    assert(intkit::to_char(26, true) == 'Z');
    for (int32_t i = 1; i <= 26; ++i) {
        assert(intkit::to_char(i) == static_cast<char>('a' + i - 1));
        assert(intkit::to_char(i, true) == static_cast<char>('A' + i - 1));
    }
}

void test_to_hex_char() {
    const char expected[] = "0123456789ABCDEF";
    for (int32_t i = 0; i < 16; ++i) {
        assert(intkit::to_hex_char(i) == expected[i]);
    }
}

bool pow10_throws(int32_t exponent) {
    try {
        (void)intkit::pow10(exponent);
    } catch (const std::out_of_range&) {
        return true;
    }
    return false;
}

void test_pow10() {
    assert(intkit::pow10(0) == intkit::Decimal::from_uint64(1));
    assert(intkit::pow10(1) == intkit::Decimal::from_uint64(10));
    assert(intkit::pow10(19) == intkit::Decimal::from_uint64(10000000000000000000ULL));
    assert(intkit::pow10(19).fits_uint64());
    assert(!intkit::pow10(20).fits_uint64());

    // 10^28 == 0x204FCE5E_3E250261_10000000
    const intkit::Decimal top = intkit::pow10(28);
    assert(top == intkit::Decimal(0x10000000U, 0x3e250261U, 0x204fce5eU));
    assert(top.to_string() == "1" + std::string(28, '0'));
    assert(top.to_double() == 1e28);

    uint64_t expected = 1;
    for (int32_t e = 0; e <= 19; ++e) {
        assert(intkit::pow10(e).low64() == expected);
        assert(intkit::pow10(e).to_string() == std::to_string(expected));
        if (e < 19) expected *= 10;
    }
    for (int32_t e = 0; e < intkit::kMaxPow10Exponent; ++e) {
        assert(intkit::pow10(e) < intkit::pow10(e + 1));
        assert(intkit::pow10(e + 1) == intkit::pow10(e).times(10));
    }

    assert(pow10_throws(-1));
    assert(pow10_throws(29));
    assert(pow10_throws(std::numeric_limits<int32_t>::min()));
    assert(pow10_throws(std::numeric_limits<int32_t>::max()));
    assert(!pow10_throws(28));
}

void check_civil(int32_t secs, const char* iso) {
    const intkit::UtcTime t = intkit::from_unix_seconds(secs);
    assert(intkit::to_unix_seconds(t) == secs);
    assert(intkit::to_iso8601(t) == iso);
}

void test_unix_time() {
    const intkit::UtcTime epoch = intkit::from_unix_seconds(0);
    assert(epoch.time_since_epoch().count() == 0);
    assert(epoch == std::chrono::time_point_cast<std::chrono::seconds>(
                         std::chrono::system_clock::from_time_t(0)));

    const intkit::CivilTime c = intkit::to_civil(epoch);
    assert((c == intkit::CivilTime{1970, 1, 1, 0, 0, 0}));

    check_civil(0, "1970-01-01T00:00:00Z");
    check_civil(-1, "1969-12-31T23:59:59Z");
    check_civil(31536000, "1971-01-01T00:00:00Z");
    check_civil(951782400, "2000-02-29T00:00:00Z");
    check_civil(1000000000, "2001-09-09T01:46:40Z");
    check_civil(std::numeric_limits<int32_t>::max(), "2038-01-19T03:14:07Z");
    check_civil(std::numeric_limits<int32_t>::min(), "1901-12-13T20:45:52Z");
}

int main() {
    printf("Testing character conversions...\n");
    test_to_char();
    printf("  to_char: PASS\n");
    test_to_hex_char();
    printf("  to_hex_char: PASS\n");

    printf("\nTesting pow10...\n");
    test_pow10();
    printf("  table and range checks: PASS\n");

    printf("\nTesting Unix time...\n");
    test_unix_time();
    printf("  epoch and calendar vectors: PASS\n");

    printf("\nAll converter tests passed!\n");
    return 0;
}
