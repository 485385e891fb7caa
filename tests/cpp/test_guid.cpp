/**
 * IntKit C++ Tests: Integer Mixer and Identifier Deriver
 *
 * Pins mix32 and to_guid_string to fixed vectors and checks the
 * identifier text shape over boundary and sampled inputs.
 */

#ifdef NDEBUG
#undef NDEBUG
#endif

#include <intkit/intkit.hpp>
#include <cassert>
#include <cstdint>
#include <cstdio>
#include <limits>
#include <regex>
#include <set>
#include <string>

static const std::regex kGuidPattern(
    "^[0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{12}$");

void test_mix32_vectors() {
    assert(intkit::mix32(0) == 0);
    assert(static_cast<uint32_t>(intkit::mix32(1)) == 0x514e28b7U);
    assert(static_cast<uint32_t>(intkit::mix32(-1)) == 0x81f16f39U);
    assert(intkit::mix32(987653145) == 0x06508d00);
    assert(static_cast<uint32_t>(intkit::mix32(std::numeric_limits<int32_t>::max())) == 0xf9cc0ea8U);
    assert(static_cast<uint32_t>(intkit::mix32(std::numeric_limits<int32_t>::min())) == 0x6d3c65a0U);

    // Signed and unsigned overloads agree bit for bit
    assert(static_cast<uint32_t>(intkit::mix32(-12345)) == intkit::mix32(static_cast<uint32_t>(-12345)));

    static_assert(intkit::mix32(0U) == 0U, "mix32 must be usable at compile time");
}

void test_mix32_avalanche() {
    // Flipping one input bit should flip roughly half of the output bits
    unsigned long total = 0;
    unsigned long samples = 0;
    for (uint32_t x = 1; x < 4096; x += 7) {
        for (int bit = 0; bit < 32; ++bit) {
            uint32_t diff = intkit::mix32(x) ^ intkit::mix32(x ^ (1U << bit));
            int flipped = 0;
            while (diff) { flipped += diff & 1U; diff >>= 1; }
            total += static_cast<unsigned long>(flipped);
            ++samples;
        }
    }
    const double mean = static_cast<double>(total) / static_cast<double>(samples);
    assert(mean > 15.0 && mean < 17.0 && "Poor avalanche");
}

void test_guid_regression_vectors() {
    assert(intkit::to_guid_string(987653145) == "3ade6419-8d00-0650-65ff-4c5bcbd204a6");
    assert(intkit::to_guid_string(0) == "00000000-0000-0000-0000-000000000000");
    assert(intkit::to_guid_string(1) == "00000001-28b7-514e-2d7f-954c2df45158");
    assert(intkit::to_guid_string(-1) == "ffffffff-6f39-81f1-d380-6ab3d20baea7");
    assert(intkit::to_guid_string(std::numeric_limits<int32_t>::max()) ==
           "7fffffff-0ea8-f9cc-d380-6a3369cbf84d");
    assert(intkit::to_guid_string(std::numeric_limits<int32_t>::min()) ==
           "80000000-65a0-6d3c-0000-00806940b559");
}

void test_guid_bytes_layout() {
    const intkit::GuidBytes b = intkit::guid_bytes(987653145);
    const uint8_t expected[16] = {0x19, 0x64, 0xde, 0x3a, 0x00, 0x8d, 0x50, 0x06,
                                  0x65, 0xff, 0x4c, 0x5b, 0xcb, 0xd2, 0x04, 0xa6};
    for (size_t i = 0; i < 16; ++i) {
        assert(b[i] == expected[i] && "Byte layout mismatch");
    }
}

void test_guid_format(int32_t value) {
    const std::string s = intkit::to_guid_string(value);
    assert(s.size() == intkit::kGuidStringLength);
    assert(std::regex_match(s, kGuidPattern) && "Not canonical identifier text");
    assert(s == intkit::to_guid_string(value) && "Not deterministic");
}

void test_guid_distinct() {
    assert(intkit::to_guid_string(12345) != intkit::to_guid_string(67890));

    std::set<std::string> seen;
    for (int32_t v = -5000; v <= 5000; ++v) {
        seen.insert(intkit::to_guid_string(v));
    }
    assert(seen.size() == 10001 && "Collision in small range");
}

int main() {
    printf("Testing mix32...\n");
    test_mix32_vectors();
    printf("  vectors: PASS\n");
    test_mix32_avalanche();
    printf("  avalanche: PASS\n");

    printf("\nTesting to_guid_string...\n");
    test_guid_regression_vectors();
    printf("  regression vectors: PASS\n");
    test_guid_bytes_layout();
    printf("  byte layout: PASS\n");

    int32_t values[] = {0, 1, -1, 123456789, 987653145,
                        std::numeric_limits<int32_t>::max(),
                        std::numeric_limits<int32_t>::min()};
    for (int32_t v : values) {
        test_guid_format(v);
        printf("  format v=%d: PASS\n", static_cast<int>(v));
    }

    test_guid_distinct();
    printf("  distinct outputs: PASS\n");

    printf("\nAll identifier tests passed!\n");
    return 0;
}
