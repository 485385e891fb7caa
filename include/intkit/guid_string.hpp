/**
 * IntKit: Integer Conversion Kit
 *
 * Deterministic Identifier Deriver
 *
 * Expands a 32-bit integer into a 128-bit identifier and renders it as
 * canonical "D" format text: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx.
 *
 * Buffer layout (all little-endian):
 *   [0..3]   the input value
 *   [4..7]   mix32(value)
 *   [8..15]  int64(value) * 6364136223846793005, wrapping
 *
 * The first 4 bytes are the input itself, so the identifier is trivially
 * reversible. It is a stable key, not a secret.
 */

#ifndef INTKIT_GUID_STRING_HPP
#define INTKIT_GUID_STRING_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include "mix32.hpp"

namespace intkit {

/// Multiplier for the upper 8 bytes (Knuth's MMIX LCG constant, odd).
constexpr uint64_t kGuidProductMultiplier = 6364136223846793005ULL;

/// Length of the rendered identifier, hyphens included.
constexpr size_t kGuidStringLength = 36;

using GuidBytes = std::array<uint8_t, 16>;

namespace detail {

constexpr char kLowerHexDigits[] = "0123456789abcdef";

constexpr void store_le32(uint8_t* out, uint32_t v) noexcept {
    out[0] = static_cast<uint8_t>(v);
    out[1] = static_cast<uint8_t>(v >> 8);
    out[2] = static_cast<uint8_t>(v >> 16);
    out[3] = static_cast<uint8_t>(v >> 24);
}

constexpr void store_le64(uint8_t* out, uint64_t v) noexcept {
    store_le32(out, static_cast<uint32_t>(v));
    store_le32(out + 4, static_cast<uint32_t>(v >> 32));
}

inline char* put_hex_byte(char* out, uint8_t b) noexcept {
    out[0] = kLowerHexDigits[b >> 4];
    out[1] = kLowerHexDigits[b & 0x0f];
    return out + 2;
}

} // namespace detail

/**
 * Build the 16-byte identifier buffer for a value.
 * @param value Any int32_t
 * @return Bytes in written order (see layout above)
 */
constexpr GuidBytes guid_bytes(int32_t value) noexcept {
    GuidBytes bytes{};
    const uint32_t raw = static_cast<uint32_t>(value);

    detail::store_le32(bytes.data(), raw);
    detail::store_le32(bytes.data() + 4, mix32(raw));

    // Sign-extend, then multiply unsigned so the product wraps mod 2^64.
    const uint64_t wide = static_cast<uint64_t>(static_cast<int64_t>(value));
    detail::store_le64(bytes.data() + 8, wide * kGuidProductMultiplier);
    return bytes;
}

/**
 * Render a 16-byte buffer in GUID "D" format, lowercase.
 *
 * Field order follows the standard GUID text form: the first group is a
 * little-endian 32-bit field, the next two are little-endian 16-bit fields,
 * and the final 8 bytes are printed as stored. Nothing goes through a
 * platform UUID type.
 */
inline std::string format_guid(const GuidBytes& b) {
    static constexpr int kOrder[16] = {3, 2, 1, 0, 5, 4, 7, 6,
                                       8, 9, 10, 11, 12, 13, 14, 15};

    char buf[kGuidStringLength];
    char* p = buf;
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) *p++ = '-';
        p = detail::put_hex_byte(p, b[kOrder[i]]);
    }
    return std::string(buf, kGuidStringLength);
}

/**
 * Derive the identifier string for a value.
 *
 * Total and deterministic. Example:
 *   to_guid_string(987653145) == "3ade6419-8d00-0650-65ff-4c5bcbd204a6"
 */
inline std::string to_guid_string(int32_t value) {
    return format_guid(guid_bytes(value));
}

} // namespace intkit

#endif // INTKIT_GUID_STRING_HPP
