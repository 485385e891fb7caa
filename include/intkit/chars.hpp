/**
 * IntKit: Integer Conversion Kit
 *
 * Ordinal and nibble to character conversions.
 *
 * Preconditions are the caller's responsibility and are not checked.
 * Out-of-range input yields an unspecified character.
 */

#ifndef INTKIT_CHARS_HPP
#define INTKIT_CHARS_HPP

#include <cstdint>

namespace intkit {

/**
 * 1-based letter of the Latin alphabet: 1 -> 'a' (or 'A'), 26 -> 'z'.
 * @param value Expected in [1, 26]
 * @param is_caps Return the uppercase letter
 */
constexpr char to_char(int32_t value, bool is_caps = false) noexcept {
    return static_cast<char>((is_caps ? 'A' : 'a') + (value - 1));
}

/**
 * Uppercase hex digit for a nibble.
 * @param value Expected in [0, 15]
 */
constexpr char to_hex_char(int32_t value) noexcept {
    return static_cast<char>(value < 10 ? value + '0' : value - 10 + 'A');
}

} // namespace intkit

#endif // INTKIT_CHARS_HPP
