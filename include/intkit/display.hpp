/**
 * IntKit: Integer Conversion Kit
 *
 * Display Formatter
 *
 * Invariant-locale "N0" rendering: decimal digits grouped by three with
 * commas, leading '-' for negatives. 123456789 -> "123,456,789".
 *
 * The text is built back-to-front in a 16-char stack buffer and copied into
 * the returned string once.
 */

#ifndef INTKIT_DISPLAY_HPP
#define INTKIT_DISPLAY_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace intkit {

/// Worst case is "-2,147,483,648" (14 chars).
constexpr size_t kDisplayBufferSize = 16;

/**
 * Format with thousands separators.
 * @param value Any int32_t; INT32_MIN is handled through its unsigned magnitude
 */
inline std::string to_display(int32_t value) {
    char buf[kDisplayBufferSize];
    char* const end = buf + kDisplayBufferSize;
    char* p = end;

    // 0u - x avoids negating INT32_MIN in signed arithmetic
    uint32_t magnitude = value < 0 ? 0U - static_cast<uint32_t>(value)
                                   : static_cast<uint32_t>(value);
    int digits = 0;
    do {
        if (digits != 0 && digits % 3 == 0) *--p = ',';
        *--p = static_cast<char>('0' + magnitude % 10);
        magnitude /= 10;
        ++digits;
    } while (magnitude != 0);

    if (value < 0) *--p = '-';
    return std::string(p, static_cast<size_t>(end - p));
}

/**
 * Nullable overload.
 * @param value Optional value
 * @param dash_if_null Return "-" instead of nullopt when value is empty
 * @return nullopt only if value is empty and dash_if_null is false
 */
inline std::optional<std::string> to_display(const std::optional<int32_t>& value,
                                             bool dash_if_null = false) {
    if (!value) {
        if (dash_if_null) return std::string("-");
        return std::nullopt;
    }
    return to_display(*value);
}

} // namespace intkit

#endif // INTKIT_DISPLAY_HPP
