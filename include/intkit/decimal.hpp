/**
 * IntKit: Integer Conversion Kit
 *
 * Exact Decimal Powers of Ten
 *
 * Decimal holds a non-negative integer of up to 96 bits, the mantissa width
 * of a 28-digit decimal, so every power of ten from 10^0 to 10^28 is
 * represented exactly. The lookup table is built at compile time and is
 * read-only, so concurrent readers need no synchronization.
 */

#ifndef INTKIT_DECIMAL_HPP
#define INTKIT_DECIMAL_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace intkit {

/**
 * Exact 96-bit unsigned integer value, stored as three 32-bit limbs
 * (least significant first).
 */
class Decimal {
private:
    uint32_t lo_;
    uint32_t mid_;
    uint32_t hi_;

public:
    constexpr Decimal() noexcept : lo_(0), mid_(0), hi_(0) {}

    constexpr Decimal(uint32_t lo, uint32_t mid, uint32_t hi) noexcept
        : lo_(lo), mid_(mid), hi_(hi) {}

    static constexpr Decimal from_uint64(uint64_t v) noexcept {
        return Decimal(static_cast<uint32_t>(v), static_cast<uint32_t>(v >> 32), 0);
    }

    /**
     * Multiply by a small factor. Bits beyond 96 are dropped; callers keep
     * results in range.
     */
    constexpr Decimal times(uint32_t factor) const noexcept {
        uint64_t t = static_cast<uint64_t>(lo_) * factor;
        const uint32_t lo = static_cast<uint32_t>(t);
        t = static_cast<uint64_t>(mid_) * factor + (t >> 32);
        const uint32_t mid = static_cast<uint32_t>(t);
        t = static_cast<uint64_t>(hi_) * factor + (t >> 32);
        return Decimal(lo, mid, static_cast<uint32_t>(t));
    }

    /// True if the value fits in 64 bits.
    constexpr bool fits_uint64() const noexcept { return hi_ == 0; }

    /// Low 64 bits of the value.
    constexpr uint64_t low64() const noexcept {
        return (static_cast<uint64_t>(mid_) << 32) | lo_;
    }

    double to_double() const noexcept {
        return static_cast<double>(hi_) * 18446744073709551616.0 +
               static_cast<double>(low64());
    }

    /// Base-10 digits, no separators, no sign.
    std::string to_string() const {
        // 2^96 has 29 decimal digits
        char buf[32];
        char* const end = buf + sizeof(buf);
        char* p = end;

        uint32_t limbs[3] = {hi_, mid_, lo_};
        do {
            uint64_t rem = 0;
            for (uint32_t& limb : limbs) {
                const uint64_t cur = (rem << 32) | limb;
                limb = static_cast<uint32_t>(cur / 10);
                rem = cur % 10;
            }
            *--p = static_cast<char>('0' + rem);
        } while (limbs[0] != 0 || limbs[1] != 0 || limbs[2] != 0);

        return std::string(p, static_cast<size_t>(end - p));
    }

    constexpr uint32_t lo() const noexcept { return lo_; }
    constexpr uint32_t mid() const noexcept { return mid_; }
    constexpr uint32_t hi() const noexcept { return hi_; }

    friend constexpr bool operator==(const Decimal& a, const Decimal& b) noexcept {
        return a.lo_ == b.lo_ && a.mid_ == b.mid_ && a.hi_ == b.hi_;
    }
    friend constexpr bool operator!=(const Decimal& a, const Decimal& b) noexcept {
        return !(a == b);
    }
    friend constexpr bool operator<(const Decimal& a, const Decimal& b) noexcept {
        if (a.hi_ != b.hi_) return a.hi_ < b.hi_;
        if (a.mid_ != b.mid_) return a.mid_ < b.mid_;
        return a.lo_ < b.lo_;
    }
    friend constexpr bool operator>(const Decimal& a, const Decimal& b) noexcept {
        return b < a;
    }
};

/// Largest exponent accepted by pow10.
constexpr int32_t kMaxPow10Exponent = 28;

namespace detail {

constexpr std::array<Decimal, kMaxPow10Exponent + 1> make_pow10_table() noexcept {
    std::array<Decimal, kMaxPow10Exponent + 1> table{};
    Decimal v = Decimal::from_uint64(1);
    for (size_t i = 0; i < table.size(); ++i) {
        table[i] = v;
        v = v.times(10);
    }
    return table;
}

inline constexpr std::array<Decimal, kMaxPow10Exponent + 1> kPow10Table = make_pow10_table();

} // namespace detail

/**
 * Table lookup of 10^exponent.
 * @param exponent Must be in [0, 28]
 * @throws std::out_of_range for any other exponent
 */
inline Decimal pow10(int32_t exponent) {
    // A single unsigned compare rejects negatives as well
    if (static_cast<uint32_t>(exponent) > static_cast<uint32_t>(kMaxPow10Exponent))
        throw std::out_of_range("exponent must be between 0 and 28");
    return detail::kPow10Table[static_cast<size_t>(exponent)];
}

} // namespace intkit

#endif // INTKIT_DECIMAL_HPP
