/**
 * IntKit: Integer Conversion Kit
 *
 * Jitter
 *
 * Perturbs a value by a uniform random offset in [-delta, delta], where
 * delta = max(min_delta, round(|value| * percent)). Typical use is
 * spreading retry or expiry times so callers do not fire in lockstep.
 */

#ifndef INTKIT_JITTER_HPP
#define INTKIT_JITTER_HPP

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include "random_source.hpp"

namespace intkit {

/**
 * Half-width of the jitter window for a value.
 * @throws std::out_of_range if percent is outside [0.0, 1.0] (or NaN),
 *         or min_delta is negative
 */
inline int32_t jitter_delta(int32_t value, double percent = 0.1, int32_t min_delta = 1) {
    if (min_delta < 0)
        throw std::out_of_range("min_delta must be non-negative");
    if (!(percent >= 0.0 && percent <= 1.0))
        throw std::out_of_range("percent must be between 0.0 and 1.0");

    // |INT32_MIN| does not fit in int32_t
    const int64_t magnitude = value < 0 ? -static_cast<int64_t>(value)
                                        : static_cast<int64_t>(value);
    // Round half to even, capped so -delta stays representable
    const double scaled = std::min(std::nearbyint(static_cast<double>(magnitude) * percent),
                                   static_cast<double>(std::numeric_limits<int32_t>::max()));
    return std::max(min_delta, static_cast<int32_t>(scaled));
}

/**
 * Apply jitter using an explicit source.
 * @param value Base value
 * @param percent Fraction of |value| used as the window half-width
 * @param min_delta Smallest half-width, also used when value is 0
 * @param source Uniform integer source
 * @return value + offset, offset uniform in [-delta, delta], clamped to int32
 */
inline int32_t apply_jitter(int32_t value, double percent, int32_t min_delta,
                            UniformIntSource& source) {
    const int32_t delta = jitter_delta(value, percent, min_delta);
    const int64_t result = static_cast<int64_t>(value) + source.next(-delta, delta);

    if (result > std::numeric_limits<int32_t>::max()) return std::numeric_limits<int32_t>::max();
    if (result < std::numeric_limits<int32_t>::min()) return std::numeric_limits<int32_t>::min();
    return static_cast<int32_t>(result);
}

/**
 * Apply jitter using shared_source().
 */
inline int32_t apply_jitter(int32_t value, double percent = 0.1, int32_t min_delta = 1) {
    return apply_jitter(value, percent, min_delta, shared_source());
}

} // namespace intkit

#endif // INTKIT_JITTER_HPP
