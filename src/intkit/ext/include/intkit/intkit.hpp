/**
 * IntKit: Integer Conversion Kit
 *
 * Main header that includes all IntKit components and provides
 * convenience classes.
 *
 * Usage:
 *   #include <intkit/intkit.hpp>
 */

#ifndef INTKIT_INTKIT_HPP
#define INTKIT_INTKIT_HPP

// Version
#define INTKIT_VERSION_MAJOR 1
#define INTKIT_VERSION_MINOR 0
#define INTKIT_VERSION_PATCH 0
#define INTKIT_VERSION_STRING "1.0.0"

// Core components
#include <intkit/mix32.hpp>
#include <intkit/guid_string.hpp>
#include <intkit/display.hpp>

// Auxiliary converters
#include <intkit/chars.hpp>
#include <intkit/decimal.hpp>
#include <intkit/unix_time.hpp>
#include <intkit/random_source.hpp>
#include <intkit/jitter.hpp>

namespace intkit {

// ============================================================================
// JitterPolicy: fixed jitter settings with a private, seeded source
// ============================================================================

/**
 * Reusable jitter configuration.
 *
 * Settings are validated once at construction. Each policy owns its own
 * SplitMix64 stream, so two policies built with the same seed produce the
 * same sequence of results.
 */
class JitterPolicy {
private:
    double percent_;
    int32_t min_delta_;
    uint64_t seed_;
    SplitMix64Source source_;

public:
    /**
     * @param percent Fraction of |value| used as the window half-width
     * @param min_delta Smallest half-width
     * @param seed Seed for the policy's source
     * @throws std::out_of_range on invalid percent or min_delta
     */
    JitterPolicy(double percent = 0.1, int32_t min_delta = 1, uint64_t seed = 42)
        : percent_(percent)
        , min_delta_(min_delta)
        , seed_(seed)
        , source_(seed)
    {
        jitter_delta(0, percent_, min_delta_);
    }

    int32_t operator()(int32_t value) {
        return apply_jitter(value, percent_, min_delta_, source_);
    }

    /// Half-width of the window this policy would use for value.
    int32_t delta_for(int32_t value) const {
        return jitter_delta(value, percent_, min_delta_);
    }

    // Accessors
    double percent() const { return percent_; }
    int32_t min_delta() const { return min_delta_; }
    uint64_t seed() const { return seed_; }
};

} // namespace intkit

#endif // INTKIT_INTKIT_HPP
