/**
 * IntKit: Integer Conversion Kit
 *
 * Uniform Integer Sources
 *
 * apply_jitter draws its offset from a UniformIntSource. The default
 * source is SplitMix64 (Steele, Lea, Flood 2014) with unbiased bounded
 * sampling (Lemire 2019, multiply-shift with rejection).
 *
 * Properties of SplitMix64:
 * - Period: 2^64
 * - State: 64 bits (8 bytes)
 * - Passes BigCrush statistical tests
 * - Not cryptographic
 */

#ifndef INTKIT_RANDOM_SOURCE_HPP
#define INTKIT_RANDOM_SOURCE_HPP

#include <cstdint>
#include <mutex>
#include <random>
#include <stdexcept>

namespace intkit {

/**
 * SplitMix64 PRNG
 */
class SplitMix64 {
private:
    uint64_t state_;

public:
    /**
     * Construct with initial seed
     * @param seed Initial state value
     */
    explicit constexpr SplitMix64(uint64_t seed) noexcept : state_(seed) {}

    /**
     * Generate next random value (advances state)
     * @return 64-bit pseudo-random value
     */
    constexpr uint64_t next() noexcept {
        uint64_t z = (state_ += 0x9e3779b97f4a7c15ULL);
        z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
        z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
        return z ^ (z >> 31);
    }

    /// Upper half of next(); the high bits are the better mixed ones.
    constexpr uint32_t next32() noexcept {
        return static_cast<uint32_t>(next() >> 32);
    }

    /**
     * Stateless hash: the output next() would give from state (key ^ data).
     * Used to fold several entropy words into one seed.
     */
    static constexpr uint64_t hash(uint64_t key, uint64_t data) noexcept {
        uint64_t z = key ^ data;
        z += 0x9e3779b97f4a7c15ULL;
        z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
        z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
        return z ^ (z >> 31);
    }

    uint64_t state() const noexcept { return state_; }
};

/**
 * Source of uniformly distributed integers.
 *
 * next(low, high) must return every integer in [low, high], both ends
 * included, with equal probability.
 */
class UniformIntSource {
public:
    virtual ~UniformIntSource() = default;

    /**
     * @param low Smallest value that may be returned
     * @param high_inclusive Largest value that may be returned
     * @throws std::invalid_argument if low > high_inclusive
     */
    virtual int32_t next(int32_t low, int32_t high_inclusive) = 0;
};

/**
 * Seedable SplitMix64-backed source. Not thread-safe; give each thread its
 * own instance or use shared_source().
 */
class SplitMix64Source final : public UniformIntSource {
private:
    SplitMix64 rng_;

public:
    explicit SplitMix64Source(uint64_t seed) noexcept : rng_(seed) {}

    int32_t next(int32_t low, int32_t high_inclusive) override {
        if (low > high_inclusive)
            throw std::invalid_argument("low must not exceed high_inclusive");

        // Range size in [1, 2^32]
        const uint64_t span = static_cast<uint64_t>(
            static_cast<int64_t>(high_inclusive) - static_cast<int64_t>(low)) + 1;

        uint64_t offset;
        if (span == (1ULL << 32)) {
            offset = rng_.next32();
        } else {
            const uint32_t s = static_cast<uint32_t>(span);
            uint64_t m = static_cast<uint64_t>(rng_.next32()) * s;
            uint32_t l = static_cast<uint32_t>(m);
            if (l < s) {
                const uint32_t threshold = (0U - s) % s;
                while (l < threshold) {
                    m = static_cast<uint64_t>(rng_.next32()) * s;
                    l = static_cast<uint32_t>(m);
                }
            }
            offset = m >> 32;
        }
        return static_cast<int32_t>(static_cast<int64_t>(low) + static_cast<int64_t>(offset));
    }

    const SplitMix64& generator() const noexcept { return rng_; }
};

/**
 * Mutex-guarded SplitMix64 source, safe to share between threads.
 */
class LockedSource final : public UniformIntSource {
private:
    std::mutex mu_;
    SplitMix64Source inner_;

public:
    explicit LockedSource(uint64_t seed) noexcept : inner_(seed) {}

    int32_t next(int32_t low, int32_t high_inclusive) override {
        std::lock_guard<std::mutex> lk(mu_);
        return inner_.next(low, high_inclusive);
    }
};

/**
 * Process-wide source seeded once from std::random_device.
 */
inline UniformIntSource& shared_source() {
    static LockedSource inst([] {
        std::random_device rd;
        const uint64_t a = (static_cast<uint64_t>(rd()) << 32) | rd();
        const uint64_t b = (static_cast<uint64_t>(rd()) << 32) | rd();
        return SplitMix64::hash(a, b);
    }());
    return inst;
}

} // namespace intkit

#endif // INTKIT_RANDOM_SOURCE_HPP
