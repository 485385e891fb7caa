/**
 * IntKit: Integer Conversion Kit
 *
 * 32-bit Integer Mixer
 *
 * Murmur3 finalizer applied to a single 32-bit word.
 *
 * Properties:
 * - Bijective over all 2^32 inputs
 * - Full avalanche: flipping one input bit flips ~half the output bits
 * - Stateless and deterministic
 * - mix32(0) == 0
 */

#ifndef INTKIT_MIX32_HPP
#define INTKIT_MIX32_HPP

#include <cstdint>

namespace intkit {

/**
 * Mix a 32-bit word.
 *
 * Arithmetic is done on uint32_t so shifts are logical and the
 * multiplications wrap mod 2^32 for negative inputs too.
 */
constexpr uint32_t mix32(uint32_t v) noexcept {
    v ^= v >> 16;
    v *= 0x85ebca6bU;
    v ^= v >> 13;
    v *= 0xc2b2ae35U;
    v ^= v >> 16;
    return v;
}

/**
 * Signed overload: reinterprets the two's complement bit pattern.
 * @param value Any int32_t, including INT32_MIN
 * @return Mixed value with the same bit pattern as mix32(uint32_t)
 */
constexpr int32_t mix32(int32_t value) noexcept {
    return static_cast<int32_t>(mix32(static_cast<uint32_t>(value)));
}

} // namespace intkit

#endif // INTKIT_MIX32_HPP
