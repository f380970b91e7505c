#ifndef SLURP_MATH_HPP
#define SLURP_MATH_HPP

#include <slurp/assert.hpp>
#include <slurp/defs.hpp>

#include <climits>
#include <type_traits>

namespace slurp {

/// \defgroup math Math functions
/// @{

template<typename T>
using IsUnsigned = std::enable_if_t<std::is_unsigned<T>::value, T>;

/// Rounds `v` towards the next power of two. Returns `v` if it is already a power of two.
/// Note: returns 0 if `v == 0`.
///
/// Adapted from http://graphics.stanford.edu/~seander/bithacks.html#RoundUpPowerOf2
template<typename T, IsUnsigned<T>* = nullptr>
constexpr T round_towards_pow2(T v) noexcept {
    --v;
    for (u64 i = 1; i < sizeof(T) * CHAR_BIT; i *= 2) {
        v |= v >> i;
    }
    return ++v;
}

/// Computes the base-2 logarithm of `v`.
/// \pre `v > 0`.
template<typename T, IsUnsigned<T>* = nullptr>
constexpr T log2(T v) noexcept {
    SLURP_CONSTEXPR_ASSERT(v != 0, "v must be greater than zero.");
    T log = 0;
    while (v >>= 1)
        ++log;
    return log;
}

/// Returns true if the given integer is a power of two.
template<typename T, IsUnsigned<T>* = nullptr>
constexpr bool is_pow2(T v) noexcept {
    return v && !(v & (v - 1));
}

/// Returns the capacity that follows `current` when a buffer is doubled,
/// without ever exceeding `ceiling`. Returns `current` itself if it
/// has already reached the ceiling.
template<typename T, IsUnsigned<T>* = nullptr>
constexpr T grow_capped(T current, T ceiling) noexcept {
    if (current >= ceiling)
        return current;
    if (current > ceiling / 2)
        return ceiling;
    return current * 2;
}

/// @}

} // namespace slurp

#endif // SLURP_MATH_HPP
