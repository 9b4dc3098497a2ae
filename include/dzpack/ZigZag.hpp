//
// Zigzag mapping between signed deltas and unsigned magnitudes.
//

#ifndef DZPACK_ZIGZAG_HPP
#define DZPACK_ZIGZAG_HPP

#include <concepts>
#include <cstdint>
#include <limits>
#include <type_traits>

namespace dzpack {

    /**
     * @brief Maps a signed value to an unsigned one of the same width.
     *
     * 0 -> 0, -1 -> 1, 1 -> 2, -2 -> 3, ... so small magnitudes of either sign
     * stay small. Total over the whole range, including the minimum value.
     */
    template<std::signed_integral S>
    constexpr std::make_unsigned_t<S> zigzag_encode(const S value) noexcept {
        using U = std::make_unsigned_t<S>;
        constexpr int shift = std::numeric_limits<U>::digits - 1;
        // arithmetic shift spreads the sign bit over the whole word
        return static_cast<U>(static_cast<U>(value) << 1) ^ static_cast<U>(value >> shift);
    }

    /**
     * @brief Exact inverse of zigzag_encode.
     */
    template<std::unsigned_integral U>
    constexpr std::make_signed_t<U> zigzag_decode(const U value) noexcept {
        const U sign = static_cast<U>(U(0) - (value & U(1)));
        return static_cast<std::make_signed_t<U>>(static_cast<U>(value >> 1) ^ sign);
    }

    static_assert(zigzag_encode(int32_t{0}) == 0u);
    static_assert(zigzag_encode(int64_t{-1}) == 1u);
    static_assert(zigzag_encode(int64_t{1}) == 2u);
    static_assert(zigzag_encode(std::numeric_limits<int32_t>::min()) == std::numeric_limits<uint32_t>::max());
    static_assert(zigzag_decode(zigzag_encode(std::numeric_limits<int64_t>::min())) ==
                  std::numeric_limits<int64_t>::min());

} // namespace dzpack

#endif // DZPACK_ZIGZAG_HPP
