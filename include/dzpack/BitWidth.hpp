//
// Minimal bit width selection for a block of zigzag-mapped deltas.
//

#ifndef DZPACK_BIT_WIDTH_HPP
#define DZPACK_BIT_WIDTH_HPP

#include <array>
#include <bit>
#include <concepts>
#include <cstddef>
#include <cstdint>

namespace dzpack {

    /**
     * @brief Number of bits needed to hold every value of the range.
     *
     * max(values) < 2^n and OR(values) < 2^n are the same condition since
     * both have the same highest set bit, so the selector ORs the whole range
     * and never branches on the data. Returns 0 when every value is 0.
     */
    template<std::unsigned_integral U, size_t N>
    constexpr uint8_t required_bit_width(const std::array<U, N>& values) noexcept {
        U acc = 0;
        for (size_t i = 0; i < N; ++i) {
            acc |= values[i];
        }
        return static_cast<uint8_t>(std::bit_width(acc));
    }

    template<std::unsigned_integral U>
    constexpr uint8_t required_bit_width(const U* values, const size_t count) noexcept {
        U acc = 0;
        for (size_t i = 0; i < count; ++i) {
            acc |= values[i];
        }
        return static_cast<uint8_t>(std::bit_width(acc));
    }

    /**
     * @brief Mask with the low `width` bits set; width 64 gives all ones.
     */
    constexpr uint64_t low_bits_mask(const unsigned width) noexcept {
        return width >= 64 ? ~0ULL : (1ULL << width) - 1;
    }

} // namespace dzpack

#endif // DZPACK_BIT_WIDTH_HPP
