//
// Fixed-width bit packing kernels for blocks of 64 values.
//

#ifndef DZPACK_FAST_BIT_PACKER_HPP
#define DZPACK_FAST_BIT_PACKER_HPP

#include "BitWidth.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace dzpack {

    // Values per block. 64 values of width n always fill exactly n words.
    inline constexpr size_t BLOCK_SIZE = 64;

    /**
     * @brief Packs 64 values of a fixed bit width into exactly Width words.
     *
     * Layout is LSB first: value i occupies stream bits [i * Width, (i + 1) * Width),
     * and stream bit k is bit (k % 64) of word (k / 64). A value crossing a word
     * boundary keeps its low part in the top of word w and its high part in the
     * bottom of word w + 1.
     *
     * The 64 slots are expanded with a fold over an index sequence, so every word
     * index and shift is a compile-time constant and the boundary test disappears.
     *
     * @tparam Width Bits per value, in [1, 64].
     */
    template<unsigned Width>
    struct FastBitPacker {
        static_assert(Width >= 1 && Width <= 64, "FastBitPacker width must be in [1, 64]");

        static constexpr size_t words = Width;
        static constexpr uint64_t mask = low_bits_mask(Width);

        /**
         * @brief Writes in[0..63] into out[0..Width-1]. Bits above Width are dropped.
         */
        static void pack_words(const uint64_t* in, uint64_t* out) noexcept {
            for (size_t w = 0; w < words; ++w) {
                out[w] = 0;
            }
            pack_all(in, out, std::make_index_sequence<BLOCK_SIZE>{});
        }

        static void unpack_words(const uint64_t* in, uint64_t* out) noexcept {
            unpack_all(in, out, std::make_index_sequence<BLOCK_SIZE>{});
        }

        static void pack(const std::array<uint64_t, BLOCK_SIZE>& values,
                         std::array<uint64_t, Width>& packed) noexcept {
            pack_words(values.data(), packed.data());
        }

        static void unpack(const std::array<uint64_t, Width>& packed,
                           std::array<uint64_t, BLOCK_SIZE>& values) noexcept {
            unpack_words(packed.data(), values.data());
        }

    private:
        template<size_t I>
        __attribute__((always_inline)) static inline void pack_one(const uint64_t* in, uint64_t* out) noexcept {
            constexpr size_t bit = I * Width;
            constexpr size_t word = bit >> 6;
            constexpr unsigned shift = static_cast<unsigned>(bit & 63);

            const uint64_t v = in[I] & mask;
            out[word] |= v << shift;
            if constexpr (shift + Width > 64) {
                out[word + 1] |= v >> (64 - shift);
            }
        }

        template<size_t I>
        __attribute__((always_inline)) static inline uint64_t unpack_one(const uint64_t* in) noexcept {
            constexpr size_t bit = I * Width;
            constexpr size_t word = bit >> 6;
            constexpr unsigned shift = static_cast<unsigned>(bit & 63);

            if constexpr (shift + Width > 64) {
                return ((in[word] >> shift) | (in[word + 1] << (64 - shift))) & mask;
            } else {
                return (in[word] >> shift) & mask;
            }
        }

        template<size_t... I>
        static inline void pack_all(const uint64_t* in, uint64_t* out, std::index_sequence<I...>) noexcept {
            (pack_one<I>(in, out), ...);
        }

        template<size_t... I>
        static inline void unpack_all(const uint64_t* in, uint64_t* out, std::index_sequence<I...>) noexcept {
            ((out[I] = unpack_one<I>(in)), ...);
        }
    };

    using PackFunction = void (*)(const uint64_t*, uint64_t*) noexcept;

    namespace internal {
        template<size_t... W>
        constexpr std::array<PackFunction, sizeof...(W)> make_pack_table(std::index_sequence<W...>) {
            return {{&FastBitPacker<static_cast<unsigned>(W + 1)>::pack_words...}};
        }

        template<size_t... W>
        constexpr std::array<PackFunction, sizeof...(W)> make_unpack_table(std::index_sequence<W...>) {
            return {{&FastBitPacker<static_cast<unsigned>(W + 1)>::unpack_words...}};
        }

        // Entry w - 1 holds the kernel for width w.
        inline constexpr auto pack_table = make_pack_table(std::make_index_sequence<64>{});
        inline constexpr auto unpack_table = make_unpack_table(std::make_index_sequence<64>{});

        inline void check_kernel_width(const unsigned width) {
            if (width == 0 || width > 64) {
                throw std::invalid_argument("bit packing width " + std::to_string(width) +
                                            " is outside [1, 64]");
            }
        }
    } // namespace internal

    /**
     * @brief Runtime-width pack: writes exactly `width` words to `out`.
     * @throws std::invalid_argument if width is not in [1, 64]
     */
    inline void pack_block(const unsigned width, const uint64_t* in, uint64_t* out) {
        internal::check_kernel_width(width);
        internal::pack_table[width - 1](in, out);
    }

    /**
     * @brief Runtime-width unpack: reads exactly `width` words, writes 64 values.
     * @throws std::invalid_argument if width is not in [1, 64]
     */
    inline void unpack_block(const unsigned width, const uint64_t* in, uint64_t* out) {
        internal::check_kernel_width(width);
        internal::unpack_table[width - 1](in, out);
    }

} // namespace dzpack

#endif // DZPACK_FAST_BIT_PACKER_HPP
