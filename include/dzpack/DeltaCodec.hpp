//
// Delta + zigzag + bit packing codec for blocks of 64 integers.
//

#ifndef DZPACK_DELTA_CODEC_HPP
#define DZPACK_DELTA_CODEC_HPP

#include "BitWidth.hpp"
#include "FastBitPacker.hpp"
#include "ZigZag.hpp"
#include <algorithm>
#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace dzpack {

    /*
     * Pack layout, identified by its length alone:
     *
     *   0 words          every delta is zero, the block repeats the baseline
     *   n words, n <= T  deltas zigzag mapped and bit packed at width n
     *   64 words         raw: each element sign/zero-extended to 64 bits
     *
     * Deltas run from the predecessor to the current value:
     *   delta[0] = baseline - block[0], delta[i] = block[i - 1] - block[i]
     * in modular arithmetic, so wraparound is exact on both sides.
     */

    // Widths above this are stored raw.
    inline constexpr unsigned COMPACTION_THRESHOLD = 42;
    inline constexpr size_t RAW_PACK_WORDS = BLOCK_SIZE;

    template<typename T>
    concept DeltaElement = std::same_as<T, int32_t> || std::same_as<T, int64_t> || std::same_as<T, uint64_t>;

    template<typename T>
    using Block = std::array<T, BLOCK_SIZE>;

    template<DeltaElement T>
    inline constexpr unsigned element_bits = std::numeric_limits<std::make_unsigned_t<T>>::digits;

    /**
     * @brief Thrown when a pack cannot have been produced by this codec.
     */
    class DecodingError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    enum class PackKind : uint8_t {
        ZeroWidth,
        FixedWidth,
        Raw,
        Invalid
    };

    constexpr PackKind classify_pack(const size_t words) noexcept {
        if (words == 0) return PackKind::ZeroWidth;
        if (words <= COMPACTION_THRESHOLD) return PackKind::FixedWidth;
        if (words == RAW_PACK_WORDS) return PackKind::Raw;
        return PackKind::Invalid;
    }

    constexpr bool is_valid_pack_length(const size_t words) noexcept {
        return classify_pack(words) != PackKind::Invalid;
    }

    // Widest fixed-width pack a T block can produce: 32 for int32_t, 42 otherwise.
    template<DeltaElement T>
    inline constexpr unsigned max_fixed_width = std::min(COMPACTION_THRESHOLD, element_bits<T>);

    /**
     * @brief Pack length check for a given element type.
     *
     * Stricter than is_valid_pack_length: an int32_t delta never needs more
     * than 32 bits, so 33..42 word packs cannot come from an int32_t block.
     */
    template<DeltaElement T>
    constexpr bool is_valid_pack_length_for(const size_t words) noexcept {
        const PackKind kind = classify_pack(words);
        if (kind == PackKind::FixedWidth) {
            return words <= max_fixed_width<T>;
        }
        return kind != PackKind::Invalid;
    }

    /**
     * @brief Pack length the encoder emits for a block of the given delta width.
     */
    constexpr size_t pack_length_for_width(const unsigned bit_width) noexcept {
        return bit_width <= COMPACTION_THRESHOLD ? bit_width : RAW_PACK_WORDS;
    }

    template<DeltaElement T>
    constexpr uint64_t to_raw_word(const T value) noexcept {
        if constexpr (std::is_signed_v<T>) {
            return static_cast<uint64_t>(static_cast<int64_t>(value));
        } else {
            return static_cast<uint64_t>(value);
        }
    }

    template<DeltaElement T>
    constexpr T from_raw_word(const uint64_t word) noexcept {
        return static_cast<T>(word);
    }

    /**
     * @brief Zigzag-mapped deltas of a block, widened to 64 bits.
     */
    template<DeltaElement T>
    std::array<uint64_t, BLOCK_SIZE> zigzag_deltas(const Block<T>& block, const T baseline) noexcept {
        using U = std::make_unsigned_t<T>;
        using S = std::make_signed_t<T>;

        std::array<uint64_t, BLOCK_SIZE> zigzags;
        U previous = static_cast<U>(baseline);
        for (size_t i = 0; i < BLOCK_SIZE; ++i) {
            const U current = static_cast<U>(block[i]);
            zigzags[i] = zigzag_encode(static_cast<S>(static_cast<U>(previous - current)));
            previous = current;
        }
        return zigzags;
    }

    /**
     * @brief Minimal width in [0, element_bits<T>] holding every zigzag delta.
     */
    template<DeltaElement T>
    uint8_t delta_bit_width(const Block<T>& block, const T baseline) noexcept {
        return required_bit_width(zigzag_deltas(block, baseline));
    }

    namespace internal {
        // Inverse of zigzag_deltas: running sum from the baseline.
        template<DeltaElement T>
        void apply_zigzag_deltas(const uint64_t* zigzags, const T baseline, T* out) noexcept {
            using U = std::make_unsigned_t<T>;

            U previous = static_cast<U>(baseline);
            for (size_t i = 0; i < BLOCK_SIZE; ++i) {
                previous -= static_cast<U>(zigzag_decode(static_cast<U>(zigzags[i])));
                out[i] = static_cast<T>(previous);
            }
        }

        [[noreturn]] inline void throw_invalid_pack(const size_t words, const unsigned max_width) {
            throw DecodingError("invalid pack of " + std::to_string(words) +
                                " words: expected 0, 1.." + std::to_string(max_width) +
                                " or " + std::to_string(RAW_PACK_WORDS));
        }
    } // namespace internal

    /**
     * @brief Encodes one block into `out`.
     * @param out Room for at least 64 words; only the returned count is written.
     * @return The pack length: 0, the delta width (up to 42), or 64.
     */
    template<DeltaElement T>
    size_t encode_block(const Block<T>& block, const T baseline, uint64_t* out) noexcept {
        const auto zigzags = zigzag_deltas(block, baseline);
        const unsigned width = required_bit_width(zigzags);

        if (width == 0) {
            return 0;
        }
        if (width > COMPACTION_THRESHOLD) {
            for (size_t i = 0; i < BLOCK_SIZE; ++i) {
                out[i] = to_raw_word(block[i]);
            }
            return RAW_PACK_WORDS;
        }
        internal::pack_table[width - 1](zigzags.data(), out);
        return width;
    }

    /**
     * @brief Decodes one pack of `words` words into out[0..63].
     * @throws DecodingError if `words` is not a pack length this codec emits for T
     */
    template<DeltaElement T>
    void decode_block(const uint64_t* pack, const size_t words, const T baseline, T* out) {
        switch (classify_pack(words)) {
            case PackKind::ZeroWidth:
                std::fill_n(out, BLOCK_SIZE, baseline);
                return;
            case PackKind::FixedWidth: {
                if (words > max_fixed_width<T>) [[unlikely]] {
                    break;
                }
                std::array<uint64_t, BLOCK_SIZE> zigzags;
                internal::unpack_table[words - 1](pack, zigzags.data());
                internal::apply_zigzag_deltas(zigzags.data(), baseline, out);
                return;
            }
            case PackKind::Raw:
                for (size_t i = 0; i < BLOCK_SIZE; ++i) {
                    out[i] = from_raw_word<T>(pack[i]);
                }
                return;
            case PackKind::Invalid:
                break;
        }
        internal::throw_invalid_pack(words, max_fixed_width<T>);
    }

    /**
     * @brief Appends the pack of `block` to `dst`, keeping what `dst` holds.
     *
     * Successive blocks may be appended to one buffer; framing them is up to
     * the caller (see DeltaBlockSequence).
     *
     * @return Number of words appended.
     */
    template<DeltaElement T>
    size_t append_delta_encode(std::vector<uint64_t>& dst, const Block<T>& block, const T baseline) {
        const size_t offset = dst.size();
        dst.resize(offset + RAW_PACK_WORDS);
        const size_t words = encode_block(block, baseline, dst.data() + offset);
        dst.resize(offset + words);
        return words;
    }

    /**
     * @brief Appends the 64 values decoded from one pack to `dst`.
     * @param pack Exactly one block's words.
     * @return Number of values appended (always 64).
     * @throws DecodingError if the pack length is not 0, 1..max_fixed_width<T> or 64;
     *         `dst` is left unchanged
     */
    template<DeltaElement T>
    size_t append_delta_decode(std::vector<T>& dst, std::span<const uint64_t> pack, const T baseline) {
        if (!is_valid_pack_length_for<T>(pack.size())) {
            internal::throw_invalid_pack(pack.size(), max_fixed_width<T>);
        }
        const size_t offset = dst.size();
        dst.resize(offset + BLOCK_SIZE);
        decode_block(pack.data(), pack.size(), baseline, dst.data() + offset);
        return BLOCK_SIZE;
    }

    /**
     * @brief Encodes a block whose delta width is known at compile time.
     *
     * The result is the same pack append_delta_encode produces for a block of
     * delta width exactly N. A narrower block is packed at N bits anyway.
     *
     * @throws std::invalid_argument if some zigzag delta needs more than N bits
     */
    template<size_t N, DeltaElement T>
        requires (N >= 1 && N <= max_fixed_width<T>)
    std::array<uint64_t, N> encode_fixed_width(const Block<T>& block, const T baseline) {
        const auto zigzags = zigzag_deltas(block, baseline);
        const unsigned width = required_bit_width(zigzags);
        if (width > N) {
            throw std::invalid_argument("block needs " + std::to_string(width) +
                                        "-bit deltas, cannot pack at width " + std::to_string(N));
        }
        std::array<uint64_t, N> packed;
        FastBitPacker<static_cast<unsigned>(N)>::pack(zigzags, packed);
        return packed;
    }

    template<DeltaElement T, size_t N>
        requires (N >= 1 && N <= max_fixed_width<T>)
    Block<T> decode_fixed_width(const std::array<uint64_t, N>& packed, const T baseline) noexcept {
        std::array<uint64_t, BLOCK_SIZE> zigzags;
        FastBitPacker<static_cast<unsigned>(N)>::unpack(packed, zigzags);
        Block<T> block;
        internal::apply_zigzag_deltas(zigzags.data(), baseline, block.data());
        return block;
    }

} // namespace dzpack

#endif // DZPACK_DELTA_CODEC_HPP
