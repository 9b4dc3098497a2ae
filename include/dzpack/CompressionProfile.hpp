#ifndef DZPACK_COMPRESSION_PROFILE_HPP
#define DZPACK_COMPRESSION_PROFILE_HPP

#include "DeltaCodec.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>

namespace dzpack {

struct CompressionBuildMetrics {
    std::size_t blocks = 0;
    std::size_t elements_processed = 0;
    std::size_t total_words = 0;

    std::size_t zero_width_blocks = 0;
    std::size_t fixed_width_blocks = 0;
    std::size_t raw_blocks = 0;

    std::uint8_t min_fixed_width = std::numeric_limits<std::uint8_t>::max();
    std::uint8_t max_fixed_width = 0;

    // Index = pack length in words, 0..64.
    std::array<std::size_t, RAW_PACK_WORDS + 1> words_histogram{};

    void record_block(std::size_t pack_words, std::size_t elements) {
        switch (classify_pack(pack_words)) {
            case PackKind::ZeroWidth:
                ++zero_width_blocks;
                break;
            case PackKind::FixedWidth: {
                ++fixed_width_blocks;
                const auto width = static_cast<std::uint8_t>(pack_words);
                if (width < min_fixed_width) {
                    min_fixed_width = width;
                }
                if (width > max_fixed_width) {
                    max_fixed_width = width;
                }
                break;
            }
            case PackKind::Raw:
                ++raw_blocks;
                break;
            case PackKind::Invalid:
                throw DecodingError("cannot profile a pack of " + std::to_string(pack_words) + " words");
        }
        blocks += 1;
        elements_processed += elements;
        total_words += pack_words;
        words_histogram[pack_words] += 1;
    }

    double average_words_per_block() const {
        if (blocks == 0) return 0.0;
        return static_cast<double>(total_words) / static_cast<double>(blocks);
    }

    // Payload bits per element, directory and baselines excluded.
    double bits_per_element() const {
        if (elements_processed == 0) return 0.0;
        return static_cast<double>(total_words * 64) / static_cast<double>(elements_processed);
    }
};

} // namespace dzpack

#endif // DZPACK_COMPRESSION_PROFILE_HPP
