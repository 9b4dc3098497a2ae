#ifndef DZPACK_DELTA_BLOCK_SEQUENCE_HPP
#define DZPACK_DELTA_BLOCK_SEQUENCE_HPP

#include "CompressionProfile.hpp"
#include "DeltaCodec.hpp"
#include "sdsl/int_vector.hpp"
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#if defined(_OPENMP) && !defined(DZPACK_DISABLE_OPENMP)
#include <omp.h>
#define DZPACK_USE_OPENMP 1
#endif

namespace dzpack {

    /**
     * @brief A whole column compressed block by block with the delta codec.
     *
     * The sequence is cut into blocks of 64 values. The last block is padded with
     * copies of its final value, which adds only zero deltas and so never widens
     * it. Block k is encoded against the value preceding it (the first block
     * against its own first value); these baselines are stored so every block
     * decodes on its own, and a directory of word offsets frames the packs.
     *
     * @tparam T int32_t, int64_t or uint64_t.
     */
    template<DeltaElement T>
    class DeltaBlockSequence {
    public:
        constexpr static size_t MIN_BLOCKS_PER_THREAD = 2048;

        DeltaBlockSequence() : m_offsets(1, 0, 1), m_size(0) {}

        explicit DeltaBlockSequence(const std::vector<T>& data) : m_size(data.size()) {
            const size_t n_blocks = num_blocks_for(m_size);
            m_baselines = sdsl::int_vector<64>(n_blocks, 0);

            // Pass 1: pack length of every block, then prefix sums.
            std::vector<uint64_t> offsets(n_blocks + 1, 0);
            auto measure = [&](size_t k) {
                Block<T> block;
                const T baseline = load_block(data, k, block);
                m_baselines[k] = to_raw_word(baseline);
                offsets[k + 1] = pack_length_for_width(delta_bit_width(block, baseline));
            };

            // Pass 2: every block encodes straight into its final position.
            sdsl::int_vector<64> words;
            auto encode = [&](size_t k) -> bool {
                Block<T> block;
                const T baseline = load_block(data, k, block);
                const size_t written = encode_block(block, baseline, words.data() + offsets[k]);
                return written == offsets[k + 1] - offsets[k];
            };

        #if DZPACK_USE_OPENMP
            const int n_threads = std::max(1, std::min(omp_get_max_threads(),
                                                       static_cast<int>(n_blocks / MIN_BLOCKS_PER_THREAD)));
            #pragma omp parallel for schedule(static) num_threads(n_threads)
            for (size_t k = 0; k < n_blocks; ++k) {
                measure(k);
            }
        #else
            for (size_t k = 0; k < n_blocks; ++k) {
                measure(k);
            }
        #endif

            for (size_t k = 0; k < n_blocks; ++k) {
                offsets[k + 1] += offsets[k];
            }
            words = sdsl::int_vector<64>(offsets[n_blocks], 0);

            bool consistent = true;
        #if DZPACK_USE_OPENMP
            #pragma omp parallel for schedule(static) num_threads(n_threads) reduction(&& : consistent)
            for (size_t k = 0; k < n_blocks; ++k) {
                consistent = encode(k) && consistent;
            }
        #else
            for (size_t k = 0; k < n_blocks; ++k) {
                consistent = encode(k) && consistent;
            }
        #endif
            if (!consistent) {
                throw std::runtime_error("DeltaBlockSequence: block sizes changed between passes");
            }

            m_words = std::move(words);
            m_offsets = sdsl::int_vector<>(n_blocks + 1, 0, 64);
            for (size_t k = 0; k <= n_blocks; ++k) {
                m_offsets[k] = offsets[k];
            }
            sdsl::util::bit_compress(m_offsets);
        }

        DeltaBlockSequence(const DeltaBlockSequence&) = default;
        DeltaBlockSequence(DeltaBlockSequence&&) = default;
        DeltaBlockSequence& operator=(const DeltaBlockSequence&) = default;
        DeltaBlockSequence& operator=(DeltaBlockSequence&&) = default;
        ~DeltaBlockSequence() = default;

        friend void swap(DeltaBlockSequence& first, DeltaBlockSequence& second) noexcept {
            using std::swap;
            swap(first.m_words, second.m_words);
            swap(first.m_offsets, second.m_offsets);
            swap(first.m_baselines, second.m_baselines);
            swap(first.m_size, second.m_size);
        }

        [[nodiscard]] size_t size() const {
            return m_size;
        }

        [[nodiscard]] bool empty() const {
            return m_size == 0;
        }

        [[nodiscard]] size_t num_blocks() const {
            return m_baselines.size();
        }

        /**
         * @brief Number of words in block k's pack: 0, 1..42 or 64.
         */
        [[nodiscard]] size_t block_words(const size_t k) const {
            check_block_index(k);
            return block_offset(k + 1) - block_offset(k);
        }

        [[nodiscard]] T block_baseline(const size_t k) const {
            check_block_index(k);
            return from_raw_word<T>(m_baselines[k]);
        }

        /**
         * @brief Element access. Decodes at most the one block holding the index.
         * @throws std::out_of_range if index >= size()
         */
        T operator[](const size_t index) const {
            if (index >= m_size) [[unlikely]] {
                throw std::out_of_range("index out of range in DeltaBlockSequence");
            }
            const size_t k = index / BLOCK_SIZE;
            const size_t in_block = index % BLOCK_SIZE;
            const size_t begin = block_offset(k);
            const size_t words = block_offset(k + 1) - begin;

            switch (classify_pack(words)) {
                case PackKind::ZeroWidth:
                    return from_raw_word<T>(m_baselines[k]);
                case PackKind::Raw:
                    return from_raw_word<T>(m_words[begin + in_block]);
                default: {
                    Block<T> block;
                    dzpack::decode_block(m_words.data() + begin, words, from_raw_word<T>(m_baselines[k]), block.data());
                    return block[in_block];
                }
            }
        }

        T at(const size_t index) const {
            return operator[](index);
        }

        /**
         * @brief Decodes [startIndex, startIndex + count) into output[0..].
         * @return Number of elements written, clipped at size().
         * @throws std::invalid_argument if output is smaller than count
         */
        size_t get_elements(const size_t startIndex, const size_t count, std::vector<T>& output) const {
            if (count == 0 || startIndex >= m_size) {
                return 0;
            }
            if (output.size() < count) {
                throw std::invalid_argument("output buffer is smaller than requested count");
            }

            const size_t endIndex = std::min(startIndex + count, m_size);
            const size_t first_block = startIndex / BLOCK_SIZE;
            const size_t last_block = (endIndex - 1) / BLOCK_SIZE;

            Block<T> block;
            size_t written = 0;
            for (size_t k = first_block; k <= last_block; ++k) {
                decode_stored_block(k, block);
                const size_t block_start = k * BLOCK_SIZE;
                const size_t from = std::max(startIndex, block_start) - block_start;
                const size_t to = std::min(endIndex, block_start + BLOCK_SIZE) - block_start;
                std::copy(block.begin() + from, block.begin() + to, output.begin() + written);
                written += to - from;
            }
            return written;
        }

        /**
         * @brief Appends the elements of block k to out (64, or fewer for a short last block).
         * @return Number of elements appended.
         */
        size_t decode_block(const size_t k, std::vector<T>& out) const {
            check_block_index(k);
            Block<T> block;
            decode_stored_block(k, block);
            const size_t n = std::min(BLOCK_SIZE, m_size - k * BLOCK_SIZE);
            out.insert(out.end(), block.begin(), block.begin() + n);
            return n;
        }

        [[nodiscard]] std::vector<T> decode_all() const {
            std::vector<T> result(m_size);
            get_elements(0, m_size, result);
            return result;
        }

        [[nodiscard]] CompressionBuildMetrics profile() const {
            CompressionBuildMetrics metrics;
            for (size_t k = 0; k < num_blocks(); ++k) {
                metrics.record_block(block_words(k), std::min(BLOCK_SIZE, m_size - k * BLOCK_SIZE));
            }
            return metrics;
        }

        [[nodiscard]] size_t size_in_bytes() const {
            size_t total_bytes = sizeof(m_size);
            total_bytes += sdsl::size_in_bytes(m_words);
            total_bytes += sdsl::size_in_bytes(m_offsets);
            total_bytes += sdsl::size_in_bytes(m_baselines);
            return total_bytes;
        }

        [[nodiscard]] size_t theoretical_size_in_bytes() const {
            auto bits_to_bytes = [](size_t bits) -> size_t { return (bits + 7) / 8; };
            size_t total_bytes = sizeof(m_size);
            total_bytes += bits_to_bytes(m_words.size() * 64);
            total_bytes += bits_to_bytes(m_offsets.size() * m_offsets.width());
            total_bytes += bits_to_bytes(m_baselines.size() * 64);
            return total_bytes;
        }

        [[nodiscard]] double bits_per_element() const {
            if (m_size == 0) return 0.0;
            return static_cast<double>(size_in_bytes() * 8) / static_cast<double>(m_size);
        }

        // ~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~
        // Serialization
        // ~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~~

        void serialize(std::ofstream& ofs) const {
            if (!ofs.is_open()) {
                throw std::runtime_error("Output file stream is not open for serialization.");
            }
            ofs.write(reinterpret_cast<const char*>(&m_size), sizeof(m_size));
            m_words.serialize(ofs);
            m_offsets.serialize(ofs);
            m_baselines.serialize(ofs);
            if (ofs.fail()) {
                throw std::runtime_error("Failed to write DeltaBlockSequence to stream.");
            }
        }

        void serialize(const std::filesystem::path& filepath) const {
            std::ofstream ofs(filepath, std::ios::binary);
            if (!ofs.is_open()) {
                throw std::runtime_error("Failed to open file " + filepath.string());
            }
            serialize(ofs);
        }

        /**
         * @brief Replaces the contents with a sequence read from the stream.
         * @throws std::runtime_error on a closed stream, short read or inconsistent block directory
         */
        void load(std::ifstream& ifs) {
            if (!ifs.is_open()) {
                throw std::runtime_error("Input file stream is not open for loading.");
            }
            DeltaBlockSequence loaded;
            ifs.read(reinterpret_cast<char*>(&loaded.m_size), sizeof(loaded.m_size));
            if (ifs.fail()) {
                throw std::runtime_error("Failed to read element count during DeltaBlockSequence load.");
            }
            loaded.m_words.load(ifs);
            loaded.m_offsets.load(ifs);
            loaded.m_baselines.load(ifs);
            if (ifs.fail()) {
                throw std::runtime_error("Failed to read block data during DeltaBlockSequence load.");
            }
            loaded.validate();
            swap(*this, loaded);
        }

        void load(const std::filesystem::path& filepath) {
            std::ifstream ifs(filepath, std::ios::binary);
            if (!ifs.is_open()) {
                throw std::runtime_error("Failed to open file " + filepath.string());
            }
            load(ifs);
        }

    private:
        // Packs of every block, back to back.
        sdsl::int_vector<64> m_words;

        // m_offsets[k] is the first word of block k; m_offsets[num_blocks] == m_words.size().
        sdsl::int_vector<> m_offsets;

        // Value preceding each block, as a raw 64-bit pattern.
        sdsl::int_vector<64> m_baselines;

        size_t m_size;

        static size_t num_blocks_for(const size_t n) {
            return (n + BLOCK_SIZE - 1) / BLOCK_SIZE;
        }

        // Copies block k out of data, padding a short tail; returns its baseline.
        static T load_block(const std::vector<T>& data, const size_t k, Block<T>& block) {
            const size_t start = k * BLOCK_SIZE;
            const size_t end = std::min(start + BLOCK_SIZE, data.size());
            std::copy(data.begin() + start, data.begin() + end, block.begin());
            std::fill(block.begin() + (end - start), block.end(), data[end - 1]);
            return start == 0 ? data[0] : data[start - 1];
        }

        size_t block_offset(const size_t k) const {
            return static_cast<size_t>(m_offsets[k]);
        }

        void check_block_index(const size_t k) const {
            if (k >= num_blocks()) {
                throw std::out_of_range("block " + std::to_string(k) + " out of range in DeltaBlockSequence");
            }
        }

        void decode_stored_block(const size_t k, Block<T>& block) const {
            const size_t begin = block_offset(k);
            dzpack::decode_block(m_words.data() + begin, block_offset(k + 1) - begin,
                         from_raw_word<T>(m_baselines[k]), block.data());
        }

        void validate() const {
            const size_t n_blocks = num_blocks_for(m_size);
            if (m_baselines.size() != n_blocks || m_offsets.size() != n_blocks + 1) {
                throw std::runtime_error("DeltaBlockSequence: block directory does not match element count");
            }
            if (block_offset(0) != 0 || block_offset(n_blocks) != m_words.size()) {
                throw std::runtime_error("DeltaBlockSequence: block directory does not cover the packed words");
            }
            for (size_t k = 0; k < n_blocks; ++k) {
                const size_t begin = block_offset(k);
                const size_t end = block_offset(k + 1);
                if (end < begin || !is_valid_pack_length_for<T>(end - begin)) {
                    throw std::runtime_error("DeltaBlockSequence: block " + std::to_string(k) +
                                             " has an invalid pack length");
                }
            }
        }
    };

} // namespace dzpack

#endif // DZPACK_DELTA_BLOCK_SEQUENCE_HPP
