#include <gtest/gtest.h>
#include "dzpack/DeltaBlockSequence.hpp"
#include "dzpack_test_utils.hpp"
#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <random>
#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

using namespace dzpack;

template<typename T>
class DeltaBlockSequenceTest : public ::testing::Test {
protected:
    std::filesystem::path temp_path;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        // typed suites are named "Suite/0"
        std::string name = std::string("dzpack_") + info->test_suite_name() + "_" + info->name() + ".bin";
        std::replace(name.begin(), name.end(), '/', '_');
        temp_path = std::filesystem::temp_directory_path() / name;
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(temp_path, ec);
    }
};

using ElementTypes = ::testing::Types<int32_t, int64_t, uint64_t>;
TYPED_TEST_SUITE(DeltaBlockSequenceTest, ElementTypes);

// --- Construction ---

TYPED_TEST(DeltaBlockSequenceTest, DefaultConstructor) {
    DeltaBlockSequence<TypeParam> sequence;
    EXPECT_EQ(sequence.size(), 0u);
    EXPECT_TRUE(sequence.empty());
    EXPECT_EQ(sequence.num_blocks(), 0u);
    EXPECT_TRUE(sequence.decode_all().empty());
    EXPECT_EQ(sequence.bits_per_element(), 0.0);
}

TYPED_TEST(DeltaBlockSequenceTest, EncodeEmpty) {
    const std::vector<TypeParam> empty;
    DeltaBlockSequence<TypeParam> sequence(empty);
    EXPECT_EQ(sequence.size(), 0u);
    EXPECT_TRUE(sequence.empty());
    EXPECT_EQ(sequence.num_blocks(), 0u);
    EXPECT_EQ(sequence.profile().blocks, 0u);
}

TYPED_TEST(DeltaBlockSequenceTest, BlockBoundarySizes) {
    using T = TypeParam;
    for (size_t n : {size_t{1}, size_t{63}, size_t{64}, size_t{65}, size_t{128}, size_t{1000}}) {
        const auto data = test::generate_column<T>(n, 100 + n);
        DeltaBlockSequence<T> sequence(data);

        ASSERT_EQ(sequence.size(), n);
        EXPECT_EQ(sequence.num_blocks(), (n + BLOCK_SIZE - 1) / BLOCK_SIZE);
        EXPECT_EQ(sequence.decode_all(), data) << "size " << n;
        for (size_t i = 0; i < n; ++i) {
            ASSERT_EQ(sequence[i], data[i]) << "size " << n << " index " << i;
        }
    }
}

TYPED_TEST(DeltaBlockSequenceTest, AllElementsIdentical) {
    using T = TypeParam;
    const std::vector<T> data(1000, static_cast<T>(42));
    DeltaBlockSequence<T> sequence(data);

    for (size_t k = 0; k < sequence.num_blocks(); ++k) {
        EXPECT_EQ(sequence.block_words(k), 0u) << "block " << k;
    }
    EXPECT_EQ(sequence.decode_all(), data);
    EXPECT_EQ(sequence[999], static_cast<T>(42));
}

TYPED_TEST(DeltaBlockSequenceTest, ExtremeValues) {
    using T = TypeParam;
    std::vector<T> data;
    for (size_t i = 0; i < 300; ++i) {
        data.push_back(i % 3 == 0 ? std::numeric_limits<T>::min() : std::numeric_limits<T>::max());
    }
    DeltaBlockSequence<T> sequence(data);
    EXPECT_EQ(sequence.decode_all(), data);
}

// Short tail blocks are padded with their last value, which costs nothing.
TYPED_TEST(DeltaBlockSequenceTest, TailPaddingAddsNoWidth) {
    using T = TypeParam;
    std::vector<T> data(65, static_cast<T>(7));
    DeltaBlockSequence<T> sequence(data);
    ASSERT_EQ(sequence.num_blocks(), 2u);
    EXPECT_EQ(sequence.block_words(1), 0u);
    EXPECT_EQ(sequence.block_baseline(1), static_cast<T>(7));

    data.push_back(static_cast<T>(6));
    data.push_back(static_cast<T>(5));
    sequence = DeltaBlockSequence<T>(data);
    // deltas of the tail: 0, +1, +1, then zeros from padding
    EXPECT_EQ(sequence.block_words(1), 2u);

    std::vector<T> tail;
    EXPECT_EQ(sequence.decode_block(1, tail), 3u);
    EXPECT_EQ(tail, (std::vector<T>{static_cast<T>(7), static_cast<T>(6), static_cast<T>(5)}));
}

TYPED_TEST(DeltaBlockSequenceTest, BaselinesChainBlocks) {
    using T = TypeParam;
    const auto data = test::generate_column<T>(640, 5);
    DeltaBlockSequence<T> sequence(data);

    EXPECT_EQ(sequence.block_baseline(0), data[0]);
    for (size_t k = 1; k < sequence.num_blocks(); ++k) {
        EXPECT_EQ(sequence.block_baseline(k), data[k * BLOCK_SIZE - 1]) << "block " << k;
    }
    EXPECT_THROW((void) sequence.block_baseline(sequence.num_blocks()), std::out_of_range);
    EXPECT_THROW((void) sequence.block_words(sequence.num_blocks()), std::out_of_range);
}

// --- Access ---

TYPED_TEST(DeltaBlockSequenceTest, DirectAccessOperator) {
    using T = TypeParam;
    const auto data = test::generate_column<T>(5000, 17);
    DeltaBlockSequence<T> sequence(data);

    std::mt19937_64 gen(3);
    for (size_t i = 0; i < 2000; ++i) {
        const size_t index = gen() % data.size();
        ASSERT_EQ(sequence[index], data[index]) << "index " << index;
        ASSERT_EQ(sequence.at(index), data[index]) << "index " << index;
    }
    EXPECT_THROW(sequence[data.size()], std::out_of_range);
    EXPECT_THROW(sequence.at(data.size() + 100), std::out_of_range);
}

TYPED_TEST(DeltaBlockSequenceTest, GetElementsAcrossBlocks) {
    using T = TypeParam;
    const auto data = test::generate_column<T>(1000, 23);
    DeltaBlockSequence<T> sequence(data);

    for (const auto& [start, count] : std::vector<std::pair<size_t, size_t>>{
             {0, 1000}, {0, 64}, {10, 5}, {60, 10}, {63, 130}, {500, 1}, {999, 1}}) {
        std::vector<T> output(count);
        ASSERT_EQ(sequence.get_elements(start, count, output), count) << "start " << start;
        for (size_t i = 0; i < count; ++i) {
            ASSERT_EQ(output[i], data[start + i]) << "start " << start << " offset " << i;
        }
    }
}

TYPED_TEST(DeltaBlockSequenceTest, GetElementsClipsAtEnd) {
    using T = TypeParam;
    const auto data = test::generate_column<T>(200, 29);
    DeltaBlockSequence<T> sequence(data);

    std::vector<T> output(50, static_cast<T>(0));
    EXPECT_EQ(sequence.get_elements(190, 50, output), 10u);
    for (size_t i = 0; i < 10; ++i) {
        EXPECT_EQ(output[i], data[190 + i]);
    }
    EXPECT_EQ(output[10], static_cast<T>(0));

    EXPECT_EQ(sequence.get_elements(200, 5, output), 0u);
    EXPECT_EQ(sequence.get_elements(0, 0, output), 0u);
}

TYPED_TEST(DeltaBlockSequenceTest, GetElementsRejectsSmallOutput) {
    using T = TypeParam;
    const auto data = test::generate_column<T>(200, 31);
    DeltaBlockSequence<T> sequence(data);

    std::vector<T> output(10);
    EXPECT_THROW(sequence.get_elements(0, 11, output), std::invalid_argument);
}

TYPED_TEST(DeltaBlockSequenceTest, DecodeBlockAppends) {
    using T = TypeParam;
    const auto data = test::generate_column<T>(150, 37);
    DeltaBlockSequence<T> sequence(data);

    std::vector<T> out;
    EXPECT_EQ(sequence.decode_block(1, out), BLOCK_SIZE);
    EXPECT_EQ(sequence.decode_block(0, out), BLOCK_SIZE);
    EXPECT_EQ(sequence.decode_block(2, out), 150 - 2 * BLOCK_SIZE);
    ASSERT_EQ(out.size(), 150u);
    for (size_t i = 0; i < BLOCK_SIZE; ++i) {
        EXPECT_EQ(out[i], data[BLOCK_SIZE + i]);
        EXPECT_EQ(out[BLOCK_SIZE + i], data[i]);
    }
    for (size_t i = 2 * BLOCK_SIZE; i < 150; ++i) {
        EXPECT_EQ(out[i], data[i]);
    }
    EXPECT_THROW(sequence.decode_block(3, out), std::out_of_range);
}

// --- Sizes and profile ---

TYPED_TEST(DeltaBlockSequenceTest, ProfileCountsPackKinds) {
    using T = TypeParam;
    using U = std::make_unsigned_t<T>;
    std::vector<T> data;
    for (size_t i = 0; i < BLOCK_SIZE; ++i) {
        data.push_back(static_cast<T>(5));
    }
    for (size_t i = 0; i < BLOCK_SIZE; ++i) {
        data.push_back(static_cast<T>(6 + i));
    }
    std::mt19937_64 gen(41);
    for (size_t i = 0; i < BLOCK_SIZE; ++i) {
        data.push_back(static_cast<T>(static_cast<U>(gen())));
    }
    DeltaBlockSequence<T> sequence(data);

    const auto metrics = sequence.profile();
    EXPECT_EQ(metrics.blocks, 3u);
    EXPECT_EQ(metrics.elements_processed, data.size());
    EXPECT_EQ(metrics.zero_width_blocks, 1u);
    EXPECT_EQ(sequence.block_words(0), 0u);
    EXPECT_EQ(sequence.block_words(1), 1u);
    if constexpr (element_bits<T> > COMPACTION_THRESHOLD) {
        EXPECT_EQ(metrics.fixed_width_blocks, 1u);
        EXPECT_EQ(metrics.raw_blocks, 1u);
        EXPECT_EQ(sequence.block_words(2), RAW_PACK_WORDS);
        EXPECT_EQ(metrics.total_words, 1u + RAW_PACK_WORDS);
    } else {
        EXPECT_EQ(metrics.fixed_width_blocks, 2u);
        EXPECT_EQ(metrics.raw_blocks, 0u);
        EXPECT_EQ(metrics.max_fixed_width, sequence.block_words(2));
    }
    EXPECT_EQ(metrics.min_fixed_width, 1u);
    EXPECT_EQ(metrics.words_histogram[0], 1u);
    EXPECT_EQ(metrics.words_histogram[1], 1u);
}

TYPED_TEST(DeltaBlockSequenceTest, SizeInBytes) {
    using T = TypeParam;
    const std::vector<T> constant(64000, static_cast<T>(1));
    DeltaBlockSequence<T> small(constant);

    const auto data = test::generate_column<T>(64000, 43);
    DeltaBlockSequence<T> large(data);

    EXPECT_GT(small.size_in_bytes(), 0u);
    EXPECT_LT(small.size_in_bytes(), large.size_in_bytes());
    EXPECT_LE(large.theoretical_size_in_bytes(), large.size_in_bytes());
    // Constant columns cost only the block directory.
    EXPECT_LT(small.bits_per_element(), 2.0);
    EXPECT_LT(large.bits_per_element(), 8.0 * sizeof(T));
}

// --- Copy and move ---

TYPED_TEST(DeltaBlockSequenceTest, CopyConstructor) {
    using T = TypeParam;
    const auto data = test::generate_column<T>(700, 47);
    DeltaBlockSequence<T> original(data);
    DeltaBlockSequence<T> copy(original);

    EXPECT_EQ(copy.size(), original.size());
    EXPECT_EQ(copy.decode_all(), data);
    EXPECT_EQ(original.decode_all(), data);
}

TYPED_TEST(DeltaBlockSequenceTest, CopyAssignment) {
    using T = TypeParam;
    const auto first = test::generate_column<T>(700, 53);
    const auto second = test::generate_column<T>(90, 59);
    DeltaBlockSequence<T> a(first);
    DeltaBlockSequence<T> b(second);

    b = a;
    EXPECT_EQ(b.size(), first.size());
    EXPECT_EQ(b.decode_all(), first);
    EXPECT_EQ(a.decode_all(), first);
}

TYPED_TEST(DeltaBlockSequenceTest, MoveConstructorAndAssignment) {
    using T = TypeParam;
    const auto data = test::generate_column<T>(700, 61);
    DeltaBlockSequence<T> original(data);

    DeltaBlockSequence<T> moved(std::move(original));
    EXPECT_EQ(moved.decode_all(), data);

    DeltaBlockSequence<T> target;
    target = std::move(moved);
    EXPECT_EQ(target.size(), data.size());
    EXPECT_EQ(target.decode_all(), data);
}

// --- Serialization ---

TYPED_TEST(DeltaBlockSequenceTest, SerializationDeserialization) {
    using T = TypeParam;
    for (size_t n : {size_t{0}, size_t{1}, size_t{65}, size_t{3000}}) {
        const auto data = test::generate_column<T>(n, 67 + n);
        DeltaBlockSequence<T> original(data);

        std::ofstream ofs(this->temp_path, std::ios::binary);
        ASSERT_TRUE(ofs.is_open());
        original.serialize(ofs);
        ofs.close();
        ASSERT_GT(std::filesystem::file_size(this->temp_path), 0u);

        DeltaBlockSequence<T> loaded;
        std::ifstream ifs(this->temp_path, std::ios::binary);
        ASSERT_TRUE(ifs.is_open());
        loaded.load(ifs);

        EXPECT_EQ(loaded.size(), original.size());
        EXPECT_EQ(loaded.num_blocks(), original.num_blocks());
        EXPECT_EQ(loaded.size_in_bytes(), original.size_in_bytes());
        EXPECT_EQ(loaded.decode_all(), data) << "size " << n;
    }
}

TYPED_TEST(DeltaBlockSequenceTest, SerializeToPath) {
    using T = TypeParam;
    const auto data = test::generate_column<T>(1234, 71);
    DeltaBlockSequence<T> original(data);
    original.serialize(this->temp_path);

    DeltaBlockSequence<T> loaded;
    loaded.load(this->temp_path);
    EXPECT_EQ(loaded.decode_all(), data);
    for (size_t i = 0; i < data.size(); i += 97) {
        EXPECT_EQ(loaded[i], data[i]);
    }
}

TYPED_TEST(DeltaBlockSequenceTest, LoadRejectsMismatchedElementCount) {
    using T = TypeParam;
    const auto data = test::generate_column<T>(300, 73);
    DeltaBlockSequence<T> original(data);
    original.serialize(this->temp_path);

    // Claim one block more than the directory holds.
    {
        std::fstream file(this->temp_path, std::ios::in | std::ios::out | std::ios::binary);
        ASSERT_TRUE(file.is_open());
        const size_t bogus = data.size() + BLOCK_SIZE;
        file.write(reinterpret_cast<const char*>(&bogus), sizeof(bogus));
    }

    const auto other = test::generate_column<T>(10, 79);
    DeltaBlockSequence<T> target(other);
    EXPECT_THROW(target.load(this->temp_path), std::runtime_error);
    // a failed load leaves the previous contents in place
    EXPECT_EQ(target.decode_all(), other);
}

TYPED_TEST(DeltaBlockSequenceTest, LoadRejectsTruncatedFile) {
    using T = TypeParam;
    {
        std::ofstream ofs(this->temp_path, std::ios::binary);
        const char partial[3] = {1, 2, 3};
        ofs.write(partial, sizeof(partial));
    }
    DeltaBlockSequence<T> target;
    EXPECT_THROW(target.load(this->temp_path), std::runtime_error);
    EXPECT_TRUE(target.empty());
}

TYPED_TEST(DeltaBlockSequenceTest, LoadMissingFile) {
    DeltaBlockSequence<TypeParam> target;
    EXPECT_THROW(target.load(this->temp_path / "missing.bin"), std::runtime_error);
}

namespace {

// Writes a stream in the serialized layout with a hand-made block directory.
void write_stream(const std::filesystem::path& path, const size_t n, const std::vector<size_t>& offsets,
                  const size_t n_words) {
    sdsl::int_vector<64> words(n_words, 0);
    sdsl::int_vector<> directory(offsets.size(), 0, 64);
    for (size_t k = 0; k < offsets.size(); ++k) {
        directory[k] = offsets[k];
    }
    sdsl::int_vector<64> baselines(offsets.size() - 1, 0);

    std::ofstream ofs(path, std::ios::binary);
    ofs.write(reinterpret_cast<const char*>(&n), sizeof(n));
    words.serialize(ofs);
    directory.serialize(ofs);
    baselines.serialize(ofs);
}

} // namespace

TYPED_TEST(DeltaBlockSequenceTest, LoadRejectsInvalidPackLength) {
    using T = TypeParam;
    // one block of 50 words: neither a fixed-width nor a raw pack
    write_stream(this->temp_path, BLOCK_SIZE, {0, 50}, 50);

    const auto other = test::generate_column<T>(10, 83);
    DeltaBlockSequence<T> target(other);
    EXPECT_THROW(target.load(this->temp_path), std::runtime_error);
    EXPECT_EQ(target.decode_all(), other);
}

TYPED_TEST(DeltaBlockSequenceTest, LoadRejectsDirectoryNotCoveringWords) {
    using T = TypeParam;
    // the directory stops two words short of the packed words
    write_stream(this->temp_path, 2 * BLOCK_SIZE, {0, 3, 5}, 7);

    DeltaBlockSequence<T> target;
    EXPECT_THROW(target.load(this->temp_path), std::runtime_error);
    EXPECT_TRUE(target.empty());
}

TYPED_TEST(DeltaBlockSequenceTest, LoadChecksFixedWidthAgainstElementBits) {
    using T = TypeParam;
    // 33 words: valid for 64-bit elements, wider than any int32 delta
    write_stream(this->temp_path, BLOCK_SIZE, {0, 33}, 33);

    DeltaBlockSequence<T> target;
    if constexpr (std::is_same_v<T, int32_t>) {
        EXPECT_THROW(target.load(this->temp_path), std::runtime_error);
        EXPECT_TRUE(target.empty());
    } else {
        target.load(this->temp_path);
        EXPECT_EQ(target.size(), BLOCK_SIZE);
        // all-zero words and baseline decode to zeros
        EXPECT_EQ(target.decode_all(), std::vector<T>(BLOCK_SIZE, T{0}));
    }
}
