#include <benchmark/benchmark.h>
#include "dzpack/DeltaCodec.hpp"
#include <array>
#include <cstdint>
#include <random>
#include <span>
#include <type_traits>
#include <vector>

namespace {

constexpr size_t BLOCKS_PER_RUN = 1024;

// Blocks whose zigzag deltas fit in bit_n bits, chained so each block's
// baseline is the previous block's last value.
template<dzpack::DeltaElement T>
std::vector<dzpack::Block<T>> make_blocks(const unsigned bit_n, T& first_baseline) {
    using U = std::make_unsigned_t<T>;
    std::mt19937_64 gen(42);
    std::vector<dzpack::Block<T>> blocks(BLOCKS_PER_RUN);

    first_baseline = static_cast<T>(gen());
    U previous = static_cast<U>(first_baseline);
    const U mask = static_cast<U>(dzpack::low_bits_mask(bit_n));
    for (auto& block : blocks) {
        for (auto& v : block) {
            previous -= static_cast<U>(dzpack::zigzag_decode(static_cast<U>(gen()) & mask));
            v = static_cast<T>(previous);
        }
    }
    return blocks;
}

template<dzpack::DeltaElement T>
void BM_Encode(benchmark::State& state) {
    const auto bit_n = static_cast<unsigned>(state.range(0));
    T baseline;
    const auto blocks = make_blocks<T>(bit_n, baseline);
    std::vector<uint64_t> pack;
    pack.reserve(BLOCKS_PER_RUN * dzpack::RAW_PACK_WORDS);

    for (auto _ : state) {
        pack.clear();
        T previous = baseline;
        for (const auto& block : blocks) {
            dzpack::append_delta_encode(pack, block, previous);
            previous = block.back();
        }
        benchmark::DoNotOptimize(pack.data());
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations() * BLOCKS_PER_RUN * dzpack::BLOCK_SIZE);
    state.SetBytesProcessed(state.iterations() * BLOCKS_PER_RUN * dzpack::BLOCK_SIZE * sizeof(T));
    state.counters["WordsPerBlock"] = static_cast<double>(pack.size()) / BLOCKS_PER_RUN;
}

template<dzpack::DeltaElement T>
void BM_Decode(benchmark::State& state) {
    const auto bit_n = static_cast<unsigned>(state.range(0));
    T baseline;
    const auto blocks = make_blocks<T>(bit_n, baseline);

    std::vector<uint64_t> pack;
    std::vector<size_t> offsets = {0};
    T previous = baseline;
    for (const auto& block : blocks) {
        offsets.push_back(offsets.back() + dzpack::append_delta_encode(pack, block, previous));
        previous = block.back();
    }

    std::vector<T> out;
    out.reserve(BLOCKS_PER_RUN * dzpack::BLOCK_SIZE);
    for (auto _ : state) {
        out.clear();
        for (size_t k = 0; k < BLOCKS_PER_RUN; ++k) {
            const std::span<const uint64_t> words(pack.data() + offsets[k], offsets[k + 1] - offsets[k]);
            dzpack::append_delta_decode(out, words, k == 0 ? baseline : out.back());
        }
        benchmark::DoNotOptimize(out.data());
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations() * BLOCKS_PER_RUN * dzpack::BLOCK_SIZE);
    state.SetBytesProcessed(state.iterations() * BLOCKS_PER_RUN * dzpack::BLOCK_SIZE * sizeof(T));
}

// Compile-time width, no dispatch through the kernel table.
template<size_t N>
void BM_EncodeFixedWidth(benchmark::State& state) {
    int64_t baseline;
    const auto blocks = make_blocks<int64_t>(N, baseline);
    std::vector<std::array<uint64_t, N>> packs(BLOCKS_PER_RUN);

    for (auto _ : state) {
        int64_t previous = baseline;
        for (size_t k = 0; k < BLOCKS_PER_RUN; ++k) {
            packs[k] = dzpack::encode_fixed_width<N>(blocks[k], previous);
            previous = blocks[k].back();
        }
        benchmark::DoNotOptimize(packs.data());
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations() * BLOCKS_PER_RUN * dzpack::BLOCK_SIZE);
}

} // namespace

BENCHMARK_TEMPLATE(BM_Encode, int32_t)->Arg(1)->Arg(7)->Arg(32);
BENCHMARK_TEMPLATE(BM_Encode, int64_t)->Arg(1)->Arg(7)->Arg(32)->Arg(63);
BENCHMARK_TEMPLATE(BM_Encode, uint64_t)->Arg(1)->Arg(7)->Arg(32)->Arg(63);

BENCHMARK_TEMPLATE(BM_Decode, int32_t)->Arg(1)->Arg(7)->Arg(32);
BENCHMARK_TEMPLATE(BM_Decode, int64_t)->Arg(1)->Arg(7)->Arg(32)->Arg(63);
BENCHMARK_TEMPLATE(BM_Decode, uint64_t)->Arg(1)->Arg(7)->Arg(32)->Arg(63);

BENCHMARK_TEMPLATE(BM_EncodeFixedWidth, 1);
BENCHMARK_TEMPLATE(BM_EncodeFixedWidth, 7);
BENCHMARK_TEMPLATE(BM_EncodeFixedWidth, 32);

BENCHMARK_MAIN();
