#include "benchmark_utils.hpp"
#include "dzpack/dzpack.hpp"
#include <random>

template<typename T>
void RegisterCompression(const std::string& name) {
    for (size_t i = 0; i < g_input_files.size(); ++i) {
        std::string fname = std::filesystem::path(g_input_files[i]).filename().string();
        std::string bench_name = fname + "/Compression/" + name;

        benchmark::RegisterBenchmark(bench_name.c_str(), [](benchmark::State& state, size_t file_idx) {
            const auto data = load_dataset<T>(g_input_files[file_idx]);
            if (data.empty()) {
                state.SkipWithError("Empty data");
                return;
            }

            size_t compressed_bytes = 0;
            for (auto _ : state) {
                dzpack::DeltaBlockSequence<T> sequence(data);
                compressed_bytes = sequence.size_in_bytes();
                benchmark::DoNotOptimize(compressed_bytes);
            }

            state.counters["BitsPerInt"] = 8.0 * static_cast<double>(compressed_bytes) / data.size();
            state.counters["CompRatio"] = static_cast<double>(compressed_bytes) / (data.size() * sizeof(T));
            state.SetBytesProcessed(state.iterations() * data.size() * sizeof(T));
        }, i)->Unit(benchmark::kMillisecond);
    }
}

template<typename T>
void RegisterDecompression(const std::string& name) {
    for (size_t i = 0; i < g_input_files.size(); ++i) {
        std::string fname = std::filesystem::path(g_input_files[i]).filename().string();
        std::string bench_name = fname + "/Decompression/" + name;

        benchmark::RegisterBenchmark(bench_name.c_str(), [](benchmark::State& state, size_t file_idx) {
            const auto data = load_dataset<T>(g_input_files[file_idx]);
            if (data.empty()) {
                state.SkipWithError("Empty data");
                return;
            }

            // Build outside the timed loop
            dzpack::DeltaBlockSequence<T> sequence(data);
            std::vector<T> output(data.size());

            for (auto _ : state) {
                sequence.get_elements(0, data.size(), output);
                benchmark::DoNotOptimize(output.data());
                benchmark::ClobberMemory();
            }

            state.SetBytesProcessed(state.iterations() * data.size() * sizeof(T));
        }, i)->Unit(benchmark::kMillisecond);
    }
}

template<typename T>
void RegisterRandomAccess(const std::string& name) {
    for (size_t i = 0; i < g_input_files.size(); ++i) {
        std::string fname = std::filesystem::path(g_input_files[i]).filename().string();
        std::string bench_name = fname + "/RandomAccess/" + name;

        benchmark::RegisterBenchmark(bench_name.c_str(), [](benchmark::State& state, size_t file_idx) {
            const auto data = load_dataset<T>(g_input_files[file_idx]);
            if (data.empty()) {
                state.SkipWithError("Empty data");
                return;
            }

            dzpack::DeltaBlockSequence<T> sequence(data);

            const size_t num_queries = 1 << 20;
            std::vector<size_t> indices(num_queries);
            std::mt19937 gen(42);
            std::uniform_int_distribution<size_t> dist(0, data.size() - 1);
            for (auto& idx : indices) idx = dist(gen);

            size_t query_idx = 0;
            for (auto _ : state) {
                auto val = sequence[indices[query_idx++ & (num_queries - 1)]];
                benchmark::DoNotOptimize(val);
            }

            state.SetItemsProcessed(state.iterations());
        }, i);
    }
}

int main(int argc, char** argv) {
    RegisterInputFiles(argc, argv);
    benchmark::Initialize(&argc, argv);

    if (g_input_files.empty()) {
        std::cerr << "No input files found.\n";
        return 0;
    }

    RegisterCompression<int64_t>("int64");
    RegisterCompression<uint64_t>("uint64");
    RegisterCompression<int32_t>("int32");
    RegisterDecompression<int64_t>("int64");
    RegisterDecompression<int32_t>("int32");
    RegisterRandomAccess<int64_t>("int64");

    benchmark::RunSpecifiedBenchmarks();
    benchmark::Shutdown();
    return 0;
}
