#include "dzpack/dzpack.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using namespace std::chrono;

namespace {

struct ProgramOptions {
    std::vector<std::filesystem::path> dataset_paths;
    std::string element_type = "int64";
    std::optional<std::filesystem::path> output_path;
    bool verify = true;
    bool verbose = false;
};

std::optional<ProgramOptions> parse_arguments(int argc, char** argv) {
    if (argc < 2) {
        return std::nullopt;
    }

    ProgramOptions opts{};
    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);
        if (arg == "--help" || arg == "-h") {
            return std::nullopt;
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "--no-verify") {
            opts.verify = false;
        } else if (arg.rfind("--type=", 0) == 0) {
            std::string value(arg.substr(7));
            std::transform(value.begin(),
                           value.end(),
                           value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            if (value != "int32" && value != "int64" && value != "uint64") {
                throw std::invalid_argument("Unsupported element type: " + value);
            }
            opts.element_type = std::move(value);
        } else if (arg.rfind("--output=", 0) == 0) {
            opts.output_path = std::filesystem::path(std::string(arg.substr(9)));
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::invalid_argument("Unknown option: " + std::string(arg));
        } else {
            opts.dataset_paths.emplace_back(std::string(arg));
        }
    }

    if (opts.dataset_paths.empty()) {
        throw std::invalid_argument("Missing dataset path argument");
    }
    if (opts.output_path.has_value() && opts.dataset_paths.size() != 1) {
        throw std::invalid_argument("--output needs exactly one dataset");
    }
    for (const auto& path : opts.dataset_paths) {
        if (!std::filesystem::exists(path)) {
            throw std::invalid_argument("Dataset does not exist: " + path.string());
        }
    }
    return opts;
}

void print_histogram(const dzpack::CompressionBuildMetrics& metrics) {
    std::cout << "  Pack length histogram (words: blocks):\n";
    for (size_t words = 0; words < metrics.words_histogram.size(); ++words) {
        if (metrics.words_histogram[words] == 0) continue;
        std::cout << "    " << std::setw(2) << words << ": " << metrics.words_histogram[words] << "\n";
    }
}

// Returns false when verification was requested and failed.
template<dzpack::DeltaElement T>
bool process(const std::filesystem::path& path, const ProgramOptions& opts) {
    // Datasets are stored as int64; narrower element types take the low bits.
    const std::vector<T> data = dzpack::read_data_binary<int64_t, T>(path.string(), true);

    const auto t0 = steady_clock::now();
    dzpack::DeltaBlockSequence<T> sequence(data);
    const auto t1 = steady_clock::now();

    const double input_bytes = static_cast<double>(data.size() * sizeof(T));
    const double compressed_bytes = static_cast<double>(sequence.size_in_bytes());
    const double seconds = duration<double>(t1 - t0).count();

    std::cout << std::fixed << std::setprecision(3);
    std::cout << path.string() << "\n"
              << "  Number of integers:  " << data.size() << "\n"
              << "  Compressed size:     " << (compressed_bytes / (1024.0 * 1024.0)) << " MB\n"
              << "  Compression ratio:   "
              << (input_bytes > 0 ? 100.0 * compressed_bytes / input_bytes : 0.0) << " %\n"
              << "  Bits per integer:    " << sequence.bits_per_element() << "\n"
              << "  Build time:          " << seconds << " s\n";

    if (opts.verbose) {
        const auto metrics = sequence.profile();
        std::cout << "  Blocks (zero/fixed/raw): " << metrics.blocks << " ("
                  << metrics.zero_width_blocks << "/" << metrics.fixed_width_blocks << "/"
                  << metrics.raw_blocks << ")\n"
                  << "  Average pack length:   " << metrics.average_words_per_block() << " words\n";
        if (metrics.fixed_width_blocks > 0) {
            std::cout << "  Fixed width (min/max): " << static_cast<int>(metrics.min_fixed_width) << " / "
                      << static_cast<int>(metrics.max_fixed_width) << "\n";
        }
        print_histogram(metrics);
    }

    if (opts.output_path.has_value()) {
        sequence.serialize(*opts.output_path);
        std::cout << "  Written to:          " << opts.output_path->string() << "\n";
    }

    if (opts.verify) {
        const auto decoded = sequence.decode_all();
        const auto mismatch = std::mismatch(data.begin(), data.end(), decoded.begin(), decoded.end());
        if (mismatch.first != data.end() || mismatch.second != decoded.end()) {
            std::cerr << "Verification failed for " << path.string() << " at index "
                      << std::distance(data.begin(), mismatch.first) << std::endl;
            return false;
        }
        std::cout << "  Round trip:          ok\n";
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    try {
        auto maybe_opts = parse_arguments(argc, argv);
        if (!maybe_opts.has_value()) {
            std::cout << "Usage: " << argv[0]
                      << " [options] <dataset.bin> [<dataset.bin> ...]\n\n"
                      << "Datasets start with a 64-bit element count followed by int64 values.\n\n"
                      << "Options:\n"
                      << "  --type=<int32|int64|uint64>  Element type to compress as (default: int64)\n"
                      << "  --output=<file>              Serialize the compressed sequence\n"
                      << "  --no-verify                  Skip the decode check\n"
                      << "  --verbose                    Print block statistics\n"
                      << std::endl;
            return 1;
        }

        const ProgramOptions& opts = *maybe_opts;
        bool ok = true;
        for (const auto& path : opts.dataset_paths) {
            if (opts.element_type == "int32") {
                ok = process<int32_t>(path, opts) && ok;
            } else if (opts.element_type == "uint64") {
                ok = process<uint64_t>(path, opts) && ok;
            } else {
                ok = process<int64_t>(path, opts) && ok;
            }
        }
        std::cout << std::endl;
        return ok ? 0 : 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return 1;
    }
}
