#pragma once

#include <vector>
#include <string>
#include <benchmark/benchmark.h>
#include "dzpack/utils.hpp"
#include <filesystem>
#include <iostream>
#include <stdexcept>

// Global input files list
inline std::vector<std::string> g_input_files;

// Helper to register input files from command line
inline void RegisterInputFiles(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        // Skip flags
        if (!arg.empty() && arg.rfind("-", 0) == 0) continue;
        if (std::filesystem::exists(arg)) {
            g_input_files.push_back(arg);
        }
    }
}

// Datasets hold a 64-bit count followed by int64 values.
template<typename T>
std::vector<T> load_dataset(const std::string& filename) {
    return dzpack::read_data_binary<int64_t, T>(filename, true);
}
