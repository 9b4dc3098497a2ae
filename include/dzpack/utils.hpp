#ifndef DZPACK_UTILS_HPP
#define DZPACK_UTILS_HPP

#include "DeltaCodec.hpp"
#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace dzpack {

    /**
     * @brief Loads a binary column as the element type of a DeltaBlockSequence.
     *
     * The file holds TypeIn values back to back, optionally preceded by a
     * uint64_t element count. A count larger than what the file holds is an
     * error, not a short read.
     *
     * Values convert with static_cast: a narrower TypeOut (int64 datasets read
     * as int32_t) keeps the low bits in two's complement, and a signed TypeIn
     * read as uint64_t keeps its bit pattern.
     *
     * @param path Dataset file.
     * @param first_is_size If true the first 8 bytes are the element count,
     *                      otherwise the count is the file size over sizeof(TypeIn).
     * @param max_size Upper bound on the number of elements returned.
     * @throws std::runtime_error if the file cannot be opened or read, or is shorter than its header claims
     */
    template<typename TypeIn, DeltaElement TypeOut>
    std::vector<TypeOut> read_data_binary(const std::filesystem::path& path, const bool first_is_size = true,
                                          const size_t max_size = std::numeric_limits<size_t>::max()) {
        static_assert(std::is_integral_v<TypeIn>, "datasets hold integers");

        std::ifstream in(path, std::ios::binary | std::ios::ate);
        if (!in.is_open()) {
            throw std::runtime_error("Failed to open dataset " + path.string());
        }
        const std::streamoff file_bytes = in.tellg();
        if (file_bytes < 0) {
            throw std::runtime_error("Could not determine the size of " + path.string());
        }
        in.seekg(0);

        const size_t header_bytes = first_is_size ? sizeof(uint64_t) : 0;
        if (static_cast<size_t>(file_bytes) < header_bytes) {
            throw std::runtime_error(path.string() + " is too short to hold an element count");
        }
        const size_t available = (static_cast<size_t>(file_bytes) - header_bytes) / sizeof(TypeIn);

        size_t count = available;
        if (first_is_size) {
            uint64_t header = 0;
            in.read(reinterpret_cast<char*>(&header), sizeof(header));
            if (!in) {
                throw std::runtime_error("Failed to read the element count of " + path.string());
            }
            if (header > available) {
                throw std::runtime_error(path.string() + " claims " + std::to_string(header) +
                                         " elements but holds " + std::to_string(available));
            }
            count = static_cast<size_t>(header);
        }
        count = std::min(count, max_size);

        std::vector<TypeOut> column;
        column.reserve(count);

        constexpr size_t chunk_elements = 131072;
        std::vector<TypeIn> buffer(std::min(chunk_elements, count));
        while (column.size() < count) {
            const size_t n = std::min(chunk_elements, count - column.size());
            in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(n * sizeof(TypeIn)));
            if (!in) {
                throw std::runtime_error("I/O error while reading " + path.string() + " at element " +
                                         std::to_string(column.size()));
            }
            std::transform(buffer.begin(), buffer.begin() + n, std::back_inserter(column),
                           [](const TypeIn v) { return static_cast<TypeOut>(v); });
        }
        return column;
    }

} // namespace dzpack

#endif // DZPACK_UTILS_HPP
