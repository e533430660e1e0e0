/**
 * @file chunk.hh
 * @brief One parsed chunk of a container
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace riffle {

    /**
     * @struct chunk
     * @brief A chunk with its payload copied out of the source
     *
     * Chunk values do not refer back to the source and may be kept after
     * the source is gone.
     */
    struct chunk {
        std::string identifier;            ///< Latin-1 text, or uppercase GUID string for W64
        std::uint64_t declared_size = 0;   ///< Size as encoded (or from ds64), before overhead adjustment
        std::vector<std::byte> payload;    ///< declared_size - size_overhead bytes
        std::uint64_t start_offset = 0;    ///< Offset of the identifier field
        std::uint64_t end_offset = 0;      ///< Offset after payload and padding, where the next chunk begins

        [[nodiscard]] std::uint64_t payload_size() const { return payload.size(); }
    };

} // namespace riffle
