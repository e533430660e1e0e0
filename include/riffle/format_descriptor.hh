/**
 * @file format_descriptor.hh
 * @brief Encoding rules of one container family
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <riffle/export_riffle.h>
#include <riffle/byte_order.hh>

namespace riffle {

    /**
     * @enum container_family
     * @brief Family a master tag belongs to
     */
    enum class container_family {
        iff,   ///< EA IFF-85 ("FORM")
        riff,  ///< RIFF and its big-endian spellings ("RIFF", "RIFX", "FFIR")
        rf64,  ///< RF64 with a ds64 side chunk ("RF64")
        w64    ///< Sony Wave64, GUID identifiers ("riff" GUID)
    };

    RIFFLE_EXPORT std::string_view to_string(container_family family);

    /**
     * @enum identifier_encoding
     * @brief How chunk identifiers are decoded to text
     */
    enum class identifier_encoding {
        latin1,  ///< Fixed-width text, byte for byte
        guid     ///< 16-byte GUID rendered in canonical uppercase form
    };

    /**
     * @brief Chunk sizes declared outside the chunk itself
     *
     * Keyed by chunk identifier. An identifier may carry several sizes, one
     * per chunk that uses the sentinel, in the order those chunks appear.
     * Only RF64 fills this, from its ds64 chunk.
     */
    using extended_size_table = std::map<std::string, std::vector<std::uint64_t>>;

    // Stored sizes already handed out per identifier during one walk
    using extended_size_cursor = std::map<std::string, std::size_t>;

    /**
     * @struct format_descriptor
     * @brief Immutable description of how a family lays out its chunks
     *
     * Chosen once by header classification. The chunk reader is
     * parametrized entirely by these fields.
     */
    struct RIFFLE_EXPORT format_descriptor {
        container_family family = container_family::riff;
        byte_order order = byte_order::little;
        identifier_encoding encoding = identifier_encoding::latin1;
        std::size_t identifier_width = 4;   ///< Bytes per identifier
        std::size_t size_field_width = 4;   ///< Bytes per size field
        std::size_t alignment = 2;          ///< Payloads are padded to a multiple of this
        std::uint64_t size_overhead = 0;    ///< Bytes every size field counts beyond the payload
        extended_size_table extended_size_storage;

        /**
         * Size field value meaning "look the size up in extended_size_storage".
         * Set for RF64 (0xFFFFFFFF). Only a size field holding the sentinel is
         * replaced; a sentinel with no stored size left is unsupported_error.
         */
        std::optional<std::uint64_t> size_sentinel;

        // identifier + size field
        [[nodiscard]] std::size_t field_width() const {
            return identifier_width + size_field_width;
        }

        // Padding bytes following a payload of the given length
        [[nodiscard]] std::uint64_t padding_for(std::uint64_t payload_length) const {
            if (alignment <= 1) {
                return 0;
            }
            return (alignment - payload_length % alignment) % alignment;
        }

        // Stored size for the n-th sentinel chunk with this identifier
        [[nodiscard]] std::optional<std::uint64_t> extended_size(const std::string& identifier,
                                                                 std::size_t occurrence = 0) const;

        // FORM: big-endian, 4-byte ids and sizes, 2-byte alignment
        static format_descriptor iff();

        // RIFF/RIFX/FFIR: 4-byte ids and sizes, 2-byte alignment
        static format_descriptor riff(byte_order order = byte_order::little);

        // RIFF layout plus sizes resolved from ds64
        static format_descriptor rf64(extended_size_table sizes);

        // 16-byte GUID ids, 8-byte little-endian sizes, 8-byte alignment, 24 bytes overhead
        static format_descriptor w64();
    };

} // namespace riffle
