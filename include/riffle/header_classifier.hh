/**
 * @file header_classifier.hh
 * @brief Container detection from the leading bytes of a source
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <riffle/export_riffle.h>
#include <riffle/byte_order.hh>
#include <riffle/format_descriptor.hh>
#include <riffle/fourcc.hh>
#include <riffle/parse_options.hh>
#include <riffle/source.hh>

namespace riffle {

    /**
     * @struct container_metadata
     * @brief What the container header declares
     */
    struct container_metadata {
        std::string master_identifier;     ///< "RIFF", "FORM", ... or the uppercase master GUID for W64
        byte_order order = byte_order::little;
        container_family family = container_family::riff;
        std::string form_type;             ///< "WAVE", "AIFF", ... or a GUID string for W64
        std::uint64_t declared_size = 0;   ///< Bytes following the master size field, overhead-adjusted
        std::uint64_t start_offset = 0;    ///< Offset of the master identifier
        std::uint64_t data_offset = 0;     ///< First chunk boundary
        std::uint64_t declared_end = 0;    ///< start_offset + master fields + declared_size
    };

    /**
     * @struct container_info
     * @brief Result of header classification
     */
    struct container_info {
        container_metadata metadata;
        format_descriptor format;
    };

    /**
     * @struct master_tag
     * @brief Entry of the master identifier table
     */
    struct master_tag {
        fourcc tag;
        byte_order order;
        container_family family;
    };

    /**
     * @brief Look a 4-byte probe up in the master identifier table
     *
     * The table is fixed: FORM, RIFX, FFIR, RF64, riff (W64) and RIFF.
     */
    RIFFLE_EXPORT std::optional<master_tag> find_master_tag(const fourcc& probe);

    /**
     * @brief Classify the container whose header starts at `start`
     *
     * Leaves the cursor at metadata.data_offset. For RF64 the ds64 chunk is
     * consumed here and turned into format.extended_size_storage.
     *
     * @param src Source holding the container
     * @param start Offset of the header, non-zero for embedded containers
     * @param options Warning handler and RF64 policy
     * @throws invalid_container_error for an unknown master id, a truncated header or a
     *         start at or past the end of the source
     * @throws parse_error for a malformed ds64 chunk
     * @throws unsupported_error for RF64 when it is disabled or its size cannot be resolved
     */
    RIFFLE_EXPORT container_info classify_header(source& src, std::uint64_t start = 0,
                                                 const parse_options& options = parse_options{});

} // namespace riffle
