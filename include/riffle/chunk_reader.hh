/**
 * @file chunk_reader.hh
 * @brief Reading a single chunk at the cursor of a source
 */

#pragma once

#include <cstdint>
#include <string>
#include <riffle/export_riffle.h>
#include <riffle/chunk.hh>
#include <riffle/format_descriptor.hh>
#include <riffle/parse_options.hh>
#include <riffle/source.hh>

namespace riffle {

    /**
     * @brief Read one chunk starting at the current cursor
     *
     * On success the cursor is left at the next chunk boundary, i.e. after
     * the payload and its alignment padding.
     *
     * @param src Source positioned at a chunk boundary
     * @param format Descriptor of the container family
     * @param options Size limit and warning handler
     * @return The chunk with its payload copied out
     * @throws end_of_source_error if the identifier/size fields or the payload
     *         do not fit in the source
     * @throws parse_error if the payload exceeds options.max_chunk_size in strict mode
     * @throws unsupported_error for an RF64 sentinel size with no ds64 entry
     */
    RIFFLE_EXPORT chunk read_chunk(source& src, const format_descriptor& format,
                                   const parse_options& options = parse_options{});

    /**
     * @brief read_chunk() that continues through repeated stored sizes
     *
     * A size field holding format.size_sentinel takes the next unused entry
     * of format.extended_size_storage for the chunk's identifier; cursor
     * counts the entries used so far. Pass the same cursor for every chunk
     * of one container.
     */
    RIFFLE_EXPORT chunk read_chunk(source& src, const format_descriptor& format,
                                   const parse_options& options, extended_size_cursor& cursor);

    /**
     * @brief Read and decode an identifier of format.identifier_width bytes
     * @throws end_of_source_error on a short read
     */
    RIFFLE_EXPORT std::string read_identifier(source& src, const format_descriptor& format);

    /**
     * @brief Read a size field of format.size_field_width bytes in format.order
     * @throws end_of_source_error on a short read
     */
    RIFFLE_EXPORT std::uint64_t read_size_field(source& src, const format_descriptor& format);

} // namespace riffle
