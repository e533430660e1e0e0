//
// Single chunk reader shared by every container family
//

#include <limits>

#include <riffle/chunk_reader.hh>
#include <riffle/guid.hh>

namespace riffle {

    std::string read_identifier(source& src, const format_descriptor& format) {
        if (format.encoding == identifier_encoding::guid) {
            if (format.identifier_width != 16) {
                THROW_UNSUPPORTED("GUID identifiers must be 16 bytes wide, descriptor declares ",
                                  format.identifier_width);
            }
            auto bytes = src.read_exact(format.identifier_width);
            return guid::from_bytes(bytes.data()).to_string();
        }

        const std::uint64_t start = src.tell();
        std::string id(format.identifier_width, '\0');
        std::size_t got = src.read(id.data(), id.size());
        THROW_EOS_IF(got != id.size(), "Unexpected end of source at offset ", start,
                     ": requested ", id.size(), " identifier bytes, got ", got);
        return id;
    }

    std::uint64_t read_size_field(source& src, const format_descriptor& format) {
        switch (format.size_field_width) {
            case 2:
                return src.read<std::uint16_t>(format.order);
            case 4:
                return src.read<std::uint32_t>(format.order);
            case 8:
                return src.read<std::uint64_t>(format.order);
            default:
                THROW_UNSUPPORTED("Size fields of ", format.size_field_width, " bytes are not supported");
        }
    }

    chunk read_chunk(source& src, const format_descriptor& format, const parse_options& options) {
        extended_size_cursor cursor;
        return read_chunk(src, format, options, cursor);
    }

    chunk read_chunk(source& src, const format_descriptor& format, const parse_options& options,
                     extended_size_cursor& cursor) {
        const std::uint64_t start = src.tell();
        const std::uint64_t length = src.size();
        const std::uint64_t available = start < length ? length - start : 0;

        THROW_EOS_IF(available < format.field_width(),
                     "Insufficient bytes to read identifier/size fields at offset ", start,
                     ": ", available, " remaining, ", format.field_width(), " required");

        chunk result;
        result.start_offset = start;
        result.identifier = read_identifier(src, format);

        // Sentinel sizes take the next stored size for this identifier
        std::uint64_t size = read_size_field(src, format);
        if (format.size_sentinel && size == *format.size_sentinel) {
            std::size_t& used = cursor[result.identifier];
            auto extended = format.extended_size(result.identifier, used);
            if (!extended) {
                THROW_UNSUPPORTED("Chunk '", result.identifier, "' at offset ", start,
                                  " declares its size externally but no ds64 entry is left for it");
            }
            size = *extended;
            used++;
        }

        THROW_EOS_IF(size < format.size_overhead,
                     "Chunk '", result.identifier, "' at offset ", start, " has size ", size,
                     ", smaller than the ", format.size_overhead, " bytes its header occupies");

        const std::uint64_t payload_length = size - format.size_overhead;
        const std::uint64_t payload_start = src.tell();
        const std::uint64_t payload_room = payload_start < length ? length - payload_start : 0;

        THROW_EOS_IF(payload_length > payload_room,
                     "Payload of chunk '", result.identifier, "' at offset ", start,
                     " exceeds source length: ", payload_length, " bytes declared, ",
                     payload_room, " remaining");

        if (payload_length > options.max_chunk_size) {
            std::string msg = build_error_msg("Chunk '", result.identifier, "' at offset ", start,
                                              " has size ", payload_length,
                                              " bytes, which exceeds maximum allowed size of ",
                                              options.max_chunk_size, " bytes");
            if (options.strict) {
                throw parse_error(msg);
            }
            options.warn(start, "size_limit", msg);
            throw end_of_source_error(msg);
        }

        THROW_EOS_IF(payload_length > std::numeric_limits<std::size_t>::max(),
                     "Payload of chunk '", result.identifier, "' at offset ", start,
                     " does not fit in memory");

        result.declared_size = size;
        result.payload = src.read_exact(static_cast<std::size_t>(payload_length));

        // Align for the next chunk; padding may run past the end of the source
        std::uint64_t padding = format.padding_for(payload_length);
        if (padding) {
            src.seek(static_cast<std::int64_t>(padding), source::cur);
        }

        result.end_offset = src.tell();
        return result;
    }

} // namespace riffle
