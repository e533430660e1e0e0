//
// Header classification: master tag table, standard, W64 and RF64 headers
//

#include <array>
#include <limits>

#include <riffle/header_classifier.hh>
#include <riffle/chunk_reader.hh>
#include <riffle/exceptions.hh>
#include "ds64.hh"

namespace riffle {

    static constexpr auto DS64 = "ds64"_4cc;
    static constexpr std::uint32_t SIZE_SENTINEL = 0xFFFFFFFF;

    static const std::array<master_tag, 6> master_tags = {{
        {"FORM"_4cc, byte_order::big,    container_family::iff},
        {"RIFX"_4cc, byte_order::big,    container_family::riff},
        {"FFIR"_4cc, byte_order::big,    container_family::riff},
        {"RF64"_4cc, byte_order::little, container_family::rf64},
        {"riff"_4cc, byte_order::little, container_family::w64},
        {"RIFF"_4cc, byte_order::little, container_family::riff},
    }};

    std::optional<master_tag> find_master_tag(const fourcc& probe) {
        for (const auto& entry : master_tags) {
            if (entry.tag == probe) {
                return entry;
            }
        }
        return std::nullopt;
    }

    static std::uint64_t saturating_add(std::uint64_t a, std::uint64_t b) {
        return b > std::numeric_limits<std::uint64_t>::max() - a
                   ? std::numeric_limits<std::uint64_t>::max()
                   : a + b;
    }

    // [4-byte master id][4-byte size][4-byte form type]
    static container_info read_standard_header(source& src, std::uint64_t start, const master_tag& tag) {
        container_info info;
        info.format = tag.family == container_family::iff ? format_descriptor::iff()
                                                          : format_descriptor::riff(tag.order);

        auto& md = info.metadata;
        md.master_identifier = tag.tag.to_string();
        md.order = tag.order;
        md.family = tag.family;
        md.declared_size = src.read<std::uint32_t>(tag.order);
        md.form_type = src.read_fourcc().to_string();
        md.start_offset = start;
        md.data_offset = src.tell();
        md.declared_end = saturating_add(start + 8, md.declared_size);
        return info;
    }

    // [16-byte GUID][8-byte LE size including the 24 header bytes][16-byte GUID form type]
    static container_info read_w64_header(source& src, std::uint64_t start, const master_tag& tag) {
        container_info info;
        info.format = format_descriptor::w64();

        src.seek(static_cast<std::int64_t>(start), source::set);

        auto& md = info.metadata;
        md.master_identifier = read_identifier(src, info.format);
        auto raw_size = read_size_field(src, info.format);
        if (raw_size < info.format.size_overhead) {
            THROW_INVALID_CONTAINER("W64 header at offset ", start, " declares size ", raw_size,
                                    ", smaller than its own ", info.format.size_overhead, " header bytes");
        }
        md.form_type = read_identifier(src, info.format);
        md.order = tag.order;
        md.family = tag.family;
        md.declared_size = raw_size - info.format.size_overhead;
        md.start_offset = start;
        md.data_offset = src.tell();
        md.declared_end = saturating_add(start + info.format.field_width(), md.declared_size);
        return info;
    }

    // Standard header followed by the ds64 chunk
    static container_info read_rf64_header(source& src, std::uint64_t start, const master_tag& tag,
                                           const parse_options& options) {
        container_info info;

        auto& md = info.metadata;
        md.master_identifier = tag.tag.to_string();
        md.order = tag.order;
        md.family = tag.family;
        std::uint32_t raw_size = src.read<std::uint32_t>(tag.order);
        md.form_type = src.read_fourcc().to_string();
        md.start_offset = start;

        const std::uint64_t first_chunk = src.tell();
        bool has_ds64 = false;
        std::uint32_t ds64_size = 0;
        if (src.remaining() >= 8) {
            has_ds64 = src.read_fourcc() == DS64;
            ds64_size = src.read<std::uint32_t>(byte_order::little);
        }

        if (has_ds64) {
            auto record = read_ds64(src, ds64_size);
            info.format = format_descriptor::rf64(std::move(record.sizes));
            md.declared_size = raw_size == SIZE_SENTINEL ? record.riff_size : raw_size;
            md.data_offset = src.tell();
        } else {
            if (raw_size == SIZE_SENTINEL) {
                THROW_UNSUPPORTED("RF64 container at offset ", start,
                                  " declares its size in ds64, but the first chunk is not ds64");
            }
            options.warn(first_chunk, "ds64", "RF64 container has no ds64 chunk, using 32-bit sizes");
            info.format = format_descriptor::rf64({});
            md.declared_size = raw_size;
            md.data_offset = first_chunk;
        }

        md.declared_end = saturating_add(start + 8, md.declared_size);
        return info;
    }

    container_info classify_header(source& src, std::uint64_t start, const parse_options& options) {
        // Also keeps start within the signed range seek() accepts
        if (start >= src.size()) {
            THROW_INVALID_CONTAINER("Header offset ", start, " is past the end of the ",
                                    src.size(), "-byte source");
        }
        src.seek(static_cast<std::int64_t>(start), source::set);

        std::array<char, 4> magic{};
        std::size_t got = src.read(magic.data(), magic.size());
        fourcc probe(magic[0], magic[1], magic[2], magic[3]);

        std::optional<master_tag> tag;
        if (got == magic.size()) {
            tag = find_master_tag(probe);
        }
        if (!tag) {
            THROW_INVALID_CONTAINER("Master identifier ", probe, " at offset ", start,
                                    " indicates the source is not IFF-based or malformed");
        }

        if (tag->family == container_family::rf64 && !options.allow_rf64) {
            THROW_UNSUPPORTED("RF64 container at offset ", start, " but RF64 support is disabled");
        }

        container_info info;
        try {
            switch (tag->family) {
                case container_family::w64:
                    info = read_w64_header(src, start, *tag);
                    break;
                case container_family::rf64:
                    info = read_rf64_header(src, start, *tag, options);
                    break;
                case container_family::iff:
                case container_family::riff:
                    info = read_standard_header(src, start, *tag);
                    break;
            }
        } catch (const end_of_source_error& e) {
            THROW_INVALID_CONTAINER("Truncated ", to_string(tag->family), " header at offset ", start,
                                    ": ", e.what());
        }

        if (info.metadata.declared_end > src.size()) {
            options.warn(start, "size_mismatch",
                         build_error_msg("Container declares ", info.metadata.declared_size,
                                         " bytes ending at offset ", info.metadata.declared_end,
                                         ", but the source is only ", src.size(), " bytes long"));
        }

        src.seek(static_cast<std::int64_t>(info.metadata.data_offset), source::set);
        return info;
    }

} // namespace riffle
