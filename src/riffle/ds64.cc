//
// RF64 ds64 chunk (EBU Tech 3306)
//

#include "ds64.hh"

namespace riffle {

    static constexpr auto DATA = "data"_4cc;

    ds64_record read_ds64(source& src, std::uint32_t chunk_size) {
        const std::uint64_t payload_start = src.tell();
        const std::uint64_t chunk_offset = payload_start - 8;

        // ds64 chunk must be at least 24 bytes (3 * 8-byte fields)
        if (chunk_size < 24) {
            THROW_PARSE("Invalid ds64 chunk at offset ", chunk_offset, ": size ", chunk_size,
                        " bytes is too small (minimum 24 bytes required)");
        }

        // ds64 is always little-endian
        ds64_record record;
        record.riff_size = src.read<std::uint64_t>(byte_order::little);
        record.data_size = src.read<std::uint64_t>(byte_order::little);
        record.sample_count = src.read<std::uint64_t>(byte_order::little);

        // Optional table of per-chunk sizes
        if (chunk_size >= 28) {
            auto table_count = src.read<std::uint32_t>(byte_order::little);

            // Each table entry is 12 bytes: fourcc + 8-byte size
            std::uint64_t expected_size = 28 + std::uint64_t(table_count) * 12;
            if (chunk_size < expected_size) {
                THROW_PARSE("Invalid ds64 chunk at offset ", chunk_offset, ": claims ", table_count,
                            " table entries requiring ", expected_size,
                            " bytes total, but chunk size is only ", chunk_size, " bytes");
            }

            // Repeated ids apply to successive sentinel chunks of that id
            for (std::uint32_t i = 0; i < table_count; i++) {
                fourcc id = src.read_fourcc();
                auto size = src.read<std::uint64_t>(byte_order::little);
                record.sizes[id.to_string()].push_back(size);
            }
        }

        // The fixed data size belongs to the first sentinel data chunk
        if (record.data_size != 0) {
            auto& data_sizes = record.sizes[DATA.to_string()];
            data_sizes.insert(data_sizes.begin(), record.data_size);
        }

        std::uint64_t next = payload_start + chunk_size + (chunk_size & 1);
        src.seek(static_cast<std::int64_t>(next), source::set);
        return record;
    }

} // namespace riffle
