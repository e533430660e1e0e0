//
// RF64 ds64 chunk (EBU Tech 3306)
//

#pragma once

#include <cstdint>
#include <riffle/format_descriptor.hh>
#include <riffle/source.hh>

namespace riffle {

    // Sizes declared by a ds64 chunk
    struct ds64_record {
        std::uint64_t riff_size = 0;      // 64-bit size of the RF64 container
        std::uint64_t data_size = 0;      // 64-bit size of the data chunk
        std::uint64_t sample_count = 0;
        extended_size_table sizes;        // data + table entries, in file order per chunk id
    };

    // Parse a ds64 payload of chunk_size bytes at the cursor. The cursor is
    // left after the payload and its padding.
    ds64_record read_ds64(source& src, std::uint32_t chunk_size);

} // namespace riffle
