//
// Per-family format descriptors
//

#include <utility>

#include <riffle/format_descriptor.hh>

namespace riffle {

    std::string_view to_string(container_family family) {
        switch (family) {
            case container_family::iff:
                return "IFF";
            case container_family::riff:
                return "RIFF";
            case container_family::rf64:
                return "RF64";
            case container_family::w64:
                return "W64";
        }
        return "unknown";
    }

    std::optional<std::uint64_t> format_descriptor::extended_size(const std::string& identifier,
                                                                  std::size_t occurrence) const {
        auto it = extended_size_storage.find(identifier);
        if (it == extended_size_storage.end() || occurrence >= it->second.size()) {
            return std::nullopt;
        }
        return it->second[occurrence];
    }

    format_descriptor format_descriptor::iff() {
        format_descriptor fd;
        fd.family = container_family::iff;
        fd.order = byte_order::big;
        return fd;
    }

    format_descriptor format_descriptor::riff(byte_order order) {
        format_descriptor fd;
        fd.family = container_family::riff;
        fd.order = order;
        return fd;
    }

    format_descriptor format_descriptor::rf64(extended_size_table sizes) {
        format_descriptor fd;
        fd.family = container_family::rf64;
        fd.order = byte_order::little;
        fd.extended_size_storage = std::move(sizes);
        fd.size_sentinel = 0xFFFFFFFFu;
        return fd;
    }

    format_descriptor format_descriptor::w64() {
        format_descriptor fd;
        fd.family = container_family::w64;
        fd.order = byte_order::little;
        fd.encoding = identifier_encoding::guid;
        fd.identifier_width = 16;
        fd.size_field_width = 8;
        fd.alignment = 8;
        fd.size_overhead = 24;
        return fd;
    }

} // namespace riffle
