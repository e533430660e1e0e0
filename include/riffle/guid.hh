/**
 * @file guid.hh
 * @brief 16-byte GUID identifiers used by Sony Wave64 (W64) containers
 */

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <riffle/export_riffle.h>
#include <riffle/fourcc.hh>

namespace riffle {

    /**
     * @struct guid
     * @brief A GUID as stored on disk (Microsoft "bytes_le" layout)
     *
     * The first three groups are stored little-endian, the last eight bytes
     * in order. W64 GUIDs start with the four characters of the equivalent
     * RIFF fourcc, which is why `prefix()` is meaningful.
     */
    struct RIFFLE_EXPORT guid {
        std::array<std::uint8_t, 16> bytes{};

        static guid from_bytes(const void* data);

        /**
         * @brief Canonical uppercase text form
         * @return e.g. "66666972-912E-11CF-A5D6-28DB04C10000"
         */
        [[nodiscard]] std::string to_string() const;

        // First four bytes as a fourcc ("riff", "wave", "fmt ", ...)
        [[nodiscard]] fourcc prefix() const {
            return {static_cast<char>(bytes[0]), static_cast<char>(bytes[1]),
                    static_cast<char>(bytes[2]), static_cast<char>(bytes[3])};
        }

        bool operator==(const guid& o) const { return bytes == o.bytes; }
        bool operator!=(const guid& o) const { return !(*this == o); }
    };

    // Well-known Wave64 identifiers
    namespace w64 {
        inline constexpr guid riff{{0x72, 0x69, 0x66, 0x66, 0x2E, 0x91, 0xCF, 0x11,
                                    0xA5, 0xD6, 0x28, 0xDB, 0x04, 0xC1, 0x00, 0x00}};
        inline constexpr guid wave{{0x77, 0x61, 0x76, 0x65, 0xF3, 0xAC, 0xD3, 0x11,
                                    0x8C, 0xD1, 0x00, 0xC0, 0x4F, 0x8E, 0xDB, 0x8A}};
        inline constexpr guid fmt{{0x66, 0x6D, 0x74, 0x20, 0xF3, 0xAC, 0xD3, 0x11,
                                   0x8C, 0xD1, 0x00, 0xC0, 0x4F, 0x8E, 0xDB, 0x8A}};
        inline constexpr guid data{{0x64, 0x61, 0x74, 0x61, 0xF3, 0xAC, 0xD3, 0x11,
                                    0x8C, 0xD1, 0x00, 0xC0, 0x4F, 0x8E, 0xDB, 0x8A}};
    }

} // namespace riffle
