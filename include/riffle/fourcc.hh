//
// Four character codes: master tags, form types and RIFF/IFF chunk ids
//

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <iosfwd>
#include <stdexcept>
#include <string>
#include <string_view>

#include <riffle/export_riffle.h>

namespace riffle {

    /**
     * @struct fourcc
     * @brief Four raw bytes, compared and printed as Latin-1 text
     *
     * Text constructors pad short input with spaces and cut long input
     * at four characters. from_bytes() copies bytes unchanged.
     */
    struct fourcc {
        std::array<char, 4> b{' ', ' ', ' ', ' '};

        constexpr fourcc() = default;

        constexpr fourcc(char c0, char c1, char c2, char c3)
            : b{c0, c1, c2, c3} {}

        explicit fourcc(std::string_view text) {
            for (std::size_t i = 0; i < 4 && i < text.size(); i++) {
                b[i] = text[i];
            }
        }

        fourcc(const char* text)
            : fourcc(std::string_view(text)) {}

        explicit fourcc(const std::string& text)
            : fourcc(std::string_view(text)) {}

        static fourcc from_bytes(const void* data) {
            fourcc f;
            std::memcpy(f.b.data(), data, f.b.size());
            return f;
        }

        [[nodiscard]] std::string to_string() const { return {b.data(), b.size()}; }
        [[nodiscard]] std::string_view to_string_view() const { return {b.data(), b.size()}; }

        // Text without the space padding
        [[nodiscard]] std::string to_string_trimmed() const {
            std::size_t n = b.size();
            while (n > 0 && b[n - 1] == ' ') {
                n--;
            }
            return {b.data(), n};
        }

        // Bytes reinterpreted in host order
        [[nodiscard]] std::uint32_t to_uint32() const {
            std::uint32_t v;
            std::memcpy(&v, b.data(), sizeof(v));
            return v;
        }

        [[nodiscard]] bool is_printable() const {
            for (char c : b) {
                if (c < 0x20 || c > 0x7E) {
                    return false;
                }
            }
            return true;
        }

        constexpr char operator[](std::size_t i) const { return b[i]; }

        bool operator==(const fourcc& o) const { return b == o.b; }
        bool operator!=(const fourcc& o) const { return b != o.b; }
        bool operator<(const fourcc& o) const { return b < o.b; }
    };

    // Quoted text, non-printable bytes as \xNN; the stream's flags are kept
    RIFFLE_EXPORT std::ostream& operator<<(std::ostream& os, const fourcc& f);

    struct fourcc_hash {
        std::size_t operator()(const fourcc& f) const noexcept {
            return (static_cast<std::size_t>(f.to_uint32()) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

    // "WAVE"_4cc; shorter literals are space padded
    constexpr fourcc operator""_4cc(const char* text, std::size_t len) {
        if (len > 4) {
            throw std::invalid_argument("fourcc literal longer than 4 characters");
        }
        return {len > 0 ? text[0] : ' ',
                len > 1 ? text[1] : ' ',
                len > 2 ? text[2] : ' ',
                len > 3 ? text[3] : ' '};
    }

} // namespace riffle

namespace std {
    template<>
    struct hash<riffle::fourcc> : riffle::fourcc_hash {};
}
