//
// GUID decoding for W64 identifiers
//

#include <riffle/guid.hh>
#include <cstring>

namespace riffle {

    static constexpr char hex_digits[] = "0123456789ABCDEF";

    static void append_hex(std::string& out, std::uint8_t value) {
        out += hex_digits[value >> 4];
        out += hex_digits[value & 0x0F];
    }

    guid guid::from_bytes(const void* data) {
        guid result;
        std::memcpy(result.bytes.data(), data, result.bytes.size());
        return result;
    }

    std::string guid::to_string() const {
        // Data1..Data3 are little-endian, Data4 is a plain byte sequence
        static constexpr int order[16] = {3, 2, 1, 0, 5, 4, 7, 6, 8, 9, 10, 11, 12, 13, 14, 15};

        std::string out;
        out.reserve(36);
        for (int i = 0; i < 16; i++) {
            if (i == 4 || i == 6 || i == 8 || i == 10) {
                out += '-';
            }
            append_hex(out, bytes[order[i]]);
        }
        return out;
    }

} // namespace riffle
