//
// Printing of four character codes
//

#include <riffle/fourcc.hh>
#include <ostream>

namespace riffle {

    std::ostream& operator<<(std::ostream& os, const fourcc& f) {
        static constexpr char hex_digits[] = "0123456789abcdef";

        std::string text;
        text.reserve(2 + 4 * f.b.size());
        text += '\'';
        for (char c : f.b) {
            auto u = static_cast<unsigned char>(c);
            if (u >= 0x20 && u <= 0x7E) {
                text += c;
            } else {
                text += "\\x";
                text += hex_digits[u >> 4];
                text += hex_digits[u & 0x0F];
            }
        }
        text += '\'';
        return os << text;
    }

} // namespace riffle
