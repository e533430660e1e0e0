/**
 * @file byte_order.hh
 * @brief Byte order (endianness) utilities for chunk containers
 */

#pragma once

#include <string_view>
#include <riffle/endian.hh>

namespace riffle {
    /**
     * @enum byte_order
     * @brief Byte order of the size fields of a container
     */
    enum class byte_order {
        little, ///< Little-endian (RIFF, RF64, W64)
        big     ///< Big-endian (IFF-85, RIFX, FFIR)
    };

    /**
     * @brief Check if given byte order matches the native system byte order
     * @param bo Byte order to check
     * @return True if the byte order matches the system's native byte order
     */
    inline bool byte_order_native(byte_order bo) {
        switch (bo) {
            case byte_order::little:
                return is_little_endian;
            case byte_order::big:
                return is_big_endian;
        }
        // make compiler happy
        return false;
    }

    inline std::string_view to_string(byte_order bo) {
        return bo == byte_order::big ? "big" : "little";
    }
}
