/**
 * @file parse_options.hh
 * @brief Parsing options and configuration for chunk containers
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace riffle {

    /**
     * @struct parse_options
     * @brief Configuration options for parsing containers
     *
     * Controls strictness, size limits, RF64 handling and
     * warning reporting.
     */
    struct parse_options {
        /**
         * @brief Strict parsing mode
         *
         * When true, a chunk larger than max_chunk_size is a parse_error.
         * When false, a "size_limit" warning is reported and the walk
         * ends as truncated at that chunk.
         */
        bool strict = true;

        /**
         * @brief Maximum payload size copied out of a chunk
         *
         * Default is 4GB.
         */
        std::uint64_t max_chunk_size = std::uint64_t(1) << 32;

        /**
         * @brief Allow RF64 containers
         *
         * When false, an RF64 master tag raises unsupported_error.
         */
        bool allow_rf64 = true;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Source offset where the condition was detected
         * @param category Warning category ("truncated", "size_limit",
         *                 "size_mismatch", "ds64")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;

        void warn(std::uint64_t offset, std::string_view category, std::string_view message) const {
            if (on_warning) {
                on_warning(offset, category, message);
            }
        }
    };

} // namespace riffle
