/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the riffle library
 *
 * This file defines the exception hierarchy and convenience macros for
 * error handling throughout the library.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>

namespace riffle {

    /**
     * @class riffle_error
     * @brief Base exception class for all riffle errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch every riffle-specific error with a single catch block.
     */
    class riffle_error : public std::runtime_error {
    public:
        explicit riffle_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class io_error
     * @brief The byte source is unavailable or its backend failed
     *
     * Thrown when a file cannot be opened or mapped, or when the
     * underlying stream reports a hard failure. Never used for format errors.
     */
    class io_error : public riffle_error {
    public:
        explicit io_error(const std::string& msg)
            : riffle_error(msg) {}
    };

    /**
     * @class parse_error
     * @brief Exception for unrecoverable format errors
     *
     * Thrown when the container structure is invalid in a way that makes
     * further reading meaningless (bad ds64 chunk, size limit in strict mode).
     */
    class parse_error : public riffle_error {
    public:
        explicit parse_error(const std::string& msg)
            : riffle_error(msg) {}
    };

    /**
     * @class invalid_container_error
     * @brief The byte range is not a recognized container
     *
     * Raised by header classification when the master identifier is unknown
     * or the header itself is cut short.
     */
    class invalid_container_error : public parse_error {
    public:
        explicit invalid_container_error(const std::string& msg)
            : parse_error(msg) {}
    };

    /**
     * @class end_of_source_error
     * @brief Fewer bytes remain than an operation requires
     *
     * The container walker catches this and ends the walk with
     * walk_status::truncated instead of propagating it.
     */
    class end_of_source_error : public riffle_error {
    public:
        explicit end_of_source_error(const std::string& msg)
            : riffle_error(msg) {}
    };

    /**
     * @class unsupported_error
     * @brief A declared extension path that cannot be resolved
     *
     * Used for RF64 sizes that have no ds64 entry and for RF64 input
     * when parse_options::allow_rf64 is off.
     */
    class unsupported_error : public riffle_error {
    public:
        explicit unsupported_error(const std::string& msg)
            : riffle_error(msg) {}
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    #define THROW_IO(...) \
        throw ::riffle::io_error(::riffle::build_error_msg(__VA_ARGS__))

    #define THROW_PARSE(...) \
        throw ::riffle::parse_error(::riffle::build_error_msg(__VA_ARGS__))

    #define THROW_INVALID_CONTAINER(...) \
        throw ::riffle::invalid_container_error(::riffle::build_error_msg(__VA_ARGS__))

    #define THROW_EOS(...) \
        throw ::riffle::end_of_source_error(::riffle::build_error_msg(__VA_ARGS__))

    #define THROW_UNSUPPORTED(...) \
        throw ::riffle::unsupported_error(::riffle::build_error_msg(__VA_ARGS__))

    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    #define THROW_PARSE_IF(condition, ...) \
        do { if (condition) THROW_PARSE(__VA_ARGS__); } while(0)

    #define THROW_EOS_IF(condition, ...) \
        do { if (condition) THROW_EOS(__VA_ARGS__); } while(0)

    #define THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_IO(__VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace riffle
