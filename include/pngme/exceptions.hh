/**
 * @file exceptions.hh
 * @brief Exception classes, error codes and throwing macros for pngme
 * @author Igor
 * @date 19/10/2026
 *
 * Every failure raised by the library carries an error_code so callers can
 * branch on the kind of failure instead of inspecting message text.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>
#include <ostream>

namespace pngme {

    /**
     * @enum error_code
     * @brief Closed set of failure kinds reported by the library
     */
    enum class error_code {
        invalid_byte,    ///< Chunk type byte outside A-Z / a-z
        invalid_length,  ///< Chunk type text is not exactly 4 bytes
        truncated,       ///< Buffer ended before a chunk field was complete
        crc_mismatch,    ///< Stored CRC differs from the computed CRC
        bad_signature,   ///< Buffer does not start with the PNG signature
        chunk_too_large, ///< Declared chunk length exceeds parse_options::max_chunk_size
        bad_structure,   ///< Strict structure validation failed (IHDR/IEND placement, reserved bit)
        not_found,       ///< No chunk of the requested type
        io_failure       ///< File could not be opened, read or written
    };

    /**
     * @brief Get the symbolic name of an error code
     * @param code Error code
     * @return Name such as "crc_mismatch"
     */
    inline const char* to_string(error_code code) {
        switch (code) {
            case error_code::invalid_byte:
                return "invalid_byte";
            case error_code::invalid_length:
                return "invalid_length";
            case error_code::truncated:
                return "truncated";
            case error_code::crc_mismatch:
                return "crc_mismatch";
            case error_code::bad_signature:
                return "bad_signature";
            case error_code::chunk_too_large:
                return "chunk_too_large";
            case error_code::bad_structure:
                return "bad_structure";
            case error_code::not_found:
                return "not_found";
            case error_code::io_failure:
                return "io_failure";
        }
        return "unknown";
    }

    inline std::ostream& operator<<(std::ostream& os, error_code code) {
        return os << to_string(code);
    }

    /**
     * @class pngme_error
     * @brief Base exception class for all pngme errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch every pngme failure with a single catch block.
     */
    class pngme_error : public std::runtime_error {
    public:
        pngme_error(error_code code, const std::string& msg)
            : std::runtime_error(msg), m_code(code) {}

        /**
         * @brief Get the failure kind
         */
        [[nodiscard]] error_code code() const noexcept { return m_code; }

    private:
        error_code m_code;
    };

    /**
     * @class parse_error
     * @brief Exception for malformed chunk types, chunks and PNG files
     *
     * Thrown when the signature is wrong, a chunk is truncated or
     * corrupted, or a chunk type violates the naming rules.
     */
    class parse_error : public pngme_error {
    public:
        parse_error(error_code code, const std::string& msg)
            : pngme_error(code, msg) {}
    };

    /**
     * @class not_found_error
     * @brief Exception for lookups and removals of absent chunk types
     */
    class not_found_error : public pngme_error {
    public:
        explicit not_found_error(const std::string& msg)
            : pngme_error(error_code::not_found, msg) {}
    };

    /**
     * @class io_error
     * @brief Exception for I/O related errors
     *
     * Thrown when file access, reading or writing fails.
     */
    class io_error : public pngme_error {
    public:
        explicit io_error(const std::string& msg)
            : pngme_error(error_code::io_failure, msg) {}
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

    /**
     * @def THROW_PARSE
     * @brief Throw a parse_error with the given code and formatted message
     * @param code error_code enumerator name (e.g. truncated)
     * @param ... Variable arguments to format into error message
     */
    #define THROW_PARSE(code, ...) \
        throw ::pngme::parse_error(::pngme::error_code::code, ::pngme::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_PARSE_IF
     * @brief Conditionally throw a parse_error
     */
    #define THROW_PARSE_IF(condition, code, ...) \
        do { if (condition) THROW_PARSE(code, __VA_ARGS__); } while(0)

    /**
     * @def THROW_PARSE_UNLESS
     * @brief Throw a parse_error unless condition is true
     */
    #define THROW_PARSE_UNLESS(condition, code, ...) \
        do { if (!(condition)) THROW_PARSE(code, __VA_ARGS__); } while(0)

    /**
     * @def THROW_NOT_FOUND
     * @brief Throw a not_found_error with formatted message
     */
    #define THROW_NOT_FOUND(...) \
        throw ::pngme::not_found_error(::pngme::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_IO
     * @brief Throw an io_error with formatted message
     */
    #define THROW_IO(...) \
        throw ::pngme::io_error(::pngme::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_IO_IF
     * @brief Conditionally throw an io_error
     */
    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    /**
     * @def THROW_IO_UNLESS
     * @brief Throw an io_error unless condition is true
     */
    #define THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_IO(__VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngme
