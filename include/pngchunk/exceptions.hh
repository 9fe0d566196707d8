/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the PNG chunk library
 * @author Igor
 * @date 14/08/2025
 *
 * This file defines the error taxonomy shared by chunk types and chunk
 * records. Type-level failures are reported as chunk_type_error; record
 * level failures derive from chunk_error and, when the type tag is the
 * culprit, carry the nested type-level code.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <sstream>

#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /**
     * @enum error_code
     * @brief Machine readable classification of every library failure
     */
    enum class error_code {
        value_not_in_range,     ///< Chunk type byte outside A-Z / a-z
        wrong_length,           ///< Chunk type source is not exactly 4 characters
        input_too_small,        ///< Record buffer shorter than 16 bytes
        chunk_type_not_valid,   ///< Record type field failed chunk type validation
        length_out_of_bounds,   ///< Declared length runs past the end of the buffer
        length_limit_exceeded,  ///< Declared length above parse_options::max_chunk_length
        crc_mismatch,           ///< Stored CRC differs from the recomputed one
        utf8_decode_failure     ///< Payload requested as text is not valid UTF-8
    };

    /**
     * @brief Get the symbolic name of an error code
     * @param code Error code
     * @return Name such as "crc_mismatch"
     */
    PNGCHUNK_EXPORT const char* to_string(error_code code) noexcept;

    /**
     * @class pngchunk_error
     * @brief Base exception class for all library errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch every chunk related error with a single catch block.
     */
    class PNGCHUNK_EXPORT pngchunk_error : public std::runtime_error {
    public:
        pngchunk_error(error_code code, const std::string& msg)
            : std::runtime_error(msg), m_code(code) {}

        [[nodiscard]] error_code code() const noexcept { return m_code; }

    private:
        error_code m_code;
    };

    /**
     * @class chunk_type_error
     * @brief Exception for an invalid chunk type tag
     *
     * Code is either value_not_in_range or wrong_length.
     */
    class PNGCHUNK_EXPORT chunk_type_error : public pngchunk_error {
    public:
        chunk_type_error(error_code code, const std::string& msg)
            : pngchunk_error(code, msg) {}
    };

    /**
     * @class chunk_error
     * @brief Exception for a chunk record that cannot be decoded or rendered
     */
    class PNGCHUNK_EXPORT chunk_error : public pngchunk_error {
    public:
        chunk_error(error_code code, const std::string& msg)
            : pngchunk_error(code, msg) {}
    };

    /**
     * @class input_too_small_error
     * @brief Record buffer is shorter than the 16 byte minimum
     */
    class PNGCHUNK_EXPORT input_too_small_error : public chunk_error {
    public:
        input_too_small_error(std::size_t actual, const std::string& msg)
            : chunk_error(error_code::input_too_small, msg), m_actual(actual) {}

        [[nodiscard]] std::size_t actual() const noexcept { return m_actual; }

    private:
        std::size_t m_actual;
    };

    /**
     * @class chunk_type_not_valid_error
     * @brief The type field of a record is not a valid chunk type
     *
     * Wraps the chunk_type_error raised while validating the tag.
     */
    class PNGCHUNK_EXPORT chunk_type_not_valid_error : public chunk_error {
    public:
        chunk_type_not_valid_error(error_code cause, const std::string& msg)
            : chunk_error(error_code::chunk_type_not_valid, msg), m_cause(cause) {}

        /**
         * @brief Type-level error that caused the rejection
         * @return value_not_in_range for records (the field is always 4 bytes)
         */
        [[nodiscard]] error_code cause() const noexcept { return m_cause; }

    private:
        error_code m_cause;
    };

    /**
     * @class length_out_of_bounds_error
     * @brief Declared payload length does not fit in the supplied buffer
     */
    class PNGCHUNK_EXPORT length_out_of_bounds_error : public chunk_error {
    public:
        length_out_of_bounds_error(std::uint32_t declared, std::size_t available, const std::string& msg)
            : chunk_error(error_code::length_out_of_bounds, msg),
              m_declared(declared),
              m_available(available) {}

        [[nodiscard]] std::uint32_t declared() const noexcept { return m_declared; }
        /// Bytes left after the type field (payload + crc space)
        [[nodiscard]] std::size_t available() const noexcept { return m_available; }

    private:
        std::uint32_t m_declared;
        std::size_t m_available;
    };

    /**
     * @class crc_mismatch_error
     * @brief Integrity check failure, the record is rejected as a whole
     */
    class PNGCHUNK_EXPORT crc_mismatch_error : public chunk_error {
    public:
        crc_mismatch_error(std::uint32_t computed, std::uint32_t declared, const std::string& msg)
            : chunk_error(error_code::crc_mismatch, msg),
              m_computed(computed),
              m_declared(declared) {}

        [[nodiscard]] std::uint32_t computed() const noexcept { return m_computed; }
        [[nodiscard]] std::uint32_t declared() const noexcept { return m_declared; }

    private:
        std::uint32_t m_computed;
        std::uint32_t m_declared;
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     *
     * Uses C++17 fold expressions to concatenate all arguments into
     * a single error message string.
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
     * @def THROW_CHUNK_TYPE
     * @brief Throw a chunk_type_error with formatted message
     * @param code error_code enumerator name
     * @param ... Variable arguments to format into error message
     */
    #define THROW_CHUNK_TYPE(code, ...) \
        throw ::pngchunk::chunk_type_error(::pngchunk::error_code::code, ::pngchunk::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_CHUNK
     * @brief Throw a chunk_error with formatted message
     * @param code error_code enumerator name
     * @param ... Variable arguments to format into error message
     */
    #define THROW_CHUNK(code, ...) \
        throw ::pngchunk::chunk_error(::pngchunk::error_code::code, ::pngchunk::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_CHUNK_IF
     * @brief Conditionally throw a chunk_error
     * @param condition Condition to check
     * @param code error_code enumerator name
     * @param ... Variable arguments for error message if condition is true
     */
    #define THROW_CHUNK_IF(condition, code, ...) \
        do { if (condition) THROW_CHUNK(code, __VA_ARGS__); } while(0)

    /**
     * @def THROW_CHUNK_UNLESS
     * @brief Throw a chunk_error unless condition is true
     * @param condition Condition that must be true to avoid throwing
     * @param code error_code enumerator name
     * @param ... Variable arguments for error message if condition is false
     */
    #define THROW_CHUNK_UNLESS(condition, code, ...) \
        do { if (!(condition)) THROW_CHUNK(code, __VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngchunk
