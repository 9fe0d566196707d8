/**
 * @file parse_options.hh
 * @brief Parsing options and configuration for PNG chunk records
 * @author Igor
 * @date 14/08/2025
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngchunk {

    /**
     * @struct parse_options
     * @brief Configuration options for decoding chunk records
     *
     * Controls strictness, size limits, and warning handling. Integrity
     * checks (type tag, bounds, CRC) are always enforced.
     */
    struct parse_options {
        /**
         * @brief Strict parsing mode
         *
         * When true, limit violations make the parse fail.
         * When false, they are reported as warnings and parsing continues.
         */
        bool strict = true;

        /**
         * @brief Maximum allowed declared payload length in bytes
         *
         * The PNG format limits chunk lengths to 2^31-1.
         */
        std::uint32_t max_chunk_length = 0x7FFFFFFFu;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Offset within the input buffer the warning refers to
         * @param category Warning category ("size_limit", "reserved_bit", "trailing_data")
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
         * If set, will be called for non-fatal issues during parsing.
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngchunk
